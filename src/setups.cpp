#include <opticslab/core/grating.hpp>
#include <opticslab/core/mirror.hpp>
#include <opticslab/core/setups.hpp>
#include <opticslab/core/stop.hpp>
#include <opticslab/log/logger.hpp>
#include <opticslab/math/utils.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace opticslab::core {

namespace {

// Plane whose normal is the +z axis turned by `rotation_y` about +y
Frame turned(const Vec3 &origin, double rotation_y) {
  return Frame::facing_xz(origin, PI / 2 - rotation_y);
}

Frame facing_x(const Vec3 &origin) {
  return Frame::facing(origin, X_UNIT_VEC3);
}

Bench with_detector(Bench bench, const Vec3 &position) {
  bench.detector = std::make_shared<Detector>("detector1", facing_x(position));
  bench.elements.push_back(bench.detector);
  return bench;
}

Bench single_lens() {
  Bench b;
  b.elements.push_back(std::make_shared<ThinLens>("lens1", facing_x({0, 0, 0}), 4.0));
  return b;
}

Bench flat_mirror() {
  Bench b;
  b.elements.push_back(std::make_shared<FlatMirror>("mirror1", turned({0, 0, 0}, -deg_to_rad(45.0))));
  return b;
}

Bench spherical_mirror() {
  Bench b;
  b.elements.push_back(std::make_shared<SphericalMirror>("spherical_mirror_1", turned({5, 0, 0}, -PI / 2), -10.0));
  return b;
}

Bench two_lens() {
  Bench b;
  b.elements.push_back(std::make_shared<ThinLens>("lens1", facing_x({-3, 0, 0}), 4.0));
  b.elements.push_back(std::make_shared<ThinLens>("lens2", facing_x({3, 0, 0}), 4.0));
  return b;
}

Bench camera_sensor() {
  Bench b;
  b.lens = std::make_shared<ThinLens>("lens1", facing_x({0, 0, 0}), 5.0);
  b.elements.push_back(b.lens);
  b.source.white_light = true;
  return with_detector(std::move(b), {8, 0, 0});
}

Bench transmissive_grating() {
  Bench b;
  b.elements.push_back(std::make_shared<TransmissiveGrating>("grating1", facing_x({0, 0, 0}), 600.0));
  b.source.white_light = true;
  return with_detector(std::move(b), {6, 0, 0});
}

Bench reflective_grating() {
  Bench b;
  b.elements.push_back(std::make_shared<ReflectiveGrating>("reflective_grating_1", turned({0, 0, 0}, -PI / 2),
                                                           600.0, LineOrientation::Vertical));
  b.source.white_light = true;
  return b;
}

Bench slit() {
  Bench b;
  b.elements.push_back(std::make_shared<Slit>("slit1", facing_x({0, 0, 0}), 0.005, 1.2));
  return with_detector(std::move(b), {6, 0, 0});
}

Bench aperture() {
  Bench b;
  b.elements.push_back(std::make_shared<Aperture>("aperture1", facing_x({0, 0, 0}), 1.0));
  b.source.pattern = PatternKind::Disc;
  return with_detector(std::move(b), {6, 0, 0});
}

Bench czerny_turner() {
  return make_czerny_turner();
}

Bench camera_image_object() {
  Bench b = camera_sensor();
  b.source.white_light = false;
  b.lens_mode = LensMode::Imaging;
  return b;
}

using BenchFactory = Bench (*)();

const std::array<std::pair<std::string_view, BenchFactory>, 11> &factories() {
  static const std::array<std::pair<std::string_view, BenchFactory>, 11> table{{
      {"single-lens", single_lens},
      {"flat-mirror", flat_mirror},
      {"spherical-mirror", spherical_mirror},
      {"two-lens", two_lens},
      {"camera-sensor", camera_sensor},
      {"transmissive-grating", transmissive_grating},
      {"reflective-grating", reflective_grating},
      {"slit", slit},
      {"aperture", aperture},
      {"czerny-turner", czerny_turner},
      {"camera-image-object", camera_image_object},
  }};
  return table;
}

} // namespace

TraceConfig Bench::trace_config() const {
  TraceConfig config;
  config.elements = elements;
  config.lens_mode = lens_mode;
  config.white_light = source.white_light;
  return config;
}

std::vector<Ray> Bench::seed_rays(Rng &rng, const ImagePlane *object) const {
  if (object && lens && lens_mode == LensMode::Imaging)
    return generate_object_cones(sample_object_plane(*object), lens->frame(), lens->aperture_radius());
  return generate_rays(source, rng);
}

const std::vector<std::string> &bench_names() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto &[name, factory] : factories())
      out.emplace_back(name);
    return out;
  }();
  return names;
}

Bench make_bench(std::string_view name) {
  for (const auto &[key, factory] : factories()) {
    if (key == name) {
      Bench bench = factory();
      bench.name = std::string(key);
      OLOG_DEBUG("Bench '{}': {} elements, lens mode {}", bench.name, bench.elements.size(),
                 to_string(bench.lens_mode));
      return bench;
    }
  }
  OLOG_ERROR("Unknown bench '{}'", name);
  throw std::invalid_argument("Unknown bench: " + std::string(name));
}

Bench make_czerny_turner(const CzernyTurnerParams &params) {
  require_positive(params.lines_per_mm, "lines_per_mm", "czerny-turner");
  require_positive(params.grating_distance, "grating_distance", "czerny-turner");
  require_positive(params.focusing_distance, "focusing_distance", "czerny-turner");

  constexpr double PHI = 30.0 * PI / 180.0;
  constexpr double LAMBDA_CENTRE = 550.0;
  constexpr double DETECTOR_WIDTH = 0.5;
  constexpr double WAVELENGTH_RANGE = 300.0;

  const double G = params.lines_per_mm;
  const double asin_arg = (LAMBDA_CENTRE * G * 1e-6) / (2.0 * std::cos(PHI / 2.0));
  if (std::abs(asin_arg) > 1.0) {
    OLOG_ERROR("czerny-turner: no grating angle for {} lines/mm (asin argument {})", G, asin_arg);
    throw std::invalid_argument("Czerny-Turner layout has no solution for this grating density");
  }

  const double alpha = std::asin(asin_arg) - PHI / 2.0;
  const double beta = PHI - alpha;

  const double Lf = DETECTOR_WIDTH * std::cos(beta) / (G * WAVELENGTH_RANGE * 1e-7);
  const double Lc = Lf * std::cos(alpha) / std::cos(beta);

  const Vec3 slit_pos{-10.0, 0.0, 0.0};
  const double coll_angle = deg_to_rad(params.collimating_angle_deg);

  // Collimating mirror
  const Vec3 coll_pos = slit_pos + Vec3{Lc, 0.0, 0.0};
  auto collimating = std::make_shared<SphericalMirror>("collimating_mirror", turned(coll_pos, -PI / 2 - coll_angle),
                                                       -2.0 * Lc);

  // Grating
  const Vec3 grating_pos = coll_pos - Vec3{params.grating_distance * std::cos(2.0 * coll_angle), 0.0,
                                           params.grating_distance * std::sin(2.0 * coll_angle)};
  const double grating_angle = alpha + 2.0 * coll_angle;
  auto grating = std::make_shared<ReflectiveGrating>("grating", turned(grating_pos, -PI / 2 - grating_angle + PI),
                                                     G, LineOrientation::Vertical);

  // Focusing mirror on the diffracted beam
  const double diffracted = grating_angle + beta;
  const Vec3 focus_pos = grating_pos + Vec3{params.focusing_distance * std::cos(diffracted), 0.0,
                                            params.focusing_distance * std::sin(diffracted)};
  const Frame focus_frame = turned(focus_pos, -PI / 2 - deg_to_rad(params.focusing_angle_deg));
  auto focusing = std::make_shared<SphericalMirror>("focusing_mirror", focus_frame, -2.0 * Lf);

  // Detector Lf along the reflected beam, facing the focusing mirror
  const Vec3 reflected = reflect(normalize(focus_pos - grating_pos), focus_frame.n);
  const Vec3 detector_pos = focus_pos + reflected * Lf;

  Bench b;
  b.name = "czerny-turner";
  b.source.position = {-12.0, 0.0, 0.0};
  b.source.white_light = true;
  b.detector = std::make_shared<Detector>("detector1", Frame::facing(detector_pos, focus_pos - detector_pos));
  b.elements = {std::make_shared<Slit>("slit1", facing_x(slit_pos), 0.005, 1.2), collimating, grating, focusing,
                b.detector};

  OLOG_DEBUG("czerny-turner: alpha {:.2f} deg, beta {:.2f} deg, Lc {:.3f}, Lf {:.3f}", rad_to_deg(alpha),
             rad_to_deg(beta), Lc, Lf);
  return b;
}

ImagePlane make_object_plane(int image_width, int image_height, std::vector<std::uint8_t> rgba) {
  if (image_width <= 0 || image_height <= 0) {
    OLOG_ERROR("make_object_plane: empty image {}x{}", image_width, image_height);
    throw std::invalid_argument("Object image must not be empty");
  }
  const std::size_t expected = static_cast<std::size_t>(image_width) * image_height * 4;
  if (rgba.size() < expected) {
    OLOG_ERROR("make_object_plane: buffer has {} bytes, expected {}", rgba.size(), expected);
    throw std::invalid_argument("Object image buffer is too small");
  }

  constexpr double PLANE_HEIGHT = 4.0;

  ImagePlane plane;
  plane.frame = facing_x({-10.0, 0.0, 0.0});
  plane.height = PLANE_HEIGHT;
  plane.width = PLANE_HEIGHT * static_cast<double>(image_width) / image_height;
  plane.image_width = image_width;
  plane.image_height = image_height;
  plane.rgba = std::move(rgba);
  return plane;
}

ImagePlane make_color_chart(int image_width, int image_height) {
  static constexpr std::array<std::array<std::uint8_t, 3>, 6> PATCHES{{
      {255, 0, 0}, {0, 255, 0}, {0, 0, 255}, {255, 255, 0}, {0, 255, 255}, {255, 0, 255},
  }};

  std::vector<std::uint8_t> rgba(static_cast<std::size_t>(std::max(image_width, 0)) * std::max(image_height, 0) * 4);
  for (int y = 0; y < image_height; ++y) {
    for (int x = 0; x < image_width; ++x) {
      const int col = x * 3 / image_width;
      const int row = y * 2 / image_height;
      const auto &c = PATCHES[row * 3 + col];
      const std::size_t i = (static_cast<std::size_t>(y) * image_width + x) * 4;
      rgba[i] = c[0];
      rgba[i + 1] = c[1];
      rgba[i + 2] = c[2];
      rgba[i + 3] = 255;
    }
  }
  return make_object_plane(image_width, image_height, std::move(rgba));
}

} // namespace opticslab::core
