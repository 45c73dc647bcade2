#include <opticslab/core/source.hpp>
#include <opticslab/log/logger.hpp>
#include <opticslab/math/utils.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace opticslab::core {

namespace {

// Evenly spaced values over [-size/2, size/2]; a single value sits at 0
double spread(int i, int n, double size) {
  if (n <= 1)
    return 0.0;
  return -size / 2.0 + size * (static_cast<double>(i) / (n - 1));
}

Vec2 disc_sample(Rng &rng, double radius) {
  const double r = radius * std::sqrt(rng.uniform());
  const double theta = rng.uniform(0.0, 2.0 * PI);
  return {r * std::sin(theta), r * std::cos(theta)};
}

// Classic heart curve, extent about 17 x 17 before scaling
Vec2 heart_point(double t, double radius) {
  const double s = std::sin(t);
  const double x = 16.0 * s * s * s;
  const double y = 13.0 * std::cos(t) - 5.0 * std::cos(2.0 * t) - 2.0 * std::cos(3.0 * t) - std::cos(4.0 * t);
  return {radius * y / 17.0, radius * x / 17.0};
}

// Five-pointed star outline, inner radius 0.4 R, first tip pointing up
Vec2 star_point(double t, double radius) {
  constexpr int VERTICES = 10;
  const double pos = t / (2.0 * PI) * VERTICES;
  const int k = static_cast<int>(std::floor(pos)) % VERTICES;
  const double frac = pos - std::floor(pos);

  auto vertex = [radius](int i) {
    const double r = (i % 2 == 0) ? radius : 0.4 * radius;
    const double a = 2.0 * PI * i / VERTICES;
    return Vec2{r * std::cos(a), r * std::sin(a)};
  };

  const Vec2 p = vertex(k);
  const Vec2 q = vertex((k + 1) % VERTICES);
  return {p.x + (q.x - p.x) * frac, p.y + (q.y - p.y) * frac};
}

std::vector<Vec2> smile_offsets(int n, double radius) {
  std::vector<Vec2> out;
  out.reserve(n);

  // face 50%, each eye 10%, mouth the rest
  const int face = n / 2;
  const int eye = n / 10;
  const int mouth = n - face - 2 * eye;

  for (int i = 0; i < face; ++i) {
    const double a = 2.0 * PI * i / face;
    out.push_back({radius * std::cos(a), radius * std::sin(a)});
  }
  for (const double side : {-1.0, 1.0}) {
    for (int i = 0; i < eye; ++i) {
      const double a = 2.0 * PI * i / eye;
      out.push_back({0.35 * radius + 0.1 * radius * std::cos(a), side * 0.35 * radius + 0.1 * radius * std::sin(a)});
    }
  }
  for (int i = 0; i < mouth; ++i) {
    const double a = (mouth <= 1) ? PI : deg_to_rad(200.0) + deg_to_rad(140.0) * i / (mouth - 1);
    // lower arc of a circle of radius 0.6 R
    out.push_back({0.6 * radius * std::sin(a) + 0.05 * radius, 0.6 * radius * std::cos(a)});
  }
  return out;
}

} // namespace

std::string_view to_string(PatternKind kind) {
  switch (kind) {
  case PatternKind::Line:
    return "line";
  case PatternKind::Radial:
    return "radial";
  case PatternKind::Cross:
    return "cross";
  case PatternKind::Disc:
    return "disc";
  case PatternKind::Heart:
    return "heart";
  case PatternKind::Star:
    return "star";
  case PatternKind::Smile:
    return "smile";
  }
  return "line";
}

std::optional<PatternKind> parse_pattern(std::string_view name) {
  for (PatternKind kind : {PatternKind::Line, PatternKind::Radial, PatternKind::Cross, PatternKind::Disc,
                           PatternKind::Heart, PatternKind::Star, PatternKind::Smile}) {
    if (to_string(kind) == name)
      return kind;
  }
  return std::nullopt;
}

std::vector<Vec2> pattern_offsets(PatternKind kind, int n, double size, Rng &rng) {
  std::vector<Vec2> out;
  if (n <= 0)
    return out;

  const double radius = size / 2.0;
  out.reserve(n);

  switch (kind) {
  case PatternKind::Line:
    for (int i = 0; i < n; ++i)
      out.push_back({spread(i, n, size), 0.0});
    break;
  case PatternKind::Radial:
    for (int i = 0; i < n; ++i) {
      const double angle = (static_cast<double>(i) / n) * 2.0 * PI;
      out.push_back({std::sin(angle) * radius, std::cos(angle) * radius});
    }
    break;
  case PatternKind::Cross: {
    const int half = n / 2;
    for (int i = 0; i < half; ++i)
      out.push_back({spread(i, half, size), 0.0});
    for (int i = 0; i < half; ++i)
      out.push_back({0.0, spread(i, half, size)});
    break;
  }
  case PatternKind::Disc:
    for (int i = 0; i < n; ++i)
      out.push_back(disc_sample(rng, radius));
    break;
  case PatternKind::Heart:
    for (int i = 0; i < n; ++i)
      out.push_back(heart_point(2.0 * PI * i / n, radius));
    break;
  case PatternKind::Star:
    for (int i = 0; i < n; ++i)
      out.push_back(star_point(2.0 * PI * i / n, radius));
    break;
  case PatternKind::Smile:
    out = smile_offsets(n, radius);
    break;
  }
  return out;
}

std::vector<Ray> generate_rays(const SourceConfig &config, Rng &rng) {
  int count = config.ray_count;
  if (count > MAX_RAY_COUNT) {
    OLOG_WARN("Source: ray_count {} exceeds limit, clamped to {}", count, MAX_RAY_COUNT);
    count = MAX_RAY_COUNT;
  } else if (count < 0) {
    OLOG_WARN("Source: negative ray_count {}, no rays emitted", count);
    count = 0;
  }

  // Transverse axes: `up` and the "across" axis. For a +x beam these are +y and +z.
  const Frame frame = Frame::facing(config.position, config.direction, config.up);
  const Vec3 across = -frame.u;

  std::vector<double> wavelengths;
  if (config.white_light)
    wavelengths.assign(WHITE_LIGHT_WAVELENGTHS.begin(), WHITE_LIGHT_WAVELENGTHS.end());
  else
    wavelengths.push_back(config.wavelength_nm);

  std::vector<Ray> rays;
  rays.reserve(wavelengths.size() * count);

  for (double wl : wavelengths) {
    for (const Vec2 &o : pattern_offsets(config.pattern, count, config.beam_size, rng)) {
      const Vec3 start = config.position + frame.v * o.x + across * o.y;
      rays.emplace_back(start, frame.n, wl);
    }
  }

  OLOG_DEBUG("Source: {} rays ({} pattern, {} wavelength(s))", rays.size(), to_string(config.pattern),
             wavelengths.size());
  return rays;
}

std::vector<ObjectSample> sample_object_plane(const ImagePlane &plane, int stride) {
  if (stride <= 0) {
    OLOG_ERROR("sample_object_plane: stride must be positive, got {}", stride);
    throw std::invalid_argument("Sampling stride must be positive");
  }
  if (plane.image_width <= 0 || plane.image_height <= 0) {
    OLOG_ERROR("sample_object_plane: empty image {}x{}", plane.image_width, plane.image_height);
    throw std::invalid_argument("Object image must not be empty");
  }
  const std::size_t expected = static_cast<std::size_t>(plane.image_width) * plane.image_height * 4;
  if (plane.rgba.size() < expected) {
    OLOG_ERROR("sample_object_plane: buffer has {} bytes, expected {}", plane.rgba.size(), expected);
    throw std::invalid_argument("Object image buffer is too small");
  }

  std::vector<ObjectSample> samples;

  for (int y = 0; y < plane.image_height; y += stride) {
    for (int x = 0; x < plane.image_width; x += stride) {
      const std::size_t i = (static_cast<std::size_t>(y) * plane.image_width + x) * 4;
      if (plane.rgba[i + 3] == 0)
        continue;

      const double u = (static_cast<double>(x) / plane.image_width - 0.5) * plane.width;
      const double v = -(static_cast<double>(y) / plane.image_height - 0.5) * plane.height;

      samples.push_back({plane.frame.to_world({u, v, 0.0}),
                         RGB{plane.rgba[i] / 255.0, plane.rgba[i + 1] / 255.0, plane.rgba[i + 2] / 255.0}});
    }
  }
  return samples;
}

std::vector<Ray> generate_object_cones(const std::vector<ObjectSample> &samples, const Frame &lens_frame,
                                       double lens_radius) {
  const Vec3 &centre = lens_frame.origin;
  const Vec3 targets[] = {
      centre,
      centre + lens_frame.v * lens_radius,
      centre - lens_frame.v * lens_radius,
      centre + lens_frame.u * lens_radius,
      centre - lens_frame.u * lens_radius,
  };

  std::vector<Ray> rays;
  rays.reserve(samples.size() * 5);

  for (const ObjectSample &s : samples) {
    for (const Vec3 &target : targets) {
      const Vec3 dir = target - s.position;
      if (norm2(dir) == 0.0)
        continue;
      rays.emplace_back(s.position, dir, OBJECT_RAY_WAVELENGTH_NM, s.color);
    }
  }
  return rays;
}

} // namespace opticslab::core
