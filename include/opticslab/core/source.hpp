#pragma once
#include <opticslab/core/color.hpp>
#include <opticslab/core/ray.hpp>
#include <opticslab/math/frame.hpp>
#include <opticslab/math/rng.hpp>
#include <opticslab/math/vec.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

using namespace opticslab::math;

namespace opticslab::core {

enum class PatternKind {
  Line,   ///< evenly spaced along the up axis
  Radial, ///< ring of radius beam_size / 2
  Cross,  ///< two perpendicular lines, ray_count / 2 rays each
  Disc,   ///< uniform over the beam disc (random)
  Heart,
  Star,
  Smile
};

std::string_view to_string(PatternKind kind);
std::optional<PatternKind> parse_pattern(std::string_view name);

inline constexpr int MAX_RAY_COUNT = 5000;
inline constexpr double DEFAULT_BEAM_SIZE = 1.0;
inline constexpr double DEFAULT_SOURCE_X = -9.75;

struct SourceConfig {
  Vec3 position{DEFAULT_SOURCE_X, 0.0, 0.0};
  Vec3 direction{X_UNIT_VEC3};
  Vec3 up{Y_UNIT_VEC3};

  PatternKind pattern{PatternKind::Line};
  int ray_count{100};
  double beam_size{DEFAULT_BEAM_SIZE};

  bool white_light{false};
  double wavelength_nm{DEFAULT_WAVELENGTH_NM};
};

/// @brief Transverse pattern offsets (a along up, b across) for n rays, beam diameter `size`
std::vector<Vec2> pattern_offsets(PatternKind kind, int n, double size, Rng &rng);

/// @brief Build the seed rays of a collimated source
///
/// The pattern is emitted once per wavelength: {450, 532, 650} nm in white-light
/// mode, otherwise config.wavelength_nm. ray_count is clamped to [0, MAX_RAY_COUNT].
/// Only the disc pattern consumes the RNG.
/// @throws std::invalid_argument if direction has zero length
std::vector<Ray> generate_rays(const SourceConfig &config, Rng &rng);

inline constexpr int DEFAULT_SAMPLING_STRIDE = 25;
inline constexpr double OBJECT_RAY_WAVELENGTH_NM = 555.0;

/// @brief Textured object plane (e.g. a picture placed in front of a camera)
///
/// rgba is row-major, 4 bytes per pixel, image_width x image_height pixels,
/// stretched over width x height world units in the frame's (u, v) plane.
struct ImagePlane {
  Frame frame;
  double width{DEFAULT_BEAM_SIZE};
  double height{DEFAULT_BEAM_SIZE};
  int image_width{0};
  int image_height{0};
  std::vector<std::uint8_t> rgba;
};

struct ObjectSample {
  Vec3 position;
  RGB color;
};

/// @brief Sample every `stride`-th pixel in both directions, skipping fully transparent ones
/// @throws std::invalid_argument on a non-positive stride, empty image or short buffer
std::vector<ObjectSample> sample_object_plane(const ImagePlane &plane, int stride = DEFAULT_SAMPLING_STRIDE);

/// @brief Expand each sample into a chief ray toward the lens centre plus four
/// marginal rays toward the lens rim (centre +- R v, +- R u), all at 555 nm and
/// tagged with the sample colour
std::vector<Ray> generate_object_cones(const std::vector<ObjectSample> &samples, const Frame &lens_frame,
                                       double lens_radius);

} // namespace opticslab::core
