#pragma once
#include <opticslab/core/color.hpp>
#include <opticslab/core/detector.hpp>
#include <opticslab/core/element.hpp>
#include <opticslab/core/ray.hpp>
#include <opticslab/core/sensor.hpp>
#include <opticslab/math/vec.hpp>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace opticslab::core {

inline constexpr double DEFAULT_TAIL_LENGTH = 25.0;
inline constexpr double POLYLINE_OPACITY = 0.5;

struct TraceConfig {
  std::vector<ElementPtr> elements;
  LensMode lens_mode{LensMode::Paraxial};

  bool white_light{false};
  RGB neutral_color{0.0, 0.0, 0.0};

  double tail_length{DEFAULT_TAIL_LENGTH};
  double scene_radius{std::numeric_limits<double>::infinity()};
};

/// @brief Propagation state of one ray lineage
struct ActivePath {
  Ray ray;
  Ray seed;
  std::vector<Vec3> points;
  bool terminated{false};
  bool has_split{false};
  std::size_t split_index{0}; ///< index in points of the first split vertex

  ActivePath(const Ray &ray, const Ray &seed);
};

struct Polyline {
  std::vector<Vec3> points;
  RGB color;
  double opacity{POLYLINE_OPACITY};
  std::optional<int> diffraction_order;
  bool split{false};
};

struct Detection {
  std::string detector;
  Vec3 point;
  Vec2 local;
  PixelCoord pixel;
  bool in_grid{false};
  double wavelength_nm{DEFAULT_WAVELENGTH_NM};
  std::optional<RGB> color;
};

struct TraceResult {
  std::vector<Polyline> polylines;
  std::vector<Detection> detections;
  std::vector<Ray> surviving; ///< final rays of paths that were never terminated

  std::size_t n_seeds{0};
  std::size_t n_splits{0};
  std::size_t n_absorbed{0}; ///< non-detector absorptions (stops)
  std::size_t n_detected{0};
  std::size_t n_discarded{0}; ///< detections that fell outside the sensor grid
  std::size_t n_escaped{0};   ///< paths terminated by leaving the scene radius
};

/// @brief Single forward sweep of the seed rays through config.elements, in order
///
/// Every element is visited once per round by all live paths. Detector hits are
/// projected onto `sensor` (if given); the sensor is reset first.
TraceResult run_trace(const TraceConfig &config, const std::vector<Ray> &seeds,
                      SensorAccumulator *sensor = nullptr);

/// @brief Polylines for the final path set
std::vector<Polyline> build_polylines(const TraceConfig &config, const std::vector<ActivePath> &paths);

} // namespace opticslab::core
