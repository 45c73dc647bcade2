#pragma once
#include <opticslab/core/detector.hpp>
#include <opticslab/core/element.hpp>
#include <opticslab/core/lens.hpp>
#include <opticslab/core/source.hpp>
#include <opticslab/core/tracer.hpp>
#include <opticslab/math/rng.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace opticslab::core {

inline constexpr int DEFAULT_GRID_SIZE = 50;

/// @brief Ready-to-trace optical bench: elements, source and sensor geometry
struct Bench {
  std::string name;
  std::vector<ElementPtr> elements;
  SourceConfig source;
  LensMode lens_mode{LensMode::Paraxial};

  int grid_width{DEFAULT_GRID_SIZE};
  int grid_height{DEFAULT_GRID_SIZE};

  std::shared_ptr<Detector> detector; ///< null for benches without a sensor
  std::shared_ptr<ThinLens> lens;     ///< imaging lens for object-plane benches

  TraceConfig trace_config() const;

  /// @brief Seed rays: object cones when `object` is given and the bench images, else the source pattern
  std::vector<Ray> seed_rays(Rng &rng, const ImagePlane *object = nullptr) const;
};

struct CzernyTurnerParams {
  double collimating_angle_deg{-20.0};
  double lines_per_mm{1000.0};
  double grating_distance{10.0};
  double focusing_distance{10.0};
  double focusing_angle_deg{10.0};
};

/// Names accepted by make_bench
const std::vector<std::string> &bench_names();

/// @throws std::invalid_argument for an unknown name
Bench make_bench(std::string_view name);

/// @brief Crossed Czerny-Turner spectrometer (slit, collimating mirror, reflective
/// grating, focusing mirror, detector) laid out in the x-z plane
/// @throws std::invalid_argument if the grating angle cannot be solved for the given density
Bench make_czerny_turner(const CzernyTurnerParams &params = {});

/// @brief Object plane at x = -10 facing +x, 4 units tall, width following the image aspect
/// @throws std::invalid_argument on an empty image or a short buffer
ImagePlane make_object_plane(int image_width, int image_height, std::vector<std::uint8_t> rgba);

/// @brief Synthetic opaque colour chart (a grid of saturated patches)
ImagePlane make_color_chart(int image_width = 200, int image_height = 150);

} // namespace opticslab::core
