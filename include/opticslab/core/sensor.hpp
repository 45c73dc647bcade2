#pragma once
#include <opticslab/core/color.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace opticslab::core {

enum class SensorMode { Grayscale, Bayer, Demosaiced };

std::string_view to_string(SensorMode mode);
std::optional<SensorMode> parse_sensor_mode(std::string_view name);

struct RGB8 {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  bool operator==(const RGB8 &o) const = default;
};

/// @brief Final 8-bit image, row-major, 3 bytes per pixel
struct SensorImage {
  int width;
  int height;
  std::vector<std::uint8_t> pixels;

  SensorImage(int w, int h);

  RGB8 at(int x, int y) const;
  void set(int x, int y, const RGB8 &c);
  bool is_black() const;
};

/// @brief W x H grid of RGB sums with the running maximum over all channels
struct IntensityGrid {
  int width;
  int height;
  std::vector<RGB> cells;
  double max_value{0.0};

  IntensityGrid(int w, int h);

  const RGB &at(int x, int y) const;
  void add(int x, int y, const RGB &value);
  void clear();
};

/// Maps a wavelength (nm) to the per-channel contribution of one hit
using ColorResolver = RGB (*)(double wavelength_nm);

/// @brief Simulated sensor fed by detector hits
///
/// Two grids are filled in parallel: `filtered` holds the Bayer colour-filter
/// response, `true_color` the display colour. Rays carrying an explicit colour
/// add it unchanged to both. Both grids only grow within a trace.
class SensorAccumulator {
public:
  /// @throws std::invalid_argument if width or height <= 0
  SensorAccumulator(int width, int height);

  int width() const { return filtered_.width; }
  int height() const { return filtered_.height; }

  /// @brief Zero both grids and their maxima
  void reset();

  /// @brief Accumulate one hit at pixel (px, py)
  /// @return false if the pixel lies outside the grid (hit discarded)
  bool record_hit(int px, int py, double wavelength_nm, const std::optional<RGB> &color = std::nullopt);

  /// @brief Normalize and encode the accumulated grids
  ///
  /// Each grid is scaled by its own maximum to [0, 255]. A grid without hits renders black.
  SensorImage render(SensorMode mode) const;

  const IntensityGrid &filtered() const { return filtered_; }
  const IntensityGrid &true_color() const { return true_color_; }

  std::size_t hits() const { return hits_; }
  std::size_t discarded() const { return discarded_; }

  /// @brief Create empty accumulator with the same geometry
  SensorAccumulator copy_start() const;

  /// @brief Add another accumulator's grids and counters into this one
  /// @throws std::invalid_argument on a geometry mismatch
  void merge_from(const SensorAccumulator &other);

private:
  IntensityGrid filtered_;
  IntensityGrid true_color_;
  std::size_t hits_{0};
  std::size_t discarded_{0};

  static void accumulate(IntensityGrid &grid, int px, int py, double wavelength_nm,
                         const std::optional<RGB> &color, ColorResolver resolve);
};

} // namespace opticslab::core
