#include <opticslab/core/sensor.hpp>
#include <opticslab/log/logger.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace opticslab::core {

namespace {

std::uint8_t to_byte(double value) {
  return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

} // namespace

std::string_view to_string(SensorMode mode) {
  switch (mode) {
  case SensorMode::Grayscale:
    return "grayscale";
  case SensorMode::Bayer:
    return "bayer";
  case SensorMode::Demosaiced:
    return "demosaiced";
  }
  return "grayscale";
}

std::optional<SensorMode> parse_sensor_mode(std::string_view name) {
  if (name == "grayscale")
    return SensorMode::Grayscale;
  if (name == "bayer")
    return SensorMode::Bayer;
  if (name == "demosaiced")
    return SensorMode::Demosaiced;
  return std::nullopt;
}

SensorImage::SensorImage(int w, int h)
    : width(w), height(h), pixels(static_cast<std::size_t>(w) * h * 3, 0) {}

RGB8 SensorImage::at(int x, int y) const {
  const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 3;
  return {pixels[i], pixels[i + 1], pixels[i + 2]};
}

void SensorImage::set(int x, int y, const RGB8 &c) {
  const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 3;
  pixels[i] = c.r;
  pixels[i + 1] = c.g;
  pixels[i + 2] = c.b;
}

bool SensorImage::is_black() const {
  return std::all_of(pixels.begin(), pixels.end(), [](std::uint8_t p) { return p == 0; });
}

IntensityGrid::IntensityGrid(int w, int h)
    : width(w), height(h), cells(static_cast<std::size_t>(w) * h) {}

const RGB &IntensityGrid::at(int x, int y) const {
  return cells[static_cast<std::size_t>(y) * width + x];
}

void IntensityGrid::add(int x, int y, const RGB &value) {
  RGB &cell = cells[static_cast<std::size_t>(y) * width + x];
  cell += value;
  max_value = std::max(max_value, cell.max_component());
}

void IntensityGrid::clear() {
  std::fill(cells.begin(), cells.end(), RGB{});
  max_value = 0.0;
}

SensorAccumulator::SensorAccumulator(int width, int height)
    : filtered_(std::max(width, 0), std::max(height, 0)),
      true_color_(std::max(width, 0), std::max(height, 0)) {
  if (width <= 0 || height <= 0) {
    OLOG_ERROR("SensorAccumulator: grid must be at least 1x1, got {}x{}", width, height);
    throw std::invalid_argument("Sensor grid dimensions must be positive");
  }
}

void SensorAccumulator::reset() {
  filtered_.clear();
  true_color_.clear();
  hits_ = 0;
  discarded_ = 0;
}

void SensorAccumulator::accumulate(IntensityGrid &grid, int px, int py, double wavelength_nm,
                                   const std::optional<RGB> &color, ColorResolver resolve) {
  grid.add(px, py, color ? *color : resolve(wavelength_nm));
}

bool SensorAccumulator::record_hit(int px, int py, double wavelength_nm, const std::optional<RGB> &color) {
  if (px < 0 || px >= width() || py < 0 || py >= height()) {
    ++discarded_;
    return false;
  }

  accumulate(filtered_, px, py, wavelength_nm, color, filter_response_rgb);
  accumulate(true_color_, px, py, wavelength_nm, color, wavelength_to_rgb);
  ++hits_;
  return true;
}

SensorImage SensorAccumulator::render(SensorMode mode) const {
  SensorImage image(width(), height());

  const IntensityGrid &grid = (mode == SensorMode::Demosaiced) ? true_color_ : filtered_;
  if (grid.max_value <= 0.0)
    return image;

  const double scale = 255.0 / grid.max_value;

  for (int y = 0; y < height(); ++y) {
    for (int x = 0; x < width(); ++x) {
      const RGB &cell = grid.at(x, y);
      const RGB8 c{to_byte(cell.r * scale), to_byte(cell.g * scale), to_byte(cell.b * scale)};

      switch (mode) {
      case SensorMode::Demosaiced:
        image.set(x, y, c);
        break;
      case SensorMode::Grayscale: {
        const std::uint8_t gray = to_byte((c.r + c.g + c.b) / 3.0);
        image.set(x, y, {gray, gray, gray});
        break;
      }
      case SensorMode::Bayer: {
        // G R
        // B G
        const bool even_row = (y % 2) == 0;
        const bool even_col = (x % 2) == 0;
        if (even_row == even_col)
          image.set(x, y, {0, c.g, 0});
        else if (even_row)
          image.set(x, y, {c.r, 0, 0});
        else
          image.set(x, y, {0, 0, c.b});
        break;
      }
      }
    }
  }

  return image;
}

SensorAccumulator SensorAccumulator::copy_start() const {
  return SensorAccumulator(width(), height());
}

void SensorAccumulator::merge_from(const SensorAccumulator &other) {
  if (other.width() != width() || other.height() != height()) {
    OLOG_ERROR("SensorAccumulator::merge_from: grid mismatch {}x{} vs {}x{}",
               width(), height(), other.width(), other.height());
    throw std::invalid_argument("Cannot merge sensors of different size");
  }

  for (int y = 0; y < height(); ++y) {
    for (int x = 0; x < width(); ++x) {
      filtered_.add(x, y, other.filtered_.at(x, y));
      true_color_.add(x, y, other.true_color_.at(x, y));
    }
  }
  hits_ += other.hits_;
  discarded_ += other.discarded_;
}

} // namespace opticslab::core
