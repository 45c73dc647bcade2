#pragma once
#include <array>

namespace opticslab::core {

struct RGB {
  double r{0.0};
  double g{0.0};
  double b{0.0};

  RGB() = default;
  RGB(double r, double g, double b) : r(r), g(g), b(b) {}

  double max_component() const;
  RGB &operator+=(const RGB &o);
  bool operator==(const RGB &o) const = default;
};

enum class Channel { R = 0, G = 1, B = 2 };

/// Visible band covered by wavelength_to_rgb (nm)
inline constexpr double LAMBDA_MIN = 380.0;
inline constexpr double LAMBDA_MAX = 780.0;

/// Representative wavelengths emitted by a white-light source (nm)
inline constexpr std::array<double, 3> WHITE_LIGHT_WAVELENGTHS{450.0, 532.0, 650.0};

/// @brief Piecewise-linear visible-spectrum ramp with intensity falloff at both ends
/// @param nm Wavelength (nm)
/// @return Display colour in [0,1]; black outside [380, 780] nm
RGB wavelength_to_rgb(double nm);

/// @brief Gaussian colour-filter sensitivity of one Bayer channel
/// @param nm Wavelength (nm)
/// @param channel R (600/50), G (540/50) or B (450/50) peak/width
double filter_response(double nm, Channel channel);

/// @brief filter_response for all three channels
RGB filter_response_rgb(double nm);

} // namespace opticslab::core
