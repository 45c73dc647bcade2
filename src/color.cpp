#include <opticslab/core/color.hpp>
#include <algorithm>
#include <cmath>

namespace opticslab::core {

double RGB::max_component() const {
  return std::max({r, g, b});
}

RGB &RGB::operator+=(const RGB &o) {
  r += o.r;
  g += o.g;
  b += o.b;
  return *this;
}

RGB wavelength_to_rgb(double nm) {
  double r = 0.0, g = 0.0, b = 0.0;

  if (nm >= LAMBDA_MIN && nm < 440.0) {
    r = -(nm - 440.0) / (440.0 - LAMBDA_MIN);
    b = 1.0;
  } else if (nm >= 440.0 && nm < 490.0) {
    g = (nm - 440.0) / (490.0 - 440.0);
    b = 1.0;
  } else if (nm >= 490.0 && nm < 510.0) {
    g = 1.0;
    b = -(nm - 510.0) / (510.0 - 490.0);
  } else if (nm >= 510.0 && nm < 580.0) {
    r = (nm - 510.0) / (580.0 - 510.0);
    g = 1.0;
  } else if (nm >= 580.0 && nm < 645.0) {
    r = 1.0;
    g = -(nm - 645.0) / (645.0 - 580.0);
  } else if (nm >= 645.0 && nm <= LAMBDA_MAX) {
    r = 1.0;
  }

  // Intensity falls off towards the edges of the visible band
  double factor = 0.0;
  if (nm >= LAMBDA_MIN && nm < 420.0) {
    factor = 0.3 + 0.7 * (nm - LAMBDA_MIN) / (420.0 - LAMBDA_MIN);
  } else if (nm >= 420.0 && nm < 701.0) {
    factor = 1.0;
  } else if (nm >= 701.0 && nm <= LAMBDA_MAX) {
    factor = 0.3 + 0.7 * (LAMBDA_MAX - nm) / (LAMBDA_MAX - 701.0);
  }

  return {r * factor, g * factor, b * factor};
}

double filter_response(double nm, Channel channel) {
  double peak = 0.0;
  double width = 50.0;
  switch (channel) {
  case Channel::R:
    peak = 600.0;
    break;
  case Channel::G:
    peak = 540.0;
    break;
  case Channel::B:
    peak = 450.0;
    break;
  }
  const double delta = nm - peak;
  return std::exp(-(delta * delta) / (2.0 * width * width));
}

RGB filter_response_rgb(double nm) {
  return {
    filter_response(nm, Channel::R),
    filter_response(nm, Channel::G),
    filter_response(nm, Channel::B)
  };
}

} // namespace opticslab::core
