#include <opticslab/core/ray.hpp>
#include <opticslab/log/logger.hpp>
#include <stdexcept>

namespace opticslab::core {

Ray::Ray(const Vec3 &origin, const Vec3 &direction, double wavelength_nm,
         std::optional<RGB> color, std::optional<int> diffraction_order)
    : origin_(origin), direction_(normalize(direction)), wavelength_nm_(wavelength_nm),
      color_(color), diffraction_order_(diffraction_order) {
  if (norm2(direction) == 0.0) {
    OLOG_ERROR("Ray::Ray: direction has zero length");
    throw std::invalid_argument("Ray direction must be non-zero");
  }
}

Vec3 Ray::at(double t) const {
  return origin_ + direction_ * t;
}

Ray Ray::redirected(const Vec3 &origin, const Vec3 &direction) const {
  return Ray(origin, direction, wavelength_nm_, color_, diffraction_order_);
}

Ray Ray::diffracted(const Vec3 &origin, const Vec3 &direction, int order) const {
  return Ray(origin, direction, wavelength_nm_, color_, order);
}

RGB Ray::display_color() const {
  if (color_)
    return *color_;
  return wavelength_to_rgb(wavelength_nm_);
}

} // namespace opticslab::core
