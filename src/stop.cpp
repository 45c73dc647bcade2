#include <opticslab/core/stop.hpp>
#include <cmath>

namespace opticslab::core {

Stop::Stop(std::string name, const Frame &frame, double plate_size)
    : OpticalElement(std::move(name), frame), plate_size_(plate_size) {
  require_positive(plate_size_, "plate size", name_);
}

Outcome Stop::interact(const Ray &ray, const Ray &, const InteractionContext &) const {
  const PlaneHit hit = intersect_plane(frame_, ray.origin(), ray.direction());
  if (!hit.hit)
    return Miss{};

  if (is_open(hit.local))
    return Redirect{ray.redirected(hit.point, ray.direction())};

  if (inside_rect(hit.local, plate_size_, plate_size_))
    return Absorb{hit.point, ray.wavelength_nm(), ray.color(), false};

  return Miss{};
}

Slit::Slit(std::string name, const Frame &frame, double width, double height, double plate_size)
    : Stop(std::move(name), frame, plate_size), width_(width), height_(height) {
  set_width(width);
  set_height(height);
}

void Slit::set_width(double width) {
  require_positive(width, "slit width", name_);
  width_ = width;
}

void Slit::set_height(double height) {
  require_positive(height, "slit height", name_);
  height_ = height;
}

bool Slit::is_open(const Vec3 &local) const {
  return inside_rect(local, width_, height_);
}

Aperture::Aperture(std::string name, const Frame &frame, double diameter, double plate_size)
    : Stop(std::move(name), frame, plate_size), diameter_(diameter) {
  set_diameter(diameter);
}

void Aperture::set_diameter(double diameter) {
  require_positive(diameter, "aperture diameter", name_);
  diameter_ = diameter;
}

bool Aperture::is_open(const Vec3 &local) const {
  return std::hypot(local.x, local.y) <= diameter_ / 2.0;
}

} // namespace opticslab::core
