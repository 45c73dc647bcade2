#include <opticslab/core/grating.hpp>
#include <opticslab/log/logger.hpp>
#include <cmath>
#include <stdexcept>

namespace opticslab::core {

std::string_view to_string(LineOrientation o) {
  return o == LineOrientation::Vertical ? "vertical" : "horizontal";
}

std::optional<double> diffraction_angle(int order, double wavelength_nm, double groove_spacing_nm) {
  const double sin_theta = (order * wavelength_nm) / groove_spacing_nm;
  if (std::abs(sin_theta) > 1.0)
    return std::nullopt;
  return std::asin(sin_theta);
}

Grating::Grating(std::string name, const Frame &frame, double lines_per_mm, LineOrientation orientation,
                 double width, double height)
    : OpticalElement(std::move(name), frame), lines_per_mm_(lines_per_mm), orientation_(orientation),
      width_(width), height_(height) {
  set_lines_per_mm(lines_per_mm);
  require_positive(width_, "width", name_);
  require_positive(height_, "height", name_);
}

void Grating::set_lines_per_mm(double lines_per_mm) {
  require_positive(lines_per_mm, "groove density (lines/mm)", name_);
  lines_per_mm_ = lines_per_mm;
}

TransmissiveGrating::TransmissiveGrating(std::string name, const Frame &frame, double lines_per_mm,
                                         LineOrientation orientation, double width, double height)
    : Grating(std::move(name), frame, lines_per_mm, orientation, width, height) {}

Outcome TransmissiveGrating::interact(const Ray &ray, const Ray &, const InteractionContext &) const {
  const PlaneHit hit = intersect_plane(frame_, ray.origin(), ray.direction());
  if (!hit.hit || !inside_rect(hit.local, width_, height_))
    return Miss{};

  // Local direction; `a` is the transverse component inside the dispersion plane,
  // measured along v for horizontal lines and along -u (n x v) for vertical ones
  const Vec3 d = frame_.direction_to_local(ray.direction());
  const bool horizontal = orientation_ == LineOrientation::Horizontal;
  const double a = horizontal ? d.y : -d.x;
  const double in_plane = std::hypot(d.z, a);
  const double angle = std::atan2(a, d.z);
  const double spacing = groove_spacing_nm();

  Split split;
  for (int m : GRATING_ORDERS) {
    if (m == 0) {
      split.rays.push_back(ray.diffracted(hit.point, ray.direction(), 0));
      continue;
    }

    const std::optional<double> theta = diffraction_angle(m, ray.wavelength_nm(), spacing);
    if (!theta)
      continue;

    const double rotated = angle + *theta;
    Vec3 out = d;
    out.z = in_plane * std::cos(rotated);
    if (horizontal)
      out.y = in_plane * std::sin(rotated);
    else
      out.x = -in_plane * std::sin(rotated);

    split.rays.push_back(ray.diffracted(hit.point, frame_.direction_to_world(out), m));
  }

  return split;
}

ReflectiveGrating::ReflectiveGrating(std::string name, const Frame &frame, double lines_per_mm,
                                     LineOrientation orientation, double width, double height)
    : Grating(std::move(name), frame, lines_per_mm, orientation, width, height) {}

Vec3 ReflectiveGrating::dispersion_axis() const {
  return orientation_ == LineOrientation::Vertical ? frame_.u : frame_.v;
}

Outcome ReflectiveGrating::interact(const Ray &ray, const Ray &, const InteractionContext &) const {
  // Back face is inert
  if (dot(ray.direction(), frame_.n) >= 0.0)
    return Miss{};

  const PlaneHit hit = intersect_plane(frame_, ray.origin(), ray.direction());
  if (!hit.hit || !inside_rect(hit.local, width_, height_))
    return Miss{};

  const Vec3 reflected = reflect(ray.direction(), frame_.n);
  Vec3 rotation_axis = cross(reflected, dispersion_axis());
  if (norm2(rotation_axis) < 1e-20) {
    const Vec3 fallback = orientation_ == LineOrientation::Vertical ? frame_.v : frame_.u;
    rotation_axis = cross(reflected, fallback);
  }
  rotation_axis = normalize(rotation_axis);

  const double spacing = groove_spacing_nm();

  Split split;
  for (int m : GRATING_ORDERS) {
    if (m == 0) {
      split.rays.push_back(ray.diffracted(hit.point, reflected, 0));
      continue;
    }

    const std::optional<double> theta = diffraction_angle(m, ray.wavelength_nm(), spacing);
    if (!theta)
      continue;
    split.rays.push_back(ray.diffracted(hit.point, rotate_about_axis(reflected, rotation_axis, *theta), m));
  }

  return split;
}

} // namespace opticslab::core
