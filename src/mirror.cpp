#include <opticslab/core/mirror.hpp>
#include <opticslab/log/logger.hpp>
#include <cmath>
#include <stdexcept>

namespace opticslab::core {

FlatMirror::FlatMirror(std::string name, const Frame &frame, double width, double height)
    : OpticalElement(std::move(name), frame), width_(width), height_(height) {
  require_positive(width_, "width", name_);
  require_positive(height_, "height", name_);
}

PlaneHit FlatMirror::hit_face(const Ray &ray) const {
  PlaneHit hit = intersect_plane(frame_, ray.origin(), ray.direction());
  if (hit.hit && !inside_rect(hit.local, width_, height_))
    hit.hit = false;
  return hit;
}

Outcome FlatMirror::interact(const Ray &ray, const Ray &, const InteractionContext &) const {
  const PlaneHit hit = hit_face(ray);
  if (!hit.hit)
    return Miss{};
  return Redirect{ray.redirected(hit.point, reflect(ray.direction(), frame_.n))};
}

SphericalMirror::SphericalMirror(std::string name, const Frame &frame, double radius, double width, double height)
    : FlatMirror(std::move(name), frame, width, height), radius_(radius) {
  set_radius(radius);
}

void SphericalMirror::set_radius(double radius) {
  if (radius == 0.0 || !std::isfinite(radius)) {
    OLOG_ERROR("SphericalMirror '{}': radius must be non-zero and finite, got {}", name_, radius);
    throw std::invalid_argument(name_ + ": radius of curvature must be non-zero");
  }
  radius_ = radius;
}

Outcome SphericalMirror::interact(const Ray &ray, const Ray &, const InteractionContext &) const {
  const PlaneHit hit = hit_face(ray);
  if (!hit.hit)
    return Miss{};

  const Vec3 reflected = reflect(ray.direction(), frame_.n);
  const Vec3 displacement = hit.point - frame_.origin;
  const Vec3 corrected = reflected + displacement * (-1.0 / focal_length());
  if (norm2(corrected) == 0.0)
    return Redirect{ray.redirected(hit.point, reflected)};
  return Redirect{ray.redirected(hit.point, corrected)};
}

} // namespace opticslab::core
