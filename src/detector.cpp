#include <opticslab/core/detector.hpp>

namespace opticslab::core {

Detector::Detector(std::string name, const Frame &frame, double width, double height)
    : OpticalElement(std::move(name), frame), width_(width), height_(height) {
  require_positive(width_, "width", name_);
  require_positive(height_, "height", name_);
}

Outcome Detector::interact(const Ray &ray, const Ray &, const InteractionContext &) const {
  const PlaneHit hit = intersect_plane(frame_, ray.origin(), ray.direction());

  // Plane is parallel or behind the ray
  if (!hit.hit)
    return Miss{};

  return Absorb{hit.point, ray.wavelength_nm(), ray.color(), true};
}

Vec2 Detector::local_coordinates(const Vec3 &world_point) const {
  const Vec3 local = frame_.to_local(world_point);
  return {local.x, local.y};
}

namespace {

// Range-checked before the cast; grazing hits can land arbitrarily far away
int pixel_index(double f, int n) {
  if (!(f >= 0.0 && f < n))
    return OUT_OF_GRID;
  return static_cast<int>(f);
}

} // namespace

PixelCoord Detector::to_pixel(const Vec3 &world_point, int grid_w, int grid_h) const {
  const Vec2 uv = local_coordinates(world_point);
  return {
    pixel_index((uv.x / width_ + 0.5) * grid_w, grid_w),
    pixel_index((-uv.y / height_ + 0.5) * grid_h, grid_h)
  };
}

} // namespace opticslab::core
