#include <opticslab/core/lens.hpp>
#include <opticslab/core/metrics.hpp>
#include <opticslab/log/logger.hpp>
#include <cmath>
#include <stdexcept>

namespace opticslab::core {

namespace {

void require_focal_length(double f, const std::string &name) {
  if (f == 0.0 || !std::isfinite(f)) {
    OLOG_ERROR("ThinLens '{}': focal length must be non-zero and finite, got {}", name, f);
    throw std::invalid_argument(name + ": focal length must be non-zero");
  }
}

} // namespace

ThinLens::ThinLens(std::string name, const Frame &frame, double focal_length, double aperture_radius)
    : OpticalElement(std::move(name), frame), focal_length_(focal_length), aperture_radius_(aperture_radius) {
  require_focal_length(focal_length_, name_);
  require_positive(aperture_radius_, "aperture radius", name_);
}

void ThinLens::set_focal_length(double f) {
  require_focal_length(f, name_);
  focal_length_ = f;
}

std::optional<double> ThinLens::image_distance(double so) const {
  return core::image_distance(focal_length_, so);
}

Outcome ThinLens::interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const {
  const PlaneHit hit = intersect_plane(frame_, ray.origin(), ray.direction());
  if (!hit.hit)
    return Miss{};

  const double dist_from_axis = std::hypot(hit.local.x, hit.local.y);
  if (dist_from_axis > aperture_radius_ + 1e-6)
    return Miss{};

  if (ctx.lens_mode == LensMode::Imaging)
    return Redirect{bend_imaging(ray, seed, hit)};
  return Redirect{bend_paraxial(ray, hit)};
}

Ray ThinLens::bend_paraxial(const Ray &ray, const PlaneHit &hit) const {
  // d' = d - h/f on each transverse axis, axial component kept
  const Vec3 d = frame_.direction_to_local(ray.direction());
  const Vec3 bent{
    d.x - hit.local.x / focal_length_,
    d.y - hit.local.y / focal_length_,
    d.z
  };
  return ray.redirected(hit.point, frame_.direction_to_world(bent));
}

Ray ThinLens::bend_imaging(const Ray &ray, const Ray &seed, const PlaneHit &hit) const {
  const Vec3 &object_point = seed.origin();
  const Vec3 object_local = frame_.to_local(object_point);
  const double so = std::abs(object_local.z);

  const std::optional<double> si = image_distance(so);
  if (!si) {
    // Object on the focal plane: image at infinity, pass through undeviated
    Vec3 undeviated = frame_.origin - object_point;
    if (norm2(undeviated) == 0.0)
      undeviated = ray.direction();
    return ray.redirected(hit.point, undeviated);
  }

  const double magnification = -(*si) / so;
  const double side = dot(ray.direction(), frame_.n) >= 0.0 ? 1.0 : -1.0;
  const Vec3 image_point = frame_.to_world({
    object_local.x * magnification,
    object_local.y * magnification,
    side * (*si)
  });

  // Real images are converged upon, virtual ones are diverged from
  Vec3 dir = (*si > 0.0) ? image_point - hit.point : hit.point - image_point;
  if (norm2(dir) == 0.0)
    dir = ray.direction();
  return ray.redirected(hit.point, dir);
}

} // namespace opticslab::core
