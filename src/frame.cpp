#include <opticslab/log/logger.hpp>
#include <opticslab/math/frame.hpp>
#include <cmath>
#include <stdexcept>

namespace opticslab::math {

Frame Frame::facing(const Vec3 &origin, const Vec3 &normal, const Vec3 &up) {
  if (norm2(normal) == 0.0) {
    OLOG_ERROR("Frame::facing: normal has zero length");
    throw std::invalid_argument("Frame normal must be non-zero");
  }

  Frame f;
  f.origin = origin;
  f.n = normalize(normal);

  Vec3 u = cross(up, f.n);
  if (norm2(u) < 1e-20) {
    // up parallel to the normal, pick any other hint
    const Vec3 alt = std::abs(f.n.y) < 0.9 ? Y_UNIT_VEC3 : X_UNIT_VEC3;
    u = cross(alt, f.n);
  }
  f.u = normalize(u);
  f.v = cross(f.n, f.u);
  return f;
}

Frame Frame::facing_xz(const Vec3 &origin, double angle) {
  return facing(origin, {std::cos(angle), 0.0, std::sin(angle)});
}

Vec3 Frame::to_local(const Vec3 &p) const {
  const Vec3 d = p - origin;
  return {dot(d, u), dot(d, v), dot(d, n)};
}

Vec3 Frame::to_world(const Vec3 &local) const {
  return origin + direction_to_world(local);
}

Vec3 Frame::direction_to_local(const Vec3 &d) const {
  return {dot(d, u), dot(d, v), dot(d, n)};
}

Vec3 Frame::direction_to_world(const Vec3 &local) const {
  return u * local.x + v * local.y + n * local.z;
}

PlaneHit intersect_plane(const Frame &frame, const Vec3 &origin, const Vec3 &direction, double min_t) {
  PlaneHit out;
  const double denom = dot(direction, frame.n);

  // Plane and ray are parallel
  if (std::abs(denom) < 1e-12)
    return out;

  const double t = dot(frame.origin - origin, frame.n) / denom;
  if (!(t > min_t))
    return out;

  out.hit = true;
  out.t = t;
  out.point = origin + direction * t;
  out.local = frame.to_local(out.point);
  return out;
}

} // namespace opticslab::math
