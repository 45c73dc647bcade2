#pragma once
#include <opticslab/math/vec.hpp>

namespace opticslab::math {

/// @brief Right-handed orthonormal placement frame (u, v, n) anchored at origin
///
/// n is the element normal / optical axis. Local coordinates of a point are its
/// projections on (u, v, n) relative to the origin.
struct Frame {
  Vec3 origin{0.0, 0.0, 0.0};
  Vec3 u{0.0, 0.0, -1.0};
  Vec3 v{Y_UNIT_VEC3};
  Vec3 n{X_UNIT_VEC3};

  Frame() = default;

  /// @brief Build a frame whose normal is `normal`, with v as close to `up` as possible
  /// @throws std::invalid_argument if normal has zero length
  static Frame facing(const Vec3 &origin, const Vec3 &normal, const Vec3 &up = Y_UNIT_VEC3);

  /// @brief Frame with normal (cos a, 0, sin a), i.e. rotated by `angle` in the x-z plane
  static Frame facing_xz(const Vec3 &origin, double angle);

  Vec3 to_local(const Vec3 &p) const;
  Vec3 to_world(const Vec3 &local) const;
  Vec3 direction_to_local(const Vec3 &d) const;
  Vec3 direction_to_world(const Vec3 &local) const;
};

/// @brief Intersection of a ray with the plane through frame.origin with normal frame.n
struct PlaneHit {
  bool hit{false};
  double t{0.0};
  Vec3 point;
  Vec3 local;
};

/// Accepts only t > min_t. Rays parallel to the plane never hit.
PlaneHit intersect_plane(const Frame &frame, const Vec3 &origin, const Vec3 &direction, double min_t = 1e-6);

} // namespace opticslab::math
