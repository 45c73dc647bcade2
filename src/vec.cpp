#include <opticslab/math/vec.hpp>

namespace opticslab::math {

double dot(const Vec3 &a, const Vec3 &b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

Vec3 cross(const Vec3 &a, const Vec3 &b) {
  return {
    a.y * b.z - a.z * b.y,
    a.z * b.x - a.x * b.z,
    a.x * b.y - a.y * b.x
  };
}

double norm2(const Vec3 &v) {
  return dot(v, v);
}

double norm(const Vec3 &v) {
  return std::sqrt(dot(v, v));
}

double distance(const Vec3 &a, const Vec3 &b) {
  return norm(a - b);
}

Vec3 normalize(const Vec3 &v) {
  const double n = norm(v);
  if (n == 0.0)
    return v;
  return v * (1.0 / n);
}

Vec3 reflect(const Vec3 &d, const Vec3 &n) {
  return d - n * (2.0 * dot(d, n));
}

Vec3 rotate_about_axis(const Vec3 &v, const Vec3 &axis, double angle) {
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  return v * c + cross(axis, v) * s + axis * (dot(axis, v) * (1.0 - c));
}

} // namespace opticslab::math
