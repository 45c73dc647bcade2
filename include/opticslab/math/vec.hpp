#pragma once
#include <cmath>

namespace opticslab::math {

struct Vec3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};

  Vec3() = default;
  Vec3(double x, double y, double z) : x(x), y(y), z(z) {}

  Vec3 operator+(const Vec3 &o) const { return {x + o.x, y + o.y, z + o.z}; }
  Vec3 operator-(const Vec3 &o) const { return {x - o.x, y - o.y, z - o.z}; }
  Vec3 operator-() const { return {-x, -y, -z}; }
  Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
  Vec3 operator/(double s) const { return {x / s, y / s, z / s}; }
  Vec3 &operator+=(const Vec3 &o) {
    x += o.x;
    y += o.y;
    z += o.z;
    return *this;
  }
};

inline Vec3 operator*(double s, const Vec3 &v) { return v * s; }

struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x, double y) : x(x), y(y) {}
};

inline const Vec3 X_UNIT_VEC3{1.0, 0.0, 0.0};
inline const Vec3 Y_UNIT_VEC3{0.0, 1.0, 0.0};

double dot(const Vec3 &a, const Vec3 &b);
Vec3 cross(const Vec3 &a, const Vec3 &b);
double norm(const Vec3 &v);
double norm2(const Vec3 &v);
double distance(const Vec3 &a, const Vec3 &b);

/// @brief Unit vector along v. A zero vector is returned unchanged.
Vec3 normalize(const Vec3 &v);

/// @brief Mirror reflection d - 2 (d.n) n for a unit normal n
Vec3 reflect(const Vec3 &d, const Vec3 &n);

/// @brief Rodrigues rotation of v about a unit axis by angle (rads)
Vec3 rotate_about_axis(const Vec3 &v, const Vec3 &axis, double angle);

} // namespace opticslab::math
