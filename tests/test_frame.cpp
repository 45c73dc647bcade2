#include <gtest/gtest.h>

#include <opticslab/core/ray.hpp>
#include <opticslab/math/frame.hpp>
#include <opticslab/math/utils.hpp>
#include <stdexcept>

using namespace opticslab::core;
using namespace opticslab::math;

namespace {

void expect_vec_near(const Vec3 &a, const Vec3 &b, double tol = 1e-12) {
  EXPECT_NEAR(a.x, b.x, tol);
  EXPECT_NEAR(a.y, b.y, tol);
  EXPECT_NEAR(a.z, b.z, tol);
}

} // namespace

TEST(Frame, FacingPlusXMatchesScenePlacement) {
  const Frame f = Frame::facing({0, 0, 0}, X_UNIT_VEC3);
  expect_vec_near(f.n, {1, 0, 0});
  expect_vec_near(f.u, {0, 0, -1});
  expect_vec_near(f.v, {0, 1, 0});
}

TEST(Frame, IsRightHandedOrthonormal) {
  const Frame f = Frame::facing({1, 2, 3}, {1, 1, 0.5});
  EXPECT_NEAR(norm(f.u), 1.0, 1e-12);
  EXPECT_NEAR(norm(f.v), 1.0, 1e-12);
  EXPECT_NEAR(dot(f.u, f.v), 0.0, 1e-12);
  EXPECT_NEAR(dot(f.u, f.n), 0.0, 1e-12);
  expect_vec_near(cross(f.u, f.v), f.n);
}

TEST(Frame, UpParallelToNormalStillBuildsFrame) {
  const Frame f = Frame::facing({0, 0, 0}, Y_UNIT_VEC3);
  EXPECT_NEAR(norm(f.u), 1.0, 1e-12);
  EXPECT_NEAR(dot(f.u, f.n), 0.0, 1e-12);
}

TEST(Frame, ZeroNormalThrows) {
  EXPECT_THROW(Frame::facing({0, 0, 0}, {0, 0, 0}), std::invalid_argument);
}

TEST(Frame, LocalWorldRoundTrip) {
  const Frame f = Frame::facing_xz({2, -1, 4}, deg_to_rad(30.0));
  const Vec3 p{0.3, 1.7, -2.2};
  expect_vec_near(f.to_world(f.to_local(p)), p);
}

TEST(IntersectPlane, ParallelRayMisses) {
  const Frame f = Frame::facing({0, 0, 0}, X_UNIT_VEC3);
  EXPECT_FALSE(intersect_plane(f, {-1, 0, 0}, {0, 1, 0}).hit);
}

TEST(IntersectPlane, PlaneBehindRayMisses) {
  const Frame f = Frame::facing({0, 0, 0}, X_UNIT_VEC3);
  EXPECT_FALSE(intersect_plane(f, {1, 0, 0}, {1, 0, 0}).hit);
}

TEST(IntersectPlane, RayStartingOnPlaneDoesNotHitItself) {
  const Frame f = Frame::facing({0, 0, 0}, X_UNIT_VEC3);
  EXPECT_FALSE(intersect_plane(f, {0, 0.5, 0}, {1, 0, 0}).hit);
}

TEST(IntersectPlane, ReportsLocalCoordinates) {
  const Frame f = Frame::facing({3, 0, 0}, X_UNIT_VEC3);
  const PlaneHit hit = intersect_plane(f, {-2, 0.5, 1.0}, {1, 0, 0});
  ASSERT_TRUE(hit.hit);
  EXPECT_DOUBLE_EQ(hit.t, 5.0);
  expect_vec_near(hit.local, {-1.0, 0.5, 0.0});
}

TEST(Ray, NormalizesDirection) {
  const Ray r({0, 0, 0}, {3, 4, 0});
  expect_vec_near(r.direction(), {0.6, 0.8, 0});
  EXPECT_DOUBLE_EQ(r.wavelength_nm(), DEFAULT_WAVELENGTH_NM);
  EXPECT_FALSE(r.color().has_value());
  EXPECT_FALSE(r.diffraction_order().has_value());
}

TEST(Ray, ZeroDirectionThrows) {
  EXPECT_THROW(Ray({0, 0, 0}, {0, 0, 0}), std::invalid_argument);
}

TEST(Ray, DerivedRaysKeepWavelengthAndColor) {
  const Ray r({0, 0, 0}, {1, 0, 0}, 650.0, RGB(0.1, 0.2, 0.3));
  const Ray moved = r.redirected({1, 0, 0}, {0, 1, 0});
  EXPECT_DOUBLE_EQ(moved.wavelength_nm(), 650.0);
  ASSERT_TRUE(moved.color().has_value());
  EXPECT_EQ(*moved.color(), RGB(0.1, 0.2, 0.3));
  EXPECT_EQ(moved.display_color(), RGB(0.1, 0.2, 0.3));

  const Ray diffracted = r.diffracted({1, 0, 0}, {1, 1, 0}, -1);
  ASSERT_TRUE(diffracted.diffraction_order().has_value());
  EXPECT_EQ(*diffracted.diffraction_order(), -1);
}
