#include <gtest/gtest.h>

#include <opticslab/core/source.hpp>
#include <opticslab/math/utils.hpp>
#include <cmath>
#include <set>
#include <stdexcept>

using namespace opticslab::core;
using namespace opticslab::math;

TEST(GenerateRays, LineSpansBeamEvenly) {
  Rng rng(1);
  SourceConfig cfg;
  cfg.ray_count = 5;
  const auto rays = generate_rays(cfg, rng);

  ASSERT_EQ(rays.size(), 5u);
  for (std::size_t i = 0; i < rays.size(); ++i) {
    EXPECT_DOUBLE_EQ(rays[i].origin().x, DEFAULT_SOURCE_X);
    EXPECT_NEAR(rays[i].origin().y, -0.5 + 0.25 * i, 1e-12);
    EXPECT_NEAR(rays[i].origin().z, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(rays[i].direction().x, 1.0);
    EXPECT_DOUBLE_EQ(rays[i].wavelength_nm(), DEFAULT_WAVELENGTH_NM);
  }
}

TEST(GenerateRays, SingleLineRaySitsOnAxis) {
  Rng rng(1);
  SourceConfig cfg;
  cfg.ray_count = 1;
  const auto rays = generate_rays(cfg, rng);
  ASSERT_EQ(rays.size(), 1u);
  EXPECT_DOUBLE_EQ(rays[0].origin().y, 0.0);
}

TEST(GenerateRays, RadialRingHasBeamRadius) {
  Rng rng(1);
  SourceConfig cfg;
  cfg.pattern = PatternKind::Radial;
  cfg.ray_count = 12;
  const auto rays = generate_rays(cfg, rng);
  ASSERT_EQ(rays.size(), 12u);
  for (const Ray &r : rays)
    EXPECT_NEAR(std::hypot(r.origin().y, r.origin().z), 0.5, 1e-12);
  // First ray at angle 0: y = sin 0, z = cos 0
  EXPECT_NEAR(rays[0].origin().z, 0.5, 1e-12);
}

TEST(GenerateRays, CrossUsesHalfCountPerArm) {
  Rng rng(1);
  SourceConfig cfg;
  cfg.pattern = PatternKind::Cross;
  cfg.ray_count = 11;
  const auto rays = generate_rays(cfg, rng);
  ASSERT_EQ(rays.size(), 10u);
  for (std::size_t i = 0; i < 5; ++i)
    EXPECT_NEAR(rays[i].origin().z, 0.0, 1e-12);
  for (std::size_t i = 5; i < 10; ++i)
    EXPECT_NEAR(rays[i].origin().y, 0.0, 1e-12);
}

TEST(GenerateRays, DiscStaysInsideBeamAndIsSeeded) {
  SourceConfig cfg;
  cfg.pattern = PatternKind::Disc;
  cfg.ray_count = 500;

  Rng a(42), b(42);
  const auto first = generate_rays(cfg, a);
  const auto second = generate_rays(cfg, b);
  ASSERT_EQ(first.size(), 500u);
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_LE(std::hypot(first[i].origin().y, first[i].origin().z), 0.5 + 1e-12);
    EXPECT_DOUBLE_EQ(first[i].origin().y, second[i].origin().y);
  }
}

TEST(GenerateRays, WhiteLightRepeatsPatternPerWavelength) {
  Rng rng(1);
  SourceConfig cfg;
  cfg.ray_count = 4;
  cfg.white_light = true;
  const auto rays = generate_rays(cfg, rng);
  ASSERT_EQ(rays.size(), 12u);

  std::multiset<double> wavelengths;
  for (const Ray &r : rays)
    wavelengths.insert(r.wavelength_nm());
  for (double wl : WHITE_LIGHT_WAVELENGTHS)
    EXPECT_EQ(wavelengths.count(wl), 4u);
}

TEST(GenerateRays, RayCountIsCapped) {
  Rng rng(1);
  SourceConfig cfg;
  cfg.ray_count = MAX_RAY_COUNT + 100;
  EXPECT_EQ(generate_rays(cfg, rng).size(), static_cast<std::size_t>(MAX_RAY_COUNT));

  cfg.ray_count = -3;
  EXPECT_TRUE(generate_rays(cfg, rng).empty());
}

TEST(GenerateRays, SilhouettesProduceRequestedCountWithinBeam) {
  Rng rng(1);
  for (PatternKind kind : {PatternKind::Heart, PatternKind::Star, PatternKind::Smile}) {
    SourceConfig cfg;
    cfg.pattern = kind;
    cfg.ray_count = 60;
    const auto rays = generate_rays(cfg, rng);
    EXPECT_EQ(rays.size(), 60u) << to_string(kind);
    for (const Ray &r : rays)
      EXPECT_LE(std::hypot(r.origin().y, r.origin().z), 0.5 + 1e-9) << to_string(kind);
  }
}

TEST(GenerateRays, FollowsSourceOrientation) {
  Rng rng(1);
  SourceConfig cfg;
  cfg.position = {0, 0, -5};
  cfg.direction = {0, 0, 1};
  cfg.ray_count = 3;
  for (const Ray &r : generate_rays(cfg, rng)) {
    EXPECT_NEAR(r.direction().z, 1.0, 1e-12);
    EXPECT_NEAR(r.origin().z, -5.0, 1e-12);
  }
}

TEST(PatternKind, ParseRoundTrip) {
  for (PatternKind k : {PatternKind::Line, PatternKind::Radial, PatternKind::Cross, PatternKind::Disc,
                        PatternKind::Heart, PatternKind::Star, PatternKind::Smile})
    EXPECT_EQ(parse_pattern(to_string(k)), k);
  EXPECT_FALSE(parse_pattern("spiral").has_value());
}

namespace {

ImagePlane checker_plane() {
  ImagePlane plane;
  plane.frame = Frame::facing({-10, 0, 0}, X_UNIT_VEC3);
  plane.width = 4.0;
  plane.height = 2.0;
  plane.image_width = 100;
  plane.image_height = 50;
  plane.rgba.assign(100 * 50 * 4, 255);
  return plane;
}

} // namespace

TEST(SampleObjectPlane, StrideGridAndMapping) {
  const ImagePlane plane = checker_plane();
  const auto samples = sample_object_plane(plane, 25);
  // x in {0, 25, 50, 75}, y in {0, 25}
  ASSERT_EQ(samples.size(), 8u);

  // Pixel (0, 0) is the top-left corner: u = -width/2, v = +height/2
  const Vec3 corner = plane.frame.to_local(samples[0].position);
  EXPECT_NEAR(corner.x, -2.0, 1e-12);
  EXPECT_NEAR(corner.y, 1.0, 1e-12);
  EXPECT_EQ(samples[0].color, RGB(1, 1, 1));
}

TEST(SampleObjectPlane, TransparentPixelsAreSkipped) {
  ImagePlane plane = checker_plane();
  plane.rgba[3] = 0; // alpha of pixel (0, 0)
  EXPECT_EQ(sample_object_plane(plane, 25).size(), 7u);
}

TEST(SampleObjectPlane, RejectsBadInput) {
  ImagePlane plane = checker_plane();
  EXPECT_THROW(sample_object_plane(plane, 0), std::invalid_argument);
  plane.rgba.resize(10);
  EXPECT_THROW(sample_object_plane(plane, 25), std::invalid_argument);
}

TEST(GenerateObjectCones, FiveRaysAimedAtLens) {
  const Frame lens = Frame::facing({0, 0, 0}, X_UNIT_VEC3);
  const std::vector<ObjectSample> samples{{{-10, 1, 0}, RGB(0.5, 0.25, 1.0)}};
  const auto rays = generate_object_cones(samples, lens, 3.5);
  ASSERT_EQ(rays.size(), 5u);

  for (const Ray &r : rays) {
    EXPECT_DOUBLE_EQ(r.wavelength_nm(), OBJECT_RAY_WAVELENGTH_NM);
    ASSERT_TRUE(r.color().has_value());
    EXPECT_EQ(*r.color(), RGB(0.5, 0.25, 1.0));
  }

  // Chief ray through the lens centre
  const Vec3 chief = normalize(Vec3{10, -1, 0});
  EXPECT_NEAR(rays[0].direction().x, chief.x, 1e-12);
  EXPECT_NEAR(rays[0].direction().y, chief.y, 1e-12);

  // Marginal rays reach the rim
  for (std::size_t i = 1; i < rays.size(); ++i) {
    const PlaneHit hit = intersect_plane(lens, rays[i].origin(), rays[i].direction());
    ASSERT_TRUE(hit.hit);
    EXPECT_NEAR(std::hypot(hit.local.x, hit.local.y), 3.5, 1e-9);
  }
}

TEST(Rng, RangedUniformIsBoundedAndSeeded) {
  Rng a(42);
  Rng b(42);
  for (int i = 0; i < 1000; ++i) {
    const double x = a.uniform(-2.0, 3.0);
    EXPECT_GE(x, -2.0);
    EXPECT_LE(x, 3.0);
    EXPECT_DOUBLE_EQ(x, b.uniform(-2.0, 3.0));
  }
}
