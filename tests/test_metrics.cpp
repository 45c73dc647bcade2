#include <gtest/gtest.h>

#include <opticslab/core/metrics.hpp>
#include <cmath>

using namespace opticslab::core;

TEST(CollimationPercent, ParallelBeamIsFullyCollimated) {
  const std::vector<Ray> rays{Ray({0, 0, 0}, {1, 0, 0}), Ray({0, 1, 0}, {1, 0, 0}), Ray({0, -1, 0}, {1, 0, 0})};
  ASSERT_TRUE(collimation_percent(rays).has_value());
  EXPECT_DOUBLE_EQ(*collimation_percent(rays), 100.0);
}

TEST(CollimationPercent, SpreadLowersScore) {
  // Direction y components +-0.02 -> sigma 0.02 -> 60 %
  const double dy = 0.02;
  const double dx = std::sqrt(1.0 - dy * dy);
  const std::vector<Ray> rays{Ray({0, 0, 0}, {dx, dy, 0}), Ray({0, 0, 0}, {dx, -dy, 0})};
  EXPECT_NEAR(*collimation_percent(rays), 60.0, 1e-9);
}

TEST(CollimationPercent, ClampsAtZero) {
  const std::vector<Ray> rays{Ray({0, 0, 0}, {1, 1, 0}), Ray({0, 0, 0}, {1, -1, 0})};
  EXPECT_DOUBLE_EQ(*collimation_percent(rays), 0.0);
}

TEST(CollimationPercent, NeedsTwoRays) {
  EXPECT_FALSE(collimation_percent({}).has_value());
  EXPECT_FALSE(collimation_percent({Ray({0, 0, 0}, {1, 0, 0})}).has_value());
}

TEST(ImageDistance, ThinLensEquation) {
  EXPECT_NEAR(*image_distance(5.0, 10.0), 10.0, 1e-12);
  EXPECT_NEAR(*image_distance(4.0, 12.0), 6.0, 1e-12);
  EXPECT_FALSE(image_distance(5.0, 5.0).has_value());
}

TEST(CircleOfConfusion, ZeroAtFocusGrowsAway) {
  EXPECT_NEAR(circle_of_confusion(5.0, 10.0, 10.0, 2.0), 0.0, 1e-12);
  // si = 10, detector at 8: (D/2) * 2 / 10
  EXPECT_NEAR(circle_of_confusion(5.0, 10.0, 8.0, 2.0), 0.2, 1e-12);
  EXPECT_TRUE(std::isinf(circle_of_confusion(5.0, 5.0, 8.0, 2.0)));
}
