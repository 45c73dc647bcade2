#include <gtest/gtest.h>

#include <opticslab/core/color.hpp>
#include <cmath>

using namespace opticslab::core;

TEST(WavelengthToRgb, OutsideVisibleBandIsBlack) {
  EXPECT_EQ(wavelength_to_rgb(LAMBDA_MIN - 0.1), RGB(0, 0, 0));
  EXPECT_EQ(wavelength_to_rgb(LAMBDA_MAX + 0.1), RGB(0, 0, 0));
  EXPECT_EQ(wavelength_to_rgb(1064.0), RGB(0, 0, 0));
}

TEST(WavelengthToRgb, VioletEdgeIsDimmed) {
  const RGB c = wavelength_to_rgb(LAMBDA_MIN);
  EXPECT_DOUBLE_EQ(c.r, 0.3);
  EXPECT_DOUBLE_EQ(c.g, 0.0);
  EXPECT_DOUBLE_EQ(c.b, 0.3);
}

TEST(WavelengthToRgb, PlateauHasFullIntensity) {
  const RGB green = wavelength_to_rgb(532.0);
  EXPECT_NEAR(green.r, 22.0 / 70.0, 1e-12);
  EXPECT_DOUBLE_EQ(green.g, 1.0);
  EXPECT_DOUBLE_EQ(green.b, 0.0);

  EXPECT_EQ(wavelength_to_rgb(650.0), RGB(1, 0, 0));
  EXPECT_EQ(wavelength_to_rgb(450.0), RGB(0, 0.2, 1));
}

TEST(WavelengthToRgb, RedEdgeTapers) {
  const RGB c = wavelength_to_rgb(LAMBDA_MAX);
  EXPECT_DOUBLE_EQ(c.r, 0.3);
  EXPECT_LT(wavelength_to_rgb(750.0).r, wavelength_to_rgb(700.0).r);
}

TEST(FilterResponse, PeaksAtChannelCentre) {
  EXPECT_DOUBLE_EQ(filter_response(600.0, Channel::R), 1.0);
  EXPECT_DOUBLE_EQ(filter_response(540.0, Channel::G), 1.0);
  EXPECT_DOUBLE_EQ(filter_response(450.0, Channel::B), 1.0);
}

TEST(FilterResponse, GaussianWidth) {
  // One standard deviation away from the peak
  EXPECT_NEAR(filter_response(650.0, Channel::R), std::exp(-0.5), 1e-12);
  EXPECT_NEAR(filter_response(400.0, Channel::B), std::exp(-0.5), 1e-12);

  const RGB rgb = filter_response_rgb(540.0);
  EXPECT_DOUBLE_EQ(rgb.g, 1.0);
  EXPECT_GT(rgb.r, rgb.b);
}
