#pragma once
#include <cmath>
#include <numbers>

namespace opticslab::math {

inline constexpr double PI = std::numbers::pi;

double deg_to_rad(double deg);

double rad_to_deg(double rad);

bool near_zero(double x, double eps = 1e-12);

} // namespace opticslab::math
