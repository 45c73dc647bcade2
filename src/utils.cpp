#include <opticslab/math/utils.hpp>

namespace opticslab::math {

double deg_to_rad(double deg) {
  return deg * (PI / 180.0);
}

double rad_to_deg(double rad) {
  return rad * (180.0 / PI);
}

bool near_zero(double x, double eps) {
  return std::abs(x) < eps;
}

} // namespace opticslab::math
