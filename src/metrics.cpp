#include <opticslab/core/metrics.hpp>
#include <opticslab/math/utils.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace opticslab::core {

std::optional<double> collimation_percent(const std::vector<Ray> &rays, const Vec3 &axis) {
  if (rays.size() < 2)
    return std::nullopt;

  const Vec3 a = normalize(axis);
  const double n = static_cast<double>(rays.size());

  double mean = 0.0;
  for (const Ray &r : rays)
    mean += dot(r.direction(), a);
  mean /= n;

  double variance = 0.0;
  for (const Ray &r : rays) {
    const double dev = dot(r.direction(), a) - mean;
    variance += dev * dev;
  }
  variance /= n;

  return std::max(0.0, 100.0 * (1.0 - 20.0 * std::sqrt(variance)));
}

std::optional<double> image_distance(double focal_length, double object_distance) {
  if (near_zero(object_distance, 1e-9) || near_zero(object_distance - focal_length, 1e-6))
    return std::nullopt;
  return 1.0 / (1.0 / focal_length - 1.0 / object_distance);
}

double circle_of_confusion(double focal_length, double object_distance, double detector_distance,
                           double aperture_diameter) {
  const auto si = image_distance(focal_length, object_distance);
  if (!si)
    return std::numeric_limits<double>::infinity();
  return (aperture_diameter / 2.0) * std::abs(detector_distance - *si) / std::abs(*si);
}

} // namespace opticslab::core
