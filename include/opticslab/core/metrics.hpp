#pragma once
#include <opticslab/core/ray.hpp>
#include <opticslab/math/vec.hpp>
#include <optional>
#include <vector>

namespace opticslab::core {

/// @brief Beam collimation score in [0, 100]
///
/// sigma is the population standard deviation of the ray directions projected
/// on `axis`; the score is max(0, 100 (1 - 20 sigma)).
/// @return nullopt for fewer than two rays
std::optional<double> collimation_percent(const std::vector<Ray> &rays, const Vec3 &axis = Y_UNIT_VEC3);

/// @brief Thin-lens image distance si = 1 / (1/f - 1/so)
/// @return nullopt when so sits on the focal plane (or at the lens)
std::optional<double> image_distance(double focal_length, double object_distance);

/// @brief Blur-disc radius on a detector at detector_distance behind the lens
///
/// (D/2) |detector_distance - si| / |si|. Infinite for an object on the focal plane.
double circle_of_confusion(double focal_length, double object_distance, double detector_distance,
                           double aperture_diameter);

} // namespace opticslab::core
