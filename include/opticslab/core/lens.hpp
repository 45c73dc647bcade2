#pragma once
#include <opticslab/core/element.hpp>

namespace opticslab::core {

inline constexpr double DEFAULT_LENS_RADIUS = 3.5;

/// @brief Thin lens in the paraxial approximation
///
/// The lens plane passes through frame.origin with the optical axis along frame.n.
/// Rays are accepted within aperture_radius of the axis (inclusive, +1e-6).
class ThinLens : public OpticalElement {
public:
  /// @throws std::invalid_argument if focal_length is zero or aperture_radius <= 0
  ThinLens(std::string name, const Frame &frame, double focal_length,
           double aperture_radius = DEFAULT_LENS_RADIUS);

  ElementKind kind() const override { return ElementKind::ThinLens; }
  Outcome interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const override;

  double focal_length() const { return focal_length_; }
  double aperture_radius() const { return aperture_radius_; }

  void set_focal_length(double f);

  /// @brief Conjugate image distance for an object at distance so (1/f = 1/so + 1/si)
  /// @return nullopt when the object sits on the focal plane or at the lens
  std::optional<double> image_distance(double so) const;

private:
  double focal_length_;
  double aperture_radius_;

  Ray bend_paraxial(const Ray &ray, const PlaneHit &hit) const;
  Ray bend_imaging(const Ray &ray, const Ray &seed, const PlaneHit &hit) const;
};

} // namespace opticslab::core
