#pragma once
#include <opticslab/core/element.hpp>

namespace opticslab::core {

/// @brief Planar mirror with a rectangular face centred on frame.origin
class FlatMirror : public OpticalElement {
public:
  FlatMirror(std::string name, const Frame &frame, double width = DEFAULT_PLATE_SIZE,
             double height = DEFAULT_PLATE_SIZE);

  ElementKind kind() const override { return ElementKind::FlatMirror; }
  Outcome interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const override;

  double width() const { return width_; }
  double height() const { return height_; }

protected:
  double width_;
  double height_;

  /// Forward hit within the face, or a miss
  PlaneHit hit_face(const Ray &ray) const;
};

/// @brief Paraxial spherical mirror
///
/// The surface is modelled as the flat face; only the focusing effect of the
/// curvature is applied, as a correction of -displacement / f added to the
/// reflected direction, with f = -radius / 2.
class SphericalMirror : public FlatMirror {
public:
  /// @throws std::invalid_argument if radius is zero
  SphericalMirror(std::string name, const Frame &frame, double radius,
                  double width = DEFAULT_PLATE_SIZE, double height = DEFAULT_PLATE_SIZE);

  ElementKind kind() const override { return ElementKind::SphericalMirror; }
  Outcome interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const override;

  double radius() const { return radius_; }
  double focal_length() const { return -radius_ / 2.0; }

  void set_radius(double radius);

private:
  double radius_;
};

} // namespace opticslab::core
