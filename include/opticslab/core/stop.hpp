#pragma once
#include <opticslab/core/element.hpp>

namespace opticslab::core {

/// @brief Opaque square plate with an opening
///
/// Rays through the opening pass undeviated, rays on the plate are blocked,
/// rays outside the plate miss it. Opening boundaries are inclusive: a hit
/// exactly on the edge passes.
class Stop : public OpticalElement {
public:
  Outcome interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const override;

  double plate_size() const { return plate_size_; }

  /// @brief Whether a local (u, v) point lies in the opening
  virtual bool is_open(const Vec3 &local) const = 0;

protected:
  Stop(std::string name, const Frame &frame, double plate_size);

  double plate_size_;
};

class Slit : public Stop {
public:
  /// @param width opening along u
  /// @param height opening along v
  Slit(std::string name, const Frame &frame, double width, double height,
       double plate_size = DEFAULT_PLATE_SIZE);

  ElementKind kind() const override { return ElementKind::Slit; }
  bool is_open(const Vec3 &local) const override;

  double width() const { return width_; }
  double height() const { return height_; }
  void set_width(double width);
  void set_height(double height);

private:
  double width_;
  double height_;
};

class Aperture : public Stop {
public:
  Aperture(std::string name, const Frame &frame, double diameter, double plate_size = DEFAULT_PLATE_SIZE);

  ElementKind kind() const override { return ElementKind::Aperture; }
  bool is_open(const Vec3 &local) const override;

  double diameter() const { return diameter_; }
  void set_diameter(double diameter);

private:
  double diameter_;
};

} // namespace opticslab::core
