#pragma once
#include <opticslab/core/color.hpp>
#include <opticslab/math/vec.hpp>
#include <optional>

using namespace opticslab::math;

namespace opticslab::core {

inline constexpr double DEFAULT_WAVELENGTH_NM = 532.0;

/// @brief Immutable light ray
///
/// A ray carrying an explicit colour came from a resolved image-object point;
/// that colour overrides the wavelength-derived one everywhere downstream.
class Ray {
public:
  /// @brief Construct a ray, normalizing direction
  /// @throws std::invalid_argument if direction has zero length
  Ray(const Vec3 &origin, const Vec3 &direction, double wavelength_nm = DEFAULT_WAVELENGTH_NM,
      std::optional<RGB> color = std::nullopt, std::optional<int> diffraction_order = std::nullopt);

  const Vec3 &origin() const { return origin_; }
  const Vec3 &direction() const { return direction_; }
  double wavelength_nm() const { return wavelength_nm_; }
  const std::optional<RGB> &color() const { return color_; }
  const std::optional<int> &diffraction_order() const { return diffraction_order_; }

  Vec3 at(double t) const;

  /// @brief New ray starting at `origin` along `direction`, keeping wavelength and colour
  Ray redirected(const Vec3 &origin, const Vec3 &direction) const;

  /// @brief Same as redirected(), tagged with a diffraction order
  Ray diffracted(const Vec3 &origin, const Vec3 &direction, int order) const;

  /// @brief Colour used for display: the explicit colour if any, else the spectral one
  RGB display_color() const;

private:
  Vec3 origin_;
  Vec3 direction_;
  double wavelength_nm_{DEFAULT_WAVELENGTH_NM};
  std::optional<RGB> color_;
  std::optional<int> diffraction_order_;
};

} // namespace opticslab::core
