#pragma once
#include <opticslab/core/element.hpp>
#include <array>

namespace opticslab::core {

/// Direction of the grating grooves; dispersion happens across them
enum class LineOrientation { Horizontal, Vertical };

std::string_view to_string(LineOrientation o);

/// Diffraction orders considered by both grating variants
inline constexpr std::array<int, 3> GRATING_ORDERS{-1, 0, 1};

/// @brief Grating equation sin(theta_m) = m * lambda / d
/// @return nullopt for non-propagating (evanescent) orders, |sin| > 1
std::optional<double> diffraction_angle(int order, double wavelength_nm, double groove_spacing_nm);

class Grating : public OpticalElement {
public:
  double lines_per_mm() const { return lines_per_mm_; }
  LineOrientation line_orientation() const { return orientation_; }
  double width() const { return width_; }
  double height() const { return height_; }

  /// Groove spacing d in nm
  double groove_spacing_nm() const { return 1e6 / lines_per_mm_; }

  /// @throws std::invalid_argument if lines_per_mm <= 0
  void set_lines_per_mm(double lines_per_mm);
  void set_line_orientation(LineOrientation o) { orientation_ = o; }

protected:
  Grating(std::string name, const Frame &frame, double lines_per_mm, LineOrientation orientation,
          double width, double height);

  double lines_per_mm_;
  LineOrientation orientation_;
  double width_;
  double height_;
};

/// @brief Transmission grating: each order rotates the incident direction by theta_m
/// within the dispersion plane (n, v) for horizontal lines or (n, -u) for vertical ones.
/// Positive orders bend towards +v or -u; for a +x normal that is +y or +z.
class TransmissiveGrating : public Grating {
public:
  TransmissiveGrating(std::string name, const Frame &frame, double lines_per_mm,
                      LineOrientation orientation = LineOrientation::Horizontal,
                      double width = DEFAULT_PLATE_SIZE, double height = DEFAULT_PLATE_SIZE);

  ElementKind kind() const override { return ElementKind::TransmissiveGrating; }
  Outcome interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const override;
};

/// @brief Reflection grating: the mirror-reflected direction is rotated by theta_m
/// about reflected x dispersion_axis. Only rays arriving on the front face interact.
class ReflectiveGrating : public Grating {
public:
  ReflectiveGrating(std::string name, const Frame &frame, double lines_per_mm,
                    LineOrientation orientation = LineOrientation::Vertical,
                    double width = DEFAULT_PLATE_SIZE, double height = DEFAULT_PLATE_SIZE);

  ElementKind kind() const override { return ElementKind::ReflectiveGrating; }
  Outcome interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const override;

  /// u for vertical lines, v for horizontal ones
  Vec3 dispersion_axis() const;
};

} // namespace opticslab::core
