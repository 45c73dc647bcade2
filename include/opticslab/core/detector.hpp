#pragma once
#include <opticslab/core/element.hpp>

namespace opticslab::core {

/// Pixel index of a hit that falls outside the grid along that axis
inline constexpr int OUT_OF_GRID = -1;

/// @brief Integer pixel indices on a sensor grid; OUT_OF_GRID off the grid
struct PixelCoord {
  int x{0};
  int y{0};
};

/// @brief Detector plane for recording arriving rays
///
/// The plane is unbounded for absorption; width and height only define the
/// area mapped onto the sensor grid.
class Detector : public OpticalElement {
public:
  /// @brief Construct detector
  /// @param frame Plane placement; (u, v) span the sensor
  /// @param width Sensor extent along u
  /// @param height Sensor extent along v
  Detector(std::string name, const Frame &frame, double width = DEFAULT_PLATE_SIZE,
           double height = DEFAULT_PLATE_SIZE);

  ElementKind kind() const override { return ElementKind::Detector; }

  /// @brief Forward-travelling hits on the plane are always absorbed and detected
  Outcome interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const override;

  double width() const { return width_; }
  double height() const { return height_; }

  /// @brief Local (u, v) coordinates of a point on the detector
  Vec2 local_coordinates(const Vec3 &world_point) const;

  /// @brief Project a point onto a grid_w x grid_h pixel grid
  ///
  /// Column grows with u, row grows with -v (row 0 is the top edge).
  /// @return Pixel indices, OUT_OF_GRID on an axis where the point is off the grid
  PixelCoord to_pixel(const Vec3 &world_point, int grid_w, int grid_h) const;

private:
  double width_;
  double height_;
};

} // namespace opticslab::core
