#pragma once
#include <opticslab/core/color.hpp>
#include <opticslab/core/ray.hpp>
#include <opticslab/math/frame.hpp>
#include <opticslab/math/vec.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace opticslab::math;

namespace opticslab::core {

enum class ElementKind {
  ThinLens,
  FlatMirror,
  SphericalMirror,
  TransmissiveGrating,
  ReflectiveGrating,
  Slit,
  Aperture,
  Detector
};

std::string_view to_string(ElementKind kind);

/// How a thin lens bends rays during one trace
enum class LensMode {
  Paraxial, ///< collimated / diverging spectral beams
  Imaging   ///< rays leave resolved object points (camera-on-object setups)
};

std::string_view to_string(LensMode mode);

/// Per-trace settings an element may consult
struct InteractionContext {
  LensMode lens_mode{LensMode::Paraxial};
};

/// Ray unaffected, path continues to the next element
struct Miss {};

/// Ray continues from the intersection point in a new direction
struct Redirect {
  Ray ray;
};

/// Path forks into one child per ray
struct Split {
  std::vector<Ray> rays;
};

/// Path terminates at point; `detected` is set only by detectors
struct Absorb {
  Vec3 point;
  double wavelength_nm{DEFAULT_WAVELENGTH_NM};
  std::optional<RGB> color;
  bool detected{false};
};

using Outcome = std::variant<Miss, Redirect, Split, Absorb>;

/// Size of the rectangular plate / face most elements use
inline constexpr double DEFAULT_PLATE_SIZE = 5.0;

class OpticalElement {
public:
  virtual ~OpticalElement() = default;

  virtual ElementKind kind() const = 0;

  /// @brief Interact a ray with this element
  /// @param ray Current ray of the path
  /// @param seed Seed ray the path started from
  /// @param ctx Per-trace settings
  virtual Outcome interact(const Ray &ray, const Ray &seed, const InteractionContext &ctx) const = 0;

  const std::string &name() const { return name_; }
  const Frame &frame() const { return frame_; }
  const Vec3 &position() const { return frame_.origin; }

  void set_frame(const Frame &frame) { frame_ = frame; }
  void set_position(const Vec3 &p) { frame_.origin = p; }

protected:
  OpticalElement(std::string name, const Frame &frame);

  std::string name_;
  Frame frame_;
};

using ElementPtr = std::shared_ptr<OpticalElement>;

/// @brief Rectangular bound test |u| <= width/2 && |v| <= height/2 (inclusive)
bool inside_rect(const Vec3 &local, double width, double height);

/// @throws std::invalid_argument unless value > 0 (and finite)
void require_positive(double value, std::string_view what, std::string_view element);

} // namespace opticslab::core
