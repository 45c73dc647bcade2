#include <opticslab/core/element.hpp>
#include <opticslab/log/logger.hpp>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace opticslab::core {

std::string_view to_string(ElementKind kind) {
  switch (kind) {
  case ElementKind::ThinLens:
    return "thin-lens";
  case ElementKind::FlatMirror:
    return "flat-mirror";
  case ElementKind::SphericalMirror:
    return "spherical-mirror";
  case ElementKind::TransmissiveGrating:
    return "transmissive-grating";
  case ElementKind::ReflectiveGrating:
    return "reflective-grating";
  case ElementKind::Slit:
    return "slit";
  case ElementKind::Aperture:
    return "aperture";
  case ElementKind::Detector:
    return "detector";
  }
  return "unknown";
}

std::string_view to_string(LensMode mode) {
  return mode == LensMode::Imaging ? "imaging" : "paraxial";
}

OpticalElement::OpticalElement(std::string name, const Frame &frame)
    : name_(std::move(name)), frame_(frame) {}

bool inside_rect(const Vec3 &local, double width, double height) {
  return std::abs(local.x) <= width / 2.0 && std::abs(local.y) <= height / 2.0;
}

void require_positive(double value, std::string_view what, std::string_view element) {
  if (!(value > 0.0) || !std::isfinite(value)) {
    OLOG_ERROR("Invalid configuration for '{}': {} must be positive, got {}", element, what, value);
    throw std::invalid_argument(std::string(element) + ": " + std::string(what) + " must be positive");
  }
}

} // namespace opticslab::core
