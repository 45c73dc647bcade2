#include <opticslab/core/color.hpp>
#include <opticslab/core/detector.hpp>
#include <opticslab/core/element.hpp>
#include <opticslab/core/grating.hpp>
#include <opticslab/core/lens.hpp>
#include <opticslab/core/metrics.hpp>
#include <opticslab/core/mirror.hpp>
#include <opticslab/core/ray.hpp>
#include <opticslab/core/sensor.hpp>
#include <opticslab/core/setups.hpp>
#include <opticslab/core/source.hpp>
#include <opticslab/core/stop.hpp>
#include <opticslab/core/tracer.hpp>
#include <opticslab/log/logger.hpp>
#include <opticslab/math/frame.hpp>
#include <opticslab/math/rng.hpp>
#include <opticslab/math/vec.hpp>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstring>

namespace py = pybind11;
using namespace opticslab::core;
using namespace opticslab::math;
using namespace opticslab::log;

PYBIND11_MODULE(opticslab_py, m) {
  m.doc() = "Python bindings for the opticslab ray-tracing core";

  // Math bindings
  py::class_<Vec3>(m, "Vec3")
      .def(py::init<>())
      .def(py::init<double, double, double>(), py::arg("x"), py::arg("y"), py::arg("z"))
      .def_readwrite("x", &Vec3::x)
      .def_readwrite("y", &Vec3::y)
      .def_readwrite("z", &Vec3::z)
      .def("__repr__", [](const Vec3 &v) { return fmt::format("Vec3({}, {}, {})", v.x, v.y, v.z); });

  py::class_<Vec2>(m, "Vec2")
      .def(py::init<double, double>(), py::arg("x"), py::arg("y"))
      .def_readwrite("x", &Vec2::x)
      .def_readwrite("y", &Vec2::y);

  py::class_<Rng>(m, "Rng")
      .def(py::init<std::uint64_t>(), py::arg("seed") = std::random_device{}(),
           "Initialize the RNG with an optional seed")
      .def("uniform", py::overload_cast<>(&Rng::uniform), "Generate a uniform random number in [0, 1)");

  py::class_<Frame>(m, "Frame")
      .def(py::init<>())
      .def_static("facing", &Frame::facing, py::arg("origin"), py::arg("normal"), py::arg("up") = Y_UNIT_VEC3,
                  "Build a frame with the given normal, v as close to `up` as possible")
      .def_readwrite("origin", &Frame::origin)
      .def_readonly("u", &Frame::u)
      .def_readonly("v", &Frame::v)
      .def_readonly("n", &Frame::n)
      .def("to_local", &Frame::to_local, py::arg("point"))
      .def("to_world", &Frame::to_world, py::arg("local"));

  // Color bindings
  py::class_<RGB>(m, "RGB")
      .def(py::init<>())
      .def(py::init<double, double, double>(), py::arg("r"), py::arg("g"), py::arg("b"))
      .def_readwrite("r", &RGB::r)
      .def_readwrite("g", &RGB::g)
      .def_readwrite("b", &RGB::b);

  m.def("wavelength_to_rgb", &wavelength_to_rgb, py::arg("nm"), "Display colour of a wavelength (nm)");
  m.def("filter_response_rgb", &filter_response_rgb, py::arg("nm"),
        "Bayer colour-filter response of a wavelength (nm)");

  // Ray bindings
  py::class_<Ray>(m, "Ray")
      .def(py::init<Vec3, Vec3, double, std::optional<RGB>, std::optional<int>>(), py::arg("origin"),
           py::arg("direction"), py::arg("wavelength_nm") = DEFAULT_WAVELENGTH_NM, py::arg("color") = py::none(),
           py::arg("diffraction_order") = py::none())
      .def_property_readonly("origin", &Ray::origin)
      .def_property_readonly("direction", &Ray::direction)
      .def_property_readonly("wavelength_nm", &Ray::wavelength_nm)
      .def_property_readonly("color", &Ray::color)
      .def_property_readonly("diffraction_order", &Ray::diffraction_order)
      .def("at", &Ray::at, py::arg("t"));

  // Element bindings
  py::enum_<LensMode>(m, "LensMode")
      .value("Paraxial", LensMode::Paraxial)
      .value("Imaging", LensMode::Imaging)
      .export_values();

  py::class_<InteractionContext>(m, "InteractionContext")
      .def(py::init<>())
      .def_readwrite("lens_mode", &InteractionContext::lens_mode);

  py::class_<Miss>(m, "Miss");
  py::class_<Redirect>(m, "Redirect").def_readonly("ray", &Redirect::ray);
  py::class_<Split>(m, "Split").def_readonly("rays", &Split::rays);
  py::class_<Absorb>(m, "Absorb")
      .def_readonly("point", &Absorb::point)
      .def_readonly("wavelength_nm", &Absorb::wavelength_nm)
      .def_readonly("color", &Absorb::color)
      .def_readonly("detected", &Absorb::detected);

  py::class_<OpticalElement, ElementPtr>(m, "OpticalElement")
      .def_property_readonly("name", &OpticalElement::name)
      .def_property_readonly("kind", [](const OpticalElement &e) { return std::string(to_string(e.kind())); })
      .def_property("frame", &OpticalElement::frame, &OpticalElement::set_frame)
      .def_property("position", &OpticalElement::position, &OpticalElement::set_position)
      .def("interact", &OpticalElement::interact, py::arg("ray"), py::arg("seed"),
           py::arg("ctx") = InteractionContext{}, "Interact one ray with the element");

  py::class_<ThinLens, OpticalElement, std::shared_ptr<ThinLens>>(m, "ThinLens")
      .def(py::init<std::string, Frame, double, double>(), py::arg("name"), py::arg("frame"),
           py::arg("focal_length"), py::arg("aperture_radius") = DEFAULT_LENS_RADIUS)
      .def_property("focal_length", &ThinLens::focal_length, &ThinLens::set_focal_length)
      .def_property_readonly("aperture_radius", &ThinLens::aperture_radius)
      .def("image_distance", &ThinLens::image_distance, py::arg("so"));

  py::class_<FlatMirror, OpticalElement, std::shared_ptr<FlatMirror>>(m, "FlatMirror")
      .def(py::init<std::string, Frame, double, double>(), py::arg("name"), py::arg("frame"),
           py::arg("width") = DEFAULT_PLATE_SIZE, py::arg("height") = DEFAULT_PLATE_SIZE);

  py::class_<SphericalMirror, FlatMirror, std::shared_ptr<SphericalMirror>>(m, "SphericalMirror")
      .def(py::init<std::string, Frame, double, double, double>(), py::arg("name"), py::arg("frame"),
           py::arg("radius"), py::arg("width") = DEFAULT_PLATE_SIZE, py::arg("height") = DEFAULT_PLATE_SIZE)
      .def_property("radius", &SphericalMirror::radius, &SphericalMirror::set_radius)
      .def_property_readonly("focal_length", &SphericalMirror::focal_length);

  py::enum_<LineOrientation>(m, "LineOrientation")
      .value("Horizontal", LineOrientation::Horizontal)
      .value("Vertical", LineOrientation::Vertical)
      .export_values();

  py::class_<Grating, OpticalElement, std::shared_ptr<Grating>>(m, "Grating")
      .def_property("lines_per_mm", &Grating::lines_per_mm, &Grating::set_lines_per_mm)
      .def_property("line_orientation", &Grating::line_orientation, &Grating::set_line_orientation)
      .def_property_readonly("groove_spacing_nm", &Grating::groove_spacing_nm);

  py::class_<TransmissiveGrating, Grating, std::shared_ptr<TransmissiveGrating>>(m, "TransmissiveGrating")
      .def(py::init<std::string, Frame, double, LineOrientation, double, double>(), py::arg("name"),
           py::arg("frame"), py::arg("lines_per_mm"), py::arg("orientation") = LineOrientation::Horizontal,
           py::arg("width") = DEFAULT_PLATE_SIZE, py::arg("height") = DEFAULT_PLATE_SIZE);

  py::class_<ReflectiveGrating, Grating, std::shared_ptr<ReflectiveGrating>>(m, "ReflectiveGrating")
      .def(py::init<std::string, Frame, double, LineOrientation, double, double>(), py::arg("name"),
           py::arg("frame"), py::arg("lines_per_mm"), py::arg("orientation") = LineOrientation::Vertical,
           py::arg("width") = DEFAULT_PLATE_SIZE, py::arg("height") = DEFAULT_PLATE_SIZE);

  py::class_<Stop, OpticalElement, std::shared_ptr<Stop>>(m, "Stop")
      .def_property_readonly("plate_size", &Stop::plate_size);

  py::class_<Slit, Stop, std::shared_ptr<Slit>>(m, "Slit")
      .def(py::init<std::string, Frame, double, double, double>(), py::arg("name"), py::arg("frame"),
           py::arg("width"), py::arg("height"), py::arg("plate_size") = DEFAULT_PLATE_SIZE)
      .def_property("width", &Slit::width, &Slit::set_width)
      .def_property("height", &Slit::height, &Slit::set_height);

  py::class_<Aperture, Stop, std::shared_ptr<Aperture>>(m, "Aperture")
      .def(py::init<std::string, Frame, double, double>(), py::arg("name"), py::arg("frame"),
           py::arg("diameter"), py::arg("plate_size") = DEFAULT_PLATE_SIZE)
      .def_property("diameter", &Aperture::diameter, &Aperture::set_diameter);

  py::class_<PixelCoord>(m, "PixelCoord")
      .def_readonly("x", &PixelCoord::x)
      .def_readonly("y", &PixelCoord::y);
  m.attr("OUT_OF_GRID") = OUT_OF_GRID;

  py::class_<Detector, OpticalElement, std::shared_ptr<Detector>>(m, "Detector")
      .def(py::init<std::string, Frame, double, double>(), py::arg("name"), py::arg("frame"),
           py::arg("width") = DEFAULT_PLATE_SIZE, py::arg("height") = DEFAULT_PLATE_SIZE)
      .def("local_coordinates", &Detector::local_coordinates, py::arg("point"))
      .def("to_pixel", &Detector::to_pixel, py::arg("point"), py::arg("grid_w"), py::arg("grid_h"));

  // Source bindings
  py::enum_<PatternKind>(m, "PatternKind")
      .value("Line", PatternKind::Line)
      .value("Radial", PatternKind::Radial)
      .value("Cross", PatternKind::Cross)
      .value("Disc", PatternKind::Disc)
      .value("Heart", PatternKind::Heart)
      .value("Star", PatternKind::Star)
      .value("Smile", PatternKind::Smile)
      .export_values();

  py::class_<SourceConfig>(m, "SourceConfig")
      .def(py::init<>())
      .def_readwrite("position", &SourceConfig::position)
      .def_readwrite("direction", &SourceConfig::direction)
      .def_readwrite("up", &SourceConfig::up)
      .def_readwrite("pattern", &SourceConfig::pattern)
      .def_readwrite("ray_count", &SourceConfig::ray_count)
      .def_readwrite("beam_size", &SourceConfig::beam_size)
      .def_readwrite("white_light", &SourceConfig::white_light)
      .def_readwrite("wavelength_nm", &SourceConfig::wavelength_nm);

  m.def("generate_rays", &generate_rays, py::arg("config"), py::arg("rng"), "Build the seed rays of a source");

  py::class_<ImagePlane>(m, "ImagePlane")
      .def(py::init<>())
      .def_readwrite("frame", &ImagePlane::frame)
      .def_readwrite("width", &ImagePlane::width)
      .def_readwrite("height", &ImagePlane::height)
      .def_readwrite("image_width", &ImagePlane::image_width)
      .def_readwrite("image_height", &ImagePlane::image_height)
      .def_readwrite("rgba", &ImagePlane::rgba);

  m.def(
      "make_object_plane",
      [](py::array_t<std::uint8_t, py::array::c_style | py::array::forcecast> image) {
        if (image.ndim() != 3 || image.shape(2) != 4)
          throw std::invalid_argument("Expected an (H, W, 4) uint8 RGBA array");
        const int h = static_cast<int>(image.shape(0));
        const int w = static_cast<int>(image.shape(1));
        std::vector<std::uint8_t> rgba(image.data(), image.data() + image.size());
        return make_object_plane(w, h, std::move(rgba));
      },
      py::arg("image"), "Object plane from an (H, W, 4) RGBA array");

  // Sensor bindings
  py::enum_<SensorMode>(m, "SensorMode")
      .value("Grayscale", SensorMode::Grayscale)
      .value("Bayer", SensorMode::Bayer)
      .value("Demosaiced", SensorMode::Demosaiced)
      .export_values();

  py::class_<SensorAccumulator>(m, "SensorAccumulator")
      .def(py::init<int, int>(), py::arg("width"), py::arg("height"))
      .def_property_readonly("width", &SensorAccumulator::width)
      .def_property_readonly("height", &SensorAccumulator::height)
      .def_property_readonly("hits", &SensorAccumulator::hits)
      .def_property_readonly("discarded", &SensorAccumulator::discarded)
      .def("reset", &SensorAccumulator::reset)
      .def("record_hit", &SensorAccumulator::record_hit, py::arg("px"), py::arg("py"), py::arg("wavelength_nm"),
           py::arg("color") = py::none())
      .def(
          "render",
          [](const SensorAccumulator &s, SensorMode mode) {
            const SensorImage img = s.render(mode);
            py::array_t<std::uint8_t> out({img.height, img.width, 3});
            std::memcpy(out.mutable_data(), img.pixels.data(), img.pixels.size());
            return out;
          },
          py::arg("mode"), "Render the sensor image as an (H, W, 3) uint8 array");

  // Tracer bindings
  py::class_<TraceConfig>(m, "TraceConfig")
      .def(py::init<>())
      .def_readwrite("elements", &TraceConfig::elements)
      .def_readwrite("lens_mode", &TraceConfig::lens_mode)
      .def_readwrite("white_light", &TraceConfig::white_light)
      .def_readwrite("neutral_color", &TraceConfig::neutral_color)
      .def_readwrite("tail_length", &TraceConfig::tail_length)
      .def_readwrite("scene_radius", &TraceConfig::scene_radius);

  py::class_<Polyline>(m, "Polyline")
      .def_readonly("points", &Polyline::points)
      .def_readonly("color", &Polyline::color)
      .def_readonly("opacity", &Polyline::opacity)
      .def_readonly("diffraction_order", &Polyline::diffraction_order)
      .def_readonly("split", &Polyline::split);

  py::class_<Detection>(m, "Detection")
      .def_readonly("detector", &Detection::detector)
      .def_readonly("point", &Detection::point)
      .def_readonly("local", &Detection::local)
      .def_readonly("pixel", &Detection::pixel)
      .def_readonly("in_grid", &Detection::in_grid)
      .def_readonly("wavelength_nm", &Detection::wavelength_nm)
      .def_readonly("color", &Detection::color);

  py::class_<TraceResult>(m, "TraceResult")
      .def_readonly("polylines", &TraceResult::polylines)
      .def_readonly("detections", &TraceResult::detections)
      .def_readonly("surviving", &TraceResult::surviving)
      .def_readonly("n_seeds", &TraceResult::n_seeds)
      .def_readonly("n_splits", &TraceResult::n_splits)
      .def_readonly("n_absorbed", &TraceResult::n_absorbed)
      .def_readonly("n_detected", &TraceResult::n_detected)
      .def_readonly("n_discarded", &TraceResult::n_discarded)
      .def_readonly("n_escaped", &TraceResult::n_escaped);

  m.def(
      "run_trace",
      [](const TraceConfig &config, const std::vector<Ray> &seeds, SensorAccumulator *sensor) {
        py::gil_scoped_release release;
        return run_trace(config, seeds, sensor);
      },
      py::arg("config"), py::arg("seeds"), py::arg("sensor") = nullptr,
      "Trace the seed rays through the configured elements");

  // Bench bindings
  py::class_<Bench>(m, "Bench")
      .def_readonly("name", &Bench::name)
      .def_readonly("elements", &Bench::elements)
      .def_readwrite("source", &Bench::source)
      .def_readwrite("lens_mode", &Bench::lens_mode)
      .def_readonly("grid_width", &Bench::grid_width)
      .def_readonly("grid_height", &Bench::grid_height)
      .def_readonly("detector", &Bench::detector)
      .def("trace_config", &Bench::trace_config)
      .def("seed_rays", &Bench::seed_rays, py::arg("rng"), py::arg("object") = nullptr);

  m.def("bench_names", &bench_names);
  m.def("make_bench", &make_bench, py::arg("name"), "Build a preset bench by name");

  // Diagnostics bindings
  m.def("collimation_percent", &collimation_percent, py::arg("rays"), py::arg("axis") = Y_UNIT_VEC3);
  m.def("image_distance", &image_distance, py::arg("focal_length"), py::arg("object_distance"));
  m.def("circle_of_confusion", &circle_of_confusion, py::arg("focal_length"), py::arg("object_distance"),
        py::arg("detector_distance"), py::arg("aperture_diameter"));

  // Logger bindings
  py::enum_<Level>(m, "LogLevel")
      .value("debug", Level::debug)
      .value("info", Level::info)
      .value("warn", Level::warn)
      .value("error", Level::error)
      .value("off", Level::off)
      .export_values();

  m.def(
      "set_log_level", [](Level level) { Logger::instance().set_level(level); }, py::arg("level"),
      "Set the logging level for the opticslab module");
}
