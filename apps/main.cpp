#include <opticslab/core/metrics.hpp>
#include <opticslab/core/sensor.hpp>
#include <opticslab/core/setups.hpp>
#include <opticslab/core/tracer.hpp>
#include <opticslab/log/logger.hpp>
#include <opticslab/math/rng.hpp>
#include <charconv>
#include <cstdio>
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace opticslab;

namespace {

struct Options {
  std::string setup{"camera-sensor"};
  core::SensorMode mode{core::SensorMode::Demosaiced};
  std::optional<core::PatternKind> pattern;
  std::optional<int> rays;
  std::optional<double> wavelength;
  bool white{false};
  std::optional<std::uint64_t> seed;
  std::string out{"sensor.ppm"};
  bool verbose{false};
};

void usage() {
  std::fprintf(stderr,
               "usage: opticslab_cli [--setup NAME] [--mode grayscale|bayer|demosaiced] [--pattern P]\n"
               "                     [--rays N] [--wavelength NM|white] [--seed S] [--out FILE.ppm] [--verbose]\n");
}

template <class T>
bool parse_number(std::string_view text, T &value) {
  const char *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  return ec == std::errc() && ptr == end;
}

// Returns nullopt (after logging) on any bad argument
std::optional<Options> parse_args(int argc, char **argv) {
  Options opt;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];

    if (arg == "--verbose") {
      opt.verbose = true;
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      usage();
      return std::nullopt;
    }
    if (i + 1 >= argc) {
      OLOG_ERROR("Missing value for '{}'", arg);
      return std::nullopt;
    }
    const std::string_view value = argv[++i];

    if (arg == "--setup") {
      opt.setup = std::string(value);
    } else if (arg == "--mode") {
      const auto mode = core::parse_sensor_mode(value);
      if (!mode) {
        OLOG_ERROR("Unknown sensor mode '{}'", value);
        return std::nullopt;
      }
      opt.mode = *mode;
    } else if (arg == "--pattern") {
      opt.pattern = core::parse_pattern(value);
      if (!opt.pattern) {
        OLOG_ERROR("Unknown pattern '{}'", value);
        return std::nullopt;
      }
    } else if (arg == "--rays") {
      int n = 0;
      if (!parse_number(value, n) || n <= 0) {
        OLOG_ERROR("--rays expects a positive integer, got '{}'", value);
        return std::nullopt;
      }
      opt.rays = n;
    } else if (arg == "--wavelength") {
      if (value == "white") {
        opt.white = true;
      } else {
        double nm = 0.0;
        if (!parse_number(value, nm) || nm <= 0.0) {
          OLOG_ERROR("--wavelength expects nanometres or 'white', got '{}'", value);
          return std::nullopt;
        }
        opt.wavelength = nm;
      }
    } else if (arg == "--seed") {
      std::uint64_t s = 0;
      if (!parse_number(value, s)) {
        OLOG_ERROR("--seed expects an unsigned integer, got '{}'", value);
        return std::nullopt;
      }
      opt.seed = s;
    } else if (arg == "--out") {
      opt.out = std::string(value);
    } else {
      OLOG_ERROR("Unknown option '{}'", arg);
      return std::nullopt;
    }
  }
  return opt;
}

void write_ppm(const std::string &path, const core::SensorImage &image) {
  std::ofstream file(path, std::ios::binary);
  if (!file)
    throw std::runtime_error("Cannot open output file: " + path);

  file << "P6\n" << image.width << " " << image.height << "\n255\n";
  file.write(reinterpret_cast<const char *>(image.pixels.data()), static_cast<std::streamsize>(image.pixels.size()));
  if (!file)
    throw std::runtime_error("Failed writing output file: " + path);
}

} // namespace

int main(int argc, char **argv) {
  const std::optional<Options> opt = parse_args(argc, argv);
  if (!opt) {
    usage();
    return 2;
  }

  if (opt->verbose)
    log::Logger::instance().set_level(log::Level::debug);

  try {
    core::Bench bench = core::make_bench(opt->setup);

    if (opt->pattern)
      bench.source.pattern = *opt->pattern;
    if (opt->rays)
      bench.source.ray_count = *opt->rays;
    if (opt->white) {
      bench.source.white_light = true;
    } else if (opt->wavelength) {
      bench.source.white_light = false;
      bench.source.wavelength_nm = *opt->wavelength;
    }

    math::Rng rng = opt->seed ? math::Rng(*opt->seed) : math::Rng();

    std::optional<core::ImagePlane> object;
    if (bench.lens_mode == core::LensMode::Imaging)
      object = core::make_color_chart();

    const std::vector<core::Ray> seeds = bench.seed_rays(rng, object ? &*object : nullptr);
    core::SensorAccumulator sensor(bench.grid_width, bench.grid_height);

    const core::TraceResult result = core::run_trace(bench.trace_config(), seeds, bench.detector ? &sensor : nullptr);

    if (bench.name == "two-lens") {
      if (const auto pct = core::collimation_percent(result.surviving))
        OLOG_INFO("Collimation: {:.1f}%", *pct);
    }

    if (bench.detector) {
      write_ppm(opt->out, sensor.render(opt->mode));
      OLOG_INFO("Wrote {} sensor image {}x{} to {}", core::to_string(opt->mode), sensor.width(), sensor.height(),
                opt->out);
    }
  } catch (const std::invalid_argument &e) {
    OLOG_ERROR("Configuration error: {}", e.what());
    return 2;
  } catch (const std::exception &e) {
    OLOG_ERROR("{}", e.what());
    return 1;
  }

  return 0;
}
