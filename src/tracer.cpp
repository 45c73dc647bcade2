#include <opticslab/core/tracer.hpp>
#include <opticslab/log/logger.hpp>
#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

namespace opticslab::core {

ActivePath::ActivePath(const Ray &ray, const Ray &seed) : ray(ray), seed(seed), points{ray.origin()} {}

namespace {

bool escaped(const Ray &ray, double scene_radius) {
  return norm(ray.origin()) > scene_radius;
}

void record_detection(const OpticalElement &element, const Absorb &absorb, SensorAccumulator *sensor,
                      TraceResult &result) {
  const auto *detector = dynamic_cast<const Detector *>(&element);
  if (detector == nullptr)
    return;

  Detection d;
  d.detector = detector->name();
  d.point = absorb.point;
  d.local = detector->local_coordinates(absorb.point);
  d.wavelength_nm = absorb.wavelength_nm;
  d.color = absorb.color;

  if (sensor) {
    d.pixel = detector->to_pixel(absorb.point, sensor->width(), sensor->height());
    d.in_grid = sensor->record_hit(d.pixel.x, d.pixel.y, absorb.wavelength_nm, absorb.color);
    if (!d.in_grid)
      ++result.n_discarded;
  }

  ++result.n_detected;
  result.detections.push_back(std::move(d));
}

} // namespace

TraceResult run_trace(const TraceConfig &config, const std::vector<Ray> &seeds, SensorAccumulator *sensor) {
  TraceResult result;
  result.n_seeds = seeds.size();

  if (sensor)
    sensor->reset();

  const InteractionContext ctx{config.lens_mode};

  std::vector<ActivePath> paths;
  paths.reserve(seeds.size());
  for (const Ray &seed : seeds)
    paths.emplace_back(seed, seed);

  for (const ElementPtr &element : config.elements) {
    if (!element)
      continue;

    std::vector<ActivePath> next;
    next.reserve(paths.size());
    std::size_t live_before = 0;

    for (ActivePath &path : paths) {
      if (path.terminated) {
        next.push_back(std::move(path));
        continue;
      }
      ++live_before;

      Outcome outcome = element->interact(path.ray, path.seed, ctx);

      std::visit(
          [&](auto &&o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Miss>) {
              next.push_back(std::move(path));
            } else if constexpr (std::is_same_v<T, Redirect>) {
              path.points.push_back(o.ray.origin());
              path.ray = o.ray;
              if (escaped(path.ray, config.scene_radius)) {
                path.terminated = true;
                ++result.n_escaped;
              }
              next.push_back(std::move(path));
            } else if constexpr (std::is_same_v<T, Split>) {
              ++result.n_splits;
              for (const Ray &child : o.rays) {
                ActivePath forked(child, path.seed);
                forked.points = path.points;
                forked.points.push_back(child.origin());
                forked.has_split = true;
                forked.split_index = path.has_split ? path.split_index : forked.points.size() - 1;
                if (escaped(child, config.scene_radius)) {
                  forked.terminated = true;
                  ++result.n_escaped;
                }
                next.push_back(std::move(forked));
              }
            } else if constexpr (std::is_same_v<T, Absorb>) {
              path.points.push_back(o.point);
              path.terminated = true;
              if (o.detected)
                record_detection(*element, o, sensor, result);
              else
                ++result.n_absorbed;
              next.push_back(std::move(path));
            }
          },
          outcome);
    }

    OLOG_DEBUG("Round '{}' ({}): {} live paths in, {} paths out", element->name(), to_string(element->kind()),
               live_before, next.size());
    paths = std::move(next);
  }

  for (ActivePath &path : paths) {
    if (path.terminated)
      continue;
    result.surviving.push_back(path.ray);
    path.points.push_back(path.ray.at(config.tail_length));
  }

  result.polylines = build_polylines(config, paths);

  OLOG_INFO("Trace finished: {} seeds, {} splits, {} surviving, {} detected ({} outside grid), {} absorbed",
            result.n_seeds, result.n_splits, result.surviving.size(), result.n_detected, result.n_discarded,
            result.n_absorbed);
  return result;
}

std::vector<Polyline> build_polylines(const TraceConfig &config, const std::vector<ActivePath> &paths) {
  std::vector<Polyline> out;
  out.reserve(paths.size());

  for (const ActivePath &path : paths) {
    const Ray &ray = path.ray;
    const std::optional<int> &order = ray.diffraction_order();

    if (config.white_light && path.has_split && !ray.color()) {
      const std::size_t k = std::min(path.split_index, path.points.size() - 1);
      std::vector<Vec3> pre(path.points.begin(), path.points.begin() + k + 1);
      std::vector<Vec3> post(path.points.begin() + k, path.points.end());

      if (pre.size() > 1)
        out.push_back({std::move(pre), config.neutral_color, POLYLINE_OPACITY, order, true});
      if (post.size() > 1) {
        const RGB color = (order && *order == 0) ? config.neutral_color : wavelength_to_rgb(ray.wavelength_nm());
        out.push_back({std::move(post), color, POLYLINE_OPACITY, order, true});
      }
      continue;
    }

    RGB color;
    if (ray.color())
      color = *ray.color();
    else if (config.white_light)
      color = config.neutral_color;
    else
      color = wavelength_to_rgb(ray.wavelength_nm());

    out.push_back({path.points, color, POLYLINE_OPACITY, order, path.has_split});
  }
  return out;
}

} // namespace opticslab::core
