#include <gtest/gtest.h>

#include <opticslab/core/metrics.hpp>
#include <opticslab/core/setups.hpp>
#include <map>
#include <set>
#include <stdexcept>

using namespace opticslab::core;
using namespace opticslab::math;

TEST(MakeBench, EveryNamedBenchBuilds) {
  for (const std::string &name : bench_names()) {
    const Bench bench = make_bench(name);
    EXPECT_EQ(bench.name, name);
    EXPECT_FALSE(bench.elements.empty()) << name;
  }
  EXPECT_EQ(bench_names().size(), 11u);
}

TEST(MakeBench, UnknownNameThrows) {
  EXPECT_THROW(make_bench("periscope"), std::invalid_argument);
}

TEST(MakeBench, FlatMirrorTurnsBeamTowardsZ) {
  const Bench bench = make_bench("flat-mirror");
  Rng rng(7);
  const TraceResult result = run_trace(bench.trace_config(), bench.seed_rays(rng));
  ASSERT_EQ(result.surviving.size(), 100u);
  for (const Ray &r : result.surviving)
    EXPECT_NEAR(r.direction().z, 1.0, 1e-12);
}

TEST(MakeBench, TwoLensCollimation) {
  const Bench bench = make_bench("two-lens");
  Rng rng(7);
  const TraceResult result = run_trace(bench.trace_config(), bench.seed_rays(rng));
  const auto pct = collimation_percent(result.surviving);
  ASSERT_TRUE(pct.has_value());
  EXPECT_GE(*pct, 0.0);
  EXPECT_LE(*pct, 100.0);
}

TEST(MakeBench, CameraSensorProducesImage) {
  const Bench bench = make_bench("camera-sensor");
  ASSERT_TRUE(bench.detector);
  EXPECT_TRUE(bench.source.white_light);

  Rng rng(7);
  SensorAccumulator sensor(bench.grid_width, bench.grid_height);
  const TraceResult result = run_trace(bench.trace_config(), bench.seed_rays(rng), &sensor);

  EXPECT_EQ(result.n_seeds, 300u);
  EXPECT_EQ(result.n_detected, 300u);
  EXPECT_FALSE(sensor.render(SensorMode::Grayscale).is_black());
}

TEST(MakeBench, CameraImageObjectImagesTheChart) {
  const Bench bench = make_bench("camera-image-object");
  EXPECT_EQ(bench.lens_mode, LensMode::Imaging);

  const ImagePlane chart = make_color_chart();
  Rng rng(7);
  const std::vector<Ray> seeds = bench.seed_rays(rng, &chart);
  EXPECT_EQ(seeds.size() % 5, 0u);
  ASSERT_FALSE(seeds.empty());

  SensorAccumulator sensor(bench.grid_width, bench.grid_height);
  const TraceResult result = run_trace(bench.trace_config(), seeds, &sensor);
  EXPECT_GT(sensor.hits(), 0u);
  for (const Detection &d : result.detections)
    EXPECT_TRUE(d.color.has_value());
  EXPECT_FALSE(sensor.render(SensorMode::Demosaiced).is_black());
}

TEST(MakeBench, CzernyTurnerLayout) {
  const Bench bench = make_czerny_turner();
  ASSERT_EQ(bench.elements.size(), 5u);
  EXPECT_EQ(bench.elements.front()->kind(), ElementKind::Slit);
  EXPECT_EQ(bench.elements[2]->kind(), ElementKind::ReflectiveGrating);
  EXPECT_EQ(bench.elements.back()->kind(), ElementKind::Detector);

  Rng rng(7);
  SensorAccumulator sensor(bench.grid_width, bench.grid_height);
  const TraceResult result = run_trace(bench.trace_config(), bench.seed_rays(rng), &sensor);

  EXPECT_EQ(result.n_seeds, 300u);
  EXPECT_GT(result.n_detected, 0u);
  EXPECT_GT(sensor.hits(), 0u);
  EXPECT_FALSE(sensor.render(SensorMode::Demosaiced).is_black());

  // Columns reached by each wavelength
  std::map<double, std::set<int>> columns;
  for (const Detection &d : result.detections) {
    if (d.in_grid)
      columns[d.wavelength_nm].insert(d.pixel.x);
  }
  ASSERT_GE(columns.size(), 2u);

  // The spectrum is dispersed: no column is shared between wavelengths
  std::set<int> all;
  std::size_t total = 0;
  for (const auto &[wl, cols] : columns) {
    all.insert(cols.begin(), cols.end());
    total += cols.size();
  }
  EXPECT_EQ(all.size(), total);
}

TEST(MakeBench, CzernyTurnerRejectsUnsolvableDensity) {
  CzernyTurnerParams params;
  params.lines_per_mm = 4000.0;
  EXPECT_THROW(make_czerny_turner(params), std::invalid_argument);

  params.lines_per_mm = -10.0;
  EXPECT_THROW(make_czerny_turner(params), std::invalid_argument);
}

TEST(ObjectPlane, FollowsImageAspect) {
  const ImagePlane plane = make_object_plane(200, 100, std::vector<std::uint8_t>(200 * 100 * 4, 255));
  EXPECT_DOUBLE_EQ(plane.height, 4.0);
  EXPECT_DOUBLE_EQ(plane.width, 8.0);
  EXPECT_DOUBLE_EQ(plane.frame.origin.x, -10.0);

  EXPECT_THROW(make_object_plane(0, 10, {}), std::invalid_argument);
  EXPECT_THROW(make_object_plane(2, 2, std::vector<std::uint8_t>(3)), std::invalid_argument);
}
