#pragma once
#include <cstdint>
#include <random>

namespace opticslab::math {

struct Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> uni{0.0, 1.0};

  explicit Rng(std::uint64_t seed = std::random_device{}()) : gen(seed) {}

  double uniform();
  double uniform(double lo, double hi);
};

} // namespace opticslab::math
