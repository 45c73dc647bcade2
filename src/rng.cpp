#include <opticslab/math/rng.hpp>

namespace opticslab::math {

double Rng::uniform() {
  return uni(gen);
}

double Rng::uniform(double lo, double hi) {
  return lo + (hi - lo) * uniform();
}

} // namespace opticslab::math
