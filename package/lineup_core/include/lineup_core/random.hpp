#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace lineup_core {

// Uniform [0, 1) source consumed by the at-bat model and lineup sampling.
class RandomSource {
public:
  virtual ~RandomSource() = default;
  virtual double next_uniform() = 0;
};

class Mt19937Source : public RandomSource {
public:
  explicit Mt19937Source(std::uint64_t seed) : rng_(seed) {}

  double next_uniform() override {
    const double u = unif_(rng_);
    // generate_canonical may round up to 1.0
    return u < 1.0 ? u : std::nextafter(1.0, 0.0);
  }

private:
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> unif_{0.0, 1.0};
};

// Fisher-Yates driven by a RandomSource
template <typename T> void shuffle(std::vector<T> &items, RandomSource &rng) {
  for (std::size_t i = items.size(); i > 1; --i) {
    std::size_t j = static_cast<std::size_t>(rng.next_uniform() *
                                             static_cast<double>(i));
    if (j >= i)
      j = i - 1;
    std::swap(items[i - 1], items[j]);
  }
}

} // namespace lineup_core
