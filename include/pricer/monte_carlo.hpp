#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "pricer/payoff.hpp"

namespace pricer {

struct SimulationParameters {
  double spot;
  double maturity;
  double rate;
  double volatility;
  int steps;
  int paths;
  PayoffFunction payoff;
  std::optional<std::uint64_t> seed;
};

struct MonteCarloResult {
  double price;
  double standard_error;
};

// Standard-normal source owned by a single pricing call.
//
// The engine is std::mt19937_64, uniforms are the top 53 bits of one engine
// word, and normals come from the Marsaglia polar method with the second
// variate of each pair cached. A given seed yields the same draws wherever
// the platform's log and sqrt agree. Without a seed the engine is seeded
// from std::random_device.
class RandomStream {
 public:
  explicit RandomStream(std::optional<std::uint64_t> seed);

  RandomStream(const RandomStream&) = delete;
  RandomStream& operator=(const RandomStream&) = delete;

  double next_normal();

 private:
  double next_uniform();

  std::mt19937_64 engine_;
  double spare_ = 0.0;
  bool has_spare_ = false;
};

void validate(const SimulationParameters& params);

MonteCarloResult price_monte_carlo(const SimulationParameters& params);

MonteCarloResult price_monte_carlo(
  double spot,
  double maturity,
  double rate,
  double volatility,
  int steps,
  int paths,
  PayoffFunction payoff_fn,
  std::optional<std::uint64_t> seed = std::nullopt);

}  // namespace pricer
