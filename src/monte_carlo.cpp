#include "pricer/monte_carlo.hpp"

#include <cmath>
#include <limits>
#include <utility>

#include "pricer/errors.hpp"

namespace pricer {

namespace {

std::mt19937_64 make_engine(std::optional<std::uint64_t> seed) {
  if (seed.has_value()) {
    return std::mt19937_64(*seed);
  }
  std::random_device entropy;
  const std::uint64_t high = entropy();
  const std::uint64_t low = entropy();
  return std::mt19937_64((high << 32U) ^ low);
}

}  // namespace

RandomStream::RandomStream(std::optional<std::uint64_t> seed) : engine_(make_engine(seed)) {}

double RandomStream::next_uniform() {
  // Top 53 bits of one engine word, uniform on [0, 1).
  return static_cast<double>(engine_() >> 11U) * 0x1.0p-53;
}

double RandomStream::next_normal() {
  if (has_spare_) {
    has_spare_ = false;
    return spare_;
  }
  double x = 0.0;
  double y = 0.0;
  double s = 0.0;
  do {
    x = 2.0 * next_uniform() - 1.0;
    y = 2.0 * next_uniform() - 1.0;
    s = x * x + y * y;
  } while (s >= 1.0 || s == 0.0);
  const double scale = std::sqrt(-2.0 * std::log(s) / s);
  spare_ = y * scale;
  has_spare_ = true;
  return x * scale;
}

void validate(const SimulationParameters& params) {
  if (!(std::isfinite(params.spot) && params.spot > 0.0)) {
    throw InvalidArgument("spot must be positive");
  }
  if (!(std::isfinite(params.maturity) && params.maturity > 0.0)) {
    throw InvalidArgument("maturity must be positive");
  }
  if (!std::isfinite(params.rate)) {
    throw InvalidArgument("rate must be finite");
  }
  if (!(std::isfinite(params.volatility) && params.volatility >= 0.0)) {
    throw InvalidArgument("volatility cannot be negative");
  }
  if (params.steps <= 0) {
    throw InvalidArgument("steps must be positive");
  }
  if (params.paths <= 0) {
    throw InvalidArgument("number of paths must be positive");
  }
  if (!params.payoff) {
    throw InvalidArgument("payoff function must be callable");
  }
}

MonteCarloResult price_monte_carlo(const SimulationParameters& params) {
  validate(params);

  const double S = params.spot;
  const double r = params.rate;
  const double sigma = params.volatility;
  const double T = params.maturity;

  const double dt = T / static_cast<double>(params.steps);
  const double drift = (r - 0.5 * sigma * sigma) * dt;
  const double diffusion = sigma * std::sqrt(dt);
  const double discount = std::exp(-r * T);

  RandomStream stream(params.seed);

  // Welford accumulation of the discounted payoffs.
  double mean = 0.0;
  double squared_deviations = 0.0;
  for (int path = 0; path < params.paths; ++path) {
    double price = S;
    for (int step = 0; step < params.steps; ++step) {
      const double z = stream.next_normal();
      price *= std::exp(drift + diffusion * z);
    }
    const double sample = discount * params.payoff(price);
    const double delta = sample - mean;
    mean += delta / static_cast<double>(path + 1);
    squared_deviations += delta * (sample - mean);
  }

  const auto n = static_cast<double>(params.paths);
  const double standard_error = params.paths > 1
    ? std::sqrt(squared_deviations / (n - 1.0)) / std::sqrt(n)
    : std::numeric_limits<double>::quiet_NaN();

  return MonteCarloResult{
    .price = mean,
    .standard_error = standard_error,
  };
}

MonteCarloResult price_monte_carlo(
  double spot,
  double maturity,
  double rate,
  double volatility,
  int steps,
  int paths,
  PayoffFunction payoff_fn,
  std::optional<std::uint64_t> seed) {
  return price_monte_carlo(SimulationParameters{
    .spot = spot,
    .maturity = maturity,
    .rate = rate,
    .volatility = volatility,
    .steps = steps,
    .paths = paths,
    .payoff = std::move(payoff_fn),
    .seed = seed,
  });
}

}  // namespace pricer
