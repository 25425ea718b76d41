#include "pricer/lattice.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "pricer/errors.hpp"

namespace pricer {

namespace {

bool positive(double x) {
  return std::isfinite(x) && x > 0.0;
}

}  // namespace

CrrFactors crr_factors(double volatility, double maturity, int steps) {
  if (!positive(volatility)) {
    throw InvalidArgument("volatility must be positive for CRR calibration");
  }
  if (!positive(maturity)) {
    throw InvalidArgument("maturity must be positive");
  }
  if (steps <= 0) {
    throw InvalidArgument("steps must be positive");
  }
  const double dt = maturity / static_cast<double>(steps);
  const double up = std::exp(volatility * std::sqrt(dt));
  return CrrFactors{.up = up, .down = 1.0 / up};
}

void validate(const LatticeParameters& params) {
  const MarketParameters& market = params.market;
  if (!positive(market.spot)) {
    throw InvalidArgument("spot must be positive");
  }
  if (!positive(market.strike)) {
    throw InvalidArgument("strike must be positive");
  }
  if (!positive(market.maturity)) {
    throw InvalidArgument("maturity must be positive");
  }
  if (!std::isfinite(market.rate)) {
    throw InvalidArgument("rate must be finite");
  }
  if (params.steps <= 0) {
    throw InvalidArgument("steps must be positive");
  }
  if (!positive(params.up) || !positive(params.down)) {
    throw InvalidArgument("up and down factors must be positive");
  }
  if (params.up <= params.down) {
    throw InvalidArgument("up factor must exceed down factor");
  }
  const double growth = std::exp(market.rate * (market.maturity / static_cast<double>(params.steps)));
  if (params.down >= growth) {
    throw InvalidArgument("down factor must be less than the discount factor to avoid arbitrage");
  }
  if (params.kind != OptionKind::Call && params.kind != OptionKind::Put) {
    throw InvalidArgument("option kind must be call or put");
  }
}

LatticeResult price_lattice(const LatticeParameters& params) {
  validate(params);

  const double S = params.market.spot;
  const double K = params.market.strike;
  const double r = params.market.rate;
  const double u = params.up;
  const double d = params.down;
  const int n = params.steps;
  const bool american = params.exercise == ExerciseStyle::American;

  const double dt = params.market.maturity / static_cast<double>(n);
  const double discount = std::exp(-r * dt);
  const double p = (std::exp(r * dt) - d) / (u - d);
  if (!(p >= 0.0 && p <= 1.0)) {
    throw InvalidArgument("risk-neutral probability out of bounds");
  }

  // values[j] holds the node with j up-moves; the live range shrinks by one
  // per step and indices past it are never read again.
  std::vector<double> values(static_cast<std::size_t>(n) + 1);
  for (int j = 0; j <= n; ++j) {
    const double terminal = S * std::pow(u, j) * std::pow(d, n - j);
    values[static_cast<std::size_t>(j)] = payoff(terminal, K, params.kind);
  }

  const double spread = S * (u - d);
  double delta = n == 1 ? (values[1] - values[0]) / spread : 0.0;

  for (int step = n - 1; step >= 0; --step) {
    for (int i = 0; i <= step; ++i) {
      const auto node = static_cast<std::size_t>(i);
      const double continuation = discount * (p * values[node + 1] + (1.0 - p) * values[node]);
      if (american) {
        const double spot_at_node = S * std::pow(u, i) * std::pow(d, step - i);
        values[node] = std::max(continuation, payoff(spot_at_node, K, params.kind));
      } else {
        values[node] = continuation;
      }
    }
    if (step == 1) {
      delta = (values[1] - values[0]) / spread;
    }
  }

  return LatticeResult{.price = values[0], .delta = delta};
}

LatticeResult price_lattice(
  double spot,
  double strike,
  double maturity,
  double rate,
  double up,
  double down,
  int steps,
  OptionKind kind,
  bool american) {
  return price_lattice(LatticeParameters{
    .market = MarketParameters{
      .spot = spot,
      .strike = strike,
      .maturity = maturity,
      .rate = rate,
    },
    .up = up,
    .down = down,
    .steps = steps,
    .kind = kind,
    .exercise = american ? ExerciseStyle::American : ExerciseStyle::European,
  });
}

}  // namespace pricer
