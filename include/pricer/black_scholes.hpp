#pragma once

#include "pricer/payoff.hpp"

namespace pricer {

struct BlackScholesResult {
  double price;
  double delta;
};

// Closed-form European price and delta without dividends. Used as the
// convergence reference for the lattice and Monte Carlo pricers.
BlackScholesResult black_scholes(
  double spot,
  double strike,
  double maturity,
  double rate,
  double volatility,
  OptionKind kind);

}  // namespace pricer
