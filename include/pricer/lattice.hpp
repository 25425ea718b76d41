#pragma once

#include "pricer/payoff.hpp"

namespace pricer {

enum class ExerciseStyle {
  European,
  American,
};

struct MarketParameters {
  double spot;
  double strike;
  double maturity;
  double rate;
};

struct LatticeParameters {
  MarketParameters market;
  double up;
  double down;
  int steps;
  OptionKind kind;
  ExerciseStyle exercise;
};

struct LatticeResult {
  double price;
  double delta;
};

// Per-step move factors of a Cox-Ross-Rubinstein tree calibrated to a
// volatility: up = exp(sigma * sqrt(dt)), down = 1 / up.
struct CrrFactors {
  double up;
  double down;
};

CrrFactors crr_factors(double volatility, double maturity, int steps);

// Throws InvalidArgument naming the first violated precondition, including
// the no-arbitrage bound down < exp(rate * maturity / steps).
void validate(const LatticeParameters& params);

LatticeResult price_lattice(const LatticeParameters& params);

LatticeResult price_lattice(
  double spot,
  double strike,
  double maturity,
  double rate,
  double up,
  double down,
  int steps,
  OptionKind kind = OptionKind::Call,
  bool american = false);

}  // namespace pricer
