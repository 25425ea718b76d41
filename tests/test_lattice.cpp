#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

#include "pricer/black_scholes.hpp"
#include "pricer/errors.hpp"
#include "pricer/lattice.hpp"

namespace {

void assert_near(const std::string& label, double actual, double expected, double tolerance) {
  if (std::abs(actual - expected) > tolerance) {
    std::cerr << label << " expected " << expected << " but got " << actual << '\n';
    std::exit(EXIT_FAILURE);
  }
}

void assert_condition(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << message << '\n';
    std::exit(EXIT_FAILURE);
  }
}

// Expects price_lattice to throw InvalidArgument whose message mentions `needle`.
void assert_rejected(const char* label, const pricer::LatticeParameters& params, const char* needle) {
  try {
    pricer::price_lattice(params);
  } catch (const pricer::InvalidArgument& error) {
    const std::string message = error.what();
    assert_condition(message.find(needle) != std::string::npos,
      std::string(label) + ": message '" + message + "' should mention '" + needle + "'");
    return;
  }
  std::cerr << label << ": expected InvalidArgument\n";
  std::exit(EXIT_FAILURE);
}

pricer::LatticeParameters reference_params() {
  return pricer::LatticeParameters{
    .market = pricer::MarketParameters{
      .spot = 100.0,
      .strike = 100.0,
      .maturity = 1.0,
      .rate = 0.05,
    },
    .up = 1.1,
    .down = 0.9,
    .steps = 3,
    .kind = pricer::OptionKind::Call,
    .exercise = pricer::ExerciseStyle::European,
  };
}

void reference_scenario() {
  // Backward induction by hand: p = (e^(0.05/3) - 0.9) / 0.2, three steps.
  const auto call = pricer::price_lattice(100.0, 100.0, 1.0, 0.05, 1.1, 0.9, 3);
  assert_near("reference call price", call.price, 9.875778502232407, 1e-9);
  assert_near("reference call delta", call.delta, 0.6083188831678705, 1e-9);

  const auto put = pricer::price_lattice(100.0, 100.0, 1.0, 0.05, 1.1, 0.9, 3, pricer::OptionKind::Put);
  assert_near("reference put price", put.price, 4.998720952303828, 1e-9);
  assert_near("reference put delta", put.delta, -0.39168111683212953, 1e-9);

  const auto american_put =
    pricer::price_lattice(100.0, 100.0, 1.0, 0.05, 1.1, 0.9, 3, pricer::OptionKind::Put, true);
  assert_near("reference american put price", american_put.price, 5.275337873804351, 1e-9);
  assert_near("reference american put delta", american_put.delta, -0.4254896792118856, 1e-9);

  // Without dividends early exercise of a call is never optimal.
  const auto american_call =
    pricer::price_lattice(100.0, 100.0, 1.0, 0.05, 1.1, 0.9, 3, pricer::OptionKind::Call, true);
  assert_near("american call equals european", american_call.price, call.price, 1e-12);
}

void one_step_matches_closed_form() {
  struct Case {
    double spot, strike, maturity, rate, up, down;
    pricer::OptionKind kind;
  };
  const Case cases[] = {
    {100.0, 110.0, 1.0, 0.05, 1.2, 0.85, pricer::OptionKind::Put},
    {100.0, 90.0, 0.5, 0.02, 1.15, 0.9, pricer::OptionKind::Call},
    {50.0, 50.0, 2.0, -0.01, 1.3, 0.7, pricer::OptionKind::Call},
    {80.0, 75.0, 0.25, 0.0, 1.05, 0.95, pricer::OptionKind::Put},
  };
  for (const auto& c : cases) {
    const double discount = std::exp(-c.rate * c.maturity);
    const double p = (std::exp(c.rate * c.maturity) - c.down) / (c.up - c.down);
    const double up_value = pricer::payoff(c.spot * c.up, c.strike, c.kind);
    const double down_value = pricer::payoff(c.spot * c.down, c.strike, c.kind);
    const double expected = discount * (p * up_value + (1.0 - p) * down_value);

    const auto result = pricer::price_lattice(
      c.spot, c.strike, c.maturity, c.rate, c.up, c.down, 1, c.kind);
    assert_near("one-step price", result.price, expected, 1e-12);
    assert_near("one-step delta", result.delta, (up_value - down_value) / (c.spot * (c.up - c.down)), 1e-12);
  }
  assert_near("one-step put fixture",
    pricer::price_lattice(100.0, 110.0, 1.0, 0.05, 1.2, 0.85, 1, pricer::OptionKind::Put).price,
    10.105379242918337, 1e-9);
}

void american_dominates_european() {
  for (const auto kind : {pricer::OptionKind::Call, pricer::OptionKind::Put}) {
    for (const double strike : {80.0, 100.0, 120.0}) {
      for (const double rate : {0.0, 0.03, 0.08}) {
        const auto factors = pricer::crr_factors(0.3, 1.5, 60);
        const auto european = pricer::price_lattice(
          100.0, strike, 1.5, rate, factors.up, factors.down, 60, kind, false);
        const auto american = pricer::price_lattice(
          100.0, strike, 1.5, rate, factors.up, factors.down, 60, kind, true);
        assert_condition(american.price >= european.price - 1e-12,
          "american price below european for strike " + std::to_string(strike));
        assert_condition(european.price >= 0.0, "european price must be non-negative");
      }
    }
  }

  // Deep in-the-money put with positive rates carries an early-exercise premium.
  const auto factors = pricer::crr_factors(0.2, 1.0, 200);
  const auto european = pricer::price_lattice(
    100.0, 140.0, 1.0, 0.08, factors.up, factors.down, 200, pricer::OptionKind::Put, false);
  const auto american = pricer::price_lattice(
    100.0, 140.0, 1.0, 0.08, factors.up, factors.down, 200, pricer::OptionKind::Put, true);
  assert_condition(american.price > european.price + 1e-3, "american put should carry an exercise premium");
  assert_near("deep put exercised immediately", american.price, 40.0, 1e-9);
}

void converges_to_black_scholes() {
  constexpr double kSpot = 100.0;
  constexpr double kStrike = 100.0;
  constexpr double kMaturity = 1.0;
  constexpr double kRate = 0.05;
  constexpr double kVol = 0.2;

  for (const auto kind : {pricer::OptionKind::Call, pricer::OptionKind::Put}) {
    const double reference = pricer::black_scholes(kSpot, kStrike, kMaturity, kRate, kVol, kind).price;
    double previous_error = 1.0;
    for (const int steps : {50, 100, 200, 400}) {
      const auto factors = pricer::crr_factors(kVol, kMaturity, steps);
      const auto result = pricer::price_lattice(
        kSpot, kStrike, kMaturity, kRate, factors.up, factors.down, steps, kind);
      const double error = std::abs(result.price - reference);
      assert_condition(error < 2.5 / steps, "lattice error too large at " + std::to_string(steps) + " steps");
      assert_condition(error < previous_error, "lattice error should shrink at " + std::to_string(steps) + " steps");
      previous_error = error;
    }
  }

  const auto factors = pricer::crr_factors(kVol, kMaturity, 400);
  const auto call = pricer::price_lattice(
    kSpot, kStrike, kMaturity, kRate, factors.up, factors.down, 400, pricer::OptionKind::Call);
  const double bs_delta = pricer::black_scholes(
    kSpot, kStrike, kMaturity, kRate, kVol, pricer::OptionKind::Call).delta;
  assert_near("lattice delta near black-scholes delta", call.delta, bs_delta, 5e-3);
}

void rejects_invalid_inputs() {
  auto params = reference_params();
  params.market.spot = 0.0;
  assert_rejected("zero spot", params, "spot");

  params = reference_params();
  params.market.strike = -5.0;
  assert_rejected("negative strike", params, "strike");

  params = reference_params();
  params.market.maturity = 0.0;
  assert_rejected("zero maturity", params, "maturity");

  params = reference_params();
  params.steps = 0;
  assert_rejected("zero steps", params, "steps");

  params = reference_params();
  params.down = 0.0;
  assert_rejected("zero down factor", params, "factors must be positive");

  params = reference_params();
  params.up = 0.9;
  params.down = 1.1;
  assert_rejected("down above up", params, "up factor must exceed down factor");

  // exp(0.05 * 1 / 1) ~ 1.0513
  params = reference_params();
  params.steps = 1;
  params.up = 1.2;
  params.down = 1.06;
  assert_rejected("down above growth", params, "arbitrage");

  params = reference_params();
  params.up = 1.02;
  params.down = 0.9;
  params.market.rate = 0.3;
  assert_rejected("up below growth", params, "risk-neutral probability out of bounds");

  params = reference_params();
  params.kind = static_cast<pricer::OptionKind>(3);
  assert_rejected("unknown kind", params, "option kind");

  const double nan = std::numeric_limits<double>::quiet_NaN();
  params = reference_params();
  params.market.spot = nan;
  assert_rejected("NaN spot", params, "spot");

  params = reference_params();
  params.market.strike = nan;
  assert_rejected("NaN strike", params, "strike");

  params = reference_params();
  params.market.maturity = std::numeric_limits<double>::infinity();
  assert_rejected("infinite maturity", params, "maturity");

  params = reference_params();
  params.market.rate = nan;
  assert_rejected("NaN rate", params, "rate");

  params = reference_params();
  params.up = nan;
  assert_rejected("NaN up factor", params, "factors must be positive");

  // Checks run in order, so the first failing quantity is reported.
  params = reference_params();
  params.market.spot = -1.0;
  params.steps = 0;
  assert_rejected("first failure wins", params, "spot");

  bool threw = false;
  try {
    pricer::crr_factors(0.0, 1.0, 10);
  } catch (const pricer::InvalidArgument&) {
    threw = true;
  }
  assert_condition(threw, "crr calibration should reject zero volatility");

  threw = false;
  try {
    pricer::crr_factors(nan, 1.0, 10);
  } catch (const pricer::InvalidArgument&) {
    threw = true;
  }
  assert_condition(threw, "crr calibration should reject NaN volatility");
}

}  // namespace

int main() {
  reference_scenario();
  one_step_matches_closed_form();
  american_dominates_european();
  converges_to_black_scholes();
  rejects_invalid_inputs();
  return EXIT_SUCCESS;
}
