#include <cstdlib>
#include <iomanip>
#include <iostream>

#include "pricer/errors.hpp"
#include "pricer/lattice.hpp"
#include "pricer/monte_carlo.hpp"
#include "pricer/payoff_expression.hpp"

// Runs a 3-step lattice example and a seeded Monte Carlo example. An optional
// first argument replaces the Monte Carlo payoff with an expression over S/K.
int main(int argc, char** argv) {
  constexpr double kSpot = 100.0;
  constexpr double kStrike = 100.0;

  try {
    const auto lattice = pricer::price_lattice(
      kSpot, kStrike, 1.0, 0.05, 1.1, 0.9, 3, pricer::OptionKind::Call, false);
    std::cout << std::fixed << std::setprecision(4)
              << "Lattice price: " << lattice.price << ", Delta: " << lattice.delta << '\n';

    const pricer::PayoffFunction payoff_fn = argc > 1
      ? pricer::compile_payoff(argv[1], kStrike)
      : pricer::vanilla_payoff(kStrike, pricer::OptionKind::Call);
    const auto mc = pricer::price_monte_carlo(kSpot, 1.0, 0.05, 0.2, 252, 10'000, payoff_fn, 42U);
    std::cout << "Monte Carlo price: " << mc.price
              << " (std error: " << mc.standard_error << ")" << std::endl;
  } catch (const pricer::InvalidArgument& error) {
    std::cerr << "pricer_cli: " << error.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
