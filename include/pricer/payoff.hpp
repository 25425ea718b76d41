#pragma once

#include <functional>

namespace pricer {

enum class OptionKind {
  Call,
  Put,
};

// Payoff applied by the Monte Carlo pricer to each simulated terminal price.
using PayoffFunction = std::function<double(double)>;

// Exercise value of a vanilla option. Throws InvalidArgument for a kind
// outside {Call, Put}.
double payoff(double price, double strike, OptionKind kind);

PayoffFunction vanilla_payoff(double strike, OptionKind kind);

}  // namespace pricer
