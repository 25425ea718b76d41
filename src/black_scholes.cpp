#include "pricer/black_scholes.hpp"

#include <cmath>

#include "pricer/errors.hpp"

namespace {

constexpr double kSqrtTwo = 1.41421356237309504880;

double normal_cdf(double x) {
  return 0.5 * std::erfc(-x / kSqrtTwo);
}

}  // namespace

namespace pricer {

BlackScholesResult black_scholes(
  double spot,
  double strike,
  double maturity,
  double rate,
  double volatility,
  OptionKind kind) {
  if (!(std::isfinite(spot) && spot > 0.0)) {
    throw InvalidArgument("spot must be positive");
  }
  if (!(std::isfinite(strike) && strike > 0.0)) {
    throw InvalidArgument("strike must be positive");
  }
  if (!(std::isfinite(maturity) && maturity > 0.0)) {
    throw InvalidArgument("maturity must be positive");
  }
  if (!(std::isfinite(volatility) && volatility > 0.0)) {
    throw InvalidArgument("volatility must be positive");
  }
  if (!std::isfinite(rate)) {
    throw InvalidArgument("rate must be finite");
  }

  const double S = spot;
  const double K = strike;
  const double r = rate;
  const double sigma = volatility;
  const double T = maturity;

  const double sigmaSqT = sigma * std::sqrt(T);
  const double discount = std::exp(-r * T);
  const double d1 = (std::log(S / K) + (r + 0.5 * sigma * sigma) * T) / sigmaSqT;
  const double d2 = d1 - sigmaSqT;

  switch (kind) {
    case OptionKind::Call:
      return BlackScholesResult{
        .price = S * normal_cdf(d1) - K * discount * normal_cdf(d2),
        .delta = normal_cdf(d1),
      };
    case OptionKind::Put:
      return BlackScholesResult{
        .price = K * discount * normal_cdf(-d2) - S * normal_cdf(-d1),
        .delta = normal_cdf(d1) - 1.0,
      };
  }
  throw InvalidArgument("option kind must be call or put");
}

}  // namespace pricer
