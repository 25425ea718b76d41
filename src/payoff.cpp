#include "pricer/payoff.hpp"

#include <algorithm>

#include "pricer/errors.hpp"

namespace pricer {

double payoff(double price, double strike, OptionKind kind) {
  switch (kind) {
    case OptionKind::Call:
      return std::max(price - strike, 0.0);
    case OptionKind::Put:
      return std::max(strike - price, 0.0);
  }
  throw InvalidArgument("option kind must be call or put");
}

PayoffFunction vanilla_payoff(double strike, OptionKind kind) {
  if (kind != OptionKind::Call && kind != OptionKind::Put) {
    throw InvalidArgument("option kind must be call or put");
  }
  return [strike, kind](double terminal) { return payoff(terminal, strike, kind); };
}

}  // namespace pricer
