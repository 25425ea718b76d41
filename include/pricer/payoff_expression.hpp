#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "pricer/payoff.hpp"

namespace pricer {

// Arithmetic payoff expression compiled from untrusted text.
//
// Only numeric literals, the variables S/spot (terminal price) and
// K/strike, the operators + - * / ^ ** with parentheses, the comparisons
// < <= > >= == != (yielding 1 or 0), the conditional "a if c else b", and
// the functions abs, exp, log, sqrt, max and min are accepted. Nothing in
// the expression can reach outside this evaluator. Source length and
// nesting depth are bounded.
class PayoffExpression {
 public:
  struct Node;

  // Throws InvalidArgument on empty or oversized input, excessive nesting,
  // syntax errors, or names outside the allow-list.
  static PayoffExpression compile(std::string_view source);

  // Throws InvalidArgument on division by zero or a function argument
  // outside its domain.
  double evaluate(double spot, double strike) const;

  const std::string& source() const { return source_; }

 private:
  PayoffExpression(std::string source, std::shared_ptr<const Node> root);

  std::string source_;
  std::shared_ptr<const Node> root_;
};

// Binds the strike and returns a functor of the terminal price.
PayoffFunction compile_payoff(std::string_view expression, double strike);

}  // namespace pricer
