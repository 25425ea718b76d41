#include "pricer/payoff_expression.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pricer/errors.hpp"

namespace pricer {

namespace {

enum class Function {
  Abs,
  Exp,
  Log,
  Sqrt,
  Max,
  Min,
};

enum class TokenType {
  Number,
  Identifier,
  Plus,
  Minus,
  Star,
  Slash,
  Caret,
  LeftParen,
  RightParen,
  Comma,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  Equal,
  NotEqual,
  End,
};

struct Token {
  TokenType type;
  std::string_view text;
  double number;
  std::size_t position;
};

struct FunctionSpec {
  std::string_view name;
  Function function;
  std::size_t min_args;
  std::size_t max_args;
};

constexpr std::size_t kVariadic = static_cast<std::size_t>(-1);

// Bounds on untrusted input: the tree is built and walked recursively.
constexpr std::size_t kMaxExpressionLength = 4096;
constexpr int kMaxNestingDepth = 256;

constexpr FunctionSpec kFunctions[] = {
  {"abs", Function::Abs, 1, 1},
  {"exp", Function::Exp, 1, 1},
  {"log", Function::Log, 1, 1},
  {"sqrt", Function::Sqrt, 1, 1},
  {"max", Function::Max, 2, kVariadic},
  {"min", Function::Min, 2, kVariadic},
};

std::string at(std::size_t position) {
  return " at position " + std::to_string(position);
}

std::vector<Token> tokenize(std::string_view source) {
  std::vector<Token> tokens;
  std::size_t i = 0;
  while (i < source.size()) {
    const char c = source[i];
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++i;
      continue;
    }
    const std::size_t start = i;
    if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.') {
      while (i < source.size() &&
             (std::isdigit(static_cast<unsigned char>(source[i])) != 0 || source[i] == '.')) {
        ++i;
      }
      if (i < source.size() && (source[i] == 'e' || source[i] == 'E')) {
        std::size_t j = i + 1;
        if (j < source.size() && (source[j] == '+' || source[j] == '-')) {
          ++j;
        }
        if (j < source.size() && std::isdigit(static_cast<unsigned char>(source[j])) != 0) {
          i = j;
          while (i < source.size() && std::isdigit(static_cast<unsigned char>(source[i])) != 0) {
            ++i;
          }
        }
      }
      const std::string literal(source.substr(start, i - start));
      char* end = nullptr;
      const double value = std::strtod(literal.c_str(), &end);
      if (end != literal.c_str() + literal.size()) {
        throw InvalidArgument("malformed number '" + literal + "'" + at(start));
      }
      tokens.push_back(Token{TokenType::Number, source.substr(start, i - start), value, start});
      continue;
    }
    if (std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_') {
      while (i < source.size() &&
             (std::isalnum(static_cast<unsigned char>(source[i])) != 0 || source[i] == '_')) {
        ++i;
      }
      tokens.push_back(Token{TokenType::Identifier, source.substr(start, i - start), 0.0, start});
      continue;
    }

    TokenType type = TokenType::End;
    std::size_t width = 1;
    switch (c) {
      case '+': type = TokenType::Plus; break;
      case '-': type = TokenType::Minus; break;
      case '/': type = TokenType::Slash; break;
      case '^': type = TokenType::Caret; break;
      case '(': type = TokenType::LeftParen; break;
      case ')': type = TokenType::RightParen; break;
      case ',': type = TokenType::Comma; break;
      case '<':
      case '>': {
        const bool or_equal = i + 1 < source.size() && source[i + 1] == '=';
        if (c == '<') {
          type = or_equal ? TokenType::LessEqual : TokenType::Less;
        } else {
          type = or_equal ? TokenType::GreaterEqual : TokenType::Greater;
        }
        width = or_equal ? 2 : 1;
        break;
      }
      case '=':
      case '!':
        if (i + 1 >= source.size() || source[i + 1] != '=') {
          throw InvalidArgument(std::string("unexpected character '") + c + "'" + at(start));
        }
        type = c == '=' ? TokenType::Equal : TokenType::NotEqual;
        width = 2;
        break;
      case '*':
        if (i + 1 < source.size() && source[i + 1] == '*') {
          type = TokenType::Caret;
          width = 2;
        } else {
          type = TokenType::Star;
        }
        break;
      default:
        throw InvalidArgument(std::string("unexpected character '") + c + "'" + at(start));
    }
    tokens.push_back(Token{type, source.substr(start, width), 0.0, start});
    i += width;
  }
  tokens.push_back(Token{TokenType::End, {}, 0.0, source.size()});
  return tokens;
}

}  // namespace

struct PayoffExpression::Node {
  enum class Kind {
    Number,
    Spot,
    Strike,
    Negate,
    Add,
    Subtract,
    Multiply,
    Divide,
    Power,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Equal,
    NotEqual,
    Conditional,
    Call,
  };

  Kind kind;
  double value = 0.0;
  Function function = Function::Abs;
  std::vector<std::unique_ptr<Node>> operands;
};

namespace {

using Node = PayoffExpression::Node;
using NodePtr = std::unique_ptr<Node>;

NodePtr make_leaf(Node::Kind kind, double value = 0.0) {
  auto node = std::make_unique<Node>();
  node->kind = kind;
  node->value = value;
  return node;
}

NodePtr make_node(Node::Kind kind, NodePtr lhs, NodePtr rhs = nullptr) {
  auto node = std::make_unique<Node>();
  node->kind = kind;
  node->operands.push_back(std::move(lhs));
  if (rhs) {
    node->operands.push_back(std::move(rhs));
  }
  return node;
}

// Recursive descent over:
//   expression := comparison ('if' comparison 'else' expression)?
//   comparison := sum (('<' | '<=' | '>' | '>=' | '==' | '!=') sum)?
//   sum        := term (('+' | '-') term)*
//   term       := unary (('*' | '/') unary)*
//   unary      := ('+' | '-') unary | power
//   power      := primary (('^' | '**') unary)?
//   primary    := number | variable | function '(' args ')' | '(' expression ')'
class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  NodePtr parse() {
    NodePtr root = expression();
    if (peek().type != TokenType::End) {
      throw InvalidArgument("unexpected '" + std::string(peek().text) + "'" + at(peek().position));
    }
    return root;
  }

 private:
  const Token& peek() const { return tokens_[index_]; }

  const Token& advance() { return tokens_[index_++]; }

  bool accept(TokenType type) {
    if (peek().type != type) {
      return false;
    }
    ++index_;
    return true;
  }

  void expect(TokenType type, const char* what) {
    if (!accept(type)) {
      throw InvalidArgument(std::string("expected ") + what + at(peek().position));
    }
  }

  // Counts active recursive productions; every cycle in the grammar passes
  // through expression() or unary().
  class DepthGuard {
   public:
    DepthGuard(int& depth, std::size_t position) : depth_(depth) {
      if (++depth_ > kMaxNestingDepth) {
        --depth_;
        throw InvalidArgument("payoff expression nested too deeply" + at(position));
      }
    }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    int& depth_;
  };

  bool accept_keyword(std::string_view keyword) {
    if (peek().type != TokenType::Identifier || peek().text != keyword) {
      return false;
    }
    ++index_;
    return true;
  }

  NodePtr expression() {
    const DepthGuard guard(depth_, peek().position);
    NodePtr value = comparison();
    if (!accept_keyword("if")) {
      return value;
    }
    NodePtr condition = comparison();
    if (!accept_keyword("else")) {
      throw InvalidArgument("expected 'else'" + at(peek().position));
    }
    auto node = std::make_unique<Node>();
    node->kind = Node::Kind::Conditional;
    node->operands.push_back(std::move(condition));
    node->operands.push_back(std::move(value));
    node->operands.push_back(expression());
    return node;
  }

  NodePtr comparison() {
    NodePtr lhs = sum();
    const auto kind = comparison_kind(peek().type);
    if (!kind) {
      return lhs;
    }
    advance();
    NodePtr result = make_node(*kind, std::move(lhs), sum());
    if (comparison_kind(peek().type)) {
      throw InvalidArgument("chained comparisons are not supported" + at(peek().position));
    }
    return result;
  }

  static std::optional<Node::Kind> comparison_kind(TokenType type) {
    switch (type) {
      case TokenType::Less: return Node::Kind::Less;
      case TokenType::LessEqual: return Node::Kind::LessEqual;
      case TokenType::Greater: return Node::Kind::Greater;
      case TokenType::GreaterEqual: return Node::Kind::GreaterEqual;
      case TokenType::Equal: return Node::Kind::Equal;
      case TokenType::NotEqual: return Node::Kind::NotEqual;
      default: return std::nullopt;
    }
  }

  NodePtr sum() {
    NodePtr lhs = term();
    for (;;) {
      if (accept(TokenType::Plus)) {
        lhs = make_node(Node::Kind::Add, std::move(lhs), term());
      } else if (accept(TokenType::Minus)) {
        lhs = make_node(Node::Kind::Subtract, std::move(lhs), term());
      } else {
        return lhs;
      }
    }
  }

  NodePtr term() {
    NodePtr lhs = unary();
    for (;;) {
      if (accept(TokenType::Star)) {
        lhs = make_node(Node::Kind::Multiply, std::move(lhs), unary());
      } else if (accept(TokenType::Slash)) {
        lhs = make_node(Node::Kind::Divide, std::move(lhs), unary());
      } else {
        return lhs;
      }
    }
  }

  NodePtr unary() {
    const DepthGuard guard(depth_, peek().position);
    if (accept(TokenType::Minus)) {
      return make_node(Node::Kind::Negate, unary());
    }
    if (accept(TokenType::Plus)) {
      return unary();
    }
    return power();
  }

  NodePtr power() {
    NodePtr base = primary();
    if (accept(TokenType::Caret)) {
      return make_node(Node::Kind::Power, std::move(base), unary());
    }
    return base;
  }

  NodePtr primary() {
    const Token& token = advance();
    switch (token.type) {
      case TokenType::Number:
        return make_leaf(Node::Kind::Number, token.number);
      case TokenType::LeftParen: {
        NodePtr inner = expression();
        expect(TokenType::RightParen, "')'");
        return inner;
      }
      case TokenType::Identifier:
        return identifier(token);
      case TokenType::End:
        throw InvalidArgument("unexpected end of expression" + at(token.position));
      default:
        throw InvalidArgument("unexpected '" + std::string(token.text) + "'" + at(token.position));
    }
  }

  NodePtr identifier(const Token& token) {
    if (peek().type != TokenType::LeftParen) {
      if (token.text == "S" || token.text == "spot") {
        return make_leaf(Node::Kind::Spot);
      }
      if (token.text == "K" || token.text == "strike") {
        return make_leaf(Node::Kind::Strike);
      }
      throw InvalidArgument("unknown name '" + std::string(token.text) + "'" + at(token.position));
    }

    const auto spec = std::find_if(std::begin(kFunctions), std::end(kFunctions),
      [&token](const FunctionSpec& candidate) { return candidate.name == token.text; });
    if (spec == std::end(kFunctions)) {
      throw InvalidArgument("unknown function '" + std::string(token.text) + "'" + at(token.position));
    }

    advance();
    auto call = std::make_unique<Node>();
    call->kind = Node::Kind::Call;
    call->function = spec->function;
    if (peek().type != TokenType::RightParen) {
      do {
        call->operands.push_back(expression());
      } while (accept(TokenType::Comma));
    }
    expect(TokenType::RightParen, "')'");

    const std::size_t count = call->operands.size();
    if (count < spec->min_args || count > spec->max_args) {
      throw InvalidArgument(
        std::string(spec->name) + "() takes " +
        (spec->max_args == kVariadic
           ? "at least " + std::to_string(spec->min_args)
           : std::to_string(spec->min_args)) +
        " argument(s), got " + std::to_string(count) + at(token.position));
    }
    return call;
  }

  std::vector<Token> tokens_;
  std::size_t index_ = 0;
  int depth_ = 0;
};

double evaluate_node(const Node& node, double spot, double strike) {
  const auto operand = [&](std::size_t i) { return evaluate_node(*node.operands[i], spot, strike); };

  switch (node.kind) {
    case Node::Kind::Number:
      return node.value;
    case Node::Kind::Spot:
      return spot;
    case Node::Kind::Strike:
      return strike;
    case Node::Kind::Negate:
      return -operand(0);
    case Node::Kind::Add:
      return operand(0) + operand(1);
    case Node::Kind::Subtract:
      return operand(0) - operand(1);
    case Node::Kind::Multiply:
      return operand(0) * operand(1);
    case Node::Kind::Divide: {
      const double denominator = operand(1);
      if (denominator == 0.0) {
        throw InvalidArgument("division by zero in payoff expression");
      }
      return operand(0) / denominator;
    }
    case Node::Kind::Power: {
      const double result = std::pow(operand(0), operand(1));
      if (!std::isfinite(result)) {
        throw InvalidArgument("power out of range in payoff expression");
      }
      return result;
    }
    case Node::Kind::Less:
      return operand(0) < operand(1) ? 1.0 : 0.0;
    case Node::Kind::LessEqual:
      return operand(0) <= operand(1) ? 1.0 : 0.0;
    case Node::Kind::Greater:
      return operand(0) > operand(1) ? 1.0 : 0.0;
    case Node::Kind::GreaterEqual:
      return operand(0) >= operand(1) ? 1.0 : 0.0;
    case Node::Kind::Equal:
      return operand(0) == operand(1) ? 1.0 : 0.0;
    case Node::Kind::NotEqual:
      return operand(0) != operand(1) ? 1.0 : 0.0;
    case Node::Kind::Conditional:
      // Only the selected branch is evaluated.
      return operand(0) != 0.0 ? operand(1) : operand(2);
    case Node::Kind::Call:
      break;
  }

  switch (node.function) {
    case Function::Abs:
      return std::abs(operand(0));
    case Function::Exp: {
      const double result = std::exp(operand(0));
      if (!std::isfinite(result)) {
        throw InvalidArgument("exp overflow in payoff expression");
      }
      return result;
    }
    case Function::Log: {
      const double x = operand(0);
      if (x <= 0.0) {
        throw InvalidArgument("log of a non-positive value in payoff expression");
      }
      return std::log(x);
    }
    case Function::Sqrt: {
      const double x = operand(0);
      if (x < 0.0) {
        throw InvalidArgument("sqrt of a negative value in payoff expression");
      }
      return std::sqrt(x);
    }
    case Function::Max:
    case Function::Min: {
      double result = operand(0);
      for (std::size_t i = 1; i < node.operands.size(); ++i) {
        const double x = operand(i);
        result = node.function == Function::Max ? std::max(result, x) : std::min(result, x);
      }
      return result;
    }
  }
  throw InvalidArgument("unsupported payoff expression node");
}

bool is_blank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
    [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace

PayoffExpression::PayoffExpression(std::string source, std::shared_ptr<const Node> root)
  : source_(std::move(source)), root_(std::move(root)) {}

PayoffExpression PayoffExpression::compile(std::string_view source) {
  if (is_blank(source)) {
    throw InvalidArgument("payoff expression cannot be empty");
  }
  if (source.size() > kMaxExpressionLength) {
    throw InvalidArgument(
      "payoff expression longer than " + std::to_string(kMaxExpressionLength) + " characters");
  }
  Parser parser(tokenize(source));
  std::shared_ptr<const Node> root = parser.parse();
  return PayoffExpression(std::string(source), std::move(root));
}

double PayoffExpression::evaluate(double spot, double strike) const {
  return evaluate_node(*root_, spot, strike);
}

PayoffFunction compile_payoff(std::string_view expression, double strike) {
  PayoffExpression compiled = PayoffExpression::compile(expression);
  return [compiled = std::move(compiled), strike](double terminal) {
    return compiled.evaluate(terminal, strike);
  };
}

}  // namespace pricer
