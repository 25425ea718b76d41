#include "pricer/grpc_service.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include <grpcpp/server_context.h>

#include "pricer/errors.hpp"
#include "pricer/payoff_expression.hpp"

namespace pricer {

namespace {

grpc::Status reject(const char* rpc, grpc::StatusCode code, const std::string& reason) {
  std::cerr << "[pricer] " << rpc << " rejected: " << reason << '\n';
  return grpc::Status(code, reason);
}

int count_or_default(const char* name, std::uint32_t requested, int fallback) {
  if (requested == 0U) {
    return fallback;
  }
  if (requested > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
    throw InvalidArgument(std::string(name) + " out of range");
  }
  return static_cast<int>(requested);
}

MarketParameters market_from_proto(const pricer::rpc::MarketSpecification& proto) {
  return MarketParameters{
    .spot = proto.spot(),
    .strike = proto.strike(),
    .maturity = proto.maturity(),
    .rate = proto.rate(),
  };
}

}  // namespace

OptionKind kind_from_proto(pricer::rpc::OptionKind proto) {
  switch (proto) {
    case pricer::rpc::OPTION_KIND_CALL:
      return OptionKind::Call;
    case pricer::rpc::OPTION_KIND_PUT:
      return OptionKind::Put;
    default:
      break;
  }
  throw InvalidArgument("option kind must be call or put");
}

LatticeParameters lattice_from_proto(const pricer::rpc::LatticeRequest& proto) {
  return LatticeParameters{
    .market = market_from_proto(proto.market()),
    .up = proto.up(),
    .down = proto.down(),
    .steps = count_or_default("steps", proto.steps(), kDefaultLatticeSteps),
    .kind = kind_from_proto(proto.kind()),
    .exercise = proto.american() ? ExerciseStyle::American : ExerciseStyle::European,
  };
}

SimulationParameters simulation_from_proto(const pricer::rpc::MonteCarloRequest& proto) {
  const double strike = proto.market().strike();
  PayoffFunction payoff_fn;
  switch (proto.payoff_case()) {
    case pricer::rpc::MonteCarloRequest::kVanilla:
      if (strike <= 0.0) {
        throw InvalidArgument("strike must be positive");
      }
      payoff_fn = vanilla_payoff(strike, kind_from_proto(proto.vanilla()));
      break;
    case pricer::rpc::MonteCarloRequest::kExpression:
      payoff_fn = compile_payoff(proto.expression(), strike);
      break;
    case pricer::rpc::MonteCarloRequest::PAYOFF_NOT_SET:
      payoff_fn = compile_payoff(kDefaultPayoffExpression, strike);
      break;
  }

  std::optional<std::uint64_t> seed;
  if (proto.has_seed()) {
    seed = proto.seed();
  }

  return SimulationParameters{
    .spot = proto.market().spot(),
    .maturity = proto.market().maturity(),
    .rate = proto.market().rate(),
    .volatility = proto.volatility(),
    .steps = count_or_default("steps", proto.steps(), kDefaultSimulationSteps),
    .paths = count_or_default("paths", proto.paths(), kDefaultSimulationPaths),
    .payoff = std::move(payoff_fn),
    .seed = seed,
  };
}

PricerGrpcService::PricerGrpcService(ServiceConfig config) : config_(std::move(config)) {}

grpc::Status PricerGrpcService::Lattice(
  grpc::ServerContext*,
  const pricer::rpc::LatticeRequest* request,
  pricer::rpc::LatticeResponse* response) {
  if (request == nullptr || response == nullptr) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "request/response must not be null");
  }
  const std::int64_t steps = request->steps() == 0U ? kDefaultLatticeSteps : request->steps();
  if (steps > config_.max_lattice_steps) {
    return reject("Lattice", grpc::StatusCode::RESOURCE_EXHAUSTED,
      "steps " + std::to_string(steps) + " exceed the limit of " + std::to_string(config_.max_lattice_steps));
  }
  try {
    const auto result = price_lattice(lattice_from_proto(*request));
    response->set_price(result.price);
    response->set_delta(result.delta);
  } catch (const InvalidArgument& error) {
    return reject("Lattice", grpc::StatusCode::INVALID_ARGUMENT, error.what());
  }
  return grpc::Status::OK;
}

grpc::Status PricerGrpcService::MonteCarlo(
  grpc::ServerContext*,
  const pricer::rpc::MonteCarloRequest* request,
  pricer::rpc::MonteCarloResponse* response) {
  if (request == nullptr || response == nullptr) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "request/response must not be null");
  }
  const std::int64_t steps = request->steps() == 0U ? kDefaultSimulationSteps : request->steps();
  const std::int64_t paths = request->paths() == 0U ? kDefaultSimulationPaths : request->paths();
  // Both factors are below 2^32, so the product fits.
  const std::int64_t work = steps * paths;
  if (work > config_.max_simulation_work) {
    return reject("MonteCarlo", grpc::StatusCode::RESOURCE_EXHAUSTED,
      "steps x paths " + std::to_string(work) + " exceed the limit of " +
      std::to_string(config_.max_simulation_work));
  }
  try {
    const auto result = price_monte_carlo(simulation_from_proto(*request));
    response->set_price(result.price);
    response->set_standard_error(result.standard_error);
  } catch (const InvalidArgument& error) {
    return reject("MonteCarlo", grpc::StatusCode::INVALID_ARGUMENT, error.what());
  }
  return grpc::Status::OK;
}

grpc::Status PricerGrpcService::BlackScholes(
  grpc::ServerContext*,
  const pricer::rpc::BlackScholesRequest* request,
  pricer::rpc::BlackScholesResponse* response) {
  if (request == nullptr || response == nullptr) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "request/response must not be null");
  }
  try {
    const auto& market = request->market();
    const auto result = black_scholes(
      market.spot(), market.strike(), market.maturity(), market.rate(),
      request->volatility(), kind_from_proto(request->kind()));
    response->set_price(result.price);
    response->set_delta(result.delta);
  } catch (const InvalidArgument& error) {
    return reject("BlackScholes", grpc::StatusCode::INVALID_ARGUMENT, error.what());
  }
  return grpc::Status::OK;
}

}  // namespace pricer
