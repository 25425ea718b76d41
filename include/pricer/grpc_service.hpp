#pragma once

#include <grpcpp/grpcpp.h>

#include "pricer.grpc.pb.h"

#include "pricer/black_scholes.hpp"
#include "pricer/config.hpp"
#include "pricer/lattice.hpp"
#include "pricer/monte_carlo.hpp"

namespace pricer {

inline constexpr int kDefaultLatticeSteps = 100;
inline constexpr int kDefaultSimulationSteps = 252;
inline constexpr int kDefaultSimulationPaths = 10'000;
inline constexpr const char* kDefaultPayoffExpression = "max(S - K, 0)";

OptionKind kind_from_proto(pricer::rpc::OptionKind proto);

LatticeParameters lattice_from_proto(const pricer::rpc::LatticeRequest& proto);

SimulationParameters simulation_from_proto(const pricer::rpc::MonteCarloRequest& proto);

class PricerGrpcService final : public pricer::rpc::PricerService::Service {
 public:
  explicit PricerGrpcService(ServiceConfig config);
  ~PricerGrpcService() override = default;

  grpc::Status Lattice(
    grpc::ServerContext* context,
    const pricer::rpc::LatticeRequest* request,
    pricer::rpc::LatticeResponse* response) override;

  grpc::Status MonteCarlo(
    grpc::ServerContext* context,
    const pricer::rpc::MonteCarloRequest* request,
    pricer::rpc::MonteCarloResponse* response) override;

  grpc::Status BlackScholes(
    grpc::ServerContext* context,
    const pricer::rpc::BlackScholesRequest* request,
    pricer::rpc::BlackScholesResponse* response) override;

 private:
  const ServiceConfig config_;
};

}  // namespace pricer
