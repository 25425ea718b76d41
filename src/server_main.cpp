#include <cstdlib>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "pricer/config.hpp"
#include "pricer/errors.hpp"
#include "pricer/grpc_service.hpp"

int main(int argc, char** argv) {
  pricer::ServiceConfig config;
  try {
    config = pricer::parse_service_config(argc, argv);
  } catch (const pricer::InvalidArgument& error) {
    std::cerr << "pricer_server: " << error.what() << '\n'
              << "usage: pricer_server [address] [--address host:port]"
                 " [--max-lattice-steps N] [--max-simulation-work N]\n";
    return EXIT_FAILURE;
  }

  pricer::PricerGrpcService service(config);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "Failed to start gRPC server on " << config.address << '\n';
    return EXIT_FAILURE;
  }

  std::cout << "pricer gRPC server listening on " << config.address
            << " (max lattice steps " << config.max_lattice_steps
            << ", max simulation work " << config.max_simulation_work << ")" << std::endl;
  server->Wait();
  return EXIT_SUCCESS;
}
