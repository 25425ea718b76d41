#pragma once

#include <cstdint>
#include <string>

namespace pricer {

struct ServiceConfig {
  std::string address = "0.0.0.0:50061";
  // Upper bound on lattice steps accepted by the service (cost is O(steps^2)).
  std::int64_t max_lattice_steps = 10'000;
  // Upper bound on Monte Carlo steps * paths accepted by the service.
  std::int64_t max_simulation_work = 50'000'000;
};

// Accepts --address, --max-lattice-steps and --max-simulation-work, each as
// "--flag value" or "--flag=value", or a bare first argument as the address.
// Throws InvalidArgument on unknown flags or malformed values.
ServiceConfig parse_service_config(int argc, const char* const* argv);

}  // namespace pricer
