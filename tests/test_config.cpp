#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "pricer/config.hpp"
#include "pricer/errors.hpp"

namespace {

void assert_condition(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << message << '\n';
    std::exit(EXIT_FAILURE);
  }
}

pricer::ServiceConfig parse(std::vector<const char*> args) {
  args.insert(args.begin(), "pricer_server");
  return pricer::parse_service_config(static_cast<int>(args.size()), args.data());
}

void assert_rejected(std::vector<const char*> args, const char* label) {
  try {
    parse(std::move(args));
  } catch (const pricer::InvalidArgument&) {
    return;
  }
  std::cerr << label << ": expected InvalidArgument\n";
  std::exit(EXIT_FAILURE);
}

}  // namespace

int main() {
  const auto defaults = parse({});
  assert_condition(defaults.address == "0.0.0.0:50061", "default address");
  assert_condition(defaults.max_lattice_steps == 10'000, "default lattice limit");
  assert_condition(defaults.max_simulation_work == 50'000'000, "default simulation limit");

  const auto positional = parse({"127.0.0.1:9000"});
  assert_condition(positional.address == "127.0.0.1:9000", "bare first argument sets the address");

  const auto flags = parse({"--address", "localhost:7000", "--max-lattice-steps=500", "--max-simulation-work", "1000"});
  assert_condition(flags.address == "localhost:7000", "--address value");
  assert_condition(flags.max_lattice_steps == 500, "--max-lattice-steps=value");
  assert_condition(flags.max_simulation_work == 1000, "--max-simulation-work value");

  assert_rejected({"--max-lattice-steps", "0"}, "zero limit");
  assert_rejected({"--max-lattice-steps=-4"}, "negative limit");
  assert_rejected({"--max-simulation-work", "lots"}, "non-numeric limit");
  assert_rejected({"--max-simulation-work=12abc"}, "trailing characters");
  assert_rejected({"--max-lattice-steps"}, "missing value");
  assert_rejected({"--verbose"}, "unknown flag");
  assert_rejected({"--address="}, "empty address");
  assert_rejected({"host:1", "host:2"}, "second bare argument");

  return EXIT_SUCCESS;
}
