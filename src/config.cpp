#include "pricer/config.hpp"

#include <charconv>
#include <string_view>
#include <system_error>

#include "pricer/errors.hpp"

namespace pricer {

namespace {

std::int64_t parse_limit(std::string_view flag, std::string_view text) {
  std::int64_t value = 0;
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || value <= 0) {
    throw InvalidArgument(std::string(flag) + " expects a positive integer, got '" + std::string(text) + "'");
  }
  return value;
}

}  // namespace

ServiceConfig parse_service_config(int argc, const char* const* argv) {
  ServiceConfig config;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (i == 1 && !arg.starts_with("--")) {
      config.address = std::string(arg);
      continue;
    }

    std::string_view flag = arg;
    std::string_view value;
    bool has_value = false;
    if (const auto eq = arg.find('='); eq != std::string_view::npos) {
      flag = arg.substr(0, eq);
      value = arg.substr(eq + 1);
      has_value = true;
    }

    const bool known = flag == "--address" || flag == "--max-lattice-steps" || flag == "--max-simulation-work";
    if (!known) {
      throw InvalidArgument("unknown option '" + std::string(arg) + "'");
    }
    if (!has_value) {
      if (i + 1 >= argc) {
        throw InvalidArgument(std::string(flag) + " requires a value");
      }
      value = argv[++i];
    }

    if (flag == "--address") {
      if (value.empty()) {
        throw InvalidArgument("--address must not be empty");
      }
      config.address = std::string(value);
    } else if (flag == "--max-lattice-steps") {
      config.max_lattice_steps = parse_limit(flag, value);
    } else {
      config.max_simulation_work = parse_limit(flag, value);
    }
  }

  return config;
}

}  // namespace pricer
