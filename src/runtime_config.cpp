#include "runtime_config.hpp"

#include <fmt/format.h>

#include <cstdio>

namespace isomer {

bool
diagnostic_sink::show(std::string const& message) {
  if (emitted_messages_.contains(message))
    return false;

  output(message);
  emitted_messages_.emplace(message);
  return true;
}

void
stderr_diagnostic_sink::output(std::string const& message) {
  fmt::print(stderr, "[isomer] {}\n", message);
}

delegate_diagnostic_sink::delegate_diagnostic_sink(diagnostic_sink& other)
  : target_{other}
{ }

void
delegate_diagnostic_sink::output(std::string const& message) {
  target_.show(message);
}

runtime_config::runtime_config()
  : diagnostics{std::make_unique<stderr_diagnostic_sink>()}
{ }

runtime_config
runtime_config::default_config(std::unique_ptr<diagnostic_sink> diagnostics) {
  return runtime_config{map_key_policy::require_presence, "isIsomer",
                        std::move(diagnostics)};
}

runtime_config
runtime_config::compatibility_config(
  std::unique_ptr<diagnostic_sink> diagnostics
) {
  return runtime_config{map_key_policy::lookup, "isIsomer",
                        std::move(diagnostics)};
}

} // namespace isomer
