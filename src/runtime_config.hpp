#ifndef ISOMER_RUNTIME_CONFIG_HPP
#define ISOMER_RUNTIME_CONFIG_HPP

#include <memory>
#include <string>
#include <unordered_set>
#include <utility>

namespace isomer {

// Receives warnings produced by the runtime. Each distinct message is output at
// most once per sink.
class diagnostic_sink {
public:
  virtual
  ~diagnostic_sink() = default;

  // Returns true if the message was output now, false if it had already been
  // output before.
  bool
  show(std::string const& message);

private:
  std::unordered_set<std::string> emitted_messages_;

  virtual void
  output(std::string const&) = 0;
};

class null_diagnostic_sink final : public diagnostic_sink {
  void
  output(std::string const&) override { }
};

class stderr_diagnostic_sink final : public diagnostic_sink {
  void
  output(std::string const&) override;
};

class delegate_diagnostic_sink final : public diagnostic_sink {
public:
  explicit
  delegate_diagnostic_sink(diagnostic_sink& other);

private:
  diagnostic_sink& target_;

  void
  output(std::string const& msg) override;
};

// What to do when a key of one key/value container is missing from the other
// one during structural comparison.
enum class map_key_policy {
  require_presence, // The containers are unequal.
  lookup            // The missing value reads as undefined.
};

struct runtime_config {
  map_key_policy                   map_keys = map_key_policy::require_presence;
  std::string                      marker_prefix = "isIsomer";
  std::unique_ptr<diagnostic_sink> diagnostics;

  runtime_config();

  runtime_config(map_key_policy map_keys,
                 std::string marker_prefix,
                 std::unique_ptr<diagnostic_sink> diagnostics)
    : map_keys{map_keys}
    , marker_prefix{std::move(marker_prefix)}
    , diagnostics{std::move(diagnostics)}
  { }

  static runtime_config
  default_config(std::unique_ptr<diagnostic_sink>);

  static runtime_config
  compatibility_config(std::unique_ptr<diagnostic_sink>);
};

} // namespace isomer

#endif
