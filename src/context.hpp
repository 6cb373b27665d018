#ifndef ISOMER_CONTEXT_HPP
#define ISOMER_CONTEXT_HPP

#include "memory/free_store.hpp"
#include "object.hpp"
#include "runtime/container_kinds.hpp"
#include "runtime_config.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace isomer {

class boolean;
class null_type;
class record_type;
class symbol;
class undefined_type;

// Runtime context. Owns every value created in it, the registered container
// kinds and the configuration the comparison primitives consult.
class context {
public:
  struct constants {
    ptr<isomer::null_type>      null;
    ptr<isomer::undefined_type> undefined;
    ptr<boolean>                t, f;     // true and false.
    ptr<record_type>            default_record_type;
  };

  free_store                 store;
  std::unique_ptr<constants> constants;
  runtime_config             config;

  context();

  explicit
  context(runtime_config);

  ~context();
  context(context const&) = delete;
  void
  operator = (context const&) = delete;

  // If the given string has been interned previously in the context, return the
  // pre-existing symbol. Otherwise, create a new symbol object and return
  // that. This means that two interned symbols can be compared for equality
  // using pointer comparison.
  ptr<symbol>
  intern(std::string const&);

  // Identifiers are unique within a context and strictly increasing, starting
  // at 1.
  std::uint64_t
  next_id() { return ++last_id_; }

  isomer::container_kinds&
  container_kinds() { return container_kinds_; }

  isomer::container_kinds const&
  container_kinds() const { return container_kinds_; }

  diagnostic_sink&
  diagnostics() { return *config.diagnostics; }

private:
  std::unordered_map<std::string, ptr<symbol>> interned_symbols_;
  isomer::container_kinds                      container_kinds_;
  std::uint64_t                                last_id_ = 0;

  void
  init();
};

// Create an instance of an object using the context's free store.
template <typename T, typename... Args>
ptr<T>
make(context& ctx, Args&&... args) {
  return ctx.store.make<T>(std::forward<Args>(args)...);
}

// Emit a deprecation warning through the context's diagnostics. Returns false if
// the same message has already been emitted before.
bool
deprecated(context&, std::string const& message);

} // namespace isomer

#endif
