#include "context.hpp"

#include "runtime/basic_types.hpp"
#include "runtime/records.hpp"

namespace isomer {

context::context()
  : context{runtime_config{}}
{ }

context::context(runtime_config cfg)
  : config{std::move(cfg)}
{
  init();
}

context::~context() = default;

void
context::init() {
  if (!config.diagnostics)
    config.diagnostics = std::make_unique<null_diagnostic_sink>();

  constants = std::make_unique<struct constants>();
  constants->null = make<null_type>(*this);
  constants->undefined = make<undefined_type>(*this);
  constants->t = make<boolean>(*this, true);
  constants->f = make<boolean>(*this, false);
  constants->default_record_type = make<record_type>(*this, "Object");

  add_native_container_kinds(container_kinds_);
}

ptr<symbol>
context::intern(std::string const& s) {
  auto interned = interned_symbols_.find(s);
  if (interned != interned_symbols_.end())
    return interned->second;

  auto result = make<symbol>(*this, s);
  interned_symbols_.emplace(s, result);
  return result;
}

bool
deprecated(context& ctx, std::string const& message) {
  return ctx.diagnostics().show("Deprecated: " + message);
}

} // namespace isomer
