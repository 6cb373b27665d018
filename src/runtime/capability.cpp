#include "runtime/capability.hpp"

#include "context.hpp"
#include "runtime/basic_types.hpp"
#include "runtime/classify.hpp"
#include "runtime/records.hpp"
#include "util/object_conversions.hpp"

namespace isomer {

bool
capability_predicate::operator () (ptr<> x) const {
  if (!is_object(x))
    return false;

  auto value = match<boolean>(get_field(x, marker_));
  return value && value->value();
}

std::string
capability_marker_name(context& ctx, std::string const& kind_name) {
  return ctx.config.marker_prefix + kind_name;
}

capability_predicate
make_capability_predicate(context& ctx, std::string const& kind_name,
                          ptr<record_type> type) {
  std::string marker = capability_marker_name(ctx, kind_name);

  auto existing = match<boolean>(get_field(type, marker));
  if (!existing || !existing->value())
    hide_final(ctx, type, marker, ctx.constants->t);

  return capability_predicate{std::move(marker)};
}

} // namespace isomer
