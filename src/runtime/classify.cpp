#include "runtime/classify.hpp"

#include "context.hpp"
#include "io/write.hpp"
#include "runtime/basic_types.hpp"
#include "runtime/container_kinds.hpp"
#include "runtime/error.hpp"
#include "runtime/records.hpp"
#include "util/object_conversions.hpp"

namespace isomer {

char const*
classification_name(classification c) {
  switch (c) {
  case classification::primitive:           return "primitive";
  case classification::null:                return "null";
  case classification::ordered_sequence:    return "ordered-sequence";
  case classification::key_value_container: return "key-value-container";
  case classification::plain_record:        return "plain-record";
  case classification::opaque:              return "opaque";
  }

  return "invalid";
}

bool
is_object(ptr<> x) {
  return x && object_category(x) == type_category::object;
}

bool
is_plain_record(context& ctx, ptr<> x) {
  if (auto r = match<record>(x))
    return !r->type() || r->type() == ctx.constants->default_record_type;
  else
    return false;
}

bool
is_sequence_like(context& ctx, ptr<> x) {
  return ctx.container_kinds().find_sequence_kind(x) != nullptr;
}

bool
is_map_like(context& ctx, ptr<> x) {
  return ctx.container_kinds().find_map_kind(x) != nullptr;
}

classification
classify(context& ctx, ptr<> x) {
  if (is_nullish(x))
    return classification::null;
  else if (!is_object(x))
    return classification::primitive;
  else if (is_sequence_like(ctx, x))
    return classification::ordered_sequence;
  else if (is_map_like(ctx, x))
    return classification::key_value_container;
  else if (is_plain_record(ctx, x))
    return classification::plain_record;
  else
    return classification::opaque;
}

static std::string
pair_key(context& ctx, sequence_kind const& kind, ptr<> sequence,
         std::size_t i) {
  ptr<> element = kind.ref(sequence, i);
  sequence_kind const* pair_kind = ctx.container_kinds().find_sequence_kind(element);
  if (!pair_kind || pair_kind->size(element) != 2)
    throw make_error<unsupported_shape_error>(
      "Cannot get keys from '{}': element {} is not a [key, value] pair",
      datum_to_string(ctx, sequence), datum_to_string(ctx, element)
    );

  ptr<> key = pair_kind->ref(element, 0);
  if (auto s = match<string>(key))
    return s->value();
  else
    throw make_error<unsupported_shape_error>(
      "Cannot get keys from '{}': key {} is not a string",
      datum_to_string(ctx, sequence), datum_to_string(ctx, key)
    );
}

std::vector<std::string>
map_keys(context& ctx, ptr<> x) {
  if (is_plain_record(ctx, x))
    return own_keys(x);

  if (sequence_kind const* seq = ctx.container_kinds().find_sequence_kind(x)) {
    std::vector<std::string> result;
    std::size_t size = seq->size(x);
    result.reserve(size);
    for (std::size_t i = 0; i < size; ++i)
      result.push_back(pair_key(ctx, *seq, x, i));
    return result;
  }

  if (map_kind const* map = ctx.container_kinds().find_map_kind(x))
    return map->keys(x);

  throw make_error<unsupported_shape_error>("Cannot get keys from '{}'",
                                            datum_to_string(ctx, x));
}

} // namespace isomer
