#ifndef ISOMER_RUNTIME_CLASSIFY_HPP
#define ISOMER_RUNTIME_CLASSIFY_HPP

#include "object.hpp"

#include <string>
#include <vector>

namespace isomer {

class context;

enum class classification {
  primitive,
  null,
  ordered_sequence,
  key_value_container,
  plain_record,
  opaque
};

char const*
classification_name(classification);

// Is the value a structured object, as opposed to null, undefined, a primitive
// or something callable?
bool
is_object(ptr<>);

// A record with no type or with the context's default record type.
bool
is_plain_record(context&, ptr<>);

// Native vector or any value recognised by a registered sequence kind.
bool
is_sequence_like(context&, ptr<>);

// Native table or any value recognised by a registered map kind.
bool
is_map_like(context&, ptr<>);

// Decide which of the classifications the value matches. Sequence kinds are
// tried before map kinds, and both before the record checks.
classification
classify(context&, ptr<>);

// Canonical key list of a map-like value: the own enumerable keys of a plain
// record, the first elements of a sequence of [key, value] pairs, or the keys
// of a key/value container, each in the shape's own iteration order. Throws
// unsupported_shape_error for anything else.
std::vector<std::string>
map_keys(context&, ptr<>);

} // namespace isomer

#endif
