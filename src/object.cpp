#include "object.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace isomer {

static word_type
append_type(type_vector& ts, type_descriptor d) {
  if (ts.size >= max_types)
    throw std::range_error{fmt::format(
      "Cannot register {}: all {} type slots are taken", d.name, max_types
    )};

  ts.types[ts.size] = d;
  return ts.size++;
}

static word_type
place_type(type_vector& ts, type_descriptor d, word_type index) {
  // Index 0 is the invalid type.
  if (index == invalid_type || index >= first_dynamic_type_index)
    throw std::out_of_range{fmt::format(
      "Static type index {} of {} is outside of [1, {})",
      index, d.name, first_dynamic_type_index
    )};

  if (ts.types[index].destroy)
    throw std::logic_error{fmt::format(
      "Static type index {} is claimed by both {} and {}",
      index, ts.types[index].name, d.name
    )};

  ts.types[index] = d;
  return index;
}

word_type
new_type(type_descriptor d, std::optional<word_type> index) {
  if (!d.destroy)
    throw std::invalid_argument{fmt::format("Type {} has no destructor", d.name)};

  type_vector& ts = types();
  if (index)
    return place_type(ts, d, *index);
  else
    return append_type(ts, d);
}

std::string
object_type_name(ptr<> o) {
  if (!o)
    return "isomer::undefined";
  else
    return type_name(object_type_index(o));
}

} // namespace isomer
