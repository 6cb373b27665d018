#include "runtime/container_kinds.hpp"

#include <stdexcept>

namespace isomer {

void
container_kinds::add(std::unique_ptr<sequence_kind> kind) {
  if (!kind)
    throw std::invalid_argument{"Cannot register an empty sequence kind"};

  sequence_kinds_.push_back(std::move(kind));
}

void
container_kinds::add(std::unique_ptr<map_kind> kind) {
  if (!kind)
    throw std::invalid_argument{"Cannot register an empty map kind"};

  map_kinds_.push_back(std::move(kind));
}

sequence_kind const*
container_kinds::find_sequence_kind(ptr<> x) const {
  if (!x || object_category(x) != type_category::object)
    return nullptr;

  for (auto const& kind : sequence_kinds_)
    if (kind->recognizes(x))
      return kind.get();

  return nullptr;
}

map_kind const*
container_kinds::find_map_kind(ptr<> x) const {
  if (!x || object_category(x) != type_category::object)
    return nullptr;

  for (auto const& kind : map_kinds_)
    if (kind->recognizes(x))
      return kind.get();

  return nullptr;
}

} // namespace isomer
