#ifndef ISOMER_RUNTIME_CAPABILITY_HPP
#define ISOMER_RUNTIME_CAPABILITY_HPP

#include "object.hpp"

#include <string>
#include <utility>

namespace isomer {

class context;
class record_type;

// Tests whether a value carries a capability marker: a hidden true field,
// usually inherited from the value's record type.
class capability_predicate {
public:
  explicit
  capability_predicate(std::string marker) : marker_{std::move(marker)} { }

  std::string const&
  marker() const { return marker_; }

  bool
  operator () (ptr<>) const;

private:
  std::string marker_;
};

// The marker name depends only on the kind name, so record types tagged with
// the same kind name independently are recognised by each other's predicates.
std::string
capability_marker_name(context&, std::string const& kind_name);

// Attach the kind's marker to the record type as a hidden read-only field, and
// return a predicate recognising its instances. Tagging a type that already
// carries the marker leaves it unchanged.
capability_predicate
make_capability_predicate(context&, std::string const& kind_name,
                          ptr<record_type> type);

} // namespace isomer

#endif
