#ifndef ISOMER_TYPE_INDEXES_HPP
#define ISOMER_TYPE_INDEXES_HPP

namespace isomer::type_indexes {

// Plain enum for implicit convertibility to word_type.
enum index {
  null = 1,
  undefined,
  boolean,
  number,
  string,
  symbol,
  procedure,
  vector,
  table,
  record_type,
  record,
};

} // namespace isomer::type_indexes

#endif
