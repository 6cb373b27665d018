#ifndef ISOMER_RUNTIME_RECORDS_HPP
#define ISOMER_RUNTIME_RECORDS_HPP

#include "object.hpp"
#include "type_indexes.hpp"

#include <string>
#include <utility>
#include <vector>

namespace isomer {

struct field {
  std::string name;
  ptr<>       value;
  bool        enumerable = true;
  bool        writable = true;
  bool        configurable = true;
};

// Fields of a record or record type in definition order. Visibility is a
// per-field attribute: only enumerable fields take part in key listing and
// structural comparison.
class field_table {
public:
  field*
  find(std::string const& name);

  field const*
  find(std::string const& name) const;

  // Add a new field, or replace the value and attributes of an existing one
  // while keeping its position.
  void
  define(field);

  std::vector<std::string>
  enumerable_names() const;

  std::vector<field> const&
  fields() const { return fields_; }

  bool
  extensible() const { return extensible_; }

  // Make every field read-only and non-configurable, and prevent extensions.
  void
  freeze();

private:
  std::vector<field> fields_;
  bool               extensible_ = true;
};

// A nominal kind of records. Its field table is shared by all instances: field
// lookups on an instance that miss the instance's own fields continue here.
class record_type : public composite_object<record_type> {
public:
  static constexpr char const* runtime_name = "isomer::record_type";
  static constexpr word_type static_type_index = type_indexes::record_type;
  static constexpr bool is_callable = true;

  explicit
  record_type(std::string name) : name_{std::move(name)} { }

  std::string const&
  name() const { return name_; }

  field_table&
  fields() { return fields_; }

  field_table const&
  fields() const { return fields_; }

private:
  std::string name_;
  field_table fields_;
};

// A record with named fields. A record with no type, or with the context's
// default record type, is a plain record.
class record : public composite_object<record> {
public:
  static constexpr char const* runtime_name = "isomer::record";
  static constexpr word_type static_type_index = type_indexes::record;

  explicit
  record(ptr<record_type> type) : type_{type} { }

  ptr<record_type>
  type() const { return type_; }

  field_table&
  fields() { return fields_; }

  field_table const&
  fields() const { return fields_; }

private:
  ptr<record_type> const type_;
  field_table            fields_;
};

using field_list = std::vector<std::pair<std::string, ptr<>>>;

// Plain record with the default record type.
ptr<record>
make_record(context&, field_list const& fields = {});

// Plain record with no type at all.
ptr<record>
make_bare_record(context&, field_list const& fields = {});

ptr<record>
make_instance(context&, ptr<record_type>, field_list const& fields = {});

ptr<record_type>
make_record_type(context&, std::string name);

// The record type whose fields back the value's own ones, if any.
ptr<record_type>
prototype_of(ptr<>);

// Own field first, then the prototype's. Returns undefined if neither has it.
ptr<>
get_field(ptr<>, std::string const& name);

// Assign a field the way an assignment expression would: an existing own
// field keeps its attributes, a new one is enumerable. Throws
// not_configurable_error for read-only fields and non-extensible targets.
void
set_field(context&, ptr<>, std::string const& name, ptr<> value);

bool
has_own_field(ptr<>, std::string const& name);

// Own field only, ignoring the prototype. Returns undefined if there is none.
ptr<>
get_own_field(ptr<>, std::string const& name);

// Own or prototype field, enumerable or not.
bool
has_field(ptr<>, std::string const& name);

void
define_field(context&, ptr<>, field);

// Make the field non-enumerable and writable, with the given value. A hidden
// field is invisible to own_keys and to structural comparison but can still be
// read and written by name.
void
hide(context&, ptr<>, std::string const& name, ptr<> value);

// Like hide, but the field is also read-only.
void
hide_final(context&, ptr<>, std::string const& name, ptr<> value);

// Hide each of the named fields, keeping their current values.
void
make_non_enumerable(context&, ptr<>, std::vector<std::string> const& names);

// A field is configurable if it doesn't exist yet, or if it is both
// configurable and writable.
bool
is_field_configurable(ptr<>, std::string const& name);

void
assert_field_configurable(context&, ptr<>, std::string const& name);

// Make all own fields read-only and non-configurable, and forbid new ones.
void
freeze(context&, ptr<>);

// Own enumerable keys in definition order. For vectors these are the indices.
// Values that can't have fields have no keys.
std::vector<std::string>
own_keys(ptr<>);

// Copy the own enumerable fields of each source onto target, later sources
// overwriting earlier ones. Returns target.
ptr<>
assign_fields(context&, ptr<> target, std::vector<ptr<>> const& sources);

} // namespace isomer

#endif
