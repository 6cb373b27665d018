#include "runtime/records.hpp"

#include "context.hpp"
#include "io/write.hpp"
#include "runtime/basic_types.hpp"
#include "runtime/error.hpp"
#include "util/object_conversions.hpp"

#include <algorithm>

namespace isomer {

field*
field_table::find(std::string const& name) {
  auto it = std::ranges::find(fields_, name, &field::name);
  return it != fields_.end() ? &*it : nullptr;
}

field const*
field_table::find(std::string const& name) const {
  auto it = std::ranges::find(fields_, name, &field::name);
  return it != fields_.end() ? &*it : nullptr;
}

void
field_table::define(field f) {
  if (field* existing = find(f.name))
    *existing = std::move(f);
  else
    fields_.push_back(std::move(f));
}

void
field_table::freeze() {
  for (field& f : fields_) {
    f.writable = false;
    f.configurable = false;
  }
  extensible_ = false;
}

std::vector<std::string>
field_table::enumerable_names() const {
  std::vector<std::string> result;
  for (field const& f : fields_)
    if (f.enumerable)
      result.push_back(f.name);
  return result;
}

static void
fill_fields(ptr<record> r, field_list const& fields) {
  for (auto const& [name, value] : fields)
    r->fields().define(field{name, value});
}

ptr<record>
make_record(context& ctx, field_list const& fields) {
  auto result = make<record>(ctx, ctx.constants->default_record_type);
  fill_fields(result, fields);
  return result;
}

ptr<record>
make_bare_record(context& ctx, field_list const& fields) {
  auto result = make<record>(ctx, ptr<record_type>{});
  fill_fields(result, fields);
  return result;
}

ptr<record>
make_instance(context& ctx, ptr<record_type> type, field_list const& fields) {
  auto result = make<record>(ctx, type);
  fill_fields(result, fields);
  return result;
}

ptr<record_type>
make_record_type(context& ctx, std::string name) {
  return make<record_type>(ctx, std::move(name));
}

static field_table*
own_fields(ptr<> x) {
  if (auto r = match<record>(x))
    return &r->fields();
  else if (auto t = match<record_type>(x))
    return &t->fields();
  else
    return nullptr;
}

static field_table&
expect_fields(context& ctx, ptr<> x) {
  if (field_table* fields = own_fields(x))
    return *fields;
  else
    throw make_error<type_error>("Cannot define fields on {}",
                                 datum_to_string(ctx, x));
}

ptr<record_type>
prototype_of(ptr<> x) {
  if (auto r = match<record>(x))
    return r->type();
  else
    return {};
}

static field const*
find_field(ptr<> x, std::string const& name) {
  if (field_table const* fields = own_fields(x))
    if (field const* f = fields->find(name))
      return f;

  if (auto proto = prototype_of(x))
    return proto->fields().find(name);

  return nullptr;
}

ptr<>
get_field(ptr<> x, std::string const& name) {
  if (field const* f = find_field(x, name))
    return f->value;
  else
    return {};
}

void
set_field(context& ctx, ptr<> x, std::string const& name, ptr<> value) {
  field_table& fields = expect_fields(ctx, x);

  if (field* own = fields.find(name)) {
    if (!own->writable)
      throw make_error<not_configurable_error>(
        "Cannot assign to read-only field '{}' of {}",
        name, datum_to_string(ctx, x)
      );

    own->value = value;
    return;
  }

  if (auto proto = prototype_of(x))
    if (field const* inherited = proto->fields().find(name))
      if (!inherited->writable)
        throw make_error<not_configurable_error>(
          "Cannot assign to read-only field '{}' of {}",
          name, datum_to_string(ctx, x)
        );

  if (!fields.extensible())
    throw make_error<not_configurable_error>(
      "Cannot add field '{}': {} is not extensible",
      name, datum_to_string(ctx, x)
    );

  fields.define(field{name, value});
}

bool
has_own_field(ptr<> x, std::string const& name) {
  if (field_table const* fields = own_fields(x))
    return fields->find(name) != nullptr;
  else
    return false;
}

ptr<>
get_own_field(ptr<> x, std::string const& name) {
  if (field_table const* fields = own_fields(x))
    if (field const* f = fields->find(name))
      return f->value;

  return {};
}

bool
has_field(ptr<> x, std::string const& name) {
  return find_field(x, name) != nullptr;
}

void
define_field(context& ctx, ptr<> x, field f) {
  field_table& fields = expect_fields(ctx, x);

  if (field const* existing = fields.find(f.name)) {
    if (!existing->configurable)
      throw make_error<not_configurable_error>(
        "Cannot redefine field '{}' of {}", f.name, datum_to_string(ctx, x)
      );
  } else if (!fields.extensible())
    throw make_error<not_configurable_error>(
      "Cannot add field '{}': {} is not extensible",
      f.name, datum_to_string(ctx, x)
    );

  fields.define(std::move(f));
}

void
hide(context& ctx, ptr<> x, std::string const& name, ptr<> value) {
  assert_field_configurable(ctx, x, name);
  define_field(ctx, x, field{name, value, false, true, true});
}

void
hide_final(context& ctx, ptr<> x, std::string const& name, ptr<> value) {
  assert_field_configurable(ctx, x, name);
  define_field(ctx, x, field{name, value, false, false, true});
}

void
make_non_enumerable(context& ctx, ptr<> x,
                    std::vector<std::string> const& names) {
  for (std::string const& name : names)
    hide(ctx, x, name, get_field(x, name));
}

bool
is_field_configurable(ptr<> x, std::string const& name) {
  if (field_table const* fields = own_fields(x))
    if (field const* f = fields->find(name))
      return f->configurable && f->writable;

  return true;
}

void
assert_field_configurable(context& ctx, ptr<> x, std::string const& name) {
  expect_fields(ctx, x);

  if (!is_field_configurable(x, name))
    throw make_error<not_configurable_error>(
      "Cannot hide field '{}' of {}: it is not configurable and writable",
      name, datum_to_string(ctx, x)
    );
}

void
freeze(context& ctx, ptr<> x) {
  expect_fields(ctx, x).freeze();
}

std::vector<std::string>
own_keys(ptr<> x) {
  if (field_table const* fields = own_fields(x))
    return fields->enumerable_names();

  if (auto v = match<vector>(x)) {
    std::vector<std::string> result;
    result.reserve(v->size());
    for (std::size_t i = 0; i < v->size(); ++i)
      result.push_back(std::to_string(i));
    return result;
  }

  return {};
}

static ptr<>
own_value(ptr<> x, std::string const& key) {
  if (auto v = match<vector>(x))
    return v->ref(std::stoul(key));
  else
    return get_field(x, key);
}

ptr<>
assign_fields(context& ctx, ptr<> target, std::vector<ptr<>> const& sources) {
  expect_fields(ctx, target);

  for (ptr<> source : sources)
    for (std::string const& key : own_keys(source))
      set_field(ctx, target, key, own_value(source, key));

  return target;
}

} // namespace isomer
