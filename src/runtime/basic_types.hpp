#ifndef ISOMER_RUNTIME_BASIC_TYPES_HPP
#define ISOMER_RUNTIME_BASIC_TYPES_HPP

#include "context.hpp"
#include "object.hpp"
#include "type_indexes.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace isomer {

class container_kinds;

// The null value. There should only be exactly one instance of this type per
// context.
class null_type : public leaf_object<null_type> {
public:
  static constexpr char const* runtime_name = "isomer::null";
  static constexpr word_type static_type_index = type_indexes::null;
};

// The undefined value. Like null_type, there should only be exactly one
// instance per context. An empty ptr<> is read as undefined too, which is what
// lookups of missing keys and fields return.
class undefined_type : public leaf_object<undefined_type> {
public:
  static constexpr char const* runtime_name = "isomer::undefined";
  static constexpr word_type static_type_index = type_indexes::undefined;
};

inline bool
is_undefined(ptr<> x) { return !x || is<undefined_type>(x); }

// Null or undefined.
inline bool
is_nullish(ptr<> x) { return is_undefined(x) || is<null_type>(x); }

// A boolean value.
class boolean : public leaf_object<boolean> {
public:
  static constexpr char const* runtime_name = "isomer::boolean";
  static constexpr word_type static_type_index = type_indexes::boolean;

  explicit
  boolean(bool value) : value_{value} { }

  bool
  value() const { return value_; }

private:
  bool value_;
};

inline ptr<boolean>
to_boolean(context& ctx, bool value) {
  return value ? ctx.constants->t : ctx.constants->f;
}

// A double-precision number. This is the only numeric type.
class number : public leaf_object<number> {
public:
  static constexpr char const* runtime_name = "isomer::number";
  static constexpr word_type static_type_index = type_indexes::number;

  explicit
  number(double value) : value_{value} { }

  double
  value() const { return value_; }

private:
  double value_;
};

inline ptr<number>
make_number(context& ctx, double value) {
  return make<number>(ctx, value);
}

class string : public leaf_object<string> {
public:
  static constexpr char const* runtime_name = "isomer::string";
  static constexpr word_type static_type_index = type_indexes::string;

  explicit
  string(std::string value) : value_{std::move(value)} { }

  std::string const&
  value() const { return value_; }

private:
  std::string value_;
};

inline ptr<string>
make_string(context& ctx, std::string value) {
  return make<string>(ctx, std::move(value));
}

// A unique token. Two symbols are the same only if they are the same object;
// context::intern gives the same symbol for the same description.
class symbol : public leaf_object<symbol> {
public:
  static constexpr char const* runtime_name = "isomer::symbol";
  static constexpr word_type static_type_index = type_indexes::symbol;

  explicit
  symbol(std::string description) : description_{std::move(description)} { }

  std::string const&
  description() const { return description_; }

private:
  std::string description_;
};

// A named native procedure. Procedures are callable: they classify as
// primitives and only compare by identity.
class procedure : public leaf_object<procedure> {
public:
  static constexpr char const* runtime_name = "isomer::procedure";
  static constexpr word_type static_type_index = type_indexes::procedure;
  static constexpr bool is_callable = true;

  explicit
  procedure(std::string name) : name_{std::move(name)} { }

  std::string const&
  name() const { return name_; }

private:
  std::string name_;
};

// Growable ordered sequence. This is the native ordered-sequence container.
class vector : public composite_object<vector> {
public:
  static constexpr char const* runtime_name = "isomer::vector";
  static constexpr word_type static_type_index = type_indexes::vector;

  vector() = default;

  explicit
  vector(std::vector<ptr<>> elements) : elements_{std::move(elements)} { }

  std::size_t
  size() const { return elements_.size(); }

  ptr<>
  ref(std::size_t) const;

  void
  set(std::size_t, ptr<>);

  void
  push_back(ptr<> value) { elements_.push_back(value); }

  std::vector<ptr<>> const&
  elements() const { return elements_; }

private:
  std::vector<ptr<>> elements_;
};

inline ptr<vector>
make_vector(context& ctx, std::vector<ptr<>> elements) {
  return make<vector>(ctx, std::move(elements));
}

// Key/value container keyed by strings, iterated in insertion order. This is
// the native key/value container.
class table : public composite_object<table> {
public:
  static constexpr char const* runtime_name = "isomer::table";
  static constexpr word_type static_type_index = type_indexes::table;

  using entry = std::pair<std::string, ptr<>>;

  table() = default;

  explicit
  table(std::vector<entry> const& entries);

  std::size_t
  size() const { return entries_.size(); }

  bool
  contains(std::string const& key) const { return index_.contains(key); }

  ptr<>
  get(std::string const& key) const;

  void
  set(std::string const& key, ptr<> value);

  // Returns whether the key was present.
  bool
  erase(std::string const& key);

  std::vector<std::string>
  keys() const;

  std::vector<entry> const&
  entries() const { return entries_; }

private:
  std::vector<entry>                           entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

inline ptr<table>
make_table(context& ctx, std::vector<table::entry> const& entries = {}) {
  return make<table>(ctx, entries);
}

// Register the native vector and table as the first sequence and map kinds.
void
add_native_container_kinds(container_kinds&);

} // namespace isomer

#endif
