#ifndef ISOMER_OBJECT_HPP
#define ISOMER_OBJECT_HPP

#include <fmt/format.h>

#include <array>
#include <cassert>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <new>
#include <optional>
#include <string>
#include <type_traits>

namespace isomer {

class context;

using word_type = std::uint64_t;

template <typename = void> class ptr;

constexpr std::size_t max_types = 256;
constexpr std::size_t first_dynamic_type_index = 64;

// object_storage<T> is standard-layout, and header is its first member. This
// means that an object_storage* and object_header* are
// pointer-interconvertible, and we can reinterpret_cast from one to the other.

using object_header = word_type;

// Object header layout:
//
// | type ... | 1
//
// The least significant bit is always 1 for a live object.

static constexpr word_type alive_mask = 0b1;
static constexpr word_type type_shift = 1;

inline word_type
header_type(object_header h) { return h >> type_shift; }

inline object_header
make_header(word_type type) {
  return (type << type_shift) | alive_mask;
}

static_assert(sizeof(object_header) == sizeof(word_type));

constexpr std::size_t object_alignment = sizeof(word_type);

template <typename T>
struct alignas(object_alignment) object_storage {
  object_header header;
  std::aligned_storage_t<sizeof(T), alignof(T)> payload_storage;

  T*
  object() {
    return std::launder(reinterpret_cast<T*>(&payload_storage));
  }

  T const*
  object() const {
    return std::launder(reinterpret_cast<T const*>(&payload_storage));
  }
};

template <typename T>
constexpr std::size_t payload_offset
  = offsetof(object_storage<T>, payload_storage);

template <typename T>
inline object_header*
object_header_address(T* o) {
  return reinterpret_cast<object_header*>(
    reinterpret_cast<std::byte*>(o) - payload_offset<T>
  );
}

// Non-owning pointer to a runtime object. ptr<> is a pointer to any object,
// ptr<T> is a pointer to an object of type T. An empty ptr<> stands for the
// undefined value.
template <>
class ptr<> {
public:
  ptr() = default;

  explicit
  ptr(object_header* header)
    : value_{header}
  { }

  ptr(auto* value) {
    if (value)
      value_ = object_header_address(value);
  }

  ptr(std::nullptr_t) { }

  explicit
  operator bool () const { return value_ != nullptr; }

  object_header*
  header() const { return value_; }

  friend auto
  operator <=> (ptr const&, ptr const&) = default;

protected:
  object_header* value_ = nullptr;
};

inline bool
operator == (ptr<> p, std::nullptr_t) {
  return p.header() == nullptr;
}

template <typename T>
class ptr : public ptr<> {
public:
  ptr() = default;

  explicit
  ptr(object_header* header) : ptr<>{header} { }

  ptr(T* value) : ptr<>(value) { }

  ptr(std::nullptr_t) { }

  T*
  operator -> () const { return value(); }

  T&
  operator * () const { return *value(); }

  T*
  value() const { return storage()->object(); }

  object_storage<T>*
  storage() const {
    return reinterpret_cast<object_storage<T>*>(value_);
  }
};

template <typename>
bool
is(ptr<>);

template <typename T>
ptr<T>
ptr_cast(ptr<> value) {
  assert(!value || is<T>(value));
  return ptr<T>{value.header()};
}

template <>
inline ptr<>
ptr_cast<void>(ptr<> value) { return value; }

template <typename T>
concept has_static_type_index = requires {
  { T::static_type_index } -> std::convertible_to<word_type>;
};

// What the runtime reports as the type of a value, mirroring the primitive tag
// of the host language: plain data, something invocable, or a structured
// object.
enum class type_category {
  primitive,
  callable,
  object
};

struct type_descriptor {
  char const*   name = "invalid";
  void          (*destroy)(object_header*) = nullptr;
  type_category category = type_category::primitive;
};

struct type_vector {
  std::array<type_descriptor, max_types> types;
  std::size_t                            size;
};

inline type_vector&
types() {
  static type_vector value{{}, first_dynamic_type_index};
  return value;
}

word_type
new_type(type_descriptor, std::optional<word_type> index);

constexpr word_type invalid_type = 0;

inline word_type
type_index(object_header const* h) { return header_type(*h); }

inline word_type
object_type_index(ptr<> o) { return type_index(o.header()); }

inline std::string
type_name(word_type index) { return types().types[index].name; }

inline type_descriptor const&
object_type(object_header const* h) { return types().types[header_type(*h)]; }

inline type_descriptor const&
object_type(ptr<> o) { return object_type(o.header()); }

inline type_category
object_category(ptr<> o) { return object_type(o).category; }

// Name of the value's runtime type. An empty pointer is undefined.
std::string
object_type_name(ptr<>);

template <typename T>
std::string
type_name() {
  return type_name(T::type_index);
}

// Is a given object an instance of the given runtime type?
template <has_static_type_index T>
bool
is(ptr<> x) {
  return x && object_type_index(x) == T::static_type_index;
}

template <typename T>
bool
is(ptr<> x) {
  return x && object_type_index(x) == T::type_index;
}

namespace detail {
  template <typename T>
  void
  destroy(object_header* h) {
    auto storage = reinterpret_cast<object_storage<T>*>(h);
    storage->object()->~T();
    delete storage;
  }

  template <has_static_type_index T>
  std::optional<word_type>
  get_type_index() { return T::static_type_index; }

  template <typename>
  std::optional<word_type>
  get_type_index() { return std::nullopt; }

  template <typename T>
  constexpr type_category
  get_category(type_category otherwise) {
    if constexpr (requires { T::is_callable; })
      return T::is_callable ? type_category::callable : otherwise;
    else
      return otherwise;
  }
}

// Object with no runtime subobjects. These are the primitive values.
template <typename Derived>
struct leaf_object {
  static word_type const type_index;
};

template <typename Derived>
word_type const leaf_object<Derived>::type_index = new_type(
  type_descriptor{
    Derived::runtime_name,
    detail::destroy<Derived>,
    detail::get_category<Derived>(type_category::primitive)
  },
  detail::get_type_index<Derived>()
);

// Object that refers to other runtime values.
template <typename Derived>
struct composite_object {
  static word_type const type_index;
};

template <typename Derived>
word_type const composite_object<Derived>::type_index = new_type(
  type_descriptor{
    Derived::runtime_name,
    detail::destroy<Derived>,
    detail::get_category<Derived>(type_category::object)
  },
  detail::get_type_index<Derived>()
);

} // namespace isomer

#endif
