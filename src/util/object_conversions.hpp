#ifndef ISOMER_UTIL_OBJECT_CONVERSIONS_HPP
#define ISOMER_UTIL_OBJECT_CONVERSIONS_HPP

#include "object.hpp"
#include "runtime/error.hpp"


namespace isomer {

// Expect an object to be of given type and return the apropriate typed pointer
// to the object. Throws type_error if the object isn't of the required type.
template <typename T>
ptr<T>
expect(ptr<> x) {
  if (is<T>(x))
    return ptr_cast<T>(x);
  else
    throw make_type_error<T>(x);
}

// Assert that an object is of a given type and return the appropriate typed
// pointer. It is undefined behaviour if the actual type doesn't match the
// specified type.
template <typename T>
ptr<T>
assume(ptr<> x) {
  assert(!x || is<T>(x));
  return ptr_cast<T>(x);
}

// If an object is of the given type, return the typed pointer to it; otherwise,
// return null.
template <typename T>
ptr<T>
match(ptr<> x) {
  if (is<T>(x))
    return ptr_cast<T>(x);
  else
    return {};
}

} // namespace isomer

#endif
