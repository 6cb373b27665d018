#ifndef ISOMER_RUNTIME_ERROR_HPP
#define ISOMER_RUNTIME_ERROR_HPP

#include "object.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>
#include <utility>

namespace isomer {

template <typename>
class named_runtime_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template <typename Error = std::runtime_error, typename... Args>
Error
make_error(std::string_view fmt, Args&&... args) {
  return Error{fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...)};
}

// A value had a different runtime type than an operation requires.
using type_error = named_runtime_error<class type_error_tag>;

// A value isn't one of the map-like shapes keys can be extracted from.
using unsupported_shape_error
  = named_runtime_error<class unsupported_shape_error_tag>;

// A field can't be redefined or written because it is locked.
using not_configurable_error
  = named_runtime_error<class not_configurable_error_tag>;

template <typename Expected>
auto
make_type_error(ptr<> actual) {
  return make_error<type_error>("Invalid type: expected {}, got {}",
                                type_name<Expected>(),
                                object_type_name(actual));
}

} // namespace isomer

#endif
