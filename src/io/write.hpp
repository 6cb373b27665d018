#ifndef ISOMER_IO_WRITE_HPP
#define ISOMER_IO_WRITE_HPP

#include "object.hpp"

#include <string>

namespace isomer {

class context;

// Textual representation of a value for diagnostics and error messages.
// Containers nested deeper than max_write_depth are abbreviated to "...", so
// this terminates even for cyclic data.
std::string
datum_to_string(context&, ptr<>);

constexpr std::size_t max_write_depth = 16;

} // namespace isomer

#endif
