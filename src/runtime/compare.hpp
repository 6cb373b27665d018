#ifndef ISOMER_RUNTIME_COMPARE_HPP
#define ISOMER_RUNTIME_COMPARE_HPP

#include "object.hpp"

namespace isomer {

class context;

// Identity comparison. Numbers, strings and booleans are the same if their
// values are; null is null and undefined is undefined. Everything else is only
// the same as itself. NaN isn't the same as anything.
bool
eqv(ptr<> x, ptr<> y);

bool
both_nan(ptr<> x, ptr<> y);

// Structural equality. Ordered sequences are compared element-wise, key/value
// containers by the values under each key, and records by their own enumerable
// fields; hidden and inherited fields don't take part. Containers of different shapes are never equal. NaN is equal to NaN.
//
// The comparison doesn't recurse; nesting depth is only limited by available
// memory. Cyclic data isn't supported and makes this loop forever.
bool
equal(context&, ptr<> x, ptr<> y);

} // namespace isomer

#endif
