#pragma once

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/ir/function.hpp"

namespace lumen::driver {

// A function that applies one builtin to its parameters and returns the
// result: float f(float a0, ...). ldexp takes an int exponent.
// The host log builtin has no value and is rejected.
auto BuildCallFunction(builtins::BuiltinId id) -> Result<ir::Function>;

}  // namespace lumen::driver
