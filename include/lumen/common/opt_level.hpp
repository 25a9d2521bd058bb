#pragma once

#include <cstdint>

namespace lumen {

// Optimization level for lowered modules.
// kO0 still runs mem2reg so SSA-held locals end up in registers.
enum class OptLevel : uint8_t { kO0, kO1, kO2, kO3 };

}  // namespace lumen
