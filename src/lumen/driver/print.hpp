#pragma once

#include <string>

#include "lumen/common/diagnostic.hpp"

namespace lumen::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// Colored when stderr is a terminal.
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace lumen::driver
