#pragma once

#include <string>

#include "rowan/common/diagnostic.hpp"

namespace rowan::driver {

// "rowan: error: <message>" on stderr.
void PrintError(const std::string& message);
// Primary message followed by its notes.
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace rowan::driver
