#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "rowan/reflect/value.hpp"

namespace rowan::reflect {

// Limits applied when rendering arguments into display names.
inline constexpr size_t kMaxFormatDepth = 3;
inline constexpr size_t kMaxFormatItems = 5;
inline constexpr size_t kMaxFormatStringLength = 50;

// Renders a value the way it appears in a theory display name:
//   42, 1.5, true, null, "text", [1, 2, 3], (1, "a")
// Strings are escaped and truncated, long arrays elided with "...".
// Lazy values (sequences, deferred values) and objects render as their type
// name; they are never enumerated for display.
auto FormatArgument(const Value& value) -> std::string;

// Escapes a string for display inside double quotes.
auto EscapeString(std::string_view text) -> std::string;

}  // namespace rowan::reflect
