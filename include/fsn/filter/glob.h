#pragma once

#include <string>
#include <string_view>

namespace fsn::filter {

// Shell-glob matching of a single path segment, case-sensitive.
// Supports: * (any run of characters), ? (exactly one character),
//           [abc], [a-z], [!0-9] / [^0-9], and backslash escapes.
// Neither wildcard matches '/'.
bool GlobMatch(std::string_view pattern, std::string_view name);

// Returns an empty string when pattern is well formed, otherwise a
// description of the first problem (unterminated class, trailing escape,
// separator inside the pattern, empty pattern).
std::string ValidateGlob(std::string_view pattern);

}  // namespace fsn::filter
