#include "fsn/filter/glob.h"

#include <cstddef>
#include <optional>

namespace fsn::filter {
namespace {

constexpr char kSeparator = '/';

// Index one past the closing ']' of the class opened at open, or npos when
// the class is unterminated. A ']' directly after '[', '[!' or '[^' is a
// literal member.
std::size_t FindClassEnd(std::string_view pattern, std::size_t open) {
  std::size_t j = open + 1;
  if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
    ++j;
  }
  bool first = true;
  while (j < pattern.size()) {
    char c = pattern[j];
    if (c == ']' && !first) {
      return j + 1;
    }
    if (c == '\\' && j + 1 < pattern.size()) {
      ++j;
    }
    first = false;
    ++j;
  }
  return std::string_view::npos;
}

std::optional<bool> MatchClass(std::string_view pattern, std::size_t open, char ch,
                               std::size_t& next) {
  const std::size_t end = FindClassEnd(pattern, open);
  if (end == std::string_view::npos) {
    return std::nullopt;
  }
  std::size_t j = open + 1;
  bool negate = false;
  if (pattern[j] == '!' || pattern[j] == '^') {
    negate = true;
    ++j;
  }
  bool matched = false;
  const std::size_t last = end - 1;  // the closing ']'
  while (j < last) {
    char lo = pattern[j];
    if (lo == '\\' && j + 1 < last) {
      lo = pattern[++j];
    }
    char hi = lo;
    if (j + 2 < last && pattern[j + 1] == '-') {
      j += 2;
      hi = pattern[j];
      if (hi == '\\' && j + 1 < last) {
        hi = pattern[++j];
      }
    }
    const auto uc = static_cast<unsigned char>(ch);
    if (static_cast<unsigned char>(lo) <= uc && uc <= static_cast<unsigned char>(hi)) {
      matched = true;
    }
    ++j;
  }
  next = end;
  return matched != negate;
}

}  // namespace

bool GlobMatch(std::string_view pattern, std::string_view name) {
  std::size_t p = 0;
  std::size_t n = 0;
  std::size_t star_p = std::string_view::npos;
  std::size_t star_n = 0;

  while (n < name.size()) {
    if (p < pattern.size()) {
      const char pc = pattern[p];
      if (pc == '*') {
        star_p = ++p;
        star_n = n;
        continue;
      }
      if (pc == '?') {
        if (name[n] != kSeparator) {
          ++p;
          ++n;
          continue;
        }
      } else if (pc == '[') {
        std::size_t next = 0;
        auto member = MatchClass(pattern, p, name[n], next);
        if (member.has_value()) {
          if (*member && name[n] != kSeparator) {
            p = next;
            ++n;
            continue;
          }
        } else if (name[n] == '[') {
          ++p;
          ++n;
          continue;
        }
      } else if (pc == '\\' && p + 1 < pattern.size()) {
        if (pattern[p + 1] == name[n]) {
          p += 2;
          ++n;
          continue;
        }
      } else if (pc == name[n]) {
        ++p;
        ++n;
        continue;
      }
    }
    if (star_p != std::string_view::npos && name[star_n] != kSeparator) {
      p = star_p;
      n = ++star_n;
      continue;
    }
    return false;
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

std::string ValidateGlob(std::string_view pattern) {
  if (pattern.empty()) {
    return "empty pattern";
  }
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == kSeparator) {
      return "pattern contains a path separator";
    }
    if (c == '\\') {
      if (i + 1 >= pattern.size()) {
        return "trailing escape";
      }
      ++i;
      continue;
    }
    if (c == '[') {
      const std::size_t end = FindClassEnd(pattern, i);
      if (end == std::string_view::npos) {
        return "unterminated character class";
      }
      i = end - 1;
    }
  }
  return {};
}

}  // namespace fsn::filter
