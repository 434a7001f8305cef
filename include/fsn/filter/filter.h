#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "fsn/node/adapter.h"

namespace fsn::node {
class Node;
}  // namespace fsn::node

namespace fsn::filter {

// Type selection bits. kTypeOpaque selects every entry that is not a link.
inline constexpr std::uint32_t kTypeFile = 0x1;
inline constexpr std::uint32_t kTypeDirectory = 0x2;
inline constexpr std::uint32_t kTypeLink = 0x4;
inline constexpr std::uint32_t kTypeOpaque = 0x8;
inline constexpr std::uint32_t kTypeAll = kTypeFile | kTypeDirectory | kTypeLink | kTypeOpaque;

inline constexpr std::uint32_t kHidden = 0x1;
inline constexpr std::uint32_t kVisible = 0x2;
inline constexpr std::uint32_t kVisibilityAll = kHidden | kVisible;

struct TypeMask {
  std::uint32_t bits{0};
};

struct VisibilityMask {
  std::uint32_t bits{0};
};

struct GlobPattern {
  std::string pattern;
};

struct Predicate {
  std::function<bool(const node::Node&)> test;
};

struct Recursive {
  bool enabled{true};
};

using FilterSpec = std::variant<TypeMask, VisibilityMask, GlobPattern, Predicate, Recursive>;

class Evaluator;

// Throws Error(kInvalidFilter) for empty or out-of-range masks, malformed
// globs and empty predicates.
Evaluator Compile(const std::vector<FilterSpec>& specs, char hidden_marker = '.');

// Compiled form of a filter specification list.
//
// Specs of the same declarative category (type, visibility, glob) are OR'd
// together; categories are AND'd; every predicate is its own required
// condition. Recursion is a traversal switch, not an acceptance criterion.
class Evaluator {
 public:
  Evaluator() = default;

  [[nodiscard]] bool Accepts(const node::Node& node) const;
  // Same decision with the node type already known, as during traversal
  // where the directory enumeration supplied a type hint.
  [[nodiscard]] bool Accepts(const node::Node& node, node::NodeType type) const;
  [[nodiscard]] bool RecursesInto(const node::Node& node) const;

  [[nodiscard]] bool IsRecursive() const noexcept { return recursive_; }
  [[nodiscard]] bool AcceptsEverything() const noexcept {
    return !type_bits_ && !visibility_bits_ && globs_.empty() && predicates_.empty();
  }

 private:
  friend Evaluator Compile(const std::vector<FilterSpec>& specs, char hidden_marker);

  [[nodiscard]] bool MatchesType(node::NodeType type) const;
  [[nodiscard]] bool MatchesName(const node::Node& node) const;

  std::optional<std::uint32_t> type_bits_;
  std::optional<std::uint32_t> visibility_bits_;
  std::vector<std::string> globs_;
  std::vector<std::function<bool(const node::Node&)>> predicates_;
  bool recursive_{false};
  char hidden_marker_{'.'};
};

}  // namespace fsn::filter
