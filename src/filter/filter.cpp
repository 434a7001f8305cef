#include "fsn/filter/filter.h"

#include <string>

#include "fsn/error.h"
#include "fsn/filter/glob.h"
#include "fsn/node/node.h"

namespace fsn::filter {
namespace {

[[noreturn]] void ThrowInvalidFilter(const std::string& detail) {
  throw Error{ErrorCode::kInvalidFilter, "Invalid filter: " + detail};
}

void ValidateMask(std::uint32_t bits, std::uint32_t allowed, const char* what) {
  if (bits == 0) {
    ThrowInvalidFilter(std::string(what) + " mask is empty");
  }
  if ((bits & ~allowed) != 0) {
    ThrowInvalidFilter(std::string(what) + " mask has unknown bits " +
                       std::to_string(bits & ~allowed));
  }
}

}  // namespace

Evaluator Compile(const std::vector<FilterSpec>& specs, char hidden_marker) {
  Evaluator evaluator;
  evaluator.hidden_marker_ = hidden_marker;
  for (const auto& spec : specs) {
    if (const auto* type = std::get_if<TypeMask>(&spec)) {
      ValidateMask(type->bits, kTypeAll, "type");
      evaluator.type_bits_ = evaluator.type_bits_.value_or(0) | type->bits;
    } else if (const auto* visibility = std::get_if<VisibilityMask>(&spec)) {
      ValidateMask(visibility->bits, kVisibilityAll, "visibility");
      evaluator.visibility_bits_ = evaluator.visibility_bits_.value_or(0) | visibility->bits;
    } else if (const auto* glob = std::get_if<GlobPattern>(&spec)) {
      auto problem = ValidateGlob(glob->pattern);
      if (!problem.empty()) {
        ThrowInvalidFilter("glob '" + glob->pattern + "': " + problem);
      }
      evaluator.globs_.push_back(glob->pattern);
    } else if (const auto* predicate = std::get_if<Predicate>(&spec)) {
      if (!predicate->test) {
        ThrowInvalidFilter("predicate has no callable");
      }
      evaluator.predicates_.push_back(predicate->test);
    } else if (const auto* recursive = std::get_if<Recursive>(&spec)) {
      evaluator.recursive_ = recursive->enabled;  // last one wins
    }
  }
  return evaluator;
}

bool Evaluator::Accepts(const node::Node& node) const {
  if (AcceptsEverything()) {
    return true;
  }
  // Only the type stage needs a stat.
  return Accepts(node, type_bits_ ? node.Type() : node::NodeType::kUnknown);
}

bool Evaluator::Accepts(const node::Node& node, node::NodeType type) const {
  if (!MatchesType(type)) {
    return false;
  }
  if (!MatchesName(node)) {
    return false;
  }
  for (const auto& predicate : predicates_) {
    if (!predicate(node)) {
      return false;
    }
  }
  return true;
}

bool Evaluator::RecursesInto(const node::Node& node) const {
  return recursive_ && node.ResolvesToDirectory();
}

bool Evaluator::MatchesType(node::NodeType type) const {
  if (!type_bits_) {
    return true;
  }
  const std::uint32_t bits = *type_bits_;
  if ((bits & kTypeOpaque) != 0 && type != node::NodeType::kLink) {
    return true;
  }
  switch (type) {
  case node::NodeType::kFile:
    return (bits & kTypeFile) != 0;
  case node::NodeType::kDirectory:
    return (bits & kTypeDirectory) != 0;
  case node::NodeType::kLink:
    return (bits & kTypeLink) != 0;
  case node::NodeType::kUnknown:
    return false;
  }
  return false;
}

bool Evaluator::MatchesName(const node::Node& node) const {
  if (!visibility_bits_ && globs_.empty()) {
    return true;
  }
  const std::string name = node.Basename();
  if (visibility_bits_) {
    const bool hidden = !name.empty() && name.front() == hidden_marker_;
    const std::uint32_t wanted = hidden ? kHidden : kVisible;
    if ((*visibility_bits_ & wanted) == 0) {
      return false;
    }
  }
  if (globs_.empty()) {
    return true;
  }
  for (const auto& pattern : globs_) {
    if (GlobMatch(pattern, name)) {
      return true;
    }
  }
  return false;
}

}  // namespace fsn::filter
