#include <algorithm>
#include <memory>
#include <optional>
#include <unordered_set>
#include <utility>

#include "fsn/diag/event_bus.h"
#include "fsn/error.h"
#include "fsn/filter/filter.h"
#include "fsn/node/filesystem.h"
#include "fsn/node/node.h"
#include "node_internal.h"

namespace fsn::node {
namespace {

// Depth-first, pre-order walk. Adapter calls go to the resolved directory
// (real); the nodes handed back keep the path the caller asked through
// (logical). active holds the real path of every directory on the current
// descent chain.
class ListingWalk {
 public:
  ListingWalk(std::shared_ptr<detail::FilesystemCore> core, const filter::Evaluator& evaluator,
              std::vector<Node>& out)
      : core_(std::move(core)), evaluator_(evaluator), out_(out),
        links_(core_->adapter->Capabilities().Has(Capability::kLinks)) {}

  void Run(const Node& start, const path::Pathname& real) {
    active_.insert(real);
    Descend(start, real, 0);
  }

 private:
  std::vector<DirectoryEntry> Enumerate(const path::Pathname& real) {
    auto entries = detail::CallAdapter(real, [&]() { return core_->adapter->ReadDirectory(real); });
    if (core_->options.sort_listings) {
      std::sort(entries.begin(), entries.end(),
                [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
    }
    return entries;
  }

  // Real path of the directory a child leads to, nullopt for anything else.
  std::optional<path::Pathname> DirectoryTarget(const path::Pathname& child_real, NodeType type) {
    if (type == NodeType::kDirectory) {
      return child_real;
    }
    if (type != NodeType::kLink || !links_) {
      return std::nullopt;
    }
    auto resolved = detail::ResolveFinal(*core_, child_real);
    if (resolved.metadata && resolved.metadata->type == NodeType::kDirectory) {
      return resolved.pathname;
    }
    return std::nullopt;
  }

  void ReportCycle(const path::Pathname& child_logical, const path::Pathname& target) {
    if (core_->options.log_listing_cycles) {
      diag::Emit(diag::EventCategory::kTraversal, diag::EventSeverity::kWarning, "listing_cycle_detected",
                 "Recursive listing aborted on a link cycle",
                 {diag::EventField("path", child_logical.Canonical(), diag::FieldPrivacy::kHash),
                  diag::EventField("target", target.Canonical(), diag::FieldPrivacy::kHash)});
    }
    throw MakeError(ErrorCode::kCyclicStructure, child_logical.Canonical(),
                    "leads back to " + target.Canonical() + " which is already being listed");
  }

  void Descend(const Node& parent, const path::Pathname& real, std::size_t depth) {
    for (const auto& entry : Enumerate(real)) {
      Node child = parent.Child(entry.name);
      const auto& child_logical = child.Path();
      auto child_real = real.Child(entry.name);
      NodeType type = entry.type_hint;
      if (type == NodeType::kUnknown) {
        auto metadata = detail::StatAt(*core_, child_real);
        if (!metadata) {
          continue;  // vanished since enumeration
        }
        type = metadata->type;
      }

      if (evaluator_.Accepts(child, type)) {
        out_.push_back(child);
      }
      if (!evaluator_.IsRecursive()) {
        continue;
      }

      auto target = DirectoryTarget(child_real, type);
      if (!target) {
        continue;
      }
      if (active_.count(*target) != 0) {
        ReportCycle(child_logical, *target);
      }
      if (depth + 1 >= detail::kMaxTraversalDepth) {
        throw MakeError(ErrorCode::kCyclicStructure, child_logical.Canonical(),
                        "exceeds the maximum listing depth");
      }
      active_.insert(*target);
      try {
        Descend(child, *target, depth + 1);
      } catch (const Error& err) {
        if (err.code != ErrorCode::kNotFound || err.pathname != target->Canonical()) {
          throw;
        }
        // The directory disappeared between stat and enumeration.
      }
      active_.erase(*target);
    }
  }

  std::shared_ptr<detail::FilesystemCore> core_;
  const filter::Evaluator& evaluator_;
  std::vector<Node>& out_;
  bool links_;
  std::unordered_set<path::Pathname> active_;
};

}  // namespace

std::vector<Node> Node::Ls(const std::vector<filter::FilterSpec>& specs) const {
  auto core = Core();
  auto evaluator = filter::Compile(specs, core->options.conventions.hidden_marker);

  auto start = detail::ResolveFinal(*core, pathname_);
  if (!start.metadata) {
    throw MakeError(ErrorCode::kNotFound, pathname_.Canonical(), "does not exist");
  }
  if (start.metadata->type != NodeType::kDirectory) {
    throw MakeError(ErrorCode::kNotADirectory, pathname_.Canonical(), "is not a directory!");
  }

  std::vector<Node> result;
  ListingWalk walk(core, evaluator, result);
  walk.Run(*this, start.pathname);
  return result;
}

std::vector<Node> Node::Children() const { return Ls(); }

std::size_t Node::Count() const {
  auto core = Core();
  auto start = detail::ResolveFinal(*core, pathname_);
  if (!start.metadata) {
    throw MakeError(ErrorCode::kNotFound, pathname_.Canonical(), "does not exist");
  }
  if (start.metadata->type != NodeType::kDirectory) {
    throw MakeError(ErrorCode::kNotADirectory, pathname_.Canonical(), "is not a directory!");
  }
  auto entries = detail::CallAdapter(start.pathname,
                                     [&]() { return core->adapter->ReadDirectory(start.pathname); });
  return entries.size();
}

}  // namespace fsn::node
