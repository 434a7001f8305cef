#include <algorithm>
#include <unordered_set>
#include <utility>
#include <vector>

#include "fsn/diag/event_bus.h"
#include "fsn/error.h"
#include "fsn/node/filesystem.h"
#include "fsn/node/node.h"
#include "node_internal.h"

namespace fsn::node {
namespace {

// Recursive copy between two filesystems (possibly the same one). Links in
// the source are followed; mutated turns true once anything was written at
// the destination.
class CopyWalk {
 public:
  CopyWalk(detail::FilesystemCore& source, detail::FilesystemCore& destination, ErrorContext& ctx)
      : source_(source), destination_(destination), ctx_(ctx) {}

  [[nodiscard]] bool Mutated() const noexcept { return mutated_; }

  void Copy(const path::Pathname& from, NodeType type, const path::Pathname& to, std::size_t depth) {
    if (type == NodeType::kDirectory) {
      CopyDirectory(from, to, depth);
    } else {
      CopyFile(from, to);
    }
  }

 private:
  void CopyFile(const path::Pathname& from, const path::Pathname& to) {
    auto existing = detail::ResolveFinal(destination_, to);
    if (existing.metadata && existing.metadata->type == NodeType::kDirectory) {
      throw MakeError(ErrorCode::kNotAFile, to.Canonical(), "is a directory");
    }
    auto input = detail::CallAdapter(from, [&]() { return source_.adapter->OpenRead(from); });
    auto output = detail::CallAdapter(to, [&]() { return destination_.adapter->OpenWrite(to, false); });
    if (!input || !output) {
      throw MakeError(ErrorCode::kIOFailure, (input ? to : from).Canonical(), "could not be opened");
    }
    mutated_ = true;
    const auto chunk = source_.options.io_chunk_size;
    std::vector<std::uint8_t> buffer(chunk);
    for (;;) {
      const auto got = detail::CallAdapter(
          from, [&]() { return input->Read(std::span<std::uint8_t>(buffer.data(), buffer.size())); });
      if (got == 0) {
        break;
      }
      detail::CallAdapter(to, [&]() { output->Write(std::span<const std::uint8_t>(buffer.data(), got)); });
    }
    detail::CallAdapter(to, [&]() {
      output->Flush();
      output->Close();
    });
    detail::CallAdapter(from, [&]() { input->Close(); });
  }

  void CopyDirectory(const path::Pathname& from, const path::Pathname& to, std::size_t depth) {
    if (depth >= detail::kMaxTraversalDepth) {
      throw MakeError(ErrorCode::kCyclicStructure, from.Canonical(), "exceeds the maximum copy depth");
    }
    auto existing = detail::ResolveFinal(destination_, to);
    if (!existing.metadata) {
      detail::CallAdapter(to, [&]() { destination_.adapter->CreateDirectory(to, false); });
      mutated_ = true;
    } else if (existing.metadata->type != NodeType::kDirectory) {
      throw MakeError(ErrorCode::kNotADirectory, to.Canonical(), "is not a directory!");
    }

    active_.insert(from);
    auto entries = detail::CallAdapter(from, [&]() { return source_.adapter->ReadDirectory(from); });
    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
    for (const auto& entry : entries) {
      auto child_from = from.Child(entry.name);
      auto child_to = to.Child(entry.name);
      detail::WithContext(ctx_, "copy " + child_from.Canonical(), [&]() {
        auto resolved = detail::ResolveFinal(source_, child_from);
        if (!resolved.metadata) {
          if (detail::StatAt(source_, child_from)) {
            throw MakeError(ErrorCode::kNotFound, child_from.Canonical(), "is a dangling link");
          }
          return;  // vanished since enumeration
        }
        if (resolved.metadata->type == NodeType::kDirectory && active_.count(resolved.pathname) != 0) {
          throw MakeError(ErrorCode::kCyclicStructure, child_from.Canonical(),
                          "leads back to " + resolved.pathname.Canonical() + " which is being copied");
        }
        Copy(resolved.pathname, resolved.metadata->type, child_to, depth + 1);
      });
    }
    active_.erase(from);
  }

  detail::FilesystemCore& source_;
  detail::FilesystemCore& destination_;
  ErrorContext& ctx_;
  bool mutated_{false};
  std::unordered_set<path::Pathname> active_;
};

void ReportPartialFailure(const path::Pathname& source, const path::Pathname& target, const Error& err) {
  diag::Emit(diag::EventCategory::kLifecycle, diag::EventSeverity::kWarning, "copy_partial_failure",
             "Transfer stopped after modifying the destination",
             {diag::EventField("source", source.Canonical(), diag::FieldPrivacy::kHash),
              diag::EventField("target", target.Canonical(), diag::FieldPrivacy::kHash),
              diag::EventField("error", std::string(ErrorCodeName(err.code)))});
}

}  // namespace

Node Node::TransferTarget(const Node& destination) const {
  if (!destination.ResolvesToDirectory()) {
    return destination;
  }
  if (pathname_.IsRoot()) {
    throw MakeError(ErrorCode::kInvalidPath, pathname_.Canonical(),
                    "has no basename to place inside " + destination.Path().Canonical());
  }
  return destination.Child(pathname_.Basename());
}

Node Node::CopyResolved(const Node& target, bool parents) const {
  auto core = Core();
  auto target_core = target.Core();
  auto source = detail::ResolveFinal(*core, pathname_);
  if (!source.metadata) {
    throw MakeError(ErrorCode::kNotFound, pathname_.Canonical(), "does not exist");
  }
  if (core == target_core) {
    const auto& to = target.Path();
    if (to == pathname_ || to == source.pathname) {
      throw MakeError(ErrorCode::kInvalidPath, pathname_.Canonical(), "cannot be copied onto itself");
    }
    if (source.metadata->type == NodeType::kDirectory &&
        (to.IsWithin(pathname_) || to.IsWithin(source.pathname))) {
      throw MakeError(ErrorCode::kInvalidPath, pathname_.Canonical(),
                      "cannot be copied into its own subtree " + to.Canonical());
    }
  }
  target.EnsureParent(parents);

  ErrorContext ctx;
  CopyWalk walk(*core, *target_core, ctx);
  try {
    detail::WithContext(ctx, "copy " + pathname_.Canonical() + " to " + target.Path().Canonical(),
                        [&]() { walk.Copy(source.pathname, source.metadata->type, target.Path(), 0); });
  } catch (Error& err) {
    if (walk.Mutated()) {
      err.partial = true;
      ReportPartialFailure(pathname_, target.Path(), err);
    }
    throw;
  }
  return target;
}

Node Node::CopyTo(const Node& destination, bool parents) const {
  auto target = CopyResolved(TransferTarget(destination), parents);
  diag::Emit(diag::EventCategory::kLifecycle, diag::EventSeverity::kInfo, "node_copied", "Node copied",
             {diag::EventField("source", pathname_.Canonical(), diag::FieldPrivacy::kHash),
              diag::EventField("target", target.Path().Canonical(), diag::FieldPrivacy::kHash)});
  return target;
}

Node Node::MoveTo(const Node& destination, bool parents) {
  auto core = Core();
  auto target_core = destination.Core();
  auto metadata = detail::StatAt(*core, pathname_);
  if (!metadata) {
    throw MakeError(ErrorCode::kNotFound, pathname_.Canonical(), "does not exist");
  }
  Node target = TransferTarget(destination);
  const bool same_filesystem = core == target_core;
  if (same_filesystem && target.Path() == pathname_) {
    return target;
  }
  if (same_filesystem && metadata->type == NodeType::kDirectory && target.Path().IsWithin(pathname_)) {
    throw MakeError(ErrorCode::kInvalidPath, pathname_.Canonical(),
                    "cannot be moved into its own subtree " + target.Path().Canonical());
  }

  std::string method;
  if (same_filesystem && core->adapter->Capabilities().Has(Capability::kRename)) {
    target.EnsureParent(parents);
    auto existing = detail::StatAt(*core, target.Path());
    if (existing && (existing->type == NodeType::kDirectory || metadata->type == NodeType::kDirectory)) {
      throw MakeError(ErrorCode::kAlreadyExists, target.Path().Canonical(), "already exists");
    }
    detail::CallAdapter(pathname_, [&]() { core->adapter->Rename(pathname_, target.Path()); });
    method = "rename";
  } else {
    CopyResolved(target, parents);
    try {
      detail::CallAdapter(pathname_, [&]() { core->adapter->Delete(pathname_, true, false); });
    } catch (Error& err) {
      err.partial = true;
      ReportPartialFailure(pathname_, target.Path(), err);
      throw;
    }
    method = "copy";
  }
  diag::Emit(diag::EventCategory::kLifecycle, diag::EventSeverity::kInfo, "node_moved", "Node moved",
             {diag::EventField("source", pathname_.Canonical(), diag::FieldPrivacy::kHash),
              diag::EventField("target", target.Path().Canonical(), diag::FieldPrivacy::kHash),
              diag::EventField("method", method)});
  return target;
}

}  // namespace fsn::node
