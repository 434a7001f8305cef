#pragma once

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "fsn/error.h"
#include "fsn/node/adapter.h"
#include "fsn/node/filesystem.h"
#include "fsn/path/pathname.h"

namespace fsn::node::detail {

// Link chains longer than this are treated as cycles, as ELOOP does.
inline constexpr int kMaxLinkHops = 40;
// Recursive listing and copying refuse to go deeper than this.
inline constexpr std::size_t kMaxTraversalDepth = 4096;

// Runs one adapter call. fsn::Error passes through unchanged; any other
// exception a backend lets escape becomes kIOFailure on pathname.
template <typename Func>
auto CallAdapter(const path::Pathname& pathname, Func&& fn) -> std::invoke_result_t<Func&> {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error&) {
    throw;
  } catch (const std::exception& ex) {
    throw MakeError(ErrorCode::kIOFailure, pathname.Canonical(),
                    std::string("backend failure: ") + ex.what());
  }
}

// Scoped description stamped onto the first error that escapes fn.
template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (Error& err) {
    if (err.context.empty()) {
      ctx.Annotate(err);
    }
    throw;
  } catch (const std::exception& ex) {
    Error wrapped{ErrorCode::kIOFailure, ex.what()};
    ctx.Annotate(wrapped);
    throw wrapped;
  }
}

struct Resolved {
  path::Pathname pathname;                // final entity after following links
  std::optional<NodeMetadata> metadata;   // nullopt when the chain dangles
};

inline std::optional<NodeMetadata> StatAt(FilesystemCore& core, const path::Pathname& pathname) {
  return CallAdapter(pathname, [&]() { return core.adapter->Stat(pathname); });
}

// Follows a link chain starting at pathname. Stops at the first non-link, at
// a missing entity, or at a link the adapter cannot resolve.
inline Resolved ResolveFinal(FilesystemCore& core, const path::Pathname& pathname) {
  const bool links = core.adapter->Capabilities().Has(Capability::kLinks);
  path::Pathname current = pathname;
  for (int hop = 0; hop <= kMaxLinkHops; ++hop) {
    auto metadata = StatAt(core, current);
    if (!metadata || metadata->type != NodeType::kLink || !links) {
      return Resolved{std::move(current), std::move(metadata)};
    }
    current = CallAdapter(current, [&]() { return core.adapter->ResolveLink(current); });
  }
  throw MakeError(ErrorCode::kCyclicStructure, pathname.Canonical(),
                  "has too many levels of symbolic links");
}

}  // namespace fsn::node::detail
