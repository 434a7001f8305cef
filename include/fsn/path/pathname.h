#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fsn/config.h"

namespace fsn::path {

// Canonical, immutable representation of a location inside one filesystem.
//
// A Pathname is a root marker ("/", "C:/", "ftp://host/") followed by zero or
// more real segments joined with '/'. It never contains empty, "." or ".."
// segments. Equality, ordering and hashing use the canonical string only, so
// two raw spellings of the same location are interchangeable as keys.
class Pathname {
 public:
  Pathname();  // the POSIX root "/"

  // Splits raw on the declared separators, drops empty and "." segments and
  // collapses ".." against the preceding segment. Ascending above the root
  // throws Error(kInvalidPath). Raw paths without a root marker are taken
  // relative to "/".
  static Pathname Normalize(std::string_view raw, const PathConventions& conventions = {});

  [[nodiscard]] const std::string& Canonical() const noexcept { return canonical_; }
  [[nodiscard]] const std::string& RootMarker() const noexcept { return root_; }
  [[nodiscard]] const std::vector<std::string>& Segments() const noexcept { return segments_; }
  [[nodiscard]] bool IsRoot() const noexcept { return segments_.empty(); }
  [[nodiscard]] std::size_t Depth() const noexcept { return segments_.size(); }

  [[nodiscard]] std::optional<Pathname> Parent() const;

  // Appends exactly one segment. Names that are empty, "." or "..", or that
  // contain '/' or NUL, are rejected with kInvalidPath.
  [[nodiscard]] Pathname Child(std::string_view name) const;

  // Resolves a relative path against this one. Leading separators in relative
  // are ignored; ".." may climb into this path's segments but not past root.
  [[nodiscard]] Pathname Join(std::string_view relative,
                              const PathConventions& conventions = {}) const;

  // Last segment, with suffix removed when it is an exact trailing match that
  // is shorter than the name. Empty for the root.
  [[nodiscard]] std::string Basename(std::string_view suffix = {}) const;

  // Text after the last '.' of the basename. A leading hidden-file dot does
  // not start an extension.
  [[nodiscard]] std::string Extension() const;

  [[nodiscard]] bool IsHidden(char marker = '.') const;

  // True when ancestor is this path or one of its parents.
  [[nodiscard]] bool IsWithin(const Pathname& ancestor) const;

  // Segments below ancestor joined with '/', "" when equal, nullopt when this
  // path is not within ancestor.
  [[nodiscard]] std::optional<std::string> RelativeTo(const Pathname& ancestor) const;

  bool operator==(const Pathname& other) const noexcept { return canonical_ == other.canonical_; }
  std::strong_ordering operator<=>(const Pathname& other) const noexcept {
    return canonical_ <=> other.canonical_;
  }

 private:
  Pathname(std::string root, std::vector<std::string> segments);

  static Pathname Build(std::string root, std::vector<std::string> segments,
                        std::string_view rest, const PathConventions& conventions,
                        std::string_view raw);

  std::string root_;
  std::vector<std::string> segments_;
  std::string canonical_;

  friend Pathname ResolveLinkTarget(const Pathname& link, std::string_view raw_target,
                                    const PathConventions& conventions);
};

inline Pathname Normalize(std::string_view raw, const PathConventions& conventions = {}) {
  return Pathname::Normalize(raw, conventions);
}

inline Pathname Join(const Pathname& base, std::string_view relative,
                     const PathConventions& conventions = {}) {
  return base.Join(relative, conventions);
}

inline std::optional<Pathname> Parent(const Pathname& p) { return p.Parent(); }

inline std::string Basename(const Pathname& p, std::string_view suffix = {}) {
  return p.Basename(suffix);
}

inline const std::vector<std::string>& Segments(const Pathname& p) { return p.Segments(); }

// Canonicalizes a symlink target. Relative targets resolve against the link's
// parent directory; targets starting with a separator resolve against the
// link's root marker; targets carrying their own drive or scheme are
// normalized as-is.
Pathname ResolveLinkTarget(const Pathname& link, std::string_view raw_target,
                           const PathConventions& conventions = {});

}  // namespace fsn::path

template <>
struct std::hash<fsn::path::Pathname> {
  std::size_t operator()(const fsn::path::Pathname& p) const noexcept {
    return std::hash<std::string>{}(p.Canonical());
  }
};
