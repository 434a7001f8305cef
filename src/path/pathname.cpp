#include "fsn/path/pathname.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "fsn/error.h"

namespace fsn::path {
namespace {

constexpr std::string_view kPosixRoot = "/";

struct SplitRoot {
  std::string root;
  std::string_view rest;
  bool explicit_root{false};  // raw carried its own drive or scheme
};

bool IsSeparator(char ch, const PathConventions& conventions) {
  return conventions.separators.find(ch) != std::string::npos;
}

// scheme ":" "//" authority, RFC 3986 scheme characters.
std::optional<SplitRoot> MatchUrlRoot(std::string_view raw, const PathConventions& conventions) {
  if (raw.empty() || !std::isalpha(static_cast<unsigned char>(raw[0]))) {
    return std::nullopt;
  }
  std::size_t pos = 1;
  while (pos < raw.size()) {
    const auto ch = static_cast<unsigned char>(raw[pos]);
    if (std::isalnum(ch) || ch == '+' || ch == '-' || ch == '.') {
      ++pos;
      continue;
    }
    break;
  }
  if (raw.substr(pos, 3) != "://") {
    return std::nullopt;
  }
  std::string scheme(raw.substr(0, pos));
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  std::size_t authority_begin = pos + 3;
  std::size_t authority_end = authority_begin;
  while (authority_end < raw.size() && !IsSeparator(raw[authority_end], conventions)) {
    ++authority_end;
  }
  SplitRoot split;
  split.root = scheme + "://" + std::string(raw.substr(authority_begin, authority_end - authority_begin)) + "/";
  split.rest = raw.substr(authority_end);
  split.explicit_root = true;
  return split;
}

std::optional<SplitRoot> MatchDriveRoot(std::string_view raw) {
  if (raw.size() < 2 || raw[1] != ':' || !std::isalpha(static_cast<unsigned char>(raw[0]))) {
    return std::nullopt;
  }
  SplitRoot split;
  split.root.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(raw[0]))));
  split.root.append(":/");
  split.rest = raw.substr(2);
  split.explicit_root = true;
  return split;
}

SplitRoot SplitRootMarker(std::string_view raw, const PathConventions& conventions) {
  if (conventions.allow_url_scheme) {
    if (auto split = MatchUrlRoot(raw, conventions)) {
      return *split;
    }
  }
  if (conventions.allow_drive_letters) {
    if (auto split = MatchDriveRoot(raw)) {
      return *split;
    }
  }
  SplitRoot split;
  split.root = conventions.default_root.empty() ? std::string(kPosixRoot) : conventions.default_root;
  split.rest = raw;
  return split;
}

void RejectEmbeddedNull(std::string_view raw) {
  if (raw.find('\0') != std::string_view::npos) {
    throw MakeError(ErrorCode::kInvalidPath, {}, "Embedded null in path");
  }
}

std::string Assemble(const std::string& root, const std::vector<std::string>& segments) {
  std::string result = root;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) {
      result.push_back('/');
    }
    result.append(segments[i]);
  }
  return result;
}

}  // namespace

Pathname::Pathname() : root_(kPosixRoot), canonical_(kPosixRoot) {}

Pathname::Pathname(std::string root, std::vector<std::string> segments)
    : root_(std::move(root)), segments_(std::move(segments)) {
  canonical_ = Assemble(root_, segments_);
}

Pathname Pathname::Build(std::string root, std::vector<std::string> segments,
                         std::string_view rest, const PathConventions& conventions,
                         std::string_view raw) {
  std::size_t pos = 0;
  while (pos <= rest.size()) {
    std::size_t end = pos;
    while (end < rest.size() && !IsSeparator(rest[end], conventions)) {
      ++end;
    }
    std::string_view name = rest.substr(pos, end - pos);
    if (name.empty() || name == ".") {
      // dropped
    } else if (name == "..") {
      if (segments.empty()) {
        throw MakeError(ErrorCode::kInvalidPath, raw, "ascends above the root");
      }
      segments.pop_back();
    } else {
      segments.emplace_back(name);
    }
    pos = end + 1;
  }
  return Pathname(std::move(root), std::move(segments));
}

Pathname Pathname::Normalize(std::string_view raw, const PathConventions& conventions) {
  RejectEmbeddedNull(raw);
  auto split = SplitRootMarker(raw, conventions);
  return Build(std::move(split.root), {}, split.rest, conventions, raw);
}

std::optional<Pathname> Pathname::Parent() const {
  if (segments_.empty()) {
    return std::nullopt;
  }
  std::vector<std::string> parent(segments_.begin(), segments_.end() - 1);
  return Pathname(root_, std::move(parent));
}

Pathname Pathname::Child(std::string_view name) const {
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string_view::npos ||
      name.find('\0') != std::string_view::npos) {
    throw MakeError(ErrorCode::kInvalidPath, canonical_,
                    "cannot take child segment '" + std::string(name) + "'");
  }
  auto segments = segments_;
  segments.emplace_back(name);
  return Pathname(root_, std::move(segments));
}

Pathname Pathname::Join(std::string_view relative, const PathConventions& conventions) const {
  RejectEmbeddedNull(relative);
  try {
    return Build(root_, segments_, relative, conventions, relative);
  } catch (const Error& err) {
    if (err.code != ErrorCode::kInvalidPath) {
      throw;
    }
    throw MakeError(ErrorCode::kInvalidPath, canonical_,
                    "joined with '" + std::string(relative) + "' ascends above the root");
  }
}

std::string Pathname::Basename(std::string_view suffix) const {
  if (segments_.empty()) {
    return {};
  }
  const std::string& name = segments_.back();
  if (!suffix.empty() && name.size() > suffix.size() &&
      std::string_view(name).substr(name.size() - suffix.size()) == suffix) {
    return name.substr(0, name.size() - suffix.size());
  }
  return name;
}

std::string Pathname::Extension() const {
  auto name = Basename();
  auto dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    return {};
  }
  return name.substr(dot + 1);
}

bool Pathname::IsHidden(char marker) const {
  return !segments_.empty() && !segments_.back().empty() && segments_.back().front() == marker;
}

bool Pathname::IsWithin(const Pathname& ancestor) const {
  if (root_ != ancestor.root_ || ancestor.segments_.size() > segments_.size()) {
    return false;
  }
  return std::equal(ancestor.segments_.begin(), ancestor.segments_.end(), segments_.begin());
}

std::optional<std::string> Pathname::RelativeTo(const Pathname& ancestor) const {
  if (!IsWithin(ancestor)) {
    return std::nullopt;
  }
  std::string relative;
  for (std::size_t i = ancestor.segments_.size(); i < segments_.size(); ++i) {
    if (!relative.empty()) {
      relative.push_back('/');
    }
    relative.append(segments_[i]);
  }
  return relative;
}

Pathname ResolveLinkTarget(const Pathname& link, std::string_view raw_target,
                           const PathConventions& conventions) {
  RejectEmbeddedNull(raw_target);
  if (raw_target.empty()) {
    throw MakeError(ErrorCode::kInvalidPath, link.Canonical(), "has an empty link target");
  }
  auto split = SplitRootMarker(raw_target, conventions);
  if (split.explicit_root) {
    return Pathname::Build(std::move(split.root), {}, split.rest, conventions, raw_target);
  }
  if (IsSeparator(raw_target.front(), conventions)) {
    return Pathname::Build(link.RootMarker(), {}, raw_target, conventions, raw_target);
  }
  auto base = link.Parent().value_or(link);
  return Pathname::Build(base.RootMarker(), base.Segments(), raw_target, conventions, raw_target);
}

}  // namespace fsn::path
