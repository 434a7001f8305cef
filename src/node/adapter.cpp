#include "fsn/node/adapter.h"

#include <string>

#include "fsn/error.h"

namespace fsn::node {
namespace {

[[noreturn]] void ThrowUnsupported(const path::Pathname& pathname, Capability capability) {
  throw MakeError(ErrorCode::kUnsupported, pathname.Canonical(),
                  "backend does not support " + std::string(CapabilityName(capability)));
}

}  // namespace

std::string_view NodeTypeName(NodeType type) noexcept {
  switch (type) {
  case NodeType::kFile:
    return "file";
  case NodeType::kDirectory:
    return "directory";
  case NodeType::kLink:
    return "link";
  case NodeType::kUnknown:
    return "unknown";
  }
  return "unknown";
}

std::string_view CapabilityName(Capability capability) noexcept {
  switch (capability) {
  case Capability::kLinks:
    return "links";
  case Capability::kOwnership:
    return "ownership";
  case Capability::kMode:
    return "mode";
  case Capability::kAccessTime:
    return "access-time";
  case Capability::kModifyTime:
    return "modify-time";
  case Capability::kCreationTime:
    return "creation-time";
  case Capability::kRename:
    return "rename";
  case Capability::kTruncate:
    return "truncate";
  case Capability::kUrl:
    return "url";
  case Capability::kPublicUrl:
    return "public-url";
  }
  return "unknown";
}

Capability CapabilityFor(MetadataField field) noexcept {
  switch (field) {
  case MetadataField::kOwner:
  case MetadataField::kGroup:
    return Capability::kOwnership;
  case MetadataField::kMode:
    return Capability::kMode;
  case MetadataField::kAccessTime:
    return Capability::kAccessTime;
  case MetadataField::kModifyTime:
    return Capability::kModifyTime;
  }
  return Capability::kOwnership;
}

path::Pathname Adapter::ResolveLink(const path::Pathname& pathname) {
  ThrowUnsupported(pathname, Capability::kLinks);
}

void Adapter::SetMetadata(const path::Pathname& pathname, MetadataField field,
                          const MetadataValue&) {
  ThrowUnsupported(pathname, CapabilityFor(field));
}

void Adapter::Rename(const path::Pathname& from, const path::Pathname&) {
  ThrowUnsupported(from, Capability::kRename);
}

void Adapter::Truncate(const path::Pathname& pathname, std::uint64_t) {
  ThrowUnsupported(pathname, Capability::kTruncate);
}

std::string Adapter::RealUrl(const path::Pathname& pathname) {
  ThrowUnsupported(pathname, Capability::kUrl);
}

std::string Adapter::PublicUrl(const path::Pathname& pathname) {
  ThrowUnsupported(pathname, Capability::kPublicUrl);
}

}  // namespace fsn::node
