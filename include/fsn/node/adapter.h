#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "fsn/path/pathname.h"

namespace fsn::node {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

enum class NodeType : std::uint8_t { kUnknown, kFile, kDirectory, kLink };

std::string_view NodeTypeName(NodeType type) noexcept;

// Each optional field is left empty by adapters that cannot report it.
struct NodeMetadata {
  NodeType type{NodeType::kUnknown};
  std::optional<std::uint64_t> size;
  std::optional<std::uint32_t> owner;
  std::optional<std::uint32_t> group;
  std::optional<std::uint32_t> mode;
  std::optional<Timestamp> access_time;
  std::optional<Timestamp> modify_time;
  std::optional<Timestamp> creation_time;
};

struct DirectoryEntry {
  std::string name;
  NodeType type_hint{NodeType::kUnknown};  // advisory; kUnknown means "stat me"
};

class InputStream {
 public:
  virtual ~InputStream() = default;
  // Fills up to buffer.size() bytes and returns the count; 0 at end of stream.
  virtual std::size_t Read(std::span<std::uint8_t> buffer) = 0;
  virtual void Close() = 0;
};

class OutputStream {
 public:
  virtual ~OutputStream() = default;
  virtual void Write(std::span<const std::uint8_t> data) = 0;
  virtual void Flush() = 0;
  virtual void Close() = 0;
};

// Optional traits an adapter advertises on top of the mandatory operations.
enum class Capability : std::uint32_t {
  kLinks = 1u << 0,
  kOwnership = 1u << 1,
  kMode = 1u << 2,
  kAccessTime = 1u << 3,
  kModifyTime = 1u << 4,
  kCreationTime = 1u << 5,
  kRename = 1u << 6,
  kTruncate = 1u << 7,
  kUrl = 1u << 8,
  kPublicUrl = 1u << 9,
};

std::string_view CapabilityName(Capability capability) noexcept;

class CapabilitySet {
 public:
  constexpr CapabilitySet() = default;
  constexpr CapabilitySet(std::initializer_list<Capability> capabilities) {
    for (auto capability : capabilities) {
      bits_ |= static_cast<std::uint32_t>(capability);
    }
  }

  [[nodiscard]] constexpr bool Has(Capability capability) const noexcept {
    return (bits_ & static_cast<std::uint32_t>(capability)) != 0;
  }
  constexpr CapabilitySet& Add(Capability capability) noexcept {
    bits_ |= static_cast<std::uint32_t>(capability);
    return *this;
  }
  constexpr CapabilitySet& Remove(Capability capability) noexcept {
    bits_ &= ~static_cast<std::uint32_t>(capability);
    return *this;
  }
  [[nodiscard]] constexpr std::uint32_t Bits() const noexcept { return bits_; }

 private:
  std::uint32_t bits_{0};
};

enum class MetadataField : std::uint8_t { kOwner, kGroup, kMode, kAccessTime, kModifyTime };

using MetadataValue = std::variant<std::uint32_t, Timestamp>;

Capability CapabilityFor(MetadataField field) noexcept;

// Backend contract. Every operation receives canonical pathnames and reports
// failures by throwing fsn::Error with a taxonomy code. Intermediate links in
// a pathname are followed; the last segment is not (Stat reports kLink).
class Adapter {
 public:
  virtual ~Adapter() = default;

  [[nodiscard]] virtual CapabilitySet Capabilities() const = 0;

  // nullopt when nothing exists at pathname.
  virtual std::optional<NodeMetadata> Stat(const path::Pathname& pathname) = 0;
  virtual std::vector<DirectoryEntry> ReadDirectory(const path::Pathname& pathname) = 0;
  virtual std::unique_ptr<InputStream> OpenRead(const path::Pathname& pathname) = 0;
  virtual std::unique_ptr<OutputStream> OpenWrite(const path::Pathname& pathname, bool append) = 0;
  virtual void CreateDirectory(const path::Pathname& pathname, bool parents) = 0;
  virtual void CreateFile(const path::Pathname& pathname, bool parents) = 0;
  virtual void Delete(const path::Pathname& pathname, bool recursive, bool force) = 0;

  // Optional operations. The defaults throw kUnsupported; adapters override
  // the ones whose capability they advertise.
  virtual path::Pathname ResolveLink(const path::Pathname& pathname);
  virtual void SetMetadata(const path::Pathname& pathname, MetadataField field,
                           const MetadataValue& value);
  virtual void Rename(const path::Pathname& from, const path::Pathname& to);
  virtual void Truncate(const path::Pathname& pathname, std::uint64_t size);
  virtual std::string RealUrl(const path::Pathname& pathname);
  // Address under which the entity is reachable from outside the backend.
  virtual std::string PublicUrl(const path::Pathname& pathname);
};

}  // namespace fsn::node
