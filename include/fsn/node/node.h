#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fsn/config.h"
#include "fsn/filter/filter.h"
#include "fsn/node/adapter.h"
#include "fsn/path/pathname.h"

namespace fsn::node {

namespace detail {
struct FilesystemCore;
}  // namespace detail

class Filesystem;

// Live handle on one pathname of one filesystem.
//
// A Node caches nothing: every query goes to the adapter, so a handle whose
// entity was deleted or replaced behind its back simply observes the new
// state. Once the owning Filesystem is destroyed every operation throws
// Error(kDetached).
class Node {
 public:
  [[nodiscard]] const path::Pathname& Path() const noexcept { return pathname_; }
  [[nodiscard]] std::string Basename(std::string_view suffix = {}) const {
    return pathname_.Basename(suffix);
  }
  [[nodiscard]] std::string Extension() const { return pathname_.Extension(); }
  [[nodiscard]] std::optional<Node> Parent() const;
  [[nodiscard]] Node Child(std::string_view name) const;
  [[nodiscard]] bool IsAttached() const noexcept { return !core_.expired(); }
  // Path-only; answers even when detached.
  [[nodiscard]] bool IsHidden() const { return pathname_.IsHidden(hidden_marker_); }

  // Type queries, each a fresh stat. Missing entities answer false.
  [[nodiscard]] bool Exists() const;
  [[nodiscard]] bool IsFile() const;
  [[nodiscard]] bool IsDirectory() const;
  [[nodiscard]] bool IsLink() const;
  // Lstat type; throws kNotFound when nothing exists at the path.
  [[nodiscard]] NodeType Type() const;
  // Directory, or a link chain ending at one.
  [[nodiscard]] bool ResolvesToDirectory() const;
  [[nodiscard]] path::Pathname LinkTarget() const;

  // Metadata accessors throw kUnsupported when the adapter cannot report the
  // field. Setters return false instead of throwing in that case.
  [[nodiscard]] std::uint64_t Size() const;
  [[nodiscard]] std::uint32_t Owner() const;
  bool SetOwner(std::uint32_t owner);
  [[nodiscard]] std::uint32_t Group() const;
  bool SetGroup(std::uint32_t group);
  [[nodiscard]] std::uint32_t Mode() const;
  bool SetMode(std::uint32_t mode);
  [[nodiscard]] Timestamp AccessTime() const;
  bool SetAccessTime(Timestamp time);
  [[nodiscard]] Timestamp ModifyTime() const;
  bool SetModifyTime(Timestamp time);
  [[nodiscard]] Timestamp CreationTime() const;
  // Creates the file when absent, then stamps modify (default: now) and
  // access (default: modify) times where supported.
  bool Touch(std::optional<Timestamp> modify = std::nullopt,
             std::optional<Timestamp> access = std::nullopt, bool parents = false);

  // Owner permission bits of the mode.
  [[nodiscard]] bool IsReadable() const;
  [[nodiscard]] bool IsWritable() const;
  [[nodiscard]] bool IsExecutable() const;

  // Content. kNotAFile on directories, kNotFound when absent, kIOFailure when
  // the transport fails.
  [[nodiscard]] std::vector<std::uint8_t> Read() const;
  [[nodiscard]] std::string ReadString() const;
  void Write(std::span<const std::uint8_t> data);
  void Write(std::string_view text);
  void Append(std::span<const std::uint8_t> data);
  void Append(std::string_view text);
  std::uint64_t Truncate(std::uint64_t size = 0);
  [[nodiscard]] std::unique_ptr<InputStream> OpenInputStream() const;
  [[nodiscard]] std::unique_ptr<OutputStream> OpenOutputStream(bool append = false);

  // Structure. Without parents a missing parent directory is kNotFound.
  void CreateDirectory(bool parents = false);
  void CreateFile(bool parents = false);
  void Delete(bool recursive = false, bool force = false);
  // An existing destination directory receives the source under its
  // basename. Returns the node that now holds the copy.
  Node CopyTo(const Node& destination, bool parents = false) const;
  Node MoveTo(const Node& destination, bool parents = false);

  [[nodiscard]] std::vector<Node> Ls(const std::vector<filter::FilterSpec>& specs = {}) const;
  [[nodiscard]] std::vector<Node> Children() const;
  [[nodiscard]] std::size_t Count() const;

  // Hex digest by default, raw digest bytes when raw is set.
  [[nodiscard]] std::string MD5(bool raw = false) const;
  [[nodiscard]] std::string SHA1(bool raw = false) const;

  [[nodiscard]] std::string RealUrl() const;
  [[nodiscard]] std::string PublicUrl() const;

  // Owning filesystem. These throw kDetached once it is gone.
  [[nodiscard]] std::string FilesystemLabel() const;
  [[nodiscard]] CapabilitySet Capabilities() const;
  [[nodiscard]] bool BelongsTo(const Filesystem& filesystem) const noexcept;

  bool operator==(const Node& other) const noexcept;

 private:
  friend class Filesystem;

  Node(std::weak_ptr<detail::FilesystemCore> core, path::Pathname pathname, char hidden_marker);

  [[nodiscard]] std::shared_ptr<detail::FilesystemCore> Core() const;
  [[nodiscard]] std::optional<NodeMetadata> StatNow() const;
  [[nodiscard]] NodeMetadata StatOrThrow() const;
  void RequireFileContent(bool must_exist) const;
  bool ApplyMetadata(MetadataField field, const MetadataValue& value);
  [[nodiscard]] bool ModeBit(std::uint32_t bit) const;
  [[nodiscard]] std::string Digest(int algorithm, bool raw) const;
  void EnsureParent(bool parents) const;
  [[nodiscard]] Node TransferTarget(const Node& destination) const;
  Node CopyResolved(const Node& target, bool parents) const;

  std::weak_ptr<detail::FilesystemCore> core_;
  path::Pathname pathname_;
  char hidden_marker_;
};

}  // namespace fsn::node
