#include "fsn/node/node.h"

#include <algorithm>
#include <utility>

#include "fsn/crypto/digest.h"
#include "fsn/diag/event_bus.h"
#include "fsn/error.h"
#include "fsn/node/filesystem.h"
#include "node_internal.h"

namespace fsn::node {
namespace {

constexpr std::uint32_t kOwnerRead = 0400;
constexpr std::uint32_t kOwnerWrite = 0200;
constexpr std::uint32_t kOwnerExecute = 0100;

[[noreturn]] void ThrowUnsupported(const path::Pathname& pathname, Capability capability) {
  throw MakeError(ErrorCode::kUnsupported, pathname.Canonical(),
                  "backend does not support " + std::string(CapabilityName(capability)));
}

template <typename T>
T RequireField(const std::optional<T>& value, const path::Pathname& pathname, Capability capability) {
  if (!value) {
    ThrowUnsupported(pathname, capability);
  }
  return *value;
}

void RequireCapability(const detail::FilesystemCore& core, const path::Pathname& pathname,
                       Capability capability) {
  if (!core.adapter->Capabilities().Has(capability)) {
    ThrowUnsupported(pathname, capability);
  }
}

void ReportUnsupportedMetadata(const path::Pathname& pathname, Capability capability) {
  diag::Emit(diag::EventCategory::kCapability, diag::EventSeverity::kDebug, "metadata_unsupported",
             "Metadata update skipped",
             {diag::EventField("path", pathname.Canonical(), diag::FieldPrivacy::kHash),
              diag::EventField("capability", std::string(CapabilityName(capability)))});
}

std::span<const std::uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

Node::Node(std::weak_ptr<detail::FilesystemCore> core, path::Pathname pathname, char hidden_marker)
    : core_(std::move(core)), pathname_(std::move(pathname)), hidden_marker_(hidden_marker) {}

std::shared_ptr<detail::FilesystemCore> Node::Core() const {
  auto core = core_.lock();
  if (!core) {
    throw MakeError(ErrorCode::kDetached, pathname_.Canonical(),
                    "belongs to a filesystem that no longer exists");
  }
  return core;
}

std::optional<Node> Node::Parent() const {
  auto parent = pathname_.Parent();
  if (!parent) {
    return std::nullopt;
  }
  return Node(core_, std::move(*parent), hidden_marker_);
}

Node Node::Child(std::string_view name) const {
  return Node(core_, pathname_.Child(name), hidden_marker_);
}

std::optional<NodeMetadata> Node::StatNow() const {
  auto core = Core();
  return detail::StatAt(*core, pathname_);
}

NodeMetadata Node::StatOrThrow() const {
  auto metadata = StatNow();
  if (!metadata) {
    throw MakeError(ErrorCode::kNotFound, pathname_.Canonical(), "does not exist");
  }
  return *metadata;
}

bool Node::Exists() const { return StatNow().has_value(); }

bool Node::IsFile() const {
  auto metadata = StatNow();
  return metadata && metadata->type == NodeType::kFile;
}

bool Node::IsDirectory() const {
  auto metadata = StatNow();
  return metadata && metadata->type == NodeType::kDirectory;
}

bool Node::IsLink() const {
  auto metadata = StatNow();
  return metadata && metadata->type == NodeType::kLink;
}

NodeType Node::Type() const { return StatOrThrow().type; }

bool Node::ResolvesToDirectory() const {
  auto core = Core();
  auto resolved = detail::ResolveFinal(*core, pathname_);
  return resolved.metadata && resolved.metadata->type == NodeType::kDirectory;
}

path::Pathname Node::LinkTarget() const {
  auto core = Core();
  RequireCapability(*core, pathname_, Capability::kLinks);
  if (StatOrThrow().type != NodeType::kLink) {
    throw MakeError(ErrorCode::kNotALink, pathname_.Canonical(), "is not a link");
  }
  return detail::CallAdapter(pathname_, [&]() { return core->adapter->ResolveLink(pathname_); });
}

std::uint64_t Node::Size() const {
  auto metadata = StatOrThrow();
  if (!metadata.size) {
    throw MakeError(ErrorCode::kUnsupported, pathname_.Canonical(), "has no reported size");
  }
  return *metadata.size;
}

std::uint32_t Node::Owner() const {
  RequireCapability(*Core(), pathname_, Capability::kOwnership);
  return RequireField(StatOrThrow().owner, pathname_, Capability::kOwnership);
}

bool Node::SetOwner(std::uint32_t owner) { return ApplyMetadata(MetadataField::kOwner, owner); }

std::uint32_t Node::Group() const {
  RequireCapability(*Core(), pathname_, Capability::kOwnership);
  return RequireField(StatOrThrow().group, pathname_, Capability::kOwnership);
}

bool Node::SetGroup(std::uint32_t group) { return ApplyMetadata(MetadataField::kGroup, group); }

std::uint32_t Node::Mode() const {
  RequireCapability(*Core(), pathname_, Capability::kMode);
  return RequireField(StatOrThrow().mode, pathname_, Capability::kMode);
}

bool Node::SetMode(std::uint32_t mode) { return ApplyMetadata(MetadataField::kMode, mode); }

Timestamp Node::AccessTime() const {
  RequireCapability(*Core(), pathname_, Capability::kAccessTime);
  return RequireField(StatOrThrow().access_time, pathname_, Capability::kAccessTime);
}

bool Node::SetAccessTime(Timestamp time) { return ApplyMetadata(MetadataField::kAccessTime, time); }

Timestamp Node::ModifyTime() const {
  RequireCapability(*Core(), pathname_, Capability::kModifyTime);
  return RequireField(StatOrThrow().modify_time, pathname_, Capability::kModifyTime);
}

bool Node::SetModifyTime(Timestamp time) { return ApplyMetadata(MetadataField::kModifyTime, time); }

Timestamp Node::CreationTime() const {
  RequireCapability(*Core(), pathname_, Capability::kCreationTime);
  return RequireField(StatOrThrow().creation_time, pathname_, Capability::kCreationTime);
}

bool Node::ApplyMetadata(MetadataField field, const MetadataValue& value) {
  auto core = Core();
  const auto capability = CapabilityFor(field);
  if (!core->adapter->Capabilities().Has(capability)) {
    ReportUnsupportedMetadata(pathname_, capability);
    return false;
  }
  (void)StatOrThrow();
  try {
    detail::CallAdapter(pathname_, [&]() { core->adapter->SetMetadata(pathname_, field, value); });
  } catch (const Error& err) {
    if (err.code != ErrorCode::kUnsupported) {
      throw;
    }
    ReportUnsupportedMetadata(pathname_, capability);
    return false;
  }
  return true;
}

bool Node::Touch(std::optional<Timestamp> modify, std::optional<Timestamp> access, bool parents) {
  if (!Exists()) {
    CreateFile(parents);
  }
  const Timestamp modify_time = modify.value_or(Clock::now());
  const Timestamp access_time = access.value_or(modify_time);
  const bool modify_ok = SetModifyTime(modify_time);
  const bool access_ok = SetAccessTime(access_time);
  return modify_ok && access_ok;
}

bool Node::ModeBit(std::uint32_t bit) const { return (Mode() & bit) != 0; }

bool Node::IsReadable() const { return ModeBit(kOwnerRead); }
bool Node::IsWritable() const { return ModeBit(kOwnerWrite); }
bool Node::IsExecutable() const { return ModeBit(kOwnerExecute); }

void Node::RequireFileContent(bool must_exist) const {
  auto core = Core();
  auto resolved = detail::ResolveFinal(*core, pathname_);
  if (!resolved.metadata) {
    if (must_exist) {
      throw MakeError(ErrorCode::kNotFound, pathname_.Canonical(), "does not exist");
    }
    return;
  }
  switch (resolved.metadata->type) {
  case NodeType::kDirectory:
    throw MakeError(ErrorCode::kNotAFile, pathname_.Canonical(), "is a directory");
  case NodeType::kLink:
    throw MakeError(ErrorCode::kNotAFile, pathname_.Canonical(), "is a link the backend cannot follow");
  case NodeType::kFile:
  case NodeType::kUnknown:
    break;
  }
}

std::unique_ptr<InputStream> Node::OpenInputStream() const {
  RequireFileContent(true);
  auto core = Core();
  auto stream = detail::CallAdapter(pathname_, [&]() { return core->adapter->OpenRead(pathname_); });
  if (!stream) {
    throw MakeError(ErrorCode::kIOFailure, pathname_.Canonical(), "could not be opened for reading");
  }
  return stream;
}

std::unique_ptr<OutputStream> Node::OpenOutputStream(bool append) {
  RequireFileContent(false);
  auto core = Core();
  if (!detail::StatAt(*core, pathname_)) {
    EnsureParent(false);
  }
  auto stream =
      detail::CallAdapter(pathname_, [&]() { return core->adapter->OpenWrite(pathname_, append); });
  if (!stream) {
    throw MakeError(ErrorCode::kIOFailure, pathname_.Canonical(), "could not be opened for writing");
  }
  return stream;
}

std::vector<std::uint8_t> Node::Read() const {
  auto stream = OpenInputStream();
  const auto chunk = Core()->options.io_chunk_size;
  std::vector<std::uint8_t> content;
  detail::CallAdapter(pathname_, [&]() {
    for (;;) {
      const auto offset = content.size();
      content.resize(offset + chunk);
      const auto got = stream->Read(std::span<std::uint8_t>(content.data() + offset, chunk));
      content.resize(offset + got);
      if (got == 0) {
        break;
      }
    }
    stream->Close();
  });
  return content;
}

std::string Node::ReadString() const {
  auto bytes = Read();
  return std::string(bytes.begin(), bytes.end());
}

void Node::Write(std::span<const std::uint8_t> data) {
  auto stream = OpenOutputStream(false);
  detail::CallAdapter(pathname_, [&]() {
    stream->Write(data);
    stream->Flush();
    stream->Close();
  });
}

void Node::Write(std::string_view text) { Write(AsBytes(text)); }

void Node::Append(std::span<const std::uint8_t> data) {
  auto stream = OpenOutputStream(true);
  detail::CallAdapter(pathname_, [&]() {
    stream->Write(data);
    stream->Flush();
    stream->Close();
  });
}

void Node::Append(std::string_view text) { Append(AsBytes(text)); }

std::uint64_t Node::Truncate(std::uint64_t size) {
  RequireFileContent(true);
  auto core = Core();
  if (core->adapter->Capabilities().Has(Capability::kTruncate)) {
    detail::CallAdapter(pathname_, [&]() { core->adapter->Truncate(pathname_, size); });
    return size;
  }
  // Rewrite through the streams: keep the prefix, zero-fill any growth.
  auto content = Read();
  content.resize(static_cast<std::size_t>(size), 0);
  Write(std::span<const std::uint8_t>(content.data(), content.size()));
  return size;
}

void Node::EnsureParent(bool parents) const {
  auto parent = pathname_.Parent();
  if (!parent) {
    return;
  }
  auto core = Core();
  auto resolved = detail::ResolveFinal(*core, *parent);
  if (!resolved.metadata) {
    if (!parents) {
      throw MakeError(ErrorCode::kNotFound, parent->Canonical(), "does not exist");
    }
    detail::CallAdapter(*parent, [&]() { core->adapter->CreateDirectory(*parent, true); });
    return;
  }
  if (resolved.metadata->type != NodeType::kDirectory) {
    throw MakeError(ErrorCode::kNotADirectory, parent->Canonical(), "is not a directory!");
  }
}

void Node::CreateDirectory(bool parents) {
  auto core = Core();
  if (detail::StatAt(*core, pathname_)) {
    throw MakeError(ErrorCode::kAlreadyExists, pathname_.Canonical(), "already exists");
  }
  EnsureParent(parents);
  detail::CallAdapter(pathname_, [&]() { core->adapter->CreateDirectory(pathname_, parents); });
}

void Node::CreateFile(bool parents) {
  auto core = Core();
  if (detail::StatAt(*core, pathname_)) {
    throw MakeError(ErrorCode::kAlreadyExists, pathname_.Canonical(), "already exists");
  }
  EnsureParent(parents);
  detail::CallAdapter(pathname_, [&]() { core->adapter->CreateFile(pathname_, parents); });
}

void Node::Delete(bool recursive, bool force) {
  auto core = Core();
  auto metadata = detail::StatAt(*core, pathname_);
  if (!metadata) {
    if (force) {
      return;
    }
    throw MakeError(ErrorCode::kNotFound, pathname_.Canonical(), "does not exist");
  }
  if (metadata->type == NodeType::kDirectory && !recursive) {
    auto entries =
        detail::CallAdapter(pathname_, [&]() { return core->adapter->ReadDirectory(pathname_); });
    if (!entries.empty()) {
      throw MakeError(ErrorCode::kDirectoryNotEmpty, pathname_.Canonical(), "is not empty");
    }
  }
  detail::CallAdapter(pathname_, [&]() { core->adapter->Delete(pathname_, recursive, force); });
  diag::Emit(diag::EventCategory::kLifecycle, diag::EventSeverity::kInfo, "node_deleted",
             "Node deleted",
             {diag::EventField("path", pathname_.Canonical(), diag::FieldPrivacy::kHash),
              diag::EventField("type", std::string(NodeTypeName(metadata->type))),
              diag::EventField("recursive", recursive ? "true" : "false", diag::FieldPrivacy::kPublic,
                               true)});
}

std::string Node::Digest(int algorithm, bool raw) const {
  auto core = Core();
  auto resolved = detail::ResolveFinal(*core, pathname_);
  if (!resolved.metadata) {
    throw MakeError(ErrorCode::kNotFound, pathname_.Canonical(), "does not exist");
  }
  if (resolved.metadata->type != NodeType::kFile && resolved.metadata->type != NodeType::kUnknown) {
    throw MakeError(ErrorCode::kUnsupported, pathname_.Canonical(), "digest is only defined for files");
  }
  auto stream = OpenInputStream();
  const auto chunk = core->options.io_chunk_size;
  auto digest = detail::CallAdapter(pathname_, [&]() {
    auto bytes =
        crypto::DigestStream(static_cast<crypto::DigestAlgorithm>(algorithm), *stream, chunk);
    stream->Close();
    return bytes;
  });
  if (raw) {
    return std::string(digest.begin(), digest.end());
  }
  return crypto::HexEncode(digest);
}

std::string Node::MD5(bool raw) const {
  return Digest(static_cast<int>(crypto::DigestAlgorithm::kMd5), raw);
}

std::string Node::SHA1(bool raw) const {
  return Digest(static_cast<int>(crypto::DigestAlgorithm::kSha1), raw);
}

std::string Node::RealUrl() const {
  auto core = Core();
  RequireCapability(*core, pathname_, Capability::kUrl);
  return detail::CallAdapter(pathname_, [&]() { return core->adapter->RealUrl(pathname_); });
}

std::string Node::PublicUrl() const {
  auto core = Core();
  RequireCapability(*core, pathname_, Capability::kPublicUrl);
  return detail::CallAdapter(pathname_, [&]() { return core->adapter->PublicUrl(pathname_); });
}

std::string Node::FilesystemLabel() const { return Core()->label; }

CapabilitySet Node::Capabilities() const { return Core()->adapter->Capabilities(); }

bool Node::BelongsTo(const Filesystem& filesystem) const noexcept {
  auto core = core_.lock();
  return core && core == filesystem.core_;
}

bool Node::operator==(const Node& other) const noexcept {
  const bool same_owner = !core_.owner_before(other.core_) && !other.core_.owner_before(core_);
  return same_owner && pathname_ == other.pathname_;
}

}  // namespace fsn::node
