#pragma once

#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fsn/error.h"
#include "fsn/node/adapter.h"
#include "fsn/path/pathname.h"

namespace fsn::testing {

using node::Capability;
using node::CapabilitySet;
using node::NodeType;
using path::Pathname;

inline CapabilitySet AllCapabilities() {
  return CapabilitySet{Capability::kLinks,        Capability::kOwnership,  Capability::kMode,
                       Capability::kAccessTime,   Capability::kModifyTime, Capability::kCreationTime,
                       Capability::kRename,       Capability::kTruncate,   Capability::kUrl,
                       Capability::kPublicUrl};
}

// POSIX-style tree held in a map keyed by canonical pathname. Directory
// enumeration comes back in reverse name order so callers cannot rely on the
// backend for sorting.
class MemoryAdapter : public node::Adapter {
 public:
  struct Entry {
    NodeType type{NodeType::kFile};
    std::vector<std::uint8_t> data;
    std::string link;
    std::uint32_t owner{1000};
    std::uint32_t group{1000};
    std::uint32_t mode{0644};
    node::Timestamp access_time{};
    node::Timestamp modify_time{};
    node::Timestamp creation_time{};
  };

  explicit MemoryAdapter(CapabilitySet capabilities = AllCapabilities())
      : capabilities_(capabilities) {
    Entry root;
    root.type = NodeType::kDirectory;
    root.mode = 0755;
    entries_.emplace("/", root);
  }

  // --- fixture setup -------------------------------------------------------
  void AddDirectory(std::string_view raw) {
    Entry entry;
    entry.type = NodeType::kDirectory;
    entry.mode = 0755;
    Insert(raw, std::move(entry));
  }

  void AddFile(std::string_view raw, std::string_view content = {}) {
    Entry entry;
    entry.data.assign(content.begin(), content.end());
    Insert(raw, std::move(entry));
  }

  void AddLink(std::string_view raw, std::string_view target) {
    Entry entry;
    entry.type = NodeType::kLink;
    entry.link = std::string(target);
    entry.mode = 0777;
    Insert(raw, std::move(entry));
  }

  void SetCapabilities(CapabilitySet capabilities) { capabilities_ = capabilities; }
  void SetTypeHints(bool enabled) { type_hints_ = enabled; }
  void FailWritesTo(std::string_view raw) { fail_writes_.insert(Key(raw)); }
  void FailReadsOf(std::string_view raw) { fail_reads_.insert(Key(raw)); }
  // OpenRead throws a plain std::runtime_error instead of fsn::Error.
  void ThrowForeignOn(std::string_view raw) { foreign_failures_.insert(Key(raw)); }
  void FailDeleteOf(std::string_view raw) { fail_deletes_.insert(Key(raw)); }
  void RejectMetadataUpdates(bool reject) { reject_metadata_ = reject; }

  [[nodiscard]] bool Has(std::string_view raw) const { return entries_.count(Key(raw)) != 0; }
  [[nodiscard]] const Entry& At(std::string_view raw) const { return entries_.at(Key(raw)); }
  [[nodiscard]] std::string Content(std::string_view raw) const {
    const auto& data = entries_.at(Key(raw)).data;
    return std::string(data.begin(), data.end());
  }
  [[nodiscard]] int RenameCalls() const noexcept { return rename_calls_; }
  [[nodiscard]] int TruncateCalls() const noexcept { return truncate_calls_; }

  // --- Adapter -------------------------------------------------------------
  CapabilitySet Capabilities() const override { return capabilities_; }

  std::optional<node::NodeMetadata> Stat(const Pathname& pathname) override {
    auto real = ResolveIntermediate(pathname);
    auto it = entries_.find(real.Canonical());
    if (it == entries_.end()) {
      return std::nullopt;
    }
    const Entry& entry = it->second;
    node::NodeMetadata metadata;
    metadata.type = entry.type;
    if (entry.type == NodeType::kFile) {
      metadata.size = entry.data.size();
    } else if (entry.type == NodeType::kLink) {
      metadata.size = entry.link.size();
    } else {
      metadata.size = 0;
    }
    if (capabilities_.Has(Capability::kOwnership)) {
      metadata.owner = entry.owner;
      metadata.group = entry.group;
    }
    if (capabilities_.Has(Capability::kMode)) {
      metadata.mode = entry.mode;
    }
    if (capabilities_.Has(Capability::kAccessTime)) {
      metadata.access_time = entry.access_time;
    }
    if (capabilities_.Has(Capability::kModifyTime)) {
      metadata.modify_time = entry.modify_time;
    }
    if (capabilities_.Has(Capability::kCreationTime)) {
      metadata.creation_time = entry.creation_time;
    }
    return metadata;
  }

  std::vector<node::DirectoryEntry> ReadDirectory(const Pathname& pathname) override {
    auto real = Resolve(pathname, true);
    const Entry& dir = Require(real);
    if (dir.type != NodeType::kDirectory) {
      throw MakeError(ErrorCode::kNotADirectory, real.Canonical(), "is not a directory!");
    }
    std::vector<node::DirectoryEntry> result;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
      if (IsDirectChild(real, it->first)) {
        node::DirectoryEntry entry;
        entry.name = it->first.substr(it->first.rfind('/') + 1);
        entry.type_hint = type_hints_ ? it->second.type : NodeType::kUnknown;
        result.push_back(std::move(entry));
      }
    }
    return result;
  }

  std::unique_ptr<node::InputStream> OpenRead(const Pathname& pathname) override {
    auto real = Resolve(pathname, true);
    if (foreign_failures_.count(real.Canonical()) != 0) {
      throw std::runtime_error("simulated transport fault");
    }
    const Entry& entry = Require(real);
    if (entry.type == NodeType::kDirectory) {
      throw MakeError(ErrorCode::kNotAFile, real.Canonical(), "is a directory");
    }
    return std::make_unique<Input>(entry.data, fail_reads_.count(real.Canonical()) != 0, real);
  }

  std::unique_ptr<node::OutputStream> OpenWrite(const Pathname& pathname, bool append) override {
    auto real = Resolve(pathname, true);
    auto it = entries_.find(real.Canonical());
    if (it == entries_.end()) {
      RequireDirectoryParent(real);
      it = entries_.emplace(real.Canonical(), Entry{}).first;
    } else if (it->second.type == NodeType::kDirectory) {
      throw MakeError(ErrorCode::kNotAFile, real.Canonical(), "is a directory");
    }
    if (!append) {
      it->second.data.clear();
    }
    return std::make_unique<Output>(*this, real, fail_writes_.count(real.Canonical()) != 0);
  }

  void CreateDirectory(const Pathname& pathname, bool parents) override {
    Create(pathname, parents, NodeType::kDirectory);
  }

  void CreateFile(const Pathname& pathname, bool parents) override {
    Create(pathname, parents, NodeType::kFile);
  }

  void Delete(const Pathname& pathname, bool recursive, bool force) override {
    auto real = ResolveIntermediate(pathname);
    if (real.IsRoot()) {
      throw MakeError(ErrorCode::kInvalidPath, real.Canonical(), "is the root");
    }
    if (fail_deletes_.count(real.Canonical()) != 0) {
      throw MakeError(ErrorCode::kIOFailure, real.Canonical(), "could not be deleted", 5);
    }
    auto it = entries_.find(real.Canonical());
    if (it == entries_.end()) {
      if (force) {
        return;
      }
      throw MakeError(ErrorCode::kNotFound, real.Canonical(), "does not exist");
    }
    if (it->second.type == NodeType::kDirectory) {
      auto descendants = Descendants(real);
      if (!descendants.empty() && !recursive) {
        throw MakeError(ErrorCode::kDirectoryNotEmpty, real.Canonical(), "is not empty");
      }
      for (const auto& key : descendants) {
        entries_.erase(key);
      }
    }
    entries_.erase(real.Canonical());
  }

  Pathname ResolveLink(const Pathname& pathname) override {
    RequireCapability(pathname, Capability::kLinks);
    auto real = ResolveIntermediate(pathname);
    const Entry& entry = Require(real);
    if (entry.type != NodeType::kLink) {
      throw MakeError(ErrorCode::kNotALink, real.Canonical(), "is not a link");
    }
    return path::ResolveLinkTarget(real, entry.link);
  }

  void SetMetadata(const Pathname& pathname, node::MetadataField field,
                   const node::MetadataValue& value) override {
    RequireCapability(pathname, node::CapabilityFor(field));
    if (reject_metadata_) {
      throw MakeError(ErrorCode::kUnsupported, pathname.Canonical(), "metadata is read-only here");
    }
    auto real = Resolve(pathname, true);
    Entry& entry = RequireMutable(real);
    switch (field) {
    case node::MetadataField::kOwner:
      entry.owner = std::get<std::uint32_t>(value);
      break;
    case node::MetadataField::kGroup:
      entry.group = std::get<std::uint32_t>(value);
      break;
    case node::MetadataField::kMode:
      entry.mode = std::get<std::uint32_t>(value);
      break;
    case node::MetadataField::kAccessTime:
      entry.access_time = std::get<node::Timestamp>(value);
      break;
    case node::MetadataField::kModifyTime:
      entry.modify_time = std::get<node::Timestamp>(value);
      break;
    }
  }

  void Rename(const Pathname& from, const Pathname& to) override {
    RequireCapability(from, Capability::kRename);
    ++rename_calls_;
    auto real_from = ResolveIntermediate(from);
    auto real_to = ResolveIntermediate(to);
    Require(real_from);
    RequireDirectoryParent(real_to);
    std::vector<std::pair<std::string, Entry>> moved;
    for (const auto& key : Descendants(real_from)) {
      moved.emplace_back(real_to.Canonical() + key.substr(real_from.Canonical().size()),
                         entries_.at(key));
      entries_.erase(key);
    }
    moved.emplace_back(real_to.Canonical(), entries_.at(real_from.Canonical()));
    entries_.erase(real_from.Canonical());
    for (auto& [key, entry] : moved) {
      entries_[key] = std::move(entry);
    }
  }

  void Truncate(const Pathname& pathname, std::uint64_t size) override {
    RequireCapability(pathname, Capability::kTruncate);
    ++truncate_calls_;
    auto real = Resolve(pathname, true);
    RequireMutable(real).data.resize(static_cast<std::size_t>(size), 0);
  }

  std::string RealUrl(const Pathname& pathname) override {
    RequireCapability(pathname, Capability::kUrl);
    return "memory://" + pathname.Canonical();
  }

  std::string PublicUrl(const Pathname& pathname) override {
    RequireCapability(pathname, Capability::kPublicUrl);
    Require(ResolveIntermediate(pathname));
    return "https://files.example.test" + pathname.Canonical();
  }

 private:
  class Input : public node::InputStream {
   public:
    Input(std::vector<std::uint8_t> data, bool fail, Pathname pathname)
        : data_(std::move(data)), fail_(fail), pathname_(std::move(pathname)) {}

    std::size_t Read(std::span<std::uint8_t> buffer) override {
      if (fail_) {
        throw MakeError(ErrorCode::kIOFailure, pathname_.Canonical(), "read failed", 5);
      }
      const std::size_t count = std::min(buffer.size(), data_.size() - offset_);
      std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), count, buffer.begin());
      offset_ += count;
      return count;
    }
    void Close() override {}

   private:
    std::vector<std::uint8_t> data_;
    std::size_t offset_{0};
    bool fail_;
    Pathname pathname_;
  };

  class Output : public node::OutputStream {
   public:
    Output(MemoryAdapter& owner, Pathname pathname, bool fail)
        : owner_(owner), pathname_(std::move(pathname)), fail_(fail) {}

    void Write(std::span<const std::uint8_t> data) override {
      if (fail_) {
        throw MakeError(ErrorCode::kIOFailure, pathname_.Canonical(), "write failed", 28);
      }
      auto& target = owner_.RequireMutable(pathname_).data;
      target.insert(target.end(), data.begin(), data.end());
    }
    void Flush() override {}
    void Close() override {}

   private:
    MemoryAdapter& owner_;
    Pathname pathname_;
    bool fail_;
  };

  static std::string Key(std::string_view raw) { return Pathname::Normalize(raw).Canonical(); }

  void Insert(std::string_view raw, Entry entry) {
    auto pathname = Pathname::Normalize(raw);
    for (auto parent = pathname.Parent(); parent && !parent->IsRoot(); parent = parent->Parent()) {
      if (entries_.count(parent->Canonical()) == 0) {
        Entry dir;
        dir.type = NodeType::kDirectory;
        dir.mode = 0755;
        entries_.emplace(parent->Canonical(), dir);
      }
    }
    entries_[pathname.Canonical()] = std::move(entry);
  }

  void RequireCapability(const Pathname& pathname, Capability capability) const {
    if (!capabilities_.Has(capability)) {
      throw MakeError(ErrorCode::kUnsupported, pathname.Canonical(),
                      "memory backend has " + std::string(node::CapabilityName(capability)) +
                          " disabled");
    }
  }

  const Entry& Require(const Pathname& real) const {
    auto it = entries_.find(real.Canonical());
    if (it == entries_.end()) {
      throw MakeError(ErrorCode::kNotFound, real.Canonical(), "does not exist");
    }
    return it->second;
  }

  Entry& RequireMutable(const Pathname& real) {
    auto it = entries_.find(real.Canonical());
    if (it == entries_.end()) {
      throw MakeError(ErrorCode::kNotFound, real.Canonical(), "does not exist");
    }
    return it->second;
  }

  void RequireDirectoryParent(const Pathname& real) const {
    auto parent = real.Parent();
    if (!parent) {
      return;
    }
    const Entry& entry = Require(*parent);
    if (entry.type != NodeType::kDirectory) {
      throw MakeError(ErrorCode::kNotADirectory, parent->Canonical(), "is not a directory!");
    }
  }

  void Create(const Pathname& pathname, bool parents, NodeType type) {
    auto real = ResolveIntermediate(pathname);
    if (entries_.count(real.Canonical()) != 0) {
      throw MakeError(ErrorCode::kAlreadyExists, real.Canonical(), "already exists");
    }
    auto parent = real.Parent();
    if (parent && entries_.count(parent->Canonical()) == 0) {
      if (!parents) {
        throw MakeError(ErrorCode::kNotFound, parent->Canonical(), "does not exist");
      }
      Create(*parent, true, NodeType::kDirectory);
    }
    RequireDirectoryParent(real);
    Entry entry;
    entry.type = type;
    entry.mode = type == NodeType::kDirectory ? 0755 : 0644;
    entries_.emplace(real.Canonical(), entry);
  }

  std::vector<std::string> Descendants(const Pathname& real) const {
    std::vector<std::string> keys;
    const std::string prefix = real.IsRoot() ? real.Canonical() : real.Canonical() + "/";
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
      if (it->first.compare(0, prefix.size(), prefix) != 0) {
        break;
      }
      if (it->first != real.Canonical()) {
        keys.push_back(it->first);
      }
    }
    return keys;
  }

  static bool IsDirectChild(const Pathname& dir, const std::string& key) {
    if (key == dir.Canonical()) {
      return false;
    }
    const std::string prefix = dir.IsRoot() ? dir.Canonical() : dir.Canonical() + "/";
    return key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0 &&
           key.find('/', prefix.size()) == std::string::npos;
  }

  // Follows links in every segment but the last; the last too when
  // follow_last is set.
  Pathname Resolve(const Pathname& pathname, bool follow_last) const {
    int hops = 0;
    return Resolve(pathname, follow_last, hops);
  }

  Pathname Resolve(const Pathname& pathname, bool follow_last, int& hops) const {
    Pathname current;
    const auto& segments = pathname.Segments();
    for (std::size_t i = 0; i < segments.size(); ++i) {
      Pathname candidate = current.Child(segments[i]);
      auto it = entries_.find(candidate.Canonical());
      const bool last = i + 1 == segments.size();
      if (it != entries_.end() && it->second.type == NodeType::kLink && (!last || follow_last) &&
          capabilities_.Has(Capability::kLinks)) {
        if (++hops > 40) {
          throw MakeError(ErrorCode::kCyclicStructure, pathname.Canonical(),
                          "has too many levels of symbolic links", 40);
        }
        current = Resolve(path::ResolveLinkTarget(candidate, it->second.link), true, hops);
      } else {
        current = candidate;
      }
    }
    return current;
  }

  Pathname ResolveIntermediate(const Pathname& pathname) const {
    auto parent = pathname.Parent();
    if (!parent) {
      return pathname;
    }
    return Resolve(*parent, true).Child(pathname.Basename());
  }

  std::map<std::string, Entry> entries_;
  CapabilitySet capabilities_;
  bool type_hints_{true};
  bool reject_metadata_{false};
  std::set<std::string> fail_writes_;
  std::set<std::string> fail_reads_;
  std::set<std::string> foreign_failures_;
  std::set<std::string> fail_deletes_;
  int rename_calls_{0};
  int truncate_calls_{0};
};

}  // namespace fsn::testing
