#include "fsn/node/filesystem.h"

#include <utility>

#include "fsn/diag/event_bus.h"
#include "fsn/error.h"

namespace fsn::node {

Filesystem::Filesystem(std::shared_ptr<Adapter> adapter, FilesystemOptions options, std::string label) {
  if (!adapter) {
    throw Error{ErrorCode::kDetached, "Filesystem '" + label + "' has no adapter"};
  }
  if (options.io_chunk_size == 0 || options.io_chunk_size > kMaxIoChunkSize) {
    options.io_chunk_size = kDefaultIoChunkSize;
  }
  core_ = std::make_shared<detail::FilesystemCore>();
  core_->adapter = std::move(adapter);
  core_->options = std::move(options);
  core_->label = std::move(label);
}

Filesystem::~Filesystem() {
  if (!core_) {
    return;  // moved-from
  }
  diag::Emit(diag::EventCategory::kLifecycle, diag::EventSeverity::kDebug, "filesystem_detached",
             "Filesystem released; outstanding nodes are detached",
             {diag::EventField("label", core_->label)});
}

Node Filesystem::Root() const {
  const auto& core = CoreRef();
  return Node(core_,
              path::Pathname::Normalize(core.options.conventions.default_root, core.options.conventions),
              core.options.conventions.hidden_marker);
}

Node Filesystem::Get(std::string_view raw) const {
  const auto& core = CoreRef();
  return Node(core_, path::Pathname::Normalize(raw, core.options.conventions),
              core.options.conventions.hidden_marker);
}

Node Filesystem::Get(const path::Pathname& pathname) const {
  const auto& core = CoreRef();
  return Node(core_, pathname, core.options.conventions.hidden_marker);
}

const FilesystemOptions& Filesystem::Options() const { return CoreRef().options; }

CapabilitySet Filesystem::Capabilities() const { return CoreRef().adapter->Capabilities(); }

const std::string& Filesystem::Label() const { return CoreRef().label; }

const detail::FilesystemCore& Filesystem::CoreRef() const {
  if (!core_) {
    throw Error{ErrorCode::kDetached, "Filesystem has been moved from"};
  }
  return *core_;
}

}  // namespace fsn::node
