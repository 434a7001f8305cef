#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "fsn/config.h"
#include "fsn/node/adapter.h"
#include "fsn/node/node.h"
#include "fsn/path/pathname.h"

namespace fsn::node {

namespace detail {

// Shared between a Filesystem and the Nodes it produced. Nodes hold it
// weakly so they notice when the Filesystem is gone.
struct FilesystemCore {
  std::shared_ptr<Adapter> adapter;
  FilesystemOptions options;
  std::string label;
};

}  // namespace detail

// Owns one adapter and is the only producer of Nodes for its tree.
class Filesystem {
 public:
  explicit Filesystem(std::shared_ptr<Adapter> adapter,
                      FilesystemOptions options = FilesystemOptions::FromEnvironment(),
                      std::string label = "default");
  ~Filesystem();

  Filesystem(const Filesystem&) = delete;
  Filesystem& operator=(const Filesystem&) = delete;
  Filesystem(Filesystem&&) noexcept = default;
  Filesystem& operator=(Filesystem&&) noexcept = default;

  [[nodiscard]] Node Root() const;
  // Normalizes raw with this filesystem's conventions.
  [[nodiscard]] Node Get(std::string_view raw) const;
  [[nodiscard]] Node Get(const path::Pathname& pathname) const;

  [[nodiscard]] const FilesystemOptions& Options() const;
  [[nodiscard]] const PathConventions& Conventions() const { return Options().conventions; }
  [[nodiscard]] CapabilitySet Capabilities() const;
  [[nodiscard]] const std::string& Label() const;

 private:
  friend class Node;

  [[nodiscard]] const detail::FilesystemCore& CoreRef() const;

  std::shared_ptr<detail::FilesystemCore> core_;
};

}  // namespace fsn::node
