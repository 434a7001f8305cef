#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fsn {

// Describes how a backend spells its paths. Normalization accepts any of the
// declared separators and always emits '/'.
struct PathConventions {
  std::string separators{"/"};
  bool allow_drive_letters{false};  // "C:\dir" style roots
  bool allow_url_scheme{false};     // "ftp://host/dir" style roots
  char hidden_marker{'.'};
  // Root marker given to raw paths that carry none ("/", "C:/", "ftp://host/").
  std::string default_root{"/"};

  static PathConventions Posix() { return PathConventions{}; }
  static PathConventions Windows() {
    PathConventions conventions;
    conventions.separators = "\\/";
    conventions.allow_drive_letters = true;
    return conventions;
  }
  static PathConventions Url() {
    PathConventions conventions;
    conventions.allow_url_scheme = true;
    return conventions;
  }
};

inline constexpr std::size_t kDefaultIoChunkSize = 64 * 1024;
inline constexpr std::size_t kMaxIoChunkSize = 64 * 1024 * 1024;

struct FilesystemOptions {
  PathConventions conventions{};
  std::size_t io_chunk_size{kDefaultIoChunkSize};  // stream copy and digest buffer
  bool sort_listings{true};                        // order children by basename
  bool log_listing_cycles{true};

  // Applies FSN_IO_CHUNK_SIZE on top of the supplied defaults. Invalid or
  // out-of-range values are ignored.
  static FilesystemOptions FromEnvironment();
  static FilesystemOptions FromEnvironment(FilesystemOptions defaults);
};

enum class LogLevel : std::uint8_t { kDebug, kInfo, kWarning, kError, kCritical };

struct LoggerSettings {
  std::filesystem::path directory;
  std::size_t max_bytes{10 * 1024 * 1024};
  std::size_t max_files{3};
  LogLevel min_level{LogLevel::kInfo};

  // FSN_LOG_DIR (default <cwd>/logs), FSN_LOG_MAX_SIZE, FSN_LOG_LEVEL.
  static LoggerSettings FromEnvironment();
};

// Parses a decimal byte count from the environment. Returns the fallback when
// the variable is unset, malformed, zero, or above the limit.
std::size_t EnvByteCount(const char* name, std::size_t fallback, std::size_t limit);

}  // namespace fsn
