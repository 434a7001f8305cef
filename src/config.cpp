#include "fsn/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace fsn {

namespace {

constexpr std::uint64_t kMaxLogFileBytes64 = std::uint64_t{1} << 40;
constexpr std::size_t kMaxLogFileBytes =
    kMaxLogFileBytes64 > std::numeric_limits<std::size_t>::max()
        ? std::numeric_limits<std::size_t>::max()
        : static_cast<std::size_t>(kMaxLogFileBytes64);

}  // namespace

std::size_t EnvByteCount(const char* name, std::size_t fallback, std::size_t limit) {
  const char* env = std::getenv(name);
  if (!env || *env == '\0') {
    return fallback;
  }
  const char* end = env + std::strlen(env);
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, end, value);
  if (ec != std::errc() || ptr != end || value == 0 || value > limit) {
    return fallback;
  }
  return static_cast<std::size_t>(value);
}

FilesystemOptions FilesystemOptions::FromEnvironment() { return FromEnvironment(FilesystemOptions{}); }

FilesystemOptions FilesystemOptions::FromEnvironment(FilesystemOptions defaults) {
  defaults.io_chunk_size =
      EnvByteCount("FSN_IO_CHUNK_SIZE", defaults.io_chunk_size, kMaxIoChunkSize);
  return defaults;
}

namespace {

LogLevel ParseLogLevel(std::string_view text, LogLevel fallback) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "info") {
    return LogLevel::kInfo;
  }
  if (lowered == "warning" || lowered == "warn") {
    return LogLevel::kWarning;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  if (lowered == "critical") {
    return LogLevel::kCritical;
  }
  return fallback;
}

}  // namespace

LoggerSettings LoggerSettings::FromEnvironment() {
  LoggerSettings settings;
  const char* dir = std::getenv("FSN_LOG_DIR");
  if (dir && *dir != '\0') {
    settings.directory = dir;
  } else {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    settings.directory = ec ? std::filesystem::path("logs") : cwd / "logs";
  }
  settings.max_bytes = EnvByteCount("FSN_LOG_MAX_SIZE", settings.max_bytes, kMaxLogFileBytes);
  if (const char* level = std::getenv("FSN_LOG_LEVEL"); level && *level != '\0') {
    settings.min_level = ParseLogLevel(level, settings.min_level);
  }
  return settings;
}

}  // namespace fsn
