#include "fsn/error.h"

#include <cerrno>
#include <string>

namespace fsn {

std::string_view ErrorCodeName(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::kInvalidPath:
    return "InvalidPath";
  case ErrorCode::kInvalidFilter:
    return "InvalidFilter";
  case ErrorCode::kNotFound:
    return "NotFound";
  case ErrorCode::kNotAFile:
    return "NotAFile";
  case ErrorCode::kNotADirectory:
    return "NotADirectory";
  case ErrorCode::kNotALink:
    return "NotALink";
  case ErrorCode::kAlreadyExists:
    return "AlreadyExists";
  case ErrorCode::kDirectoryNotEmpty:
    return "DirectoryNotEmpty";
  case ErrorCode::kCyclicStructure:
    return "CyclicStructure";
  case ErrorCode::kDetached:
    return "Detached";
  case ErrorCode::kIOFailure:
    return "IOFailure";
  case ErrorCode::kUnsupported:
    return "Unsupported";
  }
  return "Unknown";
}

ErrorCode ErrorCodeFromErrno(int native) noexcept {
  switch (native) {
  case ENOENT:
    return ErrorCode::kNotFound;
  case ENOTDIR:
    return ErrorCode::kNotADirectory;
  case EISDIR:
    return ErrorCode::kNotAFile;
  case EEXIST:
    return ErrorCode::kAlreadyExists;
  case ENOTEMPTY:
    return ErrorCode::kDirectoryNotEmpty;
  case ELOOP:
    return ErrorCode::kCyclicStructure;
  case EINVAL:
  case ENAMETOOLONG:
    return ErrorCode::kInvalidPath;
#if defined(ENOTSUP)
  case ENOTSUP:
    return ErrorCode::kUnsupported;
#endif
#if defined(ENOSYS)
  case ENOSYS:
    return ErrorCode::kUnsupported;
#endif
  default:
    break;
  }
  return ErrorCode::kIOFailure;
}

namespace {

Retryability ClassifyNativeError(std::optional<int> native) {
  if (!native) {
    return Retryability::kFatal;
  }
  switch (*native) {
#if defined(EINTR)
  case EINTR:
#endif
#if defined(EAGAIN)
  case EAGAIN:
#endif
    return Retryability::kRetryable;
#if defined(EBUSY)
  case EBUSY:
    return Retryability::kTransient;
#endif
#if defined(ETIMEDOUT)
  case ETIMEDOUT:
    return Retryability::kTransient;
#endif
  default:
    break;
  }
  return Retryability::kFatal;
}

}  // namespace

Error MakeError(ErrorCode code, std::string_view pathname, std::string_view detail,
                std::optional<int> native) {
  std::string message;
  if (!pathname.empty()) {
    message.append("Pathname ");
    message.append(pathname);
    message.push_back(' ');
  }
  message.append(detail);
  return Error{code, std::move(message), std::string(pathname), native,
               ClassifyNativeError(native)};
}

void ErrorContext::Annotate(Error& error) const {
  for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
    error.context.push_back(*it);
  }
}

}  // namespace fsn
