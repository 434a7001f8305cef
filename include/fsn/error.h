#pragma once
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fsn {
  enum class ErrorDomain : std::uint16_t {
    Validation = 0x01,
    IO = 0x02,
    State = 0x03,
    Capability = 0x04,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so that propagated errno values never
  // collide with framework codes. Codes inside the reserved range are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Validation:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::State:
      return 0x0300;
    case ErrorDomain::Capability:
      return 0x0400;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }
  } // namespace errors

  enum class ErrorCode : int {
    kInvalidPath = errors::Make(ErrorDomain::Validation, 0x01),
    kInvalidFilter = errors::Make(ErrorDomain::Validation, 0x02),
    kNotFound = errors::Make(ErrorDomain::State, 0x01),
    kNotAFile = errors::Make(ErrorDomain::State, 0x02),
    kNotADirectory = errors::Make(ErrorDomain::State, 0x03),
    kNotALink = errors::Make(ErrorDomain::State, 0x04),
    kAlreadyExists = errors::Make(ErrorDomain::State, 0x05),
    kDirectoryNotEmpty = errors::Make(ErrorDomain::State, 0x06),
    kCyclicStructure = errors::Make(ErrorDomain::State, 0x07),
    kDetached = errors::Make(ErrorDomain::State, 0x08),
    kIOFailure = errors::Make(ErrorDomain::IO, 0x01),
    kUnsupported = errors::Make(ErrorDomain::Capability, 0x01),
  };

  inline constexpr ErrorDomain DomainOf(ErrorCode code) {
    const int value = static_cast<int>(code);
    for (auto domain : {ErrorDomain::Validation, ErrorDomain::IO, ErrorDomain::State,
                        ErrorDomain::Capability}) {
      if (value >= ErrorDomainBase(domain) && value <= ErrorDomainMax(domain)) {
        return domain;
      }
    }
    return ErrorDomain::Internal;
  }

  std::string_view ErrorCodeName(ErrorCode code) noexcept;

  // Maps a platform errno value onto the taxonomy. Unknown values become
  // kIOFailure.
  ErrorCode ErrorCodeFromErrno(int native) noexcept;

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    ErrorCode code;
    std::string pathname;            // canonical form of the offending path, empty if none
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    bool partial{false};             // a structural mutation stopped midway
    std::vector<std::string> context;

    explicit Error(ErrorCode c, std::string msg, std::string path = {},
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(DomainOf(c)),
          code(c),
          pathname(std::move(path)),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Builds "Pathname <path> <detail>" style messages so that every raise site
  // reports the path the same way.
  Error MakeError(ErrorCode code, std::string_view pathname, std::string_view detail,
                  std::optional<int> native = std::nullopt);

  // Accumulates nested call context and stamps it onto errors that escape.
  class ErrorContext {
   public:
    void Push(std::string context) { stack_.push_back(std::move(context)); }
    void Pop() {
      if (!stack_.empty()) {
        stack_.pop_back();
      }
    }
    [[nodiscard]] const std::vector<std::string>& Stack() const { return stack_; }
    void Annotate(Error& error) const;

   private:
    std::vector<std::string> stack_;
  };

  class ScopedErrorContext {
   public:
    ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
      ctx_.Push(std::move(description));
    }
    ScopedErrorContext(const ScopedErrorContext&) = delete;
    ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
    ~ScopedErrorContext() { ctx_.Pop(); }

   private:
    ErrorContext& ctx_;
  };
} // namespace fsn
