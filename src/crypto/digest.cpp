#include "fsn/crypto/digest.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <string>

#include "fsn/error.h"
#include "fsn/node/adapter.h"

namespace fsn::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

[[noreturn]] void ThrowDigestError(const std::string& message) {
  throw Error{ErrorCode::kIOFailure, message};
}

const EVP_MD* MessageDigestFor(DigestAlgorithm algorithm) {
  switch (algorithm) {
  case DigestAlgorithm::kMd5:
    return EVP_md5();
  case DigestAlgorithm::kSha1:
    return EVP_sha1();
  case DigestAlgorithm::kSha256:
    return EVP_sha256();
  }
  return EVP_sha256();
}

}  // namespace

std::size_t DigestSize(DigestAlgorithm algorithm) noexcept {
  switch (algorithm) {
  case DigestAlgorithm::kMd5:
    return 16;
  case DigestAlgorithm::kSha1:
    return 20;
  case DigestAlgorithm::kSha256:
    return 32;
  }
  return 0;
}

void Hasher::ContextDeleter::operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }

Hasher::Hasher(DigestAlgorithm algorithm) : algorithm_(algorithm), ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    ThrowDigestError(BuildOpenSSLErrorMessage("EVP_MD_CTX_new"));
  }
  if (EVP_DigestInit_ex(ctx_.get(), MessageDigestFor(algorithm_), nullptr) != 1) {
    ThrowDigestError(BuildOpenSSLErrorMessage("EVP_DigestInit_ex"));
  }
}

Hasher::~Hasher() = default;

void Hasher::Update(std::span<const uint8_t> data) {
  if (finished_) {
    ThrowDigestError("digest already finalized");
  }
  if (data.empty()) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    ThrowDigestError(BuildOpenSSLErrorMessage("EVP_DigestUpdate"));
  }
}

std::vector<uint8_t> Hasher::Finish() {
  if (finished_) {
    ThrowDigestError("digest already finalized");
  }
  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
    ThrowDigestError(BuildOpenSSLErrorMessage("EVP_DigestFinal_ex"));
  }
  finished_ = true;
  if (len != DigestSize(algorithm_)) {
    ThrowDigestError("unexpected digest length " + std::to_string(len));
  }
  out.resize(len);
  return out;
}

std::vector<uint8_t> DigestBytes(DigestAlgorithm algorithm, std::span<const uint8_t> data) {
  Hasher hasher(algorithm);
  hasher.Update(data);
  return hasher.Finish();
}

std::vector<uint8_t> DigestStream(DigestAlgorithm algorithm, node::InputStream& stream,
                                  std::size_t chunk_size) {
  if (chunk_size == 0) {
    chunk_size = kDefaultIoChunkSize;
  }
  Hasher hasher(algorithm);
  std::vector<uint8_t> buffer(chunk_size);
  for (;;) {
    const std::size_t got = stream.Read(std::span<uint8_t>(buffer.data(), buffer.size()));
    if (got == 0) {
      break;
    }
    hasher.Update(std::span<const uint8_t>(buffer.data(), got));
  }
  return hasher.Finish();
}

std::string HexEncode(std::span<const uint8_t> bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

} // namespace fsn::crypto
