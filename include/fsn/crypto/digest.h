#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "fsn/config.h"

namespace fsn::node {
class InputStream;
}  // namespace fsn::node

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace fsn::crypto {

enum class DigestAlgorithm { kMd5, kSha1, kSha256 };

std::size_t DigestSize(DigestAlgorithm algorithm) noexcept;

// Incremental digest over an OpenSSL EVP_MD_CTX.
class Hasher {
public:
  explicit Hasher(DigestAlgorithm algorithm);
  ~Hasher();

  Hasher(const Hasher&) = delete;
  Hasher& operator=(const Hasher&) = delete;

  void Update(std::span<const uint8_t> data);
  // Finalizes; the hasher cannot be updated afterwards.
  std::vector<uint8_t> Finish();

private:
  struct ContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept;
  };

  DigestAlgorithm algorithm_;
  std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
  bool finished_{false};
};

std::vector<uint8_t> DigestBytes(DigestAlgorithm algorithm, std::span<const uint8_t> data);

// Pulls the stream through the digest chunk_size bytes at a time; content is
// never materialized as a whole.
std::vector<uint8_t> DigestStream(DigestAlgorithm algorithm, node::InputStream& stream,
                                  std::size_t chunk_size = kDefaultIoChunkSize);

std::string HexEncode(std::span<const uint8_t> bytes);

} // namespace fsn::crypto
