#pragma once

#include <openssl/evp.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "config.hh"
#include "types.hh"

namespace dupescan {

inline namespace detail_v1 {

// RAII wrapper for an OpenSSL digest context.
class hasher_t {
  EVP_MD_CTX *_ctx;
  const EVP_MD *_md;

 public:
  explicit hasher_t(const EVP_MD *md);
  ~hasher_t() noexcept;

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void reset();
  void update(const char *data, const std::size_t size);
  digest_t digest();
};

/**
 * @brief look up a digest supported by libcrypto
 *
 * @param name digest name, ex. sha1, sha256
 * @throws std::invalid_argument unknown digest or shorter than 160 bits
 */
const EVP_MD *digest_by_name(std::string_view name);

/**
 * @brief digest a file in chunk_size reads to cap memory.
 *
 * With a limit, reads are min(chunk_size, limit) bytes long and hashing stops
 * once limit bytes (rounded up to a whole read) are consumed: a header hash.
 *
 * Digests are an equality oracle only. Equal digests carry an astronomically
 * small collision risk; exact mode (content_grouper.hh) compares bytes
 * instead and never consults a digest.
 *
 * @param path file to read
 * @param md digest algorithm
 * @param limit optional byte limit, must be > 0
 * @param chunk_size bytes per read, must be > 0
 * @param cancel checked between reads, may be nullptr
 * @return digest_t raw digest
 * @throws std::filesystem::filesystem_error open or read failure
 * @throws cancelled_error cancel was raised
 */
digest_t hash_file(const std::filesystem::path &path, const EVP_MD *md,
                   const std::optional<std::uintmax_t> limit = std::nullopt,
                   const std::size_t chunk_size = chunk_sz,
                   const std::atomic<bool> *cancel = nullptr);

}  // namespace detail_v1

}  // namespace dupescan
