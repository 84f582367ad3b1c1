#include "stream_hasher.hh"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace dupescan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

hasher_t::hasher_t(const EVP_MD *md) : _ctx(EVP_MD_CTX_new()), _md(md) {
  if (_ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  reset();
}

hasher_t::~hasher_t() noexcept {
  if (_ctx != nullptr) {
    EVP_MD_CTX_free(_ctx);
  }
}

void hasher_t::reset() {
  if (EVP_DigestInit_ex(_ctx, _md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void hasher_t::update(const char *data, const std::size_t size) {
  if (EVP_DigestUpdate(_ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

digest_t hasher_t::digest() {
  digest_t md(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(_ctx, md.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  md.resize(len);
  return md;
}

const EVP_MD *digest_by_name(std::string_view name) {
  const std::string name_str(name);
  const EVP_MD *md = EVP_get_digestbyname(name_str.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("unknown digest: " + name_str);
  }
  if (EVP_MD_size(md) < static_cast<int>(min_digest_len)) {
    throw std::invalid_argument("digest shorter than 160 bits: " + name_str);
  }
  return md;
}

digest_t hash_file(const fs::path &path, const EVP_MD *md,
                   const std::optional<std::uintmax_t> limit,
                   const std::size_t chunk_size,
                   const std::atomic<bool> *cancel) {
  if (chunk_size == 0 || (limit && *limit == 0)) {
    throw std::invalid_argument("hash_file: zero chunk size or limit");
  }
  // per thread read buffer
  thread_local std::vector<char> buf;

  const auto read_sz =
      limit ? (std::size_t)std::min<std::uintmax_t>(chunk_size, *limit)
            : chunk_size;
  if (buf.size() < read_sz) {
    buf.resize(read_sz);
  }

  errno = 0;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    const int err = errno != 0 ? errno : EIO;
    throw fs::filesystem_error("open", path,
                               std::error_code(err, std::generic_category()));
  }

  hasher_t hasher(md);
  std::uintmax_t consumed = 0;
  while (true) {
    if (cancel != nullptr && cancel->load(std::memory_order_relaxed)) {
      throw cancelled_error();
    }
    const auto read_len = ifs.read(buf.data(), (int64_t)read_sz).gcount();
    if (ifs.bad()) {
      throw fs::filesystem_error("read", path,
                                 std::make_error_code(std::errc::io_error));
    }
    if (read_len > 0) {
      hasher.update(buf.data(), (std::size_t)read_len);
    }
    consumed += read_sz;
    if ((uint64_t)read_len < read_sz) {
      // end of file
      break;
    }
    if (limit && consumed >= *limit) {
      break;
    }
  }
  return hasher.digest();
}

}  // namespace detail_v1

}  // namespace dupescan
