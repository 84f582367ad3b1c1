#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "config.hh"
#include "types.hh"

namespace dupescan {

inline namespace detail_v1 {

struct options_t {
  // compare bytes instead of digests
  bool exact = false;
  std::uintmax_t min_size = default_min_size;
  std::uintmax_t head_size = head_sz;
  std::size_t chunk_size = chunk_sz;
  // any libcrypto digest of at least 160 bits
  std::string digest{default_digest};
  uint32_t jobs = std::max(1U, std::thread::hardware_concurrency());
  std::size_t max_open = default_max_open;
  progress_fn on_progress;
  failure_fn on_failure;
  // raised by the caller to abort between groups and chunks
  const std::atomic<bool> *cancel = nullptr;
};

/**
 * @brief detects duplicate files by size, header hash, then full hash or
 * byte-for-byte comparison.
 *
 * In hash mode two files are reported equal when both their header and full
 * digests match; the residual collision risk is astronomically small but not
 * zero. Set exact to compare contents instead.
 *
 * @param paths absolute, symlink-resolved, unique regular file paths
 * @param opts see options_t
 * @return bucket_map_t groups of at least two duplicates
 * @throws std::invalid_argument empty input or invalid options
 * @throws cancelled_error opts.cancel was raised
 */
bucket_map_t find_dupes(const std::vector<std::filesystem::path> &paths,
                        const options_t &opts = {});

/**
 * @brief flatten a bucket map for display, members and groups sorted
 */
std::vector<group_t> to_groups(bucket_map_t groups);

}  // namespace detail_v1

}  // namespace dupescan
