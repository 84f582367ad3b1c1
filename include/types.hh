#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace dupescan {

inline namespace detail_v1 {

// raw digest bytes
using digest_t = std::vector<unsigned char>;

// paths believed to be mutual duplicates, no order guarantee
using group_t = std::vector<std::filesystem::path>;

// seed marker used for the "all files" group
struct seed_t {
  friend auto operator<=>(const seed_t &, const seed_t &) = default;
};

/**
 * @brief one classification result: seed marker, file size, digest or a
 * representative path standing for "same bytes"
 */
using key_part_t =
    std::variant<seed_t, std::uintmax_t, digest_t, std::filesystem::path>;

// refining stages extend the key of the group they split
using bucket_key_t = std::vector<key_part_t>;

using bucket_map_t = std::map<bucket_key_t, group_t>;

/**
 * @brief progress observer
 * (stage name, groups processed, groups total, files examined)
 */
using progress_fn = std::function<void(std::string_view, std::size_t,
                                       std::size_t, std::size_t)>;

// called whenever a path is dropped because of an io error
using failure_fn = std::function<void(const std::filesystem::path &,
                                      const std::error_code &)>;

class cancelled_error : public std::runtime_error {
 public:
  inline cancelled_error() : std::runtime_error("scan cancelled") {}
};

}  // namespace detail_v1

}  // namespace dupescan
