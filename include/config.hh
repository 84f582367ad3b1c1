#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#define DUPESCAN_EXPORT __attribute__((visibility("default")))

namespace dupescan {

// 64KiB, unit of every read
constexpr auto chunk_sz = 64UL * 1024UL;
// 16KiB, prefix covered by the header hash
constexpr auto head_sz = 16UL * 1024UL;
// files below this size are ignored
constexpr std::uintmax_t default_min_size = 25;
// at least 160 bits
constexpr std::string_view default_digest = "sha1";
constexpr auto min_digest_len = 20U;
// open handles shared by all content comparisons
constexpr auto default_max_open = 256UL;

// version control metadata
constexpr std::array<std::string_view, 4> default_excludes{"*/.svn", "*/.bzr",
                                                           "*/.git", "*/.hg"};

}  // namespace dupescan
