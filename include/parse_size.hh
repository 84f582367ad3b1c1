#pragma once

#include <cstdint>
#include <string_view>

namespace dupescan::utils {

/**
 * @brief parse a size string, ex. 25, 4K, 16KiB, 1MB, 8Kb.
 * Units K M G T P E scale by 1000, with an 'i' by 1024, a trailing 'b'
 * counts bits.
 * @throws std::invalid_argument if not a valid size string
 * @throws std::out_of_range if the size does not fit
 */
std::uintmax_t parse_size(std::string_view size_str);

}  // namespace dupescan::utils
