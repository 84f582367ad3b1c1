#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace dupescan {

inline namespace detail_v1 {

/**
 * @brief size of a regular file, using the non-dereferencing stat
 *
 * @param path file to classify
 * @param min_size files smaller than this are ignored
 * @return std::optional<std::uintmax_t> size, or nullopt for symlinks,
 * non-regular files and small files
 * @throws std::filesystem::filesystem_error stat failed
 */
std::optional<std::uintmax_t> size_key(const std::filesystem::path &path,
                                       const std::uintmax_t min_size);

}  // namespace detail_v1

}  // namespace dupescan
