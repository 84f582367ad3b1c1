#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include "types.hh"

namespace dupescan {

inline namespace detail_v1 {

/**
 * @brief parse a keeper selection: "all", or 1-based indices separated by
 * spaces and/or commas. Out of range indices are ignored.
 *
 * @param input user reply
 * @param count number of files shown
 * @return std::optional<std::vector<std::size_t>> 0-based indices to keep,
 * nullopt when the reply is empty, malformed or keeps nothing
 */
std::optional<std::vector<std::size_t>> parse_keepers(std::string_view input,
                                                      const std::size_t count);

/**
 * @brief show a duplicate group and prompt until a valid keeper list is
 * given; keeping none of the files is impossible.
 *
 * @param group duplicate group, displayed sorted
 * @param pos position of this group, for "[pos/total]"
 * @param total number of groups
 * @param in user replies
 * @param out prompts
 * @return group_t files to delete, empty on end of input
 */
group_t prune_ui(group_t group, const std::size_t pos, const std::size_t total,
                 std::istream &in, std::ostream &out);

/**
 * @brief remove files, failures are logged and skipped
 *
 * @param rm_list files to remove
 * @return std::size_t files removed
 */
std::size_t remove(const std::vector<std::filesystem::path> &rm_list);

}  // namespace detail_v1

}  // namespace dupescan
