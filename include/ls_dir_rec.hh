#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/thread_pool.hpp>

namespace dupescan {

inline namespace detail_v1 {

/**
 * @brief shell glob match (fnmatch) of the full path against any pattern,
 * '*' also matches '/'
 */
bool is_excluded(const std::filesystem::path &path,
                 const std::vector<std::string> &excludes);

/**
 * @brief append an exclude pattern; "-" drops every pattern given so far,
 * the defaults included
 */
void add_exclude(std::vector<std::string> &excludes, std::string_view pat);

/**
 * @brief list directory recursively, skipping symlinks, special files and
 * excluded entries. Excluded directories are not descended into.
 *
 * @param dir directory path
 * @param[out] file_list file list
 * @param mtx mutex for protecting file_list
 * @param pool thread pool for recursive calls
 * @param excludes glob patterns
 * @param cancel stops the walk when raised, may be nullptr
 */
void ls_dir_rec(const std::filesystem::path dir,
                std::vector<std::filesystem::path> &file_list,
                std::mutex &mtx, boost::asio::thread_pool &pool,
                const std::vector<std::string> &excludes,
                const std::atomic<bool> *cancel);

/**
 * @brief resolve roots into a flat list of unique absolute file paths.
 * A root naming a file is kept even when an exclude matches it.
 *
 * @param roots files and directories to walk
 * @param excludes glob patterns, trailing separators are ignored
 * @param max_thread maximum number of threads to use
 * @param cancel checked per directory entry, may be nullptr
 * @return std::vector<std::filesystem::path> sorted, without duplicates
 * @throws cancelled_error cancel was raised during the walk
 */
std::vector<std::filesystem::path> get_paths(
    const std::vector<std::filesystem::path> &roots,
    std::vector<std::string> excludes, const uint32_t max_thread = 4,
    const std::atomic<bool> *cancel = nullptr);

}  // namespace detail_v1

}  // namespace dupescan
