#include "dupescan.hh"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

#include "content_grouper.hh"
#include "context.hh"
#include "handle_budget.hh"
#include "keyed_grouper.hh"
#include "oss.hh"
#include "size_classifier.hh"
#include "stream_hasher.hh"

namespace dupescan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

static void check_options(const std::vector<fs::path> &paths,
                          const options_t &opts) {
  if (paths.empty()) {
    throw std::invalid_argument("find_dupes: no paths given");
  }
  if (opts.head_size == 0 || opts.chunk_size == 0) {
    throw std::invalid_argument("find_dupes: head and chunk size must be > 0");
  }
  if (opts.jobs == 0) {
    throw std::invalid_argument("find_dupes: jobs must be > 0");
  }
  if (opts.max_open == 0) {
    throw std::invalid_argument("find_dupes: max_open must be > 0");
  }
}

static void log_stage(timer_t &timer, const bucket_map_t &groups) {
  if (!log_on(log_lv::log)) {
    return;
  }
  std::size_t files = 0;
  for (const auto &[key, group] : groups) {
    files += group.size();
  }
  oss(std::cerr) << "[log] " << groups.size() << " groups, " << files
                 << " files, elapsed: " << timer.time().count() << "ms\n";
}

bucket_map_t DUPESCAN_EXPORT find_dupes(const std::vector<fs::path> &paths,
                                        const options_t &opts) {
  check_options(paths, opts);
  const EVP_MD *md = digest_by_name(opts.digest);
  const auto head_size = opts.head_size;
  const auto chunk_size = opts.chunk_size;
  const auto min_size = opts.min_size;
  const auto *cancel = opts.cancel;

  ctx_t ctx(opts.jobs, opts.on_progress, opts.on_failure, opts.cancel);
  timer_t timer;

  // seed, every path in one group
  bucket_map_t groups;
  groups.emplace(bucket_key_t{seed_t{}}, group_t(paths.begin(), paths.end()));

  groups = group_by(
      groups,
      per_path([min_size](const fs::path &path) {
        return size_key(path, min_size);
      }),
      stage_t{"sizes"}, ctx);
  log_stage(timer, groups);

  // cheap elimination of same size files, also keeps exact mode groups small
  groups = group_by(
      groups,
      per_path([md, head_size, chunk_size, cancel](const fs::path &path) {
        return std::optional(
            hash_file(path, md, head_size, chunk_size, cancel));
      }),
      stage_t{"header hashes"}, ctx);
  log_stage(timer, groups);

  if (opts.exact) {
    handle_budget_t budget(opts.max_open);
    groups = group_by(
        groups,
        [&budget, chunk_size](const group_t &group, const ctx_t &run) {
          return group_by_content(group, run, budget, chunk_size);
        },
        stage_t{"contents"}, ctx);
  } else {
    groups = group_by(
        groups,
        per_path([md, chunk_size, cancel](const fs::path &path) {
          return std::optional(
              hash_file(path, md, std::nullopt, chunk_size, cancel));
        }),
        stage_t{"hashes"}, ctx);
  }
  log_stage(timer, groups);

  return groups;
}

std::vector<group_t> DUPESCAN_EXPORT to_groups(bucket_map_t groups) {
  std::vector<group_t> dupe_list;
  dupe_list.reserve(groups.size());
  for (auto &[key, group] : groups) {
    std::sort(group.begin(), group.end());
    dupe_list.emplace_back(std::move(group));
  }
  std::sort(dupe_list.begin(), dupe_list.end());
  return dupe_list;
}

}  // namespace detail_v1

}  // namespace dupescan
