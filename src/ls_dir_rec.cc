#include "ls_dir_rec.hh"

#include <fnmatch.h>

#include <algorithm>
#include <utility>
#include <boost/asio.hpp>
#include <functional>
#include <iostream>
#include <iterator>

#include "oss.hh"
#include "types.hh"

namespace dupescan {

inline namespace detail_v1 {

namespace fs = std::filesystem;
namespace ba = boost::asio;

static bool is_cancelled(const std::atomic<bool> *cancel) noexcept {
  return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

bool is_excluded(const fs::path &path,
                 const std::vector<std::string> &excludes) {
  for (const auto &pat : excludes) {
    if (::fnmatch(pat.c_str(), path.c_str(), 0) == 0) {
      return true;
    }
  }
  return false;
}

void add_exclude(std::vector<std::string> &excludes, std::string_view pat) {
  if (pat == "-") {
    excludes.clear();
    return;
  }
  excludes.emplace_back(pat);
}

void ls_dir_rec(const fs::path dir, std::vector<fs::path> &file_list,
                std::mutex &mtx, ba::thread_pool &pool,
                const std::vector<std::string> &excludes,
                const std::atomic<bool> *cancel) {
  std::vector<fs::path> file_list_tmp;
  try {
    for (const auto &dir_entry : fs::directory_iterator(dir)) {
      if (is_cancelled(cancel)) {
        return;
      }
      if (is_excluded(dir_entry.path(), excludes)) {
        // exclude, skip
        if (log_on(log_lv::log)) {
          oss(std::cerr) << "[log] exclude: " << dir_entry.path() << '\n';
        }

      } else if (dir_entry.is_symlink()) {
        // symlink, never compared
        continue;

      } else if (dir_entry.is_directory()) {
        // directory, recursive call
        ba::post(pool, std::bind(ls_dir_rec, dir_entry.path(),
                                 std::ref(file_list), std::ref(mtx),
                                 std::ref(pool), std::cref(excludes),
                                 cancel));

      } else if (dir_entry.is_regular_file()) {
        file_list_tmp.emplace_back(dir_entry.path());

      } else if (log_on(log_lv::warn)) {
        // other file type, skip
        oss(std::cerr) << "[warn] skip unsupported file: " << dir_entry.path()
                       << '\n';
      }
    }
  } catch (fs::filesystem_error &e) {
    // error iterate directory, skip
    if (log_on(log_lv::warn)) {
      oss(std::cerr) << "[warn] skip directory: " << dir << " - "
                     << e.code().message() << '\n';
    }
  }

  // append to global list
  if (!file_list_tmp.empty()) {
    std::lock_guard lk(mtx);
    file_list.insert(file_list.end(),
                     std::make_move_iterator(file_list_tmp.begin()),
                     std::make_move_iterator(file_list_tmp.end()));
  }
}

std::vector<fs::path> get_paths(const std::vector<fs::path> &roots,
                                std::vector<std::string> excludes,
                                const uint32_t max_thread,
                                const std::atomic<bool> *cancel) {
  // make patterns match directories
  for (auto &pat : excludes) {
    while (pat.size() > 1 && pat.back() == fs::path::preferred_separator) {
      pat.pop_back();
    }
  }

  std::vector<fs::path> file_list;
  {
    ba::thread_pool pool(std::max(1U, max_thread));
    std::mutex mtx;
    for (const auto &root : roots) {
      std::error_code ec;
      // only absolute, real paths
      auto real = fs::canonical(root, ec);
      if (ec) {
        if (log_on(log_lv::warn)) {
          oss(std::cerr) << "[warn] skip path: " << root << " - "
                         << ec.message() << '\n';
        }
        continue;
      }
      if (fs::is_regular_file(real, ec)) {
        // named directly, excludes do not apply
        std::lock_guard lk(mtx);
        file_list.emplace_back(std::move(real));
        continue;
      }
      if (!fs::is_directory(real, ec)) {
        if (log_on(log_lv::warn)) {
          oss(std::cerr) << "[warn] skip unsupported file: " << real << '\n';
        }
        continue;
      }
      ba::post(pool, std::bind(ls_dir_rec, std::move(real),
                               std::ref(file_list), std::ref(mtx),
                               std::ref(pool), std::cref(excludes),
                               cancel));
    }
    pool.join();
  }
  if (is_cancelled(cancel)) {
    throw cancelled_error();
  }

  // a root given twice must not list a file as its own duplicate
  std::sort(file_list.begin(), file_list.end());
  file_list.erase(std::unique(file_list.begin(), file_list.end()),
                  file_list.end());

  if (log_on(log_lv::log)) {
    oss(std::cerr) << "[log] file count: " << file_list.size() << '\n';
  }
  return file_list;
}

}  // namespace detail_v1

}  // namespace dupescan
