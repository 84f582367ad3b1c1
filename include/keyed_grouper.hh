#pragma once

#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

#include "context.hh"
#include "oss.hh"
#include "types.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

namespace dupescan {

inline namespace detail_v1 {

// sub-groups produced from one input group
using sub_map_t = std::map<key_part_t, group_t>;

enum class scope_t {
  merge,  // equal keys share a bucket across input groups
  refine  // output key is prefixed with the input group's key
};

struct stage_t {
  std::string_view name;
  bool keep_uniques = false;
  scope_t scope = scope_t::refine;
};

/**
 * @brief lift a per-path classifier into a group classifier.
 * fn(path) returns an optional key, no key excludes the path.
 * A filesystem_error drops that path only and is reported through ctx.
 */
template <typename Fn>
inline auto per_path(Fn fn) {
  return [fn = std::move(fn)](const group_t &group, const ctx_t &ctx) {
    sub_map_t subs;
    for (const auto &path : group) {
      if (ctx.cancelled()) {
        throw cancelled_error();
      }
      try {
        auto key = fn(path);
        if (key) {
          subs[key_part_t(std::move(*key))].push_back(path);
        }
      } catch (const std::filesystem::filesystem_error &e) {
        ctx.fail(path, e.code());
      }
    }
    return subs;
  };
}

/**
 * @brief subdivide every input group with classify, on ctx.jobs() workers.
 *
 * @param groups_in groups from the previous stage
 * @param classify callable (const group_t &, const ctx_t &) -> sub_map_t
 * @param stage stage name, singleton retention and key scope
 * @param ctx run context
 * @return bucket_map_t fresh bucket map, singletons dropped unless requested
 * @throws cancelled_error if the cancel flag was raised during the stage
 * @throws any exception escaping classify or the progress hook, after the
 * pool drains
 */
template <typename Classifier>
bucket_map_t group_by(const bucket_map_t &groups_in, Classifier &&classify,
                      const stage_t &stage, const ctx_t &ctx) {
  namespace ba = boost::asio;

  bucket_map_t groups;
  std::mutex mtx;
  std::exception_ptr error;
  std::size_t done = 0;
  std::size_t files = 0;
  const auto total = groups_in.size();

  {
    ba::thread_pool pool(ctx.jobs());
    for (const auto &entry : groups_in) {
      ba::post(pool, [&, &entry = entry]() {
        if (ctx.cancelled()) {
          return;
        }
        try {
          auto subs = classify(entry.second, ctx);
          std::size_t done_now = 0;
          std::size_t files_now = 0;
          {
            std::lock_guard lk(mtx);
            for (auto &[part, sub] : subs) {
              bucket_key_t key;
              if (stage.scope == scope_t::refine) {
                key = entry.first;
              }
              key.push_back(part);
              auto &dst = groups[std::move(key)];
              dst.insert(dst.end(), std::make_move_iterator(sub.begin()),
                         std::make_move_iterator(sub.end()));
            }
            files += entry.second.size();
            done_now = ++done;
            files_now = files;
          }
          // observer runs outside the merge lock
          ctx.progress(stage.name, done_now, total, files_now);
        } catch (...) {
          // rethrown after the pool drains
          std::lock_guard lk(mtx);
          if (!error) {
            error = std::current_exception();
          }
        }
      });
    }
    pool.join();
  }

  if (error) {
    std::rethrow_exception(error);
  }
  if (ctx.cancelled()) {
    throw cancelled_error();
  }

  if (!stage.keep_uniques) {
    std::erase_if(groups, [](const auto &kv) { return kv.second.size() < 2; });
  }

  if (log_on(log_lv::log)) {
    oss(std::cerr) << "[log] found " << groups.size()
                   << " sets of files with identical " << stage.name << " ("
                   << files << " files examined)\n";
  }
  ctx.progress(stage.name, total, total, files);
  return groups;
}

}  // namespace detail_v1

}  // namespace dupescan
