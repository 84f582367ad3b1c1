#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string_view>
#include <system_error>

#include "types.hh"

namespace dupescan {

inline namespace detail_v1 {

/**
 * @brief state shared by every stage of one run: worker count, observers and
 * the cancel flag. Hooks are serialized, never called concurrently.
 */
class ctx_t {
  uint32_t _jobs;
  progress_fn _on_progress;
  failure_fn _on_failure;
  const std::atomic<bool> *_cancel;
  mutable std::mutex _hook_mtx;

 public:
  ctx_t(const uint32_t jobs, progress_fn on_progress, failure_fn on_failure,
        const std::atomic<bool> *cancel = nullptr);

  ctx_t(const ctx_t &) = delete;
  ctx_t(ctx_t &&) = delete;
  ctx_t &operator=(const ctx_t &) = delete;
  ctx_t &operator=(ctx_t &&) = delete;

  inline uint32_t jobs() const noexcept { return _jobs; }
  inline bool cancelled() const noexcept {
    return _cancel != nullptr && _cancel->load(std::memory_order_relaxed);
  }

  /**
   * @brief log a dropped path and forward it to the failure hook
   *
   * @param path path removed from further consideration
   * @param ec cause
   */
  void fail(const std::filesystem::path &path,
            const std::error_code &ec) const;

  void progress(std::string_view stage, std::size_t done, std::size_t total,
                std::size_t files) const;
};

}  // namespace detail_v1

}  // namespace dupescan
