#include "context.hh"

#include <utility>

#include "oss.hh"

namespace dupescan {

inline namespace detail_v1 {

ctx_t::ctx_t(const uint32_t jobs, progress_fn on_progress,
             failure_fn on_failure, const std::atomic<bool> *cancel)
    : _jobs(jobs),
      _on_progress(std::move(on_progress)),
      _on_failure(std::move(on_failure)),
      _cancel(cancel) {}

void ctx_t::fail(const std::filesystem::path &path,
                 const std::error_code &ec) const {
  if (log_on(log_lv::warn)) {
    oss(std::cerr) << "[warn] skip file: " << path << " - " << ec.message()
                   << '\n';
  }
  if (_on_failure) {
    std::lock_guard lk(_hook_mtx);
    _on_failure(path, ec);
  }
}

void ctx_t::progress(std::string_view stage, std::size_t done,
                     std::size_t total, std::size_t files) const {
  if (_on_progress) {
    std::lock_guard lk(_hook_mtx);
    _on_progress(stage, done, total, files);
  }
}

}  // namespace detail_v1

}  // namespace dupescan
