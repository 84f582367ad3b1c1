#pragma once

#include <atomic>
#include <iostream>
#include <version>

#if __cpp_lib_syncbuf >= 201803L

#include <syncstream>

namespace dupescan {

inline namespace detail_v1 {

// osyncstream is provided
using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace dupescan

#else

#include <mutex>

namespace dupescan {

inline namespace detail_v1 {

// self-implemented osyncstream
class oss {
 private:
  inline static std::mutex _mtx;
  std::ostream &_os;

 public:
  oss() = delete;
  inline oss(std::ostream &os) : _os(os) { _mtx.lock(); }
  inline ~oss() { _mtx.unlock(); }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  inline oss &operator<<(const Tp &val) {
    _os << val;
    return *this;
  }
  inline operator std::ostream &() noexcept { return _os; }
};

}  // namespace detail_v1

}  // namespace dupescan

#endif

namespace dupescan {

inline namespace detail_v1 {

enum class log_lv : int {
  err = 0,   // [err]
  warn = 1,  // [warn]
  log = 2    // [log]
};

inline std::atomic<log_lv> log_level{log_lv::log};

inline void set_log_level(const log_lv lv) noexcept { log_level = lv; }

inline bool log_on(const log_lv lv) noexcept {
  return static_cast<int>(lv) <= static_cast<int>(log_level.load());
}

}  // namespace detail_v1

}  // namespace dupescan
