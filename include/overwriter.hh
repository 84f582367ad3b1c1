#pragma once

#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace dupescan {

inline namespace detail_v1 {

/**
 * @brief status line writer. On a terminal each message redraws the previous
 * one with '\r', elsewhere every message is its own line. A message equal to
 * the previous one is not written again.
 */
class overwriter_t {
  std::ostream &_os;
  bool _isatty;
  std::size_t _max_len = 0;
  std::string _last;
  std::mutex _mtx;

 public:
  overwriter_t(std::ostream &os, const bool isatty);

  overwriter_t(const overwriter_t &) = delete;
  overwriter_t(overwriter_t &&) = delete;
  overwriter_t &operator=(const overwriter_t &) = delete;
  overwriter_t &operator=(overwriter_t &&) = delete;

  /**
   * @param text status message
   * @param newline keep this message and start a fresh line after it
   */
  void write(std::string_view text, const bool newline = false);
};

}  // namespace detail_v1

}  // namespace dupescan
