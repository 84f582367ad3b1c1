#include "overwriter.hh"

#include <algorithm>

namespace dupescan {

inline namespace detail_v1 {

overwriter_t::overwriter_t(std::ostream &os, const bool isatty)
    : _os(os), _isatty(isatty) {}

void overwriter_t::write(std::string_view text, const bool newline) {
  std::lock_guard lk(_mtx);
  if (text == _last) {
    return;
  }
  _last = text;

  if (!_isatty) {
    _os << text << '\n' << std::flush;
    return;
  }

  // pad to erase what is left of a longer previous message
  _max_len = std::max(_max_len, text.size());
  _os << '\r' << text << std::string(_max_len - text.size(), ' ');
  if (newline) {
    _os << '\n';
    _max_len = 0;
  }
  _os << std::flush;
}

}  // namespace detail_v1

}  // namespace dupescan
