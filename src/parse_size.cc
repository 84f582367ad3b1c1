#include "parse_size.hh"

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace dupescan::utils {

namespace {

constexpr std::array<char, 6> unit_dict{'K', 'M', 'G', 'T', 'P', 'E'};

bool is_num(char c) { return c >= '0' && c <= '9'; }

char upper(char c) { return (c >= 'a' && c <= 'z') ? (char)(c - 32) : c; }

std::uintmax_t mul_checked(std::uintmax_t lhs, std::uintmax_t rhs,
                           std::string_view size_str) {
  if (rhs != 0 && lhs > std::numeric_limits<std::uintmax_t>::max() / rhs) {
    throw std::out_of_range("size too large: " + std::string(size_str));
  }
  return lhs * rhs;
}

}  // namespace

std::uintmax_t parse_size(std::string_view size_str) {
  const auto invalid = [&] {
    return std::invalid_argument("invalid size string: " +
                                 std::string(size_str));
  };

  std::size_t i = 0;
  std::uintmax_t size_num = 0;
  for (; i < size_str.size() && is_num(size_str[i]); ++i) {
    const auto digit = (std::uintmax_t)(size_str[i] - '0');
    size_num = mul_checked(size_num, 10, size_str);
    if (size_num > std::numeric_limits<std::uintmax_t>::max() - digit) {
      throw std::out_of_range("size too large: " + std::string(size_str));
    }
    size_num += digit;
  }
  if (i == 0) {
    throw invalid();
  }

  std::size_t scale = 0;
  bool as_bibyte = false;
  bool as_bit = false;
  if (i < size_str.size()) {
    for (std::size_t j = 0; j < unit_dict.size(); ++j) {
      if (upper(size_str[i]) == unit_dict[j]) {
        scale = j + 1;
        ++i;
        break;
      }
    }
  }
  if (scale != 0 && i < size_str.size() && size_str[i] == 'i') {
    as_bibyte = true;
    ++i;
  }
  if (i < size_str.size()) {
    if (size_str[i] == 'b') {
      as_bit = true;
    } else if (size_str[i] != 'B') {
      throw invalid();
    }
    ++i;
  }
  if (i != size_str.size()) {
    throw invalid();
  }

  const std::uintmax_t base = as_bibyte ? 1024 : 1000;
  for (std::size_t s = 0; s < scale; ++s) {
    size_num = mul_checked(size_num, base, size_str);
  }
  return as_bit ? size_num / 8 : size_num;
}

}  // namespace dupescan::utils
