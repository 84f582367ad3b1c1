#include "prune.hh"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <string>
#include <system_error>

#include "config.hh"
#include "oss.hh"

namespace dupescan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

static std::string_view trim(std::string_view str) {
  const auto is_space = [](char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  };
  while (!str.empty() && is_space(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && is_space(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

std::optional<std::vector<std::size_t>> parse_keepers(std::string_view input,
                                                      const std::size_t count) {
  input = trim(input);
  if (input.empty()) {
    return std::nullopt;
  }

  std::string lower(input);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  std::vector<std::size_t> keep;
  if (lower == "all") {
    keep.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
      keep[i] = i;
    }
    return keep;
  }

  std::size_t pos = 0;
  while (pos < input.size()) {
    if (input[pos] == ' ' || input[pos] == ',' || input[pos] == '\t') {
      ++pos;
      continue;
    }
    std::size_t idx = 0;
    const auto *first = input.data() + pos;
    const auto *last = input.data() + input.size();
    auto [ptr, ec] = std::from_chars(first, last, idx);
    if (ec != std::errc() ||
        (ptr != last && *ptr != ' ' && *ptr != ',' && *ptr != '\t')) {
      return std::nullopt;
    }
    pos += (std::size_t)(ptr - first);
    if (idx >= 1 && idx <= count &&
        std::find(keep.begin(), keep.end(), idx - 1) == keep.end()) {
      keep.emplace_back(idx - 1);
    }
  }
  if (keep.empty()) {
    return std::nullopt;
  }
  std::sort(keep.begin(), keep.end());
  return keep;
}

group_t prune_ui(group_t group, const std::size_t pos, const std::size_t total,
                 std::istream &in, std::ostream &out) {
  std::sort(group.begin(), group.end());
  out << '\n';
  for (std::size_t i = 0; i < group.size(); ++i) {
    out << (i + 1) << ") " << group[i].native() << '\n';
  }

  std::string reply;
  while (true) {
    out << '[' << pos << '/' << total << "] Keepers: " << std::flush;
    if (!std::getline(in, reply)) {
      // nothing more to read, keep everything
      return {};
    }
    auto keep = parse_keepers(reply, group.size());
    if (!keep) {
      out << "Please enter a space/comma-separated list of numbers or "
             "'all'.\n";
      continue;
    }
    group_t rm_list;
    for (std::size_t i = 0; i < group.size(); ++i) {
      if (!std::binary_search(keep->begin(), keep->end(), i)) {
        rm_list.emplace_back(std::move(group[i]));
      }
    }
    return rm_list;
  }
}

std::size_t DUPESCAN_EXPORT remove(const std::vector<fs::path> &rm_list) {
  std::size_t removed = 0;
  for (const auto &path : rm_list) {
    std::error_code ec;
    if (!fs::remove(path, ec) || ec) {
      std::string msg = ec ? ec.message() : "doesn't exist";
      oss(std::cerr) << "[err] failed to remove: " << path << " - " << msg
                     << '\n';
    } else {
      ++removed;
    }
  }
  return removed;
}

}  // namespace detail_v1

}  // namespace dupescan
