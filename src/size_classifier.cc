#include "size_classifier.hh"

#include <system_error>

namespace dupescan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

std::optional<std::uintmax_t> size_key(const fs::path &path,
                                       const std::uintmax_t min_size) {
  // symlink_status does not follow links
  const auto status = fs::symlink_status(path);
  if (status.type() == fs::file_type::not_found) {
    throw fs::filesystem_error(
        "size_key", path,
        std::make_error_code(std::errc::no_such_file_or_directory));
  }
  if (fs::is_symlink(status) || !fs::is_regular_file(status)) {
    return std::nullopt;
  }
  const auto size = fs::file_size(path);
  if (size < min_size) {
    return std::nullopt;
  }
  return size;
}

}  // namespace detail_v1

}  // namespace dupescan
