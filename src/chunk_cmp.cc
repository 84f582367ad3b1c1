#include "chunk_cmp.hh"

#include <xxhash.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace dupescan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

file_cursor_t::file_cursor_t(fs::path path, const bool reopen)
    : _path(std::move(path)), _reopen(reopen) {}

void file_cursor_t::open() {
  if (_file_stream.is_open()) {
    return;
  }
  errno = 0;
  _file_stream.open(_path, std::ios::binary);
  if (!_file_stream.is_open()) {
    const int err = errno != 0 ? errno : EIO;
    throw fs::filesystem_error("open", _path,
                               std::error_code(err, std::generic_category()));
  }
  if (_offset > 0) {
    _file_stream.seekg((int64_t)_offset);
    if (!_file_stream) {
      _file_stream.close();
      throw fs::filesystem_error("seek", _path,
                                 std::make_error_code(std::errc::io_error));
    }
  }
}

void file_cursor_t::close() noexcept {
  if (_file_stream.is_open()) {
    _file_stream.close();
  }
}

void file_cursor_t::read_chunk(const std::size_t chunk_size) {
  open();
  _chunk.resize(chunk_size);
  const auto read_len =
      _file_stream.read(_chunk.data(), (int64_t)chunk_size).gcount();
  if (_file_stream.bad()) {
    close();
    throw fs::filesystem_error("read", _path,
                               std::make_error_code(std::errc::io_error));
  }
  _chunk.resize((std::size_t)read_len);
  _offset += (std::uintmax_t)read_len;
  _fingerprint = XXH3_64bits(_chunk.data(), _chunk.size());
  if (_reopen) {
    close();
  }
}

bool file_cursor_t::same_chunk(const file_cursor_t &rhs) const noexcept {
  // fingerprint only rules out, bytes decide
  return _fingerprint == rhs._fingerprint &&
         _chunk.size() == rhs._chunk.size() &&
         (_chunk.empty() ||
          std::memcmp(_chunk.data(), rhs._chunk.data(), _chunk.size()) == 0);
}

round_t compare_chunks(cursor_vec cursors, const ctx_t &ctx,
                       handle_lease_t *lease, const std::size_t chunk_size) {
  auto finish = [lease](file_cursor_t &cursor) {
    const bool was_open = cursor.is_open();
    cursor.close();
    if (was_open && lease != nullptr) {
      lease->give_back();
    }
  };

  // read the next chunk everywhere
  cursor_vec chunks;
  chunks.reserve(cursors.size());
  for (auto &cursor : cursors) {
    try {
      cursor.read_chunk(chunk_size);
      chunks.emplace_back(std::move(cursor));
    } catch (const fs::filesystem_error &e) {
      if (lease != nullptr) {
        lease->give_back();
      }
      ctx.fail(cursor.path(), e.code());
    }
  }

  round_t round;
  while (!chunks.empty()) {
    // compare the first chunk to all successive chunks
    cursor_vec matches;
    cursor_vec non_matches;
    matches.emplace_back(std::move(chunks.front()));
    for (auto itr = chunks.begin() + 1; itr != chunks.end(); ++itr) {
      if (matches.front().same_chunk(*itr)) {
        matches.emplace_back(std::move(*itr));
      } else {
        non_matches.emplace_back(std::move(*itr));
      }
    }

    if (matches.size() == 1 || matches.front().at_eof()) {
      // unique, or identical up to a shared end of file
      auto &group = round.done.emplace_back();
      group.reserve(matches.size());
      for (auto &cursor : matches) {
        finish(cursor);
        group.emplace_back(cursor.path());
      }
    } else {
      round.more.emplace_back(std::move(matches));
    }
    chunks = std::move(non_matches);
  }
  return round;
}

}  // namespace detail_v1

}  // namespace dupescan
