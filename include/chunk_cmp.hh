#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include "config.hh"
#include "context.hh"
#include "handle_budget.hh"
#include "types.hh"

namespace dupescan {

inline namespace detail_v1 {

/**
 * @brief one file taking part in a chunked comparison: path, handle, last
 * chunk read. In reopen mode the handle is only open during a read and the
 * cursor seeks back to its offset.
 */
class file_cursor_t {
  std::filesystem::path _path;
  std::ifstream _file_stream;
  std::uintmax_t _offset = 0;
  bool _reopen;
  std::vector<char> _chunk;
  uint64_t _fingerprint = 0;

 public:
  file_cursor_t() = delete;
  file_cursor_t(std::filesystem::path path, const bool reopen);

  file_cursor_t(const file_cursor_t &) = delete;
  file_cursor_t(file_cursor_t &&) = default;
  file_cursor_t &operator=(const file_cursor_t &) = delete;
  file_cursor_t &operator=(file_cursor_t &&) = default;

  /**
   * @brief open the file and seek to the current offset
   * @throws std::filesystem::filesystem_error
   */
  void open();
  void close() noexcept;

  /**
   * @brief replace the buffered chunk with the next chunk_size bytes,
   * an empty chunk means end of file
   * @throws std::filesystem::filesystem_error
   */
  void read_chunk(const std::size_t chunk_size);

  // same bytes in the buffered chunk
  bool same_chunk(const file_cursor_t &rhs) const noexcept;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline bool is_open() const noexcept { return _file_stream.is_open(); }
  inline bool reopen() const noexcept { return _reopen; }
  inline bool at_eof() const noexcept { return _chunk.empty(); }
  inline std::uintmax_t offset() const noexcept { return _offset; }
};

using cursor_vec = std::vector<file_cursor_t>;

struct round_t {
  // partitions still equal so far, fed back individually
  std::vector<cursor_vec> more;
  // finished partitions, unique files included as singletons
  std::vector<group_t> done;
};

/**
 * @brief read one chunk from every cursor and split them by equal content.
 * A partition is finished when it holds one file or reached end of file,
 * its handles are closed and given back to lease at once. Cursors failing to
 * read are dropped and reported through ctx.
 *
 * @param cursors candidates equal up to their current offset
 * @param ctx run context
 * @param lease handles held for cursors kept open, nullptr in reopen mode
 * @param chunk_size bytes read per cursor
 */
round_t compare_chunks(cursor_vec cursors, const ctx_t &ctx,
                       handle_lease_t *lease,
                       const std::size_t chunk_size = chunk_sz);

}  // namespace detail_v1

}  // namespace dupescan
