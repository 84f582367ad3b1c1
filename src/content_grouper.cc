#include "content_grouper.hh"

#include <deque>
#include <utility>

#include "chunk_cmp.hh"

namespace dupescan {

inline namespace detail_v1 {

namespace fs = std::filesystem;

sub_map_t group_by_content(const group_t &group, const ctx_t &ctx,
                           handle_budget_t &budget,
                           const std::size_t chunk_size) {
  sub_map_t subs;
  if (group.empty()) {
    return subs;
  }

  const bool reopen = group.size() > budget.capacity();
  handle_lease_t lease(budget, reopen ? 1 : group.size());
  handle_lease_t *keep_open = reopen ? nullptr : &lease;

  cursor_vec cursors;
  cursors.reserve(group.size());
  for (const auto &path : group) {
    file_cursor_t cursor(path, reopen);
    if (!reopen) {
      try {
        cursor.open();
      } catch (const fs::filesystem_error &e) {
        lease.give_back();
        ctx.fail(path, e.code());
        continue;
      }
    }
    cursors.emplace_back(std::move(cursor));
  }

  std::deque<cursor_vec> in_flight;
  in_flight.emplace_back(std::move(cursors));
  while (!in_flight.empty()) {
    if (ctx.cancelled()) {
      throw cancelled_error();
    }
    auto round = compare_chunks(std::move(in_flight.front()), ctx, keep_open,
                                chunk_size);
    in_flight.pop_front();
    for (auto &more : round.more) {
      in_flight.emplace_back(std::move(more));
    }
    for (auto &done : round.done) {
      key_part_t key(done.front());
      subs.emplace(std::move(key), std::move(done));
    }
  }
  return subs;
}

}  // namespace detail_v1

}  // namespace dupescan
