#pragma once

#include <cstddef>

#include "config.hh"
#include "context.hh"
#include "handle_budget.hh"
#include "keyed_grouper.hh"
#include "types.hh"

namespace dupescan {

inline namespace detail_v1 {

/**
 * @brief byte-for-byte grouping of one candidate group without hashing.
 *
 * All members are opened together and compared chunk by chunk, each file is
 * read at most once and closed as soon as it is classified. The group
 * reserves its handles from budget in one go; a group larger than the whole
 * budget is compared in reopen mode and holds a single handle.
 *
 * @param group paths of equal size and header hash
 * @param ctx run context, checked for cancellation between rounds
 * @param budget shared open handle budget
 * @param chunk_size bytes read per file and round
 * @return sub_map_t groups of identical files keyed by a representative
 * member, unique files as singletons
 * @throws cancelled_error
 */
sub_map_t group_by_content(const group_t &group, const ctx_t &ctx,
                           handle_budget_t &budget,
                           const std::size_t chunk_size = chunk_sz);

}  // namespace detail_v1

}  // namespace dupescan
