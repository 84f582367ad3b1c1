#include "handle_budget.hh"

#include <algorithm>
#include <stdexcept>

namespace dupescan {

inline namespace detail_v1 {

handle_budget_t::handle_budget_t(const std::size_t capacity)
    : _capacity(capacity), _avail(capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("handle budget must be > 0");
  }
}

std::size_t handle_budget_t::acquire(std::size_t n) {
  n = std::clamp<std::size_t>(n, 1, _capacity);
  std::unique_lock lk(_mtx);
  _cv.wait(lk, [&] { return _avail >= n; });
  _avail -= n;
  return n;
}

void handle_budget_t::release(const std::size_t n) noexcept {
  if (n == 0) {
    return;
  }
  {
    std::lock_guard lk(_mtx);
    _avail = std::min(_avail + n, _capacity);
  }
  _cv.notify_all();
}

std::size_t handle_budget_t::available() noexcept {
  std::lock_guard lk(_mtx);
  return _avail;
}

handle_lease_t::handle_lease_t(handle_budget_t &budget, const std::size_t n)
    : _budget(&budget), _held(budget.acquire(n)) {}

handle_lease_t::~handle_lease_t() noexcept { _budget->release(_held); }

void handle_lease_t::give_back() noexcept {
  if (_held > 0) {
    --_held;
    _budget->release(1);
  }
}

}  // namespace detail_v1

}  // namespace dupescan
