#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace dupescan {

inline namespace detail_v1 {

/**
 * @brief counts open file handles across all workers.
 * A reservation is taken whole, so no holder ever waits for more handles
 * while keeping some, and the budget cannot deadlock.
 */
class handle_budget_t {
  std::mutex _mtx;
  std::condition_variable _cv;
  std::size_t _capacity;
  std::size_t _avail;

 public:
  explicit handle_budget_t(const std::size_t capacity);

  handle_budget_t(const handle_budget_t &) = delete;
  handle_budget_t(handle_budget_t &&) = delete;
  handle_budget_t &operator=(const handle_budget_t &) = delete;
  handle_budget_t &operator=(handle_budget_t &&) = delete;

  inline std::size_t capacity() const noexcept { return _capacity; }

  /**
   * @brief block until n handles are free and take them
   *
   * @param n handles wanted, clamped to capacity
   * @return std::size_t handles taken
   */
  std::size_t acquire(std::size_t n);
  void release(const std::size_t n) noexcept;
  std::size_t available() noexcept;
};

// RAII reservation, releases what is left on destruction
class handle_lease_t {
  handle_budget_t *_budget;
  std::size_t _held;

 public:
  handle_lease_t(handle_budget_t &budget, const std::size_t n);
  ~handle_lease_t() noexcept;

  handle_lease_t(const handle_lease_t &) = delete;
  handle_lease_t(handle_lease_t &&) = delete;
  handle_lease_t &operator=(const handle_lease_t &) = delete;
  handle_lease_t &operator=(handle_lease_t &&) = delete;

  inline std::size_t held() const noexcept { return _held; }
  // give back one handle as soon as its file is closed
  void give_back() noexcept;
};

}  // namespace detail_v1

}  // namespace dupescan
