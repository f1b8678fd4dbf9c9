#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace autoscale {
namespace reconcile {

/**
 * @brief Periodic trigger for reconciliation passes
 *
 * At most one ticker thread exists at a time. The active ticker lives in a
 * single atomic slot: enable() installs a new one with compare-and-swap and
 * disable() takes it out with an exchange, so concurrent or repeated calls
 * never leave two tickers running or stop one twice.
 */
class ReconciliationScheduler {
public:
  using Callback = std::function<void()>;

  explicit ReconciliationScheduler(Callback callback,
                                   std::string name = "autoscale-timer");
  ~ReconciliationScheduler();

  ReconciliationScheduler(const ReconciliationScheduler &) = delete;
  ReconciliationScheduler &operator=(const ReconciliationScheduler &) = delete;

  /**
   * @brief Start ticking every interval, first tick after one interval
   * @return false if a ticker was already running (nothing changes)
   */
  bool enable(std::chrono::milliseconds interval);

  /**
   * @brief Stop ticking
   *
   * Waits for a tick that is already executing to finish, unless called from
   * that tick. No tick starts after this returns.
   * @return false if nothing was enabled
   */
  bool disable();

  bool is_enabled() const { return active_.load() != nullptr; }
  uint64_t tick_count() const { return ticks_.load(); }
  const std::string &name() const { return name_; }

private:
  class Ticker;

  Callback callback_;
  std::string name_;
  std::atomic<Ticker *> active_;
  std::atomic<uint64_t> ticks_;
};

} // namespace reconcile
} // namespace autoscale
