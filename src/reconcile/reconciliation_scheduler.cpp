#include "reconcile/reconciliation_scheduler.h"
#include "common/logging.h"
#include <stdexcept>

namespace autoscale {
namespace reconcile {

namespace {
const std::string kModule = "scheduler";

struct TickerState {
  std::chrono::milliseconds interval;
  std::function<void()> tick;
  std::string name;
  std::mutex mutex;
  std::condition_variable cv;
  bool cancelled = false;
};

void ticker_loop(std::shared_ptr<TickerState> state) {
  LOG_DEBUG(kModule, state->name, " started with interval ",
            state->interval.count(), "ms");
  while (true) {
    {
      std::unique_lock<std::mutex> lock(state->mutex);
      if (state->cv.wait_for(lock, state->interval,
                             [&state] { return state->cancelled; })) {
        break;
      }
    }

    try {
      state->tick();
    } catch (const std::exception &e) {
      LOG_ERROR(kModule, state->name, " tick failed: ", e.what());
    }
  }
  LOG_DEBUG(kModule, state->name, " stopped");
}
} // namespace

// A running ticker thread; destroying it cancels the thread.
class ReconciliationScheduler::Ticker {
public:
  Ticker(std::chrono::milliseconds interval, std::function<void()> tick,
         std::string name)
      : state_(std::make_shared<TickerState>()) {
    state_->interval = interval;
    state_->tick = std::move(tick);
    state_->name = std::move(name);
    thread_ = std::thread(ticker_loop, state_);
  }

  ~Ticker() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();

    if (thread_.joinable()) {
      if (thread_.get_id() == std::this_thread::get_id()) {
        // Disabled from inside a tick; the loop exits once the tick returns
        thread_.detach();
      } else {
        thread_.join();
      }
    }
  }

private:
  std::shared_ptr<TickerState> state_;
  std::thread thread_;
};

ReconciliationScheduler::ReconciliationScheduler(Callback callback,
                                                 std::string name)
    : callback_(std::move(callback)), name_(std::move(name)), active_(nullptr),
      ticks_(0) {}

ReconciliationScheduler::~ReconciliationScheduler() { disable(); }

bool ReconciliationScheduler::enable(std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    throw std::invalid_argument("poll interval must be positive");
  }
  if (active_.load() != nullptr) {
    return false;
  }

  auto ticker = std::make_unique<Ticker>(
      interval,
      [this]() {
        ticks_.fetch_add(1);
        LOG_DEBUG(kModule, name_, " tick");
        callback_();
      },
      name_);

  Ticker *expected = nullptr;
  if (!active_.compare_exchange_strong(expected, ticker.get())) {
    // Lost the race; the new ticker is cancelled before its first tick
    return false;
  }
  ticker.release();
  LOG_INFO(kModule, name_, " enabled every ", interval.count(), "ms");
  return true;
}

bool ReconciliationScheduler::disable() {
  std::unique_ptr<Ticker> ticker(active_.exchange(nullptr));
  if (!ticker) {
    return false;
  }
  ticker.reset();
  LOG_INFO(kModule, name_, " disabled");
  return true;
}

} // namespace reconcile
} // namespace autoscale
