#include "collector.hpp"

#include <chrono>

#include <glog/logging.h>

bucky::Collector::Collector(
    const std::string& name, std::shared_ptr<SampleQueue> queue, size_t interval_ms)
  : Task(name),
    queue(queue),
    interval_ms(interval_ms),
    closed(false) {
  if (interval_ms == 0) {
    LOG(FATAL) << name << ": interval_ms must be non-zero";
  }
}

void bucky::Collector::close() {
  std::unique_lock<std::mutex> lock(mutex);
  if (!closed) {
    LOG(INFO) << name() << ": Closing";
    closed = true;
  }
  close_cv.notify_all();
}

double bucky::Collector::now() {
  std::chrono::duration<double> since_epoch =
    std::chrono::system_clock::now().time_since_epoch();
  return since_epoch.count();
}

void bucky::Collector::run() {
  LOG(INFO) << name() << ": Starting with interval_ms=" << interval_ms;
  std::chrono::steady_clock::time_point next_tick = std::chrono::steady_clock::now();
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mutex);
      if (close_cv.wait_until(lock, next_tick, [this]() { return closed; })) {
        break;
      }
    }

    collect();

    next_tick += std::chrono::milliseconds(interval_ms);
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    if (next_tick < now) {
      // Collection took longer than the interval: skip the missed ticks.
      next_tick = now;
    }
  }
  LOG(INFO) << name() << ": Exiting";
}

void bucky::Collector::interrupt() {
  close();
}
