#include "sample_queue.hpp"

#include <chrono>

#include <glog/logging.h>

void bucky::SampleQueue::push(const Sample& sample) {
  {
    std::unique_lock<std::mutex> lock(mutex);
    entries.push_back(Option<Sample>(sample));
  }
  cv.notify_one();
}

void bucky::SampleQueue::push_sentinel() {
  DLOG(INFO) << "Sentinel added to intake queue";
  {
    std::unique_lock<std::mutex> lock(mutex);
    entries.push_back(Option<Sample>::none());
  }
  cv.notify_one();
}

bucky::pop_result::Value bucky::SampleQueue::pop(size_t timeout_ms, Sample& out) {
  std::unique_lock<std::mutex> lock(mutex);
  if (entries.empty() && timeout_ms > 0) {
    // wait_for with a predicate absorbs any spurious wakeups
    cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
        [this]() { return !entries.empty(); });
  }
  if (entries.empty()) {
    return pop_result::TIMEOUT;
  }

  Option<Sample> entry = entries.front();
  entries.pop_front();
  if (entry.isNone()) {
    return pop_result::SENTINEL;
  }
  out = entry.get();
  return pop_result::SAMPLE;
}

size_t bucky::SampleQueue::size() const {
  std::unique_lock<std::mutex> lock(mutex);
  return entries.size();
}
