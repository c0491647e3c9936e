#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

#include <stout/option.hpp>

#include "sample.hpp"

namespace bucky {

  namespace pop_result {
    enum Value { SAMPLE, SENTINEL, TIMEOUT };
  }

  /**
   * The SampleQueue is the shared intake queue between all Collectors (producers) and the
   * Supervisor (the only consumer). An empty entry acts as the sentinel which tells the consumer
   * to begin shutdown.
   */
  class SampleQueue {
   public:
    SampleQueue() { }
    virtual ~SampleQueue() { }

    /**
     * Appends a sample. Safe to call from any thread.
     */
    void push(const Sample& sample);

    /**
     * Appends the shutdown sentinel. Safe to call from any thread.
     */
    void push_sentinel();

    /**
     * Waits up to timeout_ms for the oldest entry. When a sample is returned, it is written to
     * 'out'. A timeout_ms of zero only checks what's immediately available.
     */
    pop_result::Value pop(size_t timeout_ms, Sample& out);

    size_t size() const;

   private:
    SampleQueue(const SampleQueue&);

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<Option<Sample>> entries;
  };

}
