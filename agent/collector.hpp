#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "sample_queue.hpp"
#include "task.hpp"

namespace bucky {

  /**
   * A Collector periodically produces Samples and pushes them onto the shared intake queue, until
   * it's asked to close(). The queue is its only output.
   */
  class Collector : public Task {
   public:
    virtual ~Collector() { }

    /**
     * Asks the collector to exit after any collection round in progress. Safe to call from any
     * thread.
     */
    void close();

    /**
     * Runs one collection round. Called every interval_ms by the collector thread.
     */
    virtual void collect() = 0;

    /**
     * Returns the current wall-clock time as fractional epoch seconds.
     */
    static double now();

   protected:
    Collector(const std::string& name, std::shared_ptr<SampleQueue> queue, size_t interval_ms);

    void push(const Sample& sample) {
      queue->push(sample);
    }

    void run();
    void interrupt();

   private:
    std::shared_ptr<SampleQueue> queue;
    const size_t interval_ms;

    std::mutex mutex;
    std::condition_variable close_cv;
    bool closed;
  };

  typedef std::shared_ptr<Collector> collector_ptr_t;

}
