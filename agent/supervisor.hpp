#pragma once

#include <memory>
#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "collector.hpp"
#include "config.pb.h"
#include "push_client.hpp"
#include "sample_queue.hpp"

namespace bucky {

  /**
   * The Supervisor owns every Collector and PushClient in the process. It forwards Samples from
   * the shared intake queue to each client, watches the liveness of all tasks, and tears
   * everything down in order once the sentinel arrives or any task dies.
   */
  class Supervisor {
   public:
    /**
     * Creates a Supervisor with the collectors and clients enabled in the provided config.
     */
    static Try<std::shared_ptr<Supervisor>> create(const config::AgentConfig& config);

    /**
     * Use create(). This is meant for access by tests.
     */
    Supervisor(std::shared_ptr<SampleQueue> queue,
        const std::vector<collector_ptr_t>& collectors,
        const std::vector<push_client_ptr_t>& clients,
        size_t poll_timeout_ms,
        size_t join_timeout_ms);

    virtual ~Supervisor();

    /**
     * Starts the client tasks, then the collector tasks.
     */
    void start();

    /**
     * Forwards samples from the intake queue until the sentinel arrives or a task dies, then
     * shuts down. Returns an error if shutdown wasn't clean.
     */
    Try<Nothing> run();

    /**
     * Stops and joins every collector, then every client, forcibly terminating any which don't
     * exit within the join timeout. Returns an error if 'err' was provided or if any task had to
     * be terminated.
     */
    Try<Nothing> shutdown(const Option<std::string>& err = None());

    /**
     * Pushes the sentinel onto the intake queue, to be picked up by run(). Safe to call from any
     * thread.
     */
    void stop();

    std::shared_ptr<SampleQueue> queue() const {
      return sample_queue;
    }

   private:
    Option<std::string> find_dead_task() const;
    bool join_or_terminate(Task& task, std::vector<std::string>& errors);

    std::shared_ptr<SampleQueue> sample_queue;
    const std::vector<collector_ptr_t> collectors;
    const std::vector<push_client_ptr_t> clients;
    const size_t poll_timeout_ms;
    const size_t join_timeout_ms;
    bool started, shut_down;
  };

}
