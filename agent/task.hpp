#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace bucky {

  /**
   * A Task is one independently running pipeline component (a Collector or a PushClient) with its
   * own thread. The Supervisor only interacts with Tasks through start(), is_alive(), join() and
   * terminate(), plus the component-specific channel.
   *
   * Tasks must be owned by a shared_ptr: the running thread holds its own reference, so that a
   * Task which had to be abandoned on terminate() stays valid until its thread finally exits.
   */
  class Task : public std::enable_shared_from_this<Task> {
   public:
    /**
     * Time given to a task to exit after it has been interrupted by terminate().
     */
    static const size_t TERMINATE_GRACE_MS = 1000;

    explicit Task(const std::string& name);
    virtual ~Task();

    /**
     * Launches the task thread. Must only be called once.
     */
    void start();

    /**
     * Whether the task thread has been started and hasn't exited yet.
     */
    bool is_alive() const;

    /**
     * Waits up to timeout_ms for the task thread to exit, and returns whether it has exited.
     */
    bool join(size_t timeout_ms);

    /**
     * Forcibly interrupts the task and waits up to grace_ms for it to exit. If the thread still
     * doesn't exit it is abandoned. Returns whether the thread exited.
     */
    bool terminate(size_t grace_ms = TERMINATE_GRACE_MS);

    const std::string& name() const {
      return task_name;
    }

   protected:
    /**
     * The body of the task, run on its own thread.
     */
    virtual void run() = 0;

    /**
     * Breaks the task out of run() as quickly as possible, without waiting for pending work.
     * Called from the supervising thread.
     */
    virtual void interrupt() = 0;

   private:
    void run_thread(std::shared_ptr<Task> keepalive);

    const std::string task_name;

    mutable std::mutex mutex;
    std::condition_variable exit_cv;
    bool started, exited, abandoned;
    std::unique_ptr<std::thread> thread;
  };

  typedef std::shared_ptr<Task> task_ptr_t;

}
