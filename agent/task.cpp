#include "task.hpp"

#ifdef LINUX_PRCTL_AVAILABLE
#include <sys/prctl.h>
#endif

#include <chrono>

#include <glog/logging.h>

bucky::Task::Task(const std::string& name)
  : task_name(name),
    started(false),
    exited(false),
    abandoned(false) { }

bucky::Task::~Task() {
  if (!thread || !thread->joinable()) {
    return;
  }
  if (thread->get_id() == std::this_thread::get_id()) {
    // The last reference was dropped by our own thread as it exited.
    thread->detach();
  } else {
    thread->join();
  }
}

void bucky::Task::start() {
  std::unique_lock<std::mutex> lock(mutex);
  if (started) {
    LOG(FATAL) << "Task " << task_name << " was started twice";
    return;
  }
  started = true;
  LOG(INFO) << "Starting task " << task_name;
  thread.reset(new std::thread(std::bind(&Task::run_thread, this, shared_from_this())));
}

bool bucky::Task::is_alive() const {
  std::unique_lock<std::mutex> lock(mutex);
  return started && !exited;
}

bool bucky::Task::join(size_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex);
  if (!started) {
    return true;
  }
  if (!exit_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() { return exited; })) {
    LOG(WARNING) << "Task " << task_name << " didn't exit within " << timeout_ms << "ms";
    return false;
  }
  if (thread && thread->joinable()) {
    // The thread has signaled its exit, so this only waits for the thread's final return.
    lock.unlock();
    thread->join();
  }
  return true;
}

bool bucky::Task::terminate(size_t grace_ms) {
  if (!is_alive()) {
    return join(grace_ms);
  }
  LOG(WARNING) << "Interrupting task " << task_name;
  interrupt();
  if (join(grace_ms)) {
    return true;
  }

  std::unique_lock<std::mutex> lock(mutex);
  if (!abandoned && thread && thread->joinable()) {
    LOG(ERROR) << "Task " << task_name << " ignored interruption for " << grace_ms << "ms, "
               << "abandoning its thread";
    abandoned = true;
    thread->detach();
  }
  return false;
}

void bucky::Task::run_thread(std::shared_ptr<Task> keepalive) {
#if defined(LINUX_PRCTL_AVAILABLE) && defined(PR_SET_NAME)
  // Set the thread name to help with any debugging/tracing (uses Linux-specific API)
  std::string thread_name = "bucky-" + task_name;
  prctl(PR_SET_NAME, thread_name.substr(0, 15).c_str(), 0, 0, 0);
#endif
  try {
    LOG(INFO) << "Task " << task_name << " running";
    run();
    LOG(INFO) << "Task " << task_name << " exited";
  } catch (const std::exception& e) {
    LOG(ERROR) << "Task " << task_name << " threw exception, exiting: " << e.what();
  }
  {
    std::unique_lock<std::mutex> lock(mutex);
    exited = true;
  }
  exit_cv.notify_all();
  // 'keepalive' is released as this returns, possibly destroying the Task from this thread.
}
