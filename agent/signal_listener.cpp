#include "signal_listener.hpp"

#include <signal.h>

#ifdef LINUX_PRCTL_AVAILABLE
#include <sys/prctl.h>
#endif
#define THREAD_NAME "bucky-signals"

#include <glog/logging.h>

bucky::SignalListener::SignalListener(std::function<void()> stop_cb)
  : stop_cb(stop_cb),
    io_service(new boost::asio::io_service),
    signals(*io_service, SIGTERM, SIGINT) { }

bucky::SignalListener::~SignalListener() {
  // Clean shutdown in a specific order.
  boost::system::error_code ec;
  signals.cancel(ec);
  io_service->stop();
  if (io_service_thread) {
    io_service_thread->join();
    io_service_thread.reset();
  }
}

void bucky::SignalListener::start() {
  if (io_service_thread) {
    LOG(FATAL) << "SignalListener::start() was called twice";
    return;
  }
  start_wait();
  io_service_thread.reset(new std::thread(std::bind(&SignalListener::run_io_service, this)));
}

void bucky::SignalListener::start_wait() {
  signals.async_wait(std::bind(&SignalListener::signal_cb, this,
          std::placeholders::_1, std::placeholders::_2));
}

void bucky::SignalListener::signal_cb(const boost::system::error_code& ec, int signal_number) {
  if (ec == boost::asio::error::operation_aborted) {
    return;
  }
  if (ec) {
    LOG(ERROR) << "Signal wait returned error. "
               << "err='" << ec.message() << "'(" << ec << ")";
    return;
  }
  LOG(INFO) << "Received signal " << signal_number << ", shutting down";
  stop_cb();
  start_wait();
}

void bucky::SignalListener::run_io_service() {
#if defined(LINUX_PRCTL_AVAILABLE) && defined(PR_SET_NAME)
  prctl(PR_SET_NAME, THREAD_NAME, 0, 0, 0);
#endif
  try {
    io_service->run();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Signal listener io_service.run() threw exception, exiting: " << e.what();
  }
}
