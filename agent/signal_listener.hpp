#pragma once

#include <functional>
#include <memory>
#include <thread>

#include <boost/asio.hpp>

namespace bucky {

  /**
   * A SignalListener waits for SIGTERM and SIGINT on its own thread, and invokes the provided
   * callback when one arrives. The signals stay handled for as long as the listener exists.
   */
  class SignalListener {
   public:
    explicit SignalListener(std::function<void()> stop_cb);
    virtual ~SignalListener();

    void start();

   private:
    void start_wait();
    void signal_cb(const boost::system::error_code& ec, int signal_number);
    void run_io_service();

    std::function<void()> stop_cb;
    std::shared_ptr<boost::asio::io_service> io_service;
    boost::asio::signal_set signals;
    std::unique_ptr<std::thread> io_service_thread;
  };

}
