#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "config.pb.h"
#include "sample.hpp"
#include "task.hpp"

namespace bucky {
  class TCPConnector;

  namespace client_state {
    enum Value { DISCONNECTED, CONNECTED, FLUSHING, SHUTDOWN };
  }
  std::string to_string(client_state::Value state);

  /**
   * A PushClient buffers the Samples it receives from the Supervisor as backend-specific output
   * fragments, and periodically flushes them to its backend over its own TCPConnector.
   *
   * Each PushClient runs its own io_service on its own Task thread. The Supervisor talks to it
   * exclusively via send() and send_shutdown(), which post work onto that io_service. Subclasses
   * implement the backend encoding via process_values() and push_chunk().
   */
  class PushClient : public Task {
   public:
    virtual ~PushClient();

    /**
     * Queues a copy of the provided sample for receive() on the client thread.
     */
    void send(const Sample& sample);

    /**
     * Queues the sentinel: the client makes a last flush attempt, releases its connection, and
     * exits.
     */
    void send_shutdown();

    /**
     * Encodes the sample into the buffer. Never performs any network I/O.
     */
    void receive(const Sample& sample);

    /**
     * Pushes the buffer to the backend in chunks of at most chunk_size fragments. Fragments are
     * only removed from the buffer once the chunk containing them was pushed successfully.
     */
    void flush();

    /**
     * Returns a copy of the fragments which are waiting to be flushed, oldest first.
     */
    std::vector<std::string> buffer() const;

    client_state::Value state() const;

   protected:
    PushClient(const std::string& name,
        const config::ClientSettings& settings,
        std::shared_ptr<TCPConnector> connector);

    /**
     * Encodes the sample contents, passing the resulting fragment(s) to buffer_output().
     */
    virtual void process_values(double receive_timestamp, const std::string& bucket,
        const values_t& values, const Option<double>& timestamp, const metadata_t& metadata) = 0;

    /**
     * Sends a chunk of fragments to the backend. Any returned error is treated as a failed
     * connection.
     */
    virtual Try<Nothing> push_chunk(const std::vector<std::string>& chunk) = 0;

    /**
     * Appends a fragment to the buffer, dropping the oldest fragment if buffer_limit is exceeded.
     */
    void buffer_output(const std::string& fragment);

    std::shared_ptr<TCPConnector> connector() const {
      return tcp_connector;
    }

    void run();
    void interrupt();

   private:
    void start_flush_timer();
    void flush_timer_cb(const boost::system::error_code& ec);
    void threshold_flush_cb();
    void shutdown_cb();
    void set_state(client_state::Value state);

    const size_t flush_interval_ms;
    const size_t flush_threshold;
    const size_t chunk_size;
    const size_t buffer_limit;

    std::shared_ptr<TCPConnector> tcp_connector;

    std::shared_ptr<boost::asio::io_service> io_service;
    std::unique_ptr<boost::asio::io_service::work> work;
    boost::asio::deadline_timer flush_timer;

    mutable std::mutex buffer_mutex;
    std::deque<std::string> output_buffer;
    client_state::Value current_state;
    size_t dropped_count;
    bool threshold_flush_pending;
    // set while the backend is failing, until a flush succeeds
    bool threshold_flush_suspended;
  };

  typedef std::shared_ptr<PushClient> push_client_ptr_t;

}
