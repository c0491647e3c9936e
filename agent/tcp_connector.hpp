#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "endpoint.hpp"

namespace bucky {

  /**
   * A TCPConnector lazily owns the single outbound connection of one PushClient. It doesn't retry
   * on its own: any failed operation leaves the socket as-is, and the caller is expected to
   * close() it so that the following get_socket() reconnects.
   *
   * All operations block the calling thread, bounded by the configured timeouts. The socket is
   * driven by a private io_service which only runs while an operation is in progress.
   */
  class TCPConnector {
   public:
    typedef std::shared_ptr<boost::asio::ip::tcp::socket> socket_ptr_t;
    typedef std::function<void(const boost::system::error_code&, size_t)> io_handler_t;

    TCPConnector(const std::vector<Endpoint>& endpoints,
        size_t connect_timeout_ms,
        size_t io_timeout_ms);

    virtual ~TCPConnector();

    /**
     * Returns the current socket. If there isn't one and 'connect' is true, connects to the
     * configured endpoints in rotation until one succeeds.
     */
    Try<socket_ptr_t> get_socket(bool connect = true);

    /**
     * Discards the current socket, if any.
     */
    void close();

    bool is_connected() const {
      return (bool) socket;
    }

    /**
     * Writes the whole payload to the current socket.
     */
    Try<Nothing> write(const std::string& payload);

    /**
     * Starts an asynchronous operation on the current socket via 'start_op', passing it the
     * handler to complete with, and blocks until the operation completes or io_timeout_ms passes.
     * Returns the number of bytes transferred. 'what' describes the operation in errors.
     */
    Try<size_t> run_io(const std::string& what,
        std::function<void(socket_ptr_t, io_handler_t)> start_op);

    /**
     * The endpoint of the current connection, or of the most recent connection attempt.
     */
    const Endpoint& current_endpoint() const {
      return endpoints[endpoint_index];
    }

   private:
    Try<Nothing> connect_endpoint(const Endpoint& endpoint);
    boost::system::error_code run_with_deadline(socket_ptr_t sock,
        std::function<void(io_handler_t)> start_op, size_t timeout_ms, size_t& bytes_transferred);

    const std::vector<Endpoint> endpoints;
    const size_t connect_timeout_ms;
    const size_t io_timeout_ms;

    boost::asio::io_service io_service;
    socket_ptr_t socket;
    size_t endpoint_index;
  };

}
