#include "tcp_connector.hpp"

#include <random>
#include <sstream>

#include <glog/logging.h>

namespace sp = std::placeholders;

namespace {
  struct Outcome {
    Outcome()
      : ec(boost::asio::error::would_block),
        bytes(0),
        timed_out(false) { }

    boost::system::error_code ec;
    size_t bytes;
    bool timed_out;
  };

  void op_cb(const boost::system::error_code& ec, size_t bytes,
      boost::asio::deadline_timer* deadline, Outcome* outcome) {
    outcome->ec = ec;
    outcome->bytes = bytes;
    boost::system::error_code ignored;
    deadline->cancel(ignored);
  }

  void deadline_cb(const boost::system::error_code& ec,
      bucky::TCPConnector::socket_ptr_t socket, Outcome* outcome) {
    if (ec == boost::asio::error::operation_aborted) {
      // The operation finished first and cancelled us.
      return;
    }
    if (outcome->ec != boost::asio::error::would_block) {
      // Both were ready within the same run(): the operation already has its result.
      return;
    }
    outcome->timed_out = true;
    // Closing the socket aborts the pending operation with operation_aborted.
    boost::system::error_code ignored;
    socket->close(ignored);
  }

  size_t select_start_index(size_t endpoint_count) {
    if (endpoint_count <= 1) {
      return 0;
    }
    // spread agents across the configured hosts
    std::random_device dev;
    std::mt19937 engine{dev()};
    std::uniform_int_distribution<size_t> dist(0, endpoint_count - 1);
    return dist(engine);
  }

  std::string describe(const boost::system::error_code& ec) {
    std::ostringstream oss;
    oss << "err='" << ec.message() << "'(" << ec << ")";
    return oss.str();
  }
}

bucky::TCPConnector::TCPConnector(
    const std::vector<Endpoint>& endpoints,
    size_t connect_timeout_ms,
    size_t io_timeout_ms)
  : endpoints(endpoints),
    connect_timeout_ms(connect_timeout_ms),
    io_timeout_ms(io_timeout_ms),
    endpoint_index(select_start_index(endpoints.size())) {
  if (endpoints.empty()) {
    LOG(FATAL) << "TCPConnector requires at least one endpoint";
  }
  LOG(INFO) << "TCPConnector constructed for " << endpoints.size() << " endpoint(s), "
            << "starting with " << current_endpoint().string();
}

bucky::TCPConnector::~TCPConnector() {
  close();
}

Try<bucky::TCPConnector::socket_ptr_t> bucky::TCPConnector::get_socket(bool connect) {
  if (socket) {
    return socket;
  }
  if (!connect) {
    return Try<socket_ptr_t>(Error("Not connected to " + current_endpoint().string()));
  }

  std::ostringstream errors;
  for (size_t attempt = 0; attempt < endpoints.size(); ++attempt) {
    const Endpoint& endpoint = current_endpoint();
    Try<Nothing> result = connect_endpoint(endpoint);
    if (!result.isError()) {
      return socket;
    }
    LOG(WARNING) << result.error();
    errors << result.error() << "; ";
    endpoint_index = (endpoint_index + 1) % endpoints.size();
  }
  return Try<socket_ptr_t>(Error(errors.str()));
}

void bucky::TCPConnector::close() {
  if (!socket) {
    return;
  }
  LOG(INFO) << "Closing connection to " << current_endpoint().string();
  boost::system::error_code ec;
  if (socket->is_open()) {
    socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket->close(ec);
    if (ec) {
      LOG(ERROR) << "Error on socket close: " << describe(ec);
    }
  }
  socket.reset();
  // Reconnect to the next host in the list, if there are several.
  endpoint_index = (endpoint_index + 1) % endpoints.size();
}

Try<Nothing> bucky::TCPConnector::write(const std::string& payload) {
  std::ostringstream what;
  what << "send " << payload.size() << " bytes to";
  Try<size_t> sent = run_io(what.str(),
      [&payload](socket_ptr_t sock, io_handler_t handler) {
        boost::asio::async_write(*sock, boost::asio::buffer(payload), handler);
      });
  if (sent.isError()) {
    return Try<Nothing>(Error(sent.error()));
  }
  DLOG(INFO) << "Sent " << sent.get() << " bytes to " << current_endpoint().string();
  return Nothing();
}

Try<size_t> bucky::TCPConnector::run_io(const std::string& what,
    std::function<void(socket_ptr_t, io_handler_t)> start_op) {
  if (!socket) {
    return Try<size_t>(Error("Failed to " + what + " " + current_endpoint().string()
            + ": not connected"));
  }
  socket_ptr_t sock = socket;
  size_t transferred = 0;
  boost::system::error_code ec = run_with_deadline(sock,
      [sock, &start_op](io_handler_t handler) {
        start_op(sock, handler);
      },
      io_timeout_ms, transferred);
  if (ec) {
    return Try<size_t>(Error("Failed to " + what + " " + current_endpoint().string()
            + ": " + describe(ec)));
  }
  return transferred;
}

Try<Nothing> bucky::TCPConnector::connect_endpoint(const Endpoint& endpoint) {
  LOG(INFO) << "Attempting to open connection to " << endpoint.string();

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(io_service);
  boost::asio::ip::tcp::resolver::iterator iter = resolver.resolve(
      boost::asio::ip::tcp::resolver::query(endpoint.host, std::to_string(endpoint.port)), ec);
  if (ec) {
    return Try<Nothing>(Error("Error when resolving host[" + endpoint.host + "]: " + describe(ec)));
  }
  if (iter == boost::asio::ip::tcp::resolver::iterator()) {
    return Try<Nothing>(Error("No results when resolving host[" + endpoint.host + "]"));
  }

  for (; iter != boost::asio::ip::tcp::resolver::iterator(); ++iter) {
    boost::asio::ip::tcp::endpoint resolved = iter->endpoint();
    socket_ptr_t new_socket(new boost::asio::ip::tcp::socket(io_service));
    size_t ignored_bytes = 0;
    ec = run_with_deadline(new_socket,
        [new_socket, resolved](io_handler_t handler) {
          new_socket->async_connect(resolved, std::bind(handler, sp::_1, (size_t) 0));
        },
        connect_timeout_ms, ignored_bytes);
    if (ec || !new_socket->is_open()) {
      LOG(WARNING) << "Got error when connecting to " << resolved << " (" << endpoint.string()
                   << "): " << describe(ec);
      continue;
    }

    boost::system::error_code opt_ec;
    new_socket->set_option(boost::asio::socket_base::keep_alive(true), opt_ec);
    if (opt_ec) {
      LOG(WARNING) << "Unable to set keepalive on connection to " << endpoint.string()
                   << ": " << describe(opt_ec);
    }
    new_socket->set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

    LOG(INFO) << "Connected to " << resolved << " (" << endpoint.string() << ")";
    socket = new_socket;
    return Nothing();
  }
  return Try<Nothing>(Error("Unable to connect to " + endpoint.string() + ": " + describe(ec)));
}

boost::system::error_code bucky::TCPConnector::run_with_deadline(socket_ptr_t sock,
    std::function<void(io_handler_t)> start_op, size_t timeout_ms, size_t& bytes_transferred) {
  Outcome outcome;
  boost::asio::deadline_timer deadline(io_service);
  start_op(std::bind(&op_cb, sp::_1, sp::_2, &deadline, &outcome));

  // Operations which are already complete (e.g. a speculative write) finish here, before any
  // deadline exists to race them.
  io_service.reset();
  io_service.poll();

  if (outcome.ec == boost::asio::error::would_block) {
    deadline.expires_from_now(boost::posix_time::milliseconds(timeout_ms));
    deadline.async_wait(std::bind(&deadline_cb, sp::_1, sock, &outcome));
    // Runs until both the operation and the deadline handlers have completed.
    io_service.reset();
    io_service.run();
  }

  bytes_transferred = outcome.bytes;
  if (outcome.timed_out && outcome.ec) {
    return boost::asio::error::timed_out;
  }
  return outcome.ec;
}
