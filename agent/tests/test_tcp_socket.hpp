#pragma once

#include <stdlib.h>
#include <unistd.h>

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <glog/logging.h>

namespace {
  /**
   * Returns a loopback port which nothing is listening on.
   */
  inline size_t unused_port() {
    boost::asio::io_service svc;
    boost::asio::ip::tcp::acceptor acceptor(svc,
        boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    size_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
  }
}

/**
 * Accepts one loopback TCP session at a time on an ephemeral port and stores everything it
 * receives. A new session is accepted whenever the current one ends.
 */
class TestTCPReadSession {
 public:
  TestTCPReadSession()
    : buffer_size(65536),
      shutdown(false),
      acceptor(svc, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)),
      sessions(0) {
    buffer = (char*) malloc(buffer_size);
    start_accept();
    thread.reset(new std::thread(std::bind(&TestTCPReadSession::run_io, this)));
  }

  virtual ~TestTCPReadSession() {
    shutdown = true;
    if (thread) {
      svc.stop();
      thread->join();
      thread.reset();
      svc.reset();
    }
    free(buffer);
  }

  /**
   * Waits until at least 'bytes' have been received in total.
   */
  bool wait_for_bytes(size_t bytes, size_t secs = 5) {
    for (size_t i = 0; i < (secs * 100); ++i) {
      if (data().size() >= bytes) {
        return true;
      }
      usleep(1000 * 10);
    }
    return false;
  }

  size_t port() {
    return acceptor.local_endpoint().port();
  }

  std::string data() {
    std::unique_lock<std::mutex> lock(data_mutex);
    return received;
  }

  size_t session_count() {
    std::unique_lock<std::mutex> lock(data_mutex);
    return sessions;
  }

 private:
  void run_io() {
    svc.run();
  }

  void start_accept() {
    socket.reset(new boost::asio::ip::tcp::socket(svc));
    acceptor.async_accept(*socket,
        std::bind(&TestTCPReadSession::handle_accept, this, std::placeholders::_1));
  }

  void handle_accept(boost::system::error_code ec) {
    if (shutdown) {
      return;
    }
    if (ec) {
      LOG(INFO) << "error when accepting: " << ec.message();
      start_accept();
      return;
    }
    {
      std::unique_lock<std::mutex> lock(data_mutex);
      ++sessions;
    }
    start_read();
  }

  void start_read() {
    socket->async_read_some(boost::asio::buffer(buffer, buffer_size),
        std::bind(&TestTCPReadSession::handle_read, this,
            std::placeholders::_1, std::placeholders::_2));
  }

  void handle_read(boost::system::error_code ec, size_t bytes) {
    if (shutdown) {
      return;
    }
    if (ec) {
      // session has ended, wait for the next one
      LOG(INFO) << "session ended: " << ec.message();
      start_accept();
      return;
    }
    {
      std::unique_lock<std::mutex> lock(data_mutex);
      received.append(buffer, bytes);
    }
    start_read();
  }

  const size_t buffer_size;
  char* buffer;

  boost::asio::io_service svc;
  bool shutdown;
  boost::asio::ip::tcp::acceptor acceptor;
  std::shared_ptr<boost::asio::ip::tcp::socket> socket;

  std::unique_ptr<std::thread> thread;
  std::mutex data_mutex;
  std::string received;
  size_t sessions;
};

/**
 * A minimal HTTP/1.1 server on an ephemeral loopback port. Records each request, and replies with
 * the queued responses in order, or with an empty successful bulk reply once the queue is empty.
 */
class TestHTTPServer {
 public:
  struct Request {
    std::string request_line;
    std::map<std::string, std::string> headers; // lower-cased names
    std::string body;
  };

  struct Response {
    Response(int status = 200, const std::string& body = "{\"errors\":false}")
      : status(status), body(body), chunked(false), close(false) { }

    int status;
    std::string body;
    std::map<std::string, std::string> extra_headers;
    bool chunked;
    bool close;
    // when set, sent verbatim in place of everything else, and the session is closed afterwards
    std::string raw;
  };

  TestHTTPServer()
    : shutdown(false),
      acceptor(svc, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)),
      sessions(0) {
    start_accept();
    thread.reset(new std::thread(std::bind(&TestHTTPServer::run_io, this)));
  }

  virtual ~TestHTTPServer() {
    shutdown = true;
    if (thread) {
      svc.stop();
      thread->join();
      thread.reset();
      svc.reset();
    }
  }

  size_t port() {
    return acceptor.local_endpoint().port();
  }

  void add_response(const Response& response) {
    std::unique_lock<std::mutex> lock(mutex);
    responses.push_back(response);
  }

  bool wait_for_requests(size_t count, size_t secs = 5) {
    for (size_t i = 0; i < (secs * 100); ++i) {
      if (requests().size() >= count) {
        return true;
      }
      usleep(1000 * 10);
    }
    return false;
  }

  std::vector<Request> requests() {
    std::unique_lock<std::mutex> lock(mutex);
    return received;
  }

  size_t session_count() {
    std::unique_lock<std::mutex> lock(mutex);
    return sessions;
  }

 private:
  typedef boost::beast::http::request<boost::beast::http::string_body> http_request_t;
  typedef boost::beast::http::response<boost::beast::http::string_body> http_response_t;

  static std::string to_string(boost::beast::string_view view) {
    return std::string(view.data(), view.size());
  }

  void run_io() {
    svc.run();
  }

  void start_accept() {
    socket.reset(new boost::asio::ip::tcp::socket(svc));
    acceptor.async_accept(*socket,
        std::bind(&TestHTTPServer::handle_accept, this, std::placeholders::_1));
  }

  void handle_accept(boost::system::error_code ec) {
    if (shutdown) {
      return;
    }
    if (ec) {
      LOG(INFO) << "error when accepting: " << ec.message();
      start_accept();
      return;
    }
    {
      std::unique_lock<std::mutex> lock(mutex);
      ++sessions;
    }
    start_read();
  }

  void end_session() {
    boost::system::error_code ignored;
    socket->close(ignored);
    inbuf.consume(inbuf.size());
    start_accept();
  }

  void start_read() {
    current = http_request_t();
    boost::beast::http::async_read(*socket, inbuf, current,
        std::bind(&TestHTTPServer::handle_request, this,
            std::placeholders::_1, std::placeholders::_2));
  }

  void handle_request(boost::system::error_code ec, size_t /*bytes*/) {
    if (shutdown) {
      return;
    }
    if (ec) {
      LOG(INFO) << "session ended: " << ec.message();
      end_session();
      return;
    }

    Request request;
    request.request_line = to_string(current.method_string()) + " "
      + to_string(current.target()) + " HTTP/" + std::to_string(current.version() / 10)
      + "." + std::to_string(current.version() % 10);
    for (const auto& field : current) {
      request.headers[boost::algorithm::to_lower_copy(to_string(field.name_string()))] =
        to_string(field.value());
    }
    request.body = current.body();

    Response response;
    {
      std::unique_lock<std::mutex> lock(mutex);
      received.push_back(request);
      if (!responses.empty()) {
        response = responses.front();
        responses.pop_front();
      }
    }

    if (!response.raw.empty()) {
      outbuf = response.raw;
      boost::asio::async_write(*socket, boost::asio::buffer(outbuf),
          std::bind(&TestHTTPServer::handle_write, this, std::placeholders::_1, true));
      return;
    }

    reply.reset(new http_response_t(
            static_cast<boost::beast::http::status>(response.status), current.version()));
    reply->reason("Whatever");
    reply->set(boost::beast::http::field::content_type, "application/json");
    for (const auto& header : response.extra_headers) {
      reply->set(header.first, header.second);
    }
    reply->keep_alive(!response.close);
    reply->body() = response.body;
    if (response.chunked) {
      reply->chunked(true);
    } else {
      reply->prepare_payload();
    }
    boost::beast::http::async_write(*socket, *reply,
        std::bind(&TestHTTPServer::handle_write, this, std::placeholders::_1, response.close));
  }

  void handle_write(boost::system::error_code ec, bool close) {
    if (shutdown) {
      return;
    }
    if (ec || close) {
      end_session();
      return;
    }
    start_read();
  }

  boost::asio::io_service svc;
  bool shutdown;
  boost::asio::ip::tcp::acceptor acceptor;
  std::shared_ptr<boost::asio::ip::tcp::socket> socket;
  boost::beast::flat_buffer inbuf;
  http_request_t current;
  std::unique_ptr<http_response_t> reply;
  std::string outbuf;

  std::unique_ptr<std::thread> thread;
  std::mutex mutex;
  std::deque<Response> responses;
  std::vector<Request> received;
  size_t sessions;
};
