#include "http_connection.hpp"

#include <cstdint>
#include <limits>

#include <boost/algorithm/string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <glog/logging.h>

#include "compression.hpp"
#include "tcp_connector.hpp"

namespace http = boost::beast::http;

bucky::HTTPConnection::HTTPConnection(
    std::shared_ptr<TCPConnector> connector,
    params::compression_mode::Value compression)
  : connector(connector),
    compression(compression) { }

Try<bucky::HTTPResponse> bucky::HTTPConnection::post(const std::string& path,
    const std::string& content_type, const std::string& body) {
  Try<std::string> payload = compression::compress(body, compression);
  if (payload.isError()) {
    return Try<HTTPResponse>(Error("Failed to compress request body: " + payload.error()));
  }

  Try<TCPConnector::socket_ptr_t> socket = connector->get_socket();
  if (socket.isError()) {
    return Try<HTTPResponse>(Error(socket.error()));
  }

  http::request<http::string_body> request(http::verb::post, path, 11);
  request.set(http::field::host, connector->current_endpoint().string());
  request.set(http::field::content_type, content_type);
  if (compression != params::compression_mode::IDENTITY) {
    const std::string encoding = params::to_string(compression);
    request.set(http::field::content_encoding, encoding);
    request.set(http::field::accept_encoding, encoding);
  }
  request.body() = payload.get();
  request.prepare_payload();

  Try<size_t> written = connector->run_io("send request to",
      [&request](TCPConnector::socket_ptr_t sock, TCPConnector::io_handler_t handler) {
        http::async_write(*sock, request, handler);
      });
  if (written.isError()) {
    return Try<HTTPResponse>(Error(written.error()));
  }
  DLOG(INFO) << "POST " << path << " to " << connector->current_endpoint().string()
             << ": " << body.size() << " bytes (" << payload.get().size() << " on the wire)";

  boost::beast::flat_buffer buf;
  http::response_parser<http::string_body> parser;
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());
  Try<size_t> read = connector->run_io("read response from",
      [&buf, &parser](TCPConnector::socket_ptr_t sock, TCPConnector::io_handler_t handler) {
        http::async_read(*sock, buf, parser, handler);
      });
  if (read.isError()) {
    return Try<HTTPResponse>(Error(read.error()));
  }

  // Also false when the body ran until the server closed the socket.
  const bool keep_alive = parser.keep_alive();
  HTTPResponse response = parser.release();
  if (!keep_alive) {
    LOG(INFO) << "Server requested connection close";
    connector->close();
  }

  Try<Nothing> decoded = decode_body(response);
  if (decoded.isError()) {
    return Try<HTTPResponse>(Error(decoded.error()));
  }
  return response;
}

Try<Nothing> bucky::HTTPConnection::decode_body(HTTPResponse& response) {
  HTTPResponse::const_iterator encoding = response.find(http::field::content_encoding);
  if (encoding == response.end() || response.body().empty()) {
    return Nothing();
  }
  const std::string name = boost::algorithm::to_lower_copy(std::string(encoding->value().data(), encoding->value().size()));
  params::compression_mode::Value mode = params::to_compression_mode(name);
  if (mode == params::compression_mode::UNKNOWN) {
    return Try<Nothing>(Error("Unsupported response Content-Encoding: " + name));
  }
  Try<std::string> decoded = compression::decompress(response.body(), mode);
  if (decoded.isError()) {
    return Try<Nothing>(Error("Failed to decode response body: " + decoded.error()));
  }
  response.body() = decoded.get();
  return Nothing();
}
