#pragma once

#include <memory>
#include <string>

#include <boost/beast/http.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "params.hpp"

namespace bucky {
  class TCPConnector;

  /**
   * A parsed HTTP response. The body has already been decoded according to any
   * Transfer-Encoding and Content-Encoding.
   */
  typedef boost::beast::http::response<boost::beast::http::string_body> HTTPResponse;

  /**
   * An HTTPConnection performs HTTP/1.1 exchanges directly on the socket of a TCPConnector, one
   * request at a time. The connection is kept open between requests unless the server asks for it
   * to be closed. On any error the caller is expected to close() the connector.
   */
  class HTTPConnection {
   public:
    HTTPConnection(std::shared_ptr<TCPConnector> connector,
        params::compression_mode::Value compression);
    virtual ~HTTPConnection() { }

    /**
     * Sends a POST with the provided body, compressed according to the configured compression
     * mode, and returns the server's response. Any status code is returned as-is.
     */
    Try<HTTPResponse> post(const std::string& path,
        const std::string& content_type, const std::string& body);

   private:
    Try<Nothing> decode_body(HTTPResponse& response);

    std::shared_ptr<TCPConnector> connector;
    const params::compression_mode::Value compression;
  };

}
