#pragma once

#include <sstream>
#include <string>
#include <stddef.h>

namespace bucky {
  class Endpoint {
   public:
    Endpoint(const std::string& host, size_t port)
      : host(host), port(port) { }
    virtual ~Endpoint() { }

    std::string string() const {
      std::ostringstream oss;
      if (host.find(':') != std::string::npos) {
        oss << "[" << host << "]:" << port;
      } else {
        oss << host << ":" << port;
      }
      return oss.str();
    }

    bool operator==(const Endpoint& other) const {
      return port == other.port && host == other.host;
    }

    std::string host;
    size_t port;
  };
}
