#pragma once

#include <gmock/gmock.h>

#include "push_client.hpp"
#include "tcp_connector.hpp"

/**
 * Buffers one "<bucket>.<key>" fragment per value, and leaves pushing to the mock.
 */
class MockPushClient : public bucky::PushClient {
 public:
  explicit MockPushClient(const bucky::config::ClientSettings& settings)
    : bucky::PushClient("mock", settings, unconnected()) { }

  MOCK_METHOD1(push_chunk, Try<Nothing>(const std::vector<std::string>& chunk));

 protected:
  void process_values(double /*receive_timestamp*/, const std::string& bucket,
      const bucky::values_t& values, const Option<double>& /*timestamp*/,
      const bucky::metadata_t& /*metadata*/) {
    for (const bucky::values_t::value_type& value : values) {
      buffer_output(bucket + "." + value.first);
    }
  }

 private:
  static std::shared_ptr<bucky::TCPConnector> unconnected() {
    std::vector<bucky::Endpoint> endpoints;
    endpoints.push_back(bucky::Endpoint("127.0.0.1", 1));
    return std::shared_ptr<bucky::TCPConnector>(new bucky::TCPConnector(endpoints, 100, 100));
  }
};
