#include "carbon_client.hpp"

#include <math.h>
#include <stdio.h>
#include <stdlib.h>

#include <sstream>

#include <glog/logging.h>

#include "params.hpp"
#include "tcp_connector.hpp"

namespace {
  /**
   * Formats the value with as few digits as possible while still parsing back to the same double.
   */
  std::string format_value(double value) {
    char buf[64];
    for (int precision = 1; precision <= 17; ++precision) {
      snprintf(buf, sizeof(buf), "%.*g", precision, value);
      if (strtod(buf, NULL) == value) {
        break;
      }
    }
    return buf;
  }
}

Try<bucky::push_client_ptr_t> bucky::CarbonClient::create(const config::CarbonConfig& config) {
  Try<std::vector<Endpoint>> endpoints =
    params::get_endpoints(config.client(), params::CARBON_DEFAULT_PORT);
  if (endpoints.isError()) {
    return Try<push_client_ptr_t>(Error("Invalid carbon endpoints: " + endpoints.error()));
  }
  std::shared_ptr<TCPConnector> connector(new TCPConnector(
          endpoints.get(),
          config.client().connect_timeout_ms(),
          config.client().io_timeout_ms()));
  return push_client_ptr_t(new CarbonClient(config, connector));
}

bucky::CarbonClient::CarbonClient(
    const config::CarbonConfig& config, std::shared_ptr<TCPConnector> connector)
  : PushClient("carbon", config.client(), connector),
    name_mapping(config.name_mapping().begin(), config.name_mapping().end()) { }

std::string bucky::CarbonClient::build_name(metadata_t metadata) const {
  std::ostringstream oss;
  bool first = true;
  for (const std::string& key : name_mapping) {
    metadata_t::iterator iter = metadata.find(key);
    if (iter == metadata.end()) {
      continue;
    }
    if (iter->second.isSome()) {
      if (!first) {
        oss << '.';
      }
      oss << iter->second.get();
      first = false;
    }
    metadata.erase(iter);
  }
  // std::map is already sorted by key
  for (const metadata_t::value_type& entry : metadata) {
    if (entry.second.isNone()) {
      continue;
    }
    if (!first) {
      oss << '.';
    }
    oss << entry.second.get();
    first = false;
  }
  return oss.str();
}

void bucky::CarbonClient::process_values(double receive_timestamp, const std::string& bucket,
    const values_t& values, const Option<double>& timestamp, const metadata_t& metadata) {
  double effective = timestamp.isSome() ? timestamp.get() : receive_timestamp;
  long long int_timestamp = (long long) trunc(effective);
  for (const values_t::value_type& value : values) {
    metadata_t value_metadata(metadata);
    value_metadata["bucket"] = bucket;
    value_metadata["value"] = value.first;

    std::ostringstream line;
    line << build_name(value_metadata) << ' ' << format_value(value.second) << ' '
         << int_timestamp << '\n';
    buffer_output(line.str());
  }
}

Try<Nothing> bucky::CarbonClient::push_chunk(const std::vector<std::string>& chunk) {
  std::string payload;
  for (const std::string& line : chunk) {
    payload += line;
  }

  Try<TCPConnector::socket_ptr_t> socket = connector()->get_socket();
  if (socket.isError()) {
    return Try<Nothing>(Error(socket.error()));
  }
  return connector()->write(payload);
}
