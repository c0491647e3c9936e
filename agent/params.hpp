#pragma once

#include <stddef.h>
#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "config.pb.h"
#include "endpoint.hpp"
#include "sample.hpp"

namespace bucky {
  namespace params {
    /**
     * Types
     */

    namespace compression_mode {
      enum Value { UNKNOWN, IDENTITY, GZIP, DEFLATE };
    }
    compression_mode::Value to_compression_mode(const std::string& param);
    std::string to_string(compression_mode::Value mode);

    const std::string COMPRESSION_IDENTITY = "identity";
    const std::string COMPRESSION_GZIP = "gzip";
    const std::string COMPRESSION_DEFLATE = "deflate";

    /**
     * Returns the glog severity (google::INFO etc) to use as minloglevel for the provided
     * log_level config value, or an error if the value isn't recognized.
     * "DEBUG" maps to INFO plus verbose output, see is_verbose_log_level().
     */
    Try<int> to_min_log_level(const std::string& param);
    bool is_verbose_log_level(const std::string& param);

    /**
     * Output settings
     */

    // Used when a client has no remote_hosts, or for hosts which don't include a port.
    const std::string DEFAULT_REMOTE_HOST = "127.0.0.1";
    const size_t CARBON_DEFAULT_PORT = 2003;
    const size_t ELASTICSEARCH_DEFAULT_PORT = 9200;

    /**
     * Parses "host", "host:port", or "[ipv6]:port" into an endpoint.
     */
    Try<Endpoint> parse_endpoint(const std::string& host_str, size_t default_port);

    /**
     * Returns the parsed remote_hosts for a client, or DEFAULT_REMOTE_HOST if none are listed.
     */
    Try<std::vector<Endpoint>> get_endpoints(
        const config::ClientSettings& settings, size_t default_port);

    /**
     * Returns the global metadata tags which collectors attach to their samples.
     */
    metadata_t get_metadata(const config::AgentConfig& config);

    /**
     * Loading
     */

    /**
     * Parses protobuf text format config content. Unset fields keep their schema defaults.
     */
    Try<config::AgentConfig> parse(const std::string& content);

    /**
     * Reads and parses the config file at the provided path, then validates the result.
     */
    Try<config::AgentConfig> load(const std::string& path);

    /**
     * Checks the settings which can't be expressed in the schema itself.
     */
    Try<Nothing> validate(const config::AgentConfig& config);
  }
}
