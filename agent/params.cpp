#include "params.hpp"

#include <sstream>

#include <glog/logging.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/text_format.h>
#include <stout/os/read.hpp>

namespace {
  class ConfigErrorCollector : public google::protobuf::io::ErrorCollector {
   public:
    void AddError(int line, int column, const std::string& message) {
      // protobuf reports zero-based positions
      oss << "line " << (line + 1) << ", column " << (column + 1) << ": " << message << "; ";
    }

    void AddWarning(int line, int column, const std::string& message) {
      LOG(WARNING) << "Config line " << (line + 1) << ", column " << (column + 1) << ": "
                   << message;
    }

    std::string str() const {
      return oss.str();
    }

   private:
    std::ostringstream oss;
  };

  Try<size_t> to_port(const std::string& host_str, const std::string& v) {
    if (v.empty()) {
      return Try<size_t>(Error("Empty port in remote host: " + host_str));
    }
    char* invalid = NULL;
    long val = strtol(v.c_str(), &invalid, 10);
    if (invalid != NULL && invalid[0] != '\0') {
      return Try<size_t>(Error("Invalid port (must be int) in remote host: " + host_str));
    }
    if (val <= 0 || val > 65535) {
      return Try<size_t>(Error("Invalid port (must be 1-65535) in remote host: " + host_str));
    }
    return (size_t) val;
  }

  Try<Nothing> validate_client(const std::string& name,
      const bucky::config::ClientSettings& settings, size_t default_port) {
    if (settings.flush_interval_ms() == 0) {
      return Try<Nothing>(Error("Invalid " + name + ".client.flush_interval_ms: must be non-zero"));
    }
    if (settings.chunk_size() == 0) {
      return Try<Nothing>(Error("Invalid " + name + ".client.chunk_size: must be non-zero"));
    }
    if (settings.connect_timeout_ms() == 0 || settings.io_timeout_ms() == 0) {
      return Try<Nothing>(Error("Invalid " + name + ".client timeouts: must be non-zero"));
    }
    if (settings.buffer_limit() != 0 && settings.buffer_limit() < settings.chunk_size()) {
      LOG(WARNING) << name << ".client.buffer_limit=" << settings.buffer_limit()
                   << " is smaller than chunk_size=" << settings.chunk_size();
    }
    Try<std::vector<bucky::Endpoint>> endpoints = bucky::params::get_endpoints(settings, default_port);
    if (endpoints.isError()) {
      return Try<Nothing>(Error("Invalid " + name + ".client.remote_hosts: " + endpoints.error()));
    }
    return Nothing();
  }
}

bucky::params::compression_mode::Value bucky::params::to_compression_mode(const std::string& param) {
  if (param == COMPRESSION_IDENTITY) {
    return compression_mode::IDENTITY;
  } else if (param == COMPRESSION_GZIP) {
    return compression_mode::GZIP;
  } else if (param == COMPRESSION_DEFLATE) {
    return compression_mode::DEFLATE;
  }
  return compression_mode::UNKNOWN;
}

std::string bucky::params::to_string(compression_mode::Value mode) {
  switch (mode) {
    case compression_mode::IDENTITY: return COMPRESSION_IDENTITY;
    case compression_mode::GZIP: return COMPRESSION_GZIP;
    case compression_mode::DEFLATE: return COMPRESSION_DEFLATE;
    case compression_mode::UNKNOWN: break;
  }
  return "???";
}

Try<int> bucky::params::to_min_log_level(const std::string& param) {
  if (param == "DEBUG" || param == "INFO") {
    return google::GLOG_INFO;
  } else if (param == "WARNING") {
    return google::GLOG_WARNING;
  } else if (param == "ERROR") {
    return google::GLOG_ERROR;
  } else if (param == "CRITICAL") {
    return google::GLOG_FATAL;
  }
  return Try<int>(Error("Unknown log_level: " + param));
}

bool bucky::params::is_verbose_log_level(const std::string& param) {
  return param == "DEBUG";
}

Try<bucky::Endpoint> bucky::params::parse_endpoint(const std::string& host_str, size_t default_port) {
  if (host_str.empty()) {
    return Try<Endpoint>(Error("Empty remote host"));
  }

  if (host_str[0] == '[') {
    // "[::1]" or "[::1]:9200"
    size_t close = host_str.find(']');
    if (close == std::string::npos || close == 1) {
      return Try<Endpoint>(Error("Malformed IPv6 remote host: " + host_str));
    }
    std::string host = host_str.substr(1, close - 1);
    if (close + 1 == host_str.size()) {
      return Endpoint(host, default_port);
    }
    if (host_str[close + 1] != ':') {
      return Try<Endpoint>(Error("Malformed IPv6 remote host: " + host_str));
    }
    Try<size_t> port = to_port(host_str, host_str.substr(close + 2));
    if (port.isError()) {
      return Try<Endpoint>(Error(port.error()));
    }
    return Endpoint(host, port.get());
  }

  size_t colon = host_str.find(':');
  if (colon == std::string::npos) {
    return Endpoint(host_str, default_port);
  }
  if (host_str.find(':', colon + 1) != std::string::npos) {
    return Try<Endpoint>(Error("IPv6 remote hosts must be bracketed: " + host_str));
  }
  if (colon == 0) {
    return Try<Endpoint>(Error("Empty host in remote host: " + host_str));
  }
  Try<size_t> port = to_port(host_str, host_str.substr(colon + 1));
  if (port.isError()) {
    return Try<Endpoint>(Error(port.error()));
  }
  return Endpoint(host_str.substr(0, colon), port.get());
}

Try<std::vector<bucky::Endpoint>> bucky::params::get_endpoints(
    const config::ClientSettings& settings, size_t default_port) {
  std::vector<Endpoint> endpoints;
  if (settings.remote_hosts_size() == 0) {
    endpoints.push_back(Endpoint(DEFAULT_REMOTE_HOST, default_port));
    return endpoints;
  }
  for (const std::string& host_str : settings.remote_hosts()) {
    Try<Endpoint> endpoint = parse_endpoint(host_str, default_port);
    if (endpoint.isError()) {
      return Try<std::vector<Endpoint>>(Error(endpoint.error()));
    }
    endpoints.push_back(endpoint.get());
  }
  return endpoints;
}

bucky::metadata_t bucky::params::get_metadata(const config::AgentConfig& config) {
  metadata_t metadata;
  for (const config::MetadataEntry& entry : config.metadata()) {
    if (entry.has_value()) {
      metadata[entry.key()] = entry.value();
    } else {
      metadata[entry.key()] = None();
    }
  }
  return metadata;
}

Try<bucky::config::AgentConfig> bucky::params::parse(const std::string& content) {
  config::AgentConfig config;
  ConfigErrorCollector errors;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&errors);
  if (!parser.ParseFromString(content, &config)) {
    return Try<config::AgentConfig>(Error("Invalid config: " + errors.str()));
  }
  return config;
}

Try<bucky::config::AgentConfig> bucky::params::load(const std::string& path) {
  Try<std::string> content = os::read(path);
  if (content.isError()) {
    return Try<config::AgentConfig>(
        Error("Failed to read config file " + path + ": " + content.error()));
  }
  Try<config::AgentConfig> config = parse(content.get());
  if (config.isError()) {
    return Try<config::AgentConfig>(Error(path + ": " + config.error()));
  }
  Try<Nothing> valid = validate(config.get());
  if (valid.isError()) {
    return Try<config::AgentConfig>(Error(path + ": " + valid.error()));
  }
  LOG(INFO) << "Loaded config from " << path;
  return config;
}

Try<Nothing> bucky::params::validate(const config::AgentConfig& config) {
  Try<int> log_level = to_min_log_level(config.log_level());
  if (log_level.isError()) {
    return Try<Nothing>(Error(log_level.error()));
  }
  if (config.poll_timeout_ms() == 0) {
    return Try<Nothing>(Error("Invalid poll_timeout_ms: must be non-zero"));
  }
  for (const config::MetadataEntry& entry : config.metadata()) {
    if (entry.key().empty()) {
      return Try<Nothing>(Error("Invalid metadata: keys must be non-empty"));
    }
  }
  if (config.proc_stats().enabled() && config.proc_stats().interval_ms() == 0) {
    return Try<Nothing>(Error("Invalid proc_stats.interval_ms: must be non-zero"));
  }

  bool any_client = false;
  if (config.carbon().enabled()) {
    any_client = true;
    Try<Nothing> valid = validate_client("carbon", config.carbon().client(), CARBON_DEFAULT_PORT);
    if (valid.isError()) {
      return valid;
    }
  }
  if (config.elasticsearch().enabled()) {
    any_client = true;
    Try<Nothing> valid = validate_client(
        "elasticsearch", config.elasticsearch().client(), ELASTICSEARCH_DEFAULT_PORT);
    if (valid.isError()) {
      return valid;
    }
    const std::string& compression = config.elasticsearch().compression();
    if (to_compression_mode(compression) == compression_mode::UNKNOWN) {
      return Try<Nothing>(Error("Unknown elasticsearch.compression: " + compression));
    }
    if (config.elasticsearch().bulk_path().empty() || config.elasticsearch().bulk_path()[0] != '/') {
      return Try<Nothing>(Error("Invalid elasticsearch.bulk_path: must start with '/'"));
    }
  }
  if (!any_client) {
    return Try<Nothing>(Error(
            "At least one client must be enabled: carbon.enabled or elasticsearch.enabled"));
  }
  return Nothing();
}
