#include "elasticsearch_client.hpp"

#include <math.h>
#include <stdio.h>
#include <time.h>

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <glog/logging.h>

#include "params.hpp"
#include "tcp_connector.hpp"

#define NDJSON_CONTENT_TYPE "application/x-ndjson"

namespace {
  /**
   * Dumps the json with sorted keys and no whitespace. Non-ASCII text is escaped so that the
   * output, and therefore the document id, doesn't depend on how the input was encoded.
   */
  std::string dump_minified(const nlohmann::json& json) {
    return json.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
  }

  bool to_utc(double timestamp, struct tm& out) {
    time_t secs = (time_t) floor(timestamp);
    return gmtime_r(&secs, &out) != NULL;
  }

  std::string format_index_name(const std::string& format, double timestamp) {
    struct tm utc;
    if (!to_utc(timestamp, utc)) {
      return "";
    }
    char buf[256];
    size_t len = strftime(buf, sizeof(buf), format.c_str(), &utc);
    return std::string(buf, len);
  }
}

Try<bucky::push_client_ptr_t> bucky::ElasticsearchClient::create(
    const config::ElasticsearchConfig& config) {
  Try<std::vector<Endpoint>> endpoints =
    params::get_endpoints(config.client(), params::ELASTICSEARCH_DEFAULT_PORT);
  if (endpoints.isError()) {
    return Try<push_client_ptr_t>(Error("Invalid elasticsearch endpoints: " + endpoints.error()));
  }
  if (params::to_compression_mode(config.compression()) == params::compression_mode::UNKNOWN) {
    return Try<push_client_ptr_t>(Error("Unknown elasticsearch compression: " + config.compression()));
  }
  std::shared_ptr<TCPConnector> connector(new TCPConnector(
          endpoints.get(),
          config.client().connect_timeout_ms(),
          config.client().io_timeout_ms()));
  return push_client_ptr_t(new ElasticsearchClient(config, connector));
}

bucky::ElasticsearchClient::ElasticsearchClient(
    const config::ElasticsearchConfig& config,
    std::shared_ptr<TCPConnector> connector,
    const index_namer_t& index_namer_for_tests/*=index_namer_t()*/)
  : PushClient("elasticsearch", config.client(), connector),
    index_namer(index_namer_for_tests ? index_namer_for_tests : get_index_namer(config)),
    type_name(config.type_name()),
    bulk_path(config.bulk_path()),
    http(connector, params::to_compression_mode(config.compression())) { }

bucky::ElasticsearchClient::index_namer_t bucky::ElasticsearchClient::get_index_namer(
    const config::ElasticsearchConfig& config) {
  if (config.has_index_name()) {
    const std::string static_name = config.index_name();
    return [static_name](const std::string&, const nlohmann::json&, double) {
      return static_name;
    };
  }
  if (config.has_index_name_format()) {
    const std::string format = config.index_name_format();
    return [format](const std::string&, const nlohmann::json&, double timestamp) {
      return format_index_name(format, timestamp);
    };
  }
  return index_namer_t();
}

std::string bucky::ElasticsearchClient::format_timestamp(double timestamp) {
  // round to microseconds, then truncate to milliseconds
  long long micros = llround(timestamp * 1000000.);
  long long secs = micros / 1000000;
  long long sub_micros = micros % 1000000;
  if (sub_micros < 0) {
    sub_micros += 1000000;
    --secs;
  }

  time_t time_secs = (time_t) secs;
  struct tm utc;
  if (gmtime_r(&time_secs, &utc) == NULL) {
    LOG(ERROR) << "Unable to convert timestamp " << timestamp << " to UTC";
    return "";
  }
  char buf[64];
  snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03lld",
      utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
      utc.tm_hour, utc.tm_min, utc.tm_sec, sub_micros / 1000);
  return buf;
}

std::string bucky::ElasticsearchClient::document_id(const std::string& doc_str) {
  boost::uuids::name_generator_sha1 gen(boost::uuids::ns::dns());
  return boost::uuids::to_string(gen(doc_str));
}

void bucky::ElasticsearchClient::process_values(double receive_timestamp,
    const std::string& bucket, const values_t& values, const Option<double>& timestamp,
    const metadata_t& metadata) {
  nlohmann::json doc = nlohmann::json::object();
  for (const metadata_t::value_type& entry : metadata) {
    if (entry.second.isSome()) {
      doc[entry.first] = entry.second.get();
    } else {
      doc[entry.first] = nullptr;
    }
  }
  for (const values_t::value_type& entry : values) {
    doc[entry.first] = entry.second;
  }
  double effective = timestamp.isSome() ? timestamp.get() : receive_timestamp;
  doc["timestamp"] = format_timestamp(effective);
  doc["bucket"] = bucket;

  std::string index_name = index_namer ? index_namer(bucket, doc, effective) : bucket;
  if (index_name.empty()) {
    DLOG(INFO) << "Dropping sample in bucket '" << bucket << "': empty index name";
    return;
  }

  std::string doc_str = dump_minified(doc);
  nlohmann::json action;
  action["index"]["_id"] = document_id(doc_str);
  action["index"]["_index"] = index_name;
  action["index"]["_type"] = type_name.empty() ? bucket : type_name;

  buffer_output(dump_minified(action) + '\n' + doc_str + '\n');
}

Try<Nothing> bucky::ElasticsearchClient::push_chunk(const std::vector<std::string>& chunk) {
  std::string body;
  for (const std::string& pair : chunk) {
    body += pair;
  }

  Try<HTTPResponse> response = http.post(bulk_path, NDJSON_CONTENT_TYPE, body);
  if (response.isError()) {
    return Try<Nothing>(Error(response.error()));
  }
  if (response.get().result_int() != 200) {
    return Try<Nothing>(Error(
            "Elasticsearch error code " + std::to_string(response.get().result_int())));
  }

  // Rejected documents are reported per item. Resending them wouldn't help, so only log it.
  nlohmann::json reply = nlohmann::json::parse(response.get().body(), nullptr, false);
  if (!reply.is_discarded() && reply.is_object() && reply.contains("errors")
      && reply["errors"].is_boolean() && reply["errors"].get<bool>()) {
    LOG(WARNING) << "Elasticsearch rejected some of the " << chunk.size()
                 << " document(s) in the bulk request";
  }
  return Nothing();
}
