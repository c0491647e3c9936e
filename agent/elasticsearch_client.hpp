#pragma once

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.pb.h"
#include "http_connection.hpp"
#include "push_client.hpp"

namespace bucky {

  /**
   * An ElasticsearchClient forwards samples as documents to an Elasticsearch cluster using the
   * bulk API. Each sample is buffered as an NDJSON pair of "index" action line and document line.
   *
   * Document ids are derived from the document content, so that pushing the same buffer twice
   * after a connection failure doesn't produce duplicate documents.
   */
  class ElasticsearchClient : public PushClient {
   public:
    /**
     * Returns the index to place a document in, given its bucket, the document itself, and its
     * effective timestamp. An empty result drops the document.
     */
    typedef std::function<std::string(
        const std::string& bucket, const nlohmann::json& doc, double timestamp)> index_namer_t;

    /**
     * Creates an ElasticsearchClient which connects to the remote_hosts in the provided config.
     */
    static Try<push_client_ptr_t> create(const config::ElasticsearchConfig& config);

    /**
     * Use create(). This is meant for access by tests. If no index namer is provided, one is
     * built from the config via get_index_namer().
     */
    ElasticsearchClient(
        const config::ElasticsearchConfig& config,
        std::shared_ptr<TCPConnector> connector,
        const index_namer_t& index_namer_for_tests = index_namer_t());

    virtual ~ElasticsearchClient() { }

    /**
     * Returns a namer for the config's index_name or index_name_format, or an empty function if
     * neither is set, in which case documents are indexed by their bucket.
     */
    static index_namer_t get_index_namer(const config::ElasticsearchConfig& config);

    /**
     * Formats an epoch timestamp as "YYYY-MM-DD HH:MM:SS.mmm" in UTC.
     */
    static std::string format_timestamp(double timestamp);

    /**
     * Returns the SHA-1 name-based UUID of the provided text in the DNS namespace.
     */
    static std::string document_id(const std::string& doc_str);

   protected:
    void process_values(double receive_timestamp, const std::string& bucket,
        const values_t& values, const Option<double>& timestamp, const metadata_t& metadata);

    Try<Nothing> push_chunk(const std::vector<std::string>& chunk);

   private:
    const index_namer_t index_namer;
    const std::string type_name;
    const std::string bulk_path;
    HTTPConnection http;
  };

}
