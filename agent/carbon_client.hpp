#pragma once

#include <string>
#include <vector>

#include "config.pb.h"
#include "push_client.hpp"

namespace bucky {

  /**
   * A CarbonClient forwards samples to a carbon/graphite server using the plaintext line protocol:
   * "<dotted.metric.name> <value> <integer timestamp>\n", one line per value.
   */
  class CarbonClient : public PushClient {
   public:
    /**
     * Creates a CarbonClient which connects to the remote_hosts in the provided config.
     */
    static Try<push_client_ptr_t> create(const config::CarbonConfig& config);

    /**
     * Use create(). This is meant for access by tests.
     */
    CarbonClient(const config::CarbonConfig& config, std::shared_ptr<TCPConnector> connector);

    virtual ~CarbonClient() { }

    /**
     * Builds a metric name out of the metadata values: first the values for the configured
     * name_mapping keys, in configured order, then the values of all other keys, sorted by key.
     * Keys without a value are skipped.
     */
    std::string build_name(metadata_t metadata) const;

   protected:
    void process_values(double receive_timestamp, const std::string& bucket,
        const values_t& values, const Option<double>& timestamp, const metadata_t& metadata);

    Try<Nothing> push_chunk(const std::vector<std::string>& chunk);

   private:
    const std::vector<std::string> name_mapping;
  };

}
