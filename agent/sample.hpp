#pragma once

#include <map>
#include <string>

#include <stout/option.hpp>

namespace bucky {

  typedef std::map<std::string, double> values_t;
  typedef std::map<std::string, Option<std::string>> metadata_t;

  /**
   * A Sample is a single measurement event produced by a Collector. Once a Sample has been pushed
   * onto the intake queue it is treated as immutable: every client receives its own copy, and
   * clients build their output from copies of 'values' and 'metadata'.
   */
  struct Sample {
    Sample() : receive_timestamp(0) { }

    Sample(double receive_timestamp, const std::string& bucket, const values_t& values,
        const Option<double>& timestamp = None(), const metadata_t& metadata = metadata_t())
      : receive_timestamp(receive_timestamp),
        bucket(bucket),
        values(values),
        timestamp(timestamp),
        metadata(metadata) { }

    /**
     * The event time if one was provided, otherwise the time the collector observed the sample.
     */
    double effective_timestamp() const {
      return timestamp.isSome() ? timestamp.get() : receive_timestamp;
    }

    double receive_timestamp;
    std::string bucket;
    values_t values;
    Option<double> timestamp;
    metadata_t metadata;
  };

}
