#pragma once

#include <string>

#include <stout/option.hpp>

#include "collector.hpp"
#include "config.pb.h"

namespace bucky {

  /**
   * A ProcStatsCollector samples the host's load averages and memory usage from procfs. Each round
   * produces a "system_load" sample from loadavg and a "system_memory" sample from meminfo, both
   * tagged with the configured global metadata.
   */
  class ProcStatsCollector : public Collector {
   public:
    ProcStatsCollector(std::shared_ptr<SampleQueue> queue,
        const config::ProcStatsConfig& config,
        const metadata_t& metadata);

    virtual ~ProcStatsCollector() { }

    void collect();

    /**
     * Parses the content of /proc/loadavg into load_1m, load_5m and load_15m.
     */
    static Option<values_t> parse_loadavg(const std::string& content);

    /**
     * Parses the content of /proc/meminfo. kB rows are converted to bytes. Keys are lower-cased.
     */
    static Option<values_t> parse_meminfo(const std::string& content);

   private:
    const std::string proc_root;
    const metadata_t metadata;
  };

}
