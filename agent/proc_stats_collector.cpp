#include "proc_stats_collector.hpp"

#include <stdlib.h>

#include <sstream>

#include <boost/algorithm/string.hpp>
#include <glog/logging.h>
#include <stout/os/read.hpp>

#define LOAD_BUCKET "system_load"
#define MEMORY_BUCKET "system_memory"

namespace {
  bool to_double(const std::string& str, double& out) {
    if (str.empty()) {
      return false;
    }
    char* invalid = NULL;
    out = strtod(str.c_str(), &invalid);
    return invalid == NULL || invalid[0] == '\0';
  }
}

bucky::ProcStatsCollector::ProcStatsCollector(
    std::shared_ptr<SampleQueue> queue,
    const config::ProcStatsConfig& config,
    const metadata_t& metadata)
  : Collector("proc_stats", queue, config.interval_ms()),
    proc_root(config.proc_root()),
    metadata(metadata) { }

void bucky::ProcStatsCollector::collect() {
  const double timestamp = now();

  const std::string loadavg_path = proc_root + "/loadavg";
  Try<std::string> loadavg = os::read(loadavg_path);
  if (loadavg.isError()) {
    LOG(WARNING) << name() << ": Failed to read " << loadavg_path << ": " << loadavg.error();
  } else {
    Option<values_t> values = parse_loadavg(loadavg.get());
    if (values.isNone()) {
      LOG(WARNING) << name() << ": Unable to parse " << loadavg_path;
    } else {
      push(Sample(timestamp, LOAD_BUCKET, values.get(), None(), metadata));
    }
  }

  const std::string meminfo_path = proc_root + "/meminfo";
  Try<std::string> meminfo = os::read(meminfo_path);
  if (meminfo.isError()) {
    LOG(WARNING) << name() << ": Failed to read " << meminfo_path << ": " << meminfo.error();
  } else {
    Option<values_t> values = parse_meminfo(meminfo.get());
    if (values.isNone()) {
      LOG(WARNING) << name() << ": Unable to parse " << meminfo_path;
    } else {
      push(Sample(timestamp, MEMORY_BUCKET, values.get(), None(), metadata));
    }
  }
}

Option<bucky::values_t> bucky::ProcStatsCollector::parse_loadavg(const std::string& content) {
  // "0.52 0.58 0.59 2/1234 5678"
  std::istringstream iss(content);
  std::string load_1m, load_5m, load_15m;
  iss >> load_1m >> load_5m >> load_15m;
  values_t values;
  if (!to_double(load_1m, values["load_1m"])
      || !to_double(load_5m, values["load_5m"])
      || !to_double(load_15m, values["load_15m"])) {
    return None();
  }
  return values;
}

Option<bucky::values_t> bucky::ProcStatsCollector::parse_meminfo(const std::string& content) {
  // "MemTotal:       16318388 kB"
  values_t values;
  std::istringstream iss(content);
  std::string line;
  while (std::getline(iss, line)) {
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      continue;
    }
    std::string key = boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(line.substr(0, colon)));

    std::istringstream fields(line.substr(colon + 1));
    std::string value_str, unit;
    fields >> value_str >> unit;
    double value;
    if (!to_double(value_str, value)) {
      DLOG(INFO) << "Skipping meminfo row: " << line;
      continue;
    }
    if (unit == "kB") {
      value *= 1024;
    } else if (!unit.empty()) {
      DLOG(INFO) << "Skipping meminfo row with unknown unit: " << line;
      continue;
    }
    values[key] = value;
  }
  if (values.empty()) {
    return None();
  }
  return values;
}
