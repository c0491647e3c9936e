#include <stdlib.h>
#include <unistd.h>

#include <glog/logging.h>
#include <gtest/gtest.h>
#include <stout/os.hpp>

#include "proc_stats_collector.hpp"

namespace {
  const std::string LOADAVG("0.52 0.58 0.59 2/1234 5678\n");
  const std::string MEMINFO(
      "MemTotal:       16318388 kB\n"
      "MemFree:            1234 kB\n"
      "HugePages_Total:       0\n"
      "Hugepagesize:       2048 kB\n"
      "Weird:                 5 MB\n"
      "not a row\n");
}

class ProcStatsCollectorTests : public ::testing::Test {
 protected:
  virtual void SetUp() {
    std::string template_copy = "proc_stats_collector_tests-XXXXXX";
    if (mkdtemp((char*)template_copy.c_str()) == NULL) {
      LOG(FATAL) << "Failed to create tmpdir";
    }
    proc_root = template_copy;
    queue.reset(new bucky::SampleQueue);
  }

  virtual void TearDown() {
    Try<Nothing> result = os::rmdir(proc_root);
    if (result.isError()) {
      LOG(FATAL) << "Failed to clean up proc_root[" << proc_root << "]: " << result.error();
    }
  }

  void write_file(const std::string& name, const std::string& content) {
    Try<Nothing> result = os::write(proc_root + "/" + name, content);
    ASSERT_FALSE(result.isError()) << result.error();
  }

  std::shared_ptr<bucky::ProcStatsCollector> collector(size_t interval_ms = 10000) {
    bucky::config::ProcStatsConfig config;
    config.set_proc_root(proc_root);
    config.set_interval_ms(interval_ms);
    bucky::metadata_t metadata;
    metadata["host"] = std::string("a1");
    metadata["rack"] = None();
    return std::shared_ptr<bucky::ProcStatsCollector>(
        new bucky::ProcStatsCollector(queue, config, metadata));
  }

  std::string proc_root;
  std::shared_ptr<bucky::SampleQueue> queue;
};

TEST_F(ProcStatsCollectorTests, parse_loadavg) {
  Option<bucky::values_t> values = bucky::ProcStatsCollector::parse_loadavg(LOADAVG);
  ASSERT_TRUE(values.isSome());
  EXPECT_EQ(3, values.get().size());
  EXPECT_DOUBLE_EQ(0.52, values.get()["load_1m"]);
  EXPECT_DOUBLE_EQ(0.58, values.get()["load_5m"]);
  EXPECT_DOUBLE_EQ(0.59, values.get()["load_15m"]);

  EXPECT_TRUE(bucky::ProcStatsCollector::parse_loadavg("").isNone());
  EXPECT_TRUE(bucky::ProcStatsCollector::parse_loadavg("0.52 0.58").isNone());
  EXPECT_TRUE(bucky::ProcStatsCollector::parse_loadavg("0.52 abc 0.59 2/1234 5678").isNone());
}

TEST_F(ProcStatsCollectorTests, parse_meminfo) {
  Option<bucky::values_t> values = bucky::ProcStatsCollector::parse_meminfo(MEMINFO);
  ASSERT_TRUE(values.isSome());
  EXPECT_EQ(4, values.get().size());
  EXPECT_EQ(16318388. * 1024, values.get()["memtotal"]);
  EXPECT_EQ(1234. * 1024, values.get()["memfree"]);
  EXPECT_EQ(0, values.get()["hugepages_total"]);
  EXPECT_EQ(2048. * 1024, values.get()["hugepagesize"]);
  EXPECT_EQ(0, values.get().count("weird"));

  EXPECT_TRUE(bucky::ProcStatsCollector::parse_meminfo("").isNone());
  EXPECT_TRUE(bucky::ProcStatsCollector::parse_meminfo("garbage\n:\n").isNone());
}

TEST_F(ProcStatsCollectorTests, collect_pushes_load_and_memory) {
  write_file("loadavg", LOADAVG);
  write_file("meminfo", MEMINFO);
  std::shared_ptr<bucky::ProcStatsCollector> stats = collector();

  double before = bucky::Collector::now();
  stats->collect();
  double after = bucky::Collector::now();
  ASSERT_EQ(2, queue->size());

  bucky::Sample load;
  ASSERT_EQ(bucky::pop_result::SAMPLE, queue->pop(0, load));
  EXPECT_EQ("system_load", load.bucket);
  EXPECT_EQ(3, load.values.size());
  EXPECT_TRUE(load.timestamp.isNone());
  EXPECT_LE(before, load.receive_timestamp);
  EXPECT_GE(after, load.receive_timestamp);
  EXPECT_EQ(2, load.metadata.size());
  EXPECT_EQ("a1", load.metadata["host"].get());
  EXPECT_TRUE(load.metadata["rack"].isNone());

  bucky::Sample memory;
  ASSERT_EQ(bucky::pop_result::SAMPLE, queue->pop(0, memory));
  EXPECT_EQ("system_memory", memory.bucket);
  EXPECT_EQ(4, memory.values.size());
  EXPECT_EQ(load.receive_timestamp, memory.receive_timestamp);
  EXPECT_EQ(load.metadata, memory.metadata);
}

TEST_F(ProcStatsCollectorTests, missing_or_bad_files_skipped) {
  write_file("meminfo", MEMINFO);
  std::shared_ptr<bucky::ProcStatsCollector> stats = collector();

  stats->collect();
  ASSERT_EQ(1, queue->size());
  bucky::Sample sample;
  ASSERT_EQ(bucky::pop_result::SAMPLE, queue->pop(0, sample));
  EXPECT_EQ("system_memory", sample.bucket);

  write_file("loadavg", "nonsense");
  write_file("meminfo", "");
  stats->collect();
  EXPECT_EQ(0, queue->size());
}

TEST_F(ProcStatsCollectorTests, runs_on_interval_until_closed) {
  write_file("loadavg", LOADAVG);
  write_file("meminfo", MEMINFO);
  std::shared_ptr<bucky::ProcStatsCollector> stats = collector(10);
  stats->start();
  EXPECT_TRUE(stats->is_alive());

  for (size_t i = 0; i < 500 && queue->size() < 6; ++i) {
    usleep(1000 * 10);
  }
  EXPECT_LE(6, queue->size());

  stats->close();
  EXPECT_TRUE(stats->join(5000));
  EXPECT_FALSE(stats->is_alive());

  // nothing is collected once closed
  size_t size = queue->size();
  usleep(1000 * 50);
  EXPECT_EQ(size, queue->size());
}

TEST_F(ProcStatsCollectorTests, close_before_start_exits_immediately) {
  std::shared_ptr<bucky::ProcStatsCollector> stats = collector(60000);
  stats->close();
  stats->start();
  EXPECT_TRUE(stats->join(5000));
  EXPECT_EQ(0, queue->size());
}

int main(int argc, char **argv) {
  ::google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
