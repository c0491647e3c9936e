#include <unistd.h>

#include <thread>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include "sample_queue.hpp"

namespace {
  bucky::Sample sample(const std::string& bucket, double value) {
    bucky::values_t values;
    values["v"] = value;
    return bucky::Sample(1000, bucket, values);
  }
}

TEST(SampleQueueTests, empty_times_out) {
  bucky::SampleQueue queue;
  bucky::Sample out;
  EXPECT_EQ(bucky::pop_result::TIMEOUT, queue.pop(0, out));
  EXPECT_EQ(bucky::pop_result::TIMEOUT, queue.pop(10, out));
  EXPECT_EQ(0, queue.size());
}

TEST(SampleQueueTests, fifo_order_then_sentinel) {
  bucky::SampleQueue queue;
  queue.push(sample("a", 1));
  queue.push(sample("b", 2));
  queue.push_sentinel();
  queue.push(sample("c", 3));
  EXPECT_EQ(4, queue.size());

  bucky::Sample out;
  EXPECT_EQ(bucky::pop_result::SAMPLE, queue.pop(0, out));
  EXPECT_EQ("a", out.bucket);
  EXPECT_EQ(1, out.values["v"]);
  EXPECT_EQ(bucky::pop_result::SAMPLE, queue.pop(0, out));
  EXPECT_EQ("b", out.bucket);
  EXPECT_EQ(bucky::pop_result::SENTINEL, queue.pop(0, out));
  EXPECT_EQ("b", out.bucket); // untouched
  EXPECT_EQ(bucky::pop_result::SAMPLE, queue.pop(0, out));
  EXPECT_EQ("c", out.bucket);
  EXPECT_EQ(bucky::pop_result::TIMEOUT, queue.pop(0, out));
}

TEST(SampleQueueTests, pop_wakes_on_push) {
  bucky::SampleQueue queue;
  std::thread producer([&queue]() {
        usleep(1000 * 50);
        queue.push(sample("late", 1));
      });
  bucky::Sample out;
  EXPECT_EQ(bucky::pop_result::SAMPLE, queue.pop(5000, out));
  EXPECT_EQ("late", out.bucket);
  producer.join();
}

TEST(SampleQueueTests, producer_order_kept_across_threads) {
  bucky::SampleQueue queue;
  const size_t count = 1000;
  std::thread producer_a([&queue, count]() {
        for (size_t i = 0; i < count; ++i) {
          queue.push(sample("a", i));
        }
      });
  std::thread producer_b([&queue, count]() {
        for (size_t i = 0; i < count; ++i) {
          queue.push(sample("b", i));
        }
      });
  producer_a.join();
  producer_b.join();
  EXPECT_EQ(2 * count, queue.size());

  double next_a = 0, next_b = 0;
  bucky::Sample out;
  while (queue.pop(0, out) == bucky::pop_result::SAMPLE) {
    if (out.bucket == "a") {
      EXPECT_EQ(next_a++, out.values["v"]);
    } else {
      EXPECT_EQ(next_b++, out.values["v"]);
    }
  }
  EXPECT_EQ(count, next_a);
  EXPECT_EQ(count, next_b);
}

TEST(SampleQueueTests, effective_timestamp) {
  bucky::values_t values;
  bucky::Sample without(1000.5, "b", values);
  EXPECT_EQ(1000.5, without.effective_timestamp());
  bucky::Sample with(1000.5, "b", values, Option<double>(12.25));
  EXPECT_EQ(12.25, with.effective_timestamp());
}

int main(int argc, char **argv) {
  ::google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
