/**
 * @file test_job_queue.cpp
 * @brief Bounded job queue
 */

#include <thread>

#include <gtest/gtest.h>

#include "media_jobs/job_queue.hpp"

using namespace media_jobs;

namespace {

JobTicket ticket(const std::string &id) {
  JobTicket t;
  t.id = id;
  return t;
}

} // namespace

TEST(JobQueue, FifoOrder) {
  JobQueue queue(4);
  auto a = ticket("a");
  auto b = ticket("b");
  ASSERT_TRUE(queue.try_push(a));
  ASSERT_TRUE(queue.try_push(b));

  JobTicket out;
  ASSERT_TRUE(queue.pop(out));
  EXPECT_EQ(out.id, "a");
  ASSERT_TRUE(queue.pop(out));
  EXPECT_EQ(out.id, "b");
}

TEST(JobQueue, RejectsWhenFullAndKeepsTicket) {
  JobQueue queue(1);
  auto a = ticket("a");
  auto b = ticket("b");
  EXPECT_TRUE(queue.try_push(a));
  EXPECT_FALSE(queue.try_push(b));
  EXPECT_EQ(b.id, "b");
  EXPECT_EQ(queue.size(), 1u);
}

TEST(JobQueue, ZeroCapacityMeansOne) {
  JobQueue queue(0);
  EXPECT_EQ(queue.capacity(), 1u);
}

TEST(JobQueue, FinishDrainsThenStops) {
  JobQueue queue(2);
  auto a = ticket("a");
  queue.try_push(a);
  queue.finish();

  auto late = ticket("late");
  EXPECT_FALSE(queue.try_push(late));

  JobTicket out;
  EXPECT_TRUE(queue.pop(out));
  EXPECT_EQ(out.id, "a");
  EXPECT_FALSE(queue.pop(out));
  EXPECT_TRUE(queue.is_done());
}

TEST(JobQueue, FinishWakesBlockedConsumer) {
  JobQueue queue(2);
  bool popped = true;
  std::thread consumer([&] {
    JobTicket out;
    popped = queue.pop(out);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.finish();
  consumer.join();
  EXPECT_FALSE(popped);
}
