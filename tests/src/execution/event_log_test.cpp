#include <canon/execution/event_log.hpp>
#include <canon/testing/common.hpp>
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using canon::schema::pause_changed_event_t;
using canon::testing::make_hash;

TEST(event_log, assigns_increasing_sequences_across_blocks) {
  auto log = canon::execution::event_log{};
  EXPECT_EQ(log.append(1, pause_changed_event_t{make_hash(1), true}).sequence,
            1u);
  EXPECT_EQ(log.append(1, pause_changed_event_t{make_hash(1), false}).sequence,
            2u);
  EXPECT_EQ(log.pending().size(), 2u);

  auto taken = log.take_pending();
  ASSERT_EQ(taken.size(), 2u);
  EXPECT_TRUE(log.pending().empty());
  EXPECT_EQ(taken[1].height, 1u);

  EXPECT_EQ(log.append(2, pause_changed_event_t{make_hash(1), true}).sequence,
            3u);
  EXPECT_EQ(log.next_sequence(), 4u);
}

TEST(event_log, restored_sequence_continues_numbering) {
  auto log = canon::execution::event_log{};
  log.restore_sequence(42);
  EXPECT_EQ(log.append(7, pause_changed_event_t{}).sequence, 42u);
}

TEST(event_log, publish_reaches_every_subscriber_despite_failures) {
  auto log = canon::execution::event_log{};
  auto seen = std::vector<uint64_t>{};
  log.subscribe([](const canon::schema::event_record_t&) {
    throw std::runtime_error{"subscriber down"};
  });
  log.subscribe([&](const canon::schema::event_record_t& record) {
    seen.push_back(record.sequence);
  });

  log.append(1, pause_changed_event_t{});
  log.append(1, pause_changed_event_t{});
  EXPECT_TRUE(seen.empty());

  log.publish(log.take_pending());
  EXPECT_EQ(seen, (std::vector<uint64_t>{1, 2}));
}

TEST(event_log, subscribing_during_publish_takes_effect_next_publish) {
  auto log = canon::execution::event_log{};
  auto first = 0;
  auto second = 0;
  auto late = 0;
  log.subscribe([&](const canon::schema::event_record_t&) {
    ++first;
    log.subscribe([&](const canon::schema::event_record_t&) { ++late; });
  });
  log.subscribe([&](const canon::schema::event_record_t&) { ++second; });

  log.append(1, pause_changed_event_t{});
  log.publish(log.take_pending());
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 1);
  EXPECT_EQ(late, 0);

  log.append(2, pause_changed_event_t{});
  log.publish(log.take_pending());
  EXPECT_EQ(first, 2);
  EXPECT_EQ(second, 2);
  EXPECT_EQ(late, 1);
}
