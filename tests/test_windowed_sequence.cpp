#include "utils/windowed_sequence.hpp"
#include "manual_clock.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Windowed::WindowedSequence;

class WindowedSequenceTest : public ::testing::Test {
protected:
  using Sequence = WindowedSequence<std::string, ManualClock>;

  void SetUp() override { ManualClock::reset(); }

  static std::vector<std::string> collect(Sequence &seq) {
    std::vector<std::string> out;
    for (auto value : seq.values())
      out.push_back(value);
    return out;
  }
};

TEST_F(WindowedSequenceTest, AllFreshEntriesAreVisible) {
  Sequence seq(100ms);
  seq.push("a");
  seq.push("b");
  ManualClock::advance(10ms);

  EXPECT_EQ(seq.size(), 2u);
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"a", "b"}));
}

TEST_F(WindowedSequenceTest, PartialExpiryKeepsOnlyRecentEntries) {
  Sequence seq(100ms);
  seq.push("a");
  ManualClock::advance(80ms);
  seq.push("b");
  ManualClock::advance(40ms); // "a" is 120ms old, "b" 40ms

  EXPECT_EQ(seq.size(), 1u);
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"b"}));
}

TEST_F(WindowedSequenceTest, PastTimestampIsEvictedOnNextObservation) {
  Sequence seq(100ms);
  seq.push_with_timestamp("old", ManualClock::now() - 200ms);
  seq.push("new");

  EXPECT_EQ(seq.size(), 1u);
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"new"}));
}

TEST_F(WindowedSequenceTest, EarliestRepresentableTimestampIsEvicted) {
  Sequence seq(100ms);
  seq.push_with_timestamp("ancient", ManualClock::time_point::min());
  seq.push("new");

  EXPECT_EQ(seq.size(), 1u);
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"new"}));
}

TEST_F(WindowedSequenceTest, WindowBeyondClockRangeKeepsEntries) {
  Sequence seq(std::chrono::hours(3000000));
  EXPECT_EQ(seq.window_duration(), ManualClock::duration::max());

  seq.push("a");
  ManualClock::advance(24h);
  EXPECT_EQ(seq.size(), 1u);
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"a"}));
}

TEST_F(WindowedSequenceTest, ZeroWindowIsAlwaysEmpty) {
  Sequence seq(0ms);
  seq.push("a");

  EXPECT_EQ(seq.size(), 0u);
  EXPECT_TRUE(seq.values().empty());
  EXPECT_TRUE(seq.empty());
}

TEST_F(WindowedSequenceTest, EntryExpiresExactlyAtWindowBoundary) {
  Sequence seq(100ms);
  seq.push("edge");

  ManualClock::advance(99ms);
  EXPECT_EQ(seq.size(), 1u);

  ManualClock::advance(1ms);
  EXPECT_EQ(seq.size(), 0u);
}

TEST_F(WindowedSequenceTest, PreservesInsertionOrderAmongSurvivors) {
  Sequence seq(100ms);
  for (int i = 0; i < 10; ++i) {
    seq.push(std::to_string(i));
    ManualClock::advance(15ms);
  }
  // Now 150ms after "0"; entries 0..3 are at least 105ms old.
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"4", "5", "6", "7", "8",
                                                    "9"}));
}

TEST_F(WindowedSequenceTest, DuplicatesArePermitted) {
  Sequence seq(100ms);
  seq.push("x");
  seq.push("x");
  seq.push("x");

  EXPECT_EQ(seq.size(), 3u);
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"x", "x", "x"}));
}

TEST_F(WindowedSequenceTest, OutOfOrderTimestampsEvictExactlyTheExpired) {
  Sequence seq(100ms);
  const auto base = ManualClock::now();
  seq.push_with_timestamp("fresh-1", base);
  seq.push_with_timestamp("stale", base - 150ms);
  seq.push_with_timestamp("fresh-2", base - 20ms);
  seq.push_with_timestamp("borderline", base - 100ms);
  seq.push_with_timestamp("fresh-3", base + 0ms);

  EXPECT_EQ(seq.size(), 3u);
  EXPECT_EQ(collect(seq),
            (std::vector<std::string>{"fresh-1", "fresh-2", "fresh-3"}));

  ManualClock::advance(85ms); // "fresh-2" is now 105ms old
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"fresh-1", "fresh-3"}));
}

TEST_F(WindowedSequenceTest, FutureTimestampStaysUntilItAges) {
  Sequence seq(100ms);
  seq.push_with_timestamp("later", ManualClock::now() + 50ms);

  EXPECT_EQ(seq.size(), 1u);
  ManualClock::advance(149ms);
  EXPECT_EQ(seq.size(), 1u);
  ManualClock::advance(1ms);
  EXPECT_EQ(seq.size(), 0u);
}

TEST_F(WindowedSequenceTest, RepeatedObservationsAgree) {
  Sequence seq(100ms);
  seq.push("a");
  ManualClock::advance(30ms);
  seq.push("b");
  ManualClock::advance(80ms);

  auto first = collect(seq);
  auto second = collect(seq);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first, (std::vector<std::string>{"b"}));
}

TEST_F(WindowedSequenceTest, ValuesAreCopiesThatOutliveTheRange) {
  Sequence seq(100ms);
  seq.push("kept");

  std::vector<std::string> taken;
  {
    auto range = seq.values();
    EXPECT_EQ(range.size(), 1u);
    taken.push_back(*range.begin());
  }
  seq.push("more");
  ManualClock::advance(200ms);
  EXPECT_EQ(seq.size(), 0u);

  ASSERT_EQ(taken.size(), 1u);
  EXPECT_EQ(taken.front(), "kept");
}

TEST_F(WindowedSequenceTest, SnapshotMatchesValues) {
  Sequence seq(100ms);
  seq.push("a");
  seq.push("b");

  EXPECT_EQ(seq.snapshot(), collect(seq));
}

TEST_F(WindowedSequenceTest, DrainMovesSurvivorsInOrder) {
  Sequence seq(100ms);
  seq.push("expired");
  ManualClock::advance(120ms);
  seq.push("a");
  seq.push("b");

  auto drained = std::move(seq).drain();
  EXPECT_EQ(drained, (std::vector<std::string>{"a", "b"}));
}

TEST_F(WindowedSequenceTest, DrainSupportsMoveOnlyValues) {
  WindowedSequence<std::unique_ptr<int>, ManualClock> seq(100ms);
  seq.push(std::make_unique<int>(1));
  ManualClock::advance(150ms);
  seq.push(std::make_unique<int>(2));
  seq.push(std::make_unique<int>(3));

  auto drained = std::move(seq).drain();
  ASSERT_EQ(drained.size(), 2u);
  EXPECT_EQ(*drained[0], 2);
  EXPECT_EQ(*drained[1], 3);
}

TEST_F(WindowedSequenceTest, WindowDurationIsReportedAndNegativeIsClamped) {
  Sequence seq(2s);
  EXPECT_EQ(seq.window_duration(), std::chrono::nanoseconds(2s));

  Sequence negative(-5ms);
  EXPECT_EQ(negative.window_duration(), ManualClock::duration::zero());
  negative.push("a");
  EXPECT_EQ(negative.size(), 0u);
}

TEST_F(WindowedSequenceTest, PushAfterEvictionStartsFresh) {
  Sequence seq(100ms);
  seq.push("a");
  ManualClock::advance(100ms);
  EXPECT_TRUE(seq.empty());

  seq.push("b");
  EXPECT_EQ(collect(seq), (std::vector<std::string>{"b"}));
}

TEST(WindowedSequenceSteadyClockTest, PartialExpiryWithRealTime) {
  WindowedSequence<std::string> seq(200ms);
  seq.push("a");
  std::this_thread::sleep_for(160ms);
  seq.push("b");
  std::this_thread::sleep_for(80ms);

  EXPECT_EQ(seq.snapshot(), (std::vector<std::string>{"b"}));
}
