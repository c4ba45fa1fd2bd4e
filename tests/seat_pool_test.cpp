// =============================================================================
// seat_pool_test.cpp
// =============================================================================
// Unit tests for seatwise::SeatPool, seatwise::SeatLedger and
// seatwise::EnrollmentIdGenerator.
//
// Validates:
//   - reserve()/release() bounds (never above capacity, never below zero)
//   - N racing reserves against K seats: exactly K succeed
//   - Mixed concurrent reserve/release keeps the count consistent
//   - resetEnrolledCount() range checks
//   - SeatLedger creates one pool per section and keeps the first capacity
//   - Id generator uniqueness under concurrency and advancePast()
//
// Threading model:
//   Concurrency tests spawn threads and join them all before asserting.
// =============================================================================

#include "seatwise/concurrent/enrollment_id_generator.hpp"
#include "seatwise/concurrent/seat_ledger.hpp"
#include "seatwise/concurrent/seat_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

seatwise::domain::Section makeSection(const std::string& id, int capacity) {
  seatwise::domain::Section s;
  s.id = id;
  s.course_id = "CS101";
  s.capacity = capacity;
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Reserve up to capacity, then refuse.
// -----------------------------------------------------------------------------
TEST(SeatPoolTest, ReserveStopsAtCapacity) {
  seatwise::SeatPool pool(2);

  EXPECT_TRUE(pool.reserve());
  EXPECT_TRUE(pool.reserve());
  EXPECT_FALSE(pool.reserve());
  EXPECT_EQ(pool.enrolled(), 2);
  EXPECT_TRUE(pool.full());
  EXPECT_EQ(pool.available(), 0);
}

// -----------------------------------------------------------------------------
// 2. release() on an empty pool is refused and the count stays at zero.
// Why: A double drop must not produce a negative seat count.
// -----------------------------------------------------------------------------
TEST(SeatPoolTest, ReleaseOnEmptyPoolIsRefused) {
  seatwise::SeatPool pool(1);

  EXPECT_FALSE(pool.release());
  EXPECT_EQ(pool.enrolled(), 0);

  ASSERT_TRUE(pool.reserve());
  EXPECT_TRUE(pool.release());
  EXPECT_FALSE(pool.release());
  EXPECT_EQ(pool.enrolled(), 0);
}

TEST(SeatPoolTest, ZeroCapacityIsAlwaysFull) {
  seatwise::SeatPool pool(0);
  EXPECT_TRUE(pool.full());
  EXPECT_FALSE(pool.reserve());
}

TEST(SeatPoolTest, NegativeCapacityThrows) {
  EXPECT_THROW(seatwise::SeatPool pool(-1), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 3. resetEnrolledCount() accepts [0, capacity] and rejects the rest.
// -----------------------------------------------------------------------------
TEST(SeatPoolTest, ResetEnrolledCountRange) {
  seatwise::SeatPool pool(3);

  pool.resetEnrolledCount(3);
  EXPECT_EQ(pool.enrolled(), 3);
  EXPECT_FALSE(pool.reserve());

  pool.resetEnrolledCount(0);
  EXPECT_EQ(pool.enrolled(), 0);

  EXPECT_THROW(pool.resetEnrolledCount(4), std::invalid_argument);
  EXPECT_THROW(pool.resetEnrolledCount(-1), std::invalid_argument);
  EXPECT_EQ(pool.enrolled(), 0);
}

// -----------------------------------------------------------------------------
// 4. 64 threads race for 10 seats: exactly 10 win.
// -----------------------------------------------------------------------------
TEST(SeatPoolTest, ConcurrentReservesNeverOversubscribe) {
  constexpr int kCapacity = 10;
  constexpr int kThreads = 64;

  seatwise::SeatPool pool(kCapacity);
  std::atomic<int> winners{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      if (pool.reserve()) {
        winners.fetch_add(1);
      }
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(winners.load(), kCapacity);
  EXPECT_EQ(pool.enrolled(), kCapacity);
}

// -----------------------------------------------------------------------------
// 5. Mixed reserve/release churn: final count equals successful reserves
//    minus successful releases, and never leaves [0, capacity].
// -----------------------------------------------------------------------------
TEST(SeatPoolTest, ConcurrentChurnKeepsCountConsistent) {
  constexpr int kCapacity = 5;
  constexpr int kThreads = 8;
  constexpr int kIterations = 5000;

  seatwise::SeatPool pool(kCapacity);
  std::atomic<int> reserved{0};
  std::atomic<int> released{0};
  std::atomic<bool> out_of_range{false};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kIterations; ++i) {
        if ((i + t) % 2 == 0) {
          if (pool.reserve()) {
            reserved.fetch_add(1);
          }
        } else if (pool.release()) {
          released.fetch_add(1);
        }
        int now = pool.enrolled();
        if (now < 0 || now > kCapacity) {
          out_of_range.store(true);
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_FALSE(out_of_range.load());
  EXPECT_EQ(pool.enrolled(), reserved.load() - released.load());
}

// -----------------------------------------------------------------------------
// 6. SeatLedger: one pool per section; capacity fixed at first registration.
// -----------------------------------------------------------------------------
TEST(SeatLedgerTest, PoolForCreatesOncePerSection) {
  seatwise::SeatLedger ledger;

  seatwise::SeatPool& a = ledger.poolFor(makeSection("SEC1", 2));
  seatwise::SeatPool& again = ledger.poolFor(makeSection("SEC1", 99));
  EXPECT_EQ(&a, &again);
  EXPECT_EQ(again.capacity(), 2);

  EXPECT_EQ(ledger.find("SEC2"), nullptr);
  ledger.poolFor(makeSection("SEC2", 1));
  ASSERT_NE(ledger.find("SEC2"), nullptr);
}

TEST(SeatLedgerTest, SnapshotsAreSortedBySectionId) {
  seatwise::SeatLedger ledger;
  ledger.poolFor(makeSection("SEC3", 3));
  ledger.poolFor(makeSection("SEC1", 1)).reserve();
  ledger.poolFor(makeSection("SEC2", 2));

  auto snaps = ledger.snapshots();
  ASSERT_EQ(snaps.size(), 3u);
  EXPECT_EQ(snaps[0].section_id, "SEC1");
  EXPECT_EQ(snaps[0].enrolled, 1);
  EXPECT_EQ(snaps[1].section_id, "SEC2");
  EXPECT_EQ(snaps[2].section_id, "SEC3");
  EXPECT_EQ(snaps[2].capacity, 3);
}

TEST(SeatLedgerTest, NegativeCapacitySectionThrows) {
  seatwise::SeatLedger ledger;
  EXPECT_THROW(ledger.poolFor(makeSection("BAD", -2)), std::invalid_argument);
  EXPECT_EQ(ledger.find("BAD"), nullptr);
}

// -----------------------------------------------------------------------------
// 7. Enrollment ids: "E1", "E2", ... and unique across threads.
// -----------------------------------------------------------------------------
TEST(EnrollmentIdGeneratorTest, SequentialIds) {
  seatwise::EnrollmentIdGenerator gen;
  EXPECT_EQ(gen.next_id(), "E1");
  EXPECT_EQ(gen.next_id(), "E2");
  EXPECT_EQ(gen.next_id(), "E3");
}

TEST(EnrollmentIdGeneratorTest, ConcurrentIdsAreUnique) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 1000;

  seatwise::EnrollmentIdGenerator gen;
  std::mutex mutex;
  std::set<std::string> ids;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      std::vector<std::string> local;
      for (int i = 0; i < kPerThread; ++i) {
        local.push_back(gen.next_id());
      }
      std::lock_guard lock(mutex);
      ids.insert(local.begin(), local.end());
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(ids.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(EnrollmentIdGeneratorTest, AdvancePastSkipsHydratedIds) {
  seatwise::EnrollmentIdGenerator gen;
  gen.advancePast(41);
  EXPECT_EQ(gen.next_id(), "E42");

  // Never moves backwards.
  gen.advancePast(5);
  EXPECT_EQ(gen.next_id(), "E43");
}

TEST(EnrollmentIdGeneratorTest, ParseSequence) {
  using G = seatwise::EnrollmentIdGenerator;
  EXPECT_EQ(G::parseSequence("E17"), 17u);
  EXPECT_EQ(G::parseSequence("E"), 0u);
  EXPECT_EQ(G::parseSequence("X17"), 0u);
  EXPECT_EQ(G::parseSequence("E1a"), 0u);
  EXPECT_EQ(G::parseSequence(""), 0u);
}

TEST(EnrollmentIdGeneratorTest, ParseSequenceRejectsOverflow) {
  using G = seatwise::EnrollmentIdGenerator;
  EXPECT_EQ(G::parseSequence("E18446744073709551614"),
            18446744073709551614ull);
  EXPECT_THROW(G::parseSequence("E18446744073709551615"), std::out_of_range);
  EXPECT_THROW(G::parseSequence("E99999999999999999999"), std::out_of_range);
}
