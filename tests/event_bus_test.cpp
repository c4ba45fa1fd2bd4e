// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for seatwise::EventBus.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Every subscriber sees each published event, in registration order
//   - unsubscribe() stops delivery; unknown ids are ignored
//   - A subscriber may publish or unsubscribe from inside its callback
//   - A throwing subscriber is logged and skipped
//   - Concurrent publishers: every event delivered exactly once
// =============================================================================

#include "seatwise/eventbus/event_bus.hpp"
#include "seatwise/events/event.hpp"
#include "seatwise/events/event_types.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  static seatwise::EnrollmentUpdateEvent makeUpdate(
      const std::string& id, seatwise::domain::EnrollmentStatus status) {
    seatwise::EnrollmentUpdateEvent e;
    e.enrollment.id = id;
    e.enrollment.student_id = "S1";
    e.enrollment.section_id = "SEC1";
    e.enrollment.status = status;
    return e;
  }

  static seatwise::EnrollmentRejectedEvent makeRejected(
      const std::string& reason) {
    seatwise::EnrollmentRejectedEvent e;
    e.student_id = "S1";
    e.section_id = "SEC2";
    e.reason = reason;
    return e;
  }

  seatwise::EventBus bus;
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees all three alternatives.
// Why: The console logger and the IPC telemetry bridge subscribe this way.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const seatwise::Event&) { ++calls; });

  bus.publish(makeUpdate("E1", seatwise::domain::EnrollmentStatus::Enrolled));
  bus.publish(makeRejected("Section not found"));
  bus.publish(seatwise::SeatAvailableEvent{"SEC1", "S2", {}, 0});

  EXPECT_EQ(calls, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its alternative, with the payload
//    intact.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersAndKeepsPayload) {
  std::vector<std::string> reasons;
  bus.subscribe<seatwise::EnrollmentRejectedEvent>(
      [&reasons](const seatwise::EnrollmentRejectedEvent& e) {
        reasons.push_back(e.reason);
      });

  bus.publish(makeUpdate("E1", seatwise::domain::EnrollmentStatus::Enrolled));
  bus.publish(makeRejected("Missing prerequisite: CS101"));

  ASSERT_EQ(reasons.size(), 1u);
  EXPECT_EQ(reasons[0], "Missing prerequisite: CS101");
}

TEST_F(EventBusTest, SubscribersRunInRegistrationOrder) {
  std::vector<int> order;
  for (int i = 0; i < 3; ++i) {
    bus.subscribe([&order, i](const seatwise::Event&) { order.push_back(i); });
  }

  bus.publish(makeRejected("x"));

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

// -----------------------------------------------------------------------------
// 3. unsubscribe()
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<seatwise::EnrollmentUpdateEvent>(
      [&calls](const seatwise::EnrollmentUpdateEvent&) { ++calls; });

  bus.publish(makeUpdate("E1", seatwise::domain::EnrollmentStatus::Enrolled));
  bus.unsubscribe(id);
  bus.publish(makeUpdate("E1", seatwise::domain::EnrollmentStatus::Dropped));

  EXPECT_EQ(calls, 1);
}

TEST_F(EventBusTest, UnknownIdAndEmptyBusAreHarmless) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeRejected("nobody listening")));
}

// -----------------------------------------------------------------------------
// 4. Re-entrancy: a seat-available handler publishes an update, and a
//    one-shot handler unsubscribes itself. Neither deadlocks.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::vector<std::string> updates;
  bus.subscribe<seatwise::EnrollmentUpdateEvent>(
      [&updates](const seatwise::EnrollmentUpdateEvent& e) {
        updates.push_back(e.enrollment.id);
      });
  bus.subscribe<seatwise::SeatAvailableEvent>(
      [this](const seatwise::SeatAvailableEvent&) {
        bus.publish(
            makeUpdate("E3", seatwise::domain::EnrollmentStatus::Enrolled));
      });

  bus.publish(seatwise::SeatAvailableEvent{"SEC1", "S2", {}, 0});

  EXPECT_EQ(updates, (std::vector<std::string>{"E3"}));
}

TEST_F(EventBusTest, SubscriberCanUnsubscribeItself) {
  int calls = 0;
  seatwise::EventBus::SubscriptionId id = 0;
  id = bus.subscribe([this, &calls, &id](const seatwise::Event&) {
    ++calls;
    bus.unsubscribe(id);
  });

  bus.publish(makeRejected("a"));
  bus.publish(makeRejected("b"));

  EXPECT_EQ(calls, 1);
}

// -----------------------------------------------------------------------------
// 5. Publishers on several threads: every event reaches the subscriber once.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ConcurrentPublishersDeliverEverything) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;

  std::atomic<int> delivered{0};
  bus.subscribe([&delivered](const seatwise::Event&) { delivered.fetch_add(1); });

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < kPerThread; ++i) {
        bus.publish(makeRejected("Section is full"));
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(delivered.load(), kThreads * kPerThread);
}

// -----------------------------------------------------------------------------
// 6. A subscriber that throws is skipped; publish() returns normally and the
//    next subscriber still runs.
// Why: Publishing happens inside enroll()/drop() under the section lock.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberIsIsolated) {
  int after = 0;
  bus.subscribe([](const seatwise::Event&) {
    throw std::runtime_error("telemetry sink down");
  });
  bus.subscribe([&after](const seatwise::Event&) { ++after; });

  EXPECT_NO_THROW(bus.publish(makeRejected("Section not found")));
  EXPECT_EQ(after, 1);
}

TEST_F(EventBusTest, SubscriberCountTracksRegistrations) {
  EXPECT_EQ(bus.subscriberCount(), 0u);
  auto a = bus.subscribe([](const seatwise::Event&) {});
  bus.subscribe<seatwise::SeatAvailableEvent>(
      [](const seatwise::SeatAvailableEvent&) {});
  EXPECT_EQ(bus.subscriberCount(), 2u);

  bus.unsubscribe(a);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}
