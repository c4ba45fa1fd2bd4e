// =============================================================================
// validator_chain_test.cpp
// =============================================================================
// Unit tests for the eligibility validators and seatwise::ValidatorChain.
//
// Validates:
//   - PrerequisiteValidator: missing prerequisite, unknown course, pass
//   - CapacityValidator: SectionFull only when the section's pool is full
//   - TimeConflictValidator: currently passes everything
//   - Chain short-circuit: the first failing validator decides the outcome
//   - fromPolicy(): builds in configured order, rejects unknown names
//
// All tests are single-threaded.
// =============================================================================

#include "seatwise/concurrent/seat_ledger.hpp"
#include "seatwise/repo/in_memory_course_repository.hpp"
#include "seatwise/repo/in_memory_enrollment_repository.hpp"
#include "seatwise/validation/capacity_validator.hpp"
#include "seatwise/validation/prerequisite_validator.hpp"
#include "seatwise/validation/time_conflict_validator.hpp"
#include "seatwise/validation/validator_chain.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sw = seatwise;

// =============================================================================
// Fixture: CS101 (no prerequisites) and CS102 (requires CS101), one section
// each. SEC2 has a single seat.
// =============================================================================
class ValidatorChainTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sw::domain::Course cs101;
    cs101.id = "CS101";
    cs101.name = "Intro CS";
    courses.saveCourse(cs101);

    sw::domain::Course cs102;
    cs102.id = "CS102";
    cs102.name = "Data Structures";
    cs102.prerequisites = {"CS101"};
    courses.saveCourse(cs102);

    sec1.id = "SEC1";
    sec1.course_id = "CS101";
    sec1.capacity = 2;
    courses.saveSection(sec1);

    sec2.id = "SEC2";
    sec2.course_id = "CS102";
    sec2.capacity = 1;
    courses.saveSection(sec2);

    alice.id = "S1";
    alice.name = "Alice";

    bob.id = "S2";
    bob.name = "Bob";
    bob.completed_courses.insert("CS101");
  }

  void fillSection(const sw::domain::Section& section) {
    auto& pool = seats.poolFor(section);
    while (pool.reserve()) {
    }
  }

  sw::InMemoryCourseRepository courses;
  sw::InMemoryEnrollmentRepository enrollments;
  sw::SeatLedger seats;

  sw::domain::Section sec1;
  sw::domain::Section sec2;
  sw::domain::Student alice;
  sw::domain::Student bob;
};

// -----------------------------------------------------------------------------
// 1. Prerequisites
// -----------------------------------------------------------------------------
TEST_F(ValidatorChainTest, PrerequisiteMissingIsRejectedWithCourseId) {
  sw::PrerequisiteValidator v(courses);

  auto outcome = v.validate(alice, sec2);
  const auto* rejected = std::get_if<sw::ValidationRejected>(&outcome);
  ASSERT_NE(rejected, nullptr);
  EXPECT_EQ(rejected->reason, "Missing prerequisite: CS101");
}

TEST_F(ValidatorChainTest, PrerequisiteSatisfiedPasses) {
  sw::PrerequisiteValidator v(courses);
  EXPECT_TRUE(sw::passed(v.validate(bob, sec2)));
  EXPECT_TRUE(sw::passed(v.validate(alice, sec1)));
}

TEST_F(ValidatorChainTest, PrerequisiteUnknownCourseIsRejected) {
  sw::PrerequisiteValidator v(courses);
  sw::domain::Section orphan;
  orphan.id = "SEC9";
  orphan.course_id = "NOPE";
  orphan.capacity = 5;

  EXPECT_EQ(sw::reasonOf(v.validate(bob, orphan)), "Course not found");
}

// The first prerequisite not completed, in list order, is reported.
TEST_F(ValidatorChainTest, PrerequisiteReportsFirstMissingInListOrder) {
  sw::domain::Course cs301;
  cs301.id = "CS301";
  cs301.prerequisites = {"CS101", "MATH200", "CS102"};
  courses.saveCourse(cs301);
  sw::domain::Section sec;
  sec.id = "SEC301";
  sec.course_id = "CS301";
  sec.capacity = 1;

  sw::PrerequisiteValidator v(courses);
  EXPECT_EQ(sw::reasonOf(v.validate(bob, sec)),
            "Missing prerequisite: MATH200");
}

// -----------------------------------------------------------------------------
// 2. Capacity
// -----------------------------------------------------------------------------
TEST_F(ValidatorChainTest, CapacityFullReturnsSectionFull) {
  sw::CapacityValidator v(seats);
  EXPECT_TRUE(sw::passed(v.validate(bob, sec2)));

  fillSection(sec2);

  auto outcome = v.validate(bob, sec2);
  EXPECT_TRUE(std::holds_alternative<sw::SectionFull>(outcome));
  EXPECT_EQ(sw::reasonOf(outcome), "Section is full");
}

TEST_F(ValidatorChainTest, TimeConflictPassesEverything) {
  sw::TimeConflictValidator v(enrollments);
  fillSection(sec2);
  EXPECT_TRUE(sw::passed(v.validate(alice, sec2)));
}

// -----------------------------------------------------------------------------
// 3. Short-circuit: with the default order, a student who lacks the
//    prerequisite for a full section is rejected, not waitlisted.
// -----------------------------------------------------------------------------
TEST_F(ValidatorChainTest, DefaultOrderReportsPrerequisiteBeforeCapacity) {
  fillSection(sec2);

  auto chain = sw::ValidatorChain::fromPolicy(sw::domain::EnrollmentPolicy{},
                                              courses, enrollments, seats);
  auto outcome = chain.validate(alice, sec2);

  ASSERT_TRUE(std::holds_alternative<sw::ValidationRejected>(outcome));
  EXPECT_EQ(sw::reasonOf(outcome), "Missing prerequisite: CS101");
}

TEST_F(ValidatorChainTest, CapacityFirstOrderReportsSectionFull) {
  fillSection(sec2);

  sw::domain::EnrollmentPolicy policy;
  policy.validator_order = {"capacity", "prerequisite"};
  auto chain =
      sw::ValidatorChain::fromPolicy(policy, courses, enrollments, seats);

  EXPECT_TRUE(std::holds_alternative<sw::SectionFull>(
      chain.validate(alice, sec2)));
}

// -----------------------------------------------------------------------------
// 4. Validators after the first failure are never called.
// -----------------------------------------------------------------------------
namespace {

class CountingValidator : public sw::IEnrollmentValidator {
 public:
  CountingValidator(int& calls, sw::ValidationOutcome result)
      : calls_(calls), result_(std::move(result)) {}

  sw::ValidationOutcome validate(const sw::domain::Student&,
                                 const sw::domain::Section&) const override {
    ++calls_;
    return result_;
  }
  const char* name() const override { return "counting"; }

 private:
  int& calls_;
  sw::ValidationOutcome result_;
};

}  // namespace

TEST_F(ValidatorChainTest, ChainStopsAtFirstFailure) {
  int first = 0;
  int second = 0;
  int third = 0;

  sw::ValidatorChain chain;
  chain.add(std::make_unique<CountingValidator>(first, sw::ValidationPassed{}));
  chain.add(std::make_unique<CountingValidator>(
      second, sw::ValidationRejected{"nope"}));
  chain.add(std::make_unique<CountingValidator>(third, sw::SectionFull{}));

  EXPECT_EQ(sw::reasonOf(chain.validate(alice, sec1)), "nope");
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 1);
  EXPECT_EQ(third, 0);
}

TEST_F(ValidatorChainTest, EmptyChainPasses) {
  sw::ValidatorChain chain;
  EXPECT_EQ(chain.size(), 0u);
  EXPECT_TRUE(sw::passed(chain.validate(alice, sec2)));
}

// -----------------------------------------------------------------------------
// 5. fromPolicy
// -----------------------------------------------------------------------------
TEST_F(ValidatorChainTest, FromPolicyBuildsConfiguredOrder) {
  sw::domain::EnrollmentPolicy policy;
  policy.validator_order = {"time_conflict", "capacity"};
  auto chain =
      sw::ValidatorChain::fromPolicy(policy, courses, enrollments, seats);

  EXPECT_EQ(chain.names(),
            (std::vector<std::string>{"time_conflict", "capacity"}));
}

TEST_F(ValidatorChainTest, FromPolicyRejectsUnknownName) {
  sw::domain::EnrollmentPolicy policy;
  policy.validator_order = {"prerequisite", "karma"};

  EXPECT_THROW(
      sw::ValidatorChain::fromPolicy(policy, courses, enrollments, seats),
      std::invalid_argument);
  EXPECT_FALSE(sw::ValidatorChain::isKnown("karma"));
  EXPECT_TRUE(sw::ValidatorChain::isKnown("time_conflict"));
}
