#pragma once

#include <string>

namespace seatwise {

// -----------------------------------------------------------------------------
// INotificationSink: seat-available notification channel
// -----------------------------------------------------------------------------
//
// @brief  Receives (section_id, student_id) each time a waitlisted student
//         is popped for promotion.
//
// @details
// Registered on the WaitlistQueue at startup and invoked synchronously on
// the thread that performed the drop. Delivery is best effort: an exception
// thrown from onSeatAvailable() is logged by the queue and does not affect
// the promotion.
//
// Implementations: ConsoleNotificationSink (stdout). An email or SMS channel
// plugs in the same way.
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;

  virtual void onSeatAvailable(const std::string& section_id,
                               const std::string& student_id) = 0;
};

}  // namespace seatwise
