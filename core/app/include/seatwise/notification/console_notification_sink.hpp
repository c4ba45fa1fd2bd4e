#pragma once

#include "seatwise/notification/i_notification_sink.hpp"

#include <atomic>
#include <cstdint>

namespace seatwise {

// -----------------------------------------------------------------------------
// ConsoleNotificationSink
// -----------------------------------------------------------------------------
// Prints one "[Notification] ..." line per promotion to stdout and counts
// how many it has sent.
// -----------------------------------------------------------------------------
class ConsoleNotificationSink : public INotificationSink {
 public:
  void onSeatAvailable(const std::string& section_id,
                       const std::string& student_id) override;

  std::uint64_t sentCount() const { return sent_.load(); }

 private:
  std::atomic<std::uint64_t> sent_{0};
};

}  // namespace seatwise
