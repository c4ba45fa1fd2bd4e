#include "seatwise/notification/console_notification_sink.hpp"

#include <iostream>

namespace seatwise {

void ConsoleNotificationSink::onSeatAvailable(const std::string& section_id,
                                              const std::string& student_id) {
  std::cout << "[Notification] Student " << student_id
            << ": seat available in section " << section_id << "\n";
  sent_.fetch_add(1);
}

}  // namespace seatwise
