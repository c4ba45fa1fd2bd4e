#pragma once

#include <cstdio>
#include <initializer_list>
#include <string>
#include <string_view>

namespace seatwise {
namespace domain {

// -----------------------------------------------------------------------------
// Weekday
// -----------------------------------------------------------------------------
enum class Weekday {
  Monday,
  Tuesday,
  Wednesday,
  Thursday,
  Friday,
  Saturday,
  Sunday,
};

inline const char* toString(Weekday d) {
  switch (d) {
    case Weekday::Monday:    return "Monday";
    case Weekday::Tuesday:   return "Tuesday";
    case Weekday::Wednesday: return "Wednesday";
    case Weekday::Thursday:  return "Thursday";
    case Weekday::Friday:    return "Friday";
    case Weekday::Saturday:  return "Saturday";
    case Weekday::Sunday:    return "Sunday";
  }
  return "Unknown";
}

// Returns false (and leaves `out` untouched) for an unrecognised name.
inline bool parseWeekday(std::string_view name, Weekday& out) {
  for (Weekday d : {Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday,
                    Weekday::Thursday, Weekday::Friday, Weekday::Saturday,
                    Weekday::Sunday}) {
    if (name == toString(d)) {
      out = d;
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// MeetingTime
// -----------------------------------------------------------------------------
// Responsibility: When a section meets. Minutes are counted from midnight
// (09:30 == 570). Carried as metadata; no component checks overlaps yet
// (see TimeConflictValidator).
// -----------------------------------------------------------------------------
struct MeetingTime {
  Weekday day{Weekday::Monday};
  int start_minute{0};
  int end_minute{0};
};

// -----------------------------------------------------------------------------
// formatClock / parseClock
// -----------------------------------------------------------------------------
// "HH:MM" <-> minutes since midnight. parseClock accepts 00:00 to 23:59 with
// exactly two digits per field and returns false for anything else.
// -----------------------------------------------------------------------------
inline std::string formatClock(int minute_of_day) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", (minute_of_day / 60) % 100,
                minute_of_day % 60);
  return buf;
}

inline bool parseClock(std::string_view text, int& out) {
  if (text.size() != 5 || text[2] != ':') {
    return false;
  }
  for (std::size_t i : {0u, 1u, 3u, 4u}) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
  }
  int hours = (text[0] - '0') * 10 + (text[1] - '0');
  int minutes = (text[3] - '0') * 10 + (text[4] - '0');
  if (hours > 23 || minutes > 59) {
    return false;
  }
  out = hours * 60 + minutes;
  return true;
}

// -----------------------------------------------------------------------------
// Section
// -----------------------------------------------------------------------------
// Responsibility: A scheduled, capacity-bounded offering of one course.
//
// @details
// capacity is immutable after the section is registered. The live
// occupancy is NOT part of this struct: it lives in the section's SeatPool
// (see SeatLedger), which is the single source of truth for how many seats
// are taken. Section is a plain value that repositories can copy freely;
// an atomic counter could not be copied.
// -----------------------------------------------------------------------------
struct Section {
  std::string id;
  std::string course_id;
  std::string instructor_id;
  int capacity{0};
  MeetingTime meeting;
};

}  // namespace domain
}  // namespace seatwise
