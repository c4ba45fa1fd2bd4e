#pragma once

#include "seatwise/events/event_types.hpp"

#include <variant>

namespace seatwise {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type carried by the EventBus.
//
// std::variant keeps events as plain values (no base class, no heap
// allocation, no downcasts). Subscribers use std::get_if or the typed
// EventBus::subscribe<T>() to pick the alternatives they care about. Adding
// an event kind means adding it here; formatters that std::visit the
// variant then fail to compile until they handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    EnrollmentUpdateEvent,
    EnrollmentRejectedEvent,
    SeatAvailableEvent>;

}  // namespace seatwise
