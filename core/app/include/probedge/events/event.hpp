#pragma once

#include "probedge/events/event_types.hpp"

#include <variant>

namespace probedge {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Single envelope for everything that travels over an EventBus. A closed
// variant keeps dispatch type-safe: subscribers use the typed subscribe<T>()
// overload or std::visit, and adding an alternative makes the compiler flag
// every exhaustive visitor that needs updating.
// -----------------------------------------------------------------------------
using Event = std::variant<
    CycleRequestEvent,
    SignalEvent,
    CommitEvent,
    CycleCompletedEvent,
    CycleFailedEvent>;

}  // namespace probedge
