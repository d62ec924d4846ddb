#pragma once

#include "event_types.hpp"
#include <variant>

namespace arena {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by queues and the EventBus. Ingest events flow
// from the gateway into the ingest loop; telemetry events flow from the
// ingest loop to the IPC server's PUB socket.
//
// Dispatch with std::get_if or EventBus::subscribe<T>; adding an alternative
// here means updating the codec and the telemetry formatter.
// -----------------------------------------------------------------------------
using Event = std::variant<
    AgentRegisteredEvent,
    RoundCompletedEvent,
    ScoreRecordedEvent,
    HealthSnapshotEvent,
    ForecastRegisteredEvent,
    PriceResolvedEvent,
    MarketReturnEvent,
    RoundAnalyzedEvent,
    RegressionAlertEvent>;

}  // namespace arena
