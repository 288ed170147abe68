#pragma once

#include "flatguard/events/broker_events.hpp"
#include "flatguard/events/command_events.hpp"
#include "flatguard/events/engine_events.hpp"
#include "flatguard/events/event_types.hpp"
#include "flatguard/events/timer_events.hpp"

#include <functional>
#include <variant>

namespace flatguard {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus and the shard queues. Adding an
// alternative means adding it here; subscribers pick their type with
// EventBus::subscribe<T>().
//
//   inbound   PriceTickEvent, BrokerFillEvent, PositionSnapshotEvent,
//             OrderRejectedEvent
//   commands  OpenPositionCommand, ExitCommand, ForceFlattenCommand,
//             OperatorResetCommand
//   internal  ReconcileTimerEvent, ConfirmPollEvent, KillSwitchReportEvent,
//             KillSwitchDeadlineEvent
//   outbound  PositionChangedEvent, ExitStateChangedEvent,
//             DriftDetectedEvent, AlertEvent
// -----------------------------------------------------------------------------
using Event = std::variant<
    PriceTickEvent,
    BrokerFillEvent,
    PositionSnapshotEvent,
    OrderRejectedEvent,
    OpenPositionCommand,
    ExitCommand,
    ForceFlattenCommand,
    OperatorResetCommand,
    ReconcileTimerEvent,
    ConfirmPollEvent,
    KillSwitchReportEvent,
    KillSwitchDeadlineEvent,
    PositionChangedEvent,
    ExitStateChangedEvent,
    DriftDetectedEvent,
    AlertEvent>;

// Callback that enqueues an event for later processing, typically onto the
// event loop that owns the event's position.
using EventSink = std::function<void(Event)>;

}  // namespace flatguard
