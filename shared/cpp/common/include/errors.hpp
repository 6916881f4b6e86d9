#pragma once
#include <stdexcept>
#include <string>

// Base for every failure the fleet reports across component boundaries.
struct FleetError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A single transport attempt failed (connection refused, 5xx, ...).
// Bus clients retry these and convert them to BusUnavailable.
struct TransportError : FleetError {
    using FleetError::FleetError;
};

// Transport still unreachable after the publish retries.
struct BusUnavailable : FleetError {
    using FleetError::FleetError;
};

// No correlated response within the deadline.
struct TimeoutError : FleetError {
    using FleetError::FleetError;
};

// Lookup miss (memory item, agent, task). Distinct from an empty value.
struct NotFound : FleetError {
    using FleetError::FleetError;
};

// Dispatch could not find a ready agent with the capability before the deadline.
struct NoEligibleAgent : FleetError {
    using FleetError::FleetError;
};

// Domain logic failure inside an agent handler.
struct AgentHandlerError : FleetError {
    explicit AgentHandlerError(const std::string& what, bool fatal = false)
        : FleetError(what), fatal_(fatal) {}
    bool fatal() const { return fatal_; }

private:
    bool fatal_{false};
};

struct InvalidArgument : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};
