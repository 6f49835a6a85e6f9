#include "core/types/AlertDecision.hpp"

namespace beamstate::core {

std::string AlertDecision::kindToString() const {
    switch (kind) {
    case AlertKind::NodeDown:
        return "NodeDown";
    case AlertKind::NodeRecovered:
        return "NodeRecovered";
    case AlertKind::GlobalStorm:
        return "GlobalStorm";
    case AlertKind::MetricBreach:
        return "MetricBreach";
    }
    return "NodeDown";
}

std::string AlertDecision::outcomeToString() const {
    switch (outcome) {
    case DecisionOutcome::Sent:
        return "sent";
    case DecisionOutcome::SuppressedStorm:
        return "suppressed (storm)";
    case DecisionOutcome::SuppressedMaintenance:
        return "suppressed (maintenance)";
    case DecisionOutcome::SuppressedCooldown:
        return "suppressed (cooldown)";
    }
    return "sent";
}

} // namespace beamstate::core
