#include "eventtimeline.h"

QString EventTimeline::milestoneToString(Milestone milestone)
{
    switch (milestone) {
        case Milestone::ReferenceActualized:    return "reference_actualized";
        case Milestone::StabilityStarted:       return "co2_stability_started";
        case Milestone::StabilityAchieved:      return "co2_stability_achieved";
        case Milestone::GasIncreaseDetected:    return "co2_increase_detected";
        case Milestone::PeakReached:            return "co2_peak_reached";
        case Milestone::RestabilizationStarted: return "co2_restabilization_start_time";
        case Milestone::Restabilized:           return "co2_restabilized";
        case Milestone::HeatingStarted:         return "heating_started";
        case Milestone::HeatingStopped:         return "heating_stopped";
    }
    return "unknown";
}
