#include "slickwatch/report/AlertPolicy.h"

#include <iomanip>
#include <sstream>

namespace slickwatch {

std::string toString(Severity s) {
    switch (s) {
        case Severity::INFO:     return "info";
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "info";
}

AlertThresholds AlertThresholds::fromAppConfig(const AppConfig& cfg) {
    AlertThresholds t;
    t.critical = cfg.alert_critical;
    t.high     = cfg.alert_high;
    t.medium   = cfg.alert_medium;
    t.low      = cfg.alert_low;
    return t;
}

AlertPolicy::AlertPolicy(AlertThresholds t) : t_(t) {}

Severity AlertPolicy::classify(int64_t n) const {
    if (n >= t_.critical) return Severity::CRITICAL;
    if (n >= t_.high)     return Severity::HIGH;
    if (n >= t_.medium)   return Severity::MEDIUM;
    if (n >= t_.low)      return Severity::LOW;
    return Severity::INFO;
}

AlertDecision AlertPolicy::evaluate(int64_t total_detections, double avg_confidence, double coverage_percentage) const {
    AlertDecision d;
    d.severity = classify(total_detections);
    d.total_detections = total_detections;
    d.avg_confidence = avg_confidence;
    d.coverage_percentage = coverage_percentage;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    switch (d.severity) {
        case Severity::CRITICAL:
            ss << "CRITICAL: " << total_detections << " oil spills detected! Immediate action required. Coverage: "
               << coverage_percentage << "%";
            break;
        case Severity::HIGH:
            ss << "HIGH ALERT: " << total_detections << " oil spills detected. Coverage: " << coverage_percentage << "%";
            break;
        case Severity::MEDIUM:
            ss << "MEDIUM: " << total_detections << " oil spills detected. Coverage: " << coverage_percentage << "%";
            break;
        case Severity::LOW:
            ss << "LOW: " << total_detections << " oil spill(s) detected. Coverage: " << coverage_percentage << "%";
            break;
        case Severity::INFO:
            ss << "No significant oil spills detected.";
            break;
    }
    d.message = ss.str();
    return d;
}

} // namespace slickwatch
