#pragma once
#include <cstdint>
#include <string>

#include "slickwatch/vision/Config.h"

namespace slickwatch {

enum class Severity {
    INFO = 0,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string toString(Severity s);

// minimum detection count per severity
struct AlertThresholds {
    int critical = 10;
    int high     = 5;
    int medium   = 2;
    int low      = 1;

    static AlertThresholds fromAppConfig(const AppConfig& cfg);
};

struct AlertDecision {
    Severity    severity = Severity::INFO;
    std::string message;
    int64_t     total_detections    = 0;
    double      avg_confidence      = 0.0;
    double      coverage_percentage = 0.0;

    bool raised() const { return severity != Severity::INFO; }
};

class AlertPolicy {
public:
    explicit AlertPolicy(AlertThresholds t = {});

    Severity classify(int64_t total_detections) const;
    AlertDecision evaluate(int64_t total_detections, double avg_confidence, double coverage_percentage) const;

    const AlertThresholds& thresholds() const { return t_; }

private:
    AlertThresholds t_;
};

} // namespace slickwatch
