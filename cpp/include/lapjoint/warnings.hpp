/**
 * @file warnings.hpp
 * @brief Warning system for questionable joint designs.
 *
 * Warnings flag checks that the simplified capacity model does not gate
 * on. They never prevent a design from being returned.
 */

#ifndef LAPJOINT_WARNINGS_HPP
#define LAPJOINT_WARNINGS_HPP

#include <string>
#include <vector>
#include <map>
#include <utility>

namespace lapjoint {

/**
 * @brief Warning codes for questionable joint designs.
 */
enum class WarningCode {
    // === Capacity Warnings (100-199) ===

    /// Design bearing capacity of the bolt group is below the demand
    BEARING_CAPACITY_EXCEEDED = 100,

    /// Utilization ratio is close to 1
    HIGH_UTILIZATION = 101,

    // === Detailing Warnings (200-299) ===

    /// Gauge distance is smaller than the required edge distance
    EDGE_DISTANCE_NOT_MET = 200
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates an unsafe joint
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::BEARING_CAPACITY_EXCEEDED: return "BEARING_CAPACITY_EXCEEDED";
        case WarningCode::HIGH_UTILIZATION: return "HIGH_UTILIZATION";
        case WarningCode::EDGE_DISTANCE_NOT_MET: return "EDGE_DISTANCE_NOT_MET";
        default: return "UNKNOWN_WARNING";
    }
}

inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning attached to a design result.
 */
struct DesignWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    DesignWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods ===

    /**
     * @brief Create warning for bearing capacity below demand.
     * @param demand Applied load [N]
     * @param bearing_capacity Design bearing capacity of the bolt group [N]
     */
    static DesignWarning bearing_capacity_exceeded(double demand, double bearing_capacity) {
        DesignWarning warn(WarningCode::BEARING_CAPACITY_EXCEEDED, WarningSeverity::High,
            "Bearing capacity of the plates is below the applied load");
        warn.details["demand"] = std::to_string(demand) + " N";
        warn.details["bearing_capacity"] = std::to_string(bearing_capacity) + " N";
        warn.suggestion = "Bearing does not gate the design. Increase plate thickness "
                         "or choose a stronger plate grade";
        return warn;
    }

    /**
     * @brief Create warning for utilization above the configured threshold.
     */
    static DesignWarning high_utilization(double utilization, double threshold) {
        DesignWarning warn(WarningCode::HIGH_UTILIZATION, WarningSeverity::Low,
            "Utilization ratio is close to the limit");
        warn.details["utilization_ratio"] = std::to_string(utilization);
        warn.details["threshold"] = std::to_string(threshold);
        return warn;
    }

    /**
     * @brief Create warning for a bolt line too close to the plate edge.
     * @param gauge Gauge distance [mm]
     * @param edge_distance Required edge distance [mm]
     */
    static DesignWarning edge_distance_not_met(double gauge, double edge_distance) {
        DesignWarning warn(WarningCode::EDGE_DISTANCE_NOT_MET, WarningSeverity::Medium,
            "Bolt line is closer to the plate edge than the edge distance");
        warn.details["gauge_distance"] = std::to_string(gauge) + " mm";
        warn.details["edge_distance"] = std::to_string(edge_distance) + " mm";
        warn.suggestion = "Use wider plates or a smaller bolt diameter";
        return warn;
    }
};

/**
 * @brief Collection of warnings attached to one design.
 */
class WarningList {
public:
    std::vector<DesignWarning> warnings;

    void add(const DesignWarning& warning) {
        warnings.push_back(warning);
    }

    void add(DesignWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Check whether a warning with the given code is present.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace lapjoint

#endif  // LAPJOINT_WARNINGS_HPP
