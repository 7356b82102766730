/**
 * @file errors.hpp
 * @brief Structured error handling for Lapjoint.
 *
 * This file defines error codes and error structures for reporting
 * design failures in a machine-readable format. A failed design is
 * returned as a value, never thrown.
 */

#ifndef LAPJOINT_ERRORS_HPP
#define LAPJOINT_ERRORS_HPP

#include <string>
#include <vector>
#include <map>

namespace lapjoint {

/**
 * @brief Error codes for lap-joint design failures.
 *
 * These codes provide machine-readable error identification.
 * Each code corresponds to a specific type of failure.
 */
enum class ErrorCode {
    /// No error - design completed successfully
    OK = 0,

    // === Input Errors (100-199) ===

    /// Plate grade name is not in the plate-grade catalog
    INVALID_PLATE_GRADE = 100,

    /// Load or geometry is non-finite or out of range
    INVALID_INPUT = 101,

    // === Design Errors (200-299) ===

    /// No catalog combination satisfies the feasibility check
    NO_FEASIBLE_DESIGN = 200,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_PLATE_GRADE: return "INVALID_PLATE_GRADE";
        case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorCode::NO_FEASIBLE_DESIGN: return "NO_FEASIBLE_DESIGN";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for Lapjoint.
 *
 * Contains machine-readable error code, human-readable message,
 * and diagnostic key/value details about the rejected input.
 */
struct LapJointError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Valid alternatives for the rejected value (e.g. plate grade names)
    std::vector<std::string> valid_values;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    LapJointError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    LapJointError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    /**
     * @brief Get string representation of the error code.
     */
    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!valid_values.empty()) {
            result += "\n  Valid values: ";
            for (size_t i = 0; i < valid_values.size(); ++i) {
                if (i > 0) result += ", ";
                result += valid_values[i];
            }
        }

        for (const auto& [key, value] : details) {
            result += "\n  " + key + ": " + value;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a plate grade missing from the catalog.
     * @param plate_grade The rejected grade name
     * @param valid_grades Catalog grade names, in catalog order
     */
    static LapJointError invalid_plate_grade(const std::string& plate_grade,
                                             const std::vector<std::string>& valid_grades) {
        LapJointError err(ErrorCode::INVALID_PLATE_GRADE,
            "Invalid plate grade: " + plate_grade);
        err.valid_values = valid_grades;
        err.details["plate_grade"] = plate_grade;
        err.suggestion = "Use one of the listed plate grades.";
        return err;
    }

    /**
     * @brief Create error for a non-finite or out-of-range input value.
     */
    static LapJointError invalid_input(const std::string& field, double value,
                                       const std::string& reason) {
        LapJointError err(ErrorCode::INVALID_INPUT,
            "Invalid " + field + ": " + reason);
        err.details["field"] = field;
        err.details["value"] = std::to_string(value);
        return err;
    }

    /**
     * @brief Create error for an exhausted search.
     * @param n_candidates Number of catalog combinations evaluated
     */
    static LapJointError no_feasible_design(int n_candidates) {
        LapJointError err(ErrorCode::NO_FEASIBLE_DESIGN,
            "No suitable design found that meets the requirements");
        err.details["candidates_evaluated"] = std::to_string(n_candidates);
        err.suggestion = "Extend the bolt catalog or relax the minimum bolt rule.";
        return err;
    }
};

}  // namespace lapjoint

#endif  // LAPJOINT_ERRORS_HPP
