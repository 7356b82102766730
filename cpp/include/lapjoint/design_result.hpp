/**
 * @file design_result.hpp
 * @brief Result types returned by the lap-joint designer.
 *
 * A design call returns a DesignOutcome. On success it holds the winning
 * DesignResult together with any warnings; on failure it holds a
 * LapJointError and no result.
 */

#ifndef LAPJOINT_DESIGN_RESULT_HPP
#define LAPJOINT_DESIGN_RESULT_HPP

#include "lapjoint/bolt.hpp"
#include "lapjoint/detailing.hpp"
#include "lapjoint/errors.hpp"
#include "lapjoint/warnings.hpp"

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace lapjoint {

/**
 * @brief Winning bolt combination and its derived layout
 *
 * Units: lengths [mm], forces [N], stresses [MPa].
 */
struct DesignResult {
    /// Selected bolt
    BoltSpec bolt{0.0, 0.0};

    /// Bolt ultimate strength [MPa]
    double bolt_fu = 0.0;

    /// Bolt yield strength [MPa]
    double bolt_fy = 0.0;

    /// Number of bolts (always at least the minimum bolt count)
    int number_of_bolts = 0;

    double pitch_distance = 0.0;
    double gauge_distance = 0.0;
    double end_distance = 0.0;
    double edge_distance = 0.0;
    double hole_diameter = 0.0;

    /// Always 1: all bolts in one line along the load axis
    int number_of_rows = 1;

    /// Equal to number_of_bolts
    int number_of_columns = 0;

    /// Nominal shear capacity of one bolt [N]
    double shear_capacity_per_bolt = 0.0;

    /// Design shear capacity of the bolt group, N_b * V_b / safety factor [N]
    double strength_of_connection = 0.0;

    /// Nominal bearing capacity at one hole [N]
    double bearing_capacity_per_bolt = 0.0;

    /// Design bearing capacity of the bolt group [N]. Reported, not checked.
    double bearing_capacity = 0.0;

    /// Plate grade designation
    std::string plate_grade;

    double yield_strength_plate_1 = 0.0;
    double yield_strength_plate_2 = 0.0;

    /// Plate width plus two end distances [mm]
    double length_of_connection = 0.0;

    /// Demand over design shear capacity, at most 1
    double utilization_ratio = 0.0;

    /**
     * @brief Rebuild the layout record from the stored distances
     */
    Detailing layout() const;

    /**
     * @brief Centre of every bolt hole, see Detailing::hole_positions()
     */
    Eigen::MatrixX2d hole_positions() const { return layout().hole_positions(); }

    std::string to_string() const;

    /**
     * @brief Get machine-readable summary (JSON format)
     */
    std::string to_json() const;
};

/**
 * @brief How one catalog combination fared during the search
 */
enum class CandidateStatus {
    NewBest,                ///< Feasible and shorter than every earlier candidate
    FeasibleNotShorter,     ///< Feasible, but an earlier candidate is at least as short
    BelowMinimumBolts,      ///< Needs fewer bolts than the minimum (Reject rule only)
    OverUtilized,           ///< Utilization ratio above 1
    BoltCountOverflow       ///< Required bolt count does not fit in an int
};

inline std::string candidate_status_to_string(CandidateStatus status) {
    switch (status) {
        case CandidateStatus::NewBest: return "NEW_BEST";
        case CandidateStatus::FeasibleNotShorter: return "FEASIBLE_NOT_SHORTER";
        case CandidateStatus::BelowMinimumBolts: return "BELOW_MINIMUM_BOLTS";
        case CandidateStatus::OverUtilized: return "OVER_UTILIZED";
        case CandidateStatus::BoltCountOverflow: return "BOLT_COUNT_OVERFLOW";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Trace record of one evaluated catalog combination
 */
struct CandidateEvaluation {
    double bolt_diameter = 0.0;         ///< [mm]
    double bolt_grade = 0.0;
    double required_bolts = 0.0;        ///< Rounded-up count before the minimum rule
    int number_of_bolts = 0;            ///< Count used for the check (0 if not reached)
    double utilization_ratio = 0.0;     ///< 0 if not reached
    double length_of_connection = 0.0;  ///< [mm], 0 if not reached
    CandidateStatus status = CandidateStatus::OverUtilized;

    bool is_feasible() const {
        return status == CandidateStatus::NewBest ||
               status == CandidateStatus::FeasibleNotShorter;
    }
};

/**
 * @brief Result of a design call: a design or an error, never both
 */
struct DesignOutcome {
    /// Winning design (empty on failure)
    std::optional<DesignResult> result;

    /// OK on success
    LapJointError error;

    /// Warnings about the winning design
    WarningList warnings;

    /// Every evaluated combination in search order (if requested in settings)
    std::vector<CandidateEvaluation> candidates;

    bool is_ok() const { return error.is_ok() && result.has_value(); }

    std::string to_string() const;
};

}  // namespace lapjoint

#endif  // LAPJOINT_DESIGN_RESULT_HPP
