#include "lapjoint/lap_joint_designer.hpp"
#include "lapjoint/bolt.hpp"
#include "lapjoint/capacity.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace lapjoint {

DesignInput::DesignInput(double load, double width, double t1, double t2,
                         std::string plate_grade)
    : load(load), width(width), t1(t1), t2(t2), plate_grade(std::move(plate_grade)) {
}

LapJointDesigner::LapJointDesigner(DesignCatalog catalog, DesignerSettings settings)
    : catalog_(std::move(catalog)), settings_(std::move(settings)) {
    if (!(settings_.safety_factor > 0.0) || !std::isfinite(settings_.safety_factor)) {
        throw std::invalid_argument("safety_factor must be positive and finite");
    }
    if (settings_.min_bolts < 1) {
        throw std::invalid_argument("min_bolts must be at least 1");
    }
}

std::optional<LapJointError> LapJointDesigner::validate_input(const DesignInput& input) const {
    if (!std::isfinite(input.load)) {
        return LapJointError::invalid_input("load", input.load, "must be finite");
    }
    if (input.load < 0.0) {
        return LapJointError::invalid_input("load", input.load, "tensile load must not be negative");
    }

    const std::pair<const char*, double> lengths[] = {
        {"width", input.width}, {"t1", input.t1}, {"t2", input.t2}};
    for (const auto& [field, value] : lengths) {
        if (!std::isfinite(value) || value <= 0.0) {
            return LapJointError::invalid_input(field, value, "must be positive and finite");
        }
    }

    return std::nullopt;
}

DesignOutcome LapJointDesigner::design(double load, double width, double t1, double t2,
                                       const std::string& plate_grade) const {
    return design(DesignInput(load, width, t1, t2, plate_grade));
}

DesignOutcome LapJointDesigner::design(const DesignInput& input) const {
    DesignOutcome outcome;

    if (auto err = validate_input(input)) {
        spdlog::warn("Lap joint design rejected: {}", err->message);
        outcome.error = *err;
        return outcome;
    }

    std::optional<PlateGrade> plate = catalog_.plate_grades.find(input.plate_grade);
    if (!plate) {
        outcome.error = LapJointError::invalid_plate_grade(
            input.plate_grade, catalog_.plate_grades.names());
        spdlog::warn("Lap joint design rejected: {}", outcome.error.message);
        return outcome;
    }

    const double demand = input.load * 1000.0;  // kN -> N
    const double sf = settings_.safety_factor;
    const double t_total = input.t1 + input.t2;
    const double max_count = static_cast<double>(std::numeric_limits<int>::max());

    double min_length = std::numeric_limits<double>::infinity();
    std::optional<DesignResult> best;
    int n_evaluated = 0;

    for (double d : catalog_.bolts.diameters) {
        for (double grade : catalog_.bolts.grades) {
            ++n_evaluated;

            BoltSpec bolt(d, grade);
            BoltStrength strength = calculate_bolt_strength(grade);
            double v_b = calculate_shear_capacity(strength.fy, bolt.area());

            CandidateEvaluation eval;
            eval.bolt_diameter = d;
            eval.bolt_grade = grade;
            eval.required_bolts = calculate_required_bolts(demand, v_b, sf);

            double count = eval.required_bolts;
            if (count < settings_.min_bolts) {
                if (settings_.minimum_bolt_rule == MinimumBoltRule::Reject) {
                    eval.status = CandidateStatus::BelowMinimumBolts;
                    spdlog::debug("M{} grade {}: {} bolt(s) below minimum, skipped",
                                  d, grade, count);
                    if (settings_.record_candidates) outcome.candidates.push_back(eval);
                    continue;
                }
                count = settings_.min_bolts;
            }
            if (count > max_count) {
                eval.status = CandidateStatus::BoltCountOverflow;
                spdlog::debug("M{} grade {}: bolt count {} out of range, skipped", d, grade, count);
                if (settings_.record_candidates) outcome.candidates.push_back(eval);
                continue;
            }

            const int n_b = static_cast<int>(count);
            Detailing detailing = derive_detailing(d, input.width, n_b, settings_.detailing);
            double v_dpb = calculate_bearing_capacity(plate->fu, t_total, d);
            double strength_of_connection = n_b * v_b / sf;
            double utilization = demand / strength_of_connection;

            eval.number_of_bolts = n_b;
            eval.utilization_ratio = utilization;
            eval.length_of_connection = detailing.length_of_connection;

            if (!(utilization <= 1.0)) {
                eval.status = CandidateStatus::OverUtilized;
            } else if (detailing.length_of_connection < min_length) {
                eval.status = CandidateStatus::NewBest;
                min_length = detailing.length_of_connection;

                DesignResult result;
                result.bolt = bolt;
                result.bolt_fu = strength.fu;
                result.bolt_fy = strength.fy;
                result.number_of_bolts = n_b;
                result.pitch_distance = detailing.pitch_distance;
                result.gauge_distance = detailing.gauge_distance;
                result.end_distance = detailing.end_distance;
                result.edge_distance = detailing.edge_distance;
                result.hole_diameter = detailing.hole_diameter;
                result.number_of_rows = detailing.number_of_rows;
                result.number_of_columns = detailing.number_of_columns;
                result.shear_capacity_per_bolt = v_b;
                result.strength_of_connection = strength_of_connection;
                result.bearing_capacity_per_bolt = v_dpb;
                result.bearing_capacity = n_b * v_dpb / sf;
                result.plate_grade = plate->name;
                result.yield_strength_plate_1 = plate->fy;
                result.yield_strength_plate_2 = plate->fy;
                result.length_of_connection = detailing.length_of_connection;
                result.utilization_ratio = utilization;
                best = std::move(result);
            } else {
                eval.status = CandidateStatus::FeasibleNotShorter;
            }

            spdlog::debug("M{} grade {}: {} bolt(s), utilization {:.4f}, length {} mm -> {}",
                          d, grade, n_b, utilization, detailing.length_of_connection,
                          candidate_status_to_string(eval.status));
            if (settings_.record_candidates) outcome.candidates.push_back(eval);
        }
    }

    if (!best) {
        outcome.error = LapJointError::no_feasible_design(n_evaluated);
        spdlog::warn("No feasible lap joint for {} kN on {} plates ({} candidates)",
                     input.load, input.plate_grade, n_evaluated);
        return outcome;
    }

    collect_warnings(*best, demand, outcome.warnings);
    spdlog::info("Lap joint for {} kN: {} x M{} grade {}, length {} mm, utilization {:.4f}",
                 input.load, best->number_of_bolts, best->bolt.diameter, best->bolt.grade,
                 best->length_of_connection, best->utilization_ratio);
    for (const auto& w : outcome.warnings.warnings) {
        spdlog::warn("{}: {}", w.code_string(), w.message);
    }

    outcome.result = std::move(best);
    return outcome;
}

void LapJointDesigner::collect_warnings(const DesignResult& result, double demand,
                                        WarningList& warnings) const {
    if (demand > result.bearing_capacity) {
        warnings.add(DesignWarning::bearing_capacity_exceeded(demand, result.bearing_capacity));
    }
    if (result.gauge_distance < result.edge_distance) {
        warnings.add(DesignWarning::edge_distance_not_met(result.gauge_distance,
                                                          result.edge_distance));
    }
    if (result.utilization_ratio > settings_.high_utilization_threshold) {
        warnings.add(DesignWarning::high_utilization(result.utilization_ratio,
                                                     settings_.high_utilization_threshold));
    }
}

DesignOutcome design_lap_joint(double load, double width, double t1, double t2,
                               const std::string& plate_grade) {
    LapJointDesigner designer;
    return designer.design(load, width, t1, t2, plate_grade);
}

} // namespace lapjoint
