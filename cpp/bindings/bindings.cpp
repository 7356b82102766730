#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "lapjoint/bolt.hpp"
#include "lapjoint/capacity.hpp"
#include "lapjoint/catalog.hpp"
#include "lapjoint/detailing.hpp"
#include "lapjoint/design_result.hpp"
#include "lapjoint/lap_joint_designer.hpp"
#include "lapjoint/errors.hpp"
#include "lapjoint/warnings.hpp"

namespace py = pybind11;

/**
 * Lapjoint C++ Python bindings module.
 * This module exposes the lap-joint designer to Python via pybind11.
 */
PYBIND11_MODULE(_lapjoint_cpp, m) {
    m.doc() = "Lapjoint C++ core module - Bolted lap-joint designer";

    m.attr("__version__") = "1.0.0";
    m.attr("DEFAULT_PLATE_GRADE") = lapjoint::DEFAULT_PLATE_GRADE;

    // ========================================================================
    // Bolts and capacities
    // ========================================================================

    py::class_<lapjoint::BoltStrength>(m, "BoltStrength",
        "Nominal bolt strengths [MPa]")
        .def(py::init<>())
        .def_readwrite("fu", &lapjoint::BoltStrength::fu, "Ultimate tensile strength [MPa]")
        .def_readwrite("fy", &lapjoint::BoltStrength::fy, "Yield strength [MPa]")
        .def("__iter__", [](const lapjoint::BoltStrength &s) {
            return py::iter(py::make_tuple(s.fu, s.fy));
        })
        .def("__repr__", [](const lapjoint::BoltStrength &s) {
            return "<BoltStrength fu=" + std::to_string(s.fu) +
                   " fy=" + std::to_string(s.fy) + ">";
        });

    m.def("calculate_bolt_strength", &lapjoint::calculate_bolt_strength,
          py::arg("grade"),
          "Compute (fu, fy) [MPa] from a bolt property class");

    py::class_<lapjoint::BoltSpec>(m, "BoltSpec",
        "Bolt of given diameter [mm] and property class")
        .def(py::init<double, double>(), py::arg("diameter"), py::arg("grade"))
        .def_readwrite("diameter", &lapjoint::BoltSpec::diameter, "Diameter [mm]")
        .def_readwrite("grade", &lapjoint::BoltSpec::grade, "Property class")
        .def("area", &lapjoint::BoltSpec::area, "Shank area [mm²]")
        .def("fu", &lapjoint::BoltSpec::fu, "Ultimate tensile strength [MPa]")
        .def("fy", &lapjoint::BoltSpec::fy, "Yield strength [MPa]")
        .def("__repr__", [](const lapjoint::BoltSpec &b) {
            return "<BoltSpec d=" + std::to_string(b.diameter) +
                   " grade=" + std::to_string(b.grade) + ">";
        });

    m.def("calculate_shear_capacity", &lapjoint::calculate_shear_capacity,
          py::arg("fy_bolt"), py::arg("area"),
          "Nominal shear capacity of one bolt [N]");
    m.def("calculate_bearing_capacity", &lapjoint::calculate_bearing_capacity,
          py::arg("fu_plate"), py::arg("t_total"), py::arg("diameter"),
          "Nominal bearing capacity at one hole [N]");
    m.def("calculate_required_bolts", &lapjoint::calculate_required_bolts,
          py::arg("load"), py::arg("shear_capacity"), py::arg("safety_factor"),
          "Rounded-up bolt count for a load [N]");

    // ========================================================================
    // Reference catalogs
    // ========================================================================

    py::class_<lapjoint::PlateGrade>(m, "PlateGrade",
        "Plate grade with yield and ultimate strength [MPa]")
        .def(py::init<std::string, double, double>(),
             py::arg("name"), py::arg("fy"), py::arg("fu"))
        .def_readwrite("name", &lapjoint::PlateGrade::name, "Grade designation")
        .def_readwrite("fy", &lapjoint::PlateGrade::fy, "Yield strength [MPa]")
        .def_readwrite("fu", &lapjoint::PlateGrade::fu, "Ultimate strength [MPa]")
        .def("__repr__", [](const lapjoint::PlateGrade &g) {
            return "<PlateGrade '" + g.name + "' fy=" + std::to_string(g.fy) +
                   " fu=" + std::to_string(g.fu) + ">";
        });

    py::class_<lapjoint::PlateGradeCatalog>(m, "PlateGradeCatalog",
        "Ordered lookup table of plate grades")
        .def(py::init<>())
        .def_static("standard", &lapjoint::PlateGradeCatalog::standard,
                    "Standard grades E250 through E550")
        .def("add", &lapjoint::PlateGradeCatalog::add,
             py::arg("name"), py::arg("fy"), py::arg("fu"))
        .def("find", &lapjoint::PlateGradeCatalog::find, py::arg("name"))
        .def("contains", &lapjoint::PlateGradeCatalog::contains, py::arg("name"))
        .def("names", &lapjoint::PlateGradeCatalog::names)
        .def("__len__", &lapjoint::PlateGradeCatalog::size);

    py::class_<lapjoint::BoltCatalog>(m, "BoltCatalog",
        "Bolt diameters [mm] and property classes searched by the designer")
        .def(py::init<>())
        .def_static("standard", &lapjoint::BoltCatalog::standard)
        .def_readwrite("diameters", &lapjoint::BoltCatalog::diameters)
        .def_readwrite("grades", &lapjoint::BoltCatalog::grades)
        .def("__len__", &lapjoint::BoltCatalog::size);

    py::class_<lapjoint::DesignCatalog>(m, "DesignCatalog",
        "Reference data for one designer")
        .def(py::init<>())
        .def_static("standard", &lapjoint::DesignCatalog::standard)
        .def_readwrite("bolts", &lapjoint::DesignCatalog::bolts)
        .def_readwrite("plate_grades", &lapjoint::DesignCatalog::plate_grades);

    // ========================================================================
    // Detailing
    // ========================================================================

    py::class_<lapjoint::DetailingRules>(m, "DetailingRules",
        "Offsets [mm] that derive spacing from the bolt diameter")
        .def(py::init<>())
        .def_readwrite("end_distance_offset", &lapjoint::DetailingRules::end_distance_offset)
        .def_readwrite("pitch_offset", &lapjoint::DetailingRules::pitch_offset)
        .def_readwrite("hole_clearance", &lapjoint::DetailingRules::hole_clearance);

    py::class_<lapjoint::Detailing>(m, "Detailing", "Single-row bolt layout [mm]")
        .def_readonly("bolt_diameter", &lapjoint::Detailing::bolt_diameter)
        .def_readonly("end_distance", &lapjoint::Detailing::end_distance)
        .def_readonly("edge_distance", &lapjoint::Detailing::edge_distance)
        .def_readonly("pitch_distance", &lapjoint::Detailing::pitch_distance)
        .def_readonly("gauge_distance", &lapjoint::Detailing::gauge_distance)
        .def_readonly("hole_diameter", &lapjoint::Detailing::hole_diameter)
        .def_readonly("length_of_connection", &lapjoint::Detailing::length_of_connection)
        .def_readonly("number_of_rows", &lapjoint::Detailing::number_of_rows)
        .def_readonly("number_of_columns", &lapjoint::Detailing::number_of_columns)
        .def("hole_positions", &lapjoint::Detailing::hole_positions,
             "Hole centres as an (n, 2) array [mm]");

    m.def("derive_detailing", &lapjoint::derive_detailing,
          py::arg("diameter"), py::arg("width"), py::arg("n_bolts"),
          py::arg("rules") = lapjoint::DetailingRules{},
          "Derive spacing and layout for one bolt size");

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::enum_<lapjoint::ErrorCode>(m, "ErrorCode",
        "Error codes for lap-joint design failures")
        .value("OK", lapjoint::ErrorCode::OK, "No error")
        .value("INVALID_PLATE_GRADE", lapjoint::ErrorCode::INVALID_PLATE_GRADE,
               "Plate grade not in catalog")
        .value("INVALID_INPUT", lapjoint::ErrorCode::INVALID_INPUT,
               "Load or geometry out of range")
        .value("NO_FEASIBLE_DESIGN", lapjoint::ErrorCode::NO_FEASIBLE_DESIGN,
               "No catalog combination is feasible")
        .value("UNKNOWN_ERROR", lapjoint::ErrorCode::UNKNOWN_ERROR,
               "Unknown error")
        .export_values();

    py::class_<lapjoint::LapJointError>(m, "LapJointError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<lapjoint::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &lapjoint::LapJointError::code, "Error code")
        .def_readwrite("message", &lapjoint::LapJointError::message, "Error message")
        .def_readwrite("valid_values", &lapjoint::LapJointError::valid_values,
                      "Valid alternatives for the rejected value")
        .def_readwrite("details", &lapjoint::LapJointError::details,
                      "Additional diagnostic details (key-value pairs)")
        .def_readwrite("suggestion", &lapjoint::LapJointError::suggestion,
                      "Suggested fix for the error")
        .def("is_ok", &lapjoint::LapJointError::is_ok)
        .def("is_error", &lapjoint::LapJointError::is_error)
        .def("code_string", &lapjoint::LapJointError::code_string)
        .def("to_string", &lapjoint::LapJointError::to_string)
        .def("__repr__", [](const lapjoint::LapJointError &e) {
            if (e.is_ok()) return std::string("<LapJointError OK>");
            return "<LapJointError " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &lapjoint::LapJointError::to_string)
        .def("__bool__", [](const lapjoint::LapJointError &e) {
            return e.is_error();  // True if error, False if OK
        });

    py::enum_<lapjoint::WarningCode>(m, "WarningCode",
        "Warning codes for questionable joint designs")
        .value("BEARING_CAPACITY_EXCEEDED", lapjoint::WarningCode::BEARING_CAPACITY_EXCEEDED,
               "Bearing capacity below demand")
        .value("HIGH_UTILIZATION", lapjoint::WarningCode::HIGH_UTILIZATION,
               "Utilization close to 1")
        .value("EDGE_DISTANCE_NOT_MET", lapjoint::WarningCode::EDGE_DISTANCE_NOT_MET,
               "Gauge smaller than edge distance")
        .export_values();

    py::enum_<lapjoint::WarningSeverity>(m, "WarningSeverity",
        "Warning severity levels")
        .value("Low", lapjoint::WarningSeverity::Low, "Minor issue")
        .value("Medium", lapjoint::WarningSeverity::Medium, "Review recommended")
        .value("High", lapjoint::WarningSeverity::High, "Likely unsafe joint")
        .export_values();

    py::class_<lapjoint::DesignWarning>(m, "DesignWarning",
        "Structured warning attached to a design")
        .def_readonly("code", &lapjoint::DesignWarning::code)
        .def_readonly("severity", &lapjoint::DesignWarning::severity)
        .def_readonly("message", &lapjoint::DesignWarning::message)
        .def_readonly("details", &lapjoint::DesignWarning::details)
        .def_readonly("suggestion", &lapjoint::DesignWarning::suggestion)
        .def("code_string", &lapjoint::DesignWarning::code_string)
        .def("severity_string", &lapjoint::DesignWarning::severity_string)
        .def("__repr__", [](const lapjoint::DesignWarning &w) {
            return "<DesignWarning [" + w.severity_string() + "] " +
                   w.code_string() + ": " + w.message + ">";
        })
        .def("__str__", &lapjoint::DesignWarning::to_string);

    py::class_<lapjoint::WarningList>(m, "WarningList",
        "Warnings attached to one design")
        .def_readonly("warnings", &lapjoint::WarningList::warnings)
        .def("has_warnings", &lapjoint::WarningList::has_warnings)
        .def("contains", &lapjoint::WarningList::contains, py::arg("code"))
        .def("count", &lapjoint::WarningList::count)
        .def("summary", &lapjoint::WarningList::summary)
        .def("__len__", &lapjoint::WarningList::count);

    // ========================================================================
    // Designer
    // ========================================================================

    py::enum_<lapjoint::MinimumBoltRule>(m, "MinimumBoltRule",
        "Treatment of candidates below the minimum bolt count")
        .value("RoundUp", lapjoint::MinimumBoltRule::RoundUp, "Raise count to the minimum")
        .value("Reject", lapjoint::MinimumBoltRule::Reject, "Skip the candidate")
        .export_values();

    py::class_<lapjoint::DesignerSettings>(m, "DesignerSettings",
        "Settings for the lap-joint search")
        .def(py::init<>())
        .def_readwrite("safety_factor", &lapjoint::DesignerSettings::safety_factor)
        .def_readwrite("min_bolts", &lapjoint::DesignerSettings::min_bolts)
        .def_readwrite("minimum_bolt_rule", &lapjoint::DesignerSettings::minimum_bolt_rule)
        .def_readwrite("detailing", &lapjoint::DesignerSettings::detailing)
        .def_readwrite("high_utilization_threshold",
                       &lapjoint::DesignerSettings::high_utilization_threshold)
        .def_readwrite("record_candidates", &lapjoint::DesignerSettings::record_candidates);

    py::class_<lapjoint::DesignInput>(m, "DesignInput",
        "Load [kN] and plate geometry [mm]")
        .def(py::init<double, double, double, double, std::string>(),
             py::arg("load"), py::arg("width"), py::arg("t1"), py::arg("t2"),
             py::arg("plate_grade") = lapjoint::DEFAULT_PLATE_GRADE)
        .def_readonly("load", &lapjoint::DesignInput::load)
        .def_readonly("width", &lapjoint::DesignInput::width)
        .def_readonly("t1", &lapjoint::DesignInput::t1)
        .def_readonly("t2", &lapjoint::DesignInput::t2)
        .def_readonly("plate_grade", &lapjoint::DesignInput::plate_grade);

    py::class_<lapjoint::DesignResult>(m, "DesignResult",
        "Winning bolt combination and derived layout")
        .def_readonly("bolt", &lapjoint::DesignResult::bolt)
        .def_property_readonly("bolt_diameter", [](const lapjoint::DesignResult &r) {
            return r.bolt.diameter;
        })
        .def_property_readonly("bolt_grade", [](const lapjoint::DesignResult &r) {
            return r.bolt.grade;
        })
        .def_readonly("bolt_fu", &lapjoint::DesignResult::bolt_fu)
        .def_readonly("bolt_fy", &lapjoint::DesignResult::bolt_fy)
        .def_readonly("number_of_bolts", &lapjoint::DesignResult::number_of_bolts)
        .def_readonly("pitch_distance", &lapjoint::DesignResult::pitch_distance)
        .def_readonly("gauge_distance", &lapjoint::DesignResult::gauge_distance)
        .def_readonly("end_distance", &lapjoint::DesignResult::end_distance)
        .def_readonly("edge_distance", &lapjoint::DesignResult::edge_distance)
        .def_readonly("hole_diameter", &lapjoint::DesignResult::hole_diameter)
        .def_readonly("number_of_rows", &lapjoint::DesignResult::number_of_rows)
        .def_readonly("number_of_columns", &lapjoint::DesignResult::number_of_columns)
        .def_readonly("shear_capacity_per_bolt", &lapjoint::DesignResult::shear_capacity_per_bolt)
        .def_readonly("strength_of_connection", &lapjoint::DesignResult::strength_of_connection)
        .def_readonly("bearing_capacity_per_bolt",
                      &lapjoint::DesignResult::bearing_capacity_per_bolt)
        .def_readonly("bearing_capacity", &lapjoint::DesignResult::bearing_capacity)
        .def_readonly("plate_grade", &lapjoint::DesignResult::plate_grade)
        .def_readonly("yield_strength_plate_1", &lapjoint::DesignResult::yield_strength_plate_1)
        .def_readonly("yield_strength_plate_2", &lapjoint::DesignResult::yield_strength_plate_2)
        .def_readonly("length_of_connection", &lapjoint::DesignResult::length_of_connection)
        .def_readonly("utilization_ratio", &lapjoint::DesignResult::utilization_ratio)
        .def("hole_positions", &lapjoint::DesignResult::hole_positions,
             "Hole centres as an (n, 2) array [mm]")
        .def("to_json", &lapjoint::DesignResult::to_json)
        .def("__str__", &lapjoint::DesignResult::to_string);

    py::enum_<lapjoint::CandidateStatus>(m, "CandidateStatus",
        "How one catalog combination fared during the search")
        .value("NewBest", lapjoint::CandidateStatus::NewBest)
        .value("FeasibleNotShorter", lapjoint::CandidateStatus::FeasibleNotShorter)
        .value("BelowMinimumBolts", lapjoint::CandidateStatus::BelowMinimumBolts)
        .value("OverUtilized", lapjoint::CandidateStatus::OverUtilized)
        .value("BoltCountOverflow", lapjoint::CandidateStatus::BoltCountOverflow)
        .export_values();

    py::class_<lapjoint::CandidateEvaluation>(m, "CandidateEvaluation",
        "Trace record of one evaluated catalog combination")
        .def_readonly("bolt_diameter", &lapjoint::CandidateEvaluation::bolt_diameter)
        .def_readonly("bolt_grade", &lapjoint::CandidateEvaluation::bolt_grade)
        .def_readonly("required_bolts", &lapjoint::CandidateEvaluation::required_bolts)
        .def_readonly("number_of_bolts", &lapjoint::CandidateEvaluation::number_of_bolts)
        .def_readonly("utilization_ratio", &lapjoint::CandidateEvaluation::utilization_ratio)
        .def_readonly("length_of_connection", &lapjoint::CandidateEvaluation::length_of_connection)
        .def_readonly("status", &lapjoint::CandidateEvaluation::status)
        .def("is_feasible", &lapjoint::CandidateEvaluation::is_feasible);

    py::class_<lapjoint::DesignOutcome>(m, "DesignOutcome",
        "Design result or error, with warnings and optional search trace")
        .def_readonly("result", &lapjoint::DesignOutcome::result)
        .def_readonly("error", &lapjoint::DesignOutcome::error)
        .def_readonly("warnings", &lapjoint::DesignOutcome::warnings)
        .def_readonly("candidates", &lapjoint::DesignOutcome::candidates)
        .def("is_ok", &lapjoint::DesignOutcome::is_ok)
        .def("__bool__", &lapjoint::DesignOutcome::is_ok)
        .def("__str__", &lapjoint::DesignOutcome::to_string);

    py::class_<lapjoint::LapJointDesigner>(m, "LapJointDesigner",
        "Exhaustive-search designer for bolted lap joints")
        .def(py::init<lapjoint::DesignCatalog, lapjoint::DesignerSettings>(),
             py::arg("catalog") = lapjoint::DesignCatalog::standard(),
             py::arg("settings") = lapjoint::DesignerSettings{})
        .def("design", py::overload_cast<const lapjoint::DesignInput&>(
                 &lapjoint::LapJointDesigner::design, py::const_),
             py::arg("input"))
        .def("design", py::overload_cast<double, double, double, double, const std::string&>(
                 &lapjoint::LapJointDesigner::design, py::const_),
             py::arg("load"), py::arg("width"), py::arg("t1"), py::arg("t2"),
             py::arg("plate_grade") = lapjoint::DEFAULT_PLATE_GRADE)
        .def_property_readonly("catalog", &lapjoint::LapJointDesigner::catalog)
        .def_property_readonly("settings", &lapjoint::LapJointDesigner::settings);

    m.def("design_lap_joint", &lapjoint::design_lap_joint,
          py::arg("load"), py::arg("width"), py::arg("t1"), py::arg("t2"),
          py::arg("plate_grade") = lapjoint::DEFAULT_PLATE_GRADE,
          "Design a lap joint with the standard catalog [kN, mm]");
}
