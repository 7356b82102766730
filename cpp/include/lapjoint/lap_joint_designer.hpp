#pragma once

#include "lapjoint/catalog.hpp"
#include "lapjoint/design_result.hpp"
#include "lapjoint/detailing.hpp"
#include "lapjoint/errors.hpp"
#include "lapjoint/warnings.hpp"

#include <optional>
#include <string>

namespace lapjoint {

/**
 * @brief What to do with a candidate that needs fewer bolts than the minimum
 */
enum class MinimumBoltRule {
    RoundUp,    ///< Raise the bolt count to the minimum (default)
    Reject      ///< Skip the candidate
};

/**
 * @brief Settings for the lap-joint search
 */
struct DesignerSettings {
    /// Nominal capacity is divided by this factor (1.33 ~ 0.75 reduction)
    double safety_factor = 1.33;

    /// A lap joint needs at least two bolts to resist rotation
    int min_bolts = 2;

    /// Treatment of candidates below min_bolts
    MinimumBoltRule minimum_bolt_rule = MinimumBoltRule::RoundUp;

    /// Spacing offsets derived from the bolt diameter
    DetailingRules detailing;

    /// Utilization above which a HIGH_UTILIZATION warning is attached
    double high_utilization_threshold = 0.95;

    /// Fill DesignOutcome::candidates with every evaluation
    bool record_candidates = false;
};

/**
 * @brief Tensile load and plate geometry for one design call
 *
 * Units: load [kN], lengths [mm].
 */
struct DesignInput {
    double load;                ///< Tensile load [kN]
    double width;               ///< Plate width [mm]
    double t1;                  ///< Thickness of plate 1 [mm]
    double t2;                  ///< Thickness of plate 2 [mm]
    std::string plate_grade;    ///< Plate grade designation

    DesignInput(double load, double width, double t1, double t2,
                std::string plate_grade = DEFAULT_PLATE_GRADE);
};

/**
 * @brief Exhaustive-search designer for two-plate bolted lap joints
 *
 * Every bolt diameter is combined with every bolt grade, in catalog order
 * (diameters outer, grades inner). For each combination:
 *
 * 1. V_b = 0.6 * fy_bolt * A_bolt
 * 2. N_b = ceil(P / (V_b / safety_factor)), then the minimum bolt rule
 * 3. Detailing from the bolt diameter (see DetailingRules)
 * 4. utilization = P / (N_b * V_b / safety_factor)
 *
 * A combination is feasible when utilization <= 1. The feasible
 * combination with the shortest connection wins; on equal length the
 * first one in catalog order is kept. Bearing capacity is reported and
 * may raise a warning, but never rejects a combination.
 *
 * The designer holds no state between calls; design() is const and may
 * be called concurrently.
 *
 * Usage:
 *   LapJointDesigner designer;
 *   DesignOutcome outcome = designer.design(DesignInput(100.0, 150.0, 10.0, 12.0, "E250"));
 *   if (outcome.is_ok()) {
 *       int n = outcome.result->number_of_bolts;
 *   } else {
 *       std::cerr << outcome.error.to_string() << std::endl;
 *   }
 */
class LapJointDesigner {
public:
    /**
     * @brief Construct a designer
     * @param catalog Bolt and plate-grade reference data
     * @param settings Search settings
     * @throws std::invalid_argument if the settings are out of range
     */
    explicit LapJointDesigner(DesignCatalog catalog = DesignCatalog::standard(),
                              DesignerSettings settings = DesignerSettings{});

    /**
     * @brief Search the catalog for the shortest feasible joint
     * @param input Load, geometry and plate grade
     * @return DesignOutcome with a result, or with INVALID_INPUT,
     *         INVALID_PLATE_GRADE or NO_FEASIBLE_DESIGN
     * @throws std::domain_error if a catalog grade has zero yield strength
     */
    DesignOutcome design(const DesignInput& input) const;

    /**
     * @brief Convenience overload taking the input fields directly
     */
    DesignOutcome design(double load, double width, double t1, double t2,
                         const std::string& plate_grade = DEFAULT_PLATE_GRADE) const;

    const DesignCatalog& catalog() const { return catalog_; }

    const DesignerSettings& settings() const { return settings_; }

private:
    DesignCatalog catalog_;
    DesignerSettings settings_;

    /**
     * @brief Check that load and geometry are usable
     * @return Error for the first offending field, std::nullopt if valid
     */
    std::optional<LapJointError> validate_input(const DesignInput& input) const;

    /**
     * @brief Attach report-only checks of the winning design
     */
    void collect_warnings(const DesignResult& result, double demand,
                          WarningList& warnings) const;
};

/**
 * @brief Design a lap joint with the standard catalog and default settings
 *
 * @param load Tensile load [kN]
 * @param width Plate width [mm]
 * @param t1 Thickness of plate 1 [mm]
 * @param t2 Thickness of plate 2 [mm]
 * @param plate_grade Plate grade designation (default E410)
 */
DesignOutcome design_lap_joint(double load, double width, double t1, double t2,
                               const std::string& plate_grade = DEFAULT_PLATE_GRADE);

} // namespace lapjoint
