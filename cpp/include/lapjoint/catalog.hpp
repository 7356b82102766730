#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lapjoint {

/// Plate grade used when the caller does not name one
inline const std::string DEFAULT_PLATE_GRADE = "E410";

/**
 * @brief Strength pair of a structural steel plate grade
 *
 * Stresses in [MPa].
 */
class PlateGrade {
public:
    std::string name;   ///< Grade designation, e.g. "E410"
    double fy;          ///< Yield strength [MPa]
    double fu;          ///< Ultimate tensile strength [MPa]

    PlateGrade(std::string name, double fy, double fu);
};

/**
 * @brief Ordered lookup table of plate grades
 *
 * Grades keep insertion order, which is the order reported by names().
 * Names are unique within a catalog.
 */
class PlateGradeCatalog {
public:
    PlateGradeCatalog() = default;

    /**
     * @brief The eight standard grades E250 through E550
     */
    static PlateGradeCatalog standard();

    /**
     * @brief Append a grade
     *
     * @param name Grade designation
     * @param fy Yield strength [MPa]
     * @param fu Ultimate tensile strength [MPa]
     * @throws std::invalid_argument if the name already exists or a strength is not positive
     */
    void add(const std::string& name, double fy, double fu);

    /**
     * @brief Look up a grade by name
     *
     * @param name Grade designation
     * @return std::optional<PlateGrade> The grade, or std::nullopt if absent
     */
    std::optional<PlateGrade> find(const std::string& name) const;

    bool contains(const std::string& name) const;

    /**
     * @brief Grade names in catalog order
     */
    std::vector<std::string> names() const;

    const std::vector<PlateGrade>& all_grades() const { return grades_; }

    size_t size() const { return grades_.size(); }

private:
    std::vector<PlateGrade> grades_;
};

/**
 * @brief Discrete bolt sizes and property classes searched by the designer
 *
 * The designer iterates diameters in the outer loop and grades in the
 * inner loop, both in vector order.
 */
struct BoltCatalog {
    /// Bolt diameters [mm]
    std::vector<double> diameters;

    /// Bolt property classes
    std::vector<double> grades;

    /**
     * @brief Diameters {10, 12, 16, 20, 24} mm and grades 3.6 through 10.9
     */
    static BoltCatalog standard();

    /// Number of diameter/grade combinations
    size_t size() const { return diameters.size() * grades.size(); }
};

/**
 * @brief Complete reference data for one designer
 */
struct DesignCatalog {
    BoltCatalog bolts;
    PlateGradeCatalog plate_grades;

    static DesignCatalog standard();
};

} // namespace lapjoint
