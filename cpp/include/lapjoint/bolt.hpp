#pragma once

namespace lapjoint {

/**
 * @brief Nominal strengths of a bolt grade
 *
 * Both values in [MPa].
 */
struct BoltStrength {
    double fu = 0.0;    ///< Ultimate tensile strength [MPa]
    double fy = 0.0;    ///< Yield strength [MPa]
};

/**
 * @brief Compute bolt strengths from a property-class grade
 *
 * A grade X.Y encodes fu = X * 100 MPa and fy = 0.Y * fu:
 * - fu = floor(grade) * 100
 * - fy = (grade - floor(grade)) * fu
 *
 * The grade is not checked against any catalog. An integer-valued grade
 * yields fy = 0.
 *
 * @param grade Bolt grade (e.g. 4.6, 8.8, 10.9)
 * @return BoltStrength {fu, fy} [MPa]
 */
BoltStrength calculate_bolt_strength(double grade);

/**
 * @brief A bolt of given diameter and grade
 *
 * Units:
 * - diameter: [mm]
 * - grade: property class (dimensionless)
 */
class BoltSpec {
public:
    double diameter;    ///< Nominal shank diameter [mm]
    double grade;       ///< Property class, e.g. 8.8

    /**
     * @brief Construct a new BoltSpec
     *
     * @param diameter Nominal shank diameter [mm]
     * @param grade Property class
     */
    BoltSpec(double diameter, double grade);

    /**
     * @brief Shank cross-section area, no thread reduction
     *
     * Formula: A = pi * (d / 2)^2
     *
     * @return double Area [mm²]
     */
    double area() const;

    /// Ultimate tensile strength [MPa]
    double fu() const;

    /// Yield strength [MPa]
    double fy() const;
};

} // namespace lapjoint
