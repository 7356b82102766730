#pragma once

namespace lapjoint {

/**
 * @brief Nominal shear capacity of a single bolt
 *
 * Simplified single-plane check on the shank area:
 *   V_b = 0.6 * fy_bolt * A_bolt
 *
 * @param fy_bolt Bolt yield strength [MPa]
 * @param area Bolt shank area [mm²]
 * @return double Shear capacity [N]
 */
double calculate_shear_capacity(double fy_bolt, double area);

/**
 * @brief Nominal bearing capacity of the plates at one bolt hole
 *
 *   V_dpb = 2.5 * fu_plate * t_total * d
 *
 * @param fu_plate Plate ultimate strength [MPa]
 * @param t_total Sum of both plate thicknesses [mm]
 * @param diameter Bolt diameter [mm]
 * @return double Bearing capacity [N]
 */
double calculate_bearing_capacity(double fu_plate, double t_total, double diameter);

/**
 * @brief Number of bolts needed to carry a load in shear
 *
 *   N = ceil(P / (V_b / safety_factor))
 *
 * The count is rounded up and returned unclamped, so a zero load gives 0
 * and a negative load gives a non-positive count.
 *
 * @param load Applied load [N]
 * @param shear_capacity Nominal shear capacity of one bolt [N]
 * @param safety_factor Divisor applied to the nominal capacity
 * @return double Required bolt count (integral value)
 * @throws std::domain_error if shear_capacity is zero
 */
double calculate_required_bolts(double load, double shear_capacity, double safety_factor);

} // namespace lapjoint
