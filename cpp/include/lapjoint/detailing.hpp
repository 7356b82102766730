#pragma once

#include <Eigen/Dense>

namespace lapjoint {

/**
 * @brief Offsets that derive spacing from the bolt diameter
 *
 * All values in [mm]. With the defaults:
 * - end/edge distance e = d + 5
 * - pitch p = d + 10
 * - hole diameter = d + 2
 */
struct DetailingRules {
    double end_distance_offset = 5.0;   ///< e - d [mm]
    double pitch_offset = 10.0;         ///< p - d [mm]
    double hole_clearance = 2.0;        ///< hole - d [mm]
};

/**
 * @brief Bolt layout of a single-row lap joint
 *
 * All bolts sit in one line along the load axis. The line runs at the
 * gauge distance from the plate edge, which is half the plate width.
 *
 * Coordinates used by hole_positions():
 * - x: along the load axis, from the end of the overlap [mm]
 * - y: across the plate width, from one plate edge [mm]
 */
struct Detailing {
    double bolt_diameter = 0.0;         ///< [mm]
    double end_distance = 0.0;          ///< [mm]
    double edge_distance = 0.0;         ///< [mm]
    double pitch_distance = 0.0;        ///< [mm]
    double gauge_distance = 0.0;        ///< [mm]
    double hole_diameter = 0.0;         ///< [mm]
    double length_of_connection = 0.0;  ///< width + 2 * end distance [mm]
    int number_of_rows = 1;
    int number_of_columns = 0;          ///< One column per bolt

    /**
     * @brief Centre of every bolt hole
     *
     * Bolt i sits at (end_distance + i * pitch_distance, gauge_distance).
     *
     * @return Eigen::MatrixX2d One row per bolt, columns (x, y) [mm]
     */
    Eigen::MatrixX2d hole_positions() const;
};

/**
 * @brief Derive spacing and layout for one bolt size
 *
 * @param diameter Bolt diameter [mm]
 * @param width Plate width [mm]
 * @param n_bolts Number of bolts
 * @param rules Offset rules
 * @return Detailing Complete layout
 */
Detailing derive_detailing(double diameter, double width, int n_bolts,
                           const DetailingRules& rules = DetailingRules{});

} // namespace lapjoint
