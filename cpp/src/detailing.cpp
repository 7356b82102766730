#include "lapjoint/detailing.hpp"

namespace lapjoint {

Eigen::MatrixX2d Detailing::hole_positions() const {
    Eigen::MatrixX2d positions(number_of_rows * number_of_columns, 2);
    for (int i = 0; i < number_of_columns; ++i) {
        positions(i, 0) = end_distance + i * pitch_distance;
        positions(i, 1) = gauge_distance;
    }
    return positions;
}

Detailing derive_detailing(double diameter, double width, int n_bolts,
                           const DetailingRules& rules) {
    Detailing d;
    d.bolt_diameter = diameter;
    d.end_distance = diameter + rules.end_distance_offset;
    d.edge_distance = d.end_distance;
    d.pitch_distance = diameter + rules.pitch_offset;
    d.gauge_distance = width / 2.0;
    d.hole_diameter = diameter + rules.hole_clearance;
    d.length_of_connection = width + 2.0 * d.end_distance;
    d.number_of_rows = 1;
    d.number_of_columns = n_bolts;
    return d;
}

} // namespace lapjoint
