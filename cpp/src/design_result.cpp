#include "lapjoint/design_result.hpp"

#include <iomanip>
#include <sstream>

namespace lapjoint {

Detailing DesignResult::layout() const {
    Detailing d;
    d.bolt_diameter = bolt.diameter;
    d.end_distance = end_distance;
    d.edge_distance = edge_distance;
    d.pitch_distance = pitch_distance;
    d.gauge_distance = gauge_distance;
    d.hole_diameter = hole_diameter;
    d.length_of_connection = length_of_connection;
    d.number_of_rows = number_of_rows;
    d.number_of_columns = number_of_columns;
    return d;
}

std::string DesignResult::to_string() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << "Lap joint design (" << plate_grade << " plates)\n";
    oss << "  Bolts: " << number_of_bolts << " x M" << std::setprecision(0) << bolt.diameter
        << std::setprecision(1) << " grade " << bolt.grade << "\n";
    oss << std::setprecision(2);
    oss << "  Layout: " << number_of_rows << " row x " << number_of_columns << " columns\n";
    oss << "  Pitch: " << pitch_distance << " mm, gauge: " << gauge_distance << " mm\n";
    oss << "  End distance: " << end_distance << " mm, edge distance: " << edge_distance << " mm\n";
    oss << "  Hole diameter: " << hole_diameter << " mm\n";
    oss << "  Connection length: " << length_of_connection << " mm\n";
    oss << "  Shear strength: " << strength_of_connection << " N\n";
    oss << "  Bearing strength: " << bearing_capacity << " N\n";
    oss << std::setprecision(4);
    oss << "  Utilization: " << utilization_ratio;

    return oss.str();
}

std::string DesignResult::to_json() const {
    std::ostringstream oss;
    oss << std::setprecision(10);

    oss << "{\n";
    oss << "  \"bolt_diameter\": " << bolt.diameter << ",\n";
    oss << "  \"bolt_grade\": " << bolt.grade << ",\n";
    oss << "  \"bolt_fu\": " << bolt_fu << ",\n";
    oss << "  \"bolt_fy\": " << bolt_fy << ",\n";
    oss << "  \"number_of_bolts\": " << number_of_bolts << ",\n";
    oss << "  \"pitch_distance\": " << pitch_distance << ",\n";
    oss << "  \"gauge_distance\": " << gauge_distance << ",\n";
    oss << "  \"end_distance\": " << end_distance << ",\n";
    oss << "  \"edge_distance\": " << edge_distance << ",\n";
    oss << "  \"number_of_rows\": " << number_of_rows << ",\n";
    oss << "  \"number_of_columns\": " << number_of_columns << ",\n";
    oss << "  \"hole_diameter\": " << hole_diameter << ",\n";
    oss << "  \"shear_capacity_per_bolt\": " << shear_capacity_per_bolt << ",\n";
    oss << "  \"strength_of_connection\": " << strength_of_connection << ",\n";
    oss << "  \"bearing_capacity_per_bolt\": " << bearing_capacity_per_bolt << ",\n";
    oss << "  \"bearing_capacity\": " << bearing_capacity << ",\n";
    oss << "  \"plate_grade\": \"" << plate_grade << "\",\n";
    oss << "  \"yield_strength_plate_1\": " << yield_strength_plate_1 << ",\n";
    oss << "  \"yield_strength_plate_2\": " << yield_strength_plate_2 << ",\n";
    oss << "  \"length_of_connection\": " << length_of_connection << ",\n";
    oss << "  \"utilization_ratio\": " << utilization_ratio << "\n";
    oss << "}";

    return oss.str();
}

std::string DesignOutcome::to_string() const {
    if (!is_ok()) {
        return error.to_string();
    }

    std::ostringstream oss;
    oss << result->to_string();

    if (warnings.has_warnings()) {
        oss << "\n\n" << warnings.summary();
        for (const auto& w : warnings.warnings) {
            oss << "\n" << w.to_string();
        }
    }

    return oss.str();
}

} // namespace lapjoint
