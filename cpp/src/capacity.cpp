#include "lapjoint/capacity.hpp"

#include <cmath>
#include <stdexcept>

namespace lapjoint {

double calculate_shear_capacity(double fy_bolt, double area) {
    return 0.6 * fy_bolt * area;
}

double calculate_bearing_capacity(double fu_plate, double t_total, double diameter) {
    return 2.5 * fu_plate * t_total * diameter;
}

double calculate_required_bolts(double load, double shear_capacity, double safety_factor) {
    // Integer grades (e.g. 4.0) have fy = 0 and therefore no shear capacity
    if (shear_capacity == 0.0) {
        throw std::domain_error("Bolt shear capacity is zero; required bolt count is undefined");
    }
    return std::ceil(load / (shear_capacity / safety_factor));
}

} // namespace lapjoint
