#include "lapjoint/bolt.hpp"

#include <cmath>

namespace lapjoint {

BoltStrength calculate_bolt_strength(double grade) {
    double whole = std::floor(grade);
    BoltStrength strength;
    strength.fu = whole * 100.0;
    strength.fy = (grade - whole) * strength.fu;
    return strength;
}

BoltSpec::BoltSpec(double diameter, double grade)
    : diameter(diameter), grade(grade) {
}

double BoltSpec::area() const {
    double r = diameter / 2.0;
    return M_PI * r * r;
}

double BoltSpec::fu() const {
    return calculate_bolt_strength(grade).fu;
}

double BoltSpec::fy() const {
    return calculate_bolt_strength(grade).fy;
}

} // namespace lapjoint
