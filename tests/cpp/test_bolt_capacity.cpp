/**
 * @file test_bolt_capacity.cpp
 * @brief C++ tests for bolt strength and the shear/bearing capacity formulas
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lapjoint/bolt.hpp"
#include "lapjoint/capacity.hpp"

#include <cmath>
#include <stdexcept>

using namespace lapjoint;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Bolt strength
// =============================================================================

TEST_CASE("Bolt strength follows the property class", "[Bolt][strength]") {
    struct Expected { double grade; double fu; double fy; };
    const Expected cases[] = {
        {3.6, 300.0, 180.0},
        {4.6, 400.0, 240.0},
        {5.8, 500.0, 400.0},
        {8.8, 800.0, 640.0},
        {10.9, 1000.0, 900.0},
    };

    for (const auto& c : cases) {
        BoltStrength s = calculate_bolt_strength(c.grade);
        REQUIRE_THAT(s.fu, WithinAbs(c.fu, 1e-9));
        REQUIRE_THAT(s.fy, WithinAbs(c.fy, 1e-6));
    }
}

TEST_CASE("Bolt strength is computed for grades outside the catalog", "[Bolt][strength]") {
    BoltStrength s = calculate_bolt_strength(12.9);
    REQUIRE_THAT(s.fu, WithinAbs(1200.0, 1e-9));
    REQUIRE_THAT(s.fy, WithinAbs(1080.0, 1e-6));

    // Integer grade has no yield fraction
    BoltStrength integer_grade = calculate_bolt_strength(4.0);
    REQUIRE_THAT(integer_grade.fu, WithinAbs(400.0, 1e-9));
    REQUIRE(integer_grade.fy == 0.0);
}

TEST_CASE("BoltSpec derives area and strengths", "[Bolt][BoltSpec]") {
    BoltSpec bolt(20.0, 8.8);

    REQUIRE_THAT(bolt.area(), WithinRel(M_PI * 100.0, 1e-12));
    REQUIRE_THAT(bolt.fu(), WithinAbs(800.0, 1e-9));
    REQUIRE_THAT(bolt.fy(), WithinAbs(640.0, 1e-6));
}

// =============================================================================
// Capacities
// =============================================================================

TEST_CASE("Shear capacity uses 0.6 fy on the shank area", "[Capacity][shear]") {
    BoltSpec bolt(16.0, 4.6);
    double v_b = calculate_shear_capacity(bolt.fy(), bolt.area());

    // 0.6 * 240 * pi * 64
    REQUIRE_THAT(v_b, WithinRel(0.6 * 240.0 * M_PI * 64.0, 1e-9));
    REQUIRE(calculate_shear_capacity(0.0, bolt.area()) == 0.0);
}

TEST_CASE("Bearing capacity uses combined plate thickness", "[Capacity][bearing]") {
    // 2.5 * 410 * (10 + 12) * 20
    REQUIRE_THAT(calculate_bearing_capacity(410.0, 22.0, 20.0), WithinAbs(451000.0, 1e-6));
    REQUIRE_THAT(calculate_bearing_capacity(550.0, 12.0, 10.0), WithinAbs(165000.0, 1e-6));
}

TEST_CASE("Required bolt count rounds up", "[Capacity][bolt_count]") {
    // 1000 / (1330 / 1.33) = 1 exactly
    REQUIRE(calculate_required_bolts(1000.0, 1330.0, 1.33) == 1.0);
    REQUIRE(calculate_required_bolts(1001.0, 1330.0, 1.33) == 2.0);
    REQUIRE(calculate_required_bolts(0.0, 1330.0, 1.33) == 0.0);
    REQUIRE(calculate_required_bolts(100000.0, 10000.0, 1.0) == 10.0);
}

TEST_CASE("Required bolt count is undefined for zero shear capacity", "[Capacity][bolt_count]") {
    REQUIRE_THROWS_AS(calculate_required_bolts(1000.0, 0.0, 1.33), std::domain_error);
    REQUIRE_THROWS_AS(calculate_required_bolts(0.0, 0.0, 1.33), std::domain_error);
}
