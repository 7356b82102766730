/**
 * @file test_catalog_detailing.cpp
 * @brief C++ tests for reference catalogs and single-row bolt detailing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lapjoint/catalog.hpp"
#include "lapjoint/detailing.hpp"

#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lapjoint;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Catalogs
// =============================================================================

TEST_CASE("Standard plate grade catalog has eight grades in order", "[Catalog][plate]") {
    PlateGradeCatalog catalog = PlateGradeCatalog::standard();

    std::vector<std::string> expected = {
        "E250", "E275", "E300", "E350", "E410", "E450", "E500", "E550"};
    REQUIRE(catalog.size() == 8);
    REQUIRE(catalog.names() == expected);

    auto e410 = catalog.find("E410");
    REQUIRE(e410.has_value());
    REQUIRE(e410->fy == 410.0);
    REQUIRE(e410->fu == 550.0);

    auto e250 = catalog.find("E250");
    REQUIRE(e250.has_value());
    REQUIRE(e250->fy == 250.0);
    REQUIRE(e250->fu == 410.0);
}

TEST_CASE("Plate grade lookup misses unknown names", "[Catalog][plate]") {
    PlateGradeCatalog catalog = PlateGradeCatalog::standard();

    REQUIRE_FALSE(catalog.find("E999").has_value());
    REQUIRE_FALSE(catalog.contains("e410"));
    REQUIRE(catalog.contains(DEFAULT_PLATE_GRADE));
}

TEST_CASE("Custom plate grade catalog rejects duplicates and bad strengths", "[Catalog][plate]") {
    PlateGradeCatalog catalog;
    catalog.add("S355", 355.0, 490.0);

    REQUIRE(catalog.size() == 1);
    REQUIRE_THROWS_AS(catalog.add("S355", 355.0, 510.0), std::invalid_argument);
    REQUIRE_THROWS_AS(catalog.add("S0", 0.0, 490.0), std::invalid_argument);
    REQUIRE_THROWS_AS(catalog.add("S1", 355.0, -1.0), std::invalid_argument);
    REQUIRE(catalog.size() == 1);
}

TEST_CASE("Standard bolt catalog spans 5 diameters and 8 grades", "[Catalog][bolt]") {
    BoltCatalog bolts = BoltCatalog::standard();

    REQUIRE(bolts.diameters == std::vector<double>{10.0, 12.0, 16.0, 20.0, 24.0});
    REQUIRE(bolts.grades == std::vector<double>{3.6, 4.6, 4.8, 5.6, 5.8, 6.8, 8.8, 10.9});
    REQUIRE(bolts.size() == 40);

    DesignCatalog catalog = DesignCatalog::standard();
    REQUIRE(catalog.bolts.size() == 40);
    REQUIRE(catalog.plate_grades.size() == 8);
}

// =============================================================================
// Detailing
// =============================================================================

TEST_CASE("Detailing derives spacing from the bolt diameter", "[Detailing]") {
    Detailing d = derive_detailing(16.0, 150.0, 4);

    REQUIRE_THAT(d.end_distance, WithinAbs(21.0, 1e-12));
    REQUIRE_THAT(d.edge_distance, WithinAbs(21.0, 1e-12));
    REQUIRE_THAT(d.pitch_distance, WithinAbs(26.0, 1e-12));
    REQUIRE_THAT(d.gauge_distance, WithinAbs(75.0, 1e-12));
    REQUIRE_THAT(d.hole_diameter, WithinAbs(18.0, 1e-12));
    REQUIRE_THAT(d.length_of_connection, WithinAbs(192.0, 1e-12));
    REQUIRE(d.number_of_rows == 1);
    REQUIRE(d.number_of_columns == 4);
}

TEST_CASE("Detailing honours custom offsets", "[Detailing]") {
    DetailingRules rules;
    rules.end_distance_offset = 10.0;
    rules.pitch_offset = 20.0;
    rules.hole_clearance = 3.0;

    Detailing d = derive_detailing(20.0, 100.0, 2, rules);

    REQUIRE_THAT(d.end_distance, WithinAbs(30.0, 1e-12));
    REQUIRE_THAT(d.pitch_distance, WithinAbs(40.0, 1e-12));
    REQUIRE_THAT(d.hole_diameter, WithinAbs(23.0, 1e-12));
    REQUIRE_THAT(d.length_of_connection, WithinAbs(160.0, 1e-12));
}

TEST_CASE("Hole positions lie on one line at pitch spacing", "[Detailing][holes]") {
    Detailing d = derive_detailing(10.0, 150.0, 3);
    Eigen::MatrixX2d holes = d.hole_positions();

    REQUIRE(holes.rows() == 3);
    REQUIRE_THAT(holes(0, 0), WithinAbs(15.0, 1e-12));
    REQUIRE_THAT(holes(1, 0), WithinAbs(35.0, 1e-12));
    REQUIRE_THAT(holes(2, 0), WithinAbs(55.0, 1e-12));

    for (int i = 0; i < holes.rows(); ++i) {
        REQUIRE_THAT(holes(i, 1), WithinAbs(75.0, 1e-12));
    }

    // Consecutive holes are one pitch apart
    Eigen::Vector2d step = holes.row(2) - holes.row(1);
    REQUIRE_THAT(step.norm(), WithinAbs(d.pitch_distance, 1e-12));
}
