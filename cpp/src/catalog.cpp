#include "lapjoint/catalog.hpp"

#include <stdexcept>
#include <utility>

namespace lapjoint {

PlateGrade::PlateGrade(std::string name, double fy, double fu)
    : name(std::move(name)), fy(fy), fu(fu) {
}

PlateGradeCatalog PlateGradeCatalog::standard() {
    PlateGradeCatalog catalog;
    catalog.add("E250", 250.0, 410.0);
    catalog.add("E275", 275.0, 440.0);
    catalog.add("E300", 300.0, 470.0);
    catalog.add("E350", 350.0, 510.0);
    catalog.add("E410", 410.0, 550.0);
    catalog.add("E450", 450.0, 590.0);
    catalog.add("E500", 500.0, 650.0);
    catalog.add("E550", 550.0, 700.0);
    return catalog;
}

void PlateGradeCatalog::add(const std::string& name, double fy, double fu) {
    if (contains(name)) {
        throw std::invalid_argument("Plate grade already in catalog: " + name);
    }
    if (!(fy > 0.0) || !(fu > 0.0)) {
        throw std::invalid_argument("Plate grade strengths must be positive: " + name);
    }
    grades_.emplace_back(name, fy, fu);
}

std::optional<PlateGrade> PlateGradeCatalog::find(const std::string& name) const {
    for (const auto& grade : grades_) {
        if (grade.name == name) {
            return grade;
        }
    }
    return std::nullopt;
}

bool PlateGradeCatalog::contains(const std::string& name) const {
    return find(name).has_value();
}

std::vector<std::string> PlateGradeCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(grades_.size());
    for (const auto& grade : grades_) {
        result.push_back(grade.name);
    }
    return result;
}

BoltCatalog BoltCatalog::standard() {
    BoltCatalog catalog;
    catalog.diameters = {10.0, 12.0, 16.0, 20.0, 24.0};
    catalog.grades = {3.6, 4.6, 4.8, 5.6, 5.8, 6.8, 8.8, 10.9};
    return catalog;
}

DesignCatalog DesignCatalog::standard() {
    DesignCatalog catalog;
    catalog.bolts = BoltCatalog::standard();
    catalog.plate_grades = PlateGradeCatalog::standard();
    return catalog;
}

} // namespace lapjoint
