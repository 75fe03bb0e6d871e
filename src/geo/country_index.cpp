// EN: Implementation of the CountryIndex.
// FR: Implémentation du CountryIndex.

#include "geo/country_index.hpp"
#include "geo/geometry_normalizer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iterator>

namespace ARL::Geo {

namespace bgi = boost::geometry::index;

bool CountryIndex::addCountry(const std::string& id, const std::string& name, const nlohmann::json& geometry) {
    MultiPolygon boundary = GeometryNormalizer::toMultiPolygon(geometry);
    if (boundary.empty() || bg::area(boundary) <= 0.0) {
        LOG_DEBUG("geometry", "Country " + id + " has no usable boundary, not indexed");
        return false;
    }

    countries_.push_back(Country{id, name});
    boundaries_.push_back(std::move(boundary));
    return true;
}

void CountryIndex::build() {
    std::vector<Value> values;
    values.reserve(boundaries_.size());
    for (size_t i = 0; i < boundaries_.size(); ++i) {
        values.emplace_back(bg::return_envelope<Box>(boundaries_[i]), i);
    }
    rtree_ = RTree(values.begin(), values.end());
    LOG_INFO("geometry", "Country index built with " + std::to_string(values.size()) + " boundaries");
}

void CountryIndex::clear() {
    countries_.clear();
    boundaries_.clear();
    rtree_.clear();
}

std::optional<CountryIndex::Country> CountryIndex::locate(const nlohmann::json& geometry) const {
    if (rtree_.empty()) {
        return std::nullopt;
    }

    MultiPolygon area = GeometryNormalizer::toMultiPolygon(geometry);
    if (area.empty() || bg::area(area) <= 0.0) {
        return std::nullopt;
    }

    Point centroid;
    bg::centroid(area, centroid);

    std::vector<Value> candidates;
    rtree_.query(bgi::intersects(centroid), std::back_inserter(candidates));

    for (const auto& [envelope, index] : candidates) {
        if (bg::within(centroid, boundaries_[index])) {
            return countries_[index];
        }
    }
    return std::nullopt;
}

} // namespace ARL::Geo
