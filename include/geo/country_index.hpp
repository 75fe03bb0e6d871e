// EN: Country spatial index for AreaLint - R-tree of country boundaries for centroid lookups
// FR: Index spatial des pays pour AreaLint - R-tree des limites de pays pour la recherche par centroïde

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/geometry/index/rtree.hpp>
#include <nlohmann/json.hpp>

#include "geo/geo_types.hpp"

namespace ARL::Geo {

class CountryIndex {
public:
    struct Country {
        std::string id;
        std::string name;
    };

    CountryIndex() = default;

    // EN: Register a country from a normalized geometry. Empty or zero-area boundaries are skipped (returns false).
    // FR: Enregistre un pays depuis une géométrie normalisée. Les limites vides ou de surface nulle sont ignorées (retourne false).
    bool addCountry(const std::string& id, const std::string& name, const nlohmann::json& geometry);

    // EN: Pack the R-tree. Must be called after the last addCountry and before locate.
    // FR: Construit le R-tree. À appeler après le dernier addCountry et avant locate.
    void build();

    void clear();

    // EN: Country whose boundary contains the centroid of `geometry`, or nullopt.
    // FR: Pays dont la limite contient le centroïde de `geometry`, ou nullopt.
    std::optional<Country> locate(const nlohmann::json& geometry) const;

    size_t size() const { return countries_.size(); }
    bool empty() const { return countries_.empty(); }

private:
    using Value = std::pair<Box, size_t>;
    using RTree = boost::geometry::index::rtree<Value, boost::geometry::index::quadratic<16>>;

    std::vector<Country> countries_;
    std::vector<MultiPolygon> boundaries_;
    RTree rtree_;
};

} // namespace ARL::Geo
