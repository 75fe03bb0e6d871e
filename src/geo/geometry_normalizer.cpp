// EN: Implementation of the GeometryNormalizer.
// FR: Implémentation du GeometryNormalizer.

#include "geo/geometry_normalizer.hpp"
#include "geo/albers_projection.hpp"
#include "infrastructure/logging/logger.hpp"
#include "validation/field_validator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ARL::Geo {

using Validation::ErrorKind;

namespace {

ValidationError geometryError(const std::string& field, const std::string& message) {
    return ValidationError(field, ErrorKind::GEOMETRY_INVALID, field + ": " + message);
}

GeometryResult failure(ValidationError error) {
    GeometryResult result;
    result.error = std::move(error);
    return result;
}

std::string location(size_t polygon_index, size_t ring_index) {
    return "polygon " + std::to_string(polygon_index) + " ring " + std::to_string(ring_index);
}

} // namespace

GeometryResult GeometryNormalizer::normalize(const nlohmann::json& raw, const std::string& field) const {
    // EN: Step 1 - accept a JSON string or an object
    // FR: Étape 1 - accepte une chaîne JSON ou un objet
    nlohmann::json geometry;
    if (raw.is_string()) {
        geometry = nlohmann::json::parse(raw.get_ref<const std::string&>(), nullptr, false);
        if (geometry.is_discarded()) {
            return failure(ValidationError(field, ErrorKind::FORMAT_INVALID, field + ": not valid JSON"));
        }
    } else {
        geometry = raw;
    }

    if (!geometry.is_object()) {
        return failure(ValidationError(field, ErrorKind::FORMAT_INVALID, field + ": must be a GeoJSON object"));
    }

    // EN: Step 2 - only Polygon and MultiPolygon
    // FR: Étape 2 - seulement Polygon et MultiPolygon
    auto type_it = geometry.find("type");
    if (type_it == geometry.end() || !type_it->is_string()) {
        return failure(geometryError(field, "missing geometry type"));
    }
    const std::string type = type_it->get<std::string>();
    if (type != "Polygon" && type != "MultiPolygon") {
        return failure(geometryError(field, "only Polygon and MultiPolygon are accepted, got " + type));
    }

    auto coords_it = geometry.find("coordinates");
    if (coords_it == geometry.end() || !coords_it->is_array()) {
        return failure(geometryError(field, "coordinates must be an array"));
    }
    if (coords_it->empty()) {
        return failure(geometryError(field, "empty coordinates"));
    }

    std::vector<nlohmann::json> polygons;
    if (type == "Polygon") {
        polygons.push_back(*coords_it);
    } else {
        for (const auto& polygon : *coords_it) {
            if (!polygon.is_array() || polygon.empty()) {
                return failure(geometryError(field, "MultiPolygon member " + std::to_string(polygons.size()) +
                                                    " has no rings"));
            }
            polygons.push_back(polygon);
        }
    }

    // EN: Step 3 - ring structure and coordinate ranges
    // FR: Étape 3 - structure des anneaux et plages de coordonnées
    double min_lon = std::numeric_limits<double>::max();
    double min_lat = std::numeric_limits<double>::max();
    double max_lon = std::numeric_limits<double>::lowest();
    double max_lat = std::numeric_limits<double>::lowest();

    for (size_t p = 0; p < polygons.size(); ++p) {
        for (size_t r = 0; r < polygons[p].size(); ++r) {
            const auto& ring = polygons[p][r];
            if (auto problem = checkRing(ring)) {
                return failure(geometryError(field, location(p, r) + " " + *problem));
            }
            for (const auto& position : ring) {
                const double lon = position[0].get<double>();
                const double lat = position[1].get<double>();
                min_lon = std::min(min_lon, lon);
                max_lon = std::max(max_lon, lon);
                min_lat = std::min(min_lat, lat);
                max_lat = std::max(max_lat, lat);
            }
        }
    }

    // EN: Step 4 - rewind, step 5 - equal-area surface with one projection for the whole geometry
    // FR: Étape 4 - réorientation, étape 5 - surface équivalente avec une projection pour toute la géométrie
    const AlbersEqualArea projection = AlbersEqualArea::forBounds(Box(Point(min_lon, min_lat), Point(max_lon, max_lat)));

    GeometryResult result;
    nlohmann::json rewound_polygons = nlohmann::json::array();
    double total_m2 = 0.0;
    bool antimeridian = false;

    for (size_t p = 0; p < polygons.size(); ++p) {
        nlohmann::json rewound_rings = nlohmann::json::array();
        double polygon_m2 = 0.0;

        for (size_t r = 0; r < polygons[p].size(); ++r) {
            nlohmann::json ring = polygons[p][r];
            const double signed_area = bg::area(toRing(ring));
            const bool exterior = (r == 0);

            if (exterior && signed_area == 0.0) {
                return failure(geometryError(field, location(p, r) + " exterior ring has zero area"));
            }
            if ((exterior && signed_area < 0.0) || (!exterior && signed_area > 0.0)) {
                std::reverse(ring.begin(), ring.end());
            }

            antimeridian = antimeridian || crossesAntimeridian(ring);

            Ring projected;
            for (const auto& position : ring) {
                bg::append(projected, projection.project(Point(position[0].get<double>(), position[1].get<double>())));
            }
            const double ring_m2 = std::fabs(bg::area(projected));
            polygon_m2 += exterior ? ring_m2 : -ring_m2;

            rewound_rings.push_back(std::move(ring));
        }

        total_m2 += std::max(polygon_m2, 0.0);
        rewound_polygons.push_back(std::move(rewound_rings));
    }

    if (antimeridian) {
        result.warnings.emplace_back(field, ErrorKind::GEOMETRY_INVALID,
                                     field + ": ring crosses the antimeridian, area is likely inflated",
                                     ValidationError::Severity::WARNING);
        LOG_WARN("geometry", field + " crosses the antimeridian");
    }

    nlohmann::json normalized = geometry;
    normalized["coordinates"] = (type == "Polygon") ? rewound_polygons[0] : rewound_polygons;

    result.area_km2 = Validation::roundHalfUp2(total_m2 / 1e6);
    result.geometry = std::move(normalized);

    LOG_DEBUG("geometry", "Normalized " + type + " with " + std::to_string(polygons.size()) +
                          " polygon(s), area " + std::to_string(result.area_km2) + " km2");
    return result;
}

MultiPolygon GeometryNormalizer::toMultiPolygon(const nlohmann::json& geometry) {
    MultiPolygon multi;
    if (!geometry.is_object() || !geometry.contains("type") || !geometry.contains("coordinates")) {
        return multi;
    }

    const nlohmann::json& coords = geometry["coordinates"];
    std::vector<const nlohmann::json*> polygons;
    if (geometry["type"] == "Polygon") {
        polygons.push_back(&coords);
    } else if (geometry["type"] == "MultiPolygon") {
        for (const auto& polygon : coords) {
            polygons.push_back(&polygon);
        }
    }

    for (const nlohmann::json* rings : polygons) {
        Polygon polygon;
        for (size_t r = 0; r < rings->size(); ++r) {
            if (r == 0) {
                polygon.outer() = toRing((*rings)[r]);
            } else {
                polygon.inners().push_back(toRing((*rings)[r]));
            }
        }
        multi.push_back(std::move(polygon));
    }
    return multi;
}

std::optional<std::string> GeometryNormalizer::checkRing(const nlohmann::json& ring) const {
    if (!ring.is_array()) {
        return std::string("is not an array of positions");
    }
    if (ring.size() < 4) {
        return "has " + std::to_string(ring.size()) + " positions, at least 4 are required";
    }

    for (const auto& position : ring) {
        if (!position.is_array() || position.size() < 2 ||
            !position[0].is_number() || !position[1].is_number()) {
            return std::string("has a position that is not [lon, lat]");
        }
        const double lon = position[0].get<double>();
        const double lat = position[1].get<double>();
        if (!std::isfinite(lon) || !std::isfinite(lat)) {
            return std::string("has a non-finite coordinate");
        }
        if (lon < -180.0 || lon > 180.0) {
            return "has longitude " + std::to_string(lon) + " outside [-180, 180]";
        }
        if (lat < -90.0 || lat > 90.0) {
            return "has latitude " + std::to_string(lat) + " outside [-90, 90]";
        }
    }

    const auto& first = ring.front();
    const auto& last = ring.back();
    if (first[0].get<double>() != last[0].get<double>() || first[1].get<double>() != last[1].get<double>()) {
        return std::string("is not closed");
    }
    return std::nullopt;
}

Ring GeometryNormalizer::toRing(const nlohmann::json& ring) {
    Ring result;
    for (const auto& position : ring) {
        bg::append(result, Point(position[0].get<double>(), position[1].get<double>()));
    }
    return result;
}

// EN: A jump of more than 180 degrees between consecutive positions means the edge wraps around.
// FR: Un saut de plus de 180 degrés entre positions consécutives signifie que l'arête fait le tour.
bool GeometryNormalizer::crossesAntimeridian(const nlohmann::json& ring) {
    for (size_t i = 1; i < ring.size(); ++i) {
        if (std::fabs(ring[i][0].get<double>() - ring[i - 1][0].get<double>()) > 180.0) {
            return true;
        }
    }
    return false;
}

} // namespace ARL::Geo
