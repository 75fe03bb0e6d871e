// EN: Geometry Normalizer for AreaLint - GeoJSON boundary validation, ring rewinding and equal-area surface
// FR: Normaliseur de géométrie pour AreaLint - validation des limites GeoJSON, réorientation des anneaux et surface équivalente

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geo/geo_types.hpp"
#include "validation/validation_types.hpp"

namespace ARL::Geo {

using Validation::ValidationError;

// EN: Result of a normalization: the rewound geometry and its area, or an error.
// FR: Résultat d'une normalisation : la géométrie réorientée et sa surface, ou une erreur.
struct GeometryResult {
    std::optional<nlohmann::json> geometry;
    double area_km2{0.0};                        // EN: Rounded half-up to 2 decimals / FR: Arrondi au demi supérieur à 2 décimales
    std::optional<ValidationError> error;
    std::vector<ValidationError> warnings;       // EN: e.g. antimeridian crossing / FR: ex. traversée de l'antiméridien

    bool ok() const { return geometry.has_value(); }
};

// EN: Stateless GeoJSON Polygon/MultiPolygon normalizer.
//     Exterior rings end up counter-clockwise, holes clockwise (RFC 7946 right-hand rule).
// FR: Normaliseur GeoJSON Polygon/MultiPolygon sans état.
//     Les anneaux extérieurs finissent anti-horaires, les trous horaires (règle de la main droite RFC 7946).
class GeometryNormalizer {
public:
    GeometryNormalizer() = default;

    // EN: Accepts a JSON-encoded string or a parsed object. `field` names errors and warnings.
    // FR: Accepte une chaîne JSON ou un objet déjà parsé. `field` nomme les erreurs et avertissements.
    GeometryResult normalize(const nlohmann::json& raw, const std::string& field = "geo_json") const;

    // EN: Convert an already normalized geometry into Boost.Geometry polygons (lon/lat plane).
    // FR: Convertit une géométrie déjà normalisée en polygones Boost.Geometry (plan lon/lat).
    static MultiPolygon toMultiPolygon(const nlohmann::json& geometry);

private:
    // EN: Structural check of one ring; returns an error message or nullopt.
    // FR: Vérification structurelle d'un anneau ; retourne un message d'erreur ou nullopt.
    std::optional<std::string> checkRing(const nlohmann::json& ring) const;

    static Ring toRing(const nlohmann::json& ring);
    static bool crossesAntimeridian(const nlohmann::json& ring);
};

} // namespace ARL::Geo
