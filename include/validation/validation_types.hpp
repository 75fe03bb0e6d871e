// EN: Shared validation types for AreaLint - field kinds, field specs and validation errors.
// FR: Types de validation partagés pour AreaLint - types de champ, spécifications et erreurs de validation.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types/area_record.hpp"

namespace ARL::Validation {

// EN: Value kinds a field can declare
// FR: Types de valeur qu'un champ peut déclarer
enum class ValueKind {
    TEXT,       // EN: Non-empty trimmed string / FR: Chaîne non vide après trim
    INTEGER,    // EN: 0..1e9, integer or digit string / FR: 0..1e9, entier ou chaîne de chiffres
    NUMBER,     // EN: 0..1e9, rounded to 2 decimals / FR: 0..1e9, arrondi à 2 décimales
    DATE,       // EN: YYYY-MM-DD calendar date / FR: Date calendaire YYYY-MM-DD
    URL,        // EN: scheme://authority... / FR: schéma://autorité...
    EMAIL,      // EN: Pragmatic email address / FR: Adresse email pragmatique
    PHONE,      // EN: 9 to 15 digits, optional leading + / FR: 9 à 15 chiffres, + initial optionnel
    SELECT,     // EN: One of the allowed values / FR: Une des valeurs autorisées
    GEOMETRY    // EN: GeoJSON Polygon or MultiPolygon / FR: Polygon ou MultiPolygon GeoJSON
};

// EN: Failure kinds, one per validation outcome
// FR: Types d'échec, un par résultat de validation
enum class ErrorKind {
    MISSING,
    TYPE_MISMATCH,
    OUT_OF_RANGE,
    FORMAT_INVALID,
    GEOMETRY_INVALID,
    NOT_ALLOWED
};

std::string valueKindToString(ValueKind kind);
std::string errorKindToString(ErrorKind kind);

// EN: Field-level validation error. Only ERROR severity rejects a record.
// FR: Erreur de validation au niveau du champ. Seule la sévérité ERROR rejette un enregistrement.
struct ValidationError {
    enum class Severity {
        WARNING,    // EN: Suspicious but accepted / FR: Suspect mais accepté
        ERROR       // EN: Rejects the record / FR: Rejette l'enregistrement
    };

    std::string field;
    ErrorKind kind{ErrorKind::FORMAT_INVALID};
    std::string message;
    Severity severity{Severity::ERROR};

    ValidationError() = default;
    ValidationError(const std::string& field_name, ErrorKind error_kind, const std::string& msg,
                    Severity sev = Severity::ERROR)
        : field(field_name), kind(error_kind), message(msg), severity(sev) {}

    bool isError() const { return severity == Severity::ERROR; }
};

std::string severityToString(ValidationError::Severity severity);

// EN: Immutable per-type field declaration.
// FR: Déclaration de champ immuable par type.
struct FieldSpec {
    std::string key;
    ValueKind kind{ValueKind::TEXT};
    bool required{false};
    std::vector<std::string> allowed_values;   // EN: SELECT only, matched case-insensitively / FR: SELECT seulement, comparé sans casse
    std::string description;
};

// EN: Outcome of a single field check: a canonical value or an error.
// FR: Résultat d'une vérification de champ : une valeur canonique ou une erreur.
struct FieldResult {
    std::optional<nlohmann::json> value;
    std::optional<ValidationError> error;

    bool ok() const { return value.has_value(); }

    static FieldResult success(nlohmann::json normalized) {
        FieldResult result;
        result.value = std::move(normalized);
        return result;
    }

    static FieldResult failure(ValidationError err) {
        FieldResult result;
        result.error = std::move(err);
        return result;
    }
};

// EN: Outcome of a schema run. `record` is set only when no ERROR was found.
// FR: Résultat d'une validation de schéma. `record` n'est défini que sans ERROR.
struct SchemaValidationResult {
    bool is_valid{false};
    std::optional<NormalizedRecord> record;
    std::vector<ValidationError> errors;     // EN: ERROR severity, in field order / FR: Sévérité ERROR, dans l'ordre des champs
    std::vector<ValidationError> warnings;   // EN: WARNING severity / FR: Sévérité WARNING
};

} // namespace ARL::Validation
