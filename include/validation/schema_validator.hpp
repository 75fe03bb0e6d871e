// EN: Schema Validator for AreaLint - per-area-type field contracts and record normalization
// FR: Validateur de schéma pour AreaLint - contrats de champs par type de zone et normalisation d'enregistrement

#pragma once

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "geo/geometry_normalizer.hpp"
#include "types/area_record.hpp"
#include "validation/field_validator.hpp"
#include "validation/validation_types.hpp"

namespace ARL::Validation {

// EN: Field contract of one area type. Fields keep their declaration order.
// FR: Contrat de champs d'un type de zone. Les champs gardent leur ordre de déclaration.
class AreaSchema {
public:
    AreaSchema(AreaType type, const std::string& name);

    // EN: Add a field. Throws std::invalid_argument on a duplicate key or a second GEOMETRY field.
    // FR: Ajoute un champ. Lance std::invalid_argument sur une clé dupliquée ou un second champ GEOMETRY.
    AreaSchema& addField(const FieldSpec& field);

    const std::vector<FieldSpec>& getFields() const { return fields_; }
    const FieldSpec* getField(const std::string& key) const;
    std::vector<std::string> getRequiredKeys() const;

    AreaType getType() const { return type_; }
    const std::string& getName() const { return name_; }
    void setDescription(const std::string& description) { description_ = description; }
    const std::string& getDescription() const { return description_; }

private:
    AreaType type_;
    std::string name_;
    std::string description_;
    std::vector<FieldSpec> fields_;
    std::unordered_map<std::string, size_t> field_map_;
};

// EN: Validates raw area records against the schema of their type.
//     Every field is checked (no short-circuit) and unknown tags pass through untouched.
// FR: Valide les enregistrements bruts contre le schéma de leur type.
//     Chaque champ est vérifié (sans court-circuit) et les tags inconnus passent sans modification.
class SchemaValidator {
public:
    // EN: Registers the community and country schemas.
    // FR: Enregistre les schémas communauté et pays.
    SchemaValidator();

    void registerSchema(std::unique_ptr<AreaSchema> schema);
    const AreaSchema* getSchema(AreaType type) const;

    // EN: Validate and normalize. `area_km2` is recomputed whenever a valid geometry is present.
    // FR: Valide et normalise. `area_km2` est recalculé dès qu'une géométrie valide est présente.
    SchemaValidationResult validate(const AreaRecord& record) const;

    // EN: Human-readable field listing of a type (kinds, requiredness, allowed values).
    // FR: Liste lisible des champs d'un type (types, obligation, valeurs autorisées).
    std::string describe(AreaType type) const;

private:
    std::map<AreaType, std::unique_ptr<AreaSchema>> schemas_;
    FieldValidator field_validator_;
    Geo::GeometryNormalizer geometry_normalizer_;
};

// EN: Utility functions for schema creation
// FR: Fonctions utilitaires pour création de schéma
namespace SchemaUtils {

    FieldSpec createField(const std::string& key, ValueKind kind, bool required = false,
                          const std::string& description = "");
    FieldSpec createSelectField(const std::string& key, const std::vector<std::string>& values,
                                bool required = false, const std::string& description = "");

    std::unique_ptr<AreaSchema> createCommunitySchema();
    std::unique_ptr<AreaSchema> createCountrySchema();

    // EN: Continent identifiers accepted by the community schema.
    // FR: Identifiants de continent acceptés par le schéma communauté.
    const std::vector<std::string>& continents();

} // namespace SchemaUtils

} // namespace ARL::Validation
