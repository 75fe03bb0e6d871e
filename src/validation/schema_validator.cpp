// EN: Implementation of the SchemaValidator and the built-in area schemas.
// FR: Implémentation du SchemaValidator et des schémas de zone intégrés.

#include "validation/schema_validator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace ARL::Validation {

// EN: AreaSchema implementation
// FR: Implémentation d'AreaSchema

AreaSchema::AreaSchema(AreaType type, const std::string& name)
    : type_(type), name_(name) {}

AreaSchema& AreaSchema::addField(const FieldSpec& field) {
    if (field_map_.count(field.key) > 0) {
        throw std::invalid_argument("Duplicate field '" + field.key + "' in schema " + name_);
    }
    if (field.kind == ValueKind::GEOMETRY) {
        for (const auto& existing : fields_) {
            if (existing.kind == ValueKind::GEOMETRY) {
                throw std::invalid_argument("Schema " + name_ + " already has a geometry field: " + existing.key);
            }
        }
    }
    field_map_[field.key] = fields_.size();
    fields_.push_back(field);
    return *this;
}

const FieldSpec* AreaSchema::getField(const std::string& key) const {
    auto it = field_map_.find(key);
    return it != field_map_.end() ? &fields_[it->second] : nullptr;
}

std::vector<std::string> AreaSchema::getRequiredKeys() const {
    std::vector<std::string> keys;
    for (const auto& field : fields_) {
        if (field.required) {
            keys.push_back(field.key);
        }
    }
    return keys;
}

// EN: SchemaValidator implementation
// FR: Implémentation de SchemaValidator

SchemaValidator::SchemaValidator() {
    registerSchema(SchemaUtils::createCommunitySchema());
    registerSchema(SchemaUtils::createCountrySchema());
}

void SchemaValidator::registerSchema(std::unique_ptr<AreaSchema> schema) {
    if (!schema) {
        throw std::invalid_argument("Cannot register a null schema");
    }
    const AreaType type = schema->getType();
    LOG_DEBUG("schema_validator", "Registered schema " + schema->getName() + " with " +
                                  std::to_string(schema->getFields().size()) + " fields");
    schemas_[type] = std::move(schema);
}

const AreaSchema* SchemaValidator::getSchema(AreaType type) const {
    auto it = schemas_.find(type);
    return it != schemas_.end() ? it->second.get() : nullptr;
}

SchemaValidationResult SchemaValidator::validate(const AreaRecord& record) const {
    SchemaValidationResult result;

    const AreaSchema* schema = getSchema(record.type);
    if (!schema) {
        result.errors.emplace_back("type", ErrorKind::NOT_ALLOWED,
                                   "No schema registered for area type " + areaTypeToString(record.type));
        return result;
    }

    NormalizedRecord normalized;
    normalized.id = record.id;
    normalized.type = record.type;
    normalized.created_at = record.created_at;
    normalized.updated_at = record.updated_at;
    normalized.deleted_at = record.deleted_at;

    std::optional<double> derived_area;

    // EN: Check every declared field, collecting all errors.
    // FR: Vérifie chaque champ déclaré en collectant toutes les erreurs.
    for (const auto& spec : schema->getFields()) {
        auto it = record.tags.find(spec.key);
        if (it == record.tags.end() || it->second.is_null()) {
            if (spec.required) {
                result.errors.emplace_back(spec.key, ErrorKind::MISSING, spec.key + " is required");
            }
            continue;
        }

        if (spec.kind == ValueKind::GEOMETRY) {
            Geo::GeometryResult geometry = geometry_normalizer_.normalize(it->second, spec.key);
            result.warnings.insert(result.warnings.end(), geometry.warnings.begin(), geometry.warnings.end());
            if (!geometry.ok()) {
                result.errors.push_back(*geometry.error);
                continue;
            }
            normalized.fields[spec.key] = std::move(*geometry.geometry);
            derived_area = geometry.area_km2;
            continue;
        }

        FieldResult field = field_validator_.validate(spec, it->second);
        if (!field.ok()) {
            result.errors.push_back(*field.error);
            continue;
        }
        normalized.fields[spec.key] = std::move(*field.value);
    }

    // EN: Tags outside the schema are kept verbatim.
    // FR: Les tags hors schéma sont gardés tels quels.
    for (const auto& [key, value] : record.tags) {
        if (!schema->getField(key)) {
            normalized.custom_tags[key] = value;
        }
    }

    // EN: Geometry and area never disagree.
    // FR: Géométrie et surface ne divergent jamais.
    if (derived_area) {
        normalized.fields["area_km2"] = *derived_area;

        // EN: A supplied area_km2 is replaced anyway, so its problems only warn.
        // FR: Un area_km2 fourni est remplacé de toute façon, ses problèmes ne font qu'avertir.
        auto supplied = std::stable_partition(result.errors.begin(), result.errors.end(),
                                              [](const ValidationError& error) { return error.field != "area_km2"; });
        for (auto it = supplied; it != result.errors.end(); ++it) {
            it->severity = ValidationError::Severity::WARNING;
            it->message += " (replaced by the area derived from geo_json)";
            result.warnings.push_back(*it);
        }
        result.errors.erase(supplied, result.errors.end());
    }

    result.is_valid = result.errors.empty();
    if (result.is_valid) {
        result.record = std::move(normalized);
    }

    LOG_DEBUG("schema_validator", "Area " + record.id + " (" + schema->getName() + "): " +
                                  std::to_string(result.errors.size()) + " error(s), " +
                                  std::to_string(result.warnings.size()) + " warning(s)");
    return result;
}

std::string SchemaValidator::describe(AreaType type) const {
    const AreaSchema* schema = getSchema(type);
    if (!schema) {
        return "Schema not found: " + areaTypeToString(type);
    }

    std::ostringstream doc;
    doc << "=== Schema Documentation ===\n";
    doc << "Name: " << schema->getName() << "\n";
    doc << "Area Type: " << areaTypeToString(schema->getType()) << "\n";
    doc << "Description: " << schema->getDescription() << "\n";

    doc << "\n=== Fields ===\n";
    for (const auto& field : schema->getFields()) {
        doc << "Field: " << field.key << "\n";
        doc << "  Kind: " << valueKindToString(field.kind) << "\n";
        doc << "  Required: " << (field.required ? "Yes" : "No") << "\n";
        if (!field.allowed_values.empty()) {
            doc << "  Allowed: ";
            for (size_t i = 0; i < field.allowed_values.size(); ++i) {
                if (i > 0) doc << ", ";
                doc << field.allowed_values[i];
            }
            doc << "\n";
        }
        if (!field.description.empty()) {
            doc << "  Description: " << field.description << "\n";
        }
        doc << "\n";
    }
    return doc.str();
}

// EN: Schema utility functions
// FR: Fonctions utilitaires de schéma
namespace SchemaUtils {

FieldSpec createField(const std::string& key, ValueKind kind, bool required, const std::string& description) {
    FieldSpec field;
    field.key = key;
    field.kind = kind;
    field.required = required;
    field.description = description;
    return field;
}

FieldSpec createSelectField(const std::string& key, const std::vector<std::string>& values, bool required,
                            const std::string& description) {
    FieldSpec field = createField(key, ValueKind::SELECT, required, description);
    field.allowed_values = values;
    return field;
}

const std::vector<std::string>& continents() {
    static const std::vector<std::string> values = {
        "africa", "asia", "europe", "north-america", "oceania", "south-america"
    };
    return values;
}

std::unique_ptr<AreaSchema> createCommunitySchema() {
    auto schema = std::make_unique<AreaSchema>(AreaType::COMMUNITY, "community");
    schema->setDescription("Local bitcoin community with a mapped boundary");

    schema->addField(createField("name", ValueKind::TEXT, true, "Display name"));
    schema->addField(createField("population", ValueKind::INTEGER, true, "Number of inhabitants"));
    schema->addField(createField("population:date", ValueKind::DATE, true, "Date of the population figure"));
    schema->addField(createField("url_alias", ValueKind::TEXT, false, "Unique slug used in URLs"));
    schema->addField(createSelectField("continent", continents(), false));
    schema->addField(createField("icon:square", ValueKind::TEXT, false, "Square icon URL"));
    schema->addField(createField("area_km2", ValueKind::NUMBER, false, "Derived from geo_json when present"));
    schema->addField(createField("organization", ValueKind::TEXT));
    schema->addField(createField("language", ValueKind::TEXT));
    schema->addField(createField("contact:nostr", ValueKind::TEXT));
    schema->addField(createField("tips:lightning_address", ValueKind::TEXT));
    schema->addField(createField("description", ValueKind::TEXT));
    schema->addField(createField("contact:email", ValueKind::EMAIL));
    schema->addField(createField("contact:phone", ValueKind::PHONE));

    for (const char* channel : {"twitter", "website", "telegram", "signal", "whatsapp", "meetup", "discord",
                                "instagram", "youtube", "facebook", "linkedin", "rss", "github", "matrix",
                                "geyser"}) {
        schema->addField(createField(std::string("contact:") + channel, ValueKind::URL));
    }

    schema->addField(createField("geo_json", ValueKind::GEOMETRY, false, "GeoJSON Polygon or MultiPolygon boundary"));
    return schema;
}

std::unique_ptr<AreaSchema> createCountrySchema() {
    auto schema = std::make_unique<AreaSchema>(AreaType::COUNTRY, "country");
    schema->setDescription("Country boundary used to locate communities");

    schema->addField(createField("name", ValueKind::TEXT, true, "Display name"));
    schema->addField(createField("population", ValueKind::INTEGER));
    schema->addField(createField("area_km2", ValueKind::NUMBER, false, "Derived from geo_json when present"));
    schema->addField(createField("capital", ValueKind::TEXT));
    schema->addField(createField("url_alias", ValueKind::TEXT, false, "Unique slug used in URLs"));
    schema->addField(createField("icon:square", ValueKind::TEXT, false, "Square icon URL"));
    schema->addField(createField("geo_json", ValueKind::GEOMETRY, false, "GeoJSON Polygon or MultiPolygon boundary"));
    return schema;
}

} // namespace SchemaUtils

} // namespace ARL::Validation
