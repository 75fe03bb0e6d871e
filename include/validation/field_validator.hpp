// EN: Field Validator for AreaLint - type-specific checks turning raw tag values into canonical values
// FR: Validateur de champ pour AreaLint - vérifications par type transformant les valeurs brutes en valeurs canoniques

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "validation/validation_types.hpp"

namespace ARL::Validation {

// EN: Upper bound shared by INTEGER and NUMBER fields.
// FR: Borne supérieure partagée par les champs INTEGER et NUMBER.
constexpr int64_t kMaxNumericValue = 1000000000;

// EN: Round half-up to 2 decimals. Works on the decimal text so 0.125 gives 0.13.
// FR: Arrondi au demi supérieur à 2 décimales. Travaille sur le texte décimal donc 0.125 donne 0.13.
double roundHalfUp2(double value);

// EN: Stateless validator for one key/value pair. Malformed input always yields a ValidationError.
// FR: Validateur sans état pour une paire clé/valeur. Une entrée mal formée donne toujours une ValidationError.
class FieldValidator {
public:
    FieldValidator() = default;

    // EN: Validate `raw` as `kind`. `field` names the error. GEOMETRY is rejected with std::invalid_argument.
    // FR: Valide `raw` comme `kind`. `field` nomme l'erreur. GEOMETRY est rejeté avec std::invalid_argument.
    FieldResult validate(const std::string& field, ValueKind kind, const nlohmann::json& raw,
                         const std::vector<std::string>& allowed_values = {}) const;

    FieldResult validate(const FieldSpec& spec, const nlohmann::json& raw) const {
        return validate(spec.key, spec.kind, raw, spec.allowed_values);
    }

private:
    FieldResult validateText(const std::string& field, const nlohmann::json& raw) const;
    FieldResult validateInteger(const std::string& field, const nlohmann::json& raw) const;
    FieldResult validateNumber(const std::string& field, const nlohmann::json& raw) const;
    FieldResult validateDate(const std::string& field, const nlohmann::json& raw) const;
    FieldResult validateUrl(const std::string& field, const nlohmann::json& raw) const;
    FieldResult validateEmail(const std::string& field, const nlohmann::json& raw) const;
    FieldResult validatePhone(const std::string& field, const nlohmann::json& raw) const;
    FieldResult validateSelect(const std::string& field, const nlohmann::json& raw,
                               const std::vector<std::string>& allowed_values) const;

    // EN: Non-string values fail with TYPE_MISMATCH; strings are returned trimmed.
    // FR: Les valeurs non chaîne échouent en TYPE_MISMATCH ; les chaînes sont retournées sans espaces.
    static std::optional<std::string> trimmedString(const nlohmann::json& raw);
    static FieldResult typeMismatch(const std::string& field, const std::string& expected,
                                    const nlohmann::json& raw);
};

} // namespace ARL::Validation
