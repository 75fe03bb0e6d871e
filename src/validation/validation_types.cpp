// EN: String conversions for validation enums.
// FR: Conversions en chaîne pour les énumérations de validation.

#include "validation/validation_types.hpp"

namespace ARL::Validation {

std::string valueKindToString(ValueKind kind) {
    switch (kind) {
        case ValueKind::TEXT:     return "text";
        case ValueKind::INTEGER:  return "integer";
        case ValueKind::NUMBER:   return "number";
        case ValueKind::DATE:     return "date";
        case ValueKind::URL:      return "url";
        case ValueKind::EMAIL:    return "email";
        case ValueKind::PHONE:    return "phone";
        case ValueKind::SELECT:   return "select";
        case ValueKind::GEOMETRY: return "geometry";
        default:                  return "unknown";
    }
}

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MISSING:          return "Missing";
        case ErrorKind::TYPE_MISMATCH:    return "TypeMismatch";
        case ErrorKind::OUT_OF_RANGE:     return "OutOfRange";
        case ErrorKind::FORMAT_INVALID:   return "FormatInvalid";
        case ErrorKind::GEOMETRY_INVALID: return "GeometryInvalid";
        case ErrorKind::NOT_ALLOWED:      return "NotAllowed";
        default:                          return "Unknown";
    }
}

std::string severityToString(ValidationError::Severity severity) {
    return severity == ValidationError::Severity::WARNING ? "warning" : "error";
}

} // namespace ARL::Validation
