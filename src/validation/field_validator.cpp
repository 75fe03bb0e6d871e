// EN: Implementation of the FieldValidator. One check per value kind, no exceptions for bad input.
// FR: Implémentation du FieldValidator. Une vérification par type de valeur, pas d'exception pour une mauvaise entrée.

#include "validation/field_validator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <regex>
#include <stdexcept>

namespace ARL::Validation {

namespace {

constexpr size_t kMaxIntegerDigits = 10;

// EN: Longest accepted text per kind. Longer values are rejected before any pattern runs.
// FR: Texte le plus long accepté par type. Les valeurs plus longues sont rejetées avant tout motif.
constexpr size_t kMaxNumericTextLength = 32;
constexpr size_t kMaxDateTextLength = 10;
constexpr size_t kMaxUrlLength = 2048;
constexpr size_t kMaxEmailLength = 254;

bool isDigits(const std::string& text, size_t begin, size_t end) {
    return begin < end && std::all_of(text.begin() + begin, text.begin() + end,
                                      [](unsigned char c) { return std::isdigit(c) != 0; });
}

// EN: "-12" or "-12.5".
// FR: "-12" ou "-12.5".
bool isNegativeDecimal(const std::string& text) {
    if (text.size() < 2 || text[0] != '-') {
        return false;
    }
    size_t dot = text.find('.');
    if (dot == std::string::npos) {
        return isDigits(text, 1, text.size());
    }
    return isDigits(text, 1, dot) && isDigits(text, dot + 1, text.size());
}

std::string stripLeadingZeros(const std::string& digits) {
    size_t first = digits.find_first_not_of('0');
    return first == std::string::npos ? std::string("0") : digits.substr(first);
}

// EN: Cents from an unsigned decimal split in integer and fraction digits. Half-up on the third decimal.
// FR: Centimes depuis un décimal non signé découpé en partie entière et fraction. Demi supérieur sur la 3e décimale.
int64_t centsFromDecimal(const std::string& int_digits, const std::string& frac_digits) {
    int64_t cents = std::stoll(stripLeadingZeros(int_digits)) * 100;
    if (frac_digits.size() > 0) cents += (frac_digits[0] - '0') * 10;
    if (frac_digits.size() > 1) cents += frac_digits[1] - '0';
    if (frac_digits.size() > 2 && frac_digits[2] >= '5') cents += 1;
    return cents;
}

bool hasNonZeroDigit(const std::string& digits) {
    return digits.find_first_not_of('0') != std::string::npos;
}

std::string describe(const nlohmann::json& raw) {
    std::string text = raw.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() > 64) {
        text = text.substr(0, 61) + "...";
    }
    return text;
}

} // namespace

double roundHalfUp2(double value) {
    if (!std::isfinite(value)) {
        return value;
    }
    if (value < 0) {
        return -roundHalfUp2(-value);
    }
    if (value >= 1e15) {
        return value;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.10f", value);
    std::string text(buffer);
    size_t dot = text.find('.');
    std::string int_digits = dot == std::string::npos ? text : text.substr(0, dot);
    std::string frac_digits = dot == std::string::npos ? std::string() : text.substr(dot + 1);
    return static_cast<double>(centsFromDecimal(int_digits, frac_digits)) / 100.0;
}

FieldResult FieldValidator::validate(const std::string& field, ValueKind kind, const nlohmann::json& raw,
                                     const std::vector<std::string>& allowed_values) const {
    FieldResult result;
    switch (kind) {
        case ValueKind::TEXT:    result = validateText(field, raw); break;
        case ValueKind::INTEGER: result = validateInteger(field, raw); break;
        case ValueKind::NUMBER:  result = validateNumber(field, raw); break;
        case ValueKind::DATE:    result = validateDate(field, raw); break;
        case ValueKind::URL:     result = validateUrl(field, raw); break;
        case ValueKind::EMAIL:   result = validateEmail(field, raw); break;
        case ValueKind::PHONE:   result = validatePhone(field, raw); break;
        case ValueKind::SELECT:  result = validateSelect(field, raw, allowed_values); break;
        case ValueKind::GEOMETRY:
            throw std::invalid_argument("Geometry field '" + field + "' must go through GeometryNormalizer");
    }

    if (result.error) {
        LOG_DEBUG("field_validator", "Field " + field + " rejected: " + result.error->message);
    }
    return result;
}

FieldResult FieldValidator::validateText(const std::string& field, const nlohmann::json& raw) const {
    auto text = trimmedString(raw);
    if (!text) {
        return typeMismatch(field, "text", raw);
    }
    if (text->empty()) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID, field + " must not be empty"});
    }
    return FieldResult::success(*text);
}

// EN: JSON integers, integral floats and digit strings; negatives and values above the bound are OUT_OF_RANGE.
// FR: Entiers JSON, flottants entiers et chaînes de chiffres ; négatifs et valeurs au-delà de la borne en OUT_OF_RANGE.
FieldResult FieldValidator::validateInteger(const std::string& field, const nlohmann::json& raw) const {
    const std::string range_message =
        field + " must be between 0 and " + std::to_string(kMaxNumericValue);

    if (raw.is_number_unsigned()) {
        uint64_t value = raw.get<uint64_t>();
        if (value > static_cast<uint64_t>(kMaxNumericValue)) {
            return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
        }
        return FieldResult::success(static_cast<int64_t>(value));
    }

    if (raw.is_number_integer()) {
        int64_t value = raw.get<int64_t>();
        if (value < 0 || value > kMaxNumericValue) {
            return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
        }
        return FieldResult::success(value);
    }

    if (raw.is_number_float()) {
        double value = raw.get<double>();
        if (!std::isfinite(value)) {
            return typeMismatch(field, "integer", raw);
        }
        if (value < 0 || value > static_cast<double>(kMaxNumericValue)) {
            return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
        }
        if (std::floor(value) != value) {
            return typeMismatch(field, "integer", raw);
        }
        return FieldResult::success(static_cast<int64_t>(value));
    }

    auto text = trimmedString(raw);
    if (!text) {
        return typeMismatch(field, "integer", raw);
    }

    if (isNegativeDecimal(*text)) {
        return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
    }
    if (!isDigits(*text, 0, text->size())) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID,
                                     field + " must be a whole number, got " + describe(raw)});
    }

    std::string digits = stripLeadingZeros(*text);
    if (digits.size() > kMaxIntegerDigits) {
        return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
    }
    int64_t value = std::stoll(digits);
    if (value > kMaxNumericValue) {
        return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
    }
    return FieldResult::success(value);
}

// EN: Digits with at most one decimal point, 0..1e9, rounded half-up to 2 decimals.
// FR: Chiffres avec au plus un point décimal, 0..1e9, arrondi au demi supérieur à 2 décimales.
FieldResult FieldValidator::validateNumber(const std::string& field, const nlohmann::json& raw) const {
    const std::string range_message =
        field + " must be between 0 and " + std::to_string(kMaxNumericValue);

    if (raw.is_number()) {
        double value = raw.get<double>();
        if (!std::isfinite(value)) {
            return typeMismatch(field, "number", raw);
        }
        if (value < 0 || value > static_cast<double>(kMaxNumericValue)) {
            return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
        }
        return FieldResult::success(roundHalfUp2(value));
    }

    auto text = trimmedString(raw);
    if (!text) {
        return typeMismatch(field, "number", raw);
    }

    if (text->size() > kMaxNumericTextLength) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID,
                                     field + " must be a decimal number, got " + describe(raw)});
    }

    static const std::regex decimal_pattern(R"(^(-?)(\d*)(?:\.(\d*))?$)");
    std::smatch match;
    if (!std::regex_match(*text, match, decimal_pattern) ||
        (match[2].length() == 0 && match[3].length() == 0)) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID,
                                     field + " must be a decimal number, got '" + *text + "'"});
    }

    const std::string int_digits = match[2].length() > 0 ? match[2].str() : std::string("0");
    const std::string frac_digits = match[3].str();

    if (match[1].length() > 0 && (hasNonZeroDigit(int_digits) || hasNonZeroDigit(frac_digits))) {
        return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
    }

    const std::string significant = stripLeadingZeros(int_digits);
    if (significant.size() > kMaxIntegerDigits) {
        return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
    }
    int64_t whole = std::stoll(significant);
    if (whole > kMaxNumericValue || (whole == kMaxNumericValue && hasNonZeroDigit(frac_digits))) {
        return FieldResult::failure({field, ErrorKind::OUT_OF_RANGE, range_message});
    }

    return FieldResult::success(static_cast<double>(centsFromDecimal(int_digits, frac_digits)) / 100.0);
}

FieldResult FieldValidator::validateDate(const std::string& field, const nlohmann::json& raw) const {
    auto text = trimmedString(raw);
    if (!text) {
        return typeMismatch(field, "date", raw);
    }

    static const std::regex date_pattern(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch match;
    if (text->size() != kMaxDateTextLength || !std::regex_match(*text, match, date_pattern)) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID,
                                     field + " must be a date formatted YYYY-MM-DD"});
    }
    if (!isValidCalendarDate(std::stoi(match[1].str()), std::stoi(match[2].str()), std::stoi(match[3].str()))) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID,
                                     field + " is not a real calendar date: " + *text});
    }
    return FieldResult::success(*text);
}

FieldResult FieldValidator::validateUrl(const std::string& field, const nlohmann::json& raw) const {
    auto text = trimmedString(raw);
    if (!text) {
        return typeMismatch(field, "url", raw);
    }

    static const std::regex url_pattern(R"(^[A-Za-z][A-Za-z0-9+.\-]*://[^/?#\s]+([/?#]\S*)?$)");
    if (text->size() > kMaxUrlLength || !std::regex_match(*text, url_pattern)) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID,
                                     field + " must be a URL with scheme and host"});
    }
    return FieldResult::success(*text);
}

FieldResult FieldValidator::validateEmail(const std::string& field, const nlohmann::json& raw) const {
    auto text = trimmedString(raw);
    if (!text) {
        return typeMismatch(field, "email", raw);
    }

    static const std::regex email_pattern(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
    bool ascii = std::all_of(text->begin(), text->end(),
                             [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    if (!ascii || text->size() > kMaxEmailLength || !std::regex_match(*text, email_pattern)) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID, field + " must be an email address"});
    }
    return FieldResult::success(*text);
}

// EN: Formatting punctuation is stripped and the compact form is returned.
// FR: La ponctuation de formatage est retirée et la forme compacte est retournée.
FieldResult FieldValidator::validatePhone(const std::string& field, const nlohmann::json& raw) const {
    auto text = trimmedString(raw);
    if (!text) {
        return typeMismatch(field, "phone", raw);
    }

    std::string compact;
    for (char c : *text) {
        if (c == ' ' || c == '-' || c == '(' || c == ')' || c == '.' || c == '/') {
            continue;
        }
        compact += c;
    }

    static const std::regex phone_pattern(R"(^\+?\d{9,15}$)");
    if (!std::regex_match(compact, phone_pattern)) {
        return FieldResult::failure({field, ErrorKind::FORMAT_INVALID,
                                     field + " must hold 9 to 15 digits with an optional leading +"});
    }
    return FieldResult::success(compact);
}

FieldResult FieldValidator::validateSelect(const std::string& field, const nlohmann::json& raw,
                                           const std::vector<std::string>& allowed_values) const {
    auto text = trimmedString(raw);
    if (!text) {
        return typeMismatch(field, "select", raw);
    }

    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };

    const std::string needle = lower(*text);
    for (const auto& allowed : allowed_values) {
        if (lower(allowed) == needle) {
            return FieldResult::success(allowed);
        }
    }

    std::string message = field + " must be one of: ";
    for (size_t i = 0; i < allowed_values.size(); ++i) {
        if (i > 0) message += ", ";
        message += allowed_values[i];
    }
    return FieldResult::failure({field, ErrorKind::NOT_ALLOWED, message});
}

std::optional<std::string> FieldValidator::trimmedString(const nlohmann::json& raw) {
    if (!raw.is_string()) {
        return std::nullopt;
    }
    const std::string& text = raw.get_ref<const std::string&>();
    const char* whitespace = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

FieldResult FieldValidator::typeMismatch(const std::string& field, const std::string& expected,
                                         const nlohmann::json& raw) {
    return FieldResult::failure({field, ErrorKind::TYPE_MISMATCH,
                                 field + " expects " + expected + ", got " + describe(raw)});
}

} // namespace ARL::Validation
