// EN: Implementation of area record helpers and timestamp parsing.
// FR: Implémentation des utilitaires d'enregistrement de zone et du parsing d'horodatage.

#include "types/area_record.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace ARL {

namespace {

// EN: "YYYY-MM-DDTHH:MM:SS.ffffff+HH:MM" with room for long fractions.
// FR: "YYYY-MM-DDTHH:MM:SS.ffffff+HH:MM" avec de la marge pour les fractions longues.
constexpr size_t kMaxTimestampLength = 40;

} // namespace

std::string areaTypeToString(AreaType type) {
    switch (type) {
        case AreaType::COMMUNITY: return "community";
        case AreaType::COUNTRY:   return "country";
        default:                  return "unknown";
    }
}

std::optional<AreaType> parseAreaType(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "community") return AreaType::COMMUNITY;
    if (lower == "country") return AreaType::COUNTRY;
    return std::nullopt;
}

const nlohmann::json* NormalizedRecord::findTag(const std::string& key) const {
    auto it = fields.find(key);
    if (it != fields.end()) {
        return &it->second;
    }
    auto custom_it = custom_tags.find(key);
    if (custom_it != custom_tags.end()) {
        return &custom_it->second;
    }
    return nullptr;
}

std::optional<std::string> NormalizedRecord::tagString(const std::string& key) const {
    const nlohmann::json* value = findTag(key);
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

NormalizedRecord NormalizedRecord::withTag(const std::string& key, const nlohmann::json& value) const {
    NormalizedRecord copy = *this;
    if (copy.custom_tags.count(key) > 0) {
        copy.custom_tags[key] = value;
    } else {
        copy.fields[key] = value;
    }
    return copy;
}

TagMap NormalizedRecord::allTags() const {
    TagMap merged = custom_tags;
    for (const auto& [key, value] : fields) {
        merged[key] = value;
    }
    return merged;
}

AreaRecord NormalizedRecord::toAreaRecord() const {
    AreaRecord record;
    record.id = id;
    record.type = type;
    record.tags = allTags();
    record.created_at = created_at;
    record.updated_at = updated_at;
    record.deleted_at = deleted_at;
    return record;
}

bool isValidCalendarDate(int year, int month, int day) {
    if (year < 1 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = days_in_month[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        max_day = 29;
    }
    return day <= max_day;
}

std::optional<TimePoint> parseTimestamp(const std::string& text) {
    static const std::regex iso_pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d+))?)?(Z|[+-]\d{2}:?\d{2})?)?$)");

    std::smatch match;
    if (text.size() > kMaxTimestampLength || !std::regex_match(text, match, iso_pattern)) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(match[1].str()) - 1900;
    tm.tm_mon = std::stoi(match[2].str()) - 1;
    tm.tm_mday = std::stoi(match[3].str());
    if (!isValidCalendarDate(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday)) {
        return std::nullopt;
    }

    if (match[4].matched) {
        tm.tm_hour = std::stoi(match[4].str());
        tm.tm_min = std::stoi(match[5].str());
        tm.tm_sec = match[6].matched ? std::stoi(match[6].str()) : 0;
        if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
            return std::nullopt;
        }
    }

    TimePoint tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    if (match[7].matched) {
        std::string fraction = match[7].str().substr(0, 3);
        while (fraction.size() < 3) {
            fraction += '0';
        }
        tp += std::chrono::milliseconds(std::stoi(fraction));
    }

    // EN: Shift local offsets back to UTC.
    // FR: Ramène les décalages locaux en UTC.
    if (match[8].matched && match[8].str() != "Z") {
        std::string offset = match[8].str();
        int sign = offset[0] == '-' ? -1 : 1;
        offset.erase(std::remove(offset.begin(), offset.end(), ':'), offset.end());
        int hours = std::stoi(offset.substr(1, 2));
        int minutes = std::stoi(offset.substr(3, 2));
        tp -= sign * (std::chrono::hours(hours) + std::chrono::minutes(minutes));
    }

    return tp;
}

std::string formatTimestamp(const TimePoint& tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string formatDate(const TimePoint& tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%d");
    return ss.str();
}

} // namespace ARL
