// EN: Implementation of the built-in lint rules.
// FR: Implémentation des règles de lint intégrées.

#include "lint/builtin_rules.hpp"

#include <algorithm>
#include <cctype>

namespace ARL::Lint {

namespace {

constexpr const char* kIconTag = "icon:square";
constexpr const char* kPendingUpload = "pending-upload";
constexpr const char* kVerifiedTag = "verified:date";
constexpr const char* kGeometryTag = "geo_json";
constexpr size_t kMaxExtensionLength = 5;

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

// EN: icon-missing
// FR: icon-missing

IconMissingRule::IconMissingRule() {
    info_.id = "icon-missing";
    info_.name = "Missing Icon";
    info_.description = "No icon:square tag is set for this area";
    info_.severity = Severity::ERROR;
    info_.fixable = false;
}

std::optional<LintIssue> IconMissingRule::evaluate(const NormalizedRecord& record) const {
    auto icon = record.tagString(kIconTag);
    if (!icon || icon->empty() || *icon == kPendingUpload) {
        return makeIssue(record, "No icon is set for this area");
    }
    return std::nullopt;
}

// EN: icon-legacy-url
// FR: icon-legacy-url

IconLegacyUrlRule::IconLegacyUrlRule(const std::string& icon_base_url)
    : icon_base_url_(icon_base_url) {
    info_.id = "icon-legacy-url";
    info_.name = "Legacy Icon URL";
    info_.description = "Icon is not hosted at the standard area icon location";
    info_.severity = Severity::WARNING;
    info_.fixable = true;
    info_.fix_action = "migrate_icon";
}

bool IconLegacyUrlRule::isCanonical(const std::string& area_id, const std::string& icon_url) const {
    const std::string prefix = icon_base_url_ + area_id + ".";
    if (icon_url.size() <= prefix.size() || icon_url.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return std::all_of(icon_url.begin() + static_cast<std::ptrdiff_t>(prefix.size()), icon_url.end(), isWordChar);
}

std::string IconLegacyUrlRule::canonicalUrl(const std::string& area_id, const std::string& current) const {
    std::string path = current.substr(0, current.find_first_of("?#"));
    std::string extension = "png";

    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        std::string candidate = path.substr(dot + 1);
        if (!candidate.empty() && candidate.size() <= kMaxExtensionLength &&
            std::all_of(candidate.begin(), candidate.end(), isWordChar)) {
            std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            extension = candidate == "jpeg" ? "jpg" : candidate;
        }
    }
    return icon_base_url_ + area_id + "." + extension;
}

std::optional<LintIssue> IconLegacyUrlRule::evaluate(const NormalizedRecord& record) const {
    auto icon = record.tagString(kIconTag);
    if (!icon || icon->empty() || *icon == kPendingUpload) {
        return std::nullopt;
    }
    if (isCanonical(record.id, *icon)) {
        return std::nullopt;
    }
    return makeIssue(record, "Icon URL does not match expected format", *icon);
}

std::optional<NormalizedRecord> IconLegacyUrlRule::autofix(const NormalizedRecord& record) const {
    auto icon = record.tagString(kIconTag);
    if (!icon || icon->empty() || *icon == kPendingUpload || isCanonical(record.id, *icon)) {
        return std::nullopt;
    }
    return record.withTag(kIconTag, canonicalUrl(record.id, *icon));
}

// EN: verified-stale
// FR: verified-stale

VerifiedStaleRule::VerifiedStaleRule(int max_age_days, Clock clock)
    : max_age_days_(max_age_days), clock_(std::move(clock)) {
    info_.id = "verified-stale";
    info_.name = "Verification Stale";
    info_.description = "Area has not been verified in over " + std::to_string(max_age_days) + " days";
    info_.severity = Severity::WARNING;
    info_.fixable = true;
    info_.fix_action = "bump_verified";
}

std::optional<LintIssue> VerifiedStaleRule::evaluate(const NormalizedRecord& record) const {
    std::optional<TimePoint> verified;
    std::optional<std::string> current_value;

    auto verified_tag = record.tagString(kVerifiedTag);
    if (verified_tag && !verified_tag->empty()) {
        verified = parseTimestamp(*verified_tag);
        current_value = *verified_tag;
    } else if (record.updated_at) {
        verified = record.updated_at;
        current_value = formatTimestamp(*record.updated_at);
    }

    if (!verified) {
        return makeIssue(record, "No verification date found");
    }

    const TimePoint threshold = clock_() - std::chrono::hours(24) * max_age_days_;
    if (*verified < threshold) {
        return makeIssue(record,
                         "Last verified " + formatDate(*verified) + ", over " + std::to_string(max_age_days_) +
                             " days ago",
                         current_value);
    }
    return std::nullopt;
}

std::optional<NormalizedRecord> VerifiedStaleRule::autofix(const NormalizedRecord& record) const {
    return record.withTag(kVerifiedTag, formatDate(clock_()));
}

// EN: geo-json-missing
// FR: geo-json-missing

GeoJsonMissingRule::GeoJsonMissingRule() {
    info_.id = "geo-json-missing";
    info_.name = "Missing Boundary";
    info_.description = "No geo_json boundary is set, area and country cannot be derived";
    info_.severity = Severity::INFO;
    info_.fixable = false;
}

std::optional<LintIssue> GeoJsonMissingRule::evaluate(const NormalizedRecord& record) const {
    const nlohmann::json* geometry = record.findTag(kGeometryTag);
    if (!geometry || geometry->is_null()) {
        return makeIssue(record, "No boundary geometry is set for this area");
    }
    return std::nullopt;
}

const RuleInfo& urlAliasClashRuleInfo() {
    static const RuleInfo info = [] {
        RuleInfo rule;
        rule.id = "url-alias-clash";
        rule.name = "URL Alias Clash";
        rule.description = "Multiple areas share the same url_alias";
        rule.severity = Severity::ERROR;
        rule.fixable = false;
        return rule;
    }();
    return info;
}

} // namespace ARL::Lint
