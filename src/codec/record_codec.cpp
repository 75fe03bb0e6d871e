// EN: Implementation of the RecordCodec.
// FR: Implémentation du RecordCodec.

#include "codec/record_codec.hpp"
#include "infrastructure/logging/logger.hpp"

#include <fstream>
#include <sstream>

namespace ARL {

using Validation::ErrorKind;
using Validation::ValidationError;

namespace {

nlohmann::json timestampOrNull(const std::optional<TimePoint>& tp) {
    return tp ? nlohmann::json(formatTimestamp(*tp)) : nlohmann::json(nullptr);
}

// EN: Null or absent means "no timestamp"; anything else must parse.
// FR: Null ou absent signifie "pas d'horodatage" ; tout le reste doit être parsable.
std::optional<TimePoint> readTimestamp(const nlohmann::json& json, const std::string& key,
                                       std::vector<ValidationError>& errors) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        errors.emplace_back(key, ErrorKind::TYPE_MISMATCH, key + " must be an ISO-8601 string");
        return std::nullopt;
    }
    auto tp = parseTimestamp(it->get<std::string>());
    if (!tp) {
        errors.emplace_back(key, ErrorKind::FORMAT_INVALID, key + " is not an ISO-8601 timestamp");
    }
    return tp;
}

std::string describeErrors(const std::vector<ValidationError>& errors) {
    std::string text;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) text += "; ";
        text += errors[i].message;
    }
    return text;
}

} // namespace

RecordCodec::DecodeResult RecordCodec::fromJson(const nlohmann::json& json) {
    DecodeResult result;
    if (!json.is_object()) {
        result.errors.emplace_back("record", ErrorKind::TYPE_MISMATCH, "record must be a JSON object");
        return result;
    }

    AreaRecord record;

    auto id_it = json.find("id");
    if (id_it == json.end() || id_it->is_null()) {
        result.errors.emplace_back("id", ErrorKind::MISSING, "id is required");
    } else if (id_it->is_string() && !id_it->get_ref<const std::string&>().empty()) {
        record.id = id_it->get<std::string>();
    } else if (id_it->is_number_integer()) {
        record.id = id_it->dump();
    } else {
        result.errors.emplace_back("id", ErrorKind::TYPE_MISMATCH, "id must be a non-empty string or an integer");
    }

    auto tags_it = json.find("tags");
    if (tags_it != json.end() && !tags_it->is_null()) {
        if (!tags_it->is_object()) {
            result.errors.emplace_back("tags", ErrorKind::TYPE_MISMATCH, "tags must be a JSON object");
        } else {
            for (const auto& [key, value] : tags_it->items()) {
                record.tags[key] = value;
            }
        }
    }

    // EN: Type comes from the record itself, else from tags.type as the external API stores it.
    // FR: Le type vient de l'enregistrement, sinon de tags.type comme l'API externe le stocke.
    const nlohmann::json* type_value = nullptr;
    auto type_it = json.find("type");
    if (type_it != json.end() && type_it->is_string()) {
        type_value = &*type_it;
    } else if (auto tag_type = record.tags.find("type"); tag_type != record.tags.end() && tag_type->second.is_string()) {
        type_value = &tag_type->second;
    }

    if (!type_value) {
        result.errors.emplace_back("type", ErrorKind::MISSING, "area type is required");
    } else if (auto type = parseAreaType(type_value->get<std::string>())) {
        record.type = *type;
    } else {
        result.errors.emplace_back("type", ErrorKind::NOT_ALLOWED,
                                   "area type must be community or country, got " + type_value->get<std::string>());
    }

    record.created_at = readTimestamp(json, "created_at", result.errors);
    record.updated_at = readTimestamp(json, "updated_at", result.errors);
    record.deleted_at = readTimestamp(json, "deleted_at", result.errors);

    if (result.errors.empty()) {
        result.record = std::move(record);
    }
    return result;
}

nlohmann::json RecordCodec::toJson(const AreaRecord& record) {
    nlohmann::json json;
    json["id"] = record.id;
    json["type"] = areaTypeToString(record.type);
    json["tags"] = nlohmann::json(record.tags);
    json["created_at"] = timestampOrNull(record.created_at);
    json["updated_at"] = timestampOrNull(record.updated_at);
    json["deleted_at"] = timestampOrNull(record.deleted_at);
    return json;
}

nlohmann::json RecordCodec::toJson(const NormalizedRecord& record) {
    return toJson(record.toAreaRecord());
}

nlohmann::json RecordCodec::issueToJson(const Lint::LintIssue& issue) {
    nlohmann::json json;
    json["rule_id"] = issue.rule_id;
    json["rule_name"] = issue.rule_name;
    json["area_id"] = issue.area_id;
    json["severity"] = Lint::severityToString(issue.severity);
    json["message"] = issue.message;
    json["auto_fixable"] = issue.fixable;
    json["fix_action"] = issue.fix_action.empty() ? nlohmann::json(nullptr) : nlohmann::json(issue.fix_action);
    json["current_value"] = issue.current_value ? nlohmann::json(*issue.current_value) : nlohmann::json(nullptr);

    if (issue.extra.is_object()) {
        for (const auto& [key, value] : issue.extra.items()) {
            if (!json.contains(key)) {
                json[key] = value;
            }
        }
    }
    return json;
}

nlohmann::json RecordCodec::errorToJson(const ValidationError& error) {
    return nlohmann::json{
        {"field", error.field},
        {"kind", Validation::errorKindToString(error.kind)},
        {"severity", Validation::severityToString(error.severity)},
        {"message", error.message}
    };
}

nlohmann::json RecordCodec::ruleToJson(const Lint::RuleInfo& rule) {
    return nlohmann::json{
        {"id", rule.id},
        {"name", rule.name},
        {"description", rule.description},
        {"severity", Lint::severityToString(rule.severity)},
        {"auto_fixable", rule.fixable},
        {"fix_action", rule.fix_action.empty() ? nlohmann::json(nullptr) : nlohmann::json(rule.fix_action)}
    };
}

RecordCodec::CorpusLoadResult RecordCodec::loadCorpus(const std::string& text) {
    CorpusLoadResult result;

    auto decode = [&result](const nlohmann::json& json, const std::string& where) {
        DecodeResult decoded = fromJson(json);
        if (decoded.ok()) {
            result.records.push_back(std::move(*decoded.record));
        } else {
            result.problems.push_back(where + ": " + describeErrors(decoded.errors));
        }
    };

    const size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return result;
    }

    if (text[first] == '[') {
        nlohmann::json corpus = nlohmann::json::parse(text, nullptr, false);
        if (corpus.is_discarded() || !corpus.is_array()) {
            result.problems.push_back("corpus is not a valid JSON array");
        } else {
            for (size_t i = 0; i < corpus.size(); ++i) {
                decode(corpus[i], "record " + std::to_string(i + 1));
            }
        }
    } else {
        std::istringstream stream(text);
        std::string line;
        size_t line_number = 0;
        while (std::getline(stream, line)) {
            ++line_number;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            nlohmann::json json = nlohmann::json::parse(line, nullptr, false);
            if (json.is_discarded()) {
                result.problems.push_back("line " + std::to_string(line_number) + ": malformed JSON");
                continue;
            }
            decode(json, "line " + std::to_string(line_number));
        }
    }

    for (const auto& problem : result.problems) {
        LOG_WARN("record_codec", "Skipped corpus entry - " + problem);
    }
    return result;
}

RecordCodec::CorpusLoadResult RecordCodec::loadCorpusFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        CorpusLoadResult result;
        result.problems.push_back("cannot open " + path);
        LOG_ERROR("record_codec", "Cannot open corpus file: " + path);
        return result;
    }
    std::ostringstream content;
    content << file.rdbuf();
    return loadCorpus(content.str());
}

} // namespace ARL
