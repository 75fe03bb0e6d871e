// EN: Record codec for AreaLint - external API JSON shape to area records and results back to JSON
// FR: Codec d'enregistrements pour AreaLint - forme JSON de l'API externe vers enregistrements et résultats vers JSON

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lint/lint_rule.hpp"
#include "types/area_record.hpp"
#include "validation/validation_types.hpp"

namespace ARL {

class RecordCodec {
public:
    // EN: Decoded record or the reasons it could not be decoded. Never throws for bad input.
    // FR: Enregistrement décodé ou les raisons de l'échec. Ne lève jamais pour une mauvaise entrée.
    struct DecodeResult {
        std::optional<AreaRecord> record;
        std::vector<Validation::ValidationError> errors;

        bool ok() const { return record.has_value(); }
    };

    // EN: Records of a corpus plus one human-readable line per skipped entry.
    // FR: Enregistrements d'un corpus plus une ligne lisible par entrée ignorée.
    struct CorpusLoadResult {
        std::vector<AreaRecord> records;
        std::vector<std::string> problems;
    };

    // EN: {id, type | tags.type, tags, created_at, updated_at, deleted_at}. Timestamps are ISO-8601.
    // FR: {id, type | tags.type, tags, created_at, updated_at, deleted_at}. Horodatages ISO-8601.
    static DecodeResult fromJson(const nlohmann::json& json);

    static nlohmann::json toJson(const AreaRecord& record);
    static nlohmann::json toJson(const NormalizedRecord& record);
    static nlohmann::json issueToJson(const Lint::LintIssue& issue);
    static nlohmann::json errorToJson(const Validation::ValidationError& error);
    static nlohmann::json ruleToJson(const Lint::RuleInfo& rule);

    // EN: A JSON array of records, or NDJSON (one record per line). Malformed entries are reported and skipped.
    // FR: Un tableau JSON d'enregistrements, ou du NDJSON (un par ligne). Les entrées mal formées sont signalées et ignorées.
    static CorpusLoadResult loadCorpus(const std::string& text);
    static CorpusLoadResult loadCorpusFile(const std::string& path);
};

} // namespace ARL
