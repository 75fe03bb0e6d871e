// EN: Area record types for AreaLint - raw records from the external source and their normalized copies.
// FR: Types d'enregistrements de zone pour AreaLint - enregistrements bruts de la source externe et copies normalisées.

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ARL {

using TimePoint = std::chrono::system_clock::time_point;

// EN: Tag mapping, ordered by key. Values stay untyped JSON until validated.
// FR: Mapping de tags, ordonné par clé. Les valeurs restent du JSON non typé jusqu'à validation.
using TagMap = std::map<std::string, nlohmann::json>;

// EN: Kind of area. Determines which field specs apply.
// FR: Type de zone. Détermine quelles spécifications de champ s'appliquent.
enum class AreaType {
    COMMUNITY,
    COUNTRY
};

std::string areaTypeToString(AreaType type);

// EN: Case-insensitive parse of "community" / "country".
// FR: Parse insensible à la casse de "community" / "country".
std::optional<AreaType> parseAreaType(const std::string& text);

// EN: Raw record as supplied by the external collaborator. Never mutated by the engine.
// FR: Enregistrement brut fourni par le collaborateur externe. Jamais modifié par le moteur.
struct AreaRecord {
    std::string id;
    AreaType type{AreaType::COMMUNITY};
    TagMap tags;
    std::optional<TimePoint> created_at;
    std::optional<TimePoint> updated_at;
    std::optional<TimePoint> deleted_at;

    bool isDeleted() const { return deleted_at.has_value(); }
};

// EN: Record whose known fields hold canonical typed values. Unknown tags are kept apart, untouched.
// FR: Enregistrement dont les champs connus portent des valeurs typées canoniques. Les tags inconnus restent à part, intacts.
struct NormalizedRecord {
    std::string id;
    AreaType type{AreaType::COMMUNITY};
    TagMap fields;        // EN: Validated schema fields / FR: Champs du schéma validés
    TagMap custom_tags;   // EN: Opaque extension tags / FR: Tags d'extension opaques
    std::optional<TimePoint> created_at;
    std::optional<TimePoint> updated_at;
    std::optional<TimePoint> deleted_at;

    bool isDeleted() const { return deleted_at.has_value(); }

    // EN: Look up a tag in fields first, then custom tags. Returns nullptr when absent.
    // FR: Cherche un tag dans les champs puis dans les tags personnalisés. Retourne nullptr si absent.
    const nlohmann::json* findTag(const std::string& key) const;

    // EN: String value of a tag, or nullopt when absent or not a string.
    // FR: Valeur chaîne d'un tag, ou nullopt si absent ou non chaîne.
    std::optional<std::string> tagString(const std::string& key) const;

    // EN: Copy with one tag replaced (kept in whichever bag already holds it, else in fields).
    // FR: Copie avec un tag remplacé (gardé dans le sac qui le contient déjà, sinon dans les champs).
    NormalizedRecord withTag(const std::string& key, const nlohmann::json& value) const;

    // EN: All tags merged (fields win on key collision).
    // FR: Tous les tags fusionnés (les champs l'emportent en cas de collision).
    TagMap allTags() const;

    // EN: Back to a raw record, used to re-validate the output of an auto-fix.
    // FR: Retour à un enregistrement brut, utilisé pour re-valider la sortie d'un auto-fix.
    AreaRecord toAreaRecord() const;
};

// EN: Parse "YYYY-MM-DD" or ISO-8601 "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]". Returns nullopt when malformed.
// FR: Parse "YYYY-MM-DD" ou ISO-8601 "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]". Retourne nullopt si mal formé.
std::optional<TimePoint> parseTimestamp(const std::string& text);

// EN: Format as "YYYY-MM-DDTHH:MM:SSZ" (UTC).
// FR: Formate en "YYYY-MM-DDTHH:MM:SSZ" (UTC).
std::string formatTimestamp(const TimePoint& tp);

// EN: Format as "YYYY-MM-DD" (UTC).
// FR: Formate en "YYYY-MM-DD" (UTC).
std::string formatDate(const TimePoint& tp);

// EN: Calendar check shared by the date validator and the timestamp parser.
// FR: Vérification calendaire partagée par le validateur de date et le parseur d'horodatage.
bool isValidCalendarDate(int year, int month, int day);

} // namespace ARL
