// EN: YAML configuration manager for AreaLint - typed sections, env overrides and declarative validation.
// FR: Gestionnaire de configuration YAML pour AreaLint - sections typées, surcharges env et validation déclarative.

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace ARL {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    // EN: String literals must not decay to bool inside the variant.
    // FR: Les littéraux chaîne ne doivent pas se convertir en bool dans le variant.
    ConfigValue(const char* value) : value_(std::string(value)) {}

    // EN: Get value as specific type (throws if type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    template<typename T>
    T asOrDefault(const T& default_value) const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // EN: Merge another section into this one.
    // FR: Fusionne une autre section dans celle-ci.
    void merge(const ConfigSection& other, bool overwrite = true);

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing, environment overrides and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML, surcharges d'environnement et validation.
class ConfigManager {
public:
    // EN: Validation rule for a dotted key ("section.key").
    // FR: Règle de validation pour une clé pointée ("section.clé").
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<ConfigValue> default_value;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file. Existing sections are replaced.
    // FR: Charge la configuration depuis un fichier YAML. Les sections existantes sont remplacées.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply environment variable overrides (PREFIX_SECTION_KEY, e.g. ARL_LINT_CACHE_TTL).
    // FR: Applique les surcharges de variables d'environnement (PREFIXE_SECTION_CLÉ, ex: ARL_LINT_CACHE_TTL).
    size_t loadEnvironmentOverrides(const std::string& prefix = "ARL_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Fill missing keys from rule defaults, then check every rule. Errors are human-readable.
    // FR: Complète les clés manquantes depuis les défauts, puis vérifie chaque règle. Erreurs lisibles.
    bool validate(std::vector<std::string>& errors);

    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;

    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);

    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;

    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void loadYamlLocked(const YAML::Node& yaml);
    ConfigValue parseYamlValue(const YAML::Node& node) const;
    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;
    std::string expandVariables(const std::string& value) const;
    static ConfigValue parseScalarText(const std::string& text);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

// Template specializations
template<>
inline bool ConfigValue::as<bool>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<bool>(*value_);
}

template<>
inline int ConfigValue::as<int>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<int>(*value_);
}

// EN: Integers are accepted where a double is asked for.
// FR: Les entiers sont acceptés là où un double est demandé.
template<>
inline double ConfigValue::as<double>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    if (const int* i = std::get_if<int>(&*value_)) return static_cast<double>(*i);
    return std::get<double>(*value_);
}

template<>
inline std::string ConfigValue::as<std::string>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::string>(*value_);
}

template<>
inline std::vector<std::string> ConfigValue::as<std::vector<std::string>>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::vector<std::string>>(*value_);
}

#define CONFIG_GET(section, key) ARL::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(section, key, value) ARL::ConfigManager::getInstance().set(section, key, ARL::ConfigValue(value))

} // namespace ARL
