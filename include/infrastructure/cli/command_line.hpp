// EN: Command line parser for AreaLint - option table, command dispatch and configuration overrides
// FR: Parseur de ligne de commande pour AreaLint - table d'options, répartition des commandes et surcharges de configuration

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace ARL {
namespace CLI {

// EN: CLI option value types
// FR: Types de valeur des options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Flag without value / FR: Drapeau sans valeur
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING          // EN: String value / FR: Valeur chaîne
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,
    HELP_REQUESTED,
    VERSION_REQUESTED,
    INVALID_OPTION,     // EN: Unknown option / FR: Option inconnue
    MISSING_VALUE,      // EN: Option value missing / FR: Valeur d'option manquante
    INVALID_VALUE,      // EN: Value rejected by type or enum check / FR: Valeur rejetée par le type ou l'énumération
    MISSING_COMMAND     // EN: No command given / FR: Aucune commande fournie
};

std::string cliParseStatusToString(CliParseStatus status);

// EN: CLI option definition
// FR: Définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                  // EN: Without leading dashes / FR: Sans tirets initiaux
    std::optional<char> short_name;
    CliOptionType type = CliOptionType::STRING;
    std::string description;
    std::string value_name = "VALUE";       // EN: Placeholder in help / FR: Espace réservé dans l'aide
    std::string config_path;                // EN: "section.key" override target, empty for none / FR: Cible "section.key", vide sinon
    std::set<std::string> enum_values;      // EN: Allowed values, empty for any / FR: Valeurs permises, vide pour toutes
    bool repeatable = false;
    std::string category = "General";
};

// EN: Parsed command line
// FR: Ligne de commande analysée
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::string command;
    std::vector<std::string> positionals;                       // EN: Arguments after the command / FR: Arguments après la commande
    std::map<std::string, std::vector<std::string>> values;     // EN: Long name -> raw values / FR: Nom long -> valeurs brutes
    std::unordered_map<std::string, ConfigValue> overrides;     // EN: "section.key" -> value / FR: "section.key" -> valeur
    std::vector<std::string> errors;

    bool ok() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& long_name) const { return values.count(long_name) > 0; }
    std::optional<std::string> value(const std::string& long_name) const;
    std::vector<std::string> all(const std::string& long_name) const;
};

// EN: Parser for "prog [OPTIONS] COMMAND [ARGS]". Options may appear before or after the command.
// FR: Parseur pour "prog [OPTIONS] COMMANDE [ARGS]". Les options peuvent précéder ou suivre la commande.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);

    // EN: Throws std::invalid_argument on a duplicate long or short name.
    // FR: Lance std::invalid_argument sur un nom long ou court dupliqué.
    void addOption(const CliOptionDefinition& option);
    void addCommand(const std::string& name, const std::string& usage, const std::string& description);

    void setHelpHeader(const std::string& header) { help_header_ = header; }
    void setVersionInfo(const std::string& version) { version_ = version; }

    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    std::string generateVersionText() const;

    // EN: Push parsed overrides into the configuration. Returns the number applied.
    // FR: Applique les surcharges analysées à la configuration. Retourne le nombre appliqué.
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

private:
    struct Command {
        std::string name;
        std::string usage;
        std::string description;
    };

    const CliOptionDefinition* findLong(const std::string& name) const;
    const CliOptionDefinition* findShort(char name) const;
    bool checkValue(const CliOptionDefinition& option, const std::string& value, std::string& error) const;

    std::string program_name_;
    std::string help_header_;
    std::string version_ = "1.0.0";
    std::vector<CliOptionDefinition> options_;
    std::vector<Command> commands_;
};

} // namespace CLI
} // namespace ARL
