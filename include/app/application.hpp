// EN: AreaLint command line application - wires configuration, logging and the engine behind the CLI commands
// FR: Application en ligne de commande AreaLint - relie configuration, journalisation et moteur aux commandes CLI

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "infrastructure/cli/command_line.hpp"
#include "infrastructure/config/config_manager.hpp"

namespace ARL {
namespace App {

// EN: Process exit codes
// FR: Codes de sortie du processus
enum class ExitCode : int {
    OK = 0,
    FINDINGS = 1,   // EN: Invalid records, error-severity issues or failed fixes / FR: Enregistrements invalides, problèmes de sévérité error ou correctifs échoués
    USAGE = 2       // EN: Bad arguments, configuration or input / FR: Arguments, configuration ou entrée incorrects
};

class Application {
public:
    static constexpr const char* kVersion = "1.0.0";

    Application(std::ostream& out, std::ostream& err);

    int run(int argc, char* argv[]);
    int run(const std::vector<std::string>& arguments);

    // EN: Validation rules (types, ranges, defaults) for every recognized configuration key.
    // FR: Règles de validation (types, bornes, défauts) pour chaque clé de configuration reconnue.
    static std::vector<ConfigManager::ValidationRule> configurationRules();

    CLI::CommandLineParser buildParser() const;

private:
    bool configure(const CLI::CliParseResult& args);

    int runValidate(const CLI::CliParseResult& args);
    int runLint(const CLI::CliParseResult& args);
    int runFix(const CLI::CliParseResult& args);
    int runRules();
    int runSchema(const CLI::CliParseResult& args);

    // EN: Single positional FILE argument of validate, lint and fix.
    // FR: Argument positionnel FILE unique de validate, lint et fix.
    bool corpusPath(const CLI::CliParseResult& args, std::string& path);

    std::ostream& out_;
    std::ostream& err_;
};

} // namespace App
} // namespace ARL
