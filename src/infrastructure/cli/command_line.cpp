// EN: Implementation of the command line parser.
// FR: Implémentation du parseur de ligne de commande.

#include "infrastructure/cli/command_line.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace ARL {
namespace CLI {

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        case CliParseStatus::MISSING_COMMAND: return "MISSING_COMMAND";
    }
    return "UNKNOWN";
}

std::optional<std::string> CliParseResult::value(const std::string& long_name) const {
    auto it = values.find(long_name);
    if (it == values.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<std::string> CliParseResult::all(const std::string& long_name) const {
    auto it = values.find(long_name);
    return it == values.end() ? std::vector<std::string>{} : it->second;
}

CommandLineParser::CommandLineParser(std::string program_name) : program_name_(std::move(program_name)) {}

void CommandLineParser::addOption(const CliOptionDefinition& option) {
    if (findLong(option.long_name)) {
        throw std::invalid_argument("Duplicate option: --" + option.long_name);
    }
    if (option.short_name && findShort(*option.short_name)) {
        throw std::invalid_argument(std::string("Duplicate option: -") + *option.short_name);
    }
    options_.push_back(option);
}

void CommandLineParser::addCommand(const std::string& name, const std::string& usage, const std::string& description) {
    commands_.push_back(Command{name, usage, description});
}

const CliOptionDefinition* CommandLineParser::findLong(const std::string& name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&name](const CliOptionDefinition& option) { return option.long_name == name; });
    return it == options_.end() ? nullptr : &*it;
}

const CliOptionDefinition* CommandLineParser::findShort(char name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [name](const CliOptionDefinition& option) { return option.short_name == name; });
    return it == options_.end() ? nullptr : &*it;
}

bool CommandLineParser::checkValue(const CliOptionDefinition& option, const std::string& value,
                                   std::string& error) const {
    if (option.type == CliOptionType::INTEGER) {
        static const std::regex integer_pattern(R"(^-?\d{1,9}$)");
        if (!std::regex_match(value, integer_pattern)) {
            error = "expected an integer, got '" + value + "'";
            return false;
        }
    }
    if (!option.enum_values.empty() && option.enum_values.count(value) == 0) {
        std::string allowed;
        for (const auto& candidate : option.enum_values) {
            if (!allowed.empty()) allowed += ", ";
            allowed += candidate;
        }
        error = "'" + value + "' is not one of: " + allowed;
        return false;
    }
    return true;
}

CliParseResult CommandLineParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult CommandLineParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;

    auto fail = [&result](CliParseStatus status, const std::string& message) {
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
        result.errors.push_back(message);
    };

    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];
        if (arg.empty()) continue;

        if (arg == "--help" || arg == "-h") {
            result.status = CliParseStatus::HELP_REQUESTED;
            return result;
        }
        if (arg == "--version" || arg == "-V") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            return result;
        }

        if (arg.size() < 2 || arg[0] != '-') {
            if (result.command.empty()) {
                result.command = arg;
            } else {
                result.positionals.push_back(arg);
            }
            continue;
        }

        // EN: "--name", "--name=value" or "-n"
        // FR: "--name", "--name=value" ou "-n"
        const CliOptionDefinition* option = nullptr;
        std::optional<std::string> inline_value;
        if (arg.compare(0, 2, "--") == 0) {
            std::string name = arg.substr(2);
            const size_t eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
            option = findLong(name);
        } else if (arg.size() == 2) {
            option = findShort(arg[1]);
        }

        if (!option) {
            fail(CliParseStatus::INVALID_OPTION, "Unknown option: " + arg);
            continue;
        }

        std::string value;
        if (option->type == CliOptionType::BOOLEAN) {
            if (inline_value) {
                fail(CliParseStatus::INVALID_VALUE, "Option --" + option->long_name + " takes no value");
                continue;
            }
            value = "true";
        } else if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < arguments.size()) {
            value = arguments[++i];
        } else {
            fail(CliParseStatus::MISSING_VALUE, "Option --" + option->long_name + " requires a value");
            continue;
        }

        std::string error;
        if (!checkValue(*option, value, error)) {
            fail(CliParseStatus::INVALID_VALUE, "Invalid value for option --" + option->long_name + ": " + error);
            continue;
        }

        auto& slot = result.values[option->long_name];
        if (!option->repeatable) {
            slot.clear();
        }
        slot.push_back(value);

        if (!option->config_path.empty()) {
            switch (option->type) {
                case CliOptionType::BOOLEAN:
                    result.overrides[option->config_path] = ConfigValue(true);
                    break;
                case CliOptionType::INTEGER:
                    result.overrides[option->config_path] = ConfigValue(std::stoi(value));
                    break;
                case CliOptionType::STRING:
                    result.overrides[option->config_path] = ConfigValue(value);
                    break;
            }
        }
    }

    if (result.status == CliParseStatus::SUCCESS && result.command.empty()) {
        fail(CliParseStatus::MISSING_COMMAND, "No command given");
    }

    LOG_DEBUG("cli", "Command line parsed with status " + cliParseStatusToString(result.status));
    return result;
}

std::string CommandLineParser::generateHelpText() const {
    std::ostringstream help;
    if (!help_header_.empty()) {
        help << help_header_ << "\n\n";
    }
    help << "Usage: " << program_name_ << " [OPTIONS] COMMAND [ARGS]\n\n";

    if (!commands_.empty()) {
        help << "Commands:\n";
        for (const auto& command : commands_) {
            help << "  " << std::left << std::setw(28) << command.usage << command.description << "\n";
        }
        help << "\n";
    }

    std::map<std::string, std::vector<const CliOptionDefinition*>> by_category;
    for (const auto& option : options_) {
        by_category[option.category].push_back(&option);
    }

    for (const auto& [category, options] : by_category) {
        help << category << " options:\n";
        for (const CliOptionDefinition* option : options) {
            std::string flags = option->short_name ? std::string("-") + *option->short_name + ", " : "    ";
            flags += "--" + option->long_name;
            if (option->type != CliOptionType::BOOLEAN) {
                flags += " " + option->value_name;
            }
            help << "  " << std::left << std::setw(28) << flags << option->description << "\n";
        }
        help << "\n";
    }

    help << "  -h, --help                  Show this help\n";
    help << "  -V, --version               Show version information\n";
    return help.str();
}

std::string CommandLineParser::generateVersionText() const {
    return program_name_ + " " + version_;
}

size_t CommandLineParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        const size_t dot = path.find('.');
        if (dot == std::string::npos) {
            config.set(path, value);
        } else {
            config.set(path.substr(0, dot), path.substr(dot + 1), value);
        }
        ++applied;
    }
    if (applied > 0) {
        LOG_DEBUG("cli", "Applied " + std::to_string(applied) + " configuration overrides from the command line");
    }
    return applied;
}

} // namespace CLI
} // namespace ARL
