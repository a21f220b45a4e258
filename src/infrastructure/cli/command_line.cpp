// EN: Command line parser implementation for hvcctl
// FR: Implémentation de l'analyseur de ligne de commande pour hvcctl

#include "infrastructure/cli/command_line.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace HVC {
namespace CLI {

bool CliParseResult::flag(const std::string& config_path) const {
    auto it = overrides.find(config_path);
    return it != overrides.end() && it->second.asOrDefault<bool>(false);
}

std::optional<std::string> CliParseResult::text(const std::string& config_path) const {
    auto it = overrides.find(config_path);
    if (it == overrides.end()) {
        return std::nullopt;
    }
    return it->second.tryAs<std::string>();
}

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {}

void CommandLineParser::addOption(const CliOptionDefinition& option_def) {
    // EN: Validate option definition before adding
    // FR: Valider la définition d'option avant d'ajouter
    if (option_def.long_name.empty()) {
        throw std::invalid_argument("Option long name cannot be empty");
    }
    if (findLong(option_def.long_name)) {
        throw std::invalid_argument("Option with long name '" + option_def.long_name + "' already exists");
    }
    if (option_def.short_name && findShort(*option_def.short_name)) {
        throw std::invalid_argument("Option with short name '-" + std::string(1, *option_def.short_name) +
                                    "' already exists");
    }
    options_.push_back(option_def);
}

void CommandLineParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& option_def : option_defs) {
        addOption(option_def);
    }
}

void CommandLineParser::addCommand(const CliCommandDefinition& command_def) {
    if (hasCommand(command_def.name)) {
        throw std::invalid_argument("Command '" + command_def.name + "' already exists");
    }
    commands_.push_back(command_def);
}

void CommandLineParser::addStandardOptions() {
    addOptions({
        {
            .long_name = "dry-run",
            .short_name = 'n',
            .type = CliOptionType::BOOLEAN,
            .description = "Report intended actions without changing the system",
            .config_path = "_dry_run",
        },
        {
            .long_name = "yes",
            .short_name = 'y',
            .type = CliOptionType::BOOLEAN,
            .description = "Unattended run: answer yes to every confirmation",
            .config_path = "_yes",
        },
        {
            .long_name = "backup-dir",
            .type = CliOptionType::STRING,
            .description = "Directory holding system state backups",
            .config_path = "general.backup_dir",
            .value_name = "PATH",
            .category = "Storage",
        },
        {
            .long_name = "log-dir",
            .type = CliOptionType::STRING,
            .description = "Directory receiving one NDJSON log per run",
            .config_path = "general.log_dir",
            .value_name = "PATH",
            .category = "Storage",
        },
        {
            .long_name = "config",
            .short_name = 'c',
            .type = CliOptionType::STRING,
            .description = "YAML configuration file",
            .config_path = "_config_file",
            .value_name = "FILE",
        },
        {
            .long_name = "log-level",
            .type = CliOptionType::STRING,
            .description = "Logging level (debug, info, warn, error)",
            .config_path = "general.log_level",
            .value_name = "LEVEL",
            .constraint = CliOptionConstraint::ENUM_VALUES,
            .enum_values = {"debug", "info", "warn", "error"},
            .category = "Logging",
        },
        {
            .long_name = "timeout",
            .type = CliOptionType::INTEGER,
            .description = "Timeout in seconds for each external utility",
            .config_path = "general.process_timeout_seconds",
            .value_name = "SECONDS",
            .constraint = CliOptionConstraint::POSITIVE,
        },
        {
            .long_name = "backup",
            .type = CliOptionType::STRING,
            .description = "Backup id to restore (default: newest readable backup)",
            .config_path = "_backup_id",
            .value_name = "ID",
            .category = "Restore",
        },
        {
            .long_name = "with-network",
            .type = CliOptionType::BOOLEAN,
            .description = "Also restore network interface settings",
            .config_path = "_with_network",
            .category = "Restore",
        },
        {
            .long_name = "help",
            .short_name = 'h',
            .type = CliOptionType::BOOLEAN,
            .description = "Show this help message",
            .config_path = "_help",
        },
        {
            .long_name = "version",
            .short_name = 'V',
            .type = CliOptionType::BOOLEAN,
            .description = "Show version information",
            .config_path = "_version",
        },
    });

    addCommand({"scan", "scan", "Capture inventory and print the planned cleanup steps"});
    addCommand({"clean-devices", "clean-devices", "Remove non-present hypervisor devices"});
    addCommand({"clean-drivers", "clean-drivers", "Delete hypervisor driver packages"});
    addCommand({"flush-dns", "flush-dns", "Flush the DNS resolver cache"});
    addCommand({"reset-network", "reset-network", "Reset the network stack (reboot required)"});
    addCommand({"remove-tools", "remove-tools", "Silently uninstall hypervisor guest tools"});
    addCommand({"fix-disks", "fix-disks", "Bring disks online, clear read-only, assign drive letters"});
    addCommand({"clean-all", "clean-all",
                "remove-tools, clean-devices, clean-drivers, fix-disks, flush-dns in order"});
    addCommand({"restore", "restore [--backup ID] [--with-network]", "Restore state from a backup"});
    addCommand({"list-backups", "list-backups", "List stored backups, newest first"});
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

        // EN: Everything after "--" is positional
        // FR: Tout ce qui suit "--" est positionnel
        if (arg == "--") {
            for (size_t j = i + 1; j < arguments.size(); ++j) {
                if (result.command.empty()) {
                    result.command = arguments[j];
                } else {
                    result.positionals.push_back(arguments[j]);
                }
            }
            break;
        }

        if (!CommandLineUtils::isLongOption(arg) && !CommandLineUtils::isShortOption(arg)) {
            if (result.command.empty()) {
                result.command = arg;
            } else {
                result.positionals.push_back(arg);
            }
            continue;
        }

        const std::string name = CommandLineUtils::extractOptionName(arg);
        const CliOptionDefinition* option_def = nullptr;
        if (CommandLineUtils::isLongOption(arg)) {
            option_def = findLong(name);
        } else if (name.size() == 1) {
            option_def = findShort(name[0]);
        }

        if (!option_def) {
            fail(CliParseStatus::INVALID_OPTION, "Unknown option: " + arg);
            continue;
        }

        if (option_def->config_path == "_help") {
            result.status = CliParseStatus::HELP_REQUESTED;
            result.help_text = generateHelpText();
            return result;
        }
        if (option_def->config_path == "_version") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            result.version_text = generateVersionText();
            return result;
        }

        // EN: Value from "--opt=value" or from the next argument
        // FR: Valeur depuis "--opt=valeur" ou depuis l'argument suivant
        std::optional<std::string> inline_value;
        const auto eq = arg.find('=');
        if (CommandLineUtils::isLongOption(arg) && eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
        }

        if (option_def->type == CliOptionType::BOOLEAN) {
            if (inline_value) {
                std::string error;
                auto value = CommandLineUtils::parseCliValue(*inline_value, *option_def, error);
                if (!value) {
                    fail(CliParseStatus::INVALID_VALUE, "Invalid value for option " + arg + ": " + error);
                    continue;
                }
                result.overrides[option_def->config_path] = *value;
            } else {
                result.overrides[option_def->config_path] = ConfigValue(true);
            }
            continue;
        }

        std::string raw;
        if (inline_value) {
            raw = *inline_value;
        } else if (i + 1 < arguments.size()) {
            raw = arguments[++i];
        } else {
            fail(CliParseStatus::MISSING_VALUE, "Option " + arg + " requires a value");
            continue;
        }

        std::string error;
        auto value = CommandLineUtils::parseCliValue(raw, *option_def, error);
        if (!value) {
            fail(CliParseStatus::INVALID_VALUE, "Invalid value for option " + arg + ": " + error);
            continue;
        }
        result.overrides[option_def->config_path] = *value;
    }

    if (result.status != CliParseStatus::SUCCESS) {
        return result;
    }

    if (result.command.empty()) {
        fail(CliParseStatus::MISSING_COMMAND, "No command given");
    } else if (!hasCommand(result.command)) {
        fail(CliParseStatus::UNKNOWN_COMMAND, "Unknown command: " + result.command);
    } else if (!result.positionals.empty()) {
        fail(CliParseStatus::INVALID_OPTION, "Unexpected argument: " + result.positionals.front());
    }

    return result;
}

std::string CommandLineParser::generateHelpText() const {
    std::ostringstream help;

    help << "HV-Cleanup: post-migration cleanup for virtual machines\n\n";
    help << "Usage: " << program_name_ << " [OPTIONS] COMMAND [COMMAND OPTIONS]\n\n";

    help << "Commands:\n";
    for (const auto& command : commands_) {
        help << "  " << std::left << std::setw(40) << command.usage << command.description << "\n";
    }

    // EN: Group options by category
    // FR: Grouper les options par catégorie
    std::map<std::string, std::vector<const CliOptionDefinition*>> options_by_category;
    for (const auto& option : options_) {
        options_by_category[option.category].push_back(&option);
    }

    for (const auto& [category, options] : options_by_category) {
        help << "\n" << category << " options:\n";
        for (const auto* option : options) {
            help << CommandLineUtils::formatOptionHelp(*option) << "\n";
        }
    }

    help << "\nExit codes: 0 success, 1 precondition failure, 2 partial failure, 3 aborted by operator\n";
    return help.str();
}

std::string CommandLineParser::generateVersionText() const {
    return program_name_ + " " + version_;
}

void CommandLineParser::setVersionInfo(const std::string& version) {
    version_ = version;
}

std::optional<CliOptionDefinition> CommandLineParser::getOptionDefinition(const std::string& name) const {
    if (const auto* def = findLong(name)) {
        return *def;
    }
    if (name.size() == 1) {
        if (const auto* def = findShort(name[0])) {
            return *def;
        }
    }
    return std::nullopt;
}

bool CommandLineParser::hasCommand(const std::string& name) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&name](const CliCommandDefinition& def) { return def.name == name; });
}

const CliOptionDefinition* CommandLineParser::findLong(const std::string& name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&name](const CliOptionDefinition& def) { return def.long_name == name; });
    return it != options_.end() ? &*it : nullptr;
}

const CliOptionDefinition* CommandLineParser::findShort(char name) const {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [name](const CliOptionDefinition& def) {
                               return def.short_name && *def.short_name == name;
                           });
    return it != options_.end() ? &*it : nullptr;
}

namespace CommandLineUtils {

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        case CliParseStatus::MISSING_COMMAND: return "MISSING_COMMAND";
        case CliParseStatus::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
        default: return "UNKNOWN";
    }
}

std::optional<ConfigValue> parseCliValue(const std::string& raw_value,
                                         const CliOptionDefinition& definition,
                                         std::string& error_message) {
    switch (definition.type) {
        case CliOptionType::BOOLEAN: {
            std::string lowered = raw_value;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
                return ConfigValue(true);
            }
            if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
                return ConfigValue(false);
            }
            error_message = "expected a boolean";
            return std::nullopt;
        }

        case CliOptionType::INTEGER: {
            int parsed = 0;
            try {
                size_t consumed = 0;
                parsed = std::stoi(raw_value, &consumed);
                if (consumed != raw_value.size()) {
                    error_message = "expected an integer";
                    return std::nullopt;
                }
            } catch (const std::logic_error&) {
                error_message = "expected an integer";
                return std::nullopt;
            }
            if (definition.constraint == CliOptionConstraint::POSITIVE && parsed <= 0) {
                error_message = "must be positive";
                return std::nullopt;
            }
            return ConfigValue(parsed);
        }

        case CliOptionType::STRING: {
            if (raw_value.empty()) {
                error_message = "value cannot be empty";
                return std::nullopt;
            }
            if (definition.constraint == CliOptionConstraint::ENUM_VALUES &&
                !definition.enum_values.contains(raw_value)) {
                error_message = "must be one of:";
                for (const auto& allowed : definition.enum_values) {
                    error_message += " " + allowed;
                }
                return std::nullopt;
            }
            return ConfigValue(raw_value);
        }

        case CliOptionType::STRING_LIST: {
            std::vector<std::string> items;
            std::stringstream ss(raw_value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (!item.empty()) {
                    items.push_back(item);
                }
            }
            return ConfigValue(items);
        }
    }

    error_message = "unsupported option type";
    return std::nullopt;
}

bool isShortOption(const std::string& arg) {
    return arg.size() == 2 && arg[0] == '-' && arg[1] != '-';
}

bool isLongOption(const std::string& arg) {
    return arg.size() > 2 && arg.starts_with("--");
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        std::string name = arg.substr(2);
        const auto eq = name.find('=');
        return eq == std::string::npos ? name : name.substr(0, eq);
    }
    if (isShortOption(arg)) {
        return arg.substr(1);
    }
    return arg;
}

std::string formatOptionHelp(const CliOptionDefinition& option) {
    std::ostringstream line;
    std::string names = "  ";
    names += option.short_name ? std::string("-") + *option.short_name + ", " : "    ";
    names += "--" + option.long_name;
    if (option.type != CliOptionType::BOOLEAN) {
        names += " " + (option.value_name.empty() ? std::string("VALUE") : option.value_name);
    }
    line << std::left << std::setw(32) << names << option.description;
    return line.str();
}

} // namespace CommandLineUtils

} // namespace CLI
} // namespace HVC
