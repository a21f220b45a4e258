// EN: Command line parsing for hvcctl - option table, subcommand and configuration overrides
// FR: Analyse de la ligne de commande pour hvcctl - table d'options, sous-commande et surcharges de configuration

#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace HVC {
namespace CLI {

// EN: CLI option types
// FR: Types d'options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Boolean flag / FR: Drapeau booléen
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING,         // EN: String value / FR: Valeur chaîne
    STRING_LIST     // EN: Comma-separated string list / FR: Liste de chaînes séparées par virgule
};

// EN: CLI option value constraints
// FR: Contraintes de valeur d'option CLI
enum class CliOptionConstraint {
    NONE,           // EN: No constraints / FR: Aucune contrainte
    POSITIVE,       // EN: Must be positive (>0) / FR: Doit être positif (>0)
    ENUM_VALUES     // EN: Must be one of predefined values / FR: Doit être l'une des valeurs prédéfinies
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Unknown option provided / FR: Option inconnue fournie
    MISSING_VALUE,          // EN: Required value missing / FR: Valeur requise manquante
    INVALID_VALUE,          // EN: Invalid value format or constraint violation / FR: Format invalide ou contrainte violée
    MISSING_COMMAND,        // EN: No subcommand given / FR: Aucune sous-commande fournie
    UNKNOWN_COMMAND         // EN: Subcommand not recognized / FR: Sous-commande non reconnue
};

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                          // EN: Long option name (--example) / FR: Nom d'option long (--exemple)
    std::optional<char> short_name;                 // EN: Short option name (-e) / FR: Nom d'option court (-e)
    CliOptionType type = CliOptionType::BOOLEAN;    // EN: Option value type / FR: Type de valeur d'option
    std::string description;                        // EN: Option description for help / FR: Description d'option pour l'aide
    std::string config_path;                        // EN: "section.key", or "_name" for control values / FR: "section.clé", ou "_nom" pour les valeurs de contrôle
    std::string value_name;                         // EN: Placeholder shown in help / FR: Nom affiché dans l'aide
    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::set<std::string> enum_values;              // EN: Valid enum values / FR: Valeurs d'énumération valides
    std::string category = "General";               // EN: Help category / FR: Catégorie d'aide
};

// EN: Subcommand definition for help output and validation
// FR: Définition de sous-commande pour l'aide et la validation
struct CliCommandDefinition {
    std::string name;
    std::string usage;
    std::string description;
};

// EN: CLI parsing result containing the subcommand and all overrides
// FR: Résultat d'analyse CLI contenant la sous-commande et toutes les surcharges
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::string command;                                        // EN: Selected subcommand / FR: Sous-commande choisie
    std::vector<std::string> positionals;                       // EN: Extra positional arguments / FR: Arguments positionnels supplémentaires
    std::vector<std::string> errors;
    std::unordered_map<std::string, ConfigValue> overrides;     // EN: config_path -> value / FR: config_path -> valeur
    std::string help_text;
    std::string version_text;

    // EN: Control value helpers over "_name" overrides.
    // FR: Accès aux valeurs de contrôle des surcharges "_nom".
    bool flag(const std::string& config_path) const;
    std::optional<std::string> text(const std::string& config_path) const;
};

// EN: Main command line parser. Options may appear before or after the subcommand.
// FR: Analyseur principal de ligne de commande. Les options peuvent précéder ou suivre la sous-commande.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name = "hvcctl");

    // EN: Option and command definition management (throws std::invalid_argument on duplicates)
    // FR: Gestion des définitions d'options et de commandes (lance std::invalid_argument sur doublon)
    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);
    void addCommand(const CliCommandDefinition& command_def);

    // EN: Register the hvcctl global flags, command options and subcommands.
    // FR: Enregistre les drapeaux globaux, options de commande et sous-commandes de hvcctl.
    void addStandardOptions();

    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    std::string generateVersionText() const;

    void setVersionInfo(const std::string& version);

    std::optional<CliOptionDefinition> getOptionDefinition(const std::string& name) const;
    bool hasCommand(const std::string& name) const;

private:
    const CliOptionDefinition* findLong(const std::string& name) const;
    const CliOptionDefinition* findShort(char name) const;

    std::string program_name_;
    std::string version_ = "1.0.0";
    std::vector<CliOptionDefinition> options_;
    std::vector<CliCommandDefinition> commands_;
};

// EN: Utility functions for command line handling
// FR: Fonctions utilitaires pour la gestion de la ligne de commande
namespace CommandLineUtils {

    std::string cliParseStatusToString(CliParseStatus status);

    // EN: Convert and validate a raw value for an option; returns an error message on failure.
    // FR: Convertit et valide une valeur brute pour une option ; retourne un message d'erreur en cas d'échec.
    std::optional<ConfigValue> parseCliValue(const std::string& raw_value,
                                             const CliOptionDefinition& definition,
                                             std::string& error_message);

    bool isShortOption(const std::string& arg);
    bool isLongOption(const std::string& arg);

    // EN: Strip dashes and any "=value" suffix.
    // FR: Retire les tirets et tout suffixe "=valeur".
    std::string extractOptionName(const std::string& arg);

    std::string formatOptionHelp(const CliOptionDefinition& option);

} // namespace CommandLineUtils

} // namespace CLI
} // namespace HVC
