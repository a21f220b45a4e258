// EN: Configuration layer for HV-Cleanup. YAML files, environment and CLI overrides over built-in defaults.
// FR: Couche de configuration pour HV-Cleanup. Fichiers YAML, surcharges d'environnement et CLI sur des défauts intégrés.

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

namespace HVC {

class Logger;

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (!std::holds_alternative<T>(*value_)) {
            throw std::runtime_error("ConfigValue type mismatch");
        }
        return std::get<T>(*value_);
    }

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    // EN: Get value as specific type or return default if type mismatch.
    // FR: Obtient la valeur comme type spécifique ou retourne défaut si type incorrect.
    template<typename T>
    T asOrDefault(const T& default_value) const;

    // EN: Check if value is valid (not empty).
    // FR: Vérifie si la valeur est valide (non vide).
    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
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

    // EN: Get all keys in section, sorted.
    // FR: Obtient toutes les clés de la section, triées.
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Configuration manager. One instance per process, created by the application and passed to collaborators.
// FR: Gestionnaire de configuration. Une instance par processus, créée par l'application et passée aux collaborateurs.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values.
    // FR: Structure de règle de validation pour les valeurs de configuration.
    struct ValidationRule {
        std::string key;                        // EN: "section.key" / FR: "section.clé"
        std::string type;                       // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    explicit ConfigManager(Logger& logger);

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Install the built-in defaults and validation rules. Existing values are replaced.
    // FR: Installe les valeurs par défaut et les règles de validation intégrées. Les valeurs existantes sont remplacées.
    void loadDefaults();

    // EN: Merge a YAML file over the current values. Returns false on missing file or parse error.
    // FR: Fusionne un fichier YAML sur les valeurs actuelles. Retourne false si fichier absent ou erreur de parsing.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply PREFIX<SECTION>_<KEY> environment variables to every known key, converted to the key's current type.
    // FR: Applique les variables PREFIX<SECTION>_<CLÉ> à chaque clé connue, converties vers le type actuel de la clé.
    void loadEnvironmentOverrides(const std::string& prefix = "HVC_");

    // EN: Apply "section.key" overrides (CLI). Paths starting with '_' are control values and are ignored.
    // FR: Applique des surcharges "section.clé" (CLI). Les chemins commençant par '_' sont des valeurs de contrôle et sont ignorés.
    void applyOverrides(const std::unordered_map<std::string, ConfigValue>& overrides);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    // EN: Typed getters with fallback, used by the orchestrator.
    // FR: Accesseurs typés avec repli, utilisés par l'orchestrateur.
    bool getBool(const std::string& section, const std::string& key, bool default_value) const;
    int getInt(const std::string& section, const std::string& key, int default_value) const;
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_value) const;
    std::vector<std::string> getStringList(const std::string& section, const std::string& key) const;

    void reset();

    // EN: Effective configuration, one "[section]" block per section with sorted keys. Printed by scan at debug level.
    // FR: Configuration effective, un bloc "[section]" par section avec clés triées. Affichée par scan au niveau debug.
    std::string dump() const;

private:
    // EN: Merge every section of a YAML document. Caller holds the lock.
    // FR: Fusionne chaque section d'un document YAML. L'appelant détient le verrou.
    void mergeYaml(const YAML::Node& root);

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references from the environment.
    // FR: Étend les références ${VAR} depuis l'environnement.
    std::string expandVariables(const std::string& value) const;
    std::string getEnvironmentVariable(const std::string& name) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    // EN: Convert a raw string to the type held by an existing value (lists are comma-separated).
    // FR: Convertit une chaîne brute vers le type de la valeur existante (listes séparées par virgules).
    static std::optional<ConfigValue> convertLike(const ConfigValue& existing, const std::string& raw);

    Logger& logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

} // namespace HVC
