// EN: Implementation of the ConfigManager class. YAML parsing, validation, environment and CLI overrides.
// FR: Implémentation de la classe ConfigManager. Parsing YAML, validation, surcharges d'environnement et CLI.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

namespace HVC {

namespace {

constexpr const char* kModule = "config";

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// EN: Default storage locations per platform.
// FR: Emplacements de stockage par défaut selon la plateforme.
#ifdef _WIN32
constexpr const char* kDefaultBackupDir = "C:\\ProgramData\\HVCleanup\\backups";
constexpr const char* kDefaultLogDir = "C:\\ProgramData\\HVCleanup\\logs";
#else
constexpr const char* kDefaultBackupDir = "/var/lib/hvc/backups";
constexpr const char* kDefaultLogDir = "/var/log/hvc";
#endif

} // namespace

// EN: ConfigValue template implementation for type conversion.
// FR: Implémentation de template ConfigValue pour la conversion de types.
template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_ || !std::holds_alternative<T>(*value_)) {
        return std::nullopt;
    }
    return std::get<T>(*value_);
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.contains(key);
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager::ConfigManager(Logger& logger) : logger_(logger) {}

// EN: Built-in defaults. Match patterns are case-insensitive globs.
// FR: Valeurs par défaut intégrées. Les motifs de correspondance sont des globs insensibles à la casse.
void ConfigManager::loadDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);

    ConfigSection general;
    general.set("backup_dir", std::string(kDefaultBackupDir));
    general.set("log_dir", std::string(kDefaultLogDir));
    general.set("log_level", std::string("info"));
    general.set("process_timeout_seconds", 300);
    general.set("export_driver_packages", true);
    sections_["general"] = general;

    ConfigSection devices;
    devices.set("name_patterns", std::vector<std::string>{"*VMware*"});
    devices.set("hardware_id_patterns", std::vector<std::string>{
        "PCI\\VEN_15AD*", "ROOT\\VMWVMCIHOSTDEV*", "pci:v000015AD*"});
    devices.set("include_present", false);
    sections_["devices"] = devices;

    ConfigSection drivers;
    drivers.set("provider_patterns", std::vector<std::string>{"VMware*"});
    drivers.set("name_patterns", std::vector<std::string>{
        "vm3d*", "vmxnet*", "pvscsi*", "vmci*", "vmmouse*", "vmusbmouse*", "vmhgfs*",
        "vmmemctl*", "vsock*", "vmw_*", "vmwgfx*"});
    drivers.set("require_tools_removed", true);
    sections_["drivers"] = drivers;

    ConfigSection software;
    software.set("name_patterns", std::vector<std::string>{"VMware Tools*", "open-vm-tools*"});
    sections_["software"] = software;

    ConfigSection disks;
    disks.set("bring_online", true);
    disks.set("clear_read_only", true);
    disks.set("assign_letters", true);
    disks.set("first_letter", std::string("D"));
    sections_["disks"] = disks;

    ConfigSection executor;
    executor.set("reboot_required_codes", std::vector<std::string>{"3010", "1641"});
    sections_["executor"] = executor;

    ConfigSection confirmation;
    confirmation.set("double_confirm_tasks", std::vector<std::string>{"reset-network", "clean-drivers"});
    sections_["confirmation"] = confirmation;

    validation_rules_ = {
        {.key = "general.backup_dir", .type = "string", .required = true},
        {.key = "general.log_dir", .type = "string", .required = true},
        {.key = "general.log_level", .type = "string",
         .allowed_values = {"debug", "info", "warn", "error"}},
        {.key = "general.process_timeout_seconds", .type = "int", .min_value = 1, .max_value = 86400},
        {.key = "general.export_driver_packages", .type = "bool"},
        {.key = "devices.name_patterns", .type = "array"},
        {.key = "devices.hardware_id_patterns", .type = "array"},
        {.key = "devices.include_present", .type = "bool"},
        {.key = "drivers.provider_patterns", .type = "array"},
        {.key = "drivers.name_patterns", .type = "array"},
        {.key = "drivers.require_tools_removed", .type = "bool"},
        {.key = "software.name_patterns", .type = "array"},
        {.key = "disks.bring_online", .type = "bool"},
        {.key = "disks.clear_read_only", .type = "bool"},
        {.key = "disks.assign_letters", .type = "bool"},
        {.key = "disks.first_letter", .type = "string",
         .allowed_values = {"C", "D", "E", "F", "G", "H", "I", "J", "K", "L", "M", "N", "O",
                            "P", "Q", "R", "S", "T", "U", "V", "W", "X", "Y", "Z"}},
        {.key = "executor.reboot_required_codes", .type = "array"},
        {.key = "confirmation.double_confirm_tasks", .type = "array"},
    };
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!std::filesystem::exists(filename)) {
        HVC_LOG_ERROR(logger_, kModule, "Configuration file not found: " + filename);
        return false;
    }

    try {
        mergeYaml(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        logger_.error(kModule, "Failed to load configuration: " + std::string(e.what()),
                      {{"file", filename}});
        return false;
    }

    HVC_LOG_INFO(logger_, kModule, "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        mergeYaml(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        HVC_LOG_ERROR(logger_, kModule, "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }

    HVC_LOG_DEBUG(logger_, kModule, "Configuration loaded from string");
    return true;
}

void ConfigManager::mergeYaml(const YAML::Node& root) {
    if (!root.IsDefined() || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw YAML::ParserException(root.Mark(), "top-level configuration must be a map");
    }

    // EN: Each top-level key is a section, each nested key a value.
    // FR: Chaque clé de premier niveau est une section, chaque clé imbriquée une valeur.
    for (const auto& section : root) {
        const std::string section_name = section.first.as<std::string>();
        ConfigSection& target = sections_[section_name];

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                target.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            target.set("value", parseYamlValue(section.second));
        }
    }
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    if (node.IsNull()) {
        return ConfigValue(std::string());
    }

    const std::string str_val = node.as<std::string>();
    if (str_val == "true" || str_val == "false") {
        return ConfigValue(str_val == "true");
    }

    // EN: Quoted scalars stay strings ("D", "3010").
    // FR: Les scalaires entre guillemets restent des chaînes ("D", "3010").
    if (node.Tag() != "!") {
        int int_val = 0;
        if (str_val.find('.') == std::string::npos && YAML::convert<int>::decode(node, int_val)) {
            return ConfigValue(int_val);
        }
        double double_val = 0.0;
        if (YAML::convert<double>::decode(node, double_val)) {
            return ConfigValue(double_val);
        }
    }

    return ConfigValue(expandVariables(str_val));
}

void ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    // EN: Only keys that already exist can be overridden, so every override has a known type.
    // FR: Seules les clés existantes peuvent être surchargées, chaque surcharge a donc un type connu.
    for (auto& [section_name, section] : sections_) {
        for (const std::string& key : section.keys()) {
            const std::string env_name = prefix + toUpper(section_name) + "_" + toUpper(key);
            const std::string raw = getEnvironmentVariable(env_name);
            if (raw.empty()) {
                continue;
            }

            auto converted = convertLike(section.get(key), raw);
            if (!converted) {
                logger_.warn(kModule, "Ignoring environment override with invalid value",
                             {{"variable", env_name}, {"value", raw}});
                continue;
            }
            section.set(key, *converted);
            HVC_LOG_INFO(logger_, kModule, "Environment override applied: " + section_name + "." + key);
        }
    }
}

void ConfigManager::applyOverrides(const std::unordered_map<std::string, ConfigValue>& overrides) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& [path, value] : overrides) {
        if (path.empty() || path.front() == '_') {
            continue;
        }
        const auto dot = path.find('.');
        if (dot == std::string::npos) {
            HVC_LOG_WARN(logger_, kModule, "Ignoring override without section: " + path);
            continue;
        }
        sections_[path.substr(0, dot)].set(path.substr(dot + 1), value);
        logger_.debug(kModule, "CLI override applied: " + path, {{"value", value.toString()}});
    }
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        const auto dot = rule.key.find('.');
        const std::string section_name = dot != std::string::npos ? rule.key.substr(0, dot) : "general";
        const std::string key_name = dot != std::string::npos ? rule.key.substr(dot + 1) : rule.key;

        ConfigValue value;
        auto section_it = sections_.find(section_name);
        if (section_it != sections_.end()) {
            value = section_it->second.get(key_name);
        }

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

bool ConfigManager::getBool(const std::string& section, const std::string& key, bool default_value) const {
    return get(section, key).asOrDefault<bool>(default_value);
}

int ConfigManager::getInt(const std::string& section, const std::string& key, int default_value) const {
    return get(section, key).asOrDefault<int>(default_value);
}

std::string ConfigManager::getString(const std::string& section, const std::string& key,
                                     const std::string& default_value) const {
    return get(section, key).asOrDefault<std::string>(default_value);
}

std::vector<std::string> ConfigManager::getStringList(const std::string& section,
                                                      const std::string& key) const {
    ConfigValue value = get(section, key);
    if (auto list = value.tryAs<std::vector<std::string>>()) {
        return *list;
    }
    // EN: A single string is a one-element list.
    // FR: Une chaîne seule est une liste à un élément.
    if (auto single = value.tryAs<std::string>(); single && !single->empty()) {
        return {*single};
    }
    return {};
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream oss;
    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // Type validation
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") && (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    // Allowed values validation
    if (!rule.allowed_values.empty()) {
        const std::string str_value = value.toString();
        const bool found = std::any_of(rule.allowed_values.begin(), rule.allowed_values.end(),
            [&](const std::string& allowed) { return toUpper(allowed) == toUpper(str_value); });
        if (!found) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    std::string result = value;
    const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    std::string::size_type offset = 0;

    // EN: Unknown variables are left as-is and scanning resumes after them.
    // FR: Les variables inconnues sont laissées telles quelles et l'analyse reprend après elles.
    while (offset < result.size()) {
        std::string tail = result.substr(offset);
        if (!std::regex_search(tail, match, var_regex)) {
            break;
        }
        const std::string var_value = getEnvironmentVariable(match[1].str());
        const auto start = offset + static_cast<std::string::size_type>(match.position());
        if (!var_value.empty()) {
            result.replace(start, static_cast<std::string::size_type>(match.length()), var_value);
            offset = start + var_value.size();
        } else {
            offset = start + static_cast<std::string::size_type>(match.length());
        }
    }

    return result;
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) const {
    const char* env_value = std::getenv(name.c_str());
    return env_value ? std::string(env_value) : "";
}

std::optional<ConfigValue> ConfigManager::convertLike(const ConfigValue& existing, const std::string& raw) {
    const std::string value = trim(raw);

    if (existing.tryAs<bool>()) {
        std::string lowered = value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
            return ConfigValue(true);
        }
        if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
            return ConfigValue(false);
        }
        return std::nullopt;
    }

    if (existing.tryAs<int>()) {
        try {
            size_t consumed = 0;
            const int parsed = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                return std::nullopt;
            }
            return ConfigValue(parsed);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }

    if (existing.tryAs<double>()) {
        try {
            size_t consumed = 0;
            const double parsed = std::stod(value, &consumed);
            if (consumed != value.size()) {
                return std::nullopt;
            }
            return ConfigValue(parsed);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }

    if (existing.tryAs<std::vector<std::string>>()) {
        std::vector<std::string> items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return ConfigValue(items);
    }

    return ConfigValue(value);
}

// Explicit template instantiations
template std::optional<bool> ConfigValue::tryAs<bool>() const;
template std::optional<int> ConfigValue::tryAs<int>() const;
template std::optional<double> ConfigValue::tryAs<double>() const;
template std::optional<std::string> ConfigValue::tryAs<std::string>() const;
template std::optional<std::vector<std::string>> ConfigValue::tryAs<std::vector<std::string>>() const;

template bool ConfigValue::asOrDefault<bool>(const bool&) const;
template int ConfigValue::asOrDefault<int>(const int&) const;
template double ConfigValue::asOrDefault<double>(const double&) const;
template std::string ConfigValue::asOrDefault<std::string>(const std::string&) const;
template std::vector<std::string> ConfigValue::asOrDefault<std::vector<std::string>>(const std::vector<std::string>&) const;

} // namespace HVC
