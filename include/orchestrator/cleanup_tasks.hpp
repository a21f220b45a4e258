// EN: Cleanup task catalog - expands a snapshot into concrete steps using configurable match rules
// FR: Catalogue des tâches de nettoyage - développe un instantané en étapes concrètes selon des règles configurables

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "orchestrator/step.hpp"

namespace HVC {

class ConfigManager;

namespace Orchestrator {

// EN: Match rules read from the devices, drivers, software, disks and confirmation sections.
// FR: Règles de correspondance lues depuis les sections devices, drivers, software, disks et confirmation.
struct CleanupRules {
    std::vector<std::string> device_name_patterns;
    std::vector<std::string> device_hardware_id_patterns;
    bool include_present_devices = false;

    std::vector<std::string> driver_provider_patterns;
    std::vector<std::string> driver_name_patterns;
    bool require_tools_removed = true;

    std::vector<std::string> software_name_patterns;

    bool bring_disks_online = true;
    bool clear_read_only = true;
    bool assign_letters = true;
    char first_letter = 'D';

    std::vector<std::string> double_confirm_tasks;

    static CleanupRules fromConfig(const ConfigManager& config);

    bool matchesDevice(const DeviceRecord& device) const;
    bool matchesDriver(const DriverPackageRecord& driver) const;
    bool matchesSoftware(const SoftwareRecord& software) const;
    int confirmationsFor(const std::string& task) const;
};

class CleanupTaskCatalog {
public:
    static constexpr const char* kCleanDevices = "clean-devices";
    static constexpr const char* kCleanDrivers = "clean-drivers";
    static constexpr const char* kFlushDns = "flush-dns";
    static constexpr const char* kResetNetwork = "reset-network";
    static constexpr const char* kRemoveTools = "remove-tools";
    static constexpr const char* kFixDisks = "fix-disks";
    static constexpr const char* kCleanAll = "clean-all";

    explicit CleanupTaskCatalog(CleanupRules rules);

    std::optional<TaskDefinition> find(const std::string& name) const;

    // EN: Tasks run by one command; clean-all expands to its ordered task list. Throws std::invalid_argument.
    // FR: Tâches exécutées par une commande ; clean-all se développe en sa liste ordonnée. Lance std::invalid_argument.
    std::vector<TaskDefinition> forCommand(const std::string& command) const;

    static const std::vector<std::string>& names();
    static const std::vector<std::string>& cleanAllOrder();

    // EN: Installed software that must be removed before driver packages can be deleted.
    // FR: Logiciels installés à retirer avant de pouvoir supprimer les paquets de pilotes.
    std::vector<std::string> conflictingSoftware(const SystemSnapshot& snapshot) const;

    const CleanupRules& rules() const { return rules_; }

private:
    TaskDefinition cleanDevices() const;
    TaskDefinition cleanDrivers() const;
    TaskDefinition flushDns() const;
    TaskDefinition resetNetwork() const;
    TaskDefinition removeTools() const;
    TaskDefinition fixDisks() const;

    CleanupRules rules_;
};

} // namespace Orchestrator
} // namespace HVC
