// EN: Cleanup task catalog implementation.
// FR: Implémentation du catalogue des tâches de nettoyage.

#include "orchestrator/cleanup_tasks.hpp"

#include "infrastructure/config/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace HVC {
namespace Orchestrator {

namespace {

const DeviceRecord* findDevice(const SystemSnapshot& snapshot, const std::string& id) {
    for (const auto& device : snapshot.devices) {
        if (device.id == id) {
            return &device;
        }
    }
    return nullptr;
}

const DiskRecord* findDisk(const SystemSnapshot& snapshot, int number) {
    for (const auto& disk : snapshot.disks) {
        if (disk.number == number) {
            return &disk;
        }
    }
    return nullptr;
}

bool eligibleForLetter(const PartitionRecord& partition) {
    return partition.drive_letter.empty() &&
           (SnapshotUtils::globMatch("Basic", partition.type) || SnapshotUtils::globMatch("IFS", partition.type));
}

} // namespace

CleanupRules CleanupRules::fromConfig(const ConfigManager& config) {
    CleanupRules rules;
    rules.device_name_patterns = config.getStringList("devices", "name_patterns");
    rules.device_hardware_id_patterns = config.getStringList("devices", "hardware_id_patterns");
    rules.include_present_devices = config.getBool("devices", "include_present", false);

    rules.driver_provider_patterns = config.getStringList("drivers", "provider_patterns");
    rules.driver_name_patterns = config.getStringList("drivers", "name_patterns");
    rules.require_tools_removed = config.getBool("drivers", "require_tools_removed", true);

    rules.software_name_patterns = config.getStringList("software", "name_patterns");

    rules.bring_disks_online = config.getBool("disks", "bring_online", true);
    rules.clear_read_only = config.getBool("disks", "clear_read_only", true);
    rules.assign_letters = config.getBool("disks", "assign_letters", true);
    const std::string letter = config.getString("disks", "first_letter", "D");
    if (!letter.empty() && std::isalpha(static_cast<unsigned char>(letter[0]))) {
        rules.first_letter = static_cast<char>(std::toupper(static_cast<unsigned char>(letter[0])));
    }

    rules.double_confirm_tasks = config.getStringList("confirmation", "double_confirm_tasks");
    return rules;
}

bool CleanupRules::matchesDevice(const DeviceRecord& device) const {
    if (SnapshotUtils::matchesAny(device_name_patterns, device.display_name)) {
        return true;
    }
    return std::any_of(device.hardware_ids.begin(), device.hardware_ids.end(), [this](const std::string& id) {
        return SnapshotUtils::matchesAny(device_hardware_id_patterns, id);
    });
}

bool CleanupRules::matchesDriver(const DriverPackageRecord& driver) const {
    return SnapshotUtils::matchesAny(driver_provider_patterns, driver.provider) ||
           SnapshotUtils::matchesAny(driver_name_patterns, driver.original_name) ||
           SnapshotUtils::matchesAny(driver_name_patterns, driver.published_name);
}

bool CleanupRules::matchesSoftware(const SoftwareRecord& software) const {
    return SnapshotUtils::matchesAny(software_name_patterns, software.name);
}

int CleanupRules::confirmationsFor(const std::string& task) const {
    return std::find(double_confirm_tasks.begin(), double_confirm_tasks.end(), task) != double_confirm_tasks.end()
               ? 2 : 1;
}

CleanupTaskCatalog::CleanupTaskCatalog(CleanupRules rules) : rules_(std::move(rules)) {}

const std::vector<std::string>& CleanupTaskCatalog::names() {
    static const std::vector<std::string> task_names{
        kCleanDevices, kCleanDrivers, kFlushDns, kResetNetwork, kRemoveTools, kFixDisks,
    };
    return task_names;
}

const std::vector<std::string>& CleanupTaskCatalog::cleanAllOrder() {
    static const std::vector<std::string> order{
        kRemoveTools, kCleanDevices, kCleanDrivers, kFixDisks, kFlushDns,
    };
    return order;
}

std::optional<TaskDefinition> CleanupTaskCatalog::find(const std::string& name) const {
    if (name == kCleanDevices) return cleanDevices();
    if (name == kCleanDrivers) return cleanDrivers();
    if (name == kFlushDns) return flushDns();
    if (name == kResetNetwork) return resetNetwork();
    if (name == kRemoveTools) return removeTools();
    if (name == kFixDisks) return fixDisks();
    return std::nullopt;
}

std::vector<TaskDefinition> CleanupTaskCatalog::forCommand(const std::string& command) const {
    std::vector<TaskDefinition> tasks;
    if (command == kCleanAll) {
        for (const auto& name : cleanAllOrder()) {
            tasks.push_back(*find(name));
        }
        return tasks;
    }
    auto task = find(command);
    if (!task) {
        throw std::invalid_argument("Unknown cleanup command: " + command);
    }
    tasks.push_back(std::move(*task));
    return tasks;
}

std::vector<std::string> CleanupTaskCatalog::conflictingSoftware(const SystemSnapshot& snapshot) const {
    std::vector<std::string> names;
    for (const auto& software : snapshot.software) {
        if (rules_.matchesSoftware(software)) {
            names.push_back(software.name);
        }
    }
    return names;
}

TaskDefinition CleanupTaskCatalog::cleanDevices() const {
    const CleanupRules rules = rules_;
    return {kCleanDevices, "Remove non-present devices left by the previous hypervisor",
        [rules](const SystemSnapshot& snapshot) {
            std::vector<Step> steps;
            for (const auto& device : snapshot.devices) {
                if (!rules.matchesDevice(device) || (device.present && !rules.include_present_devices)) {
                    continue;
                }
                const std::string id = device.id;
                const bool include_present = rules.include_present_devices;
                Step step;
                step.name = "remove-device:" + id;
                step.task = kCleanDevices;
                step.description = "Remove device " + device.display_name + " (" + id + ")";
                step.predicate = [id, include_present](const SystemSnapshot& current) {
                    const auto* live = findDevice(current, id);
                    return live != nullptr && (!live->present || include_present);
                };
                step.action = [id](Platform::ISystemManagement& system) { return system.removeDevice(id); };
                step.confirmations_required = rules.confirmationsFor(kCleanDevices);
                steps.push_back(std::move(step));
            }
            return steps;
        }};
}

TaskDefinition CleanupTaskCatalog::cleanDrivers() const {
    const CleanupRules rules = rules_;
    return {kCleanDrivers, "Delete driver packages of the previous hypervisor from the driver store",
        [rules](const SystemSnapshot& snapshot) {
            std::vector<Step> steps;
            for (const auto& driver : snapshot.drivers) {
                if (!rules.matchesDriver(driver)) {
                    continue;
                }
                const std::string published = driver.published_name;
                Step step;
                step.name = "delete-driver:" + published;
                step.task = kCleanDrivers;
                step.description = "Delete driver package " + published + " (" + driver.original_name + ", " +
                                   driver.provider + ")";
                step.predicate = [published](const SystemSnapshot& current) {
                    return std::any_of(current.drivers.begin(), current.drivers.end(),
                                       [&](const DriverPackageRecord& d) { return d.published_name == published; });
                };
                step.action = [published](Platform::ISystemManagement& system) {
                    return system.deleteDriverPackage(published);
                };
                step.confirmations_required = rules.confirmationsFor(kCleanDrivers);
                steps.push_back(std::move(step));
            }
            return steps;
        }};
}

TaskDefinition CleanupTaskCatalog::flushDns() const {
    const int confirmations = rules_.confirmationsFor(kFlushDns);
    return {kFlushDns, "Flush the DNS resolver cache",
        [confirmations](const SystemSnapshot&) {
            Step step;
            step.name = kFlushDns;
            step.task = kFlushDns;
            step.description = "Flush the DNS resolver cache";
            step.predicate = [](const SystemSnapshot&) { return true; };
            step.action = [](Platform::ISystemManagement& system) { return system.flushDnsCache(); };
            step.idempotent = false;
            step.destructive = false;
            step.confirmations_required = confirmations;
            return std::vector<Step>{step};
        }};
}

TaskDefinition CleanupTaskCatalog::resetNetwork() const {
    const int confirmations = rules_.confirmationsFor(kResetNetwork);
    return {kResetNetwork, "Reset the TCP/IP stack and Winsock catalog",
        [confirmations](const SystemSnapshot&) {
            Step step;
            step.name = kResetNetwork;
            step.task = kResetNetwork;
            step.description = "Reset the network stack (restart required)";
            step.predicate = [](const SystemSnapshot&) { return true; };
            step.action = [](Platform::ISystemManagement& system) { return system.resetNetworkStack(); };
            step.idempotent = false;
            step.confirmations_required = confirmations;
            return std::vector<Step>{step};
        }};
}

TaskDefinition CleanupTaskCatalog::removeTools() const {
    const CleanupRules rules = rules_;
    return {kRemoveTools, "Silently uninstall the previous hypervisor's guest tools",
        [rules](const SystemSnapshot& snapshot) {
            std::vector<Step> steps;
            for (const auto& software : snapshot.software) {
                if (!rules.matchesSoftware(software)) {
                    continue;
                }
                const std::string name = software.name;
                Step step;
                step.name = "uninstall:" + name;
                step.task = kRemoveTools;
                step.description = "Uninstall " + name + (software.version.empty() ? "" : " " + software.version);
                step.predicate = [name](const SystemSnapshot& current) {
                    return std::any_of(current.software.begin(), current.software.end(),
                                       [&](const SoftwareRecord& s) { return s.name == name; });
                };
                const SoftwareRecord planned = software;
                step.action = [planned](Platform::ISystemManagement& system) {
                    return system.uninstallSoftware(planned);
                };
                step.confirmations_required = rules.confirmationsFor(kRemoveTools);
                steps.push_back(std::move(step));
            }
            return steps;
        }};
}

TaskDefinition CleanupTaskCatalog::fixDisks() const {
    const CleanupRules rules = rules_;
    return {kFixDisks, "Bring disks online, clear read-only flags and assign drive letters",
        [rules](const SystemSnapshot& snapshot) {
            std::vector<Step> steps;
            const int confirmations = rules.confirmationsFor(kFixDisks);

            std::set<char> used_letters;
            for (const auto& disk : snapshot.disks) {
                for (const auto& partition : disk.partitions) {
                    if (!partition.drive_letter.empty()) {
                        used_letters.insert(static_cast<char>(
                            std::toupper(static_cast<unsigned char>(partition.drive_letter[0]))));
                    }
                }
            }
            char next_letter = rules.first_letter;

            for (const auto& disk : snapshot.disks) {
                const int number = disk.number;
                if (rules.bring_disks_online && disk.offline) {
                    Step step;
                    step.name = "online-disk:" + std::to_string(number);
                    step.task = kFixDisks;
                    step.description = "Bring disk " + std::to_string(number) + " (" + disk.name + ") online";
                    step.predicate = [number](const SystemSnapshot& current) {
                        const auto* live = findDisk(current, number);
                        return live != nullptr && live->offline;
                    };
                    step.action = [number](Platform::ISystemManagement& system) {
                        return system.setDiskOnline(number);
                    };
                    step.confirmations_required = confirmations;
                    steps.push_back(std::move(step));
                }
                if (rules.clear_read_only && disk.read_only) {
                    Step step;
                    step.name = "clear-readonly:" + std::to_string(number);
                    step.task = kFixDisks;
                    step.description = "Clear the read-only flag of disk " + std::to_string(number);
                    step.predicate = [number](const SystemSnapshot& current) {
                        const auto* live = findDisk(current, number);
                        return live != nullptr && live->read_only;
                    };
                    step.action = [number](Platform::ISystemManagement& system) {
                        return system.clearDiskReadOnly(number);
                    };
                    step.confirmations_required = confirmations;
                    steps.push_back(std::move(step));
                }
                if (!rules.assign_letters) {
                    continue;
                }
                for (const auto& partition : disk.partitions) {
                    if (!eligibleForLetter(partition)) {
                        continue;
                    }
                    while (next_letter <= 'Z' && used_letters.count(next_letter) > 0) {
                        ++next_letter;
                    }
                    if (next_letter > 'Z') {
                        break;
                    }
                    const std::string letter(1, next_letter);
                    used_letters.insert(next_letter);
                    const int part_number = partition.number;

                    Step step;
                    step.name = "assign-letter:" + std::to_string(number) + ":" + std::to_string(part_number);
                    step.task = kFixDisks;
                    step.description = "Assign drive letter " + letter + ": to disk " + std::to_string(number) +
                                       " partition " + std::to_string(part_number);
                    step.predicate = [number, part_number](const SystemSnapshot& current) {
                        const auto* live = findDisk(current, number);
                        if (live == nullptr) {
                            return false;
                        }
                        return std::any_of(live->partitions.begin(), live->partitions.end(),
                                           [&](const PartitionRecord& p) {
                                               return p.number == part_number && p.drive_letter.empty();
                                           });
                    };
                    step.action = [number, part_number, letter](Platform::ISystemManagement& system) {
                        return system.assignDriveLetter(number, part_number, letter);
                    };
                    step.confirmations_required = confirmations;
                    steps.push_back(std::move(step));
                }
            }
            return steps;
        }};
}

} // namespace Orchestrator
} // namespace HVC
