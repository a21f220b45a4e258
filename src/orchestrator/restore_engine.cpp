// EN: Restore engine implementation.
// FR: Implémentation du moteur de restauration.

#include "orchestrator/restore_engine.hpp"

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/workflow_errors.hpp"
#include "orchestrator/workflow_sequencer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace HVC {
namespace Orchestrator {

namespace {

constexpr const char* kModule = "restore";

bool sameText(const std::string& a, const std::string& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

void addUnique(std::vector<std::string>& items, const std::string& item) {
    if (std::find(items.begin(), items.end(), item) == items.end()) {
        items.push_back(item);
    }
}

std::string describeInterface(const NetworkInterfaceRecord& iface) {
    return "interface " + iface.name + (iface.mac_address.empty() ? "" : " (" + iface.mac_address + ")");
}

} // namespace

namespace RestoreUtils {

std::vector<InterfaceMatch> mapInterfaces(const std::vector<NetworkInterfaceRecord>& saved,
                                          const std::vector<NetworkInterfaceRecord>& live) {
    std::vector<InterfaceMatch> matches;
    std::vector<bool> used(live.size(), false);

    for (const auto& saved_iface : saved) {
        matches.push_back({saved_iface, std::nullopt, ""});
    }

    // EN: MAC pass first so a renamed adapter keeps its identity.
    // FR: Passe MAC d'abord pour qu'un adaptateur renommé garde son identité.
    for (auto& match : matches) {
        const std::string mac = SnapshotUtils::normalizeMac(match.saved.mac_address);
        if (mac.empty()) {
            continue;
        }
        for (size_t i = 0; i < live.size(); ++i) {
            if (!used[i] && SnapshotUtils::normalizeMac(live[i].mac_address) == mac) {
                match.live = live[i];
                match.matched_by = "mac";
                used[i] = true;
                break;
            }
        }
    }

    for (auto& match : matches) {
        if (match.live || match.saved.name.empty()) {
            continue;
        }
        for (size_t i = 0; i < live.size(); ++i) {
            if (!used[i] && sameText(match.saved.name, live[i].name)) {
                match.live = live[i];
                match.matched_by = "name";
                used[i] = true;
                break;
            }
        }
    }
    return matches;
}

bool settingsDiffer(const NetworkInterfaceRecord& saved, const NetworkInterfaceRecord& live) {
    if (saved.dhcp_enabled != live.dhcp_enabled) {
        return true;
    }
    if (!saved.dhcp_enabled &&
        (saved.ip_address != live.ip_address || saved.prefix_length != live.prefix_length ||
         saved.gateway != live.gateway)) {
        return true;
    }
    return saved.dns_servers != live.dns_servers;
}

std::vector<DriverPackageRecord> missingDriverPackages(const std::vector<DriverPackageRecord>& saved,
                                                       const std::vector<DriverPackageRecord>& live) {
    std::vector<DriverPackageRecord> missing;
    for (const auto& package : saved) {
        const bool present = std::any_of(live.begin(), live.end(), [&](const DriverPackageRecord& candidate) {
            return sameText(candidate.original_name, package.original_name) && candidate.version == package.version;
        });
        if (!present) {
            missing.push_back(package);
        }
    }
    return missing;
}

} // namespace RestoreUtils

RestoreEngine::RestoreEngine(WorkflowSequencer& sequencer, BackupStore& backups, Logger& logger)
    : sequencer_(sequencer), backups_(backups), logger_(logger) {}

WorkflowRun RestoreEngine::restore(const BackupHandle& handle, const RestoreOptions& options) {
    const SystemSnapshot saved = backups_.load(handle);
    return restore(handle, saved, options);
}

WorkflowRun RestoreEngine::restore(const BackupHandle& handle, const SystemSnapshot& saved,
                                   const RestoreOptions& options) {
    logger_.info(kModule, "Restoring from backup", {
        {"backup", handle.id},
        {"include_network", options.include_network ? "true" : "false"},
        {"dry_run", options.dry_run ? "true" : "false"},
    });

    const int confirmations = options.include_network ? 2 : 1;
    std::vector<std::string> unmapped;

    std::vector<TaskDefinition> tasks{driverTask(handle, saved, confirmations, unmapped)};
    if (options.include_network) {
        tasks.push_back(networkTask(saved, unmapped));
    }

    SequencerOptions sequencer_options;
    sequencer_options.run_id = options.run_id;
    sequencer_options.command = kCommand;
    sequencer_options.dry_run = options.dry_run;
    sequencer_options.export_driver_packages = false;
    sequencer_options.on_plan = options.on_plan;

    WorkflowRun run = sequencer_.run(tasks, sequencer_options);
    run.unmapped_items = unmapped;
    return run;
}

TaskDefinition RestoreEngine::driverTask(const BackupHandle& handle, const SystemSnapshot& saved,
                                         int confirmations, std::vector<std::string>& unmapped) const {
    const std::filesystem::path store = BackupStore::driverStorePath(handle);
    Logger& logger = logger_;

    return {kRestoreDrivers, "Reimport exported driver packages and rescan devices",
        [saved, store, confirmations, &unmapped, &logger](const SystemSnapshot& live) {
            std::vector<Step> steps;
            const auto missing = RestoreUtils::missingDriverPackages(saved.drivers, live.drivers);

            if (!missing.empty()) {
                if (std::filesystem::is_directory(store)) {
                    const std::vector<DriverPackageRecord> saved_drivers = saved.drivers;
                    Step step;
                    step.name = "import-drivers";
                    step.task = kRestoreDrivers;
                    step.description = "Reimport " + std::to_string(missing.size()) +
                                       " driver package(s) from " + store.string();
                    step.predicate = [saved_drivers](const SystemSnapshot& current) {
                        return !RestoreUtils::missingDriverPackages(saved_drivers, current.drivers).empty();
                    };
                    const std::string directory = store.string();
                    step.action = [directory](Platform::ISystemManagement& system) {
                        return system.importDriverPackages(directory);
                    };
                    step.confirmations_required = confirmations;
                    steps.push_back(std::move(step));
                } else {
                    for (const auto& package : missing) {
                        const std::string item = "driver package " + package.original_name + " " + package.version;
                        addUnique(unmapped, item);
                        logger.warn(kModule, RestoreMappingError(item).what(), {{"reason", "no exported driver store"}});
                    }
                }
            }

            Step rescan;
            rescan.name = "rescan-devices";
            rescan.task = kRestoreDrivers;
            rescan.description = "Rescan devices so drivers bind again";
            rescan.predicate = [](const SystemSnapshot&) { return true; };
            rescan.action = [](Platform::ISystemManagement& system) { return system.rescanDevices(); };
            rescan.idempotent = false;
            rescan.destructive = false;
            rescan.confirmations_required = confirmations;
            steps.push_back(std::move(rescan));
            return steps;
        }};
}

TaskDefinition RestoreEngine::networkTask(const SystemSnapshot& saved, std::vector<std::string>& unmapped) const {
    Logger& logger = logger_;

    return {kRestoreNetwork, "Reapply saved IPv4 settings to matching interfaces",
        [saved, &unmapped, &logger](const SystemSnapshot& live) {
            std::vector<Step> steps;
            for (const auto& match : RestoreUtils::mapInterfaces(saved.network, live.network)) {
                if (!match.live) {
                    // EN: Never create an adapter; report and continue.
                    // FR: Ne jamais créer d'adaptateur ; signaler et continuer.
                    const std::string item = describeInterface(match.saved);
                    addUnique(unmapped, item);
                    logger.warn(kModule, RestoreMappingError(item).what());
                    continue;
                }
                if (!RestoreUtils::settingsDiffer(match.saved, *match.live)) {
                    continue;
                }

                const std::string live_id = match.live->id;
                const NetworkInterfaceRecord settings = match.saved;
                Step step;
                step.name = "restore-network:" + live_id;
                step.task = kRestoreNetwork;
                step.description = "Reapply " + (settings.dhcp_enabled ? std::string("DHCP")
                                       : settings.ip_address + "/" + std::to_string(settings.prefix_length)) +
                                   " to " + match.live->name + " (matched by " + match.matched_by + ")";
                step.predicate = [live_id, settings](const SystemSnapshot& current) {
                    const auto it = std::find_if(current.network.begin(), current.network.end(),
                                                 [&](const NetworkInterfaceRecord& i) { return i.id == live_id; });
                    return it != current.network.end() && RestoreUtils::settingsDiffer(settings, *it);
                };
                step.action = [live_id, settings](Platform::ISystemManagement& system) {
                    return system.applyNetworkSettings(live_id, settings);
                };
                step.confirmations_required = 2;
                steps.push_back(std::move(step));
            }
            return steps;
        }};
}

} // namespace Orchestrator
} // namespace HVC
