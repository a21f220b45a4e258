// EN: Restore engine - reverses cleanup mutations from a stored backup
// FR: Moteur de restauration - annule les mutations de nettoyage depuis une sauvegarde stockée

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "orchestrator/backup_store.hpp"
#include "orchestrator/step.hpp"
#include "orchestrator/workflow_run.hpp"

namespace HVC {

class Logger;

namespace Orchestrator {

class WorkflowSequencer;

struct RestoreOptions {
    std::string run_id;
    bool include_network = false;               // EN: Network restore is opt-in / FR: La restauration réseau est optionnelle
    bool dry_run = false;
    std::function<void(const std::vector<Step>&)> on_plan;
};

// EN: One saved interface and its live counterpart, if any.
// FR: Une interface sauvegardée et son équivalent actif, s'il existe.
struct InterfaceMatch {
    NetworkInterfaceRecord saved;
    std::optional<NetworkInterfaceRecord> live;
    std::string matched_by;                     // EN: "mac", "name" or empty / FR: "mac", "name" ou vide
};

namespace RestoreUtils {

    // EN: Map saved interfaces to live ones by normalized MAC first, then by name. A live interface is used once.
    // FR: Associe les interfaces sauvegardées aux actives par MAC normalisée puis par nom. Une interface active sert une fois.
    std::vector<InterfaceMatch> mapInterfaces(const std::vector<NetworkInterfaceRecord>& saved,
                                              const std::vector<NetworkInterfaceRecord>& live);

    // EN: True when applying `saved` would change the addressing of `live`.
    // FR: Vrai si appliquer `saved` changerait l'adressage de `live`.
    bool settingsDiffer(const NetworkInterfaceRecord& saved, const NetworkInterfaceRecord& live);

    // EN: Saved driver packages with no live package of the same original name and version.
    // FR: Paquets sauvegardés sans paquet actif de même nom d'origine et même version.
    std::vector<DriverPackageRecord> missingDriverPackages(const std::vector<DriverPackageRecord>& saved,
                                                           const std::vector<DriverPackageRecord>& live);

} // namespace RestoreUtils

class RestoreEngine {
public:
    static constexpr const char* kCommand = "restore";
    static constexpr const char* kRestoreDrivers = "restore-drivers";
    static constexpr const char* kRestoreNetwork = "restore-network";

    RestoreEngine(WorkflowSequencer& sequencer, BackupStore& backups, Logger& logger);

    // EN: Load the backup and restore it. Throws NotFoundError or CorruptDataError before any mutation.
    // FR: Charge la sauvegarde et la restaure. Lance NotFoundError ou CorruptDataError avant toute mutation.
    WorkflowRun restore(const BackupHandle& handle, const RestoreOptions& options);

    // EN: Restore from an already loaded snapshot of `handle`.
    // FR: Restaure depuis un instantané déjà chargé de `handle`.
    WorkflowRun restore(const BackupHandle& handle, const SystemSnapshot& saved, const RestoreOptions& options);

private:
    TaskDefinition driverTask(const BackupHandle& handle, const SystemSnapshot& saved, int confirmations,
                              std::vector<std::string>& unmapped) const;
    TaskDefinition networkTask(const SystemSnapshot& saved, std::vector<std::string>& unmapped) const;

    WorkflowSequencer& sequencer_;
    BackupStore& backups_;
    Logger& logger_;
};

} // namespace Orchestrator
} // namespace HVC
