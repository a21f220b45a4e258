// EN: Backup store - timestamped, checksummed snapshots of system state on disk
// FR: Magasin de sauvegardes - instantanés horodatés et contrôlés de l'état système sur disque

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "model/system_snapshot.hpp"

namespace HVC {

class Logger;

namespace Orchestrator {

// EN: Reference to one stored backup. Ids sort chronologically as strings.
// FR: Référence vers une sauvegarde stockée. Les ids se trient chronologiquement comme chaînes.
struct BackupHandle {
    std::string id;                             // EN: YYYYMMDDTHHMMSS.mmmZ / FR: YYYYMMDDTHHMMSS.mmmZ
    std::filesystem::path path;

    bool operator==(const BackupHandle&) const = default;
};

// EN: Layout: <root>/<id>/manifest.json plus one JSON file per section, each with its CRC-32 in the manifest.
// FR: Disposition : <root>/<id>/manifest.json plus un fichier JSON par section, chacun avec son CRC-32 dans le manifeste.
class BackupStore {
public:
    using Clock = std::function<std::int64_t()>;

    static constexpr int kFormatVersion = 1;
    static constexpr const char* kManifestFile = "manifest.json";
    static constexpr const char* kDriverStoreDir = "driver-store";

    BackupStore(std::filesystem::path root, Logger& logger, Clock clock = SnapshotUtils::nowMs);

    // EN: Persist a snapshot under a fresh id. Never overwrites. Throws BackupError.
    // FR: Persiste un instantané sous un nouvel id. N'écrase jamais. Lance BackupError.
    BackupHandle save(const SystemSnapshot& snapshot);

    std::optional<BackupHandle> latest() const;

    // EN: All handles, newest first. Staging directories and foreign entries are ignored.
    // FR: Tous les handles, du plus récent au plus ancien. Les répertoires de transit et entrées étrangères sont ignorés.
    std::vector<BackupHandle> list() const;

    std::optional<BackupHandle> find(const std::string& id) const;

    // EN: Throws NotFoundError when missing and CorruptDataError when unreadable or failing its checksum.
    // FR: Lance NotFoundError si absente et CorruptDataError si illisible ou en échec de contrôle.
    SystemSnapshot load(const BackupHandle& handle) const;

    // EN: Directory receiving exported driver packages for this backup. Created on demand; throws BackupError.
    // FR: Répertoire recevant les paquets de pilotes exportés pour cette sauvegarde. Créé à la demande ; lance BackupError.
    std::filesystem::path createDriverStore(const BackupHandle& handle) const;
    static std::filesystem::path driverStorePath(const BackupHandle& handle);

    const std::filesystem::path& root() const { return root_; }

    static std::string formatId(std::int64_t epoch_ms);
    static std::optional<std::int64_t> parseId(const std::string& id);

private:
    void writeFile(const std::filesystem::path& path, const std::string& content) const;

    std::filesystem::path root_;
    Logger& logger_;
    Clock clock_;
};

} // namespace Orchestrator
} // namespace HVC
