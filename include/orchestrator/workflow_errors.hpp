// EN: Exception types raised by the cleanup workflow and its collaborators.
// FR: Types d'exception levés par le workflow de nettoyage et ses collaborateurs.

#pragma once

#include <stdexcept>
#include <string>

namespace HVC {

// EN: A run cannot start (not elevated, unsupported platform, conflicting software, bad usage).
// FR: Une exécution ne peut démarrer (non élevé, plateforme non supportée, logiciel en conflit, mauvais usage).
class PreconditionError : public std::runtime_error {
public:
    explicit PreconditionError(const std::string& message) : std::runtime_error(message) {}
};

// EN: A backup could not be written.
// FR: Une sauvegarde n'a pas pu être écrite.
class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& message) : std::runtime_error(message) {}
};

// EN: A requested backup does not exist.
// FR: Une sauvegarde demandée n'existe pas.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& backup_id)
        : std::runtime_error("Backup not found: " + backup_id), backup_id_(backup_id) {}

    const std::string& backupId() const { return backup_id_; }

private:
    std::string backup_id_;
};

// EN: Stored backup data is unreadable, malformed, incomplete or fails its checksum.
// FR: Les données de sauvegarde sont illisibles, malformées, incomplètes ou échouent au contrôle.
class CorruptDataError : public std::runtime_error {
public:
    CorruptDataError(const std::string& backup_id, const std::string& reason)
        : std::runtime_error("Backup " + backup_id + " is corrupt: " + reason), backup_id_(backup_id) {}

    const std::string& backupId() const { return backup_id_; }

private:
    std::string backup_id_;
};

// EN: A snapshot item has no live counterpart during restore.
// FR: Un élément d'instantané n'a pas d'équivalent actif pendant la restauration.
class RestoreMappingError : public std::runtime_error {
public:
    explicit RestoreMappingError(const std::string& item)
        : std::runtime_error("No live counterpart for " + item), item_(item) {}

    const std::string& item() const { return item_; }

private:
    std::string item_;
};

// EN: An inventory query against the operating system failed.
// FR: Une requête d'inventaire auprès du système d'exploitation a échoué.
class SystemQueryError : public std::runtime_error {
public:
    SystemQueryError(const std::string& section, const std::string& reason)
        : std::runtime_error("Query for " + section + " failed: " + reason), section_(section) {}

    const std::string& section() const { return section_; }

private:
    std::string section_;
};

} // namespace HVC
