// EN: Normalized system state records captured by the inventory probe and persisted by the backup store.
// FR: Enregistrements normalisés de l'état système capturés par la sonde d'inventaire et persistés par le magasin de sauvegardes.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace HVC {

// EN: One device known to the OS configuration, attached or not.
// FR: Un périphérique connu de la configuration de l'OS, connecté ou non.
struct DeviceRecord {
    std::string id;                             // EN: Instance id / FR: Identifiant d'instance
    std::string device_class;                   // EN: Setup class (Net, SCSIAdapter, ...) / FR: Classe d'installation
    std::string display_name;
    bool present = false;                       // EN: False for ghost devices / FR: Faux pour les périphériques fantômes
    std::vector<std::string> hardware_ids;
    std::string driver;                         // EN: Bound driver or service / FR: Pilote ou service lié

    bool operator==(const DeviceRecord&) const = default;
};

// EN: One driver package in the driver store (or one loaded kernel module on Linux).
// FR: Un paquet de pilote du magasin de pilotes (ou un module noyau chargé sous Linux).
struct DriverPackageRecord {
    std::string published_name;                 // EN: e.g. oem12.inf / FR: ex. oem12.inf
    std::string original_name;
    std::string provider;
    std::string class_name;
    std::string version;

    bool operator==(const DriverPackageRecord&) const = default;
};

// EN: IPv4 settings of one network interface.
// FR: Paramètres IPv4 d'une interface réseau.
struct NetworkInterfaceRecord {
    std::string id;                             // EN: Interface index or kernel name / FR: Index d'interface ou nom noyau
    std::string name;                           // EN: Friendly name / FR: Nom convivial
    std::string mac_address;                    // EN: Normalized AA:BB:CC:DD:EE:FF / FR: Normalisé AA:BB:CC:DD:EE:FF
    std::string ip_address;
    int prefix_length = 0;
    std::string gateway;
    std::vector<std::string> dns_servers;
    bool dhcp_enabled = false;

    bool operator==(const NetworkInterfaceRecord&) const = default;
};

struct PartitionRecord {
    int number = 0;
    std::string drive_letter;                   // EN: Empty when unassigned / FR: Vide si non attribuée
    std::uint64_t size_bytes = 0;
    std::string type;

    bool operator==(const PartitionRecord&) const = default;
};

struct DiskRecord {
    int number = 0;
    std::string name;
    bool offline = false;
    bool read_only = false;
    std::string partition_style;                // EN: GPT, MBR or RAW / FR: GPT, MBR ou RAW
    std::uint64_t size_bytes = 0;
    std::vector<PartitionRecord> partitions;

    bool operator==(const DiskRecord&) const = default;
};

struct SoftwareRecord {
    std::string name;
    std::string version;
    std::string publisher;
    std::string product_code;                   // EN: MSI product code when available / FR: Code produit MSI si disponible
    std::string uninstall_command;

    bool operator==(const SoftwareRecord&) const = default;
};

// EN: Point-in-time record of system state. Immutable once captured.
// FR: Enregistrement ponctuel de l'état système. Immuable une fois capturé.
struct SystemSnapshot {
    std::int64_t captured_at_ms = 0;            // EN: Milliseconds since epoch, UTC / FR: Millisecondes depuis l'epoch, UTC
    std::string host;
    std::string platform;
    std::vector<DeviceRecord> devices;
    std::vector<DriverPackageRecord> drivers;
    std::vector<NetworkInterfaceRecord> network;
    std::vector<DiskRecord> disks;
    std::vector<SoftwareRecord> software;
    bool partial = false;
    std::vector<std::string> failed_sections;

    bool operator==(const SystemSnapshot&) const = default;
};

// EN: JSON mapping used by the backup store and the run log. from_json throws nlohmann::json::exception on missing fields.
// FR: Correspondance JSON utilisée par le magasin de sauvegardes et le journal. from_json lance nlohmann::json::exception si un champ manque.
void to_json(nlohmann::json& j, const DeviceRecord& record);
void from_json(const nlohmann::json& j, DeviceRecord& record);
void to_json(nlohmann::json& j, const DriverPackageRecord& record);
void from_json(const nlohmann::json& j, DriverPackageRecord& record);
void to_json(nlohmann::json& j, const NetworkInterfaceRecord& record);
void from_json(const nlohmann::json& j, NetworkInterfaceRecord& record);
void to_json(nlohmann::json& j, const PartitionRecord& record);
void from_json(const nlohmann::json& j, PartitionRecord& record);
void to_json(nlohmann::json& j, const DiskRecord& record);
void from_json(const nlohmann::json& j, DiskRecord& record);
void to_json(nlohmann::json& j, const SoftwareRecord& record);
void from_json(const nlohmann::json& j, SoftwareRecord& record);

namespace SnapshotUtils {

    // EN: Uppercase, colon-separated MAC. Accepts '-', ':' or no separator; returns "" for malformed input.
    // FR: MAC en majuscules séparée par ':'. Accepte '-', ':' ou aucun séparateur ; retourne "" si malformée.
    std::string normalizeMac(const std::string& mac);

    // EN: Current time in milliseconds since epoch.
    // FR: Heure actuelle en millisecondes depuis l'epoch.
    std::int64_t nowMs();

    // EN: ISO-8601 UTC rendering of a millisecond timestamp.
    // FR: Rendu ISO-8601 UTC d'un horodatage en millisecondes.
    std::string formatTimestampMs(std::int64_t ms);

    // EN: Case-insensitive glob match supporting '*' and '?'.
    // FR: Correspondance glob insensible à la casse supportant '*' et '?'.
    bool globMatch(const std::string& pattern, const std::string& text);
    bool matchesAny(const std::vector<std::string>& patterns, const std::string& text);

} // namespace SnapshotUtils

} // namespace HVC
