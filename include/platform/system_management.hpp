// EN: Narrow interface over the operating system management surface. The engine never sees raw utility output.
// FR: Interface étroite sur la surface de gestion du système d'exploitation. Le moteur ne voit jamais la sortie brute des utilitaires.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "model/system_snapshot.hpp"

namespace HVC {

class Logger;
class IProcessRunner;
struct ProcessResult;

namespace Platform {

// EN: Result of one mutating call against the operating system.
// FR: Résultat d'un appel de mutation sur le système d'exploitation.
struct OperationResult {
    int exit_code = 0;
    bool timed_out = false;
    bool reboot_required = false;           // EN: Succeeded, restart pending / FR: Réussi, redémarrage en attente
    std::string message;

    bool succeeded() const { return exit_code == 0 && !timed_out; }
};

// EN: OS collaborator. list* methods throw SystemQueryError, mutations report through OperationResult.
// FR: Collaborateur OS. Les méthodes list* lancent SystemQueryError, les mutations répondent par OperationResult.
class ISystemManagement {
public:
    virtual ~ISystemManagement() = default;

    virtual std::string platformName() const = 0;
    virtual bool isElevated() const = 0;
    virtual std::string hostName() const = 0;

    // EN: Devices, including non-present ones
    // FR: Périphériques, y compris non présents
    virtual std::vector<DeviceRecord> listDevices() = 0;
    virtual OperationResult removeDevice(const std::string& device_id) = 0;
    virtual OperationResult rescanDevices() = 0;

    // EN: Driver package store
    // FR: Magasin de paquets de pilotes
    virtual std::vector<DriverPackageRecord> listDriverPackages() = 0;
    virtual OperationResult deleteDriverPackage(const std::string& published_name) = 0;
    virtual OperationResult exportDriverPackages(const std::string& directory) = 0;
    virtual OperationResult importDriverPackages(const std::string& directory) = 0;

    // EN: Network configuration
    // FR: Configuration réseau
    virtual std::vector<NetworkInterfaceRecord> listNetworkInterfaces() = 0;
    virtual OperationResult applyNetworkSettings(const std::string& interface_id,
                                                 const NetworkInterfaceRecord& settings) = 0;
    virtual OperationResult flushDnsCache() = 0;
    virtual OperationResult resetNetworkStack() = 0;

    // EN: Installed software
    // FR: Logiciels installés
    virtual std::vector<SoftwareRecord> listInstalledSoftware() = 0;
    virtual OperationResult uninstallSoftware(const SoftwareRecord& software) = 0;

    // EN: Disks and volumes
    // FR: Disques et volumes
    virtual std::vector<DiskRecord> listDisks() = 0;
    virtual OperationResult setDiskOnline(int disk_number) = 0;
    virtual OperationResult clearDiskReadOnly(int disk_number) = 0;
    virtual OperationResult assignDriveLetter(int disk_number, int partition_number,
                                              const std::string& letter) = 0;
};

// EN: Create the collaborator for the running platform. Throws PreconditionError on unsupported platforms.
// FR: Crée le collaborateur pour la plateforme courante. Lance PreconditionError sur une plateforme non supportée.
std::unique_ptr<ISystemManagement> createSystemManagement(IProcessRunner& runner, Logger& logger);

namespace PlatformUtils {

    // EN: Map a process outcome to an operation result, keeping the tail of the output as message.
    // FR: Convertit un résultat de processus en résultat d'opération, en gardant la fin de la sortie comme message.
    OperationResult toOperationResult(const ProcessResult& process);

    // EN: Parse JSON emitted by a utility. A single object becomes a one-element array, empty output an empty array.
    // FR: Analyse le JSON émis par un utilitaire. Un objet seul devient un tableau d'un élément, une sortie vide un tableau vide.
    nlohmann::json parseJsonList(const std::string& output, const std::string& section);

    // EN: Replace every byte that is not part of a well-formed UTF-8 sequence with U+FFFD.
    // FR: Remplace chaque octet hors séquence UTF-8 bien formée par U+FFFD.
    std::string repairUtf8(const std::string& text);

    // EN: Tolerant field readers: null or missing fields give the fallback.
    // FR: Lecteurs de champs tolérants : champs nuls ou absents donnent la valeur de repli.
    std::string stringField(const nlohmann::json& object, const std::string& key);
    bool boolField(const nlohmann::json& object, const std::string& key, bool fallback = false);
    long long numberField(const nlohmann::json& object, const std::string& key, long long fallback = 0);
    std::vector<std::string> stringListField(const nlohmann::json& object, const std::string& key);

    std::string trim(const std::string& value);

} // namespace PlatformUtils

} // namespace Platform
} // namespace HVC
