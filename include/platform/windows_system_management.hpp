// EN: Windows collaborator: PowerShell queries with JSON output, pnputil, netsh, ipconfig, msiexec, diskpart fallback.
// FR: Collaborateur Windows : requêtes PowerShell en JSON, pnputil, netsh, ipconfig, msiexec, repli diskpart.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "platform/system_management.hpp"

namespace HVC {
namespace Platform {

class WindowsSystemManagement : public ISystemManagement {
public:
    WindowsSystemManagement(IProcessRunner& runner, Logger& logger);

    std::string platformName() const override { return "windows"; }
    bool isElevated() const override;
    std::string hostName() const override;

    std::vector<DeviceRecord> listDevices() override;
    OperationResult removeDevice(const std::string& device_id) override;
    OperationResult rescanDevices() override;

    std::vector<DriverPackageRecord> listDriverPackages() override;
    OperationResult deleteDriverPackage(const std::string& published_name) override;
    OperationResult exportDriverPackages(const std::string& directory) override;
    OperationResult importDriverPackages(const std::string& directory) override;

    std::vector<NetworkInterfaceRecord> listNetworkInterfaces() override;
    OperationResult applyNetworkSettings(const std::string& interface_id,
                                         const NetworkInterfaceRecord& settings) override;
    OperationResult flushDnsCache() override;
    OperationResult resetNetworkStack() override;

    std::vector<SoftwareRecord> listInstalledSoftware() override;
    OperationResult uninstallSoftware(const SoftwareRecord& software) override;

    std::vector<DiskRecord> listDisks() override;
    OperationResult setDiskOnline(int disk_number) override;
    OperationResult clearDiskReadOnly(int disk_number) override;
    OperationResult assignDriveLetter(int disk_number, int partition_number,
                                      const std::string& letter) override;

    // EN: Dotted-quad mask for a prefix length (24 -> 255.255.255.0).
    // FR: Masque pointé pour une longueur de préfixe (24 -> 255.255.255.0).
    static std::string prefixToMask(int prefix_length);

    // EN: Silent msiexec command for a registered MsiExec uninstall string (/I becomes /X, /qn /norestart appended).
    //     Empty for any other uninstaller.
    // FR: Commande msiexec silencieuse pour une chaîne de désinstallation MsiExec (/I devient /X, /qn /norestart ajoutés).
    //     Vide pour tout autre désinstalleur.
    static std::optional<std::vector<std::string>> silentMsiCommand(const std::string& uninstall);

private:
    // EN: Run a PowerShell script and parse its ConvertTo-Json output.
    // FR: Exécute un script PowerShell et analyse sa sortie ConvertTo-Json.
    nlohmann::json queryJson(const std::string& section, const std::string& script);

    OperationResult runPowerShell(const std::string& script);
    OperationResult runCommand(const std::vector<std::string>& command);

    // EN: Storage cmdlets are probed once; diskpart is used when they are missing.
    // FR: Les cmdlets Storage sont sondées une fois ; diskpart est utilisé si elles manquent.
    bool storageCmdletsAvailable();
    OperationResult runDiskpart(const std::vector<std::string>& script_lines);

    IProcessRunner& runner_;
    Logger& logger_;
    std::optional<bool> storage_cmdlets_;
};

} // namespace Platform
} // namespace HVC
