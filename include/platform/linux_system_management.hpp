// EN: Linux collaborator: sysfs/procfs, ip -j, modprobe, resolvectl, dpkg-query/rpm, lsblk -J, blockdev.
// FR: Collaborateur Linux : sysfs/procfs, ip -j, modprobe, resolvectl, dpkg-query/rpm, lsblk -J, blockdev.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "platform/system_management.hpp"

namespace HVC {
namespace Platform {

// EN: Filesystem roots read by the Linux collaborator. Tests point them at a fixture tree.
// FR: Racines de système de fichiers lues par le collaborateur Linux. Les tests les pointent vers une arborescence de test.
struct LinuxPaths {
    std::filesystem::path sysfs_root = "/sys";
    std::filesystem::path procfs_root = "/proc";
    std::filesystem::path etc_root = "/etc";
};

class LinuxSystemManagement : public ISystemManagement {
public:
    LinuxSystemManagement(IProcessRunner& runner, Logger& logger, LinuxPaths paths = {});

    std::string platformName() const override { return "linux"; }
    bool isElevated() const override;
    std::string hostName() const override;

    // EN: PCI devices from sysfs. Linux keeps no ghost devices, so every record is present.
    // FR: Périphériques PCI depuis sysfs. Linux ne garde pas de périphériques fantômes, chaque enregistrement est présent.
    std::vector<DeviceRecord> listDevices() override;
    OperationResult removeDevice(const std::string& device_id) override;
    OperationResult rescanDevices() override;

    // EN: Loaded kernel modules stand in for driver packages.
    // FR: Les modules noyau chargés tiennent lieu de paquets de pilotes.
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

private:
    OperationResult runCommand(const std::vector<std::string>& command);
    OperationResult writeSysfs(const std::filesystem::path& file, const std::string& value);

    // EN: Device path of a disk by its enumeration number, empty if unknown.
    // FR: Chemin de périphérique d'un disque par son numéro d'énumération, vide si inconnu.
    std::string diskDevicePath(int disk_number);

    IProcessRunner& runner_;
    Logger& logger_;
    LinuxPaths paths_;
};

} // namespace Platform
} // namespace HVC
