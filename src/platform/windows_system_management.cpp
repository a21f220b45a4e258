// EN: Windows collaborator implementation. Utility text is parsed here and never leaves this file.
// FR: Implémentation du collaborateur Windows. Le texte des utilitaires est analysé ici et ne sort jamais de ce fichier.

#include "platform/windows_system_management.hpp"

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "orchestrator/workflow_errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#else
#include <unistd.h>
#endif

namespace HVC {
namespace Platform {

namespace {

constexpr const char* kModule = "windows";

using PlatformUtils::boolField;
using PlatformUtils::numberField;
using PlatformUtils::stringField;
using PlatformUtils::stringListField;

// EN: Redirected output otherwise uses the console OEM code page.
// FR: Sinon la sortie redirigée utilise la page de code OEM de la console.
const char* const kUtf8Prelude = "[Console]::OutputEncoding = [System.Text.Encoding]::UTF8; ";

const char* const kDeviceScript =
    "Get-PnpDevice | Select-Object InstanceId,Class,FriendlyName,Present,HardwareID,Service "
    "| ConvertTo-Json -Compress -Depth 3";

const char* const kDriverScript =
    "Get-WindowsDriver -Online | Select-Object Driver,OriginalFileName,ProviderName,ClassName,Version "
    "| ConvertTo-Json -Compress";

const char* const kNetworkScript =
    "Get-NetAdapter | ForEach-Object { $i = $_.ifIndex; "
    "$ip = Get-NetIPAddress -InterfaceIndex $i -AddressFamily IPv4 -ErrorAction SilentlyContinue | Select-Object -First 1; "
    "$gw = Get-NetRoute -InterfaceIndex $i -DestinationPrefix '0.0.0.0/0' -ErrorAction SilentlyContinue | Select-Object -First 1; "
    "$dns = (Get-DnsClientServerAddress -InterfaceIndex $i -AddressFamily IPv4 -ErrorAction SilentlyContinue).ServerAddresses; "
    "$dhcp = (Get-NetIPInterface -InterfaceIndex $i -AddressFamily IPv4 -ErrorAction SilentlyContinue).Dhcp; "
    "[pscustomobject]@{ Index = $i; Name = $_.Name; Mac = $_.MacAddress; Ip = $ip.IPAddress; "
    "Prefix = $ip.PrefixLength; Gateway = $gw.NextHop; Dns = @($dns); Dhcp = ([string]$dhcp -eq 'Enabled') } } "
    "| ConvertTo-Json -Compress -Depth 3";

const char* const kSoftwareScript =
    "$keys = 'HKLM:\\Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\*', "
    "'HKLM:\\Software\\WOW6432Node\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\*'; "
    "Get-ItemProperty $keys -ErrorAction SilentlyContinue | Where-Object { $_.DisplayName } | ForEach-Object { "
    "[pscustomobject]@{ Name = $_.DisplayName; Version = $_.DisplayVersion; Publisher = $_.Publisher; "
    "Code = $_.PSChildName; Uninstall = $_.UninstallString } } | ConvertTo-Json -Compress";

const char* const kDiskScript =
    "Get-Disk | ForEach-Object { $n = $_.Number; [pscustomobject]@{ Number = $n; Name = $_.FriendlyName; "
    "Offline = $_.IsOffline; ReadOnly = $_.IsReadOnly; Style = [string]$_.PartitionStyle; Size = $_.Size; "
    "Partitions = @(Get-Partition -DiskNumber $n -ErrorAction SilentlyContinue | ForEach-Object { "
    "[pscustomobject]@{ Number = $_.PartitionNumber; Letter = [string]$_.DriveLetter; Size = $_.Size; "
    "Type = [string]$_.Type } }) } } | ConvertTo-Json -Compress -Depth 4";

const char* const kStorageProbeScript =
    "if (Get-Command Set-Disk -ErrorAction SilentlyContinue) { exit 0 } else { exit 1 }";

std::string fileNameOf(const std::string& path) {
    const auto pos = path.find_last_of("\\/");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

bool looksLikeProductCode(const std::string& code) {
    static const std::regex guid(R"(^\{[0-9A-Fa-f]{8}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{12}\}$)");
    return std::regex_match(code, guid);
}

// EN: Get-Partition reports a NUL character when no letter is assigned.
// FR: Get-Partition renvoie un caractère NUL quand aucune lettre n'est attribuée.
std::string cleanDriveLetter(const std::string& letter) {
    for (char c : letter) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return "";
}

std::string lowercase(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

} // namespace

std::optional<std::vector<std::string>> WindowsSystemManagement::silentMsiCommand(const std::string& uninstall) {
    std::istringstream words(uninstall);
    std::vector<std::string> tokens;
    for (std::string word; words >> word;) {
        tokens.push_back(word);
    }
    if (tokens.empty()) {
        return std::nullopt;
    }

    std::string program = tokens.front();
    program.erase(std::remove(program.begin(), program.end(), '"'), program.end());
    const std::string name = lowercase(fileNameOf(program));
    if (name != "msiexec.exe" && name != "msiexec") {
        return std::nullopt;
    }

    std::vector<std::string> command{"msiexec.exe"};
    for (size_t i = 1; i < tokens.size(); ++i) {
        std::string token = tokens[i];
        const std::string lower = lowercase(token);
        // EN: Drop the registered UI flags; ours are appended below.
        // FR: Supprime les options d'interface enregistrées ; les nôtres sont ajoutées ensuite.
        if (lower.rfind("/q", 0) == 0 || lower == "/norestart" || lower == "/passive") {
            continue;
        }
        if (lower.rfind("/i", 0) == 0) {
            token = "/X" + token.substr(2);
        }
        command.push_back(token);
    }
    command.push_back("/qn");
    command.push_back("/norestart");
    return command;
}

WindowsSystemManagement::WindowsSystemManagement(IProcessRunner& runner, Logger& logger)
    : runner_(runner), logger_(logger) {}

bool WindowsSystemManagement::isElevated() const {
#ifdef _WIN32
    return IsUserAnAdmin() != FALSE;
#else
    return geteuid() == 0;
#endif
}

std::string WindowsSystemManagement::hostName() const {
#ifdef _WIN32
    char buffer[MAX_COMPUTERNAME_LENGTH + 1];
    DWORD size = sizeof(buffer);
    if (GetComputerNameA(buffer, &size)) {
        return std::string(buffer, size);
    }
    return "";
#else
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0) {
        return buffer;
    }
    return "";
#endif
}

nlohmann::json WindowsSystemManagement::queryJson(const std::string& section, const std::string& script) {
    const ProcessResult process = runner_.run({"powershell.exe", "-NoProfile", "-NonInteractive",
                                               "-ExecutionPolicy", "Bypass", "-Command",
                                               std::string(kUtf8Prelude) + script});
    if (!process.started) {
        throw SystemQueryError(section, process.error);
    }
    if (process.timed_out) {
        throw SystemQueryError(section, "timed out");
    }
    if (process.exit_code != 0) {
        throw SystemQueryError(section, "powershell exited with code " + std::to_string(process.exit_code));
    }
    return PlatformUtils::parseJsonList(process.output, section);
}

OperationResult WindowsSystemManagement::runPowerShell(const std::string& script) {
    return runCommand({"powershell.exe", "-NoProfile", "-NonInteractive",
                       "-ExecutionPolicy", "Bypass", "-Command", script});
}

OperationResult WindowsSystemManagement::runCommand(const std::vector<std::string>& command) {
    return PlatformUtils::toOperationResult(runner_.run(command));
}

std::vector<DeviceRecord> WindowsSystemManagement::listDevices() {
    std::vector<DeviceRecord> devices;
    for (const auto& item : queryJson("devices", kDeviceScript)) {
        DeviceRecord device;
        device.id = stringField(item, "InstanceId");
        device.device_class = stringField(item, "Class");
        device.display_name = stringField(item, "FriendlyName");
        device.present = boolField(item, "Present");
        device.hardware_ids = stringListField(item, "HardwareID");
        device.driver = stringField(item, "Service");
        if (!device.id.empty()) {
            devices.push_back(std::move(device));
        }
    }
    return devices;
}

OperationResult WindowsSystemManagement::removeDevice(const std::string& device_id) {
    return runCommand({"pnputil.exe", "/remove-device", device_id});
}

OperationResult WindowsSystemManagement::rescanDevices() {
    return runCommand({"pnputil.exe", "/scan-devices"});
}

std::vector<DriverPackageRecord> WindowsSystemManagement::listDriverPackages() {
    std::vector<DriverPackageRecord> drivers;
    for (const auto& item : queryJson("drivers", kDriverScript)) {
        DriverPackageRecord driver;
        driver.published_name = stringField(item, "Driver");
        driver.original_name = fileNameOf(stringField(item, "OriginalFileName"));
        driver.provider = stringField(item, "ProviderName");
        driver.class_name = stringField(item, "ClassName");
        driver.version = stringField(item, "Version");
        if (!driver.published_name.empty()) {
            drivers.push_back(std::move(driver));
        }
    }
    return drivers;
}

OperationResult WindowsSystemManagement::deleteDriverPackage(const std::string& published_name) {
    return runCommand({"pnputil.exe", "/delete-driver", published_name, "/uninstall", "/force"});
}

OperationResult WindowsSystemManagement::exportDriverPackages(const std::string& directory) {
    return runCommand({"pnputil.exe", "/export-driver", "*", directory});
}

OperationResult WindowsSystemManagement::importDriverPackages(const std::string& directory) {
    return runCommand({"pnputil.exe", "/add-driver", directory + "\\*.inf", "/subdirs", "/install"});
}

std::vector<NetworkInterfaceRecord> WindowsSystemManagement::listNetworkInterfaces() {
    std::vector<NetworkInterfaceRecord> interfaces;
    for (const auto& item : queryJson("network", kNetworkScript)) {
        NetworkInterfaceRecord iface;
        iface.id = std::to_string(numberField(item, "Index"));
        iface.name = stringField(item, "Name");
        iface.mac_address = SnapshotUtils::normalizeMac(stringField(item, "Mac"));
        iface.ip_address = stringField(item, "Ip");
        iface.prefix_length = static_cast<int>(numberField(item, "Prefix"));
        iface.gateway = stringField(item, "Gateway");
        iface.dns_servers = stringListField(item, "Dns");
        iface.dhcp_enabled = boolField(item, "Dhcp");
        interfaces.push_back(std::move(iface));
    }
    return interfaces;
}

std::string WindowsSystemManagement::prefixToMask(int prefix_length) {
    if (prefix_length < 0) prefix_length = 0;
    if (prefix_length > 32) prefix_length = 32;
    const std::uint32_t mask = prefix_length == 0 ? 0u : 0xFFFFFFFFu << (32 - prefix_length);
    return std::to_string((mask >> 24) & 0xFF) + "." + std::to_string((mask >> 16) & 0xFF) + "." +
           std::to_string((mask >> 8) & 0xFF) + "." + std::to_string(mask & 0xFF);
}

OperationResult WindowsSystemManagement::applyNetworkSettings(const std::string& interface_id,
                                                              const NetworkInterfaceRecord& settings) {
    const std::string name = "name=" + interface_id;

    std::vector<std::vector<std::string>> commands;
    if (settings.dhcp_enabled || settings.ip_address.empty()) {
        commands.push_back({"netsh.exe", "interface", "ipv4", "set", "address", name, "source=dhcp"});
    } else {
        std::vector<std::string> address = {"netsh.exe", "interface", "ipv4", "set", "address", name,
                                            "source=static", "address=" + settings.ip_address,
                                            "mask=" + prefixToMask(settings.prefix_length)};
        if (!settings.gateway.empty()) {
            address.push_back("gateway=" + settings.gateway);
        }
        commands.push_back(address);
    }

    if (settings.dns_servers.empty()) {
        commands.push_back({"netsh.exe", "interface", "ipv4", "set", "dnsservers", name, "source=dhcp"});
    } else {
        commands.push_back({"netsh.exe", "interface", "ipv4", "set", "dnsservers", name,
                            "source=static", "address=" + settings.dns_servers.front(), "validate=no"});
        for (size_t i = 1; i < settings.dns_servers.size(); ++i) {
            commands.push_back({"netsh.exe", "interface", "ipv4", "add", "dnsservers", name,
                                "address=" + settings.dns_servers[i], "index=" + std::to_string(i + 1),
                                "validate=no"});
        }
    }

    OperationResult result;
    for (const auto& command : commands) {
        result = runCommand(command);
        if (!result.succeeded()) {
            return result;
        }
    }
    return result;
}

OperationResult WindowsSystemManagement::flushDnsCache() {
    return runCommand({"ipconfig.exe", "/flushdns"});
}

OperationResult WindowsSystemManagement::resetNetworkStack() {
    OperationResult result = runCommand({"netsh.exe", "int", "ip", "reset"});
    if (!result.succeeded()) {
        return result;
    }
    result = runCommand({"netsh.exe", "winsock", "reset"});
    if (result.succeeded()) {
        result.reboot_required = true;
    }
    return result;
}

std::vector<SoftwareRecord> WindowsSystemManagement::listInstalledSoftware() {
    std::vector<SoftwareRecord> software;
    for (const auto& item : queryJson("software", kSoftwareScript)) {
        SoftwareRecord record;
        record.name = stringField(item, "Name");
        record.version = stringField(item, "Version");
        record.publisher = stringField(item, "Publisher");
        const std::string code = stringField(item, "Code");
        record.product_code = looksLikeProductCode(code) ? code : "";
        record.uninstall_command = stringField(item, "Uninstall");
        software.push_back(std::move(record));
    }
    return software;
}

OperationResult WindowsSystemManagement::uninstallSoftware(const SoftwareRecord& software) {
    if (!software.product_code.empty()) {
        return runCommand({"msiexec.exe", "/x", software.product_code, "/qn", "/norestart"});
    }
    if (auto command = silentMsiCommand(software.uninstall_command)) {
        logger_.info(kModule, "No MSI product code, using the registered msiexec command silently",
                     {{"software", software.name}});
        return runCommand(*command);
    }

    OperationResult result;
    result.exit_code = -1;
    if (software.uninstall_command.empty()) {
        result.message = "no uninstall method registered for " + software.name;
    } else {
        // EN: Never launch an interactive uninstaller.
        // FR: Ne jamais lancer de désinstalleur interactif.
        result.message = "manual removal required for " + software.name + ": no silent uninstall for '" +
                         software.uninstall_command + "'";
        logger_.warn(kModule, "Uninstall command is not silent", {{"software", software.name},
                                                                 {"command", software.uninstall_command}});
    }
    return result;
}

std::vector<DiskRecord> WindowsSystemManagement::listDisks() {
    std::vector<DiskRecord> disks;
    for (const auto& item : queryJson("disks", kDiskScript)) {
        DiskRecord disk;
        disk.number = static_cast<int>(numberField(item, "Number"));
        disk.name = stringField(item, "Name");
        disk.offline = boolField(item, "Offline");
        disk.read_only = boolField(item, "ReadOnly");
        disk.partition_style = stringField(item, "Style");
        disk.size_bytes = static_cast<std::uint64_t>(numberField(item, "Size"));

        auto partitions = item.find("Partitions");
        if (partitions != item.end() && !partitions->is_null()) {
            const nlohmann::json list = partitions->is_array() ? *partitions : nlohmann::json::array({*partitions});
            for (const auto& part : list) {
                PartitionRecord partition;
                partition.number = static_cast<int>(numberField(part, "Number"));
                partition.drive_letter = cleanDriveLetter(stringField(part, "Letter"));
                partition.size_bytes = static_cast<std::uint64_t>(numberField(part, "Size"));
                partition.type = stringField(part, "Type");
                disk.partitions.push_back(std::move(partition));
            }
        }
        disks.push_back(std::move(disk));
    }
    return disks;
}

bool WindowsSystemManagement::storageCmdletsAvailable() {
    if (!storage_cmdlets_) {
        storage_cmdlets_ = runPowerShell(kStorageProbeScript).succeeded();
        if (!*storage_cmdlets_) {
            logger_.warn(kModule, "Storage cmdlets unavailable, falling back to diskpart");
        }
    }
    return *storage_cmdlets_;
}

OperationResult WindowsSystemManagement::runDiskpart(const std::vector<std::string>& script_lines) {
    const auto script_path = std::filesystem::temp_directory_path() /
        ("hvc-diskpart-" + std::to_string(SnapshotUtils::nowMs()) + ".txt");

    {
        std::ofstream script(script_path);
        if (!script) {
            OperationResult result;
            result.exit_code = -1;
            result.message = "cannot write diskpart script " + script_path.string();
            return result;
        }
        for (const auto& line : script_lines) {
            script << line << "\r\n";
        }
    }

    OperationResult result = runCommand({"diskpart.exe", "/s", script_path.string()});

    std::error_code ec;
    std::filesystem::remove(script_path, ec);
    return result;
}

OperationResult WindowsSystemManagement::setDiskOnline(int disk_number) {
    const std::string disk = std::to_string(disk_number);
    if (storageCmdletsAvailable()) {
        return runPowerShell("Set-Disk -Number " + disk + " -IsOffline $false");
    }
    return runDiskpart({"select disk " + disk, "online disk noerr"});
}

OperationResult WindowsSystemManagement::clearDiskReadOnly(int disk_number) {
    const std::string disk = std::to_string(disk_number);
    if (storageCmdletsAvailable()) {
        return runPowerShell("Set-Disk -Number " + disk + " -IsReadOnly $false");
    }
    return runDiskpart({"select disk " + disk, "attributes disk clear readonly noerr"});
}

OperationResult WindowsSystemManagement::assignDriveLetter(int disk_number, int partition_number,
                                                           const std::string& letter) {
    const std::string disk = std::to_string(disk_number);
    const std::string partition = std::to_string(partition_number);
    if (storageCmdletsAvailable()) {
        return runPowerShell("Set-Partition -DiskNumber " + disk + " -PartitionNumber " + partition +
                             " -NewDriveLetter " + letter);
    }
    return runDiskpart({"select disk " + disk, "select partition " + partition, "assign letter=" + letter});
}

} // namespace Platform
} // namespace HVC
