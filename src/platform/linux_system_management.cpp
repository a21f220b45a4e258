// EN: Linux collaborator implementation.
// FR: Implémentation du collaborateur Linux.

#include "platform/linux_system_management.hpp"

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/process_runner.hpp"
#include "orchestrator/workflow_errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <unordered_map>

#include <nlohmann/json.hpp>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace HVC {
namespace Platform {

namespace fs = std::filesystem;

namespace {

constexpr const char* kModule = "linux";
constexpr const char* kModuleListFile = "modules.txt";

using PlatformUtils::boolField;
using PlatformUtils::numberField;
using PlatformUtils::stringField;
using PlatformUtils::trim;

std::string readFirstLine(const fs::path& file) {
    std::ifstream in(file);
    std::string line;
    if (in && std::getline(in, line)) {
        return trim(line);
    }
    return "";
}

// EN: "0x15ad" -> "15AD"
// FR: "0x15ad" -> "15AD"
std::string hexId(const std::string& raw) {
    std::string value = raw;
    if (value.starts_with("0x") || value.starts_with("0X")) {
        value = value.substr(2);
    }
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    while (value.size() < 4) {
        value.insert(value.begin(), '0');
    }
    return value;
}

std::string pciClassName(const std::string& class_code) {
    const std::string code = hexId(class_code);
    const std::string base = code.size() >= 6 ? code.substr(code.size() - 6, 2) : code.substr(0, 2);
    if (base == "01") return "Storage";
    if (base == "02") return "Net";
    if (base == "03") return "Display";
    if (base == "04") return "Multimedia";
    if (base == "06") return "Bridge";
    if (base == "0C") return "SerialBus";
    return "PCI";
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

OperationResult failure(const std::string& message) {
    OperationResult result;
    result.exit_code = 1;
    result.message = message;
    return result;
}

} // namespace

LinuxSystemManagement::LinuxSystemManagement(IProcessRunner& runner, Logger& logger, LinuxPaths paths)
    : runner_(runner), logger_(logger), paths_(std::move(paths)) {}

bool LinuxSystemManagement::isElevated() const {
#ifndef _WIN32
    return geteuid() == 0;
#else
    return false;
#endif
}

std::string LinuxSystemManagement::hostName() const {
    return readFirstLine(paths_.procfs_root / "sys" / "kernel" / "hostname");
}

OperationResult LinuxSystemManagement::runCommand(const std::vector<std::string>& command) {
    return PlatformUtils::toOperationResult(runner_.run(command));
}

OperationResult LinuxSystemManagement::writeSysfs(const fs::path& file, const std::string& value) {
    std::ofstream out(file);
    if (!out) {
        return failure("cannot open " + file.string());
    }
    out << value;
    out.flush();
    if (!out) {
        return failure("write to " + file.string() + " failed");
    }
    return {};
}

std::vector<DeviceRecord> LinuxSystemManagement::listDevices() {
    const fs::path root = paths_.sysfs_root / "bus" / "pci" / "devices";
    std::vector<DeviceRecord> devices;

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        throw SystemQueryError("devices", "cannot read " + root.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        const fs::path dir = entry.path();
        const std::string vendor = hexId(readFirstLine(dir / "vendor"));
        const std::string device_id = hexId(readFirstLine(dir / "device"));

        DeviceRecord device;
        device.id = dir.filename().string();
        device.device_class = pciClassName(readFirstLine(dir / "class"));
        device.display_name = "PCI device " + vendor + ":" + device_id;
        device.present = true;
        device.hardware_ids = {"pci:v0000" + vendor + "d0000" + device_id};

        std::error_code link_ec;
        const fs::path driver = fs::read_symlink(dir / "driver", link_ec);
        if (!link_ec) {
            device.driver = driver.filename().string();
        }
        devices.push_back(std::move(device));
    }

    std::sort(devices.begin(), devices.end(),
              [](const DeviceRecord& a, const DeviceRecord& b) { return a.id < b.id; });
    return devices;
}

OperationResult LinuxSystemManagement::removeDevice(const std::string& device_id) {
    if (device_id.find('/') != std::string::npos || device_id.find("..") != std::string::npos) {
        return failure("invalid device id " + device_id);
    }
    return writeSysfs(paths_.sysfs_root / "bus" / "pci" / "devices" / device_id / "remove", "1");
}

OperationResult LinuxSystemManagement::rescanDevices() {
    return writeSysfs(paths_.sysfs_root / "bus" / "pci" / "rescan", "1");
}

std::vector<DriverPackageRecord> LinuxSystemManagement::listDriverPackages() {
    const fs::path modules = paths_.procfs_root / "modules";
    std::ifstream in(modules);
    if (!in) {
        throw SystemQueryError("drivers", "cannot read " + modules.string());
    }

    std::vector<DriverPackageRecord> drivers;
    std::string line;
    while (std::getline(in, line)) {
        const auto fields = splitWhitespace(line);
        if (fields.empty()) {
            continue;
        }
        DriverPackageRecord driver;
        driver.published_name = fields[0];
        driver.original_name = fields[0] + ".ko";
        driver.class_name = "kernel-module";
        driver.version = readFirstLine(paths_.sysfs_root / "module" / fields[0] / "version");
        drivers.push_back(std::move(driver));
    }
    return drivers;
}

OperationResult LinuxSystemManagement::deleteDriverPackage(const std::string& published_name) {
    return runCommand({"modprobe", "-r", published_name});
}

// EN: The export is the list of loaded modules; import reloads the ones that are missing.
// FR: L'export est la liste des modules chargés ; l'import recharge ceux qui manquent.
OperationResult LinuxSystemManagement::exportDriverPackages(const std::string& directory) {
    std::vector<DriverPackageRecord> drivers;
    try {
        drivers = listDriverPackages();
    } catch (const SystemQueryError& e) {
        return failure(e.what());
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return failure("cannot create " + directory + ": " + ec.message());
    }

    std::ofstream out(fs::path(directory) / kModuleListFile);
    if (!out) {
        return failure("cannot write module list in " + directory);
    }
    for (const auto& driver : drivers) {
        out << driver.published_name << '\n';
    }
    out.flush();
    if (!out) {
        return failure("write error in " + directory);
    }

    OperationResult result;
    result.message = "exported " + std::to_string(drivers.size()) + " module names";
    return result;
}

OperationResult LinuxSystemManagement::importDriverPackages(const std::string& directory) {
    std::ifstream in(fs::path(directory) / kModuleListFile);
    if (!in) {
        return failure("no module list in " + directory);
    }

    std::set<std::string> loaded;
    try {
        for (const auto& driver : listDriverPackages()) {
            loaded.insert(driver.published_name);
        }
    } catch (const SystemQueryError& e) {
        return failure(e.what());
    }

    OperationResult result;
    std::string name;
    int reloaded = 0;
    while (std::getline(in, name)) {
        name = trim(name);
        if (name.empty() || loaded.contains(name)) {
            continue;
        }
        OperationResult step = runCommand({"modprobe", name});
        if (!step.succeeded()) {
            logger_.warn(kModule, "modprobe failed", {{"module", name}, {"detail", step.message}});
            result = step;
            continue;
        }
        ++reloaded;
    }
    if (result.succeeded()) {
        result.message = "reloaded " + std::to_string(reloaded) + " modules";
    }
    return result;
}

std::vector<NetworkInterfaceRecord> LinuxSystemManagement::listNetworkInterfaces() {
    const ProcessResult addr = runner_.run({"ip", "-j", "addr", "show"});
    if (!addr.started || addr.timed_out || addr.exit_code != 0) {
        throw SystemQueryError("network", addr.started ? "ip addr exited with code " +
                               std::to_string(addr.exit_code) : addr.error);
    }

    // EN: Default gateways per device; a failing route query leaves gateways empty.
    // FR: Passerelles par défaut par périphérique ; une requête de route en échec laisse les passerelles vides.
    std::unordered_map<std::string, std::string> gateways;
    const ProcessResult routes = runner_.run({"ip", "-j", "route", "show", "default"});
    if (routes.started && !routes.timed_out && routes.exit_code == 0) {
        for (const auto& route : PlatformUtils::parseJsonList(routes.output, "network")) {
            const std::string dev = stringField(route, "dev");
            if (!dev.empty() && !gateways.contains(dev)) {
                gateways[dev] = stringField(route, "gateway");
            }
        }
    } else {
        logger_.warn(kModule, "Default route query failed, gateways left empty");
    }

    std::vector<std::string> dns;
    std::ifstream resolv(paths_.etc_root / "resolv.conf");
    std::string line;
    while (std::getline(resolv, line)) {
        const auto fields = splitWhitespace(line);
        if (fields.size() >= 2 && fields[0] == "nameserver") {
            dns.push_back(fields[1]);
        }
    }

    std::vector<NetworkInterfaceRecord> interfaces;
    for (const auto& link : PlatformUtils::parseJsonList(addr.output, "network")) {
        if (stringField(link, "link_type") == "loopback") {
            continue;
        }

        NetworkInterfaceRecord iface;
        iface.id = stringField(link, "ifname");
        iface.name = iface.id;
        iface.mac_address = SnapshotUtils::normalizeMac(stringField(link, "address"));
        iface.dns_servers = dns;
        if (auto gw = gateways.find(iface.id); gw != gateways.end()) {
            iface.gateway = gw->second;
        }

        auto info = link.find("addr_info");
        if (info != link.end() && info->is_array()) {
            for (const auto& address : *info) {
                if (stringField(address, "family") != "inet") {
                    continue;
                }
                iface.ip_address = stringField(address, "local");
                iface.prefix_length = static_cast<int>(numberField(address, "prefixlen"));
                iface.dhcp_enabled = boolField(address, "dynamic");
                break;
            }
        }
        interfaces.push_back(std::move(iface));
    }
    return interfaces;
}

OperationResult LinuxSystemManagement::applyNetworkSettings(const std::string& interface_id,
                                                            const NetworkInterfaceRecord& settings) {
    std::vector<std::vector<std::string>> commands;
    if (settings.dhcp_enabled || settings.ip_address.empty()) {
        commands.push_back({"ip", "addr", "flush", "dev", interface_id});
        commands.push_back({"dhclient", interface_id});
    } else {
        commands.push_back({"ip", "addr", "flush", "dev", interface_id});
        commands.push_back({"ip", "addr", "add",
                            settings.ip_address + "/" + std::to_string(settings.prefix_length),
                            "dev", interface_id});
        if (!settings.gateway.empty()) {
            commands.push_back({"ip", "route", "replace", "default", "via", settings.gateway,
                                "dev", interface_id});
        }
    }
    if (!settings.dns_servers.empty()) {
        std::vector<std::string> dns = {"resolvectl", "dns", interface_id};
        dns.insert(dns.end(), settings.dns_servers.begin(), settings.dns_servers.end());
        commands.push_back(dns);
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

OperationResult LinuxSystemManagement::flushDnsCache() {
    return runCommand({"resolvectl", "flush-caches"});
}

OperationResult LinuxSystemManagement::resetNetworkStack() {
    return runCommand({"systemctl", "restart", "systemd-networkd"});
}

std::vector<SoftwareRecord> LinuxSystemManagement::listInstalledSoftware() {
    std::vector<SoftwareRecord> software;

    ProcessResult process = runner_.run({"dpkg-query", "-W", "-f=${Package}\t${Version}\t${Maintainer}\n"});
    std::string remover = "apt-get";
    if (!process.started) {
        process = runner_.run({"rpm", "-qa", "--queryformat", "%{NAME}\t%{VERSION}-%{RELEASE}\t%{VENDOR}\n"});
        remover = "dnf";
    }
    if (!process.started || process.timed_out || process.exit_code != 0) {
        throw SystemQueryError("software", process.started ? "package query exited with code " +
                               std::to_string(process.exit_code) : "no supported package manager");
    }

    std::istringstream lines(process.output);
    std::string line;
    while (std::getline(lines, line)) {
        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, '\t')) {
            fields.push_back(field);
        }
        if (fields.empty() || trim(fields[0]).empty()) {
            continue;
        }

        SoftwareRecord record;
        record.name = trim(fields[0]);
        record.version = fields.size() > 1 ? trim(fields[1]) : "";
        record.publisher = fields.size() > 2 ? trim(fields[2]) : "";
        record.product_code = record.name;
        record.uninstall_command = remover + " remove -y " + record.name;
        software.push_back(std::move(record));
    }
    return software;
}

OperationResult LinuxSystemManagement::uninstallSoftware(const SoftwareRecord& software) {
    const auto command = splitWhitespace(software.uninstall_command);
    if (command.empty()) {
        return failure("no uninstall command for " + software.name);
    }
    return runCommand(command);
}

std::vector<DiskRecord> LinuxSystemManagement::listDisks() {
    const ProcessResult process = runner_.run({"lsblk", "-J", "-b", "-o", "NAME,TYPE,SIZE,RO,MODEL,PTTYPE"});
    if (!process.started || process.timed_out || process.exit_code != 0) {
        throw SystemQueryError("disks", process.started ? "lsblk exited with code " +
                               std::to_string(process.exit_code) : process.error);
    }

    nlohmann::json parsed = nlohmann::json::parse(process.output, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("blockdevices")) {
        throw SystemQueryError("disks", "unexpected lsblk output");
    }

    std::vector<DiskRecord> disks;
    int number = 0;
    for (const auto& device : parsed["blockdevices"]) {
        if (stringField(device, "type") != "disk") {
            continue;
        }

        DiskRecord disk;
        disk.number = number++;
        disk.name = "/dev/" + stringField(device, "name");
        disk.read_only = boolField(device, "ro");
        disk.size_bytes = static_cast<std::uint64_t>(numberField(device, "size"));

        std::string style = stringField(device, "pttype");
        if (style == "dos") style = "MBR";
        std::transform(style.begin(), style.end(), style.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        disk.partition_style = style.empty() ? "RAW" : style;

        auto children = device.find("children");
        if (children != device.end() && children->is_array()) {
            int part_number = 0;
            for (const auto& child : *children) {
                if (stringField(child, "type") != "part") {
                    continue;
                }
                PartitionRecord partition;
                partition.number = ++part_number;
                partition.size_bytes = static_cast<std::uint64_t>(numberField(child, "size"));
                partition.type = "part";
                disk.partitions.push_back(std::move(partition));
            }
        }
        disks.push_back(std::move(disk));
    }
    return disks;
}

std::string LinuxSystemManagement::diskDevicePath(int disk_number) {
    for (const auto& disk : listDisks()) {
        if (disk.number == disk_number) {
            return disk.name;
        }
    }
    return "";
}

OperationResult LinuxSystemManagement::setDiskOnline(int disk_number) {
    return failure("disk " + std::to_string(disk_number) + ": offline state is not managed on Linux");
}

OperationResult LinuxSystemManagement::clearDiskReadOnly(int disk_number) {
    std::string device;
    try {
        device = diskDevicePath(disk_number);
    } catch (const SystemQueryError& e) {
        return failure(e.what());
    }
    if (device.empty()) {
        return failure("disk " + std::to_string(disk_number) + " not found");
    }
    return runCommand({"blockdev", "--setrw", device});
}

OperationResult LinuxSystemManagement::assignDriveLetter(int disk_number, int partition_number,
                                                         const std::string& letter) {
    return failure("drive letters do not exist on Linux (disk " + std::to_string(disk_number) +
                   ", partition " + std::to_string(partition_number) + ", letter " + letter + ")");
}

} // namespace Platform
} // namespace HVC
