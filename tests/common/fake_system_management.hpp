// EN: Stateful in-memory OS collaborator. Successful mutations update the state so later
//     inventory captures see their effect.
// FR: Collaborateur OS en mémoire avec état. Les mutations réussies mettent l'état à jour pour
//     que les captures d'inventaire suivantes voient leur effet.

#pragma once

#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "orchestrator/workflow_errors.hpp"
#include "platform/system_management.hpp"

namespace HVC {
namespace Testing {

struct FakeSystemState {
    std::string host = "guest-01";
    std::string platform = "windows";
    bool elevated = true;

    std::vector<DeviceRecord> devices;
    std::vector<DriverPackageRecord> drivers;
    std::vector<NetworkInterfaceRecord> network;
    std::vector<DiskRecord> disks;
    std::vector<SoftwareRecord> software;

    // EN: Packages that importDriverPackages brings back into the store.
    // FR: Paquets que importDriverPackages remet dans le magasin.
    std::vector<DriverPackageRecord> importable_drivers;

    // EN: Sections whose list* call throws SystemQueryError.
    // FR: Sections dont l'appel list* lance SystemQueryError.
    std::set<std::string> failing_sections;

    // EN: Scripted results keyed by mutation call, e.g. "removeDevice:PCI\\VEN_15AD".
    // FR: Résultats scriptés indexés par appel de mutation, ex. "removeDevice:PCI\\VEN_15AD".
    std::map<std::string, Platform::OperationResult> results;

    std::vector<std::string> mutations;
    int inventory_queries = 0;
};

class FakeSystemManagement : public Platform::ISystemManagement {
public:
    explicit FakeSystemManagement(std::shared_ptr<FakeSystemState> state = std::make_shared<FakeSystemState>())
        : state_(std::move(state)) {}

    FakeSystemState& state() { return *state_; }
    std::shared_ptr<FakeSystemState> sharedState() const { return state_; }

    static Platform::OperationResult failure(int exit_code, const std::string& message = "failed") {
        Platform::OperationResult result;
        result.exit_code = exit_code;
        result.message = message;
        return result;
    }

    static Platform::OperationResult timeout() {
        Platform::OperationResult result;
        result.exit_code = -1;
        result.timed_out = true;
        result.message = "timed out";
        return result;
    }

    std::string platformName() const override { return state_->platform; }
    bool isElevated() const override { return state_->elevated; }
    std::string hostName() const override { return state_->host; }

    std::vector<DeviceRecord> listDevices() override {
        query("devices");
        return state_->devices;
    }

    Platform::OperationResult removeDevice(const std::string& device_id) override {
        const auto result = mutate("removeDevice:" + device_id);
        if (applied(result)) {
            erase(state_->devices, [&](const DeviceRecord& d) { return d.id == device_id; });
        }
        return result;
    }

    Platform::OperationResult rescanDevices() override { return mutate("rescanDevices"); }

    std::vector<DriverPackageRecord> listDriverPackages() override {
        query("drivers");
        return state_->drivers;
    }

    Platform::OperationResult deleteDriverPackage(const std::string& published_name) override {
        const auto result = mutate("deleteDriverPackage:" + published_name);
        if (applied(result)) {
            erase(state_->drivers, [&](const DriverPackageRecord& d) { return d.published_name == published_name; });
        }
        return result;
    }

    Platform::OperationResult exportDriverPackages(const std::string& directory) override {
        exported_to = directory;
        return mutate("exportDriverPackages");
    }

    Platform::OperationResult importDriverPackages(const std::string& directory) override {
        imported_from = directory;
        const auto result = mutate("importDriverPackages");
        if (applied(result)) {
            for (const auto& package : state_->importable_drivers) {
                state_->drivers.push_back(package);
            }
            state_->importable_drivers.clear();
        }
        return result;
    }

    std::vector<NetworkInterfaceRecord> listNetworkInterfaces() override {
        query("network");
        return state_->network;
    }

    Platform::OperationResult applyNetworkSettings(const std::string& interface_id,
                                                   const NetworkInterfaceRecord& settings) override {
        const auto result = mutate("applyNetworkSettings:" + interface_id);
        if (applied(result)) {
            for (auto& iface : state_->network) {
                if (iface.id == interface_id) {
                    iface.ip_address = settings.ip_address;
                    iface.prefix_length = settings.prefix_length;
                    iface.gateway = settings.gateway;
                    iface.dns_servers = settings.dns_servers;
                    iface.dhcp_enabled = settings.dhcp_enabled;
                }
            }
        }
        return result;
    }

    Platform::OperationResult flushDnsCache() override { return mutate("flushDnsCache"); }

    Platform::OperationResult resetNetworkStack() override {
        auto result = mutate("resetNetworkStack");
        if (result.succeeded()) {
            result.reboot_required = true;
        }
        return result;
    }

    std::vector<SoftwareRecord> listInstalledSoftware() override {
        query("software");
        return state_->software;
    }

    Platform::OperationResult uninstallSoftware(const SoftwareRecord& software) override {
        const auto result = mutate("uninstallSoftware:" + software.name);
        if (applied(result)) {
            erase(state_->software, [&](const SoftwareRecord& s) { return s.name == software.name; });
        }
        return result;
    }

    std::vector<DiskRecord> listDisks() override {
        query("disks");
        return state_->disks;
    }

    Platform::OperationResult setDiskOnline(int disk_number) override {
        const auto result = mutate("setDiskOnline:" + std::to_string(disk_number));
        if (applied(result)) {
            for (auto& disk : state_->disks) {
                if (disk.number == disk_number) disk.offline = false;
            }
        }
        return result;
    }

    Platform::OperationResult clearDiskReadOnly(int disk_number) override {
        const auto result = mutate("clearDiskReadOnly:" + std::to_string(disk_number));
        if (applied(result)) {
            for (auto& disk : state_->disks) {
                if (disk.number == disk_number) disk.read_only = false;
            }
        }
        return result;
    }

    Platform::OperationResult assignDriveLetter(int disk_number, int partition_number,
                                                const std::string& letter) override {
        const auto result = mutate("assignDriveLetter:" + std::to_string(disk_number) + ":" +
                                   std::to_string(partition_number) + ":" + letter);
        if (applied(result)) {
            for (auto& disk : state_->disks) {
                if (disk.number != disk_number) continue;
                for (auto& partition : disk.partitions) {
                    if (partition.number == partition_number) partition.drive_letter = letter;
                }
            }
        }
        return result;
    }

    size_t mutationCount() const { return state_->mutations.size(); }

    bool mutated(const std::string& call) const {
        return std::find(state_->mutations.begin(), state_->mutations.end(), call) != state_->mutations.end();
    }

    std::string exported_to;
    std::string imported_from;

private:
    void query(const std::string& section) {
        ++state_->inventory_queries;
        if (state_->failing_sections.count(section) > 0) {
            throw SystemQueryError(section, "scripted failure");
        }
    }

    Platform::OperationResult mutate(const std::string& call) {
        state_->mutations.push_back(call);
        const auto it = state_->results.find(call);
        return it == state_->results.end() ? Platform::OperationResult{} : it->second;
    }

    // EN: Exit 0 and the installer "restart required" codes leave the change in place.
    // FR: Le code 0 et les codes "redémarrage requis" des installeurs laissent la modification en place.
    static bool applied(const Platform::OperationResult& result) {
        return !result.timed_out && (result.exit_code == 0 || result.exit_code == 3010 || result.exit_code == 1641);
    }

    template<typename Record, typename Predicate>
    static void erase(std::vector<Record>& records, Predicate predicate) {
        records.erase(std::remove_if(records.begin(), records.end(), predicate), records.end());
    }

    std::shared_ptr<FakeSystemState> state_;
};

} // namespace Testing
} // namespace HVC
