// EN: Inventory probe implementation.
// FR: Implémentation de la sonde d'inventaire.

#include "orchestrator/inventory_probe.hpp"

#include "infrastructure/logging/logger.hpp"
#include "platform/system_management.hpp"

#include <exception>

namespace HVC {
namespace Orchestrator {

namespace {
constexpr const char* kModule = "inventory";
}

InventoryProbe::InventoryProbe(Platform::ISystemManagement& system, Logger& logger)
    : system_(system), logger_(logger) {}

template<typename Record, typename Query>
void InventoryProbe::captureSection(SystemSnapshot& snapshot, const char* section,
                                    std::vector<Record>& target, Query query) {
    try {
        target = query();
    } catch (const std::exception& e) {
        target.clear();
        snapshot.partial = true;
        snapshot.failed_sections.emplace_back(section);
        logger_.warn(kModule, "Inventory section unavailable, continuing with a partial snapshot",
                     {{"section", section}, {"error", e.what()}});
    }
}

SystemSnapshot InventoryProbe::capture() {
    SystemSnapshot snapshot;
    snapshot.captured_at_ms = SnapshotUtils::nowMs();
    snapshot.host = system_.hostName();
    snapshot.platform = system_.platformName();

    captureSection(snapshot, "devices", snapshot.devices, [this] { return system_.listDevices(); });
    captureSection(snapshot, "drivers", snapshot.drivers, [this] { return system_.listDriverPackages(); });
    captureSection(snapshot, "network", snapshot.network, [this] { return system_.listNetworkInterfaces(); });
    captureSection(snapshot, "disks", snapshot.disks, [this] { return system_.listDisks(); });
    captureSection(snapshot, "software", snapshot.software, [this] { return system_.listInstalledSoftware(); });

    logger_.info(kModule, "Inventory captured", {
        {"devices", std::to_string(snapshot.devices.size())},
        {"drivers", std::to_string(snapshot.drivers.size())},
        {"interfaces", std::to_string(snapshot.network.size())},
        {"disks", std::to_string(snapshot.disks.size())},
        {"software", std::to_string(snapshot.software.size())},
        {"partial", snapshot.partial ? "true" : "false"},
    });
    return snapshot;
}

} // namespace Orchestrator
} // namespace HVC
