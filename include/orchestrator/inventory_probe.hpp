// EN: Inventory probe - captures a normalized snapshot of devices, drivers, network, disks and software
// FR: Sonde d'inventaire - capture un instantané normalisé des périphériques, pilotes, réseau, disques et logiciels

#pragma once

#include "model/system_snapshot.hpp"

namespace HVC {

class Logger;

namespace Platform {
class ISystemManagement;
}

namespace Orchestrator {

// EN: Read-only probe. A failing section is recorded as empty and the snapshot is marked partial.
// FR: Sonde en lecture seule. Une section en échec est enregistrée vide et l'instantané est marqué partiel.
class InventoryProbe {
public:
    InventoryProbe(Platform::ISystemManagement& system, Logger& logger);

    SystemSnapshot capture();

private:
    template<typename Record, typename Query>
    void captureSection(SystemSnapshot& snapshot, const char* section,
                        std::vector<Record>& target, Query query);

    Platform::ISystemManagement& system_;
    Logger& logger_;
};

} // namespace Orchestrator
} // namespace HVC
