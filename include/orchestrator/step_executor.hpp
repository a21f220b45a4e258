// EN: Step executor - one predicate check and at most one action attempt per step
// FR: Exécuteur d'étapes - une vérification de prédicat et au plus une tentative d'action par étape

#pragma once

#include <set>

#include "orchestrator/step.hpp"

namespace HVC {

class Logger;

namespace Orchestrator {

class StepExecutor {
public:
    // EN: Exit codes that mean "succeeded, restart required" (3010 and 1641 for Windows installers).
    // FR: Codes de sortie signifiant "réussi, redémarrage requis" (3010 et 1641 pour les installeurs Windows).
    static const std::set<int>& defaultRebootCodes();

    StepExecutor(Platform::ISystemManagement& system, Logger& logger,
                 std::set<int> reboot_required_codes = defaultRebootCodes());

    // EN: Never throws and never retries. Exceptions from the action become Failed results.
    // FR: Ne lance jamais d'exception et ne réessaie jamais. Les exceptions de l'action deviennent des résultats Failed.
    StepResult run(const Step& step, const SystemSnapshot& snapshot);

    // EN: Map a collaborator result to a step outcome.
    // FR: Convertit un résultat de collaborateur en issue d'étape.
    StepResult classify(const Step& step, const Platform::OperationResult& result) const;

private:
    Platform::ISystemManagement& system_;
    Logger& logger_;
    std::set<int> reboot_required_codes_;
};

} // namespace Orchestrator
} // namespace HVC
