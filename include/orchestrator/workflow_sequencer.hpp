// EN: Workflow sequencer - guard, backup, mutate, verify, report
// FR: Séquenceur de workflow - garde, sauvegarde, mutation, vérification, rapport

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "orchestrator/step.hpp"
#include "orchestrator/workflow_run.hpp"

namespace HVC {

class Logger;

namespace Orchestrator {

class InventoryProbe;
class BackupStore;
class ConfirmationGate;
class StepExecutor;

struct SequencerOptions {
    std::string run_id;
    std::string command;
    bool dry_run = false;
    bool export_driver_packages = true;         // EN: Export the driver store into the backup / FR: Exporte le magasin de pilotes dans la sauvegarde

    // EN: Called with the applicable steps before the operator is asked to confirm.
    // FR: Appelé avec les étapes applicables avant la demande de confirmation.
    std::function<void(const std::vector<Step>&)> on_plan;
};

// EN: Single-threaded state machine driving the declared tasks in order.
// FR: Machine à états mono-thread exécutant les tâches déclarées dans l'ordre.
class WorkflowSequencer {
public:
    WorkflowSequencer(InventoryProbe& probe, BackupStore& backups, ConfirmationGate& gate,
                      StepExecutor& executor, Platform::ISystemManagement& system, Logger& logger);

    // EN: Run the tasks. Step failures never stop the run; only a denied confirmation
    //     or a failed backup abort it.
    // FR: Exécute les tâches. Les échecs d'étape n'arrêtent jamais l'exécution ; seuls un refus
    //     de confirmation ou une sauvegarde en échec l'interrompent.
    WorkflowRun run(const std::vector<TaskDefinition>& tasks, const SequencerOptions& options);

    // EN: Applicable steps of each task against one snapshot, in declared order.
    // FR: Étapes applicables de chaque tâche pour un instantané, dans l'ordre déclaré.
    std::vector<std::vector<Step>> plan(const std::vector<TaskDefinition>& tasks, const SystemSnapshot& snapshot);

private:
    void transition(WorkflowRun& run, WorkflowState state);
    void abort(WorkflowRun& run, AbortCause cause, const std::string& reason);
    void finish(WorkflowRun& run);
    void exportDrivers(WorkflowRun& run);

    InventoryProbe& probe_;
    BackupStore& backups_;
    ConfirmationGate& gate_;
    StepExecutor& executor_;
    Platform::ISystemManagement& system_;
    Logger& logger_;
};

} // namespace Orchestrator
} // namespace HVC
