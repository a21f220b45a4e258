// EN: Workflow run record - the aggregated outcome of one hvcctl invocation
// FR: Enregistrement d'exécution - le résultat agrégé d'une invocation de hvcctl

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "orchestrator/backup_store.hpp"
#include "orchestrator/step.hpp"

namespace HVC {
namespace Orchestrator {

enum class WorkflowState {
    Init,
    Scanning,
    AwaitingConfirmation,
    BackingUp,
    Executing,
    Reporting,
    Done,
    Aborted
};

// EN: Derived overall status of a finished run
// FR: Statut global dérivé d'une exécution terminée
enum class RunStatus {
    Completed,
    CompletedWithErrors,
    NothingToDo,
    Aborted
};

enum class AbortCause {
    None,
    ConfirmationDenied,
    BackupFailed
};

struct WorkflowRun {
    std::string run_id;
    std::string command;
    std::int64_t started_at_ms = 0;
    std::int64_t finished_at_ms = 0;
    bool dry_run = false;
    bool unattended = false;

    WorkflowState final_state = WorkflowState::Init;
    std::vector<WorkflowState> state_history;
    std::vector<StepResult> results;
    std::optional<BackupHandle> backup;         // EN: Set only when a backup was taken / FR: Défini seulement si une sauvegarde a été prise

    std::string abort_reason;
    AbortCause abort_cause = AbortCause::None;
    std::vector<std::string> unmapped_items;    // EN: Restore items without a live counterpart / FR: Éléments sans équivalent actif
    std::vector<std::string> warnings;

    RunStatus status() const;
    bool hasFailures() const;
    bool rebootRequired() const;
};

void to_json(nlohmann::json& j, const WorkflowRun& run);

namespace WorkflowUtils {
    std::string stateToString(WorkflowState state);
    std::string statusToString(RunStatus status);

    // EN: Human-readable end-of-run report naming each step outcome and the backup location.
    // FR: Rapport lisible de fin d'exécution nommant chaque issue d'étape et l'emplacement de la sauvegarde.
    std::string formatSummary(const WorkflowRun& run);
}

} // namespace Orchestrator
} // namespace HVC
