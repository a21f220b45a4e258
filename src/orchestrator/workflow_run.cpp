// EN: Workflow run helpers: status derivation, JSON encoding and the operator summary.
// FR: Utilitaires d'exécution : dérivation du statut, encodage JSON et résumé opérateur.

#include "orchestrator/workflow_run.hpp"

#include <algorithm>
#include <sstream>

#include <nlohmann/json.hpp>

namespace HVC {
namespace Orchestrator {

RunStatus WorkflowRun::status() const {
    if (final_state == WorkflowState::Aborted) {
        return RunStatus::Aborted;
    }
    if (hasFailures()) {
        return RunStatus::CompletedWithErrors;
    }
    if (results.empty()) {
        return RunStatus::NothingToDo;
    }
    return RunStatus::Completed;
}

bool WorkflowRun::hasFailures() const {
    return std::any_of(results.begin(), results.end(),
                       [](const StepResult& r) { return r.outcome == StepOutcome::Failed; });
}

bool WorkflowRun::rebootRequired() const {
    return std::any_of(results.begin(), results.end(),
                       [](const StepResult& r) { return r.outcome == StepOutcome::SuccessRebootRequired; });
}

void to_json(nlohmann::json& j, const WorkflowRun& run) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : run.results) {
        results.push_back({
            {"step", result.step_name},
            {"task", result.task},
            {"outcome", StepUtils::outcomeToString(result.outcome)},
            {"detail", result.detail},
        });
    }

    nlohmann::json history = nlohmann::json::array();
    for (const auto state : run.state_history) {
        history.push_back(WorkflowUtils::stateToString(state));
    }

    j = nlohmann::json{
        {"run_id", run.run_id},
        {"command", run.command},
        {"started_at", SnapshotUtils::formatTimestampMs(run.started_at_ms)},
        {"finished_at", SnapshotUtils::formatTimestampMs(run.finished_at_ms)},
        {"dry_run", run.dry_run},
        {"unattended", run.unattended},
        {"final_state", WorkflowUtils::stateToString(run.final_state)},
        {"status", WorkflowUtils::statusToString(run.status())},
        {"state_history", history},
        {"results", results},
        {"backup", run.backup ? nlohmann::json(run.backup->id) : nlohmann::json(nullptr)},
        {"backup_path", run.backup ? nlohmann::json(run.backup->path.string()) : nlohmann::json(nullptr)},
        {"abort_reason", run.abort_reason},
        {"unmapped_items", run.unmapped_items},
        {"warnings", run.warnings},
        {"reboot_required", run.rebootRequired()},
    };
}

namespace WorkflowUtils {

std::string stateToString(WorkflowState state) {
    switch (state) {
        case WorkflowState::Init: return "Init";
        case WorkflowState::Scanning: return "Scanning";
        case WorkflowState::AwaitingConfirmation: return "AwaitingConfirmation";
        case WorkflowState::BackingUp: return "BackingUp";
        case WorkflowState::Executing: return "Executing";
        case WorkflowState::Reporting: return "Reporting";
        case WorkflowState::Done: return "Done";
        case WorkflowState::Aborted: return "Aborted";
        default: return "Unknown";
    }
}

std::string statusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::CompletedWithErrors: return "completed with errors";
        case RunStatus::NothingToDo: return "nothing to do";
        case RunStatus::Aborted: return "aborted";
        default: return "unknown";
    }
}

std::string formatSummary(const WorkflowRun& run) {
    std::ostringstream out;
    out << "Run " << run.run_id << " (" << run.command << (run.dry_run ? ", dry run" : "") << "): "
        << statusToString(run.status()) << "\n";

    if (run.status() == RunStatus::Aborted && !run.abort_reason.empty()) {
        out << "  Aborted: " << run.abort_reason << "\n";
    }
    if (run.results.empty() && run.status() == RunStatus::NothingToDo) {
        out << "  No action was needed.\n";
    }

    for (const auto& result : run.results) {
        out << "  [" << StepUtils::outcomeToString(result.outcome) << "] " << result.step_name;
        if (!result.detail.empty()) {
            out << " - " << result.detail;
        }
        out << "\n";
    }

    for (const auto& item : run.unmapped_items) {
        out << "  [Unmapped] " << item << "\n";
    }
    for (const auto& warning : run.warnings) {
        out << "  Warning: " << warning << "\n";
    }

    if (run.backup) {
        out << "  Backup: " << run.backup->id << " at " << run.backup->path.string() << "\n";
    } else {
        out << "  Backup: none\n";
    }
    if (run.rebootRequired()) {
        out << "  A restart is required to complete the changes.\n";
    }
    return out.str();
}

} // namespace WorkflowUtils

} // namespace Orchestrator
} // namespace HVC
