// EN: Workflow sequencer implementation.
// FR: Implémentation du séquenceur de workflow.

#include "orchestrator/workflow_sequencer.hpp"

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/backup_store.hpp"
#include "orchestrator/confirmation_gate.hpp"
#include "orchestrator/inventory_probe.hpp"
#include "orchestrator/step_executor.hpp"
#include "orchestrator/workflow_errors.hpp"

#include <algorithm>
#include <exception>

#include <nlohmann/json.hpp>

namespace HVC {
namespace Orchestrator {

namespace {
constexpr const char* kModule = "sequencer";
}

WorkflowSequencer::WorkflowSequencer(InventoryProbe& probe, BackupStore& backups, ConfirmationGate& gate,
                                     StepExecutor& executor, Platform::ISystemManagement& system, Logger& logger)
    : probe_(probe), backups_(backups), gate_(gate), executor_(executor), system_(system), logger_(logger) {}

void WorkflowSequencer::transition(WorkflowRun& run, WorkflowState state) {
    run.state_history.push_back(state);
    run.final_state = state;
    logger_.debug(kModule, "State " + WorkflowUtils::stateToString(state), {{"run_id", run.run_id}});
}

void WorkflowSequencer::abort(WorkflowRun& run, AbortCause cause, const std::string& reason) {
    run.abort_cause = cause;
    run.abort_reason = reason;
    transition(run, WorkflowState::Aborted);
    logger_.warn(kModule, "Run aborted", {{"run_id", run.run_id}, {"reason", reason}});
    finish(run);
}

void WorkflowSequencer::finish(WorkflowRun& run) {
    run.finished_at_ms = SnapshotUtils::nowMs();
    const nlohmann::json encoded = run;
    logger_.info(kModule, "workflow_run", {
        {"run_id", run.run_id},
        {"status", WorkflowUtils::statusToString(run.status())},
        {"run", encoded.dump()},
    });
}

std::vector<std::vector<Step>> WorkflowSequencer::plan(const std::vector<TaskDefinition>& tasks,
                                                       const SystemSnapshot& snapshot) {
    std::vector<std::vector<Step>> planned;
    planned.reserve(tasks.size());

    for (const auto& task : tasks) {
        std::vector<Step> applicable;
        std::vector<Step> steps;
        try {
            steps = task.plan ? task.plan(snapshot) : std::vector<Step>{};
        } catch (const std::exception& e) {
            logger_.error(kModule, "Task planning failed", {{"task", task.name}, {"error", e.what()}});
        }
        for (auto& step : steps) {
            bool applies = false;
            try {
                applies = step.predicate && step.predicate(snapshot);
            } catch (const std::exception& e) {
                logger_.warn(kModule, "Step predicate failed during planning",
                             {{"step", step.name}, {"error", e.what()}});
            }
            if (applies) {
                applicable.push_back(std::move(step));
            }
        }
        logger_.debug(kModule, "Task planned",
                      {{"task", task.name}, {"applicable_steps", std::to_string(applicable.size())}});
        planned.push_back(std::move(applicable));
    }
    return planned;
}

void WorkflowSequencer::exportDrivers(WorkflowRun& run) {
    try {
        const auto directory = backups_.createDriverStore(*run.backup);
        const auto result = system_.exportDriverPackages(directory.string());
        if (!result.succeeded()) {
            run.warnings.push_back("driver package export failed: " +
                                   (result.timed_out ? std::string("timed out") : result.message));
            logger_.warn(kModule, "Driver package export failed",
                         {{"exit_code", std::to_string(result.exit_code)}, {"message", result.message}});
        }
    } catch (const std::exception& e) {
        run.warnings.push_back(std::string("driver package export failed: ") + e.what());
        logger_.warn(kModule, "Driver package export failed", {{"error", e.what()}});
    }
}

WorkflowRun WorkflowSequencer::run(const std::vector<TaskDefinition>& tasks, const SequencerOptions& options) {
    WorkflowRun run;
    run.run_id = options.run_id;
    run.command = options.command;
    run.dry_run = options.dry_run;
    run.unattended = gate_.isHeadless();
    run.started_at_ms = SnapshotUtils::nowMs();
    transition(run, WorkflowState::Init);

    logger_.info(kModule, "Run started", {
        {"run_id", run.run_id},
        {"command", run.command},
        {"dry_run", run.dry_run ? "true" : "false"},
        {"tasks", std::to_string(tasks.size())},
    });

    transition(run, WorkflowState::Scanning);
    SystemSnapshot snapshot = probe_.capture();
    if (snapshot.partial) {
        std::string sections;
        for (const auto& section : snapshot.failed_sections) {
            sections += (sections.empty() ? "" : ", ") + section;
        }
        run.warnings.push_back("inventory is partial (" + sections + ")");
    }

    const auto planned = plan(tasks, snapshot);
    std::vector<Step> all_steps;
    for (const auto& steps : planned) {
        all_steps.insert(all_steps.end(), steps.begin(), steps.end());
    }

    if (all_steps.empty()) {
        logger_.info(kModule, "No applicable steps", {{"run_id", run.run_id}});
        transition(run, WorkflowState::Reporting);
        transition(run, WorkflowState::Done);
        finish(run);
        return run;
    }

    if (options.on_plan) {
        options.on_plan(all_steps);
    }

    if (options.dry_run) {
        for (const auto& step : all_steps) {
            run.results.push_back({step.name, step.task, StepOutcome::WouldPerform, step.description});
        }
        transition(run, WorkflowState::Reporting);
        transition(run, WorkflowState::Done);
        finish(run);
        return run;
    }

    transition(run, WorkflowState::AwaitingConfirmation);
    int rounds = 1;
    for (const auto& step : all_steps) {
        rounds = std::max(rounds, std::clamp(step.confirmations_required, 1, 2));
    }
    const std::string question = "Apply " + std::to_string(all_steps.size()) + " change(s) for '" +
                                 run.command + "'?";
    if (!gate_.confirm(question, rounds)) {
        abort(run, AbortCause::ConfirmationDenied, "confirmation denied by operator");
        return run;
    }

    const bool needs_backup = std::any_of(all_steps.begin(), all_steps.end(),
                                          [](const Step& step) { return step.destructive; });
    if (needs_backup) {
        transition(run, WorkflowState::BackingUp);
        try {
            run.backup = backups_.save(snapshot);
        } catch (const BackupError& e) {
            abort(run, AbortCause::BackupFailed, std::string("backup failed: ") + e.what());
            return run;
        }
        if (options.export_driver_packages) {
            exportDrivers(run);
        }
    }

    transition(run, WorkflowState::Executing);
    for (size_t task_index = 0; task_index < tasks.size(); ++task_index) {
        if (planned[task_index].empty()) {
            continue;
        }
        // EN: Later tasks see the effect of earlier ones.
        // FR: Les tâches suivantes voient l'effet des précédentes.
        if (task_index > 0) {
            snapshot = probe_.capture();
        }
        for (const auto& step : planned[task_index]) {
            if (step.destructive && !run.backup) {
                run.results.push_back({step.name, step.task, StepOutcome::Skipped, "no backup for this run"});
                continue;
            }
            run.results.push_back(executor_.run(step, snapshot));
        }
    }

    transition(run, WorkflowState::Reporting);
    transition(run, WorkflowState::Done);
    finish(run);
    return run;
}

} // namespace Orchestrator
} // namespace HVC
