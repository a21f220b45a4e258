// EN: Step executor implementation.
// FR: Implémentation de l'exécuteur d'étapes.

#include "orchestrator/step_executor.hpp"

#include "infrastructure/logging/logger.hpp"

#include <exception>

namespace HVC {
namespace Orchestrator {

namespace {
constexpr const char* kModule = "executor";
}

namespace StepUtils {

std::string outcomeToString(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Success: return "Success";
        case StepOutcome::SuccessRebootRequired: return "SuccessRebootRequired";
        case StepOutcome::Skipped: return "Skipped";
        case StepOutcome::Failed: return "Failed";
        case StepOutcome::WouldPerform: return "WouldPerform";
        default: return "Unknown";
    }
}

} // namespace StepUtils

const std::set<int>& StepExecutor::defaultRebootCodes() {
    static const std::set<int> codes{3010, 1641};
    return codes;
}

StepExecutor::StepExecutor(Platform::ISystemManagement& system, Logger& logger,
                           std::set<int> reboot_required_codes)
    : system_(system), logger_(logger), reboot_required_codes_(std::move(reboot_required_codes)) {}

StepResult StepExecutor::run(const Step& step, const SystemSnapshot& snapshot) {
    StepResult result{step.name, step.task, StepOutcome::Skipped, ""};

    try {
        if (!step.predicate || !step.predicate(snapshot)) {
            result.detail = "not applicable";
            logger_.info(kModule, "Step skipped", {{"step", step.name}, {"task", step.task}});
            return result;
        }
    } catch (const std::exception& e) {
        result.outcome = StepOutcome::Failed;
        result.detail = std::string("predicate error: ") + e.what();
        logger_.error(kModule, "Step predicate failed", {{"step", step.name}, {"error", e.what()}});
        return result;
    }

    if (!step.action) {
        result.outcome = StepOutcome::Failed;
        result.detail = "step has no action";
        return result;
    }

    logger_.info(kModule, "Running step", {{"step", step.name}, {"task", step.task}});

    Platform::OperationResult operation;
    try {
        operation = step.action(system_);
    } catch (const std::exception& e) {
        result.outcome = StepOutcome::Failed;
        result.detail = std::string("exception: ") + e.what();
        logger_.error(kModule, "Step action threw", {{"step", step.name}, {"error", e.what()}});
        return result;
    }

    result = classify(step, operation);

    const std::unordered_map<std::string, std::string> metadata{
        {"step", step.name},
        {"task", step.task},
        {"outcome", StepUtils::outcomeToString(result.outcome)},
        {"exit_code", std::to_string(operation.exit_code)},
        {"detail", result.detail},
    };
    if (result.outcome == StepOutcome::Failed) {
        logger_.error(kModule, "Step failed", metadata);
    } else {
        logger_.info(kModule, "Step completed", metadata);
    }
    return result;
}

StepResult StepExecutor::classify(const Step& step, const Platform::OperationResult& result) const {
    StepResult step_result{step.name, step.task, StepOutcome::Failed, result.message};

    if (result.timed_out) {
        step_result.detail = "timed out";
        return step_result;
    }

    if (result.exit_code == 0) {
        step_result.outcome = result.reboot_required ? StepOutcome::SuccessRebootRequired : StepOutcome::Success;
        if (step_result.outcome == StepOutcome::SuccessRebootRequired && step_result.detail.empty()) {
            step_result.detail = "restart required";
        }
        return step_result;
    }

    if (reboot_required_codes_.contains(result.exit_code)) {
        step_result.outcome = StepOutcome::SuccessRebootRequired;
        step_result.detail = "restart required (exit code " + std::to_string(result.exit_code) + ")";
        return step_result;
    }

    step_result.detail = "exit code " + std::to_string(result.exit_code) +
                         (result.message.empty() ? "" : ": " + result.message);
    return step_result;
}

} // namespace Orchestrator
} // namespace HVC
