// EN: Unit tests for the step executor using a GoogleMock collaborator.
// FR: Tests unitaires pour l'exécuteur d'étapes avec un collaborateur GoogleMock.

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "common/mock_system_management.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/step_executor.hpp"

using namespace HVC;
using namespace HVC::Orchestrator;
using HVC::Testing::MockSystemManagement;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

Platform::OperationResult exitWith(int code, const std::string& message = "") {
    Platform::OperationResult result;
    result.exit_code = code;
    result.message = message;
    return result;
}

} // namespace

class StepExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_.setOutputStream(&log_);

        step_.name = "remove-device:PCI\\VEN_15AD\\1";
        step_.task = "clean-devices";
        step_.predicate = [this](const SystemSnapshot&) { return applicable_; };
        step_.action = [](Platform::ISystemManagement& system) { return system.removeDevice("PCI\\VEN_15AD\\1"); };
    }

    std::ostringstream log_;
    Logger logger_;
    MockSystemManagement system_;
    StepExecutor executor_{system_, logger_};
    Step step_;
    SystemSnapshot snapshot_;
    bool applicable_ = true;
};

TEST_F(StepExecutorTest, FalsePredicate_ShouldSkipWithoutCallingAction) {
    applicable_ = false;
    EXPECT_CALL(system_, removeDevice(_)).Times(0);

    const auto result = executor_.run(step_, snapshot_);

    EXPECT_EQ(result.outcome, StepOutcome::Skipped);
    EXPECT_EQ(result.detail, "not applicable");
    EXPECT_EQ(result.step_name, step_.name);
    EXPECT_EQ(result.task, "clean-devices");
}

TEST_F(StepExecutorTest, SuccessfulAction_ShouldSucceed) {
    EXPECT_CALL(system_, removeDevice("PCI\\VEN_15AD\\1")).WillOnce(Return(exitWith(0)));

    const auto result = executor_.run(step_, snapshot_);

    EXPECT_EQ(result.outcome, StepOutcome::Success);
    EXPECT_NE(log_.str().find("Step completed"), std::string::npos);
}

TEST_F(StepExecutorTest, RebootCode_ShouldMapToSuccessRebootRequired) {
    EXPECT_CALL(system_, removeDevice(_)).WillOnce(Return(exitWith(3010)));

    const auto result = executor_.run(step_, snapshot_);

    EXPECT_EQ(result.outcome, StepOutcome::SuccessRebootRequired);
    EXPECT_EQ(result.detail, "restart required (exit code 3010)");
}

TEST_F(StepExecutorTest, FailingAction_ShouldBeAttemptedExactlyOnce) {
    EXPECT_CALL(system_, removeDevice(_)).Times(1).WillOnce(Return(exitWith(5, "Access is denied.")));

    const auto result = executor_.run(step_, snapshot_);

    EXPECT_EQ(result.outcome, StepOutcome::Failed);
    EXPECT_EQ(result.detail, "exit code 5: Access is denied.");
    EXPECT_NE(log_.str().find("\"level\":\"ERROR\""), std::string::npos);
}

TEST_F(StepExecutorTest, ThrowingAction_ShouldBecomeFailedResult) {
    EXPECT_CALL(system_, removeDevice(_)).WillOnce(Throw(std::runtime_error("device vanished")));

    StepResult result;
    EXPECT_NO_THROW(result = executor_.run(step_, snapshot_));
    EXPECT_EQ(result.outcome, StepOutcome::Failed);
    EXPECT_EQ(result.detail, "exception: device vanished");
}

TEST_F(StepExecutorTest, ThrowingPredicate_ShouldBecomeFailedResult) {
    step_.predicate = [](const SystemSnapshot&) -> bool { throw std::runtime_error("bad snapshot"); };
    EXPECT_CALL(system_, removeDevice(_)).Times(0);

    const auto result = executor_.run(step_, snapshot_);

    EXPECT_EQ(result.outcome, StepOutcome::Failed);
    EXPECT_EQ(result.detail, "predicate error: bad snapshot");
}

TEST_F(StepExecutorTest, MissingActionOrPredicate_ShouldNotCrash) {
    Step no_action = step_;
    no_action.action = nullptr;
    EXPECT_EQ(executor_.run(no_action, snapshot_).outcome, StepOutcome::Failed);

    Step no_predicate = step_;
    no_predicate.predicate = nullptr;
    EXPECT_EQ(executor_.run(no_predicate, snapshot_).outcome, StepOutcome::Skipped);
}

TEST_F(StepExecutorTest, Classify_ShouldHandleTimeoutsAndRebootFlag) {
    Platform::OperationResult timed_out;
    timed_out.exit_code = -1;
    timed_out.timed_out = true;
    const auto timeout_result = executor_.classify(step_, timed_out);
    EXPECT_EQ(timeout_result.outcome, StepOutcome::Failed);
    EXPECT_EQ(timeout_result.detail, "timed out");

    Platform::OperationResult reset;
    reset.reboot_required = true;
    const auto reset_result = executor_.classify(step_, reset);
    EXPECT_EQ(reset_result.outcome, StepOutcome::SuccessRebootRequired);
    EXPECT_EQ(reset_result.detail, "restart required");

    EXPECT_EQ(executor_.classify(step_, exitWith(1641)).outcome, StepOutcome::SuccessRebootRequired);
    EXPECT_EQ(executor_.classify(step_, exitWith(1)).outcome, StepOutcome::Failed);
    EXPECT_EQ(executor_.classify(step_, exitWith(1)).detail, "exit code 1");
}

TEST_F(StepExecutorTest, CustomRebootCodes_ShouldReplaceDefaults) {
    StepExecutor custom(system_, logger_, {194});

    EXPECT_EQ(custom.classify(step_, exitWith(194)).outcome, StepOutcome::SuccessRebootRequired);
    EXPECT_EQ(custom.classify(step_, exitWith(3010)).outcome, StepOutcome::Failed);
}

TEST(StepUtilsTest, OutcomeNames_ShouldBeStable) {
    EXPECT_EQ(StepUtils::outcomeToString(StepOutcome::Success), "Success");
    EXPECT_EQ(StepUtils::outcomeToString(StepOutcome::SuccessRebootRequired), "SuccessRebootRequired");
    EXPECT_EQ(StepUtils::outcomeToString(StepOutcome::WouldPerform), "WouldPerform");
}
