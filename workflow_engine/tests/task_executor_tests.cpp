#include "workflow_engine/task_executor.h"
#include "workflow_engine/workflow_state.h"

#include "workflow_test_support.h"

#include <gtest/gtest.h>

namespace archflow::workflow_engine::tests {

class TaskExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<OperationRegistry>();
        registry_->registerOperation("getSheets", [this](const OperationContext&, const nlohmann::json& p) {
            recorder_.record("getSheets", p);
            return OperationResult::ok({{"sheetId", 42}, {"sheetCount", 3}});
        });
        registry_->registerOperation("placeViewOnSheet", [this](const OperationContext&, const nlohmann::json& p) {
            recorder_.record("placeViewOnSheet", p);
            return OperationResult::ok({{"viewId", nullptr}});
        });
        registry_->registerOperation("fail", [](const OperationContext&, const nlohmann::json&) {
            return OperationResult::failure("");
        });
        registry_->registerOperation("weird", [](const OperationContext&, const nlohmann::json&) -> OperationResult {
            throw 42;
        });

        auto workflowTemplate = std::make_shared<WorkflowTemplate>(
            makeTemplate("CD_Set", {makePhase("Sheets", {makeTask("t1", "getSheets")})}));
        state_ = std::make_shared<WorkflowState>("wf-1", makeRequest("CD_Set"), workflowTemplate);
        executor_ = std::make_shared<TaskExecutor>(registry_, defaultContextInjectionRules());
    }

    CallRecorder recorder_;
    std::shared_ptr<OperationRegistry> registry_;
    std::shared_ptr<WorkflowState> state_;
    std::shared_ptr<TaskExecutor> executor_;
};

TEST_F(TaskExecutorTest, DefaultRulesCoverWellKnownOutputs) {
    auto rules = defaultContextInjectionRules();
    ASSERT_EQ(rules.size(), 3u);
    EXPECT_EQ(rules[0].parameter, "scheduleId");
    EXPECT_EQ(rules[0].contextKey, "lastScheduleId");
    EXPECT_EQ(rules[1].contextKey, "lastSheetId");
    EXPECT_EQ(rules[2].contextKey, "lastViewId");

    auto custom = makeContextInjectionRules({"levelId", ""});
    ASSERT_EQ(custom.size(), 1u);
    EXPECT_EQ(custom[0].contextKey, "lastLevelId");
}

TEST_F(TaskExecutorTest, CustomTaskRecordsHintVerbatim) {
    TaskDefinition task = makeTask("title_block", "custom");
    task.autonomousDecision = "pick default title block";

    TaskResult result = executor_->execute(task, *state_);

    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.decision.has_value());
    EXPECT_EQ(result.decision->task, "title_block");
    EXPECT_EQ(result.decision->decision, TaskExecutor::kCustomTaskDecision);
    EXPECT_EQ(result.decision->reason, "pick default title block");
    EXPECT_TRUE(recorder_.calls().empty());
}

TEST_F(TaskExecutorTest, EmptyMethodIsCustomWithDefaultReason) {
    TaskResult result = executor_->execute(makeTask("placeholder", ""), *state_);

    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.decision.has_value());
    EXPECT_EQ(result.decision->reason, TaskExecutor::kDefaultCustomReason);
}

TEST_F(TaskExecutorTest, UnknownMethodFailsWithItsName) {
    TaskResult result = executor_->execute(makeTask("t", "doesNotExist"), *state_);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("doesNotExist"), std::string::npos);
    EXPECT_FALSE(result.decision.has_value());
}

TEST_F(TaskExecutorTest, FailureWithoutMessageReportsUnknownError) {
    TaskResult result = executor_->execute(makeTask("t", "fail"), *state_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Unknown error");
}

TEST_F(TaskExecutorTest, NonStandardThrowIsATaskFailure) {
    TaskResult result;
    EXPECT_NO_THROW(result = executor_->execute(makeTask("t1", "weird"), *state_));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Unknown error");
}

TEST_F(TaskExecutorTest, SuccessfulTaskWithHintRecordsDecision) {
    TaskDefinition task = makeTask("sheets", "getSheets");
    task.autonomousDecision = "Reuse existing sheets";

    TaskResult result = executor_->execute(task, *state_);

    ASSERT_TRUE(result.decision.has_value());
    EXPECT_EQ(result.decision->decision, "Executed getSheets successfully");
    EXPECT_EQ(result.decision->reason, "Reuse existing sheets");
}

TEST_F(TaskExecutorTest, OnlyWellKnownNonNullOutputsBecomeContextUpdates) {
    TaskResult sheets = executor_->execute(makeTask("sheets", "getSheets"), *state_);
    EXPECT_EQ(sheets.contextUpdates, (nlohmann::json{{"lastSheetId", 42}}));

    TaskResult place = executor_->execute(makeTask("place", "placeViewOnSheet"), *state_);
    EXPECT_TRUE(place.contextUpdates.empty());
}

TEST_F(TaskExecutorTest, ContextValuesAreInjectedUnlessExplicit) {
    state_->context().set("lastSheetId", 42);
    state_->context().set("lastViewId", "view-9");

    executor_->execute(makeTask("implicit", "placeViewOnSheet"), *state_);
    executor_->execute(makeTask("explicit", "placeViewOnSheet", {{"sheetId", 5}}), *state_);

    auto calls = recorder_.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].second["sheetId"], 42);
    EXPECT_EQ(calls[0].second["viewId"], "view-9");
    EXPECT_FALSE(calls[0].second.contains("scheduleId"));
    EXPECT_EQ(calls[1].second["sheetId"], 5);
    EXPECT_EQ(calls[1].second["viewId"], "view-9");
}

TEST_F(TaskExecutorTest, TemplateParametersAreNotModifiedByInjection) {
    state_->context().set("lastSheetId", 42);
    TaskDefinition task = makeTask("implicit", "placeViewOnSheet", {{"scale", 100}});

    nlohmann::json prepared = executor_->prepareParameters(task, state_->context());

    EXPECT_EQ(prepared["sheetId"], 42);
    EXPECT_FALSE(task.parameters.contains("sheetId"));
}

} // namespace archflow::workflow_engine::tests
