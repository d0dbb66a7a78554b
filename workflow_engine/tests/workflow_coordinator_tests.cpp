#include "workflow_engine/workflow_coordinator.h"
#include "workflow_engine/workflow_exceptions.h"
#include "workflow_engine/workflow_serialization.h"
#include "common_utils/utilities/exceptions.h"

#include "workflow_test_support.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>

namespace archflow::workflow_engine::tests {

class WorkflowCoordinatorTest : public CoordinatorTestBase {};

TEST_F(WorkflowCoordinatorTest, TasksRunInDeclaredOrder) {
    templates_->addTemplate("Ordered", makeTemplate("Ordered", {
        makePhase("A", {makeTask("a1", "record"), makeTask("a2", "record")}),
        makePhase("B", {makeTask("b1", "record"), makeTask("b2", "record")})
    }));

    auto summary = coordinator_->createAndRun(makeRequest("Ordered"));
    auto status = coordinator_->getStatus(summary.workflowId);

    EXPECT_EQ(status.completedTasks, (std::vector<std::string>{
        "a1 description", "a2 description", "b1 description", "b2 description"}));
    EXPECT_TRUE(status.failedTasks.empty());
    EXPECT_EQ(summary.status, WorkflowStatus::CompletedSuccessfully);
    EXPECT_EQ(status.currentPhase, "B");
    EXPECT_FALSE(status.isPaused);
}

TEST_F(WorkflowCoordinatorTest, SingleSheetExample) {
    TaskDefinition titleBlock = makeTask("t1", "custom");
    titleBlock.autonomousDecision = "pick default title block";
    templates_->addTemplate("Example", makeTemplate("Example", {
        makePhase("P1", {titleBlock, makeTask("t2", "getSheets")})
    }));

    auto summary = coordinator_->createAndRun(makeRequest("Example"));
    auto status = coordinator_->getStatus(summary.workflowId);

    EXPECT_EQ(status.completedTasks, (std::vector<std::string>{"t1 description", "t2 description"}));
    ASSERT_EQ(status.decisions.size(), 1u);
    EXPECT_EQ(status.decisions[0].task, "t1");
    EXPECT_EQ(status.decisions[0].decision, "Custom task - marked for future implementation");
    EXPECT_EQ(status.decisions[0].reason, "pick default title block");
    EXPECT_EQ(status.context["lastSheetId"], 7);
    EXPECT_EQ(status.status, WorkflowStatus::CompletedSuccessfully);
    EXPECT_EQ(toString(status.status), "Completed successfully");

    EXPECT_EQ(summary.tasksCompleted, 2);
    EXPECT_EQ(summary.decisionsMade, 1);
    ASSERT_EQ(summary.phases.size(), 1u);
    EXPECT_EQ(summary.phases[0].decisionsCount, 1);
}

TEST_F(WorkflowCoordinatorTest, ContextIsSeededFromRequest) {
    templates_->addTemplate("Seeded", makeTemplate("Seeded", {makePhase("Only", {})}));
    WorkflowRequest request = makeRequest("Seeded");
    request.projectType = "Healthcare";
    request.buildingCode = "NFPA_101";
    request.customParameters = {{"levels", 4}};

    auto summary = coordinator_->createAndRun(request);
    auto status = coordinator_->getStatus(summary.workflowId);

    EXPECT_EQ(status.context["projectType"], "Healthcare");
    EXPECT_EQ(status.context["buildingCode"], "NFPA_101");
    EXPECT_EQ(status.context["customParameters"]["levels"], 4);
    EXPECT_EQ(summary.status, WorkflowStatus::CompletedSuccessfully);
}

TEST_F(WorkflowCoordinatorTest, OutputOfOneTaskFeedsTheNext) {
    templates_->addTemplate("Chained", makeTemplate("Chained", {
        makePhase("Sheets", {makeTask("first", "getSheets")}),
        makePhase("Views", {makeTask("implicit", "record"), makeTask("explicit", "record", {{"sheetId", 1}})})
    }));

    coordinator_->createAndRun(makeRequest("Chained"));

    auto calls = recorder_.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[1].second["sheetId"], 7);
    EXPECT_EQ(calls[2].second["sheetId"], 1);
}

TEST_F(WorkflowCoordinatorTest, LaterOutputsOverwriteEarlierOnes) {
    templates_->addTemplate("Sheets", makeTemplate("Sheets", {
        makePhase("Create", {makeTask("s1", "createSheet"), makeTask("s2", "createSheet")})
    }));

    auto summary = coordinator_->createAndRun(makeRequest("Sheets"));

    EXPECT_EQ(coordinator_->getStatus(summary.workflowId).context["lastSheetId"], 102);
}

TEST_F(WorkflowCoordinatorTest, FailuresDoNotStopTheRun) {
    templates_->addTemplate("Mixed", makeTemplate("Mixed", {
        makePhase("A", {makeTask("ok1", "record"), makeTask("bad", "fail"), makeTask("missing", "doesNotExist")}),
        makePhase("B", {makeTask("crash", "throwing"), makeTask("ok2", "record")})
    }));

    auto summary = coordinator_->createAndRun(makeRequest("Mixed"));
    auto status = coordinator_->getStatus(summary.workflowId);

    EXPECT_EQ(summary.status, WorkflowStatus::CompletedWithErrors);
    EXPECT_EQ(toString(summary.status), "Completed with errors");
    EXPECT_EQ(status.completedTasks, (std::vector<std::string>{"ok1 description", "ok2 description"}));
    ASSERT_EQ(status.failedTasks.size(), 3u);
    EXPECT_EQ(status.failedTasks[0], "bad description: sheet number already in use");
    EXPECT_NE(status.failedTasks[1].find("doesNotExist"), std::string::npos);
    EXPECT_EQ(status.failedTasks[2], "crash description: document is read-only");

    ASSERT_EQ(summary.phases.size(), 2u);
    EXPECT_EQ(summary.phases[0].tasksCompleted, 1);
    EXPECT_EQ(summary.phases[0].tasksFailed, 2);
    EXPECT_EQ(summary.phases[1].tasksFailed, 1);
}

TEST_F(WorkflowCoordinatorTest, NonStandardThrowIsRecordedAndRunContinues) {
    operations_->registerOperation("weird", [](const OperationContext&, const nlohmann::json&) -> OperationResult {
        throw 42;
    });
    templates_->addTemplate("Odd", makeTemplate("Odd", {
        makePhase("A", {makeTask("t1", "weird"), makeTask("t2", "record")})
    }));

    WorkflowRunSummary summary;
    ASSERT_NO_THROW(summary = coordinator_->createAndRun(makeRequest("Odd")));
    auto status = coordinator_->getStatus(summary.workflowId);

    EXPECT_EQ(summary.status, WorkflowStatus::CompletedWithErrors);
    EXPECT_EQ(status.failedTasks, (std::vector<std::string>{"t1 description: Unknown error"}));
    EXPECT_EQ(status.completedTasks, (std::vector<std::string>{"t2 description"}));
}

TEST_F(WorkflowCoordinatorTest, EmptyTemplateCompletesSuccessfully) {
    templates_->addTemplate("Empty", makeTemplate("Empty", {}));
    auto summary = coordinator_->createAndRun(makeRequest("Empty"));
    EXPECT_EQ(summary.status, WorkflowStatus::CompletedSuccessfully);
    EXPECT_EQ(summary.tasksCompleted, 0);
}

TEST_F(WorkflowCoordinatorTest, PauseAtPhaseBoundaryThenResumeToCompletion) {
    templates_->addTemplate("Pausable", makeTemplate("Pausable", {
        makePhase("A", {makeTask("a1", "record"), makeTask("a2", "pauseHere")}),
        makePhase("B", {makeTask("b1", "record"), makeTask("b2", "record")})
    }));

    auto first = coordinator_->createAndRun(makeRequest("Pausable"));
    EXPECT_EQ(first.status, WorkflowStatus::Paused);
    EXPECT_EQ(first.tasksCompleted, 2);
    EXPECT_EQ(recordedOperations(), (std::vector<std::string>{"record", "pauseHere"}));

    auto paused = coordinator_->getStatus(first.workflowId);
    EXPECT_TRUE(paused.isPaused);
    EXPECT_EQ(paused.phaseIndex, 1u);
    EXPECT_EQ(paused.taskIndex, 0u);

    auto resumed = coordinator_->resumeAndRun(first.workflowId);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->status, WorkflowStatus::CompletedSuccessfully);

    auto status = coordinator_->getStatus(first.workflowId);
    EXPECT_EQ(status.completedTasks, (std::vector<std::string>{
        "a1 description", "a2 description", "b1 description", "b2 description"}));
    EXPECT_EQ(recordedOperations(), (std::vector<std::string>{"record", "pauseHere", "record", "record"}));
}

TEST_F(WorkflowCoordinatorTest, PauseMidPhaseResumesAtNextTask) {
    templates_->addTemplate("MidPhase", makeTemplate("MidPhase", {
        makePhase("A", {makeTask("a1", "pauseHere"), makeTask("a2", "record"), makeTask("a3", "record")})
    }));

    auto first = coordinator_->createAndRun(makeRequest("MidPhase"));
    EXPECT_EQ(first.status, WorkflowStatus::Paused);
    EXPECT_EQ(first.tasksCompleted, 1);

    auto resumed = coordinator_->resumeAndRun(first.workflowId);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->tasksCompleted, 3);
    ASSERT_EQ(resumed->phases.size(), 1u);
    EXPECT_EQ(resumed->phases[0].tasksCompleted, 3);
    EXPECT_EQ(recordedOperations(), (std::vector<std::string>{"pauseHere", "record", "record"}));
}

TEST_F(WorkflowCoordinatorTest, PauseOnLastTaskCompletesOnResume) {
    templates_->addTemplate("Tail", makeTemplate("Tail", {makePhase("A", {makeTask("a1", "pauseHere")})}));

    auto first = coordinator_->createAndRun(makeRequest("Tail"));
    EXPECT_EQ(first.status, WorkflowStatus::Paused);

    auto resumed = coordinator_->resumeAndRun(first.workflowId);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->status, WorkflowStatus::CompletedSuccessfully);
    EXPECT_EQ(recordedOperations().size(), 1u);
}

TEST_F(WorkflowCoordinatorTest, ResumeDuringActiveDriveIsCarriedByTheDriver) {
    std::optional<WorkflowRunSummary> nested;
    operations_->registerOperation("pauseAndResume", [this, &nested](const OperationContext& context,
                                                                     const nlohmann::json&) {
        coordinator_->pause(context.workflowId());
        nested = coordinator_->resumeAndRun(context.workflowId());
        return OperationResult::ok();
    });
    templates_->addTemplate("Bounce", makeTemplate("Bounce", {
        makePhase("A", {makeTask("a1", "pauseAndResume"), makeTask("a2", "record")}),
        makePhase("B", {makeTask("b1", "record")})
    }));

    auto summary = coordinator_->createAndRun(makeRequest("Bounce"));

    EXPECT_FALSE(nested.has_value());
    EXPECT_EQ(summary.status, WorkflowStatus::CompletedSuccessfully);
    EXPECT_EQ(summary.tasksCompleted, 3);
    EXPECT_FALSE(coordinator_->getStatus(summary.workflowId).isPaused);
    EXPECT_FALSE(workflows_->get(summary.workflowId)->isDriving());
}

TEST_F(WorkflowCoordinatorTest, CompletedRuntimeMatchesExecutionTime) {
    templates_->addTemplate("Quick", makeTemplate("Quick", {makePhase("A", {makeTask("a1", "record")})}));

    auto summary = coordinator_->createAndRun(makeRequest("Quick"));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_DOUBLE_EQ(coordinator_->getStatus(summary.workflowId).runtimeSeconds, summary.executionTimeSeconds);
}

TEST_F(WorkflowCoordinatorTest, PauseBeforeRunExecutesNothing) {
    templates_->addTemplate("Held", makeTemplate("Held", {makePhase("A", {makeTask("a1", "record")})}));

    std::string workflowId = coordinator_->createWorkflow(makeRequest("Held"));
    coordinator_->pause(workflowId);
    coordinator_->pause(workflowId);

    auto summary = coordinator_->runWorkflow(workflowId);
    EXPECT_EQ(summary.status, WorkflowStatus::Paused);
    EXPECT_TRUE(recordedOperations().empty());

    coordinator_->resume(workflowId);
    EXPECT_EQ(coordinator_->getStatus(workflowId).status, WorkflowStatus::Running);
    EXPECT_EQ(coordinator_->runWorkflow(workflowId).status, WorkflowStatus::CompletedSuccessfully);
}

TEST_F(WorkflowCoordinatorTest, CompletedWorkflowRejectsControl) {
    templates_->addTemplate("Done", makeTemplate("Done", {makePhase("A", {makeTask("a1", "record")})}));
    auto summary = coordinator_->createAndRun(makeRequest("Done"));

    EXPECT_THROW(coordinator_->pause(summary.workflowId), common_utils::InvalidStateException);
    EXPECT_THROW(coordinator_->resume(summary.workflowId), common_utils::InvalidStateException);
    EXPECT_THROW(coordinator_->runWorkflow(summary.workflowId), common_utils::InvalidStateException);
    EXPECT_EQ(coordinator_->getStatus(summary.workflowId).status, WorkflowStatus::CompletedSuccessfully);
}

TEST_F(WorkflowCoordinatorTest, UnknownIdIsNotFoundAndRegistersNothing) {
    EXPECT_THROW(coordinator_->getStatus("nope"), WorkflowNotFoundException);
    EXPECT_THROW(coordinator_->pause("nope"), WorkflowNotFoundException);
    EXPECT_THROW(coordinator_->resume("nope"), WorkflowNotFoundException);
    EXPECT_THROW(coordinator_->resumeAndRun("nope"), WorkflowNotFoundException);
    EXPECT_EQ(workflows_->size(), 0u);
}

TEST_F(WorkflowCoordinatorTest, FailedCreationRegistersNothing) {
    EXPECT_THROW(coordinator_->createAndRun(makeRequest("")), common_utils::ValidationException);
    EXPECT_THROW(coordinator_->createAndRun(makeRequest("Unknown")), TemplateNotFoundException);
    EXPECT_EQ(workflows_->size(), 0u);
    EXPECT_TRUE(coordinator_->listWorkflows().empty());
}

TEST_F(WorkflowCoordinatorTest, IdsAreUniqueAndListedInCreationOrder) {
    templates_->addTemplate("Quick", makeTemplate("Quick", {makePhase("A", {makeTask("a1", "record")})}));

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(coordinator_->createWorkflow(makeRequest("Quick")));
    }

    auto entries = coordinator_->listWorkflows();
    ASSERT_EQ(entries.size(), 5u);
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(entries[i].workflowId, ids[i]);
        EXPECT_EQ(entries[i].workflowType, "Quick");
        EXPECT_EQ(entries[i].status, WorkflowStatus::Running);
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(std::unique(ids.begin(), ids.end()), ids.end());
}

TEST_F(WorkflowCoordinatorTest, AsyncRunDeliversSummaryThroughFuture) {
    templates_->addTemplate("Background", makeTemplate("Background", {
        makePhase("A", {makeTask("a1", "record"), makeTask("a2", "getSheets")})
    }));

    AsyncWorkflowHandle handle = coordinator_->executeWorkflowAsync(makeRequest("Background"));
    EXPECT_TRUE(workflows_->contains(handle.workflowId));

    WorkflowRunSummary summary = handle.result.get();
    EXPECT_EQ(summary.workflowId, handle.workflowId);
    EXPECT_EQ(summary.status, WorkflowStatus::CompletedSuccessfully);
    EXPECT_EQ(summary.tasksCompleted, 2);
}

TEST_F(WorkflowCoordinatorTest, AsyncCreationErrorsAreThrownImmediately) {
    EXPECT_THROW(coordinator_->executeWorkflowAsync(makeRequest("Unknown")), TemplateNotFoundException);
}

TEST_F(WorkflowCoordinatorTest, DistinctWorkflowsRunConcurrently) {
    templates_->addTemplate("Parallel", makeTemplate("Parallel", {
        makePhase("A", {makeTask("a1", "createSheet"), makeTask("a2", "record")}),
        makePhase("B", {makeTask("b1", "record")})
    }));

    std::vector<AsyncWorkflowHandle> handles;
    for (int i = 0; i < 8; ++i) {
        handles.push_back(coordinator_->executeWorkflowAsync(makeRequest("Parallel")));
    }
    for (auto& handle : handles) {
        auto summary = handle.result.get();
        EXPECT_EQ(summary.status, WorkflowStatus::CompletedSuccessfully);
        EXPECT_EQ(summary.tasksCompleted, 3);
    }
    EXPECT_EQ(recorder_.calls().size(), 24u);
}

// =============================================================================
// Retention
// =============================================================================

class RetentionTest : public CoordinatorTestBase {
protected:
    size_t maxRetained() const override { return 2; }
};

TEST_F(RetentionTest, OldestCompletedWorkflowsAreEvicted) {
    templates_->addTemplate("Quick", makeTemplate("Quick", {makePhase("A", {makeTask("a1", "record")})}));

    auto first = coordinator_->createAndRun(makeRequest("Quick"));
    auto second = coordinator_->createAndRun(makeRequest("Quick"));
    auto third = coordinator_->createAndRun(makeRequest("Quick"));

    EXPECT_EQ(workflows_->size(), 2u);
    EXPECT_FALSE(workflows_->contains(first.workflowId));
    EXPECT_TRUE(workflows_->contains(second.workflowId));
    EXPECT_TRUE(workflows_->contains(third.workflowId));
    EXPECT_THROW(coordinator_->getStatus(first.workflowId), WorkflowNotFoundException);
}

TEST_F(RetentionTest, UnfinishedWorkflowsAreNeverEvicted) {
    templates_->addTemplate("Quick", makeTemplate("Quick", {makePhase("A", {makeTask("a1", "record")})}));

    std::string a = coordinator_->createWorkflow(makeRequest("Quick"));
    std::string b = coordinator_->createWorkflow(makeRequest("Quick"));
    std::string c = coordinator_->createWorkflow(makeRequest("Quick"));

    EXPECT_EQ(workflows_->size(), 3u);

    coordinator_->runWorkflow(b);
    EXPECT_EQ(workflows_->size(), 2u);
    EXPECT_TRUE(workflows_->contains(a));
    EXPECT_FALSE(workflows_->contains(b));
    EXPECT_TRUE(workflows_->contains(c));
}

// =============================================================================
// Serialization
// =============================================================================

TEST_F(WorkflowCoordinatorTest, RunSummaryJsonIsKeyedByPhaseName) {
    templates_->addTemplate("Report", makeTemplate("Report", {
        makePhase("Sheet Setup", {makeTask("s1", "record")}),
        makePhase("Annotation", {makeTask("t1", "fail")})
    }));

    nlohmann::json summary = coordinator_->createAndRun(makeRequest("Report"));

    EXPECT_EQ(summary["workflowType"], "Report");
    EXPECT_EQ(summary["status"], "Completed with errors");
    EXPECT_EQ(summary["tasksCompleted"], 1);
    EXPECT_EQ(summary["tasksFailed"], 1);
    EXPECT_TRUE(summary["executionTime"].is_number());
    EXPECT_EQ(summary["summary"]["Sheet Setup"]["tasksCompleted"], 1);
    EXPECT_EQ(summary["summary"]["Annotation"]["tasksFailed"], 1);
}

TEST_F(WorkflowCoordinatorTest, SnapshotJsonCarriesListsAndDecisions) {
    TaskDefinition custom = makeTask("c1", "custom");
    templates_->addTemplate("Snap", makeTemplate("Snap", {makePhase("A", {custom, makeTask("f1", "fail")})}));

    auto summary = coordinator_->createAndRun(makeRequest("Snap"));
    nlohmann::json status = coordinator_->getStatus(summary.workflowId);

    EXPECT_EQ(status["workflowId"], summary.workflowId);
    EXPECT_EQ(status["tasksCompleted"], nlohmann::json::array({"c1 description"}));
    EXPECT_EQ(status["tasksFailed"].size(), 1u);
    ASSERT_EQ(status["decisionsMade"].size(), 1u);
    EXPECT_EQ(status["decisionsMade"][0]["reason"], "No specific logic defined yet");
    EXPECT_EQ(status["isPaused"], false);

    std::string startTime = status["startTime"];
    EXPECT_EQ(startTime.back(), 'Z');
}

} // namespace archflow::workflow_engine::tests
