#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "orchestrator/run_orchestrator.h"
#include "support/fake_engine_client.h"
#include "support/temp_dir.h"

using namespace mhub;
using mhub::test::FakeEngineClient;
using mhub::test::TempDir;

namespace {

constexpr const char* kImage = "mhubai/totalsegmentator:latest";

class RunOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.grace_period = std::chrono::milliseconds(2000);
        config_.log_drain_timeout = std::chrono::milliseconds(1000);
    }

    void TearDown() override {
        orchestrator_.reset();
    }

    RunOrchestrator& orchestrator() {
        if (!orchestrator_) {
            orchestrator_ = std::make_unique<RunOrchestrator>(engine_, registry_, locks_, config_);
        }
        return *orchestrator_;
    }

    RunRequest request(const std::string& input = "in") {
        RunRequest r;
        r.image = kImage;
        r.input_path = temp_.subdir(input).string();
        r.output_path = temp_.subdir("out").string();
        r.model_id = "totalsegmentator";
        return r;
    }

    std::string submit(RunRequest r) {
        auto res = orchestrator().submit(std::move(r));
        EXPECT_TRUE(res.ok()) << res.error_message;
        return res.ok() ? *res.data : std::string();
    }

    JobInfo waitForState(const std::string& id, JobState state,
                         std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto info = registry_.get(id);
            const bool expired = std::chrono::steady_clock::now() > deadline;
            if (info.ok() && (info.data->state == state || is_terminal(info.data->state) || expired)) {
                return *info.data;
            }
            if (expired) {
                ADD_FAILURE() << "job " << id << " not found";
                return JobInfo{};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    JobInfo waitForTerminal(const std::string& id) {
        return waitForState(id, JobState::Completed);
    }

    TempDir temp_{"mhub-orchestrator"};
    FakeEngineClient engine_;
    JobRegistry registry_;
    ImageLockTable locks_;
    OrchestratorConfig config_;
    std::unique_ptr<RunOrchestrator> orchestrator_;
};

}  // namespace

TEST_F(RunOrchestratorTest, CompletedJobCarriesLogsAndHistory) {
    engine_.addImage(kImage);
    engine_.container_script.log_lines = {"loading dicom", "segmenting", "writing output"};

    auto id = submit(request());
    auto info = waitForTerminal(id);

    EXPECT_EQ(info.state, JobState::Completed);
    EXPECT_EQ(info.history,
              (std::vector<JobState>{JobState::Queued, JobState::Starting, JobState::Running, JobState::Completed}));
    ASSERT_TRUE(info.exit_code);
    EXPECT_EQ(*info.exit_code, 0);
    EXPECT_TRUE(info.started_at);
    EXPECT_TRUE(info.finished_at);
    EXPECT_EQ(info.container_id, "c1");

    auto logs = registry_.logs(id);
    ASSERT_TRUE(logs.ok());
    EXPECT_TRUE((*logs.data)->closed());
    EXPECT_EQ((*logs.data)->snapshot(),
              (std::vector<std::string>{"loading dicom", "segmenting", "writing output"}));
    EXPECT_EQ(engine_.releasedCount(), 1u);
}

TEST_F(RunOrchestratorTest, SubscriberGetsEveryLineBeforeEnd) {
    engine_.addImage(kImage);
    engine_.container_script.run_time = std::chrono::milliseconds(100);
    for (int i = 0; i < 50; ++i) {
        engine_.container_script.log_lines.push_back("line " + std::to_string(i));
    }

    auto id = submit(request());
    auto sub = orchestrator().subscribeLogs(id, /*from_start=*/true);
    ASSERT_TRUE(sub.ok());
    std::vector<std::string> got;
    while (auto line = sub.data->next()) got.push_back(*line);

    ASSERT_EQ(got.size(), 50u);
    EXPECT_EQ(got.front(), "line 0");
    EXPECT_EQ(got.back(), "line 49");
    EXPECT_EQ(waitForTerminal(id).state, JobState::Completed);
}

TEST_F(RunOrchestratorTest, JobLogKeepsNewestLinesUpToCap) {
    config_.max_log_lines = 10;
    engine_.addImage(kImage);
    for (int i = 0; i < 25; ++i) {
        engine_.container_script.log_lines.push_back("line " + std::to_string(i));
    }

    auto id = submit(request());
    ASSERT_EQ(waitForTerminal(id).state, JobState::Completed);
    auto logs = *registry_.logs(id).data;
    auto kept = logs->snapshot();
    ASSERT_EQ(kept.size(), 10u);
    EXPECT_EQ(kept.front(), "line 15");
    EXPECT_EQ(kept.back(), "line 24");
    EXPECT_EQ(logs->dropped(), 15u);
}

TEST_F(RunOrchestratorTest, NonZeroExitFailsWithExitCode) {
    engine_.addImage(kImage);
    engine_.container_script.exit_code = 3;

    auto info = waitForTerminal(submit(request()));
    EXPECT_EQ(info.state, JobState::Failed);
    EXPECT_EQ(info.failure, ErrorKind::kContainerFailed);
    ASSERT_TRUE(info.exit_code);
    EXPECT_EQ(*info.exit_code, 3);
}

TEST_F(RunOrchestratorTest, MissingImageIsPulledFirst) {
    engine_.pull_script.lines = {"Pulling from mhubai/totalsegmentator", "Status: Downloaded newer image"};
    engine_.container_script.log_lines = {"running"};

    auto id = submit(request());
    auto info = waitForTerminal(id);
    EXPECT_EQ(info.state, JobState::Completed);
    EXPECT_EQ(info.history[1], JobState::Pulling);
    EXPECT_EQ((*registry_.logs(id).data)->snapshot(),
              (std::vector<std::string>{"Pulling from mhubai/totalsegmentator", "Status: Downloaded newer image",
                                        "running"}));
}

TEST_F(RunOrchestratorTest, WithoutAutoPullMissingImageFails) {
    config_.auto_pull = false;
    auto info = waitForTerminal(submit(request()));
    EXPECT_EQ(info.state, JobState::Failed);
    EXPECT_EQ(info.failure, ErrorKind::kImageNotFound);
    EXPECT_TRUE(engine_.pulled.empty());
}

TEST_F(RunOrchestratorTest, PullFailureFailsJob) {
    engine_.pull_script.error = ErrorKind::kPullError;
    engine_.pull_script.error_message = "manifest unknown";
    auto info = waitForTerminal(submit(request()));
    EXPECT_EQ(info.state, JobState::Failed);
    EXPECT_EQ(info.failure, ErrorKind::kPullError);
    EXPECT_EQ(engine_.createdCount(), 0u);
}

TEST_F(RunOrchestratorTest, EngineDownFailsJob) {
    engine_.list_images_error = ErrorKind::kEngineUnavailable;
    auto info = waitForTerminal(submit(request()));
    EXPECT_EQ(info.state, JobState::Failed);
    EXPECT_EQ(info.failure, ErrorKind::kEngineUnavailable);
}

TEST_F(RunOrchestratorTest, CreateFailureKeepsEngineError) {
    engine_.addImage(kImage);
    engine_.create_error = ErrorKind::kInvalidMount;
    auto info = waitForTerminal(submit(request()));
    EXPECT_EQ(info.state, JobState::Failed);
    EXPECT_EQ(info.failure, ErrorKind::kInvalidMount);
    EXPECT_EQ(info.history.back(), JobState::Failed);
}

TEST_F(RunOrchestratorTest, MissingInputFailsBeforePullOrCreate) {
    auto r = request();
    r.input_path = "/does/not/exist";

    auto info = waitForTerminal(submit(std::move(r)));
    EXPECT_EQ(info.state, JobState::Failed);
    EXPECT_EQ(info.failure, ErrorKind::kInvalidMount);
    EXPECT_EQ(info.history, (std::vector<JobState>{JobState::Queued, JobState::Starting, JobState::Failed}));
    EXPECT_NE(info.message.find("/does/not/exist"), std::string::npos);
    EXPECT_EQ(engine_.createdCount(), 0u);
    std::lock_guard<std::mutex> lock(engine_.mutex);
    EXPECT_TRUE(engine_.pulled.empty());
}

TEST_F(RunOrchestratorTest, OutputThatIsAFileIsInvalidMount) {
    engine_.addImage(kImage);
    auto r = request();
    r.output_path = temp_.writeFile("result.nii", "x").string();

    auto info = waitForTerminal(submit(std::move(r)));
    EXPECT_EQ(info.failure, ErrorKind::kInvalidMount);
    EXPECT_EQ(engine_.createdCount(), 0u);
}

TEST_F(RunOrchestratorTest, CancelStopsRunningContainer) {
    engine_.addImage(kImage);
    engine_.container_script.block_until_killed = true;
    engine_.container_script.log_lines = {"started"};

    auto id = submit(request());
    ASSERT_EQ(waitForState(id, JobState::Running).state, JobState::Running);

    auto res = orchestrator().cancel(id);
    EXPECT_TRUE(res.ok()) << res.error_message;

    auto info = waitForTerminal(id);
    EXPECT_EQ(info.state, JobState::Killed);
    EXPECT_EQ(info.failure, ErrorKind::kCancelled);
    EXPECT_GE(engine_.killedCount(), 1u);

    orchestrator().shutdown();
    EXPECT_EQ(engine_.releasedCount(), 1u);
}

TEST_F(RunOrchestratorTest, CancelKeepsLinesAlreadyWritten) {
    engine_.addImage(kImage);
    engine_.container_script.block_until_killed = true;
    engine_.container_script.line_interval = std::chrono::milliseconds(100);
    engine_.container_script.log_lines = {"l1", "l2", "l3", "l4", "l5"};

    auto id = submit(request());
    ASSERT_EQ(waitForState(id, JobState::Running).state, JobState::Running);
    auto sub = orchestrator().subscribeLogs(id, /*from_start=*/true);
    ASSERT_TRUE(sub.ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    ASSERT_TRUE(orchestrator().cancel(id).ok());
    auto info = waitForTerminal(id);
    EXPECT_EQ(info.state, JobState::Killed);
    EXPECT_EQ(info.message, "cancelled");
    EXPECT_GE(engine_.killedCount(), 1u);

    const std::vector<std::string> expected{"l1", "l2", "l3", "l4", "l5"};
    EXPECT_EQ((*registry_.logs(id).data)->snapshot(), expected);
    std::vector<std::string> streamed;
    while (auto line = sub.data->next()) streamed.push_back(*line);
    EXPECT_EQ(streamed, expected);
}

TEST_F(RunOrchestratorTest, CancelTerminalOrUnknownJob) {
    engine_.addImage(kImage);
    auto id = submit(request());
    ASSERT_EQ(waitForTerminal(id).state, JobState::Completed);

    EXPECT_EQ(orchestrator().cancel(id).error, ErrorKind::kAlreadyTerminal);
    EXPECT_EQ(orchestrator().cancel("does-not-exist").error, ErrorKind::kNotFound);
    EXPECT_EQ(waitForTerminal(id).state, JobState::Completed);
}

TEST_F(RunOrchestratorTest, CancelDuringPullCreatesNoContainer) {
    engine_.pull_script.block_until_cancelled = true;
    auto id = submit(request());
    ASSERT_EQ(waitForState(id, JobState::Pulling).state, JobState::Pulling);

    EXPECT_TRUE(orchestrator().cancel(id).ok());
    auto info = waitForTerminal(id);
    EXPECT_EQ(info.state, JobState::Killed);
    EXPECT_EQ(engine_.createdCount(), 0u);
}

TEST_F(RunOrchestratorTest, RunTimeoutKillsContainer) {
    engine_.addImage(kImage);
    engine_.container_script.block_until_killed = true;
    auto r = request();
    r.run_timeout = std::chrono::seconds(1);

    auto info = waitForTerminal(submit(std::move(r)));
    EXPECT_EQ(info.state, JobState::Failed);
    EXPECT_EQ(info.failure, ErrorKind::kTimeout);
    EXPECT_GE(engine_.killedCount(), 1u);
}

TEST_F(RunOrchestratorTest, ConcurrentJobsPullSharedImageOnce) {
    engine_.pull_script.delay = std::chrono::milliseconds(200);

    auto a = submit(request("a"));
    auto b = submit(request("b"));
    EXPECT_EQ(waitForTerminal(a).state, JobState::Completed);
    EXPECT_EQ(waitForTerminal(b).state, JobState::Completed);

    EXPECT_EQ(engine_.max_concurrent_pulls.load(), 1);
    std::lock_guard<std::mutex> lock(engine_.mutex);
    EXPECT_EQ(engine_.pulled.size(), 1u);
    EXPECT_EQ(engine_.created.size(), 2u);
}

TEST_F(RunOrchestratorTest, ExclusiveInputQueuesSecondJob) {
    config_.allow_concurrent_input = false;
    engine_.addImage(kImage);
    engine_.container_script.block_until_killed = true;

    auto first = submit(request("shared"));
    ASSERT_EQ(waitForState(first, JobState::Running).state, JobState::Running);
    auto second = submit(request("shared"));

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(registry_.get(second).data->state, JobState::Queued);

    ASSERT_TRUE(orchestrator().cancel(first).ok());
    EXPECT_EQ(waitForState(second, JobState::Running).state, JobState::Running);
    ASSERT_TRUE(orchestrator().cancel(second).ok());
}

TEST_F(RunOrchestratorTest, ConcurrentInputAllowedByDefault) {
    engine_.addImage(kImage);
    engine_.container_script.block_until_killed = true;

    auto first = submit(request("shared"));
    auto second = submit(request("shared"));
    EXPECT_EQ(waitForState(first, JobState::Running).state, JobState::Running);
    EXPECT_EQ(waitForState(second, JobState::Running).state, JobState::Running);
}

TEST_F(RunOrchestratorTest, KillAllCancelsActiveAndReportsTerminal) {
    engine_.addImage(kImage);
    auto done = submit(request("done"));
    ASSERT_EQ(waitForTerminal(done).state, JobState::Completed);

    engine_.container_script.block_until_killed = true;
    std::vector<std::string> running;
    for (const char* dir : {"a", "b", "c"}) {
        running.push_back(submit(request(dir)));
    }
    for (const auto& id : running) {
        ASSERT_EQ(waitForState(id, JobState::Running).state, JobState::Running);
    }

    auto report = orchestrator().killAll();
    ASSERT_EQ(report.entries.size(), 4u);
    EXPECT_EQ(report.entries[0].job_id, done);
    EXPECT_EQ(report.entries[0].outcome, ErrorKind::kAlreadyTerminal);
    EXPECT_EQ(report.killed, 3u);
    EXPECT_EQ(report.already_terminal, 1u);
    EXPECT_EQ(report.failed, 0u);
    for (const auto& id : running) {
        EXPECT_EQ(registry_.get(id).data->state, JobState::Killed);
    }
    EXPECT_EQ(registry_.get(done).data->state, JobState::Completed);
}

TEST_F(RunOrchestratorTest, KillAllWaitsOneGracePeriodForStuckJobs) {
    config_.grace_period = std::chrono::milliseconds(500);
    engine_.addImage(kImage);
    engine_.container_script.block_until_killed = true;
    engine_.container_script.wait_ignores_cancel = true;

    std::vector<std::string> ids;
    for (const char* dir : {"a", "b", "c", "d"}) {
        ids.push_back(submit(request(dir)));
    }
    for (const auto& id : ids) {
        ASSERT_EQ(waitForState(id, JobState::Running).state, JobState::Running);
    }

    const auto started = std::chrono::steady_clock::now();
    auto report = orchestrator().killAll();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(report.killed, 4u);
    EXPECT_GE(elapsed, std::chrono::milliseconds(450));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    for (const auto& id : ids) {
        auto info = registry_.get(id).data;
        EXPECT_EQ(info->state, JobState::Killed);
        EXPECT_EQ(info->message, "killed after grace period");
    }
    EXPECT_EQ(engine_.killedCount(), 4u);
}

TEST_F(RunOrchestratorTest, ShutdownKillsActiveJobsAndRejectsSubmissions) {
    engine_.addImage(kImage);
    engine_.container_script.block_until_killed = true;
    auto id = submit(request());
    ASSERT_EQ(waitForState(id, JobState::Running).state, JobState::Running);

    orchestrator().shutdown();
    EXPECT_EQ(registry_.get(id).data->state, JobState::Killed);
    EXPECT_EQ(orchestrator().submit(request()).error, ErrorKind::kInvalidArgument);
}

TEST_F(RunOrchestratorTest, EmptyImageIsRejected) {
    RunRequest r = request();
    r.image.clear();
    EXPECT_EQ(orchestrator().submit(r).error, ErrorKind::kInvalidArgument);
    EXPECT_TRUE(registry_.list().empty());
}

TEST_F(RunOrchestratorTest, TerminalStateImpliesClosedLog) {
    engine_.addImage(kImage);
    engine_.container_script.log_lines = {"a", "b"};
    for (int i = 0; i < 10; ++i) {
        auto id = submit(request("in" + std::to_string(i)));
        for (;;) {
            auto info = registry_.get(id);
            ASSERT_TRUE(info.ok());
            if (is_terminal(info.data->state)) {
                EXPECT_TRUE((*registry_.logs(id).data)->closed());
                break;
            }
            std::this_thread::yield();
        }
    }
}
