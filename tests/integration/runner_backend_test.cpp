#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "api/runner_backend.h"
#include "support/catalog_fixture.h"
#include "support/fake_engine_client.h"
#include "support/temp_dir.h"

using namespace mhub;
using mhub::test::FakeEngineClient;
using mhub::test::makeGpu;

namespace {

class RunnerBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.orchestrator.grace_period = std::chrono::milliseconds(1000);
        config_.orchestrator.log_drain_timeout = std::chrono::milliseconds(500);
        auto engine = std::make_unique<FakeEngineClient>();
        engine_ = engine.get();
        pending_engine_ = std::move(engine);
    }

    void TearDown() override {
        backend_.reset();
    }

    RunnerBackend& backend() {
        if (!backend_) {
            backend_ = std::make_unique<RunnerBackend>(
                config_, std::move(pending_engine_),
                [this]() {
                    ++fetches_;
                    if (catalog_down_) {
                        return Result<std::string>::failure(ErrorKind::kCatalogUnreachable, "connection refused");
                    }
                    return Result<std::string>::success(test::kCatalogJson);
                },
                factory_);
        }
        return *backend_;
    }

    JobInfo waitForTerminal(const std::string& id, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto info = backend().getJob(id);
            if (info.ok() && is_terminal(info.data->state)) return *info.data;
            if (std::chrono::steady_clock::now() > deadline) {
                ADD_FAILURE() << "job " << id << " did not finish";
                return info.ok() ? *info.data : JobInfo{};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    JobInfo waitForState(const std::string& id, JobState state) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        for (;;) {
            auto info = backend().getJob(id);
            if (info.ok() && (info.data->state == state || is_terminal(info.data->state))) return *info.data;
            if (std::chrono::steady_clock::now() > deadline) {
                ADD_FAILURE() << "job " << id << " never reached " << to_string(state);
                return JobInfo{};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    // Existing directory under the test's temp dir, for mount paths.
    std::string dir(const std::string& name) { return temp_.subdir(name).string(); }

    test::TempDir temp_{"mhub-backend"};
    BackendConfig config_;
    FakeEngineClient* engine_{nullptr};
    std::unique_ptr<FakeEngineClient> pending_engine_;
    EngineFactory factory_;
    std::atomic<int> fetches_{0};
    std::atomic<bool> catalog_down_{false};
    std::unique_ptr<RunnerBackend> backend_;
};

}  // namespace

TEST_F(RunnerBackendTest, ListsAndSearchesCatalog) {
    auto all = backend().listModels();
    ASSERT_TRUE(all.ok()) << all.error_message;
    EXPECT_EQ(all.data->size(), 3u);

    auto liver = backend().listModels("liver");
    ASSERT_TRUE(liver.ok());
    ASSERT_EQ(liver.data->size(), 1u);
    EXPECT_EQ((*liver.data)[0].name, "totalsegmentator");

    auto by_name = backend().getModel("lungmask");
    ASSERT_TRUE(by_name.ok());
    EXPECT_EQ(by_name.data->image_ref, "mhubai/lungmask:v2");
    EXPECT_EQ(backend().getModel("nope").error, ErrorKind::kNotFound);
}

TEST_F(RunnerBackendTest, CatalogFailureKeepsPreviousSnapshot) {
    ASSERT_TRUE(backend().refreshCatalog().ok());
    catalog_down_ = true;
    auto res = backend().refreshCatalog();
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error, ErrorKind::kCatalogUnreachable);
    EXPECT_TRUE(backend().getModel("totalsegmentator").ok());
}

TEST_F(RunnerBackendTest, ReportsImageStatuses) {
    engine_->addImage("mhubai/totalsegmentator:latest");
    engine_->addImage("mhubai/lungmask:v2", "sha256:old");

    auto statuses = backend().listModelStatuses();
    ASSERT_TRUE(statuses.ok()) << statuses.error_message;
    ASSERT_EQ(statuses.data->size(), 3u);
    EXPECT_EQ((*statuses.data)[0].image.status, ImageStatus::PresentUpToDate);
    EXPECT_EQ((*statuses.data)[1].image.status, ImageStatus::PresentStale);
    EXPECT_EQ((*statuses.data)[2].image.status, ImageStatus::NotPresent);
    EXPECT_EQ((*statuses.data)[0].image.local_created_at, "2024-01-01 00:00:00 +0000 UTC");

    auto one = backend().getModelStatus("lungmask");
    ASSERT_TRUE(one.ok());
    EXPECT_EQ(one.data->image.local_digest, "sha256:old");
    EXPECT_FALSE(one.data->pulling);
}

TEST_F(RunnerBackendTest, EngineFailureSurfacesInStatus) {
    engine_->list_images_error = ErrorKind::kEngineUnavailable;
    auto statuses = backend().listModelStatuses();
    ASSERT_FALSE(statuses.ok());
    EXPECT_EQ(statuses.error, ErrorKind::kEngineUnavailable);
}

TEST_F(RunnerBackendTest, PullOrUpdateRefreshesStaleImage) {
    engine_->addImage("mhubai/lungmask:v2", "sha256:old");
    engine_->pull_script.digest = "sha256:pinned";

    std::vector<std::string> lines;
    CancelToken cancel;
    auto res = backend().pullOrUpdate("lungmask", [&](const std::string& l) { lines.push_back(l); }, cancel);
    ASSERT_TRUE(res.ok()) << res.error_message;
    EXPECT_EQ(lines.size(), 3u);
    EXPECT_EQ(engine_->pulled, (std::vector<std::string>{"mhubai/lungmask:v2"}));

    auto st = backend().getModelStatus("lungmask");
    ASSERT_TRUE(st.ok());
    EXPECT_EQ(st.data->image.status, ImageStatus::PresentUpToDate);
}

TEST_F(RunnerBackendTest, ConcurrentPullsOfOneImageAreSerialized) {
    engine_->pull_script.delay = std::chrono::milliseconds(100);
    auto& b = backend();
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&] {
            CancelToken cancel;
            if (b.pullOrUpdate("totalsegmentator", [](const std::string&) {}, cancel).ok()) ++ok;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), 3);
    EXPECT_EQ(engine_->max_concurrent_pulls.load(), 1);
}

TEST_F(RunnerBackendTest, PullShowsAsPullingAndCancels) {
    engine_->pull_script.block_until_cancelled = true;
    CancelToken cancel;
    std::thread puller([&] {
        auto res = backend().pullOrUpdate("totalsegmentator", [](const std::string&) {}, cancel);
        EXPECT_EQ(res.error, ErrorKind::kCancelled);
    });
    while (engine_->active_pulls.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    auto st = backend().getModelStatus("totalsegmentator");
    ASSERT_TRUE(st.ok());
    EXPECT_TRUE(st.data->pulling);
    cancel.cancel();
    puller.join();

    auto after = backend().getModelStatus("totalsegmentator");
    ASSERT_TRUE(after.ok());
    EXPECT_FALSE(after.data->pulling);
}

TEST_F(RunnerBackendTest, RemoveLocalImage) {
    engine_->addImage("mhubai/totalsegmentator:latest");
    ASSERT_TRUE(backend().removeLocalImage("totalsegmentator").ok());
    EXPECT_EQ(engine_->removed, (std::vector<std::string>{"mhubai/totalsegmentator:latest"}));
    EXPECT_EQ(backend().removeLocalImage("totalsegmentator").error, ErrorKind::kNotFound);
}

TEST_F(RunnerBackendTest, RemoveRefusedWhileRunActive) {
    engine_->addImage("mhubai/totalsegmentator:latest");
    engine_->container_script.block_until_killed = true;

    auto id = backend().submitModel("totalsegmentator", dir("in"), dir("out"));
    ASSERT_TRUE(id.ok()) << id.error_message;
    waitForState(*id.data, JobState::Running);

    auto st = backend().getModelStatus("totalsegmentator");
    ASSERT_TRUE(st.ok());
    EXPECT_EQ(st.data->active_runs, 1u);

    auto rm = backend().removeLocalImage("totalsegmentator");
    ASSERT_FALSE(rm.ok());
    EXPECT_EQ(rm.error, ErrorKind::kImageInUse);
    EXPECT_TRUE(engine_->removed.empty());

    ASSERT_TRUE(backend().cancel(*id.data).ok());
    EXPECT_EQ(waitForTerminal(*id.data).state, JobState::Killed);
    EXPECT_TRUE(backend().removeLocalImage("totalsegmentator").ok());
}

TEST_F(RunnerBackendTest, SubmitModelUsesDefaultRunArgs) {
    engine_->addImage("mhubai/totalsegmentator:latest");
    engine_->container_script.log_lines = {"start", "done"};

    auto id = backend().submitModel("totalsegmentator", dir("in"), dir("out"), {}, {"--debug"});
    ASSERT_TRUE(id.ok()) << id.error_message;
    auto info = waitForTerminal(*id.data);
    EXPECT_EQ(info.state, JobState::Completed);
    EXPECT_EQ(info.request.model_id, "totalsegmentator");

    ASSERT_EQ(engine_->createdCount(), 1u);
    EXPECT_EQ(engine_->created[0].extra_args,
              (std::vector<std::string>{"--workflow", "default", "--print", "--debug"}));

    auto logs = backend().jobLogs(*id.data);
    ASSERT_TRUE(logs.ok());
    EXPECT_EQ(*logs.data, (std::vector<std::string>{"start", "done"}));
}

TEST_F(RunnerBackendTest, SubmitAutoPullsMissingImage) {
    auto id = backend().submitModel("fmcib_radiomics", dir("in"), dir("out"));
    ASSERT_TRUE(id.ok()) << id.error_message;
    auto info = waitForTerminal(*id.data);
    EXPECT_EQ(info.state, JobState::Completed) << info.message;
    EXPECT_EQ(engine_->pulled, (std::vector<std::string>{"mhubai/fmcib_radiomics:latest"}));
}

TEST_F(RunnerBackendTest, SubmitUnknownModel) {
    auto id = backend().submitModel("nope", dir("in"), dir("out"));
    ASSERT_FALSE(id.ok());
    EXPECT_EQ(id.error, ErrorKind::kNotFound);
}

TEST_F(RunnerBackendTest, GpuSelectionIsValidated) {
    engine_->addImage("mhubai/totalsegmentator:latest");
    engine_->gpus = {makeGpu(0), makeGpu(1, false)};

    auto gpus = backend().listGPUs();
    ASSERT_TRUE(gpus.ok());
    EXPECT_EQ(gpus.data->size(), 2u);

    auto busy = backend().submitModel("totalsegmentator", dir("in"), dir("out"), {1});
    ASSERT_FALSE(busy.ok());
    EXPECT_EQ(busy.error, ErrorKind::kInvalidArgument);

    auto unknown = backend().submitModel("totalsegmentator", dir("in"), dir("out"), {7});
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error, ErrorKind::kInvalidArgument);

    auto ok = backend().submitModel("totalsegmentator", dir("in"), dir("out"), {0, 0});
    ASSERT_TRUE(ok.ok()) << ok.error_message;
    waitForTerminal(*ok.data);
    ASSERT_EQ(engine_->createdCount(), 1u);
    EXPECT_EQ(engine_->created[0].gpus, (std::vector<int>{0}));
}

TEST_F(RunnerBackendTest, GpuListIsCachedUntilInvalidated) {
    engine_->gpus = {makeGpu(0)};
    ASSERT_TRUE(backend().listGPUs().ok());
    ASSERT_TRUE(backend().listGPUs().ok());
    EXPECT_EQ(engine_->list_gpus_calls.load(), 1);
    backend().invalidateGPUs();
    ASSERT_TRUE(backend().listGPUs().ok());
    EXPECT_EQ(engine_->list_gpus_calls.load(), 2);
}

TEST_F(RunnerBackendTest, KillAllAndClearJobs) {
    engine_->addImage("mhubai/totalsegmentator:latest");
    engine_->container_script.block_until_killed = true;

    auto a = backend().submitModel("totalsegmentator", dir("a"), dir("out-a"));
    auto b = backend().submitModel("totalsegmentator", dir("b"), dir("out-b"));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    waitForState(*a.data, JobState::Running);
    waitForState(*b.data, JobState::Running);

    EXPECT_EQ(backend().clearJob(*a.data).error, ErrorKind::kInvalidArgument);

    auto report = backend().killAll();
    EXPECT_EQ(report.entries.size(), 2u);
    EXPECT_EQ(waitForTerminal(*a.data).state, JobState::Killed);
    EXPECT_EQ(waitForTerminal(*b.data).state, JobState::Killed);

    ASSERT_TRUE(backend().clearJob(*a.data).ok());
    EXPECT_EQ(backend().getJob(*a.data).error, ErrorKind::kNotFound);
    EXPECT_EQ(backend().clearJobs(), 1u);
    EXPECT_TRUE(backend().listJobs().empty());
}

TEST_F(RunnerBackendTest, SwitchBackendUsesFactory) {
    std::vector<EngineBackend> built;
    factory_ = [&](const EngineConfig& cfg) -> std::unique_ptr<EngineClient> {
        built.push_back(cfg.backend);
        auto next = std::make_unique<FakeEngineClient>();
        next->addImage("mhubai/lungmask:v2", "sha256:pinned");
        return next;
    };
    EXPECT_EQ(backend().backend(), EngineBackend::Docker);
    EXPECT_TRUE(backend().switchBackend(EngineBackend::Docker).ok());
    EXPECT_TRUE(built.empty());

    ASSERT_TRUE(backend().switchBackend(EngineBackend::UDocker).ok());
    engine_ = nullptr;  // replaced and destroyed
    EXPECT_EQ(built, (std::vector<EngineBackend>{EngineBackend::UDocker}));
    EXPECT_EQ(backend().backend(), EngineBackend::UDocker);
    EXPECT_EQ(backend().config().engine.backend, EngineBackend::UDocker);

    auto st = backend().getModelStatus("lungmask");
    ASSERT_TRUE(st.ok());
    EXPECT_EQ(st.data->image.status, ImageStatus::PresentUpToDate);
}

TEST_F(RunnerBackendTest, SwitchBackendFailureKeepsCurrentEngine) {
    factory_ = [](const EngineConfig&) -> std::unique_ptr<EngineClient> { return nullptr; };
    auto res = backend().switchBackend(EngineBackend::UDocker);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error, ErrorKind::kEngineUnavailable);
    EXPECT_EQ(backend().backend(), EngineBackend::Docker);
    EXPECT_EQ(backend().backendInfo().name, "fake");
}

TEST_F(RunnerBackendTest, PeriodicRefresherFetchesCatalog) {
    config_.catalog.refresh_interval = std::chrono::seconds(1);
    backend();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (fetches_.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_GE(fetches_.load(), 2);
    backend_.reset();
    const int after_stop = fetches_.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(fetches_.load(), after_stop);
}
