#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/cancel_token.h"
#include "core/error.h"
#include "engine/engine_client.h"
#include "models/image_registry_view.h"
#include "models/model_catalog.h"
#include "orchestrator/job_registry.h"
#include "orchestrator/resource_locks.h"
#include "orchestrator/run_orchestrator.h"
#include "system/gpu_inventory.h"
#include "utils/config.h"

namespace mhub {

struct ModelStatus {
    ModelDescriptor model;
    ModelImageStatus image;
    bool pulling{false};
    size_t active_runs{0};
};

using EngineFactory = std::function<std::unique_ptr<EngineClient>(const EngineConfig&)>;

/// Public entry point: owns the engine client, catalog, GPU inventory,
/// job registry and run orchestrator, and wires them together.
class RunnerBackend {
public:
    explicit RunnerBackend(BackendConfig config);

    // Injected engine and catalog source. `factory` builds engines on
    // switchBackend (createEngineClient when empty).
    RunnerBackend(BackendConfig config,
                  std::unique_ptr<EngineClient> engine,
                  CatalogFetcher fetcher,
                  EngineFactory factory = {});

    ~RunnerBackend();

    RunnerBackend(const RunnerBackend&) = delete;
    RunnerBackend& operator=(const RunnerBackend&) = delete;

    // Catalog
    Result<std::vector<ModelDescriptor>> listModels(const std::string& query = "");
    Result<std::shared_ptr<const CatalogSnapshot>> refreshCatalog();
    Result<ModelDescriptor> getModel(const std::string& id);

    // Local images
    Result<ModelStatus> getModelStatus(const std::string& id);
    Result<std::vector<ModelStatus>> listModelStatuses();
    Result<void> pullOrUpdate(const std::string& id,
                              const LineCallback& on_progress,
                              const CancelToken& cancel);
    Result<void> removeLocalImage(const std::string& id);

    // GPUs
    Result<std::vector<GpuDevice>> listGPUs();
    void invalidateGPUs();

    // Runs
    Result<std::string> submit(RunRequest request);

    // Request for a catalog model: its image, default_run_args then extra_args.
    Result<RunRequest> buildModelRequest(const std::string& model_id,
                                         const std::string& input_path,
                                         const std::string& output_path,
                                         const std::vector<int>& gpus = {},
                                         const std::vector<std::string>& extra_args = {});
    Result<std::string> submitModel(const std::string& model_id,
                                    const std::string& input_path,
                                    const std::string& output_path,
                                    const std::vector<int>& gpus = {},
                                    const std::vector<std::string>& extra_args = {});
    Result<LogSubscription> subscribeLogs(const std::string& job_id, bool from_start = false);
    Result<std::vector<std::string>> jobLogs(const std::string& job_id);
    Result<void> cancel(const std::string& job_id);
    KillAllReport killAll();
    std::vector<JobInfo> listJobs() const;
    Result<JobInfo> getJob(const std::string& job_id) const;
    Result<void> clearJob(const std::string& job_id);
    size_t clearJobs();

    // Engine selection
    BackendInfo backendInfo();
    EngineBackend backend() const;
    Result<void> switchBackend(EngineBackend backend);

    const BackendConfig& config() const { return config_; }

private:
    void startRefresher();
    void stopRefresher();
    void refresherLoop();

    size_t activeRunsFor(const std::string& image_ref) const;

    BackendConfig config_;
    EngineFactory factory_;

    ModelCatalog catalog_;
    JobRegistry registry_;
    ImageLockTable image_locks_;

    // Guards engine_, orchestrator_ and gpus_ against switchBackend.
    mutable std::shared_mutex engine_mutex_;
    std::unique_ptr<EngineClient> engine_;
    std::unique_ptr<GpuInventory> gpus_;
    std::unique_ptr<RunOrchestrator> orchestrator_;

    std::thread refresher_;
    std::mutex refresher_mutex_;
    std::condition_variable refresher_cv_;
    bool refresher_stop_{false};
};

}  // namespace mhub
