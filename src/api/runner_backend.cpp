#include "api/runner_backend.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "engine/image_ref.h"

namespace mhub {

RunnerBackend::RunnerBackend(BackendConfig config)
    : RunnerBackend(config, createEngineClient(config.engine), CatalogFetcher{}, EngineFactory{}) {}

RunnerBackend::RunnerBackend(BackendConfig config,
                             std::unique_ptr<EngineClient> engine,
                             CatalogFetcher fetcher,
                             EngineFactory factory)
    : config_(std::move(config))
    , factory_(factory ? std::move(factory) : EngineFactory(createEngineClient))
    , catalog_(config_.catalog, std::move(fetcher))
    , engine_(engine ? std::move(engine) : createEngineClient(config_.engine)) {
    gpus_ = std::make_unique<GpuInventory>(engine_.get());
    orchestrator_ = std::make_unique<RunOrchestrator>(*engine_, registry_, image_locks_, config_.orchestrator);
    spdlog::info("Runner backend ready (engine={})", to_string(config_.engine.backend));
    startRefresher();
}

RunnerBackend::~RunnerBackend() {
    stopRefresher();
    std::unique_lock<std::shared_mutex> lock(engine_mutex_);
    if (orchestrator_) {
        orchestrator_->shutdown();
        orchestrator_.reset();
    }
}

void RunnerBackend::startRefresher() {
    if (config_.catalog.refresh_interval.count() <= 0) {
        return;
    }
    refresher_ = std::thread(&RunnerBackend::refresherLoop, this);
}

void RunnerBackend::stopRefresher() {
    {
        std::lock_guard<std::mutex> lock(refresher_mutex_);
        refresher_stop_ = true;
    }
    refresher_cv_.notify_all();
    if (refresher_.joinable()) {
        refresher_.join();
    }
}

void RunnerBackend::refresherLoop() {
    spdlog::info("Catalog refresher started (every {}s)", config_.catalog.refresh_interval.count());
    std::unique_lock<std::mutex> lock(refresher_mutex_);
    while (!refresher_stop_) {
        lock.unlock();
        auto res = catalog_.refresh();
        if (!res.ok()) {
            spdlog::warn("Periodic catalog refresh failed: {}", res.error_message);
        }
        lock.lock();
        refresher_cv_.wait_for(lock, config_.catalog.refresh_interval, [this]() { return refresher_stop_; });
    }
}

Result<std::vector<ModelDescriptor>> RunnerBackend::listModels(const std::string& query) {
    return catalog_.search(query);
}

Result<std::shared_ptr<const CatalogSnapshot>> RunnerBackend::refreshCatalog() {
    return catalog_.refresh();
}

Result<ModelDescriptor> RunnerBackend::getModel(const std::string& id) {
    return catalog_.get(id);
}

size_t RunnerBackend::activeRunsFor(const std::string& image_ref) const {
    size_t n = 0;
    for (const auto& job : registry_.list()) {
        if (!is_terminal(job.state) && sameImage(job.request.image, image_ref)) ++n;
    }
    return n;
}

Result<ModelStatus> RunnerBackend::getModelStatus(const std::string& id) {
    auto model = catalog_.get(id);
    if (!model.ok()) return Result<ModelStatus>::from(model);

    Result<std::vector<LocalImage>> images;
    {
        std::shared_lock<std::shared_mutex> lock(engine_mutex_);
        images = engine_->listImages();
    }
    if (!images.ok()) return Result<ModelStatus>::from(images);

    ModelStatus st;
    st.image = computeImageStatus(*model.data, *images.data);
    st.pulling = image_locks_.isPulling(model.data->image_ref);
    st.active_runs = activeRunsFor(model.data->image_ref);
    st.model = std::move(*model.data);
    return Result<ModelStatus>::success(std::move(st));
}

Result<std::vector<ModelStatus>> RunnerBackend::listModelStatuses() {
    using R = Result<std::vector<ModelStatus>>;
    auto snap = catalog_.ensureLoaded();
    if (!snap.ok()) return R::from(snap);

    Result<std::vector<LocalImage>> images;
    {
        std::shared_lock<std::shared_mutex> lock(engine_mutex_);
        images = engine_->listImages();
    }
    if (!images.ok()) return R::from(images);

    const auto& snapshot = **snap.data;
    auto statuses = computeImageStatuses(snapshot, *images.data);
    std::vector<ModelStatus> out;
    out.reserve(statuses.size());
    for (size_t i = 0; i < statuses.size(); ++i) {
        ModelStatus st;
        st.model = snapshot.models[i];
        st.image = std::move(statuses[i]);
        st.pulling = image_locks_.isPulling(st.model.image_ref);
        st.active_runs = activeRunsFor(st.model.image_ref);
        out.push_back(std::move(st));
    }
    return R::success(std::move(out));
}

Result<void> RunnerBackend::pullOrUpdate(const std::string& id,
                                         const LineCallback& on_progress,
                                         const CancelToken& cancel) {
    auto model = catalog_.get(id);
    if (!model.ok()) return Result<void>::from(model);
    const auto& ref = model.data->image_ref;

    auto pulling = image_locks_.markPulling(ref);
    auto lock = image_locks_.acquire(ref, &cancel);
    if (!lock) {
        return Result<void>::failure(ErrorKind::kCancelled, "pull cancelled");
    }
    std::shared_lock<std::shared_mutex> engine_lock(engine_mutex_);
    return engine_->pullImage(ref, on_progress, cancel);
}

Result<void> RunnerBackend::removeLocalImage(const std::string& id) {
    auto model = catalog_.get(id);
    if (!model.ok()) return Result<void>::from(model);
    const auto& ref = model.data->image_ref;

    auto lock = image_locks_.acquire(ref);
    if (activeRunsFor(ref) > 0) {
        return Result<void>::failure(ErrorKind::kImageInUse, ref + " is used by an active run");
    }
    std::shared_lock<std::shared_mutex> engine_lock(engine_mutex_);
    return engine_->removeImage(ref);
}

Result<std::vector<GpuDevice>> RunnerBackend::listGPUs() {
    std::shared_lock<std::shared_mutex> lock(engine_mutex_);
    return gpus_->list();
}

void RunnerBackend::invalidateGPUs() {
    std::shared_lock<std::shared_mutex> lock(engine_mutex_);
    gpus_->invalidate();
}

Result<std::string> RunnerBackend::submit(RunRequest request) {
    std::shared_lock<std::shared_mutex> lock(engine_mutex_);
    if (!request.gpus.empty()) {
        auto selection = gpus_->resolveSelection(request.gpus);
        if (!selection.ok()) return Result<std::string>::from(selection);
        request.gpus = std::move(*selection.data);
    }
    return orchestrator_->submit(std::move(request));
}

Result<RunRequest> RunnerBackend::buildModelRequest(const std::string& model_id,
                                                    const std::string& input_path,
                                                    const std::string& output_path,
                                                    const std::vector<int>& gpus,
                                                    const std::vector<std::string>& extra_args) {
    auto model = catalog_.get(model_id);
    if (!model.ok()) return Result<RunRequest>::from(model);

    RunRequest request;
    request.image = model.data->image_ref;
    request.model_id = model.data->name;
    request.input_path = input_path;
    request.output_path = output_path;
    request.gpus = gpus;
    request.extra_args = config_.default_run_args;
    request.extra_args.insert(request.extra_args.end(), extra_args.begin(), extra_args.end());
    return Result<RunRequest>::success(std::move(request));
}

Result<std::string> RunnerBackend::submitModel(const std::string& model_id,
                                               const std::string& input_path,
                                               const std::string& output_path,
                                               const std::vector<int>& gpus,
                                               const std::vector<std::string>& extra_args) {
    auto request = buildModelRequest(model_id, input_path, output_path, gpus, extra_args);
    if (!request.ok()) return Result<std::string>::from(request);
    return submit(std::move(*request.data));
}

Result<LogSubscription> RunnerBackend::subscribeLogs(const std::string& job_id, bool from_start) {
    std::shared_lock<std::shared_mutex> lock(engine_mutex_);
    return orchestrator_->subscribeLogs(job_id, from_start);
}

Result<std::vector<std::string>> RunnerBackend::jobLogs(const std::string& job_id) {
    auto logs = registry_.logs(job_id);
    if (!logs.ok()) return Result<std::vector<std::string>>::from(logs);
    return Result<std::vector<std::string>>::success((*logs.data)->snapshot());
}

Result<void> RunnerBackend::cancel(const std::string& job_id) {
    std::shared_lock<std::shared_mutex> lock(engine_mutex_);
    return orchestrator_->cancel(job_id);
}

KillAllReport RunnerBackend::killAll() {
    std::shared_lock<std::shared_mutex> lock(engine_mutex_);
    return orchestrator_->killAll();
}

std::vector<JobInfo> RunnerBackend::listJobs() const {
    return registry_.list();
}

Result<JobInfo> RunnerBackend::getJob(const std::string& job_id) const {
    return registry_.get(job_id);
}

Result<void> RunnerBackend::clearJob(const std::string& job_id) {
    return registry_.clear(job_id);
}

size_t RunnerBackend::clearJobs() {
    return registry_.clearAll();
}

BackendInfo RunnerBackend::backendInfo() {
    std::shared_lock<std::shared_mutex> lock(engine_mutex_);
    return engine_->info();
}

EngineBackend RunnerBackend::backend() const {
    std::shared_lock<std::shared_mutex> lock(engine_mutex_);
    return config_.engine.backend;
}

Result<void> RunnerBackend::switchBackend(EngineBackend backend) {
    std::unique_lock<std::shared_mutex> lock(engine_mutex_);
    if (backend == config_.engine.backend) {
        return Result<void>::success();
    }
    spdlog::info("Switching engine backend {} -> {}", to_string(config_.engine.backend), to_string(backend));

    EngineConfig next = config_.engine;
    next.backend = backend;
    auto engine = factory_(next);
    if (!engine) {
        return Result<void>::failure(ErrorKind::kEngineUnavailable,
                                     std::string("cannot create ") + to_string(backend) + " client");
    }

    orchestrator_->shutdown();
    orchestrator_.reset();
    engine_ = std::move(engine);
    config_.engine = next;
    gpus_->rebind(engine_.get());
    orchestrator_ = std::make_unique<RunOrchestrator>(*engine_, registry_, image_locks_, config_.orchestrator);
    return Result<void>::success();
}

}  // namespace mhub
