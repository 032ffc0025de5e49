#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/error.h"
#include "models/model_descriptor.h"
#include "utils/config.h"

namespace mhub {

// Returns the raw catalog response body.
using CatalogFetcher = std::function<Result<std::string>()>;

// HTTP(S) GET of `url` with cpp-httplib. Non-2xx or transport failure is kCatalogUnreachable.
CatalogFetcher makeHttpCatalogFetcher(const std::string& url, std::chrono::milliseconds timeout);

// Parse a catalog payload ({"data": [...]} or a bare array) into a snapshot.
// Malformed entries are dropped and recorded in snapshot.warnings.
Result<CatalogSnapshot> parseCatalog(const std::string& body, const CatalogConfig& config);

class ModelCatalog {
public:
    ModelCatalog(CatalogConfig config, CatalogFetcher fetcher);

    // Fetch and parse; on failure the previous snapshot stays current.
    Result<std::shared_ptr<const CatalogSnapshot>> refresh();

    // Cached snapshot, or nullptr before the first successful refresh.
    std::shared_ptr<const CatalogSnapshot> snapshot() const;

    // Cached snapshot, refreshing first when none has been loaded.
    Result<std::shared_ptr<const CatalogSnapshot>> ensureLoaded();

    // Lookup by id, then by name. kNotFound when neither matches.
    Result<ModelDescriptor> get(const std::string& id);

    // Case-insensitive substring match over name, label, description,
    // modalities, categories and regions. Empty query returns everything.
    Result<std::vector<ModelDescriptor>> search(const std::string& query);

    const CatalogConfig& config() const { return config_; }

private:
    CatalogConfig config_;
    CatalogFetcher fetcher_;

    std::mutex refresh_mutex_;
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const CatalogSnapshot> snapshot_;
};

// True when any searchable field of `model` contains `query` (case-insensitive).
bool matchesQuery(const ModelDescriptor& model, const std::string& query);

}  // namespace mhub
