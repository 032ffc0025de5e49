#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace mhub {

struct ModelInput {
    std::string format;       // e.g. "DICOM"
    std::string description;
};

/// Immutable catalog entry. Replaced wholesale on every catalog refresh.
struct ModelDescriptor {
    std::string id;
    std::string name;
    std::string label;        // display name; falls back to name
    std::string description;
    std::vector<std::string> modalities;
    std::vector<ModelInput> inputs;
    std::vector<std::string> categories;
    std::vector<std::string> regions;  // segmented regions of interest
    std::string cite;
    bool inputs_compatible{false};
    std::string image_ref;
    std::string image_digest;          // empty when the catalog pins none
    std::string documentation_url;
};

struct CatalogSnapshot {
    std::vector<ModelDescriptor> models;
    std::vector<std::string> warnings;  // one per dropped entry
    std::chrono::system_clock::time_point fetched_at;
};

}  // namespace mhub
