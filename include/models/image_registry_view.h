#pragma once

#include <string>
#include <vector>

#include "engine/engine_types.h"
#include "models/model_descriptor.h"

namespace mhub {

enum class ImageStatus {
    NotPresent,
    PresentUpToDate,
    PresentStale,
};

const char* to_string(ImageStatus status);

struct ModelImageStatus {
    std::string model_id;
    std::string image_ref;
    ImageStatus status{ImageStatus::NotPresent};
    std::string local_digest;
    std::string local_created_at;
    uint64_t local_size_bytes{0};
};

// Reconcile one descriptor against the engine's image list. No side effects.
ModelImageStatus computeImageStatus(const ModelDescriptor& model,
                                    const std::vector<LocalImage>& local_images);

// Same for every model of a snapshot, in catalog order.
std::vector<ModelImageStatus> computeImageStatuses(const CatalogSnapshot& snapshot,
                                                   const std::vector<LocalImage>& local_images);

}  // namespace mhub
