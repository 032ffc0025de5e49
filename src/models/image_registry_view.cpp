#include "models/image_registry_view.h"

#include "engine/image_ref.h"

namespace mhub {

const char* to_string(ImageStatus status) {
    switch (status) {
        case ImageStatus::NotPresent:
            return "not-present";
        case ImageStatus::PresentUpToDate:
            return "up-to-date";
        case ImageStatus::PresentStale:
            return "stale";
    }
    return "unknown";
}

namespace {

// A "repo@sha256:..." digest as reported by docker images may carry the repo prefix.
std::string bareDigest(const std::string& digest) {
    auto at = digest.find('@');
    return at == std::string::npos ? digest : digest.substr(at + 1);
}

}  // namespace

ModelImageStatus computeImageStatus(const ModelDescriptor& model,
                                    const std::vector<LocalImage>& local_images) {
    ModelImageStatus st;
    st.model_id = model.id;
    st.image_ref = model.image_ref;

    const auto wanted = normalizeImageRef(model.image_ref);
    for (const auto& img : local_images) {
        if (normalizeImageRef(img.reference) != wanted) continue;
        st.local_digest = img.digest;
        st.local_created_at = img.created_at;
        st.local_size_bytes = img.size_bytes;
        const auto declared = bareDigest(model.image_digest);
        const auto local = bareDigest(img.digest);
        if (!declared.empty() && !local.empty() && declared != local) {
            st.status = ImageStatus::PresentStale;
        } else {
            st.status = ImageStatus::PresentUpToDate;
        }
        return st;
    }
    st.status = ImageStatus::NotPresent;
    return st;
}

std::vector<ModelImageStatus> computeImageStatuses(const CatalogSnapshot& snapshot,
                                                   const std::vector<LocalImage>& local_images) {
    std::vector<ModelImageStatus> out;
    out.reserve(snapshot.models.size());
    for (const auto& m : snapshot.models) {
        out.push_back(computeImageStatus(m, local_images));
    }
    return out;
}

}  // namespace mhub
