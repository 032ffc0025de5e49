#include <gtest/gtest.h>

#include "models/image_registry_view.h"

using namespace mhub;

namespace {

ModelDescriptor model(const std::string& image, const std::string& digest = "") {
    ModelDescriptor m;
    m.id = "1";
    m.name = "totalsegmentator";
    m.image_ref = image;
    m.image_digest = digest;
    return m;
}

LocalImage local(const std::string& ref, const std::string& digest) {
    LocalImage img;
    img.reference = ref;
    img.digest = digest;
    img.size_bytes = 42;
    img.created_at = "2024-05-01 12:00:00 +0000 UTC";
    return img;
}

}  // namespace

TEST(ImageRegistryViewTest, MissingImageIsNotPresent) {
    auto st = computeImageStatus(model("mhubai/totalsegmentator:latest"),
                                 {local("mhubai/lungmask:latest", "sha256:a")});
    EXPECT_EQ(st.status, ImageStatus::NotPresent);
    EXPECT_STREQ(to_string(st.status), "not-present");
    EXPECT_TRUE(st.local_digest.empty());
}

TEST(ImageRegistryViewTest, PresentWithoutDeclaredDigestIsUpToDate) {
    auto st = computeImageStatus(model("mhubai/totalsegmentator"),
                                 {local("docker.io/mhubai/totalsegmentator:latest", "sha256:a")});
    EXPECT_EQ(st.status, ImageStatus::PresentUpToDate);
    EXPECT_EQ(st.local_digest, "sha256:a");
    EXPECT_EQ(st.local_size_bytes, 42u);
    EXPECT_EQ(st.local_created_at, "2024-05-01 12:00:00 +0000 UTC");
}

TEST(ImageRegistryViewTest, DigestMismatchIsStale) {
    auto st = computeImageStatus(model("mhubai/totalsegmentator:latest", "sha256:new"),
                                 {local("mhubai/totalsegmentator:latest", "sha256:old")});
    EXPECT_EQ(st.status, ImageStatus::PresentStale);
    EXPECT_STREQ(to_string(st.status), "stale");
}

TEST(ImageRegistryViewTest, RepoQualifiedDigestsCompareBare) {
    auto st = computeImageStatus(model("mhubai/totalsegmentator:latest", "sha256:same"),
                                 {local("mhubai/totalsegmentator:latest", "mhubai/totalsegmentator@sha256:same")});
    EXPECT_EQ(st.status, ImageStatus::PresentUpToDate);
}

TEST(ImageRegistryViewTest, StatusesFollowCatalogOrder) {
    CatalogSnapshot snap;
    snap.models.push_back(model("mhubai/a:latest"));
    snap.models.push_back(model("mhubai/b:latest"));
    auto statuses = computeImageStatuses(snap, {local("mhubai/b:latest", "")});
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0].status, ImageStatus::NotPresent);
    EXPECT_EQ(statuses[1].status, ImageStatus::PresentUpToDate);
    EXPECT_EQ(statuses[1].image_ref, "mhubai/b:latest");
}
