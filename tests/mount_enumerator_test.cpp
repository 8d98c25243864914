#include "metadata/mount_enumerator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "tree_helpers.hpp"

#include <filesystem>

#include <gtest/gtest.h>

namespace cvault::metadata {

namespace fs = std::filesystem;

class MountEnumeratorTest : public ::testing::Test {
protected:
    // Add a mount; `host` is relative to the temp dir unless it is empty or
    // already absolute.
    MountPoint& add(const std::string& host, const std::string& container,
                    MountPoint::Kind kind = MountPoint::BIND) {
        auto* m = meta_.add_mounts();
        m->set_host_path(host.empty() || host.front() == '/' ? host
                                                             : (dir_.path() / host).string());
        m->set_container_path(container);
        m->set_kind(kind);
        return *m;
    }

    std::string host(const std::string& rel) const { return (dir_.path() / rel).string(); }

    std::vector<MountPoint> enumerate() const {
        return MountEnumerator{make_component_logger("mounts")}.enumerate(meta_);
    }

    void SetUp() override {
        meta_.set_name("web1");
        for (const char* d : {"html", "conf", "conf/sites", "cache", "logs"}) {
            fs::create_directories(dir_.path() / d);
        }
        test::write_file(dir_.path() / "app.sock", "");
    }

    test::TempDir dir_{"mounts"};
    WorkloadMetadata meta_;
};

TEST_F(MountEnumeratorTest, KeepsBindsAndVolumesSortedByHostPath) {
    add("html", "/usr/share/nginx/html");
    add("cache", "/var/cache/nginx", MountPoint::VOLUME);
    add("conf", "/etc/nginx").set_read_only(true);

    auto mounts = enumerate();
    ASSERT_EQ(mounts.size(), 3u);
    EXPECT_EQ(mounts[0].host_path(), host("cache"));
    EXPECT_EQ(mounts[0].kind(), MountPoint::VOLUME);
    EXPECT_EQ(mounts[1].host_path(), host("conf"));
    EXPECT_TRUE(mounts[1].read_only());
    EXPECT_EQ(mounts[2].host_path(), host("html"));
}

TEST_F(MountEnumeratorTest, SkipsNonPersistentAndUnusableMounts) {
    add("html", "/html");
    add("", "/run", MountPoint::KIND_UNSPECIFIED);
    add("", "/empty");
    add("missing", "/missing");
    add("app.sock", "/var/run/app.sock");
    auto& relative = *meta_.add_mounts();
    relative.set_host_path("relative/dir");
    relative.set_container_path("/rel");
    relative.set_kind(MountPoint::BIND);

    auto mounts = enumerate();
    ASSERT_EQ(mounts.size(), 1u);
    EXPECT_EQ(mounts[0].container_path(), "/html");
}

TEST_F(MountEnumeratorTest, DropsDuplicateAndNestedHostPaths) {
    add("conf/sites", "/etc/nginx/sites-enabled");
    add("conf", "/etc/nginx");
    add("conf/", "/etc/nginx-copy");
    add("logs", "/var/log/nginx");

    auto mounts = enumerate();
    ASSERT_EQ(mounts.size(), 2u);
    EXPECT_EQ(mounts[0].host_path(), host("conf"));
    EXPECT_EQ(mounts[0].container_path(), "/etc/nginx");
    EXPECT_EQ(mounts[1].host_path(), host("logs"));
}

TEST_F(MountEnumeratorTest, SiblingWithSharedPrefixIsNotNested) {
    fs::create_directories(dir_.path() / "conf-extra");
    add("conf", "/a");
    add("conf-extra", "/b");

    auto mounts = enumerate();
    EXPECT_EQ(mounts.size(), 2u);
}

TEST_F(MountEnumeratorTest, NoUsableMountsThrows) {
    add("", "/run", MountPoint::KIND_UNSPECIFIED);
    add("missing", "/data");
    try {
        (void)enumerate();
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::no_mounts_found);
        EXPECT_EQ(exit_code_for(e.code()), kExitFailure);
    }
}

TEST_F(MountEnumeratorTest, NoMountsAtAllThrows) {
    EXPECT_THROW((void)enumerate(), VaultError);
}

} // namespace cvault::metadata
