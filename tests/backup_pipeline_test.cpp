#include "pipeline/backup_pipeline.hpp"
#include "common/errors.hpp"
#include "metadata/metadata_snapshotter.hpp"
#include "pipeline_fixture.hpp"

#include <filesystem>

#include <gtest/gtest.h>

namespace cvault::pipeline {

namespace fs = std::filesystem;
using persistence::data_path_for;

namespace {

// Performs the sync, then reports an I/O error as if the disk failed.
class BrokenSync : public transfer::TreeSync {
public:
    explicit BrokenSync(transfer::TreeSync& inner) : inner_{inner} {}

    std::error_code sync(const fs::path& src, const fs::path& dst,
                         const std::optional<fs::path>& base,
                         transfer::SyncStats& stats) override {
        if (auto ec = inner_.sync(src, dst, base, stats)) {
            return ec;
        }
        return std::make_error_code(std::errc::io_error);
    }

private:
    transfer::TreeSync& inner_;
};

} // anonymous namespace

class BackupPipelineTest : public test::PipelineTest {};

// ── Successful runs ──────────────────────────────────────────────────────────

TEST_F(BackupPipelineTest, FirstBackupCopiesEverything) {
    auto result = backup();

    const auto& gen = result.generation;
    EXPECT_EQ(gen.timestamp, "20240102_030405");
    EXPECT_TRUE(gen.sealed);
    EXPECT_EQ(result.stats.files_copied, 3u);
    EXPECT_EQ(result.stats.files_linked, 0u);

    EXPECT_EQ(test::describe_tree(data_path_for(gen.data_root(), html_)),
              test::describe_tree(html_));
    EXPECT_EQ(test::describe_tree(data_path_for(gen.data_root(), conf_)),
              test::describe_tree(conf_));
    EXPECT_TRUE(fs::is_regular_file(gen.inspect_path()));
    EXPECT_FALSE(fs::exists(gen.staging_root()));
    EXPECT_FALSE(fs::exists(gen.image_path()));

    auto store = open_store();
    ASSERT_TRUE(store->latest().has_value());
    EXPECT_EQ(store->latest()->timestamp, gen.timestamp);
}

TEST_F(BackupPipelineTest, RecordsMetadataCapturedBeforeStop) {
    auto result = backup();

    WorkloadMetadata recorded;
    ASSERT_FALSE(metadata::load_metadata(result.generation.metadata_path(), recorded));
    EXPECT_EQ(recorded.name(), "web1");
    EXPECT_TRUE(recorded.running());
    EXPECT_EQ(recorded.image_ref(), "nginx:1.25");
    EXPECT_EQ(recorded.captured_at(), result.generation.timestamp);
    EXPECT_EQ(recorded.mounts_size(), 2);
    EXPECT_EQ(recorded.ports_size(), 2);
    EXPECT_TRUE(recorded.snapshot_image().empty());
}

TEST_F(BackupPipelineTest, StopsAndRestartsRunningWorkload) {
    (void)backup();
    EXPECT_EQ(runtime_.calls, (std::vector<std::string>{"stop web1", "start web1"}));
    EXPECT_TRUE(runtime_.workloads["web1"].running);
}

TEST_F(BackupPipelineTest, StoppedWorkloadStaysStopped) {
    runtime_.workloads["web1"].running = false;
    (void)backup();
    EXPECT_TRUE(runtime_.calls.empty());
    EXPECT_FALSE(runtime_.workloads["web1"].running);
}

TEST_F(BackupPipelineTest, IncrementalRunsShareUnchangedFiles) {
    auto t1 = backup().generation;

    test::write_file(html_ / "index.html", "v2");
    test::set_mtime(html_ / "index.html", 1700000100);
    auto r2 = backup();
    auto t2 = r2.generation;

    EXPECT_EQ(r2.stats.files_copied, 1u);
    EXPECT_EQ(r2.stats.files_linked, 2u);
    EXPECT_EQ(test::read_file(data_path_for(t1.data_root(), html_) / "index.html"), "v1");
    EXPECT_EQ(test::read_file(data_path_for(t2.data_root(), html_) / "index.html"), "v2");
    EXPECT_TRUE(test::same_inode(data_path_for(t1.data_root(), conf_) / "nginx.conf",
                                 data_path_for(t2.data_root(), conf_) / "nginx.conf"));
    EXPECT_TRUE(test::same_inode(data_path_for(t1.data_root(), html_) / "img" / "logo.png",
                                 data_path_for(t2.data_root(), html_) / "img" / "logo.png"));

    // Nothing changed since T2: every file of T3 is T2's inode.
    auto r3 = backup();
    auto t3 = r3.generation;
    EXPECT_EQ(r3.stats.files_copied, 0u);
    EXPECT_EQ(r3.stats.files_linked, 3u);
    EXPECT_TRUE(test::same_inode(data_path_for(t2.data_root(), html_) / "index.html",
                                 data_path_for(t3.data_root(), html_) / "index.html"));

    auto store = open_store();
    EXPECT_EQ(store->latest()->timestamp, t3.timestamp);
    EXPECT_EQ(store->list().size(), 3u);
}

TEST_F(BackupPipelineTest, DeletedSourceFileIsAbsentFromNextGeneration) {
    (void)backup();
    fs::remove(html_ / "img" / "logo.png");
    auto t2 = backup().generation;
    EXPECT_FALSE(fs::exists(data_path_for(t2.data_root(), html_) / "img" / "logo.png"));
    EXPECT_TRUE(fs::is_directory(data_path_for(t2.data_root(), html_) / "img"));
}

TEST_F(BackupPipelineTest, SnapshotImageIsCommittedAndSaved) {
    options_.snapshot_image = true;
    auto result = backup();

    ASSERT_GE(runtime_.calls.size(), 4u);
    EXPECT_EQ(runtime_.calls[0], "commit web1");
    EXPECT_EQ(runtime_.calls[1], "stop web1");
    EXPECT_EQ(runtime_.calls[2], "start web1");
    EXPECT_EQ(runtime_.calls[3], "save web1_backup_20240102_030405");
    EXPECT_TRUE(fs::is_regular_file(result.generation.image_path()));

    WorkloadMetadata recorded;
    ASSERT_FALSE(metadata::load_metadata(result.generation.metadata_path(), recorded));
    EXPECT_EQ(recorded.snapshot_image(), "web1_backup_20240102_030405");
}

TEST_F(BackupPipelineTest, SnapshotImageNameIsLowercase) {
    EXPECT_EQ(snapshot_image_name("Web1", "20240102_030405"), "web1_backup_20240102_030405");
}

TEST_F(BackupPipelineTest, PackagesSealedGeneration) {
    test::FakeCodec codec{dir_.path() / "stash"};
    auto result = backup(&codec);

    ASSERT_TRUE(result.archive.has_value());
    EXPECT_EQ(result.archive->filename(), "web1_20240102_030405.tar.fake");
    EXPECT_TRUE(fs::is_regular_file(*result.archive));
    EXPECT_EQ(codec.packs, 1);
}

TEST_F(BackupPipelineTest, PruneRunsAfterAdvance) {
    options_.retention = std::chrono::hours{3};
    auto t1 = backup().generation;
    (void)backup();
    (void)backup();
    clock_.advance(std::chrono::hours{1});
    auto r4 = backup();

    // T1 is now 4h old and past the horizon; T2 is 3h old and kept.
    ASSERT_EQ(r4.prune.removed.size(), 1u);
    EXPECT_EQ(r4.prune.removed[0], t1.timestamp);
    EXPECT_FALSE(fs::exists(t1.path));
    EXPECT_EQ(open_store()->list().size(), 3u);
}

// ── Failures ─────────────────────────────────────────────────────────────────

TEST_F(BackupPipelineTest, UnknownWorkloadIsNotFound) {
    try {
        (void)backup(nullptr, "ghost");
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::not_found);
        EXPECT_EQ(exit_code_for(e.code()), kExitNotFound);
    }
    EXPECT_TRUE(open_store("ghost")->list().empty());
}

TEST_F(BackupPipelineTest, NoMountsFailsBeforeStopping) {
    runtime_.workloads["web1"].binds = {{(host_ / "missing").string(), "/data"}};
    try {
        (void)backup();
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::no_mounts_found);
    }
    EXPECT_TRUE(runtime_.calls.empty());
    EXPECT_TRUE(open_store()->list().empty());
}

TEST_F(BackupPipelineTest, TransferFailureDiscardsGenerationAndRestarts) {
    auto t1 = backup().generation;
    clear_calls();

    BrokenSync broken{sync_};
    auto store = open_store();
    BackupPipeline pipeline(runtime_, broken, nullptr, clock_, cancel_, options_);
    try {
        (void)pipeline.run(*store);
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::transfer_failed);
        EXPECT_EQ(exit_code_for(e.code()), kExitFailure);
    }

    EXPECT_TRUE(runtime_.called("start web1"));
    EXPECT_TRUE(runtime_.workloads["web1"].running);
    ASSERT_TRUE(store->latest().has_value());
    EXPECT_EQ(store->latest()->timestamp, t1.timestamp);
    auto list = store->list();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].timestamp, t1.timestamp);
}

TEST_F(BackupPipelineTest, QuiesceTimeoutDiscardsGeneration) {
    runtime_.ignore_stop = true;
    runtime_.ignore_kill = true;
    try {
        (void)backup();
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::quiesce_timeout);
    }
    EXPECT_TRUE(runtime_.called("kill web1"));
    auto store = open_store();
    EXPECT_FALSE(store->latest().has_value());
    EXPECT_TRUE(store->list().empty());
}

TEST_F(BackupPipelineTest, RestartFailureFailsRun) {
    runtime_.fail_start = true;
    try {
        (void)backup();
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::quiesce_timeout);
    }
    EXPECT_FALSE(open_store()->latest().has_value());
}

TEST_F(BackupPipelineTest, PackagingFailureLeavesSealedButNotLatest) {
    auto t1 = backup().generation;
    test::FakeCodec codec{dir_.path() / "stash"};
    codec.fail_pack = true;

    try {
        (void)backup(&codec);
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::packaging_failed);
    }

    auto store = open_store();
    EXPECT_EQ(store->latest()->timestamp, t1.timestamp);
    auto list = store->list();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_TRUE(list[0].sealed);
    EXPECT_NE(list[0].timestamp, t1.timestamp);
    EXPECT_TRUE(store->archives_for(list[0].timestamp).empty());
}

TEST_F(BackupPipelineTest, CancelledRunLeavesStoreUntouched) {
    cancel_.cancel();
    try {
        (void)backup();
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::cancelled);
    }
    EXPECT_TRUE(runtime_.calls.empty());
    EXPECT_TRUE(open_store()->list().empty());
}

TEST_F(BackupPipelineTest, ConcurrentRunForSameWorkloadIsBusy) {
    auto held = open_store();
    persistence::GenerationStore second(backup_root_, "web1", make_component_logger("store"));
    EXPECT_EQ(second.open(), Errc::busy);
}

} // namespace cvault::pipeline
