#pragma once

#include "persistence/generation_journal.hpp"
#include "persistence/workload_lock.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace cvault::persistence {

// ── Generation ───────────────────────────────────────────────────────────────
//
// One timestamped backup of a workload.  Layout of `path`:
//
//   metadata.json   normalized WorkloadMetadata
//   inspect.json    raw runtime inspect output, verbatim
//   image.tar       saved workload image (optional)
//   data/<hostPath without leading '/'>/...
//   staging/        in-flight mount transfers (never present once sealed)

struct Generation {
    static constexpr const char* kMetadataFile = "metadata.json";
    static constexpr const char* kInspectFile  = "inspect.json";
    static constexpr const char* kImageFile    = "image.tar";
    static constexpr const char* kDataDir      = "data";
    static constexpr const char* kStagingDir   = "staging";

    std::string workload;
    std::string timestamp;            // YYYYMMDD_HHMMSS
    std::filesystem::path path;
    bool sealed = false;
    bool orphan = false;              // directory on disk with no journal entry

    // Set by the pipeline as the two sealing preconditions complete.
    bool metadata_recorded = false;
    bool transfer_recorded = false;

    [[nodiscard]] std::filesystem::path metadata_path() const { return path / kMetadataFile; }
    [[nodiscard]] std::filesystem::path inspect_path() const { return path / kInspectFile; }
    [[nodiscard]] std::filesystem::path image_path() const { return path / kImageFile; }
    [[nodiscard]] std::filesystem::path data_root() const { return path / kDataDir; }
    [[nodiscard]] std::filesystem::path staging_root() const { return path / kStagingDir; }
};

// Location of a host path's copy inside a generation's data tree:
// data_root / host_path without its leading '/'.
[[nodiscard]] std::filesystem::path data_path_for(const std::filesystem::path& data_root,
                                                  const std::filesystem::path& host_path);

// ── GenerationStore ──────────────────────────────────────────────────────────
//
// Owns <backup_root>/<workload>/: the generation directories, the journal that
// orders them, the LATEST pointer and the packaged archives.
//
//   <backup_root>/<workload>/
//     .lock  generations.journal  LATEST
//     <timestamp>/...
//     archives/<workload>_<timestamp>.tar.{gz,zst}
//
// open() takes the per-workload lock; every mutation happens while it is
// held.  advance_latest() is the only operation that moves LATEST and is the
// commit point of a backup.
//
// Thread-safety: NOT thread-safe.  One store instance per pipeline run, used
// from the run's control thread.

class GenerationStore {
public:
    static constexpr const char* kArchiveDir = "archives";

    GenerationStore(std::filesystem::path backup_root,
                    std::string workload,
                    std::shared_ptr<spdlog::logger> logger);

    GenerationStore(const GenerationStore&) = delete;
    GenerationStore& operator=(const GenerationStore&) = delete;

    // Create the workload directory if needed, take the workload lock
    // (Errc::busy if another run holds it), open and replay the journal and
    // load the LATEST pointer.
    [[nodiscard]] std::error_code open();

    // Allocate a new, unsealed generation.  Fails with Errc::busy if the
    // timestamp already exists or is not newer than every known generation.
    [[nodiscard]] std::error_code create(const std::string& timestamp, Generation& out);

    // Mark a generation sealed.  Idempotent.  Requires metadata_recorded
    // (Errc::incomplete_metadata otherwise) and transfer_recorded
    // (Errc::transfer_failed otherwise).
    [[nodiscard]] std::error_code seal(Generation& generation);

    // Most recently advanced sealed generation, if any.
    [[nodiscard]] std::optional<Generation> latest() const;

    // Point LATEST at `generation`.  Only sealed generations are accepted
    // (errc::operation_not_permitted otherwise).
    [[nodiscard]] std::error_code advance_latest(const Generation& generation);

    // Live generations sorted by timestamp, newest first.  Includes unsealed
    // and orphaned directories, flagged as such.
    [[nodiscard]] std::vector<Generation> list() const;

    [[nodiscard]] std::optional<Generation> find(const std::string& timestamp) const;

    // Delete a generation's directory and archives and journal it as pruned.
    // The generation behind LATEST is refused (errc::operation_not_permitted).
    [[nodiscard]] std::error_code remove(const Generation& generation);

    // Archive path for a generation with the given extension (".tar.gz").
    [[nodiscard]] std::filesystem::path archive_path(const std::string& timestamp,
                                                     const std::string& extension) const;

    // Existing archives belonging to `timestamp`.
    [[nodiscard]] std::vector<std::filesystem::path> archives_for(const std::string& timestamp) const;

    [[nodiscard]] const std::string& workload() const noexcept { return workload_; }
    [[nodiscard]] const std::filesystem::path& workload_dir() const noexcept { return workload_dir_; }
    [[nodiscard]] std::filesystem::path archive_dir() const { return workload_dir_ / kArchiveDir; }

private:
    struct Entry {
        bool sealed = false;
        bool pruned = false;
    };

    [[nodiscard]] Generation make_generation(const std::string& timestamp, const Entry& entry) const;
    [[nodiscard]] GenerationEvent make_event(const std::string& timestamp) const;

    std::filesystem::path workload_dir_;
    std::string workload_;
    std::shared_ptr<spdlog::logger> logger_;

    WorkloadLock lock_;
    GenerationJournal journal_;
    std::map<std::string, Entry> entries_;     // keyed by timestamp
    std::optional<std::string> latest_;
};

} // namespace cvault::persistence
