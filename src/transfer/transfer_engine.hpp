#pragma once

#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "persistence/generation_store.hpp"
#include "transfer/tree_sync.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "cvault.pb.h"

namespace cvault::transfer {

// ── TransferError ────────────────────────────────────────────────────────────
//
// Failure of one mount's transfer.  code() is Errc::transfer_failed; cause()
// is the underlying I/O error.

class TransferError : public VaultError {
public:
    TransferError(std::string mount, std::error_code cause)
        : VaultError(Errc::transfer_failed, mount + ": " + cause.message())
        , mount_{std::move(mount)}
        , cause_{cause} {}

    [[nodiscard]] const std::string& mount() const noexcept { return mount_; }
    [[nodiscard]] std::error_code cause() const noexcept { return cause_; }

private:
    std::string mount_;
    std::error_code cause_;
};

// Worker count for `jobs` (0 = one per hardware thread), capped at `work`.
[[nodiscard]] unsigned effective_jobs(unsigned jobs, std::size_t work);

// ── IncrementalTransferEngine ────────────────────────────────────────────────
//
// Copies every mount of a backup into the target generation's data tree,
// hard-linking files unchanged since the base generation.
//
// Each mount is synced into `staging/<n>` and renamed to
// `data/<hostPath>` only once it is complete, so the data tree never holds
// a partial copy.  Mounts are independent and run in parallel on a
// boost::asio::thread_pool.  Cancellation is checked before each mount
// starts.

class IncrementalTransferEngine {
public:
    IncrementalTransferEngine(TreeSync& sync,
                              unsigned jobs,
                              const CancellationToken& cancel,
                              std::shared_ptr<spdlog::logger> logger);

    // Throws TransferError for the first failed mount, or
    // VaultError(Errc::cancelled).
    SyncStats run(const std::vector<MountPoint>& mounts,
                  const persistence::Generation& target,
                  const std::optional<persistence::Generation>& base);

private:
    TreeSync& sync_;
    unsigned jobs_;
    const CancellationToken& cancel_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ── RestoreTransferEngine ────────────────────────────────────────────────────
//
// Mirrors a generation's data back onto the host, one binding at a time in
// parallel: restore_host_path becomes an exact copy of the data recorded for
// source_host_path.  Missing parents of a target are created.  A binding
// whose target lies inside another's is mirrored after it.  A binding with
// no recorded data is skipped with a warning.

class RestoreTransferEngine {
public:
    struct Report {
        std::vector<std::string> restored;   // restore host paths written
        std::vector<std::string> skipped;    // container paths with no data
        SyncStats stats;
    };

    RestoreTransferEngine(TreeSync& sync,
                          unsigned jobs,
                          const CancellationToken& cancel,
                          std::shared_ptr<spdlog::logger> logger);

    // Throws TransferError or VaultError(Errc::cancelled).
    Report run(const std::vector<MountBinding>& bindings,
               const std::filesystem::path& data_root);

private:
    TreeSync& sync_;
    unsigned jobs_;
    const CancellationToken& cancel_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cvault::transfer
