#pragma once

#include "transfer/tree_sync.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace cvault::transfer {

// ── RsyncSync ────────────────────────────────────────────────────────────────
//
// TreeSync delegating to an external `rsync -aHAX --numeric-ids --delete`,
// with --link-dest pointing at the base tree.  Statistics are not collected.

class RsyncSync final : public TreeSync {
public:
    RsyncSync(std::string binary, std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::error_code sync(const std::filesystem::path& src,
                                       const std::filesystem::path& dst,
                                       const std::optional<std::filesystem::path>& base,
                                       SyncStats& stats) override;

private:
    std::string binary_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Exposed for testing.
[[nodiscard]] std::vector<std::string> build_rsync_args(const std::string& binary,
                                                        const std::filesystem::path& src,
                                                        const std::filesystem::path& dst,
                                                        const std::optional<std::filesystem::path>& base);

} // namespace cvault::transfer
