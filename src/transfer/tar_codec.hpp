#pragma once

#include "transfer/archive_codec.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace cvault::transfer {

// ── TarCodec ─────────────────────────────────────────────────────────────────
//
// ArchiveCodec running GNU tar.  Archives are created with numeric owners
// and preserved permissions; extraction detects the compression itself, so
// any TarCodec can unpack an archive made by another.

class TarCodec final : public ArchiveCodec {
public:
    enum class Compression {
        None,
        Gzip,
        Zstd,
    };

    TarCodec(Compression compression,
             std::string binary,
             std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::string extension() const override;

    [[nodiscard]] std::error_code pack(const std::filesystem::path& dir,
                                       const std::filesystem::path& artifact) override;

    [[nodiscard]] std::error_code unpack(const std::filesystem::path& artifact,
                                         const std::filesystem::path& dir) override;

    // Exposed for testing.
    [[nodiscard]] std::vector<std::string> pack_args(const std::filesystem::path& dir,
                                                     const std::filesystem::path& out) const;

private:
    std::error_code run(const std::vector<std::string>& args);

    Compression compression_;
    std::string binary_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cvault::transfer
