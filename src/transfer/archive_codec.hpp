#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace cvault::transfer {

// ── ArchiveCodec ─────────────────────────────────────────────────────────────
//
// Packs a sealed generation directory into one portable artifact and back.
// pack() writes to a temporary name next to `artifact` and renames it into
// place, so a failed or interrupted pack never leaves a truncated archive
// under the final name.

class ArchiveCodec {
public:
    virtual ~ArchiveCodec() = default;

    // File name suffix of produced artifacts (".tar.gz").
    [[nodiscard]] virtual std::string extension() const = 0;

    [[nodiscard]] virtual std::error_code pack(const std::filesystem::path& dir,
                                               const std::filesystem::path& artifact) = 0;

    // Extract `artifact` into `dir` (created if missing).
    [[nodiscard]] virtual std::error_code unpack(const std::filesystem::path& artifact,
                                                 const std::filesystem::path& dir) = 0;
};

} // namespace cvault::transfer
