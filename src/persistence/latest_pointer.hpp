#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>

#include "cvault.pb.h"

namespace cvault::persistence {

// ── Pointer file constants ───────────────────────────────────────────────────

static constexpr char kPointerMagic[] = "CVLP";        // 4 bytes (no NUL)
static constexpr std::size_t kPointerMagicSize = 4;
static constexpr uint16_t kPointerVersion = 1;

// ── LatestPointerFile ────────────────────────────────────────────────────────
//
// The single mutable reference to a workload's most recently sealed
// generation.  Binary format:
//
//   [magic: "CVLP" (4B)][version: u16 LE = 1]
//   [payload_len: u32 LE][payload: LatestPointer protobuf]
//   [crc32: u32 LE]     // CRC of everything from magic through payload
//
// File path: <workload_dir>/LATEST
// Atomic replace: write to LATEST.tmp, fsync, rename, fsync the directory.
// A reader therefore sees either the previous pointer or the new one.
//
// Thread-safety: static methods, no mutable state.  Callers serialise writes
// through the per-workload lock.

class LatestPointerFile {
public:
    static constexpr const char* kFilename = "LATEST";

    [[nodiscard]] static std::error_code save(const std::filesystem::path& path,
                                              const LatestPointer& pointer);

    // Validates magic, version and CRC32.
    [[nodiscard]] static std::error_code load(const std::filesystem::path& path,
                                              LatestPointer& pointer);

    [[nodiscard]] static bool exists(const std::filesystem::path& path);
};

// fsync a directory so that a completed rename inside it is durable.
[[nodiscard]] std::error_code fsync_directory(const std::filesystem::path& dir);

} // namespace cvault::persistence
