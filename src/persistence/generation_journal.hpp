#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

#include "cvault.pb.h"

namespace cvault::persistence {

// ── Journal record types ─────────────────────────────────────────────────────

enum class JournalRecordType : uint8_t {
    Created = 0x01,   // generation directory allocated
    Sealed  = 0x02,   // transfer + metadata complete
    Pruned  = 0x03,   // generation deleted by retention
};

// ── Journal header constants ─────────────────────────────────────────────────

static constexpr char kJournalMagic[] = "CVJN";        // 4 bytes (no NUL)
static constexpr std::size_t kJournalMagicSize = 4;
static constexpr uint16_t kJournalVersion = 1;
static constexpr std::size_t kJournalHeaderSize =
    kJournalMagicSize + sizeof(uint16_t);             // 6 bytes

// ── Journal record ───────────────────────────────────────────────────────────
//
// [type: u8][payload_len: u32 LE][payload: GenerationEvent protobuf]
// [crc32: u32 LE]     // CRC of type through payload

struct JournalRecord {
    JournalRecordType type = JournalRecordType::Created;
    GenerationEvent event;
};

// ── Replay result ────────────────────────────────────────────────────────────

struct JournalReplayResult {
    std::vector<JournalRecord> records;
    std::size_t valid_length = 0;   // bytes up to the end of the last good record
    bool torn_tail = false;         // an incomplete trailing record was dropped
};

// ── GenerationJournal ────────────────────────────────────────────────────────
//
// Append-only index of generation lifecycle events for one workload.  Every
// append is fsynced before returning.  A record torn by a crash mid-append is
// dropped (and truncated away on the next open()); a damaged record followed
// by further records means the journal cannot be trusted and replay fails
// with Errc::store_corrupt.
//
// Thread-safety: NOT thread-safe.  The owning GenerationStore runs under the
// per-workload lock.

class GenerationJournal {
public:
    static constexpr const char* kFilename = "generations.journal";

    explicit GenerationJournal(const std::filesystem::path& path);
    ~GenerationJournal();

    // Non-copyable, non-movable.
    GenerationJournal(const GenerationJournal&) = delete;
    GenerationJournal& operator=(const GenerationJournal&) = delete;
    GenerationJournal(GenerationJournal&&) = delete;
    GenerationJournal& operator=(GenerationJournal&&) = delete;

    // Opens the journal, creating it with a fresh header if it doesn't exist.
    // A torn tail left by a crash is truncated away.
    [[nodiscard]] std::error_code open();

    void close();

    // Append one record and fsync.
    [[nodiscard]] std::error_code append(JournalRecordType type,
                                         const GenerationEvent& event);

    // Read every record from the journal at `path`.
    [[nodiscard]] static std::error_code replay(const std::filesystem::path& path,
                                                JournalReplayResult& result);

    [[nodiscard]] bool is_open() const { return fd_ != -1; }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    [[nodiscard]] std::error_code write_bytes(const std::vector<uint8_t>& data);

    std::filesystem::path path_;
    int fd_ = -1;
};

// ── CRC32 utility ────────────────────────────────────────────────────────────

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// Serialise a journal record to bytes (including type byte and CRC).
[[nodiscard]] std::vector<uint8_t> serialise_record(JournalRecordType type,
                                                    const GenerationEvent& event);

} // namespace cvault::persistence
