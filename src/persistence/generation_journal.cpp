#include "persistence/generation_journal.hpp"
#include "persistence/byte_io.hpp"
#include "common/errors.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace cvault::persistence {

// ── CRC32 (ISO 3309 polynomial 0xEDB88320) ──────────────────────────────────

namespace {

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1)
                crc = (crc >> 1) ^ 0xEDB88320;
            else
                crc >>= 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32Table = make_crc32_table();

// [type(1)][payload_len(4)] ... [crc(4)]
constexpr std::size_t kRecordOverhead = 1 + 4 + 4;

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

bool known_type(uint8_t type) {
    return type == static_cast<uint8_t>(JournalRecordType::Created) ||
           type == static_cast<uint8_t>(JournalRecordType::Sealed) ||
           type == static_cast<uint8_t>(JournalRecordType::Pruned);
}

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (std::size_t i = 0; i < length; ++i) {
        crc = kCrc32Table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

// ── Serialisation ────────────────────────────────────────────────────────────

std::vector<uint8_t> serialise_record(JournalRecordType type,
                                      const GenerationEvent& event) {
    const std::string payload = event.SerializeAsString();

    std::vector<uint8_t> buf;
    buf.reserve(kRecordOverhead + payload.size());

    write_u8(buf, static_cast<uint8_t>(type));
    write_u32_le(buf, static_cast<uint32_t>(payload.size()));
    append_raw(buf, payload.data(), payload.size());

    // CRC covers type through payload.
    uint32_t c = crc32(buf.data(), buf.size());
    write_u32_le(buf, c);

    return buf;
}

// ── GenerationJournal ────────────────────────────────────────────────────────

GenerationJournal::GenerationJournal(const std::filesystem::path& path)
    : path_(path) {}

GenerationJournal::~GenerationJournal() {
    close();
}

std::error_code GenerationJournal::open() {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    std::error_code fs_ec;
    const bool exists = std::filesystem::exists(path_, fs_ec);
    const bool fresh = !exists || std::filesystem::file_size(path_, fs_ec) == 0;

    std::size_t keep_length = kJournalHeaderSize;
    if (!fresh) {
        JournalReplayResult current;
        if (auto ec = replay(path_, current)) {
            return ec;
        }
        keep_length = current.valid_length;
        if (current.torn_tail) {
            spdlog::warn("Journal: truncating torn tail of {} to {} bytes",
                         path_.string(), keep_length);
        }
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return make_errno_error();
    }

    if (fresh) {
        std::vector<uint8_t> hdr;
        hdr.reserve(kJournalHeaderSize);
        append_raw(hdr, kJournalMagic, kJournalMagicSize);
        write_u16_le(hdr, kJournalVersion);
        if (auto ec = write_bytes(hdr)) {
            close();
            return ec;
        }
        return {};
    }

    if (::ftruncate(fd_, static_cast<off_t>(keep_length)) < 0 ||
        ::lseek(fd_, 0, SEEK_END) < 0) {
        auto ec = make_errno_error();
        close();
        return ec;
    }
    return {};
}

void GenerationJournal::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code GenerationJournal::write_bytes(const std::vector<uint8_t>& data) {
    if (auto ec = write_all(fd_, data.data(), data.size())) {
        return ec;
    }
    // fsync to ensure durability.
    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    return {};
}

std::error_code GenerationJournal::append(JournalRecordType type,
                                          const GenerationEvent& event) {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);
    return write_bytes(serialise_record(type, event));
}

std::error_code GenerationJournal::replay(const std::filesystem::path& path,
                                          JournalReplayResult& result) {
    result = {};

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return make_errno_error();
    }
    std::vector<uint8_t> data;
    auto read_ec = read_all(fd, data);
    ::close(fd);
    if (read_ec) {
        return read_ec;
    }

    // Validate header.
    if (data.size() < kJournalHeaderSize ||
        std::memcmp(data.data(), kJournalMagic, kJournalMagicSize) != 0) {
        spdlog::error("Journal: invalid header in {}", path.string());
        return make_error_code(Errc::store_corrupt);
    }

    const uint8_t* ptr = data.data() + kJournalMagicSize;
    const uint8_t* end = data.data() + data.size();

    uint16_t version = 0;
    if (!read_u16_le(ptr, end, version) || version != kJournalVersion) {
        spdlog::error("Journal: unsupported version {} in {}", version, path.string());
        return make_error_code(Errc::store_corrupt);
    }
    result.valid_length = kJournalHeaderSize;

    // Parse records.
    while (ptr < end) {
        const uint8_t* record_start = ptr;

        uint8_t type = 0;
        uint32_t payload_len = 0;
        if (!read_u8(ptr, end, type) || !read_u32_le(ptr, end, payload_len) ||
            static_cast<std::size_t>(end - ptr) < std::size_t{payload_len} + 4) {
            spdlog::warn("Journal: truncated record at offset {}",
                         record_start - data.data());
            result.torn_tail = true;
            break;
        }

        const uint8_t* payload = ptr;
        ptr += payload_len;

        uint32_t stored_crc = 0;
        if (!read_u32_le(ptr, end, stored_crc)) {
            result.torn_tail = true;
            break;
        }

        const std::size_t covered = static_cast<std::size_t>(ptr - record_start) - 4;
        const bool crc_ok = crc32(record_start, covered) == stored_crc;
        if (!crc_ok || !known_type(type)) {
            if (ptr == end) {
                // Last record: a crash while appending.
                spdlog::warn("Journal: damaged final record at offset {}",
                             record_start - data.data());
                result.torn_tail = true;
                break;
            }
            spdlog::error("Journal: damaged record at offset {} in {}",
                          record_start - data.data(), path.string());
            return make_error_code(Errc::store_corrupt);
        }

        JournalRecord rec;
        rec.type = static_cast<JournalRecordType>(type);
        if (!rec.event.ParseFromArray(payload, static_cast<int>(payload_len))) {
            spdlog::error("Journal: unparsable payload at offset {} in {}",
                          record_start - data.data(), path.string());
            return make_error_code(Errc::store_corrupt);
        }

        result.records.push_back(std::move(rec));
        result.valid_length = static_cast<std::size_t>(ptr - data.data());
    }

    return {};
}

} // namespace cvault::persistence
