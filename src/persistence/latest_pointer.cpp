#include "persistence/latest_pointer.hpp"
#include "persistence/byte_io.hpp"
#include "persistence/generation_journal.hpp"  // crc32()
#include "common/errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace cvault::persistence {

namespace {

// magic(4) + version(2) + payload_len(4) + crc(4)
constexpr std::size_t kMinSize = kPointerMagicSize + 2 + 4 + 4;

} // anonymous namespace

// ── fsync_directory ──────────────────────────────────────────────────────────

std::error_code fsync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return {errno, std::system_category()};
    }
    std::error_code ec;
    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
    }
    ::close(fd);
    return ec;
}

// ── LatestPointerFile::save ──────────────────────────────────────────────────

std::error_code LatestPointerFile::save(const std::filesystem::path& path,
                                        const LatestPointer& pointer) {
    const std::string payload = pointer.SerializeAsString();

    std::vector<uint8_t> buf;
    buf.reserve(kMinSize + payload.size());
    append_raw(buf, kPointerMagic, kPointerMagicSize);
    write_u16_le(buf, kPointerVersion);
    write_u32_le(buf, static_cast<uint32_t>(payload.size()));
    append_raw(buf, payload.data(), payload.size());

    // CRC32 of everything so far.
    uint32_t checksum = crc32(buf.data(), buf.size());
    write_u32_le(buf, checksum);

    // Atomic write: write to .tmp, fsync, rename.
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("LatestPointer: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    auto ec = write_all(fd, buf.data(), buf.size());
    if (ec) {
        spdlog::error("LatestPointer: write failed: {}", ec.message());
        ::close(fd);
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::error("LatestPointer: fsync failed: {}", ec.message());
        ::close(fd);
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    ::close(fd);

    // Rename .tmp → final path.  This is the commit point.
    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::error("LatestPointer: rename failed: {}", rename_ec.message());
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return rename_ec;
    }

    if (auto dir_ec = fsync_directory(path.parent_path())) {
        spdlog::warn("LatestPointer: directory fsync failed: {}", dir_ec.message());
    }

    spdlog::debug("LatestPointer: {} now at {}", pointer.workload(), pointer.timestamp());
    return {};
}

// ── LatestPointerFile::load ──────────────────────────────────────────────────

std::error_code LatestPointerFile::load(const std::filesystem::path& path,
                                        LatestPointer& pointer) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return {errno, std::system_category()};
    }
    std::vector<uint8_t> buf;
    auto ec = read_all(fd, buf);
    ::close(fd);
    if (ec) {
        spdlog::error("LatestPointer: read failed: {}", ec.message());
        return ec;
    }

    if (buf.size() < kMinSize) {
        spdlog::error("LatestPointer: file too small ({} bytes)", buf.size());
        return make_error_code(Errc::store_corrupt);
    }

    const uint8_t* p = buf.data();
    const uint8_t* end = p + buf.size();

    // Validate magic.
    if (std::memcmp(p, kPointerMagic, kPointerMagicSize) != 0) {
        spdlog::error("LatestPointer: invalid magic");
        return make_error_code(Errc::store_corrupt);
    }
    p += kPointerMagicSize;

    uint16_t version = 0;
    uint32_t payload_len = 0;
    if (!read_u16_le(p, end, version) || version != kPointerVersion) {
        spdlog::error("LatestPointer: unsupported version {}", version);
        return make_error_code(Errc::store_corrupt);
    }
    if (!read_u32_le(p, end, payload_len) ||
        static_cast<std::size_t>(end - p) != std::size_t{payload_len} + 4) {
        spdlog::error("LatestPointer: length mismatch");
        return make_error_code(Errc::store_corrupt);
    }

    const uint8_t* payload = p;
    p += payload_len;

    uint32_t stored_crc = 0;
    if (!read_u32_le(p, end, stored_crc)) {
        return make_error_code(Errc::store_corrupt);
    }
    const std::size_t data_len = static_cast<std::size_t>(payload + payload_len - buf.data());
    const uint32_t computed_crc = crc32(buf.data(), data_len);
    if (stored_crc != computed_crc) {
        spdlog::error("LatestPointer: CRC mismatch (stored={:#010x}, computed={:#010x})",
                      stored_crc, computed_crc);
        return make_error_code(Errc::store_corrupt);
    }

    if (!pointer.ParseFromArray(payload, static_cast<int>(payload_len))) {
        spdlog::error("LatestPointer: unparsable payload");
        return make_error_code(Errc::store_corrupt);
    }
    return {};
}

// ── LatestPointerFile::exists ────────────────────────────────────────────────

bool LatestPointerFile::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace cvault::persistence
