#pragma once

#include <cerrno>
#include <cstdint>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace cvault::persistence {

// ── Little-endian serialisation helpers ──────────────────────────────────────

inline void append_raw(std::vector<uint8_t>& buf, const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

inline void write_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

inline void write_u16_le(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

inline void write_u32_le(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

// Read helpers: return false if not enough data.
inline bool read_u8(const uint8_t*& ptr, const uint8_t* end, uint8_t& out) {
    if (ptr + 1 > end) return false;
    out = *ptr++;
    return true;
}

inline bool read_u16_le(const uint8_t*& ptr, const uint8_t* end, uint16_t& out) {
    if (ptr + 2 > end) return false;
    out = static_cast<uint16_t>(ptr[0]) |
          (static_cast<uint16_t>(ptr[1]) << 8);
    ptr += 2;
    return true;
}

inline bool read_u32_le(const uint8_t*& ptr, const uint8_t* end, uint32_t& out) {
    if (ptr + 4 > end) return false;
    out = static_cast<uint32_t>(ptr[0]) |
          (static_cast<uint32_t>(ptr[1]) << 8) |
          (static_cast<uint32_t>(ptr[2]) << 16) |
          (static_cast<uint32_t>(ptr[3]) << 24);
    ptr += 4;
    return true;
}

// ── fd helpers ───────────────────────────────────────────────────────────────

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] inline std::error_code write_all(int fd, const uint8_t* data,
                                               std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Read the rest of fd into `out`. Returns error_code on failure.
[[nodiscard]] inline std::error_code read_all(int fd, std::vector<uint8_t>& out) {
    out.clear();
    uint8_t buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }
    return {};
}

} // namespace cvault::persistence
