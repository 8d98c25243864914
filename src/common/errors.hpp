#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace cvault {

// ── Error taxonomy ────────────────────────────────────────────────────────────

enum class Errc {
    usage = 1,            // bad invocation, no side effects
    not_found,            // workload, generation or archive missing
    quiesce_timeout,      // stop/restart could not be confirmed
    transfer_failed,      // I/O failure while copying one mount
    incomplete_metadata,  // restore blob lacks mandatory fields
    packaging_failed,     // archive codec failure
    no_mounts_found,      // nothing to back up for the workload
    busy,                 // another run holds the workload, or timestamp clash
    cancelled,            // operator interrupt
    store_corrupt,        // generation journal or pointer unreadable
    runtime_failed,       // workload runtime rejected a lifecycle call
};

} // namespace cvault

template <>
struct std::is_error_code_enum<cvault::Errc> : std::true_type {};

namespace cvault {

[[nodiscard]] const std::error_category& vault_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// ── VaultError ────────────────────────────────────────────────────────────────
//
// Thrown by the backup/restore pipelines.  what() carries the context
// (workload, generation, mount) followed by the category message.

class VaultError : public std::system_error {
public:
    VaultError(Errc code, const std::string& context)
        : std::system_error(make_error_code(code), context) {}

    VaultError(std::error_code code, const std::string& context)
        : std::system_error(code, context) {}
};

// ── Exit codes ────────────────────────────────────────────────────────────────

inline constexpr int kExitOk       = 0;
inline constexpr int kExitUsage    = 1;
inline constexpr int kExitNotFound = 2;
inline constexpr int kExitFailure  = 3;

// Map a pipeline error to the process exit code.
// usage → 1, not_found → 2, anything else → 3.
[[nodiscard]] int exit_code_for(const std::error_code& ec) noexcept;

} // namespace cvault
