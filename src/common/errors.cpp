#include "common/errors.hpp"

namespace cvault {

namespace {

class VaultCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "cvault"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::usage:               return "usage error";
            case Errc::not_found:           return "not found";
            case Errc::quiesce_timeout:     return "workload could not be quiesced";
            case Errc::transfer_failed:     return "transfer failed";
            case Errc::incomplete_metadata: return "incomplete metadata";
            case Errc::packaging_failed:    return "packaging failed";
            case Errc::no_mounts_found:     return "no mounts found";
            case Errc::busy:                return "resource busy";
            case Errc::cancelled:           return "cancelled";
            case Errc::store_corrupt:       return "generation store corrupt";
            case Errc::runtime_failed:      return "workload runtime call failed";
        }
        return "unknown cvault error";
    }
};

} // anonymous namespace

const std::error_category& vault_category() noexcept {
    static const VaultCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), vault_category()};
}

int exit_code_for(const std::error_code& ec) noexcept {
    if (!ec) return kExitOk;
    if (ec == Errc::usage) return kExitUsage;
    if (ec == Errc::not_found) return kExitNotFound;
    return kExitFailure;
}

} // namespace cvault
