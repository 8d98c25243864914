#include "transfer/rsync_sync.hpp"
#include "common/subprocess.hpp"

#include <utility>

namespace cvault::transfer {

namespace fs = std::filesystem;

namespace {

// rsync copies the contents of a directory only when it ends with '/'.
std::string as_dir(const fs::path& p) {
    auto s = p.string();
    if (s.empty() || s.back() != '/') {
        s += '/';
    }
    return s;
}

} // anonymous namespace

std::vector<std::string> build_rsync_args(const std::string& binary,
                                          const fs::path& src,
                                          const fs::path& dst,
                                          const std::optional<fs::path>& base) {
    std::vector<std::string> args{binary, "-aHAX", "--numeric-ids", "--delete"};
    if (base) {
        args.push_back("--link-dest=" + fs::absolute(*base).string());
    }
    args.push_back(as_dir(src));
    args.push_back(as_dir(dst));
    return args;
}

RsyncSync::RsyncSync(std::string binary, std::shared_ptr<spdlog::logger> logger)
    : binary_{std::move(binary)}
    , logger_{std::move(logger)}
{}

std::error_code RsyncSync::sync(const fs::path& src,
                                const fs::path& dst,
                                const std::optional<fs::path>& base,
                                SyncStats& /*stats*/) {
    std::error_code ec;
    fs::create_directories(dst, ec);
    if (ec) {
        logger_->error("mkdir {}: {}", dst.string(), ec.message());
        return ec;
    }

    std::optional<fs::path> link_dest;
    if (base && fs::is_directory(*base, ec)) {
        link_dest = base;
    }

    const auto args = build_rsync_args(binary_, src, dst, link_dest);
    logger_->debug("exec: {}", join_argv(args));

    ProcessResult result;
    if (auto spawn_ec = run_process(args, result)) {
        logger_->error("cannot run {}: {}", binary_, spawn_ec.message());
        return spawn_ec;
    }
    if (result.exit_code != 0) {
        logger_->error("rsync {} -> {} exited {}: {}", src.string(), dst.string(),
                       result.exit_code, result.err);
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

} // namespace cvault::transfer
