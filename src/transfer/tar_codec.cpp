#include "transfer/tar_codec.hpp"
#include "common/subprocess.hpp"

#include <utility>

namespace cvault::transfer {

namespace fs = std::filesystem;

TarCodec::TarCodec(Compression compression,
                   std::string binary,
                   std::shared_ptr<spdlog::logger> logger)
    : compression_{compression}
    , binary_{std::move(binary)}
    , logger_{std::move(logger)}
{}

std::string TarCodec::extension() const {
    switch (compression_) {
        case Compression::Gzip: return ".tar.gz";
        case Compression::Zstd: return ".tar.zst";
        case Compression::None: break;
    }
    return ".tar";
}

std::vector<std::string> TarCodec::pack_args(const fs::path& dir, const fs::path& out) const {
    std::vector<std::string> args{binary_, "--create", "--numeric-owner"};
    switch (compression_) {
        case Compression::Gzip: args.emplace_back("--gzip"); break;
        case Compression::Zstd: args.emplace_back("--zstd"); break;
        case Compression::None: break;
    }
    args.emplace_back("--file");
    args.push_back(out.string());
    args.emplace_back("--directory");
    args.push_back(dir.string());
    args.emplace_back(".");
    return args;
}

std::error_code TarCodec::pack(const fs::path& dir, const fs::path& artifact) {
    std::error_code ec;
    fs::create_directories(artifact.parent_path(), ec);
    if (ec) {
        logger_->error("mkdir {}: {}", artifact.parent_path().string(), ec.message());
        return ec;
    }

    auto tmp = artifact;
    tmp += ".tmp";
    if (auto run_ec = run(pack_args(dir, tmp))) {
        fs::remove(tmp, ec);
        return run_ec;
    }

    fs::rename(tmp, artifact, ec);
    if (ec) {
        logger_->error("rename {}: {}", artifact.string(), ec.message());
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return ec;
    }
    logger_->info("Packaged {} into {}", dir.string(), artifact.string());
    return {};
}

std::error_code TarCodec::unpack(const fs::path& artifact, const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        logger_->error("mkdir {}: {}", dir.string(), ec.message());
        return ec;
    }
    return run({binary_, "--extract", "--preserve-permissions", "--numeric-owner",
                "--file", artifact.string(), "--directory", dir.string()});
}

std::error_code TarCodec::run(const std::vector<std::string>& args) {
    logger_->debug("exec: {}", join_argv(args));
    ProcessResult result;
    if (auto ec = run_process(args, result)) {
        logger_->error("cannot run {}: {}", binary_, ec.message());
        return ec;
    }
    if (result.exit_code != 0) {
        logger_->error("{} exited {}: {}", binary_, result.exit_code, result.err);
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

} // namespace cvault::transfer
