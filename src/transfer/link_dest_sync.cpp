#include "transfer/link_dest_sync.hpp"
#include "persistence/byte_io.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace cvault::transfer {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 128 * 1024;

// Temp names must not grow with the target name: a source name close to
// NAME_MAX still has to fit.
std::atomic<std::uint64_t> g_tmp_sequence{0};

fs::path temp_path_in(const fs::path& dir) {
    return dir / (".cvault." + std::to_string(::getpid()) + "." +
                  std::to_string(++g_tmp_sequence) + ".tmp");
}

std::error_code last_error() {
    return {errno, std::generic_category()};
}

bool same_content_hint(const struct stat& a, const struct stat& b) {
    return a.st_size == b.st_size &&
           a.st_mtim.tv_sec == b.st_mtim.tv_sec &&
           a.st_mtim.tv_nsec == b.st_mtim.tv_nsec;
}

bool same_attributes(const struct stat& a, const struct stat& b) {
    return a.st_mode == b.st_mode && a.st_uid == b.st_uid && a.st_gid == b.st_gid;
}

// ── SyncRun ──────────────────────────────────────────────────────────────────
//
// State of one sync() call: the inode map that reproduces hard links between
// files of the source tree, and the running statistics.

class SyncRun {
public:
    SyncRun(spdlog::logger& logger, SyncStats& stats)
        : logger_{logger}, stats_{stats} {}

    std::error_code run(const fs::path& src, const fs::path& dst,
                        const std::optional<fs::path>& base);

private:
    std::error_code sync_dir(const fs::path& src, const fs::path& dst,
                             const std::optional<fs::path>& base);
    std::error_code sync_file(const fs::path& src, const struct stat& st,
                              const fs::path& dst, const std::optional<fs::path>& base);
    std::error_code sync_symlink(const fs::path& src, const struct stat& st,
                                 const fs::path& dst);
    std::error_code sync_special(const fs::path& src, const struct stat& st,
                                 const fs::path& dst);

    std::error_code copy_file(const fs::path& src, const struct stat& st,
                              const fs::path& dst);
    std::error_code ensure_directory(const fs::path& dst);
    std::error_code apply_attributes(const fs::path& path, const struct stat& st,
                                     bool is_symlink);
    std::error_code remove_entry(const fs::path& path);
    std::error_code remove_extraneous(const fs::path& dst,
                                      const std::vector<std::string>& keep);

    void remember_inode(const struct stat& st, const fs::path& dst) {
        if (st.st_nlink > 1) {
            inodes_.emplace(std::make_pair(st.st_dev, st.st_ino), dst);
        }
    }

    std::error_code fail(const char* op, const fs::path& path) {
        auto ec = last_error();
        logger_.error("{} {}: {}", op, path.string(), ec.message());
        return ec;
    }

    spdlog::logger& logger_;
    SyncStats& stats_;
    std::map<std::pair<dev_t, ino_t>, fs::path> inodes_;
};

std::error_code SyncRun::run(const fs::path& src, const fs::path& dst,
                             const std::optional<fs::path>& base) {
    struct stat st{};
    if (::lstat(src.c_str(), &st) != 0) {
        return fail("lstat", src);
    }
    if (!S_ISDIR(st.st_mode)) {
        logger_.error("{} is not a directory", src.string());
        return std::make_error_code(std::errc::not_a_directory);
    }

    if (auto ec = ensure_directory(dst)) {
        return ec;
    }
    if (auto ec = sync_dir(src, dst, base)) {
        return ec;
    }
    if (auto ec = apply_attributes(dst, st, false)) {
        return ec;
    }

    int fd = ::open(dst.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return fail("open", dst);
    }
    int rc = ::syncfs(fd);
    ::close(fd);
    if (rc != 0) {
        return fail("syncfs", dst);
    }
    return {};
}

// ── Directories ──────────────────────────────────────────────────────────────

std::error_code SyncRun::sync_dir(const fs::path& src, const fs::path& dst,
                                  const std::optional<fs::path>& base) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        logger_.error("readdir {}: {}", src.string(), ec.message());
        return ec;
    }

    if (auto rm_ec = remove_extraneous(dst, names)) {
        return rm_ec;
    }

    for (const auto& name : names) {
        const auto child_src = src / name;
        const auto child_dst = dst / name;
        std::optional<fs::path> child_base;
        if (base) {
            child_base = *base / name;
        }

        struct stat st{};
        if (::lstat(child_src.c_str(), &st) != 0) {
            return fail("lstat", child_src);
        }

        std::error_code child_ec;
        if (S_ISDIR(st.st_mode)) {
            child_ec = ensure_directory(child_dst);
            if (!child_ec) {
                child_ec = sync_dir(child_src, child_dst, child_base);
            }
            if (!child_ec) {
                child_ec = apply_attributes(child_dst, st, false);
            }
        } else if (S_ISREG(st.st_mode)) {
            child_ec = sync_file(child_src, st, child_dst, child_base);
        } else if (S_ISLNK(st.st_mode)) {
            child_ec = sync_symlink(child_src, st, child_dst);
        } else {
            child_ec = sync_special(child_src, st, child_dst);
        }
        if (child_ec) {
            return child_ec;
        }
    }
    return {};
}

std::error_code SyncRun::ensure_directory(const fs::path& dst) {
    struct stat st{};
    if (::lstat(dst.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            // Must be able to populate it; final mode is applied afterwards.
            if ((st.st_mode & S_IRWXU) != S_IRWXU &&
                ::chmod(dst.c_str(), (st.st_mode & 07777) | S_IRWXU) != 0) {
                return fail("chmod", dst);
            }
            return {};
        }
        if (auto ec = remove_entry(dst)) {
            return ec;
        }
    } else if (errno != ENOENT) {
        return fail("lstat", dst);
    }

    if (::mkdir(dst.c_str(), S_IRWXU) != 0) {
        return fail("mkdir", dst);
    }
    return {};
}

std::error_code SyncRun::remove_extraneous(const fs::path& dst,
                                           const std::vector<std::string>& keep) {
    std::vector<fs::path> doomed;
    std::error_code ec;
    for (fs::directory_iterator it(dst, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (std::find(keep.begin(), keep.end(), name) == keep.end()) {
            doomed.push_back(it->path());
        }
    }
    if (ec) {
        logger_.error("readdir {}: {}", dst.string(), ec.message());
        return ec;
    }

    for (const auto& path : doomed) {
        if (auto rm_ec = remove_entry(path)) {
            return rm_ec;
        }
        ++stats_.entries_deleted;
        logger_.debug("deleted {}", path.string());
    }
    return {};
}

std::error_code SyncRun::remove_entry(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        logger_.error("remove {}: {}", path.string(), ec.message());
    }
    return ec;
}

// ── Regular files ────────────────────────────────────────────────────────────

std::error_code SyncRun::sync_file(const fs::path& src, const struct stat& st,
                                   const fs::path& dst, const std::optional<fs::path>& base) {
    struct stat dst_st{};
    bool dst_exists = ::lstat(dst.c_str(), &dst_st) == 0;

    // Second name of a file already transferred in this run.
    if (st.st_nlink > 1) {
        auto it = inodes_.find(std::make_pair(st.st_dev, st.st_ino));
        if (it != inodes_.end()) {
            struct stat first_st{};
            if (dst_exists && ::lstat(it->second.c_str(), &first_st) == 0 &&
                first_st.st_dev == dst_st.st_dev && first_st.st_ino == dst_st.st_ino) {
                ++stats_.files_unchanged;
                return {};
            }
            if (dst_exists) {
                if (auto ec = remove_entry(dst)) {
                    return ec;
                }
            }
            if (::link(it->second.c_str(), dst.c_str()) != 0) {
                return fail("link", dst);
            }
            ++stats_.files_linked;
            return {};
        }
    }

    if (dst_exists && S_ISREG(dst_st.st_mode) && same_content_hint(st, dst_st)) {
        if (!same_attributes(st, dst_st)) {
            if (auto ec = apply_attributes(dst, st, false)) {
                return ec;
            }
        }
        ++stats_.files_unchanged;
        remember_inode(st, dst);
        return {};
    }

    if (base) {
        struct stat base_st{};
        if (::lstat(base->c_str(), &base_st) == 0 && S_ISREG(base_st.st_mode) &&
            same_content_hint(st, base_st) && same_attributes(st, base_st)) {
            if (dst_exists) {
                if (auto ec = remove_entry(dst)) {
                    return ec;
                }
                dst_exists = false;
            }
            if (::link(base->c_str(), dst.c_str()) == 0) {
                ++stats_.files_linked;
                remember_inode(st, dst);
                return {};
            }
            if (errno != EXDEV && errno != EMLINK && errno != EPERM) {
                return fail("link", dst);
            }
            logger_.debug("cannot link {} to {}; copying", dst.string(), base->string());
        }
    }

    if (auto ec = copy_file(src, st, dst)) {
        return ec;
    }
    ++stats_.files_copied;
    stats_.bytes_copied += static_cast<uint64_t>(st.st_size);
    remember_inode(st, dst);
    return {};
}

std::error_code SyncRun::copy_file(const fs::path& src, const struct stat& st,
                                   const fs::path& dst) {
    int in = ::open(src.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (in < 0) {
        return fail("open", src);
    }

    fs::path tmp;
    int out = -1;
    do {
        tmp = temp_path_in(dst.parent_path());
        out = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW,
                     S_IRUSR | S_IWUSR);
    } while (out < 0 && errno == EEXIST);
    if (out < 0) {
        auto ec = fail("create", tmp);
        ::close(in);
        return ec;
    }

    std::error_code ec;
    std::vector<uint8_t> buf(kCopyBufferSize);
    for (;;) {
        ssize_t n = ::read(in, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ec = fail("read", src);
            break;
        }
        if (n == 0) {
            break;
        }
        if ((ec = persistence::write_all(out, buf.data(), static_cast<std::size_t>(n)))) {
            logger_.error("write {}: {}", tmp.string(), ec.message());
            break;
        }
    }
    ::close(in);

    if (!ec && ::fchown(out, st.st_uid, st.st_gid) != 0 && errno != EPERM) {
        ec = fail("chown", tmp);
    }
    if (!ec && ::fchmod(out, st.st_mode & 07777) != 0) {
        ec = fail("chmod", tmp);
    }
    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (!ec && ::futimens(out, times) != 0) {
        ec = fail("utimens", tmp);
    }
    if (::close(out) != 0 && !ec) {
        ec = fail("close", tmp);
    }

    if (!ec) {
        struct stat dst_st{};
        if (::lstat(dst.c_str(), &dst_st) == 0 && S_ISDIR(dst_st.st_mode)) {
            ec = remove_entry(dst);
        }
    }
    if (!ec && ::rename(tmp.c_str(), dst.c_str()) != 0) {
        ec = fail("rename", dst);
    }
    if (ec) {
        ::unlink(tmp.c_str());
    }
    return ec;
}

// ── Symlinks and special files ───────────────────────────────────────────────

std::error_code SyncRun::sync_symlink(const fs::path& src, const struct stat& st,
                                      const fs::path& dst) {
    std::error_code ec;
    const auto target = fs::read_symlink(src, ec);
    if (ec) {
        logger_.error("readlink {}: {}", src.string(), ec.message());
        return ec;
    }

    struct stat dst_st{};
    if (::lstat(dst.c_str(), &dst_st) == 0) {
        if (S_ISLNK(dst_st.st_mode)) {
            std::error_code read_ec;
            if (fs::read_symlink(dst, read_ec) == target && !read_ec) {
                ++stats_.files_unchanged;
                return apply_attributes(dst, st, true);
            }
        }
        if (auto rm_ec = remove_entry(dst)) {
            return rm_ec;
        }
    }

    if (::symlink(target.c_str(), dst.c_str()) != 0) {
        return fail("symlink", dst);
    }
    ++stats_.files_copied;
    return apply_attributes(dst, st, true);
}

std::error_code SyncRun::sync_special(const fs::path& src, const struct stat& st,
                                      const fs::path& dst) {
    if (S_ISSOCK(st.st_mode)) {
        logger_.debug("skipping socket {}", src.string());
        return {};
    }

    struct stat dst_st{};
    if (::lstat(dst.c_str(), &dst_st) == 0) {
        if ((dst_st.st_mode & S_IFMT) == (st.st_mode & S_IFMT) && dst_st.st_rdev == st.st_rdev) {
            ++stats_.files_unchanged;
            return apply_attributes(dst, st, false);
        }
        if (auto ec = remove_entry(dst)) {
            return ec;
        }
    }

    int rc = S_ISFIFO(st.st_mode) ? ::mkfifo(dst.c_str(), st.st_mode & 07777)
                                  : ::mknod(dst.c_str(), st.st_mode, st.st_rdev);
    if (rc != 0) {
        if (errno == EPERM) {
            logger_.warn("skipping device node {}: not permitted", src.string());
            return {};
        }
        return fail("mknod", dst);
    }
    ++stats_.files_copied;
    return apply_attributes(dst, st, false);
}

std::error_code SyncRun::apply_attributes(const fs::path& path, const struct stat& st,
                                          bool is_symlink) {
    if (::lchown(path.c_str(), st.st_uid, st.st_gid) != 0 && errno != EPERM) {
        return fail("chown", path);
    }
    if (!is_symlink && ::chmod(path.c_str(), st.st_mode & 07777) != 0) {
        return fail("chmod", path);
    }
    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, path.c_str(), times, is_symlink ? AT_SYMLINK_NOFOLLOW : 0) != 0) {
        return fail("utimens", path);
    }
    return {};
}

} // anonymous namespace

// ── LinkDestSync ─────────────────────────────────────────────────────────────

LinkDestSync::LinkDestSync(std::shared_ptr<spdlog::logger> logger)
    : logger_{std::move(logger)}
{}

std::error_code LinkDestSync::sync(const fs::path& src,
                                   const fs::path& dst,
                                   const std::optional<fs::path>& base,
                                   SyncStats& stats) {
    logger_->debug("sync {} -> {}{}", src.string(), dst.string(),
                   base ? " (base " + base->string() + ")" : std::string{});
    SyncRun run(*logger_, stats);
    return run.run(src, dst, base);
}

} // namespace cvault::transfer
