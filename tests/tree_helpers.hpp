#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace cvault::test {

// ── TempDir ──────────────────────────────────────────────────────────────────
//
// Per-test scratch directory under the system temp dir, removed on
// destruction.

class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + info->test_suite_name() + "_" + info->name() +
                 "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Set a file's mtime to `seconds` since the epoch.
inline void set_mtime(const std::filesystem::path& path, time_t seconds) {
    struct timeval times[2] = {{seconds, 0}, {seconds, 0}};
    ASSERT_EQ(::lutimes(path.c_str(), times), 0);
}

inline struct stat stat_of(const std::filesystem::path& path) {
    struct stat st{};
    EXPECT_EQ(::lstat(path.c_str(), &st), 0) << path;
    return st;
}

inline bool same_inode(const std::filesystem::path& a, const std::filesystem::path& b) {
    auto sa = stat_of(a);
    auto sb = stat_of(b);
    return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
}

// Flatten a tree to "relative path → description" for equality checks:
// files map to their content and mode, symlinks to their target, directories
// to "<dir>".
inline std::map<std::string, std::string> describe_tree(const std::filesystem::path& root) {
    std::map<std::string, std::string> out;
    for (auto it = std::filesystem::recursive_directory_iterator(root);
         it != std::filesystem::recursive_directory_iterator(); ++it) {
        const auto rel = std::filesystem::relative(it->path(), root).string();
        const auto st = stat_of(it->path());
        if (S_ISLNK(st.st_mode)) {
            out[rel] = "-> " + std::filesystem::read_symlink(it->path()).string();
        } else if (S_ISDIR(st.st_mode)) {
            out[rel] = "<dir>";
        } else {
            out[rel] = read_file(it->path()) + " mode=" + std::to_string(st.st_mode & 07777) +
                       " mtime=" + std::to_string(st.st_mtim.tv_sec);
        }
    }
    return out;
}

} // namespace cvault::test
