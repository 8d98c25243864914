#include "persistence/generation_store.hpp"
#include "persistence/latest_pointer.hpp"
#include "common/errors.hpp"
#include "common/timestamp.hpp"

#include <algorithm>
#include <chrono>

namespace cvault::persistence {

namespace fs = std::filesystem;

std::filesystem::path data_path_for(const fs::path& data_root,
                                    const fs::path& host_path) {
    return data_root / host_path.relative_path();
}

GenerationStore::GenerationStore(fs::path backup_root,
                                 std::string workload,
                                 std::shared_ptr<spdlog::logger> logger)
    : workload_dir_{backup_root / workload}
    , workload_{std::move(workload)}
    , logger_{std::move(logger)}
    , lock_{workload_dir_ / WorkloadLock::kFilename}
    , journal_{workload_dir_ / GenerationJournal::kFilename}
{}

// ── open ─────────────────────────────────────────────────────────────────────

std::error_code GenerationStore::open() {
    std::error_code ec;
    fs::create_directories(workload_dir_, ec);
    if (ec) {
        logger_->error("Cannot create store directory {}: {}",
                       workload_dir_.string(), ec.message());
        return ec;
    }

    if (auto lock_ec = lock_.try_lock()) {
        logger_->error("Cannot lock {}: {}", workload_dir_.string(), lock_ec.message());
        return lock_ec;
    }

    if (auto journal_ec = journal_.open()) {
        logger_->error("Cannot open journal {}: {}",
                       journal_.path().string(), journal_ec.message());
        return journal_ec;
    }

    JournalReplayResult replay;
    if (auto replay_ec = GenerationJournal::replay(journal_.path(), replay)) {
        return replay_ec;
    }

    entries_.clear();
    for (const auto& rec : replay.records) {
        auto& entry = entries_[rec.event.timestamp()];
        switch (rec.type) {
            case JournalRecordType::Created:
                break;
            case JournalRecordType::Sealed:
                entry.sealed = true;
                break;
            case JournalRecordType::Pruned:
                entry.pruned = true;
                break;
        }
    }

    latest_.reset();
    const auto pointer_path = workload_dir_ / LatestPointerFile::kFilename;
    if (LatestPointerFile::exists(pointer_path)) {
        LatestPointer pointer;
        if (auto ptr_ec = LatestPointerFile::load(pointer_path, pointer)) {
            return ptr_ec;
        }
        auto it = entries_.find(pointer.timestamp());
        if (it == entries_.end() || !it->second.sealed || it->second.pruned) {
            logger_->error("LATEST points at {} which is not a live sealed generation",
                           pointer.timestamp());
            return make_error_code(Errc::store_corrupt);
        }
        latest_ = pointer.timestamp();
    }

    logger_->debug("Store {} opened: {} journaled generations, latest={}",
                   workload_dir_.string(), entries_.size(), latest_.value_or("<none>"));
    return {};
}

// ── create ───────────────────────────────────────────────────────────────────

std::error_code GenerationStore::create(const std::string& timestamp, Generation& out) {
    if (!is_timestamp_token(timestamp)) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (!entries_.empty() && entries_.rbegin()->first >= timestamp) {
        logger_->error("Generation {} is not newer than {}", timestamp,
                       entries_.rbegin()->first);
        return make_error_code(Errc::busy);
    }

    const auto dir = workload_dir_ / timestamp;
    std::error_code ec;
    if (!fs::create_directory(dir, ec)) {
        if (!ec) {
            logger_->error("Generation directory {} already exists", dir.string());
            return make_error_code(Errc::busy);
        }
        logger_->error("Cannot create {}: {}", dir.string(), ec.message());
        return ec;
    }

    if (auto journal_ec = journal_.append(JournalRecordType::Created, make_event(timestamp))) {
        logger_->error("Cannot journal generation {}: {}", timestamp, journal_ec.message());
        std::error_code rm_ec;
        fs::remove_all(dir, rm_ec);
        return journal_ec;
    }

    entries_[timestamp] = Entry{};
    out = make_generation(timestamp, entries_[timestamp]);
    logger_->info("Created generation {}", out.path.string());
    return {};
}

// ── seal ─────────────────────────────────────────────────────────────────────

std::error_code GenerationStore::seal(Generation& generation) {
    auto it = entries_.find(generation.timestamp);
    if (it == entries_.end() || it->second.pruned) {
        return make_error_code(Errc::not_found);
    }
    if (it->second.sealed) {
        generation.sealed = true;
        return {};
    }
    if (!generation.metadata_recorded) {
        logger_->error("Refusing to seal {}: metadata not recorded", generation.timestamp);
        return make_error_code(Errc::incomplete_metadata);
    }
    if (!generation.transfer_recorded) {
        logger_->error("Refusing to seal {}: transfer not recorded", generation.timestamp);
        return make_error_code(Errc::transfer_failed);
    }

    if (auto ec = journal_.append(JournalRecordType::Sealed, make_event(generation.timestamp))) {
        logger_->error("Cannot journal seal of {}: {}", generation.timestamp, ec.message());
        return ec;
    }
    it->second.sealed = true;
    generation.sealed = true;
    logger_->info("Sealed generation {}", generation.timestamp);
    return {};
}

// ── latest / advance_latest ──────────────────────────────────────────────────

std::optional<Generation> GenerationStore::latest() const {
    if (!latest_) {
        return std::nullopt;
    }
    return make_generation(*latest_, entries_.at(*latest_));
}

std::error_code GenerationStore::advance_latest(const Generation& generation) {
    auto it = entries_.find(generation.timestamp);
    if (it == entries_.end() || !it->second.sealed || it->second.pruned) {
        logger_->error("Refusing to point LATEST at unsealed generation {}",
                       generation.timestamp);
        return std::make_error_code(std::errc::operation_not_permitted);
    }

    LatestPointer pointer;
    pointer.set_workload(workload_);
    pointer.set_timestamp(generation.timestamp);
    pointer.set_advanced_at_unix(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());

    if (auto ec = LatestPointerFile::save(workload_dir_ / LatestPointerFile::kFilename, pointer)) {
        return ec;
    }
    latest_ = generation.timestamp;
    logger_->info("LATEST -> {}", generation.timestamp);
    return {};
}

// ── list / find ──────────────────────────────────────────────────────────────

std::vector<Generation> GenerationStore::list() const {
    std::vector<Generation> result;
    for (const auto& [timestamp, entry] : entries_) {
        if (!entry.pruned) {
            result.push_back(make_generation(timestamp, entry));
        }
    }

    // Directories nobody journaled (a crash between mkdir and append).
    std::error_code ec;
    for (const auto& dirent : fs::directory_iterator(workload_dir_, ec)) {
        const auto name = dirent.path().filename().string();
        if (!dirent.is_directory() || !is_timestamp_token(name) || entries_.count(name)) {
            continue;
        }
        Generation orphan = make_generation(name, Entry{});
        orphan.orphan = true;
        result.push_back(std::move(orphan));
    }
    if (ec) {
        logger_->warn("Cannot scan {}: {}", workload_dir_.string(), ec.message());
    }

    std::sort(result.begin(), result.end(),
              [](const Generation& a, const Generation& b) { return a.timestamp > b.timestamp; });
    return result;
}

std::optional<Generation> GenerationStore::find(const std::string& timestamp) const {
    auto it = entries_.find(timestamp);
    if (it == entries_.end() || it->second.pruned) {
        return std::nullopt;
    }
    return make_generation(timestamp, it->second);
}

// ── remove ───────────────────────────────────────────────────────────────────

std::error_code GenerationStore::remove(const Generation& generation) {
    if (latest_ && *latest_ == generation.timestamp) {
        logger_->error("Refusing to remove generation {} behind LATEST", generation.timestamp);
        return std::make_error_code(std::errc::operation_not_permitted);
    }

    std::error_code ec;
    for (const auto& archive : archives_for(generation.timestamp)) {
        fs::remove(archive, ec);
        if (ec) {
            logger_->error("Cannot delete archive {}: {}", archive.string(), ec.message());
            return ec;
        }
    }

    fs::remove_all(workload_dir_ / generation.timestamp, ec);
    if (ec) {
        logger_->error("Cannot delete generation {}: {}", generation.timestamp, ec.message());
        return ec;
    }

    auto it = entries_.find(generation.timestamp);
    if (it != entries_.end()) {
        if (auto journal_ec = journal_.append(JournalRecordType::Pruned,
                                              make_event(generation.timestamp))) {
            logger_->error("Cannot journal removal of {}: {}",
                           generation.timestamp, journal_ec.message());
            return journal_ec;
        }
        it->second.pruned = true;
    }
    logger_->info("Removed generation {}", generation.timestamp);
    return {};
}

// ── archives ─────────────────────────────────────────────────────────────────

fs::path GenerationStore::archive_path(const std::string& timestamp,
                                       const std::string& extension) const {
    return archive_dir() / (workload_ + "_" + timestamp + extension);
}

std::vector<fs::path> GenerationStore::archives_for(const std::string& timestamp) const {
    std::vector<fs::path> result;
    const std::string prefix = workload_ + "_" + timestamp + ".tar";
    std::error_code ec;
    for (const auto& dirent : fs::directory_iterator(archive_dir(), ec)) {
        const auto name = dirent.path().filename().string();
        if (dirent.is_regular_file() && name.rfind(prefix, 0) == 0 &&
            name.find(".tmp") == std::string::npos) {
            result.push_back(dirent.path());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ── helpers ──────────────────────────────────────────────────────────────────

Generation GenerationStore::make_generation(const std::string& timestamp,
                                            const Entry& entry) const {
    Generation g;
    g.workload  = workload_;
    g.timestamp = timestamp;
    g.path      = workload_dir_ / timestamp;
    g.sealed    = entry.sealed;
    return g;
}

GenerationEvent GenerationStore::make_event(const std::string& timestamp) const {
    GenerationEvent event;
    event.set_workload(workload_);
    event.set_timestamp(timestamp);
    event.set_recorded_at_unix(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    return event;
}

} // namespace cvault::persistence
