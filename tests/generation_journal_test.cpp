#include "persistence/generation_journal.hpp"
#include "common/errors.hpp"
#include "tree_helpers.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace cvault::persistence {

// ── Fixture ──────────────────────────────────────────────────────────────────

class GenerationJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        journal_path_ = dir_.path() / GenerationJournal::kFilename;
    }

    static GenerationEvent event(const std::string& timestamp) {
        GenerationEvent e;
        e.set_workload("web1");
        e.set_timestamp(timestamp);
        e.set_recorded_at_unix(1704067200);
        return e;
    }

    void append_raw_bytes(const std::vector<uint8_t>& bytes) {
        std::ofstream out(journal_path_, std::ios::binary | std::ios::app);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

    test::TempDir dir_{"journal"};
    std::filesystem::path journal_path_;
};

// ── Open / append / replay ───────────────────────────────────────────────────

TEST_F(GenerationJournalTest, OpenCreatesFileWithHeader) {
    GenerationJournal journal(journal_path_);
    auto ec = journal.open();
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(journal.is_open());
    EXPECT_EQ(std::filesystem::file_size(journal_path_), kJournalHeaderSize);
}

TEST_F(GenerationJournalTest, ReplayEmptyJournal) {
    {
        GenerationJournal journal(journal_path_);
        ASSERT_FALSE(journal.open());
    }
    JournalReplayResult result;
    ASSERT_FALSE(GenerationJournal::replay(journal_path_, result));
    EXPECT_TRUE(result.records.empty());
    EXPECT_FALSE(result.torn_tail);
}

TEST_F(GenerationJournalTest, ReplayReturnsRecordsInOrder) {
    {
        GenerationJournal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(JournalRecordType::Created, event("20240101_020000")));
        ASSERT_FALSE(journal.append(JournalRecordType::Sealed, event("20240101_020000")));
        ASSERT_FALSE(journal.append(JournalRecordType::Created, event("20240102_020000")));
    }

    JournalReplayResult result;
    ASSERT_FALSE(GenerationJournal::replay(journal_path_, result));
    ASSERT_EQ(result.records.size(), 3u);
    EXPECT_EQ(result.records[0].type, JournalRecordType::Created);
    EXPECT_EQ(result.records[1].type, JournalRecordType::Sealed);
    EXPECT_EQ(result.records[2].type, JournalRecordType::Created);
    EXPECT_EQ(result.records[2].event.timestamp(), "20240102_020000");
    EXPECT_EQ(result.records[2].event.workload(), "web1");
}

TEST_F(GenerationJournalTest, ReopenAppendsAfterExistingRecords) {
    {
        GenerationJournal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(JournalRecordType::Created, event("20240101_020000")));
    }
    {
        GenerationJournal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(JournalRecordType::Sealed, event("20240101_020000")));
    }
    JournalReplayResult result;
    ASSERT_FALSE(GenerationJournal::replay(journal_path_, result));
    EXPECT_EQ(result.records.size(), 2u);
}

TEST_F(GenerationJournalTest, AppendOnClosedJournalFails) {
    GenerationJournal journal(journal_path_);
    EXPECT_TRUE(journal.append(JournalRecordType::Created, event("20240101_020000")));
}

// ── Crash recovery ───────────────────────────────────────────────────────────

TEST_F(GenerationJournalTest, TornTailIsDroppedAndTruncatedOnOpen) {
    {
        GenerationJournal journal(journal_path_);
        ASSERT_FALSE(journal.open());
        ASSERT_FALSE(journal.append(JournalRecordType::Created, event("20240101_020000")));
    }
    const auto good_size = std::filesystem::file_size(journal_path_);

    auto partial = serialise_record(JournalRecordType::Sealed, event("20240101_020000"));
    partial.resize(partial.size() / 2);
    append_raw_bytes(partial);

    JournalReplayResult result;
    ASSERT_FALSE(GenerationJournal::replay(journal_path_, result));
    EXPECT_TRUE(result.torn_tail);
    EXPECT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.valid_length, good_size);

    GenerationJournal journal(journal_path_);
    ASSERT_FALSE(journal.open());
    EXPECT_EQ(std::filesystem::file_size(journal_path_), good_size);
}

TEST_F(GenerationJournalTest, DamagedRecordFollowedByMoreIsCorrupt) {
    {
        GenerationJournal journal(journal_path_);
        ASSERT_FALSE(journal.open());
    }
    auto first = serialise_record(JournalRecordType::Created, event("20240101_020000"));
    first[first.size() - 1] ^= 0xFF;   // break the CRC
    append_raw_bytes(first);
    append_raw_bytes(serialise_record(JournalRecordType::Sealed, event("20240101_020000")));

    JournalReplayResult result;
    EXPECT_EQ(GenerationJournal::replay(journal_path_, result), Errc::store_corrupt);

    GenerationJournal journal(journal_path_);
    EXPECT_EQ(journal.open(), Errc::store_corrupt);
}

TEST_F(GenerationJournalTest, BadHeaderIsCorrupt) {
    test::write_file(journal_path_, "NOPE\x01\x00");
    JournalReplayResult result;
    EXPECT_EQ(GenerationJournal::replay(journal_path_, result), Errc::store_corrupt);
}

// ── CRC ──────────────────────────────────────────────────────────────────────

TEST(Crc32Test, KnownVector) {
    const std::string s = "123456789";
    EXPECT_EQ(crc32(reinterpret_cast<const uint8_t*>(s.data()), s.size()), 0xCBF43926u);
}

} // namespace cvault::persistence
