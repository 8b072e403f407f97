#include "persistence/snapshot.hpp"
#include "persistence/crc32.hpp"

#include "common/clock.hpp"
#include "storage/keyspace.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace memkv::persistence {

using namespace std::chrono_literals;

namespace {

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
}

void put_u32(std::vector<uint8_t>& buf, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }
}

// Rewrites the trailing CRC so that edits to the body pass the checksum.
void reseal(std::vector<uint8_t>& bytes) {
    bytes.resize(bytes.size() - 4);
    put_u32(bytes, crc32(bytes.data(), bytes.size()));
}

} // namespace

// ── Fixture ──────────────────────────────────────────────────────────────────

class SnapshotTest : public ::testing::Test {
protected:
    SnapshotTest() : source_(clock_), target_(clock_) {}

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("memkv_snapshot_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        snap_path_ = test_dir_ / Snapshot::kFilename;
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void save_and_reload() {
        auto ec = Snapshot::save(snap_path_, source_);
        ASSERT_FALSE(ec) << ec.message();
        ec = Snapshot::load(snap_path_, target_, result_);
        ASSERT_FALSE(ec) << ec.message();
    }

    MockClock             clock_;
    Keyspace              source_;
    Keyspace              target_;
    SnapshotLoadResult    result_;
    std::filesystem::path test_dir_;
    std::filesystem::path snap_path_;
};

// ── Save / Load ──────────────────────────────────────────────────────────────

TEST_F(SnapshotTest, SaveAndLoadEmpty) {
    save_and_reload();
    EXPECT_EQ(result_.entries_read, 0u);
    EXPECT_EQ(target_.size(), 0u);
    EXPECT_EQ(std::filesystem::file_size(snap_path_), kSnapshotHeaderSize + 4);
}

TEST_F(SnapshotTest, EveryValueTypeSurvives) {
    source_.set("str", StringValue{"hello"});
    source_.set("list", ListValue{"c", "a", "b"});
    source_.set("set", SetValue{"x", "y"});
    auto& z = source_.find_or_create_as<SortedSet>("zset");
    z.insert_or_update("low", -1.25);
    z.insert_or_update("high", std::numeric_limits<double>::infinity());

    save_and_reload();
    EXPECT_EQ(result_.entries_read, 4u);
    EXPECT_EQ(result_.entries_loaded, 4u);

    EXPECT_EQ(*target_.find_as<StringValue>("str"), "hello");
    EXPECT_EQ(*target_.find_as<ListValue>("list"), (ListValue{"c", "a", "b"}));
    EXPECT_EQ(*target_.find_as<SetValue>("set"), (SetValue{"x", "y"}));

    const auto* loaded = target_.find_as<SortedSet>("zset");
    ASSERT_NE(loaded, nullptr);
    EXPECT_DOUBLE_EQ(*loaded->score_of("low"), -1.25);
    EXPECT_EQ(*loaded->score_of("high"), std::numeric_limits<double>::infinity());
    EXPECT_EQ(*loaded->rank_of("high"), 1u);
}

TEST_F(SnapshotTest, BinaryKeysAndValues) {
    const std::string key{"k\0\r\n", 4};
    const std::string value{"\xff\x00\x01", 3};
    source_.set(key, StringValue{value});
    save_and_reload();
    EXPECT_EQ(*target_.find_as<StringValue>(key), value);
}

TEST_F(SnapshotTest, ExpireTimesAreAbsolute) {
    source_.set("k", StringValue{"v"});
    ASSERT_TRUE(source_.set_expire("k", clock_.now_ms() + 5000));
    save_and_reload();
    EXPECT_EQ(target_.expire_at("k"), clock_.now_ms() + 5000);
}

TEST_F(SnapshotTest, EntriesExpiredBeforeLoadAreDropped) {
    source_.set("short", StringValue{"v"});
    source_.set("long", StringValue{"v"});
    ASSERT_TRUE(source_.set_expire("short", clock_.now_ms() + 100));
    ASSERT_TRUE(source_.set_expire("long", clock_.now_ms() + 10'000));

    auto ec = Snapshot::save(snap_path_, source_);
    ASSERT_FALSE(ec) << ec.message();

    clock_.advance(1s);
    ec = Snapshot::load(snap_path_, target_, result_);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(result_.entries_read, 2u);
    EXPECT_EQ(result_.entries_loaded, 1u);
    EXPECT_FALSE(target_.exists("short"));
    EXPECT_TRUE(target_.exists("long"));
}

TEST_F(SnapshotTest, ExpiredButUnreclaimedKeysAreNotWritten) {
    source_.set("gone", StringValue{"v"});
    ASSERT_TRUE(source_.set_expire("gone", clock_.now_ms() + 10));
    clock_.advance(20ms);
    save_and_reload();
    EXPECT_EQ(result_.entries_read, 0u);
}

TEST_F(SnapshotTest, LoadOverwritesExistingKeys) {
    source_.set("k", StringValue{"new"});
    target_.set("k", ListValue{"old"});
    target_.set("other", StringValue{"kept"});
    save_and_reload();
    EXPECT_EQ(*target_.find_as<StringValue>("k"), "new");
    EXPECT_TRUE(target_.exists("other"));
}

TEST_F(SnapshotTest, SaveOverwritesPreviousSnapshot) {
    source_.set("a", StringValue{"1"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    source_.clear();
    source_.set("b", StringValue{"2"});
    save_and_reload();
    EXPECT_FALSE(target_.exists("a"));
    EXPECT_TRUE(target_.exists("b"));
}

TEST_F(SnapshotTest, NoTmpFileLeftAfterSave) {
    source_.set("a", StringValue{"1"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    auto tmp = snap_path_;
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST_F(SnapshotTest, ManyEntries) {
    for (int i = 0; i < 5000; ++i) {
        source_.set("key" + std::to_string(i), StringValue{std::to_string(i)});
    }
    save_and_reload();
    EXPECT_EQ(target_.size(), 5000u);
    EXPECT_EQ(*target_.find_as<StringValue>("key4321"), "4321");
}

// ── exists() ─────────────────────────────────────────────────────────────────

TEST_F(SnapshotTest, ExistsTracksFile) {
    EXPECT_FALSE(Snapshot::exists(snap_path_));
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    EXPECT_TRUE(Snapshot::exists(snap_path_));
    EXPECT_FALSE(Snapshot::exists(test_dir_));
}

// ── Binary format ────────────────────────────────────────────────────────────

TEST_F(SnapshotTest, HeaderHasMagicVersionAndCount) {
    source_.set("a", StringValue{"1"});
    source_.set("b", StringValue{"2"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));

    const auto bytes = read_file(snap_path_);
    ASSERT_GE(bytes.size(), kSnapshotHeaderSize + 4);
    EXPECT_EQ(std::memcmp(bytes.data(), kSnapshotMagic, kSnapshotMagicSize), 0);
    EXPECT_EQ(bytes[4] | (bytes[5] << 8), kSnapshotVersion);
    EXPECT_EQ(bytes[6], 2u);
    EXPECT_EQ(bytes[7] | bytes[8] | bytes[9], 0u);
}

TEST_F(SnapshotTest, StringEntryLayout) {
    source_.set("k", StringValue{"vv"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));

    const auto bytes = read_file(snap_path_);
    // type(1) + expire(8) + key(4+1) + value(4+2)
    ASSERT_EQ(bytes.size(), kSnapshotHeaderSize + 20 + 4);
    const uint8_t* entry = bytes.data() + kSnapshotHeaderSize;
    EXPECT_EQ(entry[0], static_cast<uint8_t>(ValueType::String));
    for (int i = 1; i <= 8; ++i) {
        EXPECT_EQ(entry[i], 0xFF) << "expire byte " << i;
    }
    EXPECT_EQ(entry[9], 1u);
    EXPECT_EQ(entry[13], 'k');
    EXPECT_EQ(entry[14], 2u);
    EXPECT_EQ(entry[18], 'v');
}

// ── Corruption ───────────────────────────────────────────────────────────────

TEST_F(SnapshotTest, LoadFailsOnNonexistentFile) {
    EXPECT_TRUE(Snapshot::load(test_dir_ / "missing.mkv", target_, result_));
}

TEST_F(SnapshotTest, LoadFailsOnEmptyFile) {
    write_file(snap_path_, {});
    EXPECT_TRUE(Snapshot::load(snap_path_, target_, result_));
}

TEST_F(SnapshotTest, LoadFailsOnBadMagic) {
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    auto bytes = read_file(snap_path_);
    bytes[0] = 'X';
    reseal(bytes);
    write_file(snap_path_, bytes);
    EXPECT_TRUE(Snapshot::load(snap_path_, target_, result_));
}

TEST_F(SnapshotTest, LoadFailsOnBadVersion) {
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    auto bytes = read_file(snap_path_);
    bytes[4] = 0xFF;
    reseal(bytes);
    write_file(snap_path_, bytes);
    EXPECT_TRUE(Snapshot::load(snap_path_, target_, result_));
}

TEST_F(SnapshotTest, CorruptedDataLeavesKeyspaceUntouched) {
    source_.set("key", StringValue{"value"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    auto bytes = read_file(snap_path_);
    bytes[bytes.size() / 2] ^= 0xFF;
    write_file(snap_path_, bytes);

    EXPECT_TRUE(Snapshot::load(snap_path_, target_, result_));
    EXPECT_EQ(target_.size(), 0u);
}

TEST_F(SnapshotTest, LoadFailsOnTruncatedFile) {
    source_.set("key", StringValue{"value"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    std::filesystem::resize_file(snap_path_, std::filesystem::file_size(snap_path_) / 2);
    EXPECT_TRUE(Snapshot::load(snap_path_, target_, result_));
}

TEST_F(SnapshotTest, LoadRejectsUnknownTypeEvenWithValidCrc) {
    source_.set("k", StringValue{"v"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    auto bytes = read_file(snap_path_);
    bytes[kSnapshotHeaderSize] = 9;
    reseal(bytes);
    write_file(snap_path_, bytes);
    EXPECT_TRUE(Snapshot::load(snap_path_, target_, result_));
    EXPECT_EQ(target_.size(), 0u);
}

TEST_F(SnapshotTest, LoadRejectsTrailingBytes) {
    source_.set("k", StringValue{"v"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    auto bytes = read_file(snap_path_);
    bytes.insert(bytes.end() - 4, uint8_t{0});
    reseal(bytes);
    write_file(snap_path_, bytes);
    EXPECT_TRUE(Snapshot::load(snap_path_, target_, result_));
}

TEST_F(SnapshotTest, LoadRejectsEntryCountBeyondFileSize) {
    source_.set("k", StringValue{"v"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    auto bytes = read_file(snap_path_);
    for (int i = 6; i < 10; ++i) {
        bytes[i] = 0xFF;
    }
    reseal(bytes);
    write_file(snap_path_, bytes);

    std::error_code ec;
    EXPECT_NO_THROW(ec = Snapshot::load(snap_path_, target_, result_));
    EXPECT_EQ(ec, std::make_error_code(std::errc::invalid_argument));
    EXPECT_EQ(target_.size(), 0u);
}

TEST_F(SnapshotTest, LoadRejectsSetCountBeyondFileSize) {
    source_.set("s", SetValue{"m"});
    ASSERT_FALSE(Snapshot::save(snap_path_, source_));
    auto bytes = read_file(snap_path_);
    // type(1) + expire(8) + key(4+1), then the member count.
    const std::size_t count_at = kSnapshotHeaderSize + 14;
    for (std::size_t i = count_at; i < count_at + 4; ++i) {
        bytes[i] = 0xFF;
    }
    reseal(bytes);
    write_file(snap_path_, bytes);

    std::error_code ec;
    EXPECT_NO_THROW(ec = Snapshot::load(snap_path_, target_, result_));
    EXPECT_TRUE(ec);
    EXPECT_EQ(target_.size(), 0u);
}

TEST_F(SnapshotTest, SaveToNonexistentDirectoryFails) {
    EXPECT_TRUE(Snapshot::save(test_dir_ / "no" / "dir" / "dump.mkv", source_));
}

// ── crc32 ────────────────────────────────────────────────────────────────────

TEST(Crc32Test, MatchesKnownCheckValue) {
    const std::string input = "123456789";
    EXPECT_EQ(crc32(reinterpret_cast<const uint8_t*>(input.data()), input.size()),
              0xCBF43926u);
}

} // namespace memkv::persistence
