#include "storage/keyspace.hpp"
#include "storage/glob.hpp"

#include "common/clock.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace memkv {

using namespace std::chrono_literals;

// ── Fixture ───────────────────────────────────────────────────────────────────

class KeyspaceTest : public ::testing::Test {
protected:
    KeyspaceTest() : ks_(clock_) {}

    int64_t in(std::chrono::milliseconds ms) const { return clock_.now_ms() + ms.count(); }

    MockClock clock_;
    Keyspace  ks_;
};

// ── set / lookup / del ────────────────────────────────────────────────────────

TEST_F(KeyspaceTest, LookupReturnsNullForMissingKey) {
    EXPECT_EQ(ks_.lookup("nope"), nullptr);
    EXPECT_FALSE(ks_.exists("nope"));
    EXPECT_FALSE(ks_.type_of("nope").has_value());
}

TEST_F(KeyspaceTest, SetReplacesValueAndType) {
    ks_.set("k", StringValue{"v"});
    EXPECT_EQ(ks_.type_of("k"), ValueType::String);

    ks_.set("k", ListValue{"a"});
    EXPECT_EQ(ks_.type_of("k"), ValueType::List);
    EXPECT_EQ(ks_.size(), 1u);
}

TEST_F(KeyspaceTest, DelReportsWhetherKeyExisted) {
    ks_.set("k", StringValue{"v"});
    EXPECT_TRUE(ks_.del("k"));
    EXPECT_FALSE(ks_.del("k"));
    EXPECT_EQ(ks_.size(), 0u);
}

// ── typed access ──────────────────────────────────────────────────────────────

TEST_F(KeyspaceTest, FindAsThrowsWrongTypeOnMismatch) {
    ks_.set("k", StringValue{"v"});
    try {
        (void)ks_.find_as<ListValue>("k");
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WrongType);
        EXPECT_EQ(e.reply_text(),
                  "WRONGTYPE Operation against a key holding the wrong kind of value");
    }
}

TEST_F(KeyspaceTest, FindOrCreateAsCreatesEmptyContainer) {
    auto& set = ks_.find_or_create_as<SetValue>("s");
    EXPECT_TRUE(set.empty());
    set.insert("m");
    EXPECT_EQ(ks_.find_as<SetValue>("s")->size(), 1u);
}

TEST_F(KeyspaceTest, RemoveIfEmptyOnlyRemovesEmptyContainers) {
    ks_.set("str", StringValue{});
    ks_.set("list", ListValue{});
    EXPECT_FALSE(ks_.remove_if_empty("str"));
    EXPECT_TRUE(ks_.remove_if_empty("list"));
    EXPECT_TRUE(ks_.exists("str"));
    EXPECT_FALSE(ks_.exists("list"));
}

// ── expiration ────────────────────────────────────────────────────────────────

TEST_F(KeyspaceTest, KeyDisappearsOnceDeadlinePasses) {
    ks_.set("k", StringValue{"v"});
    ASSERT_TRUE(ks_.set_expire("k", in(100ms)));

    clock_.advance(99ms);
    EXPECT_TRUE(ks_.exists("k"));

    clock_.advance(1ms);
    EXPECT_FALSE(ks_.exists("k"));
    EXPECT_EQ(ks_.expires_size(), 0u);
    EXPECT_EQ(ks_.expired_keys(), 1u);
}

TEST_F(KeyspaceTest, SetExpireOnMissingKeyFails) {
    EXPECT_FALSE(ks_.set_expire("missing", in(100ms)));
}

TEST_F(KeyspaceTest, PastDeadlineDeletesImmediately) {
    ks_.set("k", StringValue{"v"});
    EXPECT_TRUE(ks_.set_expire("k", clock_.now_ms() - 1));
    EXPECT_EQ(ks_.size(), 0u);
    EXPECT_EQ(ks_.expired_keys(), 0u);
}

TEST_F(KeyspaceTest, SetClearsExpiryButSetKeepTtlPreservesIt) {
    ks_.set("a", StringValue{"1"});
    ks_.set("b", StringValue{"1"});
    ASSERT_TRUE(ks_.set_expire("a", in(1s)));
    ASSERT_TRUE(ks_.set_expire("b", in(1s)));

    ks_.set("a", StringValue{"2"});
    ks_.set_keep_ttl("b", StringValue{"2"});

    EXPECT_EQ(ks_.ttl_ms("a"), -1);
    EXPECT_EQ(ks_.ttl_ms("b"), 1000);
}

TEST_F(KeyspaceTest, TtlReportsMissingAndPersistentKeys) {
    EXPECT_EQ(ks_.ttl_ms("missing"), -2);
    ks_.set("k", StringValue{"v"});
    EXPECT_EQ(ks_.ttl_ms("k"), -1);
    ASSERT_TRUE(ks_.set_expire("k", in(2500ms)));
    clock_.advance(500ms);
    EXPECT_EQ(ks_.ttl_ms("k"), 2000);
}

TEST_F(KeyspaceTest, ClearExpireMakesKeyPersistent) {
    ks_.set("k", StringValue{"v"});
    EXPECT_FALSE(ks_.clear_expire("k"));
    ASSERT_TRUE(ks_.set_expire("k", in(10ms)));
    EXPECT_TRUE(ks_.clear_expire("k"));
    clock_.advance(1s);
    EXPECT_TRUE(ks_.exists("k"));
}

TEST_F(KeyspaceTest, ActiveExpireCycleReclaimsUnreadKeys) {
    for (int i = 0; i < 100; ++i) {
        const std::string key = "k" + std::to_string(i);
        ks_.set(key, StringValue{"v"});
        ASSERT_TRUE(ks_.set_expire(key, in(10ms)));
    }
    ks_.set("forever", StringValue{"v"});
    clock_.advance(20ms);

    std::size_t evicted = 0;
    for (int round = 0; round < 100 && ks_.expires_size() > 0; ++round) {
        evicted += ks_.active_expire_cycle(20);
    }
    EXPECT_EQ(evicted, 100u);
    EXPECT_EQ(ks_.size(), 1u);
    EXPECT_EQ(ks_.expired_keys(), 100u);
}

TEST_F(KeyspaceTest, ActiveExpireCycleLeavesLiveKeysAlone) {
    ks_.set("k", StringValue{"v"});
    ASSERT_TRUE(ks_.set_expire("k", in(1s)));
    EXPECT_EQ(ks_.active_expire_cycle(20), 0u);
    EXPECT_TRUE(ks_.exists("k"));
}

// ── keyspace-wide operations ──────────────────────────────────────────────────

TEST_F(KeyspaceTest, RenameCarriesExpiry) {
    ks_.set("src", StringValue{"v"});
    ASSERT_TRUE(ks_.set_expire("src", in(1s)));
    ks_.set("dst", ListValue{"x"});

    ASSERT_TRUE(ks_.rename("src", "dst"));
    EXPECT_FALSE(ks_.exists("src"));
    EXPECT_EQ(*ks_.find_as<StringValue>("dst"), "v");
    EXPECT_EQ(ks_.ttl_ms("dst"), 1000);
    EXPECT_FALSE(ks_.rename("src", "other"));
}

TEST_F(KeyspaceTest, KeysMatchesGlobPatternsAndSkipsExpired) {
    ks_.set("hello", StringValue{});
    ks_.set("hallo", StringValue{});
    ks_.set("hxllo", StringValue{});
    ks_.set("world", StringValue{});
    ks_.set("gone", StringValue{});
    ASSERT_TRUE(ks_.set_expire("gone", in(1ms)));
    clock_.advance(5ms);

    auto matched = ks_.keys("h[ae]llo");
    std::sort(matched.begin(), matched.end());
    EXPECT_EQ(matched, (std::vector<std::string>{"hallo", "hello"}));

    EXPECT_EQ(ks_.keys("h?llo").size(), 3u);
    EXPECT_EQ(ks_.keys("*").size(), 4u);
    EXPECT_EQ(ks_.size(), 4u);
}

TEST_F(KeyspaceTest, KeysMatchesBinaryKeysOnTheirFullLength) {
    const std::string binary("a\0zz", 4);
    ks_.set(binary, StringValue{"v"});
    ks_.set("a", StringValue{"v"});

    EXPECT_EQ(ks_.keys("a"), (std::vector<std::string>{"a"}));
    EXPECT_EQ(ks_.keys(std::string("a\0*", 3)), (std::vector<std::string>{binary}));
    EXPECT_EQ(ks_.keys("a?zz"), (std::vector<std::string>{binary}));
}

// ── glob_match ────────────────────────────────────────────────────────────────

TEST(GlobMatchTest, StarsAndQuestionMarks) {
    EXPECT_TRUE(glob_match("*", ""));
    EXPECT_TRUE(glob_match("user:*", "user:42"));
    EXPECT_TRUE(glob_match("*:*:end", "a:b:c:end"));
    EXPECT_TRUE(glob_match("h?llo", "hello"));
    EXPECT_FALSE(glob_match("h?llo", "hllo"));
    EXPECT_FALSE(glob_match("user:*", "users:1"));
    EXPECT_TRUE(glob_match("**a**", "bab"));
}

TEST(GlobMatchTest, SetsRangesAndNegation) {
    EXPECT_TRUE(glob_match("h[ae]llo", "hallo"));
    EXPECT_FALSE(glob_match("h[ae]llo", "hillo"));
    EXPECT_TRUE(glob_match("h[^e]llo", "hallo"));
    EXPECT_FALSE(glob_match("h[^e]llo", "hello"));
    EXPECT_TRUE(glob_match("k[0-9]", "k7"));
    EXPECT_TRUE(glob_match("k[9-0]", "k7"));
    EXPECT_FALSE(glob_match("k[0-9]", "kx"));
}

TEST(GlobMatchTest, EscapesMatchLiterally) {
    EXPECT_TRUE(glob_match("a\\*b", "a*b"));
    EXPECT_FALSE(glob_match("a\\*b", "axb"));
    EXPECT_TRUE(glob_match("[\\]]", "]"));
    EXPECT_TRUE(glob_match("q\\?", "q?"));
}

TEST(GlobMatchTest, NulBytesAreOrdinaryBytes) {
    const std::string key("a\0zz", 4);
    EXPECT_FALSE(glob_match("a", key));
    EXPECT_TRUE(glob_match("a*", key));
    EXPECT_TRUE(glob_match(std::string("a\0zz", 4), key));
    EXPECT_FALSE(glob_match(std::string("a\0z", 3), key));
}

TEST_F(KeyspaceTest, RandomKeyNeverReturnsExpiredKey) {
    EXPECT_FALSE(ks_.random_key().has_value());
    ks_.set("dead", StringValue{});
    ASSERT_TRUE(ks_.set_expire("dead", in(1ms)));
    ks_.set("alive", StringValue{});
    clock_.advance(2ms);

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(ks_.random_key(), std::optional<std::string>{"alive"});
    }
}

// ── persistence collaborator ──────────────────────────────────────────────────

TEST_F(KeyspaceTest, ForEachEntrySkipsExpiredKeys) {
    ks_.set("a", StringValue{"1"});
    ks_.set("b", StringValue{"2"});
    ASSERT_TRUE(ks_.set_expire("b", in(1ms)));
    ks_.set("c", StringValue{"3"});
    ASSERT_TRUE(ks_.set_expire("c", in(1h)));
    clock_.advance(2ms);

    std::vector<std::string> seen;
    ks_.for_each_entry([&](const std::string& key, const Value&, std::optional<int64_t> when) {
        seen.push_back(key);
        if (key == "c") {
            EXPECT_TRUE(when.has_value());
        } else {
            EXPECT_FALSE(when.has_value());
        }
    });
    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "c"}));
}

TEST_F(KeyspaceTest, RestoreDropsAlreadyExpiredEntries) {
    EXPECT_FALSE(ks_.restore("old", StringValue{"v"}, clock_.now_ms() - 1));
    EXPECT_TRUE(ks_.restore("new", StringValue{"v"}, in(1s)));
    EXPECT_TRUE(ks_.restore("plain", StringValue{"v"}, std::nullopt));
    EXPECT_EQ(ks_.size(), 2u);
    EXPECT_EQ(ks_.ttl_ms("new"), 1000);
}

TEST_F(KeyspaceTest, ClearEmptiesBothTables) {
    ks_.set("a", StringValue{"1"});
    ASSERT_TRUE(ks_.set_expire("a", in(1s)));
    ks_.clear();
    EXPECT_EQ(ks_.size(), 0u);
    EXPECT_EQ(ks_.expires_size(), 0u);
}

} // namespace memkv
