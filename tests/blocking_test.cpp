#include "command/blocking.hpp"

#include "test_support.hpp"

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace memkv::command {

using testing_support::RecordingClient;

// ── Fixture ───────────────────────────────────────────────────────────────────

class BlockingRegistryTest : public ::testing::Test {
protected:
    BlockingRegistryTest() : keyspace_(clock_) {}

    std::shared_ptr<RecordingClient> client(uint64_t id) {
        return std::make_shared<RecordingClient>(id);
    }

    void push(const std::string& key, std::vector<std::string> items) {
        auto& list = keyspace_.find_or_create_as<ListValue>(key);
        for (auto& item : items) {
            list.push_back(std::move(item));
        }
        registry_.signal_key_ready(key);
    }

    MockClock        clock_;
    Keyspace         keyspace_;
    BlockingRegistry registry_;
};

// ── Serving ───────────────────────────────────────────────────────────────────

TEST_F(BlockingRegistryTest, SignalWithoutWaitersIsIgnored) {
    push("q", {"a"});
    EXPECT_FALSE(registry_.has_ready_keys());
}

TEST_F(BlockingRegistryTest, EarliestWaiterIsServedFirst) {
    auto first = client(1);
    auto second = client(2);
    registry_.block(first, {"q"}, 0, ListEnd::Head);
    registry_.block(second, {"q"}, 0, ListEnd::Head);

    push("q", {"a"});
    EXPECT_EQ(registry_.serve_ready_keys(keyspace_), 1u);
    ASSERT_EQ(first->delivered.size(), 1u);
    EXPECT_EQ(first->delivered[0], reply::bulk_array({"q", "a"}));
    EXPECT_TRUE(second->delivered.empty());
    EXPECT_TRUE(registry_.is_blocked(2));
    EXPECT_FALSE(keyspace_.exists("q"));
}

TEST_F(BlockingRegistryTest, OnePushCanServeSeveralWaiters) {
    auto first = client(1);
    auto second = client(2);
    registry_.block(first, {"q"}, 0, ListEnd::Head);
    registry_.block(second, {"q"}, 0, ListEnd::Tail);

    push("q", {"a", "b", "c"});
    EXPECT_EQ(registry_.serve_ready_keys(keyspace_), 2u);
    EXPECT_EQ(first->delivered[0], reply::bulk_array({"q", "a"}));
    EXPECT_EQ(second->delivered[0], reply::bulk_array({"q", "c"}));
    EXPECT_EQ(registry_.blocked_count(), 0u);
    EXPECT_EQ(keyspace_.find_as<ListValue>("q")->size(), 1u);
}

TEST_F(BlockingRegistryTest, ClientWaitingOnManyKeysIsServedOnce) {
    auto c = client(1);
    registry_.block(c, {"a", "b", "a"}, 0, ListEnd::Head);

    push("b", {"x"});
    push("a", {"y"});
    EXPECT_EQ(registry_.serve_ready_keys(keyspace_), 1u);
    ASSERT_EQ(c->delivered.size(), 1u);
    EXPECT_EQ(c->delivered[0], reply::bulk_array({"b", "x"}));
    EXPECT_TRUE(keyspace_.exists("a"));
}

TEST_F(BlockingRegistryTest, ReadyKeyHoldingOtherTypeServesNobody) {
    auto c = client(1);
    registry_.block(c, {"q"}, 0, ListEnd::Head);
    keyspace_.set("q", StringValue{"v"});
    registry_.signal_key_ready("q");
    EXPECT_EQ(registry_.serve_ready_keys(keyspace_), 0u);
    EXPECT_TRUE(registry_.is_blocked(1));
}

TEST_F(BlockingRegistryTest, DeadClientIsSkipped) {
    auto gone = client(1);
    auto alive = client(2);
    registry_.block(gone, {"q"}, 0, ListEnd::Head);
    registry_.block(alive, {"q"}, 0, ListEnd::Head);
    gone.reset();

    push("q", {"a"});
    EXPECT_EQ(registry_.serve_ready_keys(keyspace_), 1u);
    EXPECT_EQ(alive->delivered[0], reply::bulk_array({"q", "a"}));
}

// ── Cancel / timeouts ─────────────────────────────────────────────────────────

TEST_F(BlockingRegistryTest, CancelRemovesWaiter) {
    auto c = client(1);
    registry_.block(c, {"q"}, 0, ListEnd::Head);
    registry_.cancel(1);
    EXPECT_FALSE(registry_.is_blocked(1));

    push("q", {"a"});
    EXPECT_FALSE(registry_.has_ready_keys());
    EXPECT_TRUE(c->delivered.empty());
}

TEST_F(BlockingRegistryTest, TimeoutsFireInArrivalOrder) {
    std::vector<uint64_t> order;
    struct OrderedClient final : Client {
        OrderedClient(uint64_t id, std::vector<uint64_t>& log) : id_(id), log_(log) {}
        uint64_t id() const noexcept override { return id_; }
        void deliver(Reply) override { log_.push_back(id_); }
        uint64_t id_;
        std::vector<uint64_t>& log_;
    };

    const int64_t now = clock_.now_ms();
    auto c3 = std::make_shared<OrderedClient>(3, order);
    auto c1 = std::make_shared<OrderedClient>(1, order);
    auto c2 = std::make_shared<OrderedClient>(2, order);
    registry_.block(c3, {"q"}, now + 100, ListEnd::Head);
    registry_.block(c1, {"q"}, now + 100, ListEnd::Head);
    registry_.block(c2, {"q"}, 0, ListEnd::Head);

    EXPECT_EQ(registry_.expire_timeouts(now + 99), 0u);
    EXPECT_EQ(registry_.expire_timeouts(now + 100), 2u);
    EXPECT_EQ(order, (std::vector<uint64_t>{3, 1}));
    EXPECT_TRUE(registry_.is_blocked(2));
}

TEST_F(BlockingRegistryTest, TimedOutClientGetsNilArray) {
    auto c = client(1);
    registry_.block(c, {"q"}, clock_.now_ms() + 10, ListEnd::Tail);
    registry_.expire_timeouts(clock_.now_ms() + 10);
    ASSERT_EQ(c->delivered.size(), 1u);
    EXPECT_EQ(c->delivered[0], reply::nil_array());
    EXPECT_EQ(registry_.blocked_count(), 0u);
}

} // namespace memkv::command
