#include "core/error.hpp"
#include "core/shard_verifier.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace Nebula::Reconstruct {

using namespace Testing;

class ShardVerifierTest : public ::testing::Test {
protected:
    Encoded object = encode_object(to_bytes("The quick brown fox jumps over the lazy"), 3, 5);
    Manifest manifest = parse_or_throw(manifest_doc(object));
    MemoryStore store { object };
};

// Test 1: every shard fetched and matching its declared hash
TEST_F(ShardVerifierTest, AllValid)
{
    auto records = verify_shards(manifest, store);
    ASSERT_EQ(records.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        const auto& r = records[i];
        EXPECT_EQ(r.index, i);
        EXPECT_TRUE(r.valid());
        EXPECT_TRUE(r.fetched());
        EXPECT_FALSE(r.error);
        EXPECT_EQ(*r.bytes, object.shards[i]);
        EXPECT_EQ(*r.computed_hash, r.declared_hash);
        EXPECT_EQ(r.locator, shard_path(i));
    }
    EXPECT_EQ(valid_indices(records), (std::set<ShardIndex> { 0, 1, 2, 3, 4 }));
    EXPECT_EQ(store.calls(), 5);
}

// Test 2: a corrupted shard is kept but flagged
TEST_F(ShardVerifierTest, TamperedShard)
{
    store.tamper(2, 5);
    auto records = verify_shards(manifest, store);

    EXPECT_EQ(records[2].status, ShardStatus::HashMismatch);
    EXPECT_EQ(records[2].error, ShardErrc::HashMismatch);
    EXPECT_TRUE(records[2].fetched());
    EXPECT_NE(*records[2].computed_hash, records[2].declared_hash);
    EXPECT_EQ(valid_indices(records), (std::set<ShardIndex> { 0, 1, 3, 4 }));
}

// Test 3: the source's own error code is preserved
TEST_F(ShardVerifierTest, MissingShard)
{
    store.remove(4);
    auto records = verify_shards(manifest, store);

    EXPECT_EQ(records[4].status, ShardStatus::FetchError);
    EXPECT_EQ(records[4].error, std::errc::no_such_file_or_directory);
    EXPECT_FALSE(records[4].fetched());
    EXPECT_FALSE(records[4].computed_hash.has_value());
}

// Test 4: an exception from the fetcher becomes a fetch error
TEST_F(ShardVerifierTest, ThrowingFetcher)
{
    FetchFn fetch = [&](const ShardRef& ref, std::stop_token stop) -> FetchResult {
        if (ref.index == 1)
            throw std::runtime_error("connection reset");
        return store.fetch(ref, stop);
    };

    auto records = verify_shards(manifest, fetch);
    EXPECT_EQ(records[1].status, ShardStatus::FetchError);
    EXPECT_EQ(records[1].error, ShardErrc::FetchFailed);
    EXPECT_EQ(valid_indices(records).size(), 4u);
}

// Test 5: once k valid shards are out of reach the rest are abandoned
TEST_F(ShardVerifierTest, FailFastCancelsRemaining)
{
    store.remove(0);
    store.remove(1);
    store.remove(2);

    auto records = verify_shards(manifest, store, { .max_workers = 1, .fail_fast = true });
    EXPECT_EQ(store.calls(), 3);
    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(records[i].status, ShardStatus::FetchError);
    for (int i = 3; i < 5; ++i) {
        EXPECT_EQ(records[i].status, ShardStatus::Unfetched);
        EXPECT_EQ(records[i].error, ShardErrc::Cancelled);
    }
}

// Test 6: without fail-fast every shard is attempted
TEST_F(ShardVerifierTest, NoFailFastFetchesAll)
{
    store.remove(0);
    store.remove(1);
    store.remove(2);

    auto records = verify_shards(manifest, store, { .max_workers = 1 });
    EXPECT_EQ(store.calls(), 5);
    EXPECT_EQ(valid_indices(records), (std::set<ShardIndex> { 3, 4 }));
}

// Test 7: failures within tolerance never stop the pool
TEST_F(ShardVerifierTest, ToleratedFailuresDoNotCancel)
{
    store.remove(0);
    store.remove(3);

    auto records = verify_shards(manifest, store, { .max_workers = 1 });
    EXPECT_EQ(store.calls(), 5);
    EXPECT_EQ(valid_indices(records), (std::set<ShardIndex> { 1, 2, 4 }));
}

// Test 8: records follow declaration order, not index order
TEST_F(ShardVerifierTest, DeclarationOrder)
{
    std::string shards = "[";
    for (int i : { 3, 1, 4, 0, 2 }) {
        if (shards.size() > 1)
            shards += ",";
        shards += "{\"index\":" + std::to_string(i) + ",\"hash\":\"" + hex(sha256(object.shards[i]))
            + "\",\"path\":\"" + shard_path(i) + "\"}";
    }
    shards += "]";
    auto shuffled = parse_or_throw(manifest_doc(object, false).set("shards", shards));

    auto records = verify_shards(shuffled, store, { .max_workers = 4 });
    std::vector<ShardIndex> order;
    for (const auto& r : records) {
        order.push_back(r.index);
        EXPECT_TRUE(r.valid());
    }
    EXPECT_EQ(order, (std::vector<ShardIndex> { 3, 1, 4, 0, 2 }));
}

// Test 9: many workers over a larger object
TEST_F(ShardVerifierTest, ParallelWorkers)
{
    auto big = encode_object(random_bytes(64 * 1024, 7), 10, 16);
    auto m = parse_or_throw(manifest_doc(big));
    MemoryStore big_store(big);
    big_store.tamper(5);
    big_store.remove(11);

    auto records = verify_shards(m, big_store, { .max_workers = 8 });
    EXPECT_EQ(big_store.calls(), 16);
    EXPECT_EQ(valid_indices(records).size(), 14u);
    EXPECT_EQ(records[5].status, ShardStatus::HashMismatch);
    EXPECT_EQ(records[11].status, ShardStatus::FetchError);
}

// Test 10: a throw of something other than std::exception is still contained
TEST_F(ShardVerifierTest, NonStandardException)
{
    FetchFn fetch = [&](const ShardRef& ref, std::stop_token stop) -> FetchResult {
        if (ref.index == 3)
            throw 42;
        return store.fetch(ref, stop);
    };

    auto records = verify_shards(manifest, fetch, { .max_workers = 2 });
    EXPECT_EQ(records[3].status, ShardStatus::FetchError);
    EXPECT_EQ(records[3].error, ShardErrc::FetchFailed);
    EXPECT_EQ(valid_indices(records), (std::set<ShardIndex> { 0, 1, 2, 4 }));
}

// Test 11: the abort returns while a fetch that ignores the stop token is still blocked
TEST_F(ShardVerifierTest, AbortDoesNotWaitForInFlightFetch)
{
    struct Gate {
        std::mutex mutex;
        std::condition_variable cv;
        bool blocked_entered = false;
        bool open = false;
        int active = 0;
    };
    auto gate = std::make_shared<Gate>();

    // Shards 0..2 fail once shard 3 is inside its fetch, so the abort always
    // happens with shard 3 in flight. Shard 3 waits for the gate regardless
    // of the stop token. Only the gate is captured, so a late call on a
    // detached worker touches nothing the test owns.
    FetchFn fetch = [gate](const ShardRef& ref, std::stop_token) -> FetchResult {
        std::unique_lock<std::mutex> lock(gate->mutex);
        ++gate->active;
        if (ref.index == 3) {
            gate->blocked_entered = true;
            gate->cv.notify_all();
            gate->cv.wait(lock, [&] { return gate->open; });
        } else if (ref.index < 3) {
            gate->cv.wait(lock, [&] { return gate->blocked_entered; });
        }
        --gate->active;
        gate->cv.notify_all();
        return std::unexpected(std::make_error_code(std::errc::connection_refused));
    };

    auto pending = std::async(std::launch::async, [&] {
        return verify_shards(manifest, fetch, { .max_workers = 4, .fail_fast = true });
    });
    const bool returned_while_blocked = pending.wait_for(std::chrono::seconds(10)) == std::future_status::ready;

    {
        std::lock_guard<std::mutex> lock(gate->mutex);
        gate->open = true;
    }
    gate->cv.notify_all();
    EXPECT_TRUE(returned_while_blocked);

    auto records = pending.get();
    ASSERT_EQ(records.size(), 5u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(records[i].status, ShardStatus::FetchError);
        EXPECT_EQ(records[i].error, std::errc::connection_refused);
    }
    EXPECT_EQ(records[3].status, ShardStatus::Unfetched);
    EXPECT_EQ(records[3].error, ShardErrc::Cancelled);

    // The blocked fetch completes on its own once released.
    std::unique_lock<std::mutex> lock(gate->mutex);
    EXPECT_TRUE(gate->cv.wait_for(lock, std::chrono::seconds(10), [&] { return gate->active == 0; }));
}

TEST(ShardStatusTest, Names)
{
    EXPECT_EQ(to_string(ShardStatus::Unfetched), "unfetched");
    EXPECT_EQ(to_string(ShardStatus::Valid), "valid");
    EXPECT_EQ(to_string(ShardStatus::HashMismatch), "hash_mismatch");
    EXPECT_EQ(to_string(ShardStatus::FetchError), "fetch_error");
}

} // namespace Nebula::Reconstruct
