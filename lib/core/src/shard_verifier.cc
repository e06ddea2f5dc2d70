#include "core/shard_verifier.hpp"
#include "core/error.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <thread>

namespace Nebula::Reconstruct {

namespace {

    unsigned worker_count(unsigned requested, std::size_t shards)
    {
        unsigned workers = requested != 0 ? requested : std::thread::hardware_concurrency();
        workers = std::max(1u, workers);
        return static_cast<unsigned>(std::min<std::size_t>(workers, shards));
    }

    ShardRecord blank_record(const ShardRef& ref)
    {
        return ShardRecord {
            .index = ref.index,
            .declared_hash = ref.hash,
            .locator = ref.locator,
        };
    }

    FetchResult guarded_fetch(const FetchFn& fetch, const ShardRef& ref, std::stop_token stop)
    {
        try {
            return fetch(ref, stop);
        } catch (const std::exception& e) {
            NEBULA_WARN("shard " << ref.index << ": fetch threw: " << e.what());
        } catch (...) {
            NEBULA_WARN("shard " << ref.index << ": fetch threw a non-standard exception");
        }
        return std::unexpected(make_error_code(ShardErrc::FetchFailed));
    }

    void check_shard(ShardRecord& record, const ShardRef& ref, HashAlgorithm algorithm,
        const FetchFn& fetch, std::stop_token stop)
    {
        auto result = guarded_fetch(fetch, ref, stop);
        if (!result) {
            record.status = ShardStatus::FetchError;
            record.error = result.error();
            NEBULA_DEBUG("shard " << ref.index << ": fetch failed: " << record.error.message());
            return;
        }

        auto computed = Crypto::digest(algorithm, *result);
        if (!computed) {
            record.status = ShardStatus::FetchError;
            record.error = computed.error();
            return;
        }

        record.bytes = std::move(*result);
        record.computed_hash = std::move(*computed);
        if (*record.computed_hash == record.declared_hash) {
            record.status = ShardStatus::Valid;
            NEBULA_TRACE("shard " << ref.index << ": valid, " << record.bytes->size() << " bytes");
        } else {
            record.status = ShardStatus::HashMismatch;
            record.error = make_error_code(ShardErrc::HashMismatch);
            NEBULA_WARN("shard " << ref.index << ": hash mismatch, expected "
                                 << Crypto::Utils::to_hex(record.declared_hash) << " got "
                                 << Crypto::Utils::to_hex(*record.computed_hash));
        }
    }

    // Shared between verify_shards and its workers. After an early abort the
    // caller returns while fetches already in flight finish on their own, so
    // everything they touch lives here.
    struct VerifyState {
        std::vector<ShardRef> refs;
        std::vector<ShardRecord> records;
        FetchFn fetch;
        HashAlgorithm algorithm;
        int k;
        std::size_t tolerated;
        bool fail_fast;

        std::stop_source stop;
        std::atomic<std::size_t> next { 0 };

        std::mutex mutex;
        std::condition_variable changed;
        std::size_t failures = 0; // guarded by mutex
        unsigned running = 0; // guarded by mutex

        void work()
        {
            while (!stop.stop_requested()) {
                const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
                if (i >= refs.size())
                    break;

                ShardRecord record = blank_record(refs[i]);
                check_shard(record, refs[i], algorithm, fetch, stop.get_token());
                settle(i, std::move(record));
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                --running;
            }
            changed.notify_all();
        }

        void settle(std::size_t i, ShardRecord&& record)
        {
            {
                std::lock_guard<std::mutex> lock(mutex);
                const bool valid = record.valid();
                records[i] = std::move(record);
                // More failures than this and k valid shards can no longer be reached.
                if (!valid && ++failures > tolerated && fail_fast && stop.request_stop()) {
                    NEBULA_WARN("only " << refs.size() - failures << " shards can still be valid, k=" << k
                                        << "; abandoning remaining fetches");
                }
            }
            changed.notify_all();
        }
    };

} // namespace

std::string_view to_string(ShardStatus status) noexcept
{
    switch (status) {
    case ShardStatus::Unfetched:
        return "unfetched";
    case ShardStatus::Valid:
        return "valid";
    case ShardStatus::HashMismatch:
        return "hash_mismatch";
    case ShardStatus::FetchError:
        return "fetch_error";
    }
    return "unknown";
}

std::vector<ShardRecord> verify_shards(const Manifest& manifest, const FetchFn& fetch,
    const VerifyOptions& options)
{
    const auto& refs = manifest.shards();
    if (refs.empty())
        return {};

    auto state = std::make_shared<VerifyState>();
    state->refs = refs;
    state->records.reserve(refs.size());
    for (const auto& ref : refs)
        state->records.push_back(blank_record(ref));
    state->fetch = fetch;
    state->algorithm = manifest.hash_algorithm();
    state->k = manifest.rs().k;
    state->tolerated = refs.size() - static_cast<std::size_t>(manifest.rs().k);
    state->fail_fast = options.fail_fast;

    const unsigned workers = worker_count(options.max_workers, refs.size());
    state->running = workers;
    NEBULA_DEBUG("verifying " << refs.size() << " shards on " << workers << " workers");

    unsigned launched = 0;
    for (; launched < workers; ++launched) {
        try {
            std::thread([state] { state->work(); }).detach();
        } catch (const std::system_error& e) {
            NEBULA_WARN("could not start shard worker: " << e.what());
            break;
        }
    }
    if (launched < workers) {
        std::lock_guard<std::mutex> guard(state->mutex);
        state->running -= workers - launched;
        if (launched == 0)
            state->running = 1; // the calling thread does the work itself
    }
    if (launched == 0)
        state->work();

    std::unique_lock<std::mutex> lock(state->mutex);
    state->changed.wait(lock, [&] { return state->running == 0 || state->stop.stop_requested(); });

    std::vector<ShardRecord> records;
    if (state->running == 0) {
        records = std::move(state->records);
    } else {
        // Aborted: slots still being fetched are reported as never fetched.
        records = state->records;
        NEBULA_DEBUG("returning with up to " << state->running << " fetches still in flight");
    }
    lock.unlock();

    for (auto& record : records) {
        if (record.status == ShardStatus::Unfetched)
            record.error = make_error_code(ShardErrc::Cancelled);
    }
    return records;
}

std::set<ShardIndex> valid_indices(std::span<const ShardRecord> records)
{
    std::set<ShardIndex> out;
    for (const auto& r : records) {
        if (r.valid())
            out.insert(r.index);
    }
    return out;
}

} // namespace Nebula::Reconstruct
