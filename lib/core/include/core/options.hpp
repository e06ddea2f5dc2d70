#pragma once

#include <cstdint>
#include <string_view>

#include "core/shard_verifier.hpp"

namespace Nebula::Reconstruct {

enum class IntegrityPolicy : std::uint8_t {
    AllowReduced, // succeed, but report integrity = Reduced
    RequireFull, // fail unless Merkle and final hash both verified
};

[[nodiscard]] std::string_view to_string(IntegrityPolicy policy) noexcept;

struct ReconstructOptions {
    bool verify_final_hash = true;
    IntegrityPolicy integrity_policy = IntegrityPolicy::AllowReduced;
    bool bind_merkle_leaves = true;
    bool fail_fast = false;
    unsigned max_workers = 0; // 0: hardware concurrency

    [[nodiscard]] VerifyOptions verify_options() const noexcept
    {
        return { .max_workers = max_workers, .fail_fast = fail_fast };
    }
};

} // namespace Nebula::Reconstruct
