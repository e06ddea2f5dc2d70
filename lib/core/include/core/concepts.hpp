#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <stop_token>
#include <system_error>
#include <vector>

#include "core/common.hpp"
#include "core/manifest.hpp"

namespace Nebula::Reconstruct {

using FetchResult = std::expected<std::vector<Byte>, std::error_code>;

// Retrieves the raw bytes of one shard. Called concurrently from several
// workers; long-running implementations should poll the stop token.
using FetchFn = std::function<FetchResult(const ShardRef&, std::stop_token)>;

template <typename T>
concept ShardSource = requires(T& source, const ShardRef& ref, std::stop_token stop) {
    { source.fetch(ref, stop) } -> std::convertible_to<FetchResult>;
};

// The source must outlive the returned function.
template <ShardSource Source>
[[nodiscard]] FetchFn as_fetch_fn(Source& source)
{
    return [&source](const ShardRef& ref, std::stop_token stop) -> FetchResult {
        return source.fetch(ref, stop);
    };
}

} // namespace Nebula::Reconstruct
