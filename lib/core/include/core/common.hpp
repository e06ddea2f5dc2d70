#pragma once

#include "crypto/common.hpp"
#include "crypto/hash.hpp"

namespace Nebula::Reconstruct {

using Crypto::Byte;
using Crypto::BytesSpan;
using Crypto::Digest;
using Crypto::HashAlgorithm;

/// Index of a shard within the erasure-coded object, in [0, n)
using ShardIndex = int;

} // namespace Nebula::Reconstruct
