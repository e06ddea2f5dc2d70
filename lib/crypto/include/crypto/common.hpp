#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Nebula::Crypto {
using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;
using MutableBytesSpan = std::span<Byte>;

// Variable length so that further hash algorithms fit without a new type.
using Digest = std::vector<Byte>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

inline BytesSpan as_span(const std::string& s)
{
    return as_span(std::string_view { s });
}
} // namespace Nebula::Crypto
