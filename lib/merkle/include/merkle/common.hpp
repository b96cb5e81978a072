#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Arbor::Merkle {

using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;

// Output of the hash primitive. Length is fixed per hasher, equality is byte-exact.
using Digest = std::vector<Byte>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

// Lowercase hex, used for log lines and test diagnostics.
std::string to_hex(BytesSpan bytes);

} // namespace Arbor::Merkle
