#include "merkle/common.hpp"

namespace Arbor::Merkle {

std::string to_hex(BytesSpan bytes)
{
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(bytes.size() * 2);
    for (Byte b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

} // namespace Arbor::Merkle
