#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Arbor::Merkle {

enum class Error : std::uint8_t {
    Success = 0,
    EmptyInput, // 零个叶子，无法产生根
    IndexOutOfRange, // 叶子下标越界
    LeafDigestMismatch, // Proof 内的叶子哈希与数据不符
    HashPrimitiveUnavailable, // 摘要算法不可用 (致命)
    InconsistentDigestSize, // 哈希器返回的摘要长度不一致
    LeafNotFound, // 按值查找叶子失败
    MalformedEncoding, // 序列化数据损坏
    RootMismatch // 反序列化后重建的根与记录不符
};

class MerkleErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "ArborMerkle"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EmptyInput:
            return "Cannot build a Merkle tree from zero blocks";
        case Error::IndexOutOfRange:
            return "Leaf index is out of range";
        case Error::LeafDigestMismatch:
            return "Proof leaf digest does not match its leaf data";
        case Error::HashPrimitiveUnavailable:
            return "Hash primitive is unavailable";
        case Error::InconsistentDigestSize:
            return "Hasher produced digests of differing length";
        case Error::LeafNotFound:
            return "No leaf holds the requested value";
        case Error::MalformedEncoding:
            return "Encoded data is malformed";
        case Error::RootMismatch:
            return "Rebuilt root does not match the encoded root";
        default:
            return "Unknown Merkle error";
        }
    }
};

inline const std::error_category& merkle_category()
{
    static MerkleErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), merkle_category() };
}

} // namespace Arbor::Merkle

namespace std {
template <>
struct is_error_code_enum<Arbor::Merkle::Error> : true_type { };
} // namespace std
