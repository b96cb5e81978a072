#pragma once

#include <expected>
#include <system_error>
#include <utility>

#include "merkle/common.hpp"
#include "merkle/error.hpp"
#include "merkle/hasher.hpp"
#include "merkle/log.hpp"
#include "merkle/proof.hpp"

namespace Arbor::Merkle {

// 验证不需要 Tree 对象，只需要 Proof 和可信的根
template <TreeHasher H>
class ProofVerifier {
public:
    explicit ProofVerifier(H hasher)
        : hasher_(std::move(hasher))
    {
    }

    // true iff the root recomputed from `proof` equals `trusted_root` byte for byte.
    // Error::LeafDigestMismatch if the proof's leaf digest disagrees with its leaf data.
    [[nodiscard]]
    std::expected<bool, std::error_code> verify(const Proof& proof, const Digest& trusted_root) const;

private:
    H hasher_;
};

template <TreeHasher H>
std::expected<bool, std::error_code> ProofVerifier<H>::verify(const Proof& proof, const Digest& trusted_root) const
{
    // 1. 重新计算叶子哈希，并与 Proof 自带的摘要比对
    Digest acc = hasher_.hash_leaf(proof.leaf_data);
    if (acc != proof.leaf_digest) {
        Log::get(Log::kVerifier)->debug("leaf {}: stored digest does not match leaf data", proof.leaf_index);
        return std::unexpected(make_error_code(Error::LeafDigestMismatch));
    }

    // 2. 沿路径重建根
    for (const auto& node : proof.path) {
        if (node.digest.size() != acc.size()) {
            Log::get(Log::kVerifier)->debug("leaf {}: sibling digest has wrong length {}", proof.leaf_index, node.digest.size());
            return false;
        }
        if (node.side == Side::Right) {
            acc = hasher_.hash_node(acc, node.digest);
        } else if (node.side == Side::Left) {
            acc = hasher_.hash_node(node.digest, acc);
        } else {
            return false;
        }
    }

    // 3. 比较计算出的根与可信根
    if (acc != trusted_root) {
        Log::get(Log::kVerifier)->debug("leaf {}: recomputed root {} != trusted root {}",
            proof.leaf_index, to_hex(acc), to_hex(trusted_root));
        return false;
    }
    return true;
}

} // namespace Arbor::Merkle
