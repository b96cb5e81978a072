#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <system_error>
#include <vector>

#include "merkle/common.hpp"
#include "merkle/tree.hpp"

namespace Arbor::Merkle {

// Which side of the running hash the sibling sits on when recombining upward.
enum class Side : std::uint8_t {
    Left = 0,
    Right = 1
};

struct ProofNode {
    Digest digest;
    Side side;

    bool operator==(const ProofNode&) const = default;
};

// Everything needed to check one leaf against a trusted root, without the Tree.
struct Proof {
    size_t leaf_index;
    std::vector<Byte> leaf_data;
    Digest leaf_digest;
    std::vector<ProofNode> path; // 自底向上，不含根

    bool operator==(const Proof&) const = default;
};

// Levels where the node was promoted contribute no ProofNode.
[[nodiscard]]
std::expected<Proof, std::error_code> generate_proof(const Tree& tree, size_t leaf_index);

// Proves the first leaf whose data equals `value`; Error::LeafNotFound otherwise.
[[nodiscard]]
std::expected<Proof, std::error_code> generate_proof_for(const Tree& tree, BytesSpan value);

} // namespace Arbor::Merkle
