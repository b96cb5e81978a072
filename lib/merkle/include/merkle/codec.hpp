#pragma once

#include <expected>
#include <system_error>
#include <vector>

#include "merkle/builder.hpp"
#include "merkle/common.hpp"
#include "merkle/error.hpp"
#include "merkle/hasher.hpp"
#include "merkle/log.hpp"
#include "merkle/proof.hpp"
#include "merkle/tree.hpp"

namespace Arbor::Merkle {

// Byte layouts (all integers little-endian):
//
//   proof: u64 leaf_index | u32 len, leaf data | u32 digest_size, leaf digest
//          | u32 node_count | node_count x (u8 side, digest_size bytes)
//   tree:  u64 leaf_count | leaf_count x (u32 len, data) | u32 digest_size, root
//
// A tree is persisted as its blocks plus its root; decoding rebuilds the levels.

[[nodiscard]]
std::expected<std::vector<Byte>, std::error_code> encode_proof(const Proof& proof);

[[nodiscard]]
std::expected<Proof, std::error_code> decode_proof(BytesSpan encoded);

[[nodiscard]]
std::expected<std::vector<Byte>, std::error_code> encode_tree(const Tree& tree);

namespace detail {
    struct TreeImage {
        std::vector<std::vector<Byte>> blocks;
        Digest root;
    };

    std::expected<TreeImage, std::error_code> parse_tree(BytesSpan encoded);
}

// Fails with Error::RootMismatch if the rebuilt root differs from the encoded one.
template <TreeHasher H>
[[nodiscard]] std::expected<Tree, std::error_code> decode_tree(const H& hasher, BytesSpan encoded)
{
    auto image = detail::parse_tree(encoded);
    if (!image) {
        return std::unexpected(image.error());
    }

    auto tree = TreeBuilder<H>(hasher).build(image->blocks);
    if (!tree) {
        return std::unexpected(tree.error());
    }

    if (*tree->root() != image->root) {
        Log::get(Log::kCodec)->warn("decoded tree root {} does not match encoded root {}",
            to_hex(*tree->root()), to_hex(image->root));
        return std::unexpected(make_error_code(Error::RootMismatch));
    }
    return tree;
}

} // namespace Arbor::Merkle
