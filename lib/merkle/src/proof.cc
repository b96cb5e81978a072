#include "merkle/proof.hpp"
#include "merkle/error.hpp"

#include <utility>

namespace Arbor::Merkle {

using detail::LevelAccess;

std::expected<Proof, std::error_code> generate_proof(const Tree& tree, size_t leaf_index)
{
    if (leaf_index >= tree.leaf_count()) {
        return std::unexpected(make_error_code(Error::IndexOutOfRange));
    }

    std::vector<ProofNode> path;
    path.reserve(tree.height());

    size_t pos = leaf_index;
    for (size_t level = 0; level + 1 < tree.height(); ++level) {
        const size_t width = LevelAccess::width(tree, level);

        if (pos & 1) {
            // 当前是右孩子，兄弟在左
            BytesSpan sib = LevelAccess::digest_at(tree, level, pos - 1);
            path.push_back(ProofNode { .digest = Digest(sib.begin(), sib.end()), .side = Side::Left });
        } else if (pos + 1 < width) {
            BytesSpan sib = LevelAccess::digest_at(tree, level, pos + 1);
            path.push_back(ProofNode { .digest = Digest(sib.begin(), sib.end()), .side = Side::Right });
        }
        // 否则该节点被原样提升，本层无兄弟

        pos >>= 1;
    }

    BytesSpan data = tree.leaves()[leaf_index];
    BytesSpan digest = LevelAccess::digest_at(tree, 0, leaf_index);

    return Proof {
        .leaf_index = leaf_index,
        .leaf_data = std::vector<Byte>(data.begin(), data.end()),
        .leaf_digest = Digest(digest.begin(), digest.end()),
        .path = std::move(path)
    };
}

std::expected<Proof, std::error_code> generate_proof_for(const Tree& tree, BytesSpan value)
{
    auto index = tree.find_leaf(value);
    if (!index) {
        return std::unexpected(make_error_code(Error::LeafNotFound));
    }
    return generate_proof(tree, *index);
}

} // namespace Arbor::Merkle
