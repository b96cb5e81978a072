#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <system_error>
#include <vector>

#include "merkle/common.hpp"
#include "merkle/hasher.hpp"

namespace Arbor::Merkle {

// One horizontal slice of the tree, addressed in digests within the arena.
struct LevelRange {
    size_t offset;
    size_t width;
};

struct LeafView {
    size_t index;
    BytesSpan data;
    BytesSpan digest;
};

template <TreeHasher H>
class TreeBuilder;

namespace detail {
    struct LevelAccess;

    // Level widths for `leaf_count` leaves: w[0] = n, w[i+1] = ceil(w[i] / 2), last = 1.
    std::vector<LevelRange> plan_levels(size_t leaf_count);
}

// Read-only once built. A default-constructed (or moved-from) Tree is empty:
// it has no root and every root-dependent query fails with Error::EmptyInput.
class Tree {
public:
    Tree() = default;

    [[nodiscard]] std::expected<Digest, std::error_code> root() const;

    [[nodiscard]] size_t leaf_count() const noexcept { return blocks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return levels_.empty(); }

    // 层数，叶子层为第 0 层；单叶子树高度为 1
    [[nodiscard]] size_t height() const noexcept { return levels_.size(); }
    [[nodiscard]] size_t digest_size() const noexcept { return digest_size_; }

    [[nodiscard]] std::expected<Digest, std::error_code> leaf_digest(size_t index) const;
    [[nodiscard]] std::expected<LeafView, std::error_code> leaf(size_t index) const;

    // Original blocks, in input order.
    [[nodiscard]] const std::vector<std::vector<Byte>>& leaves() const noexcept { return blocks_; }

    // Index of the first leaf whose data equals `value`.
    [[nodiscard]] std::optional<size_t> find_leaf(BytesSpan value) const;

private:
    template <TreeHasher H>
    friend class TreeBuilder;
    friend struct detail::LevelAccess;

    Tree(std::vector<std::vector<Byte>> blocks,
        std::vector<Byte> arena,
        std::vector<LevelRange> levels,
        size_t digest_size);

    [[nodiscard]] BytesSpan digest_at(size_t level, size_t pos) const;

    std::vector<std::vector<Byte>> blocks_;
    // 所有层的摘要连续存放，层 i 占 [offset, offset + width) 个摘要
    std::vector<Byte> arena_;
    std::vector<LevelRange> levels_;
    size_t digest_size_ = 0;
};

namespace detail {

    // Level storage is not part of the consumer surface; proof generation and
    // white-box tests reach it through here.
    struct LevelAccess {
        [[nodiscard]] static size_t width(const Tree& tree, size_t level)
        {
            return tree.levels_.at(level).width;
        }

        [[nodiscard]] static BytesSpan digest_at(const Tree& tree, size_t level, size_t pos)
        {
            return tree.digest_at(level, pos);
        }
    };

} // namespace detail

} // namespace Arbor::Merkle
