#pragma once

#include <algorithm>
#include <cstddef>
#include <expected>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include "merkle/common.hpp"
#include "merkle/error.hpp"
#include "merkle/hasher.hpp"
#include "merkle/log.hpp"
#include "merkle/tree.hpp"

namespace Arbor::Merkle {

template <TreeHasher H>
class TreeBuilder {
public:
    explicit TreeBuilder(H hasher)
        : hasher_(std::move(hasher))
    {
    }

    [[nodiscard]] const H& hasher() const noexcept { return hasher_; }

    // Pairs adjacent digests left to right. An unpaired last digest is promoted
    // to the next level unchanged (never duplicated or hashed with itself).
    [[nodiscard]]
    std::expected<Tree, std::error_code> build(std::span<const std::vector<Byte>> blocks) const;

private:
    H hasher_;
};

template <TreeHasher H>
std::expected<Tree, std::error_code> TreeBuilder<H>::build(std::span<const std::vector<Byte>> blocks) const
{
    auto log = Log::get(Log::kBuilder);

    if (blocks.empty()) {
        log->debug("refusing to build a tree from zero blocks");
        return std::unexpected(make_error_code(Error::EmptyInput));
    }

    std::vector<LevelRange> levels = detail::plan_levels(blocks.size());
    const LevelRange& top = levels.back();

    // 第一个叶子的摘要长度决定整棵树的摘要长度
    Digest first = hasher_.hash_leaf(blocks[0]);
    const size_t digest_size = first.size();
    if (digest_size == 0) {
        return std::unexpected(make_error_code(Error::InconsistentDigestSize));
    }

    std::vector<Byte> arena((top.offset + top.width) * digest_size);

    auto slot = [&](size_t level, size_t pos) {
        return arena.data() + ((levels[level].offset + pos) * digest_size);
    };

    auto store = [&](size_t level, size_t pos, const Digest& d) {
        if (d.size() != digest_size) {
            return false;
        }
        std::ranges::copy(d, slot(level, pos));
        return true;
    };

    // 1. 叶子层 (带前缀哈希)
    std::ranges::copy(first, slot(0, 0));
    for (size_t i = 1; i < blocks.size(); ++i) {
        if (!store(0, i, hasher_.hash_leaf(blocks[i]))) {
            return std::unexpected(make_error_code(Error::InconsistentDigestSize));
        }
    }

    // 2. 逐层向上两两合并
    for (size_t level = 1; level < levels.size(); ++level) {
        const size_t below = levels[level - 1].width;

        for (size_t pos = 0; pos < levels[level].width; ++pos) {
            const size_t left = 2 * pos;

            if (left + 1 < below) {
                Digest node = hasher_.hash_node(
                    BytesSpan(slot(level - 1, left), digest_size),
                    BytesSpan(slot(level - 1, left + 1), digest_size));
                if (!store(level, pos, node)) {
                    return std::unexpected(make_error_code(Error::InconsistentDigestSize));
                }
            } else {
                // 奇数个节点: 末尾节点原样提升
                std::copy_n(slot(level - 1, left), digest_size, slot(level, pos));
            }
        }
    }

    Tree tree(std::vector<std::vector<Byte>>(blocks.begin(), blocks.end()),
        std::move(arena),
        std::move(levels),
        digest_size);

    if (log->should_log(spdlog::level::debug)) {
        log->debug("built tree: leaves={} height={} root={}",
            tree.leaf_count(), tree.height(), to_hex(*tree.root()));
    }
    return tree;
}

} // namespace Arbor::Merkle
