#include "merkle/tree.hpp"
#include "merkle/error.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace Arbor::Merkle {

namespace detail {

    std::vector<LevelRange> plan_levels(size_t leaf_count)
    {
        std::vector<LevelRange> levels;
        if (leaf_count == 0) {
            return levels;
        }

        size_t offset = 0;
        size_t width = leaf_count;
        for (;;) {
            levels.push_back(LevelRange { .offset = offset, .width = width });
            if (width == 1) {
                break;
            }
            offset += width;
            width = (width + 1) / 2;
        }
        return levels;
    }

} // namespace detail

Tree::Tree(std::vector<std::vector<Byte>> blocks,
    std::vector<Byte> arena,
    std::vector<LevelRange> levels,
    size_t digest_size)
    : blocks_(std::move(blocks))
    , arena_(std::move(arena))
    , levels_(std::move(levels))
    , digest_size_(digest_size)
{
}

BytesSpan Tree::digest_at(size_t level, size_t pos) const
{
    const LevelRange& range = levels_.at(level);
    if (pos >= range.width) {
        throw std::out_of_range("Merkle level position out of range");
    }
    return BytesSpan(arena_).subspan((range.offset + pos) * digest_size_, digest_size_);
}

std::expected<Digest, std::error_code> Tree::root() const
{
    if (levels_.empty()) {
        return std::unexpected(make_error_code(Error::EmptyInput));
    }
    BytesSpan top = digest_at(levels_.size() - 1, 0);
    return Digest(top.begin(), top.end());
}

std::expected<Digest, std::error_code> Tree::leaf_digest(size_t index) const
{
    if (index >= leaf_count()) {
        return std::unexpected(make_error_code(Error::IndexOutOfRange));
    }
    BytesSpan d = digest_at(0, index);
    return Digest(d.begin(), d.end());
}

std::expected<LeafView, std::error_code> Tree::leaf(size_t index) const
{
    if (index >= leaf_count()) {
        return std::unexpected(make_error_code(Error::IndexOutOfRange));
    }
    return LeafView { .index = index, .data = blocks_[index], .digest = digest_at(0, index) };
}

std::optional<size_t> Tree::find_leaf(BytesSpan value) const
{
    auto it = std::ranges::find_if(blocks_, [value](const std::vector<Byte>& block) {
        return std::ranges::equal(block, value);
    });
    if (it == blocks_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - blocks_.begin());
}

} // namespace Arbor::Merkle
