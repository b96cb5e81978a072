#include "merkle/codec.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace Arbor::Merkle {

namespace {

    // --- Little-endian helpers ---
    void put_u32_le(std::vector<Byte>& out, uint32_t val)
    {
        for (int shift = 0; shift < 32; shift += 8) {
            out.push_back(static_cast<Byte>(val >> shift));
        }
    }

    void put_u64_le(std::vector<Byte>& out, uint64_t val)
    {
        for (int shift = 0; shift < 64; shift += 8) {
            out.push_back(static_cast<Byte>(val >> shift));
        }
    }

    bool fits_u32(size_t n)
    {
        return n <= std::numeric_limits<uint32_t>::max();
    }

    void put_bytes(std::vector<Byte>& out, BytesSpan bytes)
    {
        out.insert(out.end(), bytes.begin(), bytes.end());
    }

    // 顺序读取，任何越界读取都会使 reader 进入失败状态
    class Reader {
    public:
        explicit Reader(BytesSpan buf)
            : buf_(buf)
        {
        }

        bool ok() const { return ok_; }
        bool done() const { return ok_ && pos_ == buf_.size(); }
        size_t remaining() const { return buf_.size() - pos_; }

        uint64_t u64()
        {
            uint64_t val = 0;
            if (!need(8)) {
                return 0;
            }
            for (int i = 0; i < 8; ++i) {
                val |= static_cast<uint64_t>(buf_[pos_ + i]) << (8 * i);
            }
            pos_ += 8;
            return val;
        }

        uint32_t u32()
        {
            uint32_t val = 0;
            if (!need(4)) {
                return 0;
            }
            for (int i = 0; i < 4; ++i) {
                val |= static_cast<uint32_t>(buf_[pos_ + i]) << (8 * i);
            }
            pos_ += 4;
            return val;
        }

        Byte u8()
        {
            if (!need(1)) {
                return 0;
            }
            return buf_[pos_++];
        }

        std::vector<Byte> bytes(size_t n)
        {
            if (!need(n)) {
                return {};
            }
            std::vector<Byte> out(buf_.begin() + pos_, buf_.begin() + pos_ + n);
            pos_ += n;
            return out;
        }

    private:
        bool need(size_t n)
        {
            if (!ok_ || remaining() < n) {
                ok_ = false;
            }
            return ok_;
        }

        BytesSpan buf_;
        size_t pos_ = 0;
        bool ok_ = true;
    };

    std::error_code malformed(const char* what)
    {
        Log::get(Log::kCodec)->warn("rejecting encoding: {}", what);
        return make_error_code(Error::MalformedEncoding);
    }

} // namespace

std::expected<std::vector<Byte>, std::error_code> encode_proof(const Proof& proof)
{
    const size_t digest_size = proof.leaf_digest.size();

    if (!fits_u32(proof.leaf_data.size()) || !fits_u32(digest_size) || !fits_u32(proof.path.size())) {
        return std::unexpected(std::make_error_code(std::errc::file_too_large));
    }
    for (const auto& node : proof.path) {
        if (node.digest.size() != digest_size) {
            return std::unexpected(make_error_code(Error::InconsistentDigestSize));
        }
    }

    std::vector<Byte> out;
    out.reserve(8 + 4 + proof.leaf_data.size() + 4 + digest_size + 4 + proof.path.size() * (1 + digest_size));

    put_u64_le(out, proof.leaf_index);
    put_u32_le(out, static_cast<uint32_t>(proof.leaf_data.size()));
    put_bytes(out, proof.leaf_data);
    put_u32_le(out, static_cast<uint32_t>(digest_size));
    put_bytes(out, proof.leaf_digest);
    put_u32_le(out, static_cast<uint32_t>(proof.path.size()));
    for (const auto& node : proof.path) {
        out.push_back(static_cast<Byte>(node.side));
        put_bytes(out, node.digest);
    }
    return out;
}

std::expected<Proof, std::error_code> decode_proof(BytesSpan encoded)
{
    Reader in(encoded);

    const uint64_t leaf_index = in.u64();
    std::vector<Byte> leaf_data = in.bytes(in.u32());
    const uint32_t digest_size = in.u32();
    Digest leaf_digest = in.bytes(digest_size);
    const uint32_t node_count = in.u32();
    if (!in.ok()) {
        return std::unexpected(malformed("truncated proof header"));
    }

    // 先检查长度再分配，防止伪造的 node_count 触发巨量分配
    if (static_cast<uint64_t>(node_count) * (1 + static_cast<uint64_t>(digest_size)) != in.remaining()) {
        return std::unexpected(malformed("proof path length does not match remaining bytes"));
    }

    std::vector<ProofNode> path;
    path.reserve(node_count);
    for (uint32_t i = 0; i < node_count; ++i) {
        const Byte side = in.u8();
        if (side > static_cast<Byte>(Side::Right)) {
            return std::unexpected(malformed("unknown side tag"));
        }
        path.push_back(ProofNode { .digest = in.bytes(digest_size), .side = static_cast<Side>(side) });
    }
    if (!in.done()) {
        return std::unexpected(malformed("trailing bytes after proof"));
    }

    return Proof {
        .leaf_index = static_cast<size_t>(leaf_index),
        .leaf_data = std::move(leaf_data),
        .leaf_digest = std::move(leaf_digest),
        .path = std::move(path)
    };
}

std::expected<std::vector<Byte>, std::error_code> encode_tree(const Tree& tree)
{
    auto root = tree.root();
    if (!root) {
        return std::unexpected(root.error());
    }

    std::vector<Byte> out;
    put_u64_le(out, tree.leaf_count());
    for (const auto& block : tree.leaves()) {
        if (!fits_u32(block.size())) {
            return std::unexpected(std::make_error_code(std::errc::file_too_large));
        }
        put_u32_le(out, static_cast<uint32_t>(block.size()));
        put_bytes(out, block);
    }
    put_u32_le(out, static_cast<uint32_t>(root->size()));
    put_bytes(out, *root);
    return out;
}

namespace detail {

    std::expected<TreeImage, std::error_code> parse_tree(BytesSpan encoded)
    {
        Reader in(encoded);

        const uint64_t leaf_count = in.u64();
        // 每个叶子至少占 4 字节长度前缀
        if (!in.ok() || leaf_count > in.remaining() / 4) {
            return std::unexpected(malformed("implausible leaf count"));
        }

        TreeImage image;
        image.blocks.reserve(static_cast<size_t>(leaf_count));
        for (uint64_t i = 0; i < leaf_count; ++i) {
            image.blocks.push_back(in.bytes(in.u32()));
            if (!in.ok()) {
                return std::unexpected(malformed("truncated leaf block"));
            }
        }

        image.root = in.bytes(in.u32());
        if (!in.done()) {
            return std::unexpected(malformed("bad root field or trailing bytes"));
        }
        return image;
    }

} // namespace detail

} // namespace Arbor::Merkle
