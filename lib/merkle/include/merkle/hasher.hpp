#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include "merkle/common.hpp"

struct evp_md_st;

namespace Arbor::Merkle {

// 域分离前缀: 叶子与内部节点的哈希输入互不重叠
inline constexpr Byte LEAF_PREFIX { 0x00 };
inline constexpr Byte NODE_PREFIX { 0x01 };

// The injected hash capability. hash_leaf must compute H(LEAF_PREFIX || data)
// and hash_node H(NODE_PREFIX || left || right), both with a fixed output length.
template <typename T>
concept TreeHasher = requires(const T& h, BytesSpan data, BytesSpan left, BytesSpan right) {
    { h.hash_leaf(data) } -> std::same_as<Digest>;
    { h.hash_node(left, right) } -> std::same_as<Digest>;
};

struct HasherConfig {
    std::string digest = "SHA256"; // any name OpenSSL can fetch
};

// OpenSSL EVP backed hasher. Immutable after create(); each call uses its own
// EVP_MD_CTX, so one instance can be shared between threads.
class EvpHasher {
public:
    [[nodiscard]]
    static std::expected<EvpHasher, std::error_code> create(const HasherConfig& config = {});

    // Throws std::system_error(Error::HashPrimitiveUnavailable) if OpenSSL fails mid-digest.
    [[nodiscard]] Digest hash_leaf(BytesSpan data) const;
    [[nodiscard]] Digest hash_node(BytesSpan left, BytesSpan right) const;

    [[nodiscard]] size_t digest_size() const noexcept { return digest_size_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    EvpHasher(std::shared_ptr<evp_md_st> md, size_t digest_size, std::string name)
        : md_(std::move(md))
        , digest_size_(digest_size)
        , name_(std::move(name))
    {
    }

    Digest digest(std::initializer_list<BytesSpan> parts) const;

    std::shared_ptr<evp_md_st> md_;
    size_t digest_size_;
    std::string name_;
};

static_assert(TreeHasher<EvpHasher>);

} // namespace Arbor::Merkle
