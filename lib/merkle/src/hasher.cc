#include "merkle/hasher.hpp"
#include "merkle/error.hpp"
#include "merkle/log.hpp"

#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <utility>

namespace Arbor::Merkle {

namespace {

    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
        decltype([](EVP_MD_CTX* ctx) {
            EVP_MD_CTX_free(ctx);
        })>;

    [[noreturn]] void primitive_failure(const char* step)
    {
        Log::get(Log::kHasher)->critical("EVP {} failed: {}", step, ERR_error_string(ERR_get_error(), nullptr));
        throw std::system_error(make_error_code(Error::HashPrimitiveUnavailable), step);
    }

} // namespace

std::expected<EvpHasher, std::error_code> EvpHasher::create(const HasherConfig& config)
{
    EVP_MD* fetched = EVP_MD_fetch(nullptr, config.digest.c_str(), nullptr);
    if (fetched == nullptr) {
        Log::get(Log::kHasher)->critical("digest '{}' is not available", config.digest);
        return std::unexpected(make_error_code(Error::HashPrimitiveUnavailable));
    }
    std::shared_ptr<EVP_MD> md(fetched, [](EVP_MD* p) { EVP_MD_free(p); });

    int size = EVP_MD_get_size(md.get());
    if (size <= 0) {
        // XOF 类算法 (如 SHAKE) 没有固定输出长度
        Log::get(Log::kHasher)->critical("digest '{}' has no fixed output length", config.digest);
        return std::unexpected(make_error_code(Error::HashPrimitiveUnavailable));
    }

    return EvpHasher(std::move(md), static_cast<size_t>(size), config.digest);
}

Digest EvpHasher::hash_leaf(BytesSpan data) const
{
    return digest({ BytesSpan(&LEAF_PREFIX, 1), data });
}

Digest EvpHasher::hash_node(BytesSpan left, BytesSpan right) const
{
    return digest({ BytesSpan(&NODE_PREFIX, 1), left, right });
}

Digest EvpHasher::digest(std::initializer_list<BytesSpan> parts) const
{
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        primitive_failure("MD_CTX_new");
    }

    if (1 != EVP_DigestInit_ex(ctx.get(), md_.get(), nullptr)) {
        primitive_failure("DigestInit");
    }

    for (BytesSpan part : parts) {
        if (1 != EVP_DigestUpdate(ctx.get(), part.data(), part.size())) {
            primitive_failure("DigestUpdate");
        }
    }

    Digest out(digest_size_);
    unsigned int len = 0;
    if (1 != EVP_DigestFinal_ex(ctx.get(), out.data(), &len)) {
        primitive_failure("DigestFinal");
    }
    out.resize(len);
    return out;
}

} // namespace Arbor::Merkle
