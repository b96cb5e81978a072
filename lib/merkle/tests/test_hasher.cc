#include "merkle/error.hpp"
#include "merkle/hasher.hpp"
#include "merkle_test_utils.hpp"
#include <gtest/gtest.h>
#include <openssl/sha.h>

namespace Arbor::Merkle {

class HasherTest : public ::testing::Test {
protected:
    EvpHasher hasher = sha256_hasher();
};

TEST_F(HasherTest, DefaultIsSha256)
{
    EXPECT_EQ(hasher.name(), "SHA256");
    EXPECT_EQ(hasher.digest_size(), 32U);
    EXPECT_EQ(hasher.hash_leaf(as_span("x")), hasher.hash_leaf(to_bytes("x")));
    EXPECT_EQ(hasher.hash_leaf(as_span("x")).size(), 32U);
}

// RFC 6962 的空叶子哈希: SHA256(0x00)
TEST_F(HasherTest, EmptyLeafKnownAnswer)
{
    EXPECT_EQ(to_hex(hasher.hash_leaf({})),
        "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

// 叶子哈希不应等于数据的直接 SHA256，否则存在第二原像攻击风险
TEST_F(HasherTest, LeafIsDomainSeparated)
{
    auto data = to_bytes("test");

    Digest direct(SHA256_DIGEST_LENGTH);
    SHA256(data.data(), data.size(), direct.data());

    EXPECT_NE(hasher.hash_leaf(data), direct) << "Domain separation is likely missing!";
}

TEST_F(HasherTest, LeafAndNodeNeverCollide)
{
    Digest left = hasher.hash_leaf(to_bytes("a"));
    Digest right = hasher.hash_leaf(to_bytes("b"));

    std::vector<Byte> concat(left);
    concat.insert(concat.end(), right.begin(), right.end());

    EXPECT_NE(hasher.hash_leaf(concat), hasher.hash_node(left, right));
}

TEST_F(HasherTest, NodeMatchesPrefixedConcatenation)
{
    Digest left = hasher.hash_leaf(to_bytes("a"));
    Digest right = hasher.hash_leaf(to_bytes("b"));

    std::vector<Byte> buf { NODE_PREFIX };
    buf.insert(buf.end(), left.begin(), left.end());
    buf.insert(buf.end(), right.begin(), right.end());

    Digest expected(SHA256_DIGEST_LENGTH);
    SHA256(buf.data(), buf.size(), expected.data());

    EXPECT_EQ(hasher.hash_node(left, right), expected);
}

TEST_F(HasherTest, NodeOrderMatters)
{
    Digest left = hasher.hash_leaf(to_bytes("a"));
    Digest right = hasher.hash_leaf(to_bytes("b"));

    EXPECT_NE(hasher.hash_node(left, right), hasher.hash_node(right, left));
}

TEST_F(HasherTest, Deterministic)
{
    EXPECT_EQ(hasher.hash_leaf(to_bytes("same")), hasher.hash_leaf(to_bytes("same")));
}

TEST(HasherCreate, UnknownDigestIsUnavailable)
{
    auto res = EvpHasher::create({ .digest = "NOT-A-REAL-DIGEST" });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Error::HashPrimitiveUnavailable);
}

TEST(HasherCreate, AlternateDigest)
{
    auto res = EvpHasher::create({ .digest = "SHA512" });
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->digest_size(), 64U);
    EXPECT_EQ(res->hash_leaf(to_bytes("x")).size(), 64U);
}

TEST(HasherCreate, ErrorCategoryMessage)
{
    std::error_code ec = Error::HashPrimitiveUnavailable;
    EXPECT_STREQ(ec.category().name(), "ArborMerkle");
    EXPECT_EQ(ec.message(), "Hash primitive is unavailable");
}

} // namespace Arbor::Merkle
