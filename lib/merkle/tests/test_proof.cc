#include "merkle/error.hpp"
#include "merkle/proof.hpp"
#include "merkle_test_utils.hpp"
#include <gtest/gtest.h>

namespace Arbor::Merkle {

class ProofGeneratorTest : public ::testing::Test {
protected:
    EvpHasher hasher = sha256_hasher();

    Digest H(std::string_view s) const { return hasher.hash_leaf(to_bytes(s)); }
    Digest N(const Digest& l, const Digest& r) const { return hasher.hash_node(l, r); }
};

TEST_F(ProofGeneratorTest, SingleLeafHasEmptyPath)
{
    auto tree = build_or_throw(hasher, { to_bytes("only") });

    auto proof = generate_proof(tree, 0);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(proof->path.empty());
    EXPECT_EQ(proof->leaf_index, 0U);
    EXPECT_EQ(proof->leaf_data, to_bytes("only"));
    EXPECT_EQ(proof->leaf_digest, H("only"));
}

// [a, b, c]: c 在第 0 层被提升，只在第 1 层有一个左兄弟
TEST_F(ProofGeneratorTest, PromotedLeafSkipsLevel)
{
    auto tree = build_or_throw(hasher, { to_bytes("a"), to_bytes("b"), to_bytes("c") });

    auto proof = generate_proof(tree, 2);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->path.size(), 1U);
    EXPECT_EQ(proof->path[0].digest, N(H("a"), H("b")));
    EXPECT_EQ(proof->path[0].side, Side::Left);
}

TEST_F(ProofGeneratorTest, PairedLeafInOddTree)
{
    auto tree = build_or_throw(hasher, { to_bytes("a"), to_bytes("b"), to_bytes("c") });

    auto proof = generate_proof(tree, 0);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->path.size(), 2U);
    EXPECT_EQ(proof->path[0], (ProofNode { .digest = H("b"), .side = Side::Right }));
    EXPECT_EQ(proof->path[1], (ProofNode { .digest = H("c"), .side = Side::Right }));
}

TEST_F(ProofGeneratorTest, PowerOfTwoSides)
{
    auto blocks = make_blocks(8);
    auto tree = build_or_throw(hasher, blocks);

    // 下标 5 = 0b101: 右孩子, 左孩子, 右孩子
    auto proof = generate_proof(tree, 5);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->path.size(), 3U);
    EXPECT_EQ(proof->path[0].side, Side::Left);
    EXPECT_EQ(proof->path[1].side, Side::Right);
    EXPECT_EQ(proof->path[2].side, Side::Left);
    EXPECT_EQ(proof->path[0].digest, hasher.hash_leaf(blocks[4]));
    EXPECT_EQ(proof->path[1].digest, level_digest(tree, 1, 3));
    EXPECT_EQ(proof->path[2].digest, level_digest(tree, 2, 0));
}

TEST_F(ProofGeneratorTest, Deterministic)
{
    auto tree = build_or_throw(hasher, make_blocks(11));

    for (size_t i = 0; i < tree.leaf_count(); ++i) {
        EXPECT_EQ(*generate_proof(tree, i), *generate_proof(tree, i)) << "index " << i;
    }
}

TEST_F(ProofGeneratorTest, IndexOutOfRange)
{
    auto tree = build_or_throw(hasher, make_blocks(3));

    auto res = generate_proof(tree, 3);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Error::IndexOutOfRange);

    EXPECT_EQ(generate_proof(Tree {}, 0).error(), Error::IndexOutOfRange);
}

TEST_F(ProofGeneratorTest, ProofByValue)
{
    auto blocks = make_blocks(6);
    auto tree = build_or_throw(hasher, blocks);

    auto proof = generate_proof_for(tree, blocks[4]);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->leaf_index, 4U);
    EXPECT_EQ(*proof, *generate_proof(tree, 4));

    auto missing = generate_proof_for(tree, to_bytes("absent"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), Error::LeafNotFound);
}

// Proof 是独立的值，树销毁后仍然可用
TEST_F(ProofGeneratorTest, ProofOutlivesTree)
{
    Proof proof;
    Digest root;
    {
        auto tree = build_or_throw(hasher, make_blocks(4));
        proof = *generate_proof(tree, 1);
        root = *tree.root();
    }
    EXPECT_EQ(proof.leaf_data, to_bytes("leaf_1"));
    EXPECT_EQ(N(N(H("leaf_0"), proof.leaf_digest), proof.path[1].digest), root);
}

} // namespace Arbor::Merkle
