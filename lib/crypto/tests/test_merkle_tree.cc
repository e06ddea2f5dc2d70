#include "crypto/error.hpp"
#include "crypto/merkle_tree.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <cctype>
#include <utility>

namespace Nebula::Crypto::MerkleTree {

class MerkleTreeTest : public ::testing::Test {
protected:
    std::vector<Digest> leaves;

    void SetUp() override
    {
        for (const char* s : { "shard_0", "shard_1", "shard_2", "shard_3", "shard_4" })
            leaves.push_back(sha256(to_bytes(s)));
    }

    static Digest concat_hash(const Digest& l, const Digest& r)
    {
        std::vector<Byte> buf(l.begin(), l.end());
        buf.insert(buf.end(), r.begin(), r.end());
        return sha256(buf);
    }

    Digest root_of(size_t count)
    {
        auto r = compute_root(HashAlgorithm::Sha256, std::span<const Digest>(leaves.data(), count));
        EXPECT_TRUE(r.has_value());
        return r.value_or(Digest {});
    }
};

// Test 1: no leaves give the empty sentinel
TEST_F(MerkleTreeTest, Empty)
{
    auto root = compute_root(HashAlgorithm::Sha256, std::span<const Digest> {});
    ASSERT_TRUE(root.has_value());
    EXPECT_TRUE(root->empty());

    auto hex_root = compute_root_hex(HashAlgorithm::Sha256, std::span<const std::string> {});
    ASSERT_TRUE(hex_root.has_value());
    EXPECT_EQ(*hex_root, "");
}

// Test 2: a single leaf is its own root, without re-hashing
TEST_F(MerkleTreeTest, SingleLeaf)
{
    EXPECT_EQ(root_of(1), leaves[0]);
}

// Test 3: two leaves hash their concatenated bytes
TEST_F(MerkleTreeTest, TwoLeaves)
{
    EXPECT_EQ(root_of(2), concat_hash(leaves[0], leaves[1]));
}

// Test 4: an odd layer duplicates its last node
TEST_F(MerkleTreeTest, OddNumberOfLeaves)
{
    auto left = concat_hash(leaves[0], leaves[1]);
    auto right = concat_hash(leaves[2], leaves[2]);
    EXPECT_EQ(root_of(3), concat_hash(left, right));

    // Five leaves: 5 -> 3 -> 2 -> 1
    auto l1_0 = concat_hash(leaves[0], leaves[1]);
    auto l1_1 = concat_hash(leaves[2], leaves[3]);
    auto l1_2 = concat_hash(leaves[4], leaves[4]);
    auto l2_0 = concat_hash(l1_0, l1_1);
    auto l2_1 = concat_hash(l1_2, l1_2);
    EXPECT_EQ(root_of(5), concat_hash(l2_0, l2_1));
}

// Test 5: deterministic, and leaf order matters
TEST_F(MerkleTreeTest, OrderSensitive)
{
    auto first = root_of(4);
    EXPECT_EQ(first, root_of(4));

    std::swap(leaves[0], leaves[1]);
    EXPECT_NE(root_of(4), first);
}

// Test 6: the hex form agrees with the byte form and accepts either case
TEST_F(MerkleTreeTest, HexForm)
{
    std::vector<std::string> hex_leaves;
    for (const auto& l : leaves)
        hex_leaves.push_back(Utils::to_hex(l));
    for (char& c : hex_leaves[2])
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    auto hex_root = compute_root_hex(HashAlgorithm::Sha256, hex_leaves);
    ASSERT_TRUE(hex_root.has_value());
    EXPECT_EQ(*hex_root, Utils::to_hex(root_of(5)));
}

// Test 7: malformed hex leaves are rejected
TEST_F(MerkleTreeTest, BadHexLeaf)
{
    std::vector<std::string> hex_leaves = { Utils::to_hex(leaves[0]), "not-hex" };
    auto r = compute_root_hex(HashAlgorithm::Sha256, hex_leaves);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), DigestErrc::InvalidHex);
}

} // namespace Nebula::Crypto::MerkleTree
