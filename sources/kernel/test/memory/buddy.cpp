#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "memory/detail/buddy.hpp"

using vsp::detail::BuddyTree;

class BuddyTreeTest : public testing::Test {
public:
    static constexpr size_t kPages = 256;

    void SetUp() override {
        int order = BuddyTree::suitableOrder(kPages);
        size_t roots = kPages >> order;
        storage.resize(BuddyTree::storageSize(roots, order));
        tree = BuddyTree(storage.data(), roots, order);
    }

    std::vector<int8_t> storage;
    BuddyTree tree;
};

TEST(BuddyTreeConstructTest, SuitableOrder) {
    EXPECT_EQ(BuddyTree::suitableOrder(1), 0);
    EXPECT_EQ(BuddyTree::suitableOrder(3), 1);
    EXPECT_EQ(BuddyTree::suitableOrder(64), 6);
    EXPECT_EQ(BuddyTree::suitableOrder(65), 6);
    EXPECT_EQ(BuddyTree::suitableOrder(256), 8);
    EXPECT_EQ(BuddyTree::suitableOrder(1024), BuddyTree::kMaxOrder);
    EXPECT_EQ(BuddyTree::suitableOrder(0x100000), BuddyTree::kMaxOrder);
}

TEST(BuddyTreeConstructTest, StorageSize) {
    EXPECT_EQ(BuddyTree::storageSize(4, 0), 4);
    EXPECT_EQ(BuddyTree::storageSize(4, 2), 4 + 8 + 16);
}

TEST_F(BuddyTreeTest, Construct) {
    EXPECT_EQ(tree.pages(), kPages);
    EXPECT_TRUE(tree.verify());
}

TEST_F(BuddyTreeTest, AllocateEveryPage) {
    std::set<size_t> pages;
    for (size_t i = 0; i < kPages; i++) {
        size_t index = tree.allocate(0);
        ASSERT_NE(index, BuddyTree::kInvalidIndex);
        ASSERT_LT(index, kPages);
        ASSERT_TRUE(pages.insert(index).second) << "Page " << index << " allocated twice";
    }

    EXPECT_EQ(tree.allocate(0), BuddyTree::kInvalidIndex);
    EXPECT_TRUE(tree.verify());

    for (size_t page : pages) {
        tree.free(page, 0);
    }

    EXPECT_TRUE(tree.verify());
}

TEST_F(BuddyTreeTest, AlignedChunks) {
    size_t single = tree.allocate(0);
    ASSERT_NE(single, BuddyTree::kInvalidIndex);

    size_t pair = tree.allocate(1);
    ASSERT_NE(pair, BuddyTree::kInvalidIndex);
    EXPECT_EQ(pair % 2, 0);
    EXPECT_NE(pair, single);

    size_t quad = tree.allocate(2);
    ASSERT_NE(quad, BuddyTree::kInvalidIndex);
    EXPECT_EQ(quad % 4, 0);

    EXPECT_TRUE(tree.verify());
}

TEST_F(BuddyTreeTest, FreeMergesBuddies) {
    size_t lo = tree.allocate(0);
    size_t hi = tree.allocate(0);
    ASSERT_EQ(lo, 0);
    ASSERT_EQ(hi, 1);

    tree.free(lo, 0);
    tree.free(hi, 0);
    EXPECT_TRUE(tree.verify());

    EXPECT_EQ(tree.allocate(tree.order()), 0);
}

TEST_F(BuddyTreeTest, WholeTree) {
    size_t index = tree.allocate(8);
    ASSERT_EQ(index, 0);
    EXPECT_EQ(tree.allocate(0), BuddyTree::kInvalidIndex);

    tree.free(index, 8);
    EXPECT_TRUE(tree.verify());
    EXPECT_NE(tree.allocate(2), BuddyTree::kInvalidIndex);
}

TEST(BuddyTreeConstructTest, ManyRoots) {
    size_t pages = 4096;
    int order = BuddyTree::suitableOrder(pages);
    size_t roots = pages >> order;
    ASSERT_EQ(roots, 4);

    std::vector<int8_t> storage(BuddyTree::storageSize(roots, order));
    BuddyTree tree { storage.data(), roots, order };

    for (size_t i = 0; i < roots; i++) {
        EXPECT_EQ(tree.allocate(order), i << order);
    }

    EXPECT_EQ(tree.allocate(0), BuddyTree::kInvalidIndex);
    EXPECT_TRUE(tree.verify());
}

TEST_F(BuddyTreeTest, OrderTooLarge) {
    EXPECT_EQ(tree.allocate(tree.order() + 1), BuddyTree::kInvalidIndex);
    EXPECT_EQ(tree.allocate(-1), BuddyTree::kInvalidIndex);
}
