#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "sedit/ecs/registry.hpp"

using namespace sedit::ecs;

class HierarchyTest : public ::testing::Test {
protected:
    void SetUp() override {
        a_ = reg_.CreateEntity("A");
        b_ = reg_.CreateEntity("B");
        c_ = reg_.CreateEntity("C");
        d_ = reg_.CreateEntity("D");
    }

    /// Parent of e lists e exactly once among its children.
    void expectLinked(Entity e) {
        auto siblings = reg_.GetChildren(reg_.GetParent(e));
        EXPECT_EQ(std::count(siblings.begin(), siblings.end(), e), 1);
    }

    Registry reg_;
    Entity a_, b_, c_, d_;
};

// ===========================================================================
// SetParent
// ===========================================================================

TEST_F(HierarchyTest, SetParentMovesBetweenLists) {
    ASSERT_TRUE(reg_.SetParent(b_, a_));

    EXPECT_EQ(reg_.GetParent(b_), a_);
    EXPECT_EQ(reg_.GetChildren(a_), (std::vector<Entity>{b_}));
    EXPECT_EQ(reg_.GetChildren(kNullEntity), (std::vector<Entity>{a_, c_, d_}));
    expectLinked(b_);
}

TEST_F(HierarchyTest, SetParentToRootDetaches) {
    ASSERT_TRUE(reg_.SetParent(b_, a_));
    ASSERT_TRUE(reg_.SetParent(b_, kNullEntity));

    EXPECT_EQ(reg_.GetParent(b_), kNullEntity);
    EXPECT_TRUE(reg_.GetChildren(a_).empty());
    expectLinked(b_);
}

TEST_F(HierarchyTest, InsertAtIndex) {
    ASSERT_TRUE(reg_.SetParent(b_, a_));
    ASSERT_TRUE(reg_.SetParent(c_, a_));
    ASSERT_TRUE(reg_.SetParent(d_, a_, 1));

    EXPECT_EQ(reg_.GetChildren(a_), (std::vector<Entity>{b_, d_, c_}));
    EXPECT_EQ(reg_.GetChildIndex(d_), 1u);
}

TEST_F(HierarchyTest, IndexPastEndAppends) {
    ASSERT_TRUE(reg_.SetParent(b_, a_));
    ASSERT_TRUE(reg_.SetParent(c_, a_, 50));
    EXPECT_EQ(reg_.GetChildren(a_), (std::vector<Entity>{b_, c_}));
}

TEST_F(HierarchyTest, ReorderWithinSameParent) {
    ASSERT_TRUE(reg_.SetParent(d_, kNullEntity, 0));
    EXPECT_EQ(reg_.GetChildren(kNullEntity), (std::vector<Entity>{d_, a_, b_, c_}));
}

TEST_F(HierarchyTest, RejectsSelfParent) {
    EXPECT_FALSE(reg_.SetParent(a_, a_));
    EXPECT_EQ(reg_.GetParent(a_), kNullEntity);
}

TEST_F(HierarchyTest, RejectsCycle) {
    ASSERT_TRUE(reg_.SetParent(b_, a_));
    ASSERT_TRUE(reg_.SetParent(c_, b_));

    EXPECT_FALSE(reg_.SetParent(a_, c_));
    EXPECT_FALSE(reg_.SetParent(a_, b_));

    EXPECT_EQ(reg_.GetParent(a_), kNullEntity);
    EXPECT_EQ(reg_.GetChildren(c_).size(), 0u);
}

TEST_F(HierarchyTest, RejectsRootAndUnknown) {
    EXPECT_FALSE(reg_.SetParent(kNullEntity, a_));
    EXPECT_FALSE(reg_.SetParent(Entity(77), a_));
    EXPECT_FALSE(reg_.SetParent(a_, Entity(77)));
    EXPECT_EQ(reg_.GetChildren(kNullEntity).size(), 4u);
}

// ===========================================================================
// Queries
// ===========================================================================

TEST_F(HierarchyTest, RootAndPath) {
    ASSERT_TRUE(reg_.SetParent(b_, a_));
    ASSERT_TRUE(reg_.SetParent(c_, b_));

    EXPECT_EQ(reg_.GetRoot(c_), a_);
    EXPECT_EQ(reg_.GetRoot(a_), a_);
    EXPECT_EQ(reg_.GetRoot(Entity(77)), kNullEntity);
    EXPECT_EQ(reg_.GetPath(c_), (std::vector<Entity>{a_, b_, c_}));
    EXPECT_TRUE(reg_.GetPath(Entity(77)).empty());
}

TEST_F(HierarchyTest, IsAncestorOf) {
    ASSERT_TRUE(reg_.SetParent(b_, a_));
    ASSERT_TRUE(reg_.SetParent(c_, b_));

    EXPECT_TRUE(reg_.IsAncestorOf(a_, c_));
    EXPECT_TRUE(reg_.IsAncestorOf(b_, c_));
    EXPECT_FALSE(reg_.IsAncestorOf(c_, a_));
    EXPECT_FALSE(reg_.IsAncestorOf(c_, c_));
    EXPECT_FALSE(reg_.IsAncestorOf(d_, c_));
    EXPECT_TRUE(reg_.IsAncestorOf(kNullEntity, d_));
}

TEST_F(HierarchyTest, UnknownEntityQueries) {
    EXPECT_EQ(reg_.GetParent(Entity(77)), kNullEntity);
    EXPECT_TRUE(reg_.GetChildren(Entity(77)).empty());
    EXPECT_EQ(reg_.GetChildIndex(Entity(77)), Registry::kAppend);
}

TEST_F(HierarchyTest, DestroyDetachesFromParent) {
    ASSERT_TRUE(reg_.SetParent(b_, a_));
    ASSERT_TRUE(reg_.SetParent(c_, a_));

    reg_.DestroyEntity(b_);

    EXPECT_EQ(reg_.GetChildren(a_), (std::vector<Entity>{c_}));
    expectLinked(c_);
}
