#include <gtest/gtest.h>

#include "test_support.hpp"
#include "virtual_node.hpp"

TEST(VirtualNodeTest, CreateHashesReplicaKey) {
    auto hash = createHashFunction("fnv1a");
    VirtualNode node = VirtualNode::create("S1", 7, 3, *hash);
    EXPECT_EQ(node.getServerId(), "S1");
    EXPECT_EQ(node.getReplicaIndex(), 7);
    EXPECT_EQ(node.getSequence(), 3u);
    EXPECT_EQ(VirtualNode::replicaKey("S1", 7), "S1:7");
    EXPECT_EQ(node.getHashValue(), fnv1aHash("S1:7"));
}

TEST(VirtualNodeTest, EqualityIgnoresHashAndSequence) {
    VirtualNode a("S1", 0, 100, 0);
    VirtualNode b("S1", 0, 200, 5);
    VirtualNode c("S1", 1, 100, 0);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(VirtualNodeTest, RingOrderBreaksTiesByRegistration) {
    VirtualNode low("B", 0, 10, 0);
    VirtualNode high("A", 0, 20, 0);
    EXPECT_TRUE(ringOrder(low, high));
    EXPECT_FALSE(ringOrder(high, low));

    VirtualNode early("B", 0, 50, 0);
    VirtualNode late("A", 0, 50, 1);
    EXPECT_TRUE(ringOrder(early, late));
    EXPECT_FALSE(ringOrder(late, early));

    VirtualNode first("A", 0, 50, 2);
    VirtualNode second("A", 1, 50, 2);
    EXPECT_TRUE(ringOrder(first, second));
}

TEST(VirtualNodeTest, ToStringNamesOwner) {
    VirtualNode node("S2", 4, 1234, 0);
    std::string text = node.toString();
    EXPECT_NE(text.find("S2"), std::string::npos);
    EXPECT_NE(text.find("1234"), std::string::npos);
}
