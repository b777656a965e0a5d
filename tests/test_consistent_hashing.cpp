#include <gtest/gtest.h>

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "consistent_hashing.hpp"
#include "errors.hpp"
#include "test_support.hpp"

namespace {

const int KEY_COUNT = 10000;

std::string testKey(int i) {
    return "key" + std::to_string(i);
}

std::map<std::string, std::string> assignKeys(const ConsistentHashRing& ring) {
    std::map<std::string, std::string> owners;
    for (int i = 0; i < KEY_COUNT; ++i) {
        owners[testKey(i)] = ring.lookup(testKey(i));
    }
    return owners;
}

void expectKind(ErrorKind kind, const std::function<void()>& action) {
    try {
        action();
        FAIL() << "expected " << errorKindName(kind);
    } catch (const BalancerError& e) {
        EXPECT_EQ(e.getKind(), kind) << e.what();
    }
}

// S1:0 -> 100, S2:0 -> 200, S3:0 -> 300
std::shared_ptr<const HashFunction> placedHash() {
    return std::make_shared<TableHashFunction>(std::map<std::string, uint32_t>{
        {"S1:0", 100}, {"S2:0", 200}, {"S3:0", 300},
        {"at-50", 50}, {"at-100", 100}, {"at-150", 150}, {"at-300", 300}, {"at-350", 350}, {"at-max", 0xffffffffu},
    });
}

} // namespace

TEST(ConsistentHashRingTest, LookupIsDeterministic) {
    ConsistentHashRing first(createHashFunction("fnv1a"), 100);
    ConsistentHashRing second(createHashFunction("fnv1a"), 100);
    for (const std::string id : {"S1", "S2", "S3", "S4"}) {
        first.addServer(id);
        second.addServer(id);
    }
    EXPECT_EQ(assignKeys(first), assignKeys(second));
    EXPECT_EQ(first.lookup("user:42"), first.lookup("user:42"));
}

TEST(ConsistentHashRingTest, EmptyRingRejectsLookups) {
    ConsistentHashRing ring(createHashFunction("fnv1a"), 10);
    expectKind(ErrorKind::EMPTY_RING, [&ring]() { ring.lookup("k"); });
    expectKind(ErrorKind::EMPTY_RING, [&ring]() { ring.lookupCandidates("k", 3); });

    ring.addServer("S1");
    ring.removeServer("S1");
    expectKind(ErrorKind::EMPTY_RING, [&ring]() { ring.lookup("k"); });
    EXPECT_EQ(ring.virtualNodeCount(), 0u);
}

TEST(ConsistentHashRingTest, VirtualNodeCountFollowsWeight) {
    ConsistentHashRing ring(createHashFunction("murmur3"), 150);
    ring.addServer("S1", 1);
    ring.addServer("S3", 2);
    EXPECT_EQ(ring.virtualNodeCount(), 450u);
    std::map<std::string, size_t> counts = ring.virtualNodeCounts();
    EXPECT_EQ(counts["S1"], 150u);
    EXPECT_EQ(counts["S3"], 300u);
    EXPECT_EQ(ring.virtualNodesOf("S3").size(), 300u);
    EXPECT_EQ(ring.serverCount(), 2u);
    EXPECT_TRUE(ring.contains("S1"));
    EXPECT_FALSE(ring.contains("S2"));
}

TEST(ConsistentHashRingTest, NodesStaySortedByHash) {
    ConsistentHashRing ring(createHashFunction("fnv1a"), 50);
    ring.addServer("S1");
    ring.addServer("S2", 3);
    ring.addServer("S3");
    ring.removeServer("S2");
    std::shared_ptr<const RingSnapshot> snapshot = ring.snapshot();
    ASSERT_EQ(snapshot->nodes.size(), 100u);
    for (size_t i = 1; i < snapshot->nodes.size(); ++i) {
        EXPECT_LE(snapshot->nodes[i - 1].getHashValue(), snapshot->nodes[i].getHashValue());
    }
    EXPECT_EQ(ring.nodesSample(10).size(), 10u);
    EXPECT_EQ(ring.nodesSample(1000).size(), 100u);
}

TEST(ConsistentHashRingTest, AddingServerMovesBoundedShareToIt) {
    ConsistentHashRing ring(createHashFunction("fnv1a"), 100);
    for (int i = 1; i <= 5; ++i) {
        ring.addServer("S" + std::to_string(i));
    }
    std::map<std::string, std::string> before = assignKeys(ring);
    ring.addServer("S6");
    std::map<std::string, std::string> after = assignKeys(ring);

    int moved = 0;
    for (const auto& entry : before) {
        if (after[entry.first] != entry.second) {
            moved++;
            EXPECT_EQ(after[entry.first], "S6");
        }
    }
    double fraction = static_cast<double>(moved) / KEY_COUNT;
    EXPECT_GT(fraction, 0.5 / 6);
    EXPECT_LT(fraction, 2.0 / 6);
}

TEST(ConsistentHashRingTest, RemovingServerOnlyMovesItsKeys) {
    ConsistentHashRing ring(createHashFunction("murmur3"), 100);
    for (int i = 1; i <= 5; ++i) {
        ring.addServer("S" + std::to_string(i));
    }
    std::map<std::string, std::string> before = assignKeys(ring);
    ring.removeServer("S3");
    std::map<std::string, std::string> after = assignKeys(ring);

    int owned = 0;
    for (const auto& entry : before) {
        if (entry.second == "S3") {
            owned++;
            EXPECT_NE(after[entry.first], "S3");
        } else {
            EXPECT_EQ(after[entry.first], entry.second);
        }
    }
    EXPECT_GT(owned, 0);
}

class WeightProportionalityTest : public ::testing::TestWithParam<std::string> {};

TEST_P(WeightProportionalityTest, SharesFollowWeights) {
    ConsistentHashRing ring(createHashFunction(GetParam()), 150);
    ring.addServer("S1", 1);
    ring.addServer("S2", 1);
    ring.addServer("S3", 2);

    std::map<std::string, int> hits;
    for (int i = 0; i < KEY_COUNT; ++i) {
        hits[ring.lookup(testKey(i))]++;
    }
    std::map<std::string, double> expected = {{"S1", 0.25}, {"S2", 0.25}, {"S3", 0.5}};
    for (const auto& entry : expected) {
        double share = static_cast<double>(hits[entry.first]) / KEY_COUNT;
        EXPECT_NEAR(share, entry.second, entry.second * 0.10) << entry.first;
    }
}

INSTANTIATE_TEST_SUITE_P(Hashes, WeightProportionalityTest, ::testing::Values("fnv1a", "murmur3"));

TEST(ConsistentHashRingTest, LookupWrapsAroundTheRing) {
    ConsistentHashRing ring(placedHash(), 1);
    ring.addServer("S1");
    ring.addServer("S2");
    ring.addServer("S3");

    EXPECT_EQ(ring.lookup("at-50"), "S1");
    EXPECT_EQ(ring.lookup("at-100"), "S1");
    EXPECT_EQ(ring.lookup("at-150"), "S2");
    EXPECT_EQ(ring.lookup("at-300"), "S3");
    EXPECT_EQ(ring.lookup("at-350"), "S1");
    EXPECT_EQ(ring.lookup("at-max"), "S1");
}

TEST(ConsistentHashRingTest, CandidatesWalkClockwiseWithoutRepeats) {
    ConsistentHashRing ring(placedHash(), 1);
    ring.addServer("S1");
    ring.addServer("S2");
    ring.addServer("S3");

    EXPECT_EQ(ring.lookupCandidates("at-150", 3), (std::vector<std::string>{"S2", "S3", "S1"}));
    EXPECT_EQ(ring.lookupCandidates("at-350", 2), (std::vector<std::string>{"S1", "S2"}));
    EXPECT_EQ(ring.lookupCandidates("at-150", 10).size(), 3u);
    EXPECT_TRUE(ring.lookupCandidates("at-150", 0).empty());

    ConsistentHashRing weighted(createHashFunction("fnv1a"), 100);
    weighted.addServer("A", 4);
    weighted.addServer("B");
    std::vector<std::string> candidates = weighted.lookupCandidates("user:1", 5);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_NE(candidates[0], candidates[1]);
    EXPECT_EQ(candidates[0], weighted.lookup("user:1"));
}

TEST(ConsistentHashRingTest, CollidingNodesAreBothKept) {
    auto hash = std::make_shared<TableHashFunction>(std::map<std::string, uint32_t>{
        {"A:0", 500}, {"B:0", 500}, {"at-500", 500},
    });
    ConsistentHashRing ring(hash, 1);
    ring.addServer("A");
    ring.addServer("B");

    EXPECT_EQ(ring.virtualNodeCount(), 2u);
    EXPECT_EQ(ring.lookup("at-500"), "A");
    EXPECT_EQ(ring.lookupCandidates("at-500", 2), (std::vector<std::string>{"A", "B"}));

    ring.removeServer("A");
    EXPECT_EQ(ring.lookup("at-500"), "B");
}

TEST(ConsistentHashRingTest, RejectsInvalidMutations) {
    ConsistentHashRing ring(createHashFunction("fnv1a"), 10);
    ring.addServer("S1");

    expectKind(ErrorKind::DUPLICATE_SERVER, [&ring]() { ring.addServer("S1", 2); });
    expectKind(ErrorKind::SERVER_NOT_FOUND, [&ring]() { ring.removeServer("S9"); });
    expectKind(ErrorKind::SERVER_NOT_FOUND, [&ring]() { ring.virtualNodesOf("S9"); });
    expectKind(ErrorKind::INVALID_WEIGHT, [&ring]() { ring.addServer("S2", 0); });
    expectKind(ErrorKind::INVALID_WEIGHT, [&ring]() { ring.addServer("S2", -3); });

    EXPECT_EQ(ring.serverCount(), 1u);
    EXPECT_EQ(ring.virtualNodeCount(), 10u);
    EXPECT_EQ(ring.virtualNodeCounts()["S1"], 10u);
}

TEST(ConsistentHashRingTest, RejectsUnusableConfiguration) {
    EXPECT_THROW(ConsistentHashRing(std::make_shared<NarrowHashFunction>(), 10), std::invalid_argument);
    EXPECT_THROW(ConsistentHashRing(nullptr, 10), std::invalid_argument);
    EXPECT_THROW(ConsistentHashRing(createHashFunction("fnv1a"), 0), std::invalid_argument);
}

TEST(ConsistentHashRingTest, SnapshotIsUnaffectedByLaterChanges) {
    ConsistentHashRing ring(createHashFunction("fnv1a"), 10);
    ring.addServer("S1");
    std::shared_ptr<const RingSnapshot> before = ring.snapshot();
    ring.addServer("S2");
    ring.removeServer("S1");
    EXPECT_EQ(before->nodes.size(), 10u);
    EXPECT_EQ(before->servers.count("S1"), 1u);
    EXPECT_EQ(ring.getServers(), std::vector<std::string>{"S2"});
}

TEST(ConsistentHashRingTest, UpdateServerReplacesNodesInOneStep) {
    ConsistentHashRing ring(createHashFunction("murmur3"), 100);
    ring.addServer("S1");
    ring.addServer("S2");
    ring.addServer("S3");
    std::map<std::string, std::string> before = assignKeys(ring);
    std::shared_ptr<const RingSnapshot> previous = ring.snapshot();

    ring.updateServer("S2", 3);
    EXPECT_EQ(ring.weightOf("S2"), 3);
    EXPECT_EQ(ring.virtualNodeCounts()["S2"], 300u);
    EXPECT_EQ(ring.virtualNodeCount(), 500u);
    EXPECT_EQ(previous->nodes.size(), 300u);

    // Growing S2 only moves keys onto S2
    for (const auto& entry : assignKeys(ring)) {
        if (entry.second != before[entry.first]) {
            EXPECT_EQ(entry.second, "S2");
        }
    }

    ring.updateServer("S2", 1);
    EXPECT_EQ(assignKeys(ring), before);
}

TEST(ConsistentHashRingTest, UpdateServerRejectsBadWeightWithoutChange) {
    ConsistentHashRing ring(createHashFunction("fnv1a"), 100);
    ring.addServer("S1", 2);
    std::shared_ptr<const RingSnapshot> previous = ring.snapshot();

    expectKind(ErrorKind::INVALID_WEIGHT, [&ring]() { ring.updateServer("S1", 100000); });
    expectKind(ErrorKind::INVALID_WEIGHT, [&ring]() { ring.updateServer("S1", 0); });
    expectKind(ErrorKind::SERVER_NOT_FOUND, [&ring]() { ring.updateServer("S9", 2); });
    expectKind(ErrorKind::INVALID_WEIGHT, [&ring]() { ring.addServer("S2", 100000); });

    EXPECT_EQ(ring.snapshot(), previous);
    EXPECT_TRUE(ring.contains("S1"));
    EXPECT_EQ(ring.weightOf("S1"), 2);
    EXPECT_EQ(ring.virtualNodeCount(), 200u);
}
