#include <gtest/gtest.h>
#include "patterns/search_pattern.hpp"

#include <algorithm>

using namespace malgraph;

namespace {

uint64_t addStep(AttackGraph& g, const std::string& name) {
    return g.addNode(AttackGraphNode(name, StepType::Or));
}

SearchPattern modifyThenRead() {
    return SearchPattern({
        SearchCondition::nameIs("attemptModify"),
        SearchCondition::any(1, SearchCondition::kUnbounded),
        SearchCondition::nameIs("attemptRead"),
    });
}

} // namespace

// ─── Chains ────────────────────────────────────────────────────

TEST(SearchPatternTest, MatchesChainWithIntermediateRun) {
    AttackGraph g;
    uint64_t modify = addStep(g, "attemptModify");
    uint64_t x1 = addStep(g, "escalate");
    uint64_t x2 = addStep(g, "pivot");
    uint64_t read = addStep(g, "attemptRead");
    g.link(modify, x1);
    g.link(x1, x2);
    g.link(x2, read);

    auto paths = modifyThenRead().findMatches(g);
    ASSERT_EQ(paths.size(), 1);
    EXPECT_EQ(paths[0], (NodePath{modify, x1, x2, read}));
}

TEST(SearchPatternTest, IntermediateRunMustBeNonEmpty) {
    AttackGraph g;
    uint64_t modify = addStep(g, "attemptModify");
    uint64_t read = addStep(g, "attemptRead");
    g.link(modify, read);

    EXPECT_TRUE(modifyThenRead().findMatches(g).empty());
}

TEST(SearchPatternTest, BranchesYieldOnePathEach) {
    AttackGraph g;
    uint64_t modify = addStep(g, "attemptModify");
    uint64_t left = addStep(g, "left");
    uint64_t right = addStep(g, "right");
    uint64_t read = addStep(g, "attemptRead");
    g.link(modify, left);
    g.link(modify, right);
    g.link(left, read);
    g.link(right, read);

    auto paths = modifyThenRead().findMatches(g);
    ASSERT_EQ(paths.size(), 2);
    EXPECT_EQ(paths[0], (NodePath{modify, left, read}));
    EXPECT_EQ(paths[1], (NodePath{modify, right, read}));
}

TEST(SearchPatternTest, IntermediateRunMayPassThroughReadSteps) {
    AttackGraph g;
    uint64_t modify = addStep(g, "attemptModify");
    uint64_t x = addStep(g, "pivot");
    uint64_t read1 = addStep(g, "attemptRead");
    uint64_t read2 = addStep(g, "attemptRead2");
    uint64_t read3 = addStep(g, "attemptRead");
    g.link(modify, x);
    g.link(x, read1);
    g.link(read1, read2);
    g.link(read2, read3);

    // Every attemptRead at the end of a run is a separate match.
    auto paths = modifyThenRead().findMatches(g);
    ASSERT_EQ(paths.size(), 2);
    EXPECT_NE(std::find(paths.begin(), paths.end(), NodePath{modify, x, read1}), paths.end());
    EXPECT_NE(std::find(paths.begin(), paths.end(), NodePath{modify, x, read1, read2, read3}),
              paths.end());
}

// ─── Cycles and duplicates ─────────────────────────────────────

TEST(SearchPatternTest, CyclesAreNotRevisited) {
    AttackGraph g;
    uint64_t modify = addStep(g, "attemptModify");
    uint64_t a = addStep(g, "a");
    uint64_t b = addStep(g, "b");
    uint64_t read = addStep(g, "attemptRead");
    g.link(modify, a);
    g.link(a, b);
    g.link(b, a);
    g.link(b, modify);
    g.link(b, read);

    auto paths = modifyThenRead().findMatches(g);
    ASSERT_EQ(paths.size(), 1);
    EXPECT_EQ(paths[0], (NodePath{modify, a, b, read}));
}

TEST(SearchPatternTest, BoundedRepetition) {
    AttackGraph g;
    uint64_t prev = addStep(g, "start");
    std::vector<uint64_t> hops;
    for (int i = 0; i < 4; i++) {
        uint64_t hop = addStep(g, "hop");
        g.link(prev, hop);
        hops.push_back(hop);
        prev = hop;
    }
    uint64_t end = addStep(g, "end");
    g.link(prev, end);

    SearchPattern two_to_three({
        SearchCondition::nameIs("start"),
        SearchCondition::nameIs("hop", 2, 3),
        SearchCondition::nameIs("end"),
    });
    EXPECT_TRUE(two_to_three.findMatches(g).empty());

    SearchPattern up_to_four({
        SearchCondition::nameIs("hop", 1, 4),
        SearchCondition::nameIs("end"),
    });
    auto paths = up_to_four.findMatches(g);
    // Runs of length 1..4 that end right before "end".
    ASSERT_EQ(paths.size(), 4);
    EXPECT_EQ(paths[0], (NodePath{hops[0], hops[1], hops[2], hops[3], end}));
}

TEST(SearchPatternTest, CustomPredicate) {
    AttackGraph g;
    uint64_t a = g.addNode(AttackGraphNode("a", StepType::Or));
    uint64_t b = g.addNode(AttackGraphNode("b", StepType::And));
    uint64_t c = g.addNode(AttackGraphNode("c", StepType::And));
    g.link(a, b);
    g.link(b, c);

    SearchPattern and_pair({
        SearchCondition([](const AttackGraphNode& n) { return n.type == StepType::And; }, 2, 2),
    });
    auto paths = and_pair.findMatches(g);
    ASSERT_EQ(paths.size(), 1);
    EXPECT_EQ(paths[0], (NodePath{b, c}));
}

TEST(SearchPatternTest, EmptyPatternMatchesNothing) {
    AttackGraph g;
    addStep(g, "a");
    EXPECT_TRUE(SearchPattern(std::vector<SearchCondition>{}).findMatches(g).empty());
}
