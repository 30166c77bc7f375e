#include <gtest/gtest.h>
#include "attackgraph/graph_builder.hpp"
#include "attackgraph/reachability.hpp"
#include "test_fixtures.hpp"

using namespace malgraph;
using namespace malgraph::fixtures;

// N1 --> N4, N2 --> N3 --> N4, where N4 is an and-step.
class ConvergentAndTest : public ::testing::Test {
protected:
    AttackGraph g;
    uint64_t n1 = 0, n2 = 0, n3 = 0, n4 = 0;

    void SetUp() override {
        n1 = g.addNode(AttackGraphNode("N1", StepType::Or));
        n2 = g.addNode(AttackGraphNode("N2", StepType::Or));
        n3 = g.addNode(AttackGraphNode("N3", StepType::Or));
        n4 = g.addNode(AttackGraphNode("N4", StepType::And));
        g.link(n1, n4);
        g.link(n2, n3);
        g.link(n3, n4);
    }
};

TEST_F(ConvergentAndTest, OneParentIsNotEnough) {
    uint64_t eve = g.addAttacker(Attacker("Eve"), {n1});
    ReachabilityCalculator::calculate(g);

    EXPECT_EQ(g.getAttacker(eve)->reachable_attack_steps, std::set<uint64_t>{n1});
    EXPECT_FALSE(g.getNode(n4)->isReachable());
    EXPECT_FALSE(g.getNode(n3)->isReachable());
}

TEST_F(ConvergentAndTest, AllParentsReachAndStep) {
    uint64_t eve = g.addAttacker(Attacker("Eve"), {n1, n2});
    ReachabilityCalculator::calculate(g);

    EXPECT_EQ(g.getAttacker(eve)->reachable_attack_steps, (std::set<uint64_t>{n1, n2, n3, n4}));
    EXPECT_TRUE(g.getNode(n3)->isReachableBy(eve));
    EXPECT_TRUE(g.getNode(n4)->isReachableBy(eve));
}

TEST_F(ConvergentAndTest, NonViableAndStepIsNeverReachable) {
    g.getNode(n4)->is_viable = false;
    uint64_t eve = g.addAttacker(Attacker("Eve"), {n1, n2});
    ReachabilityCalculator::calculate(g);

    EXPECT_TRUE(g.getNode(n3)->isReachableBy(eve));
    EXPECT_FALSE(g.getNode(n4)->isReachable());
}

TEST_F(ConvergentAndTest, NonViableSeedIsStillReachable) {
    g.getNode(n2)->is_viable = false;
    uint64_t eve = g.addAttacker(Attacker("Eve"), {n2});
    ReachabilityCalculator::calculate(g);

    EXPECT_TRUE(g.getNode(n2)->isReachableBy(eve));
    EXPECT_TRUE(g.getNode(n3)->isReachableBy(eve));
}

TEST_F(ConvergentAndTest, RecomputeAfterClearingReachedSteps) {
    uint64_t eve = g.addAttacker(Attacker("Eve"), {n1, n2});
    ReachabilityCalculator::calculate(g);
    ASSERT_TRUE(g.getNode(n4)->isReachable());

    g.undoCompromise(eve, n1);
    g.undoCompromise(eve, n2);
    ReachabilityCalculator::calculate(g);

    EXPECT_TRUE(g.getAttacker(eve)->reachable_attack_steps.empty());
    g.forEachNode([&](const AttackGraphNode& node) { EXPECT_FALSE(node.isReachableBy(eve)); });
}

TEST_F(ConvergentAndTest, AttackersAreIndependent) {
    uint64_t eve = g.addAttacker(Attacker("Eve"), {n1});
    uint64_t mallory = g.addAttacker(Attacker("Mallory"), {n2});
    ReachabilityCalculator::calculate(g);

    // Together they would reach N4, separately neither does.
    EXPECT_FALSE(g.getNode(n4)->isReachable());
    EXPECT_TRUE(g.getNode(n3)->isReachableBy(mallory));
    EXPECT_FALSE(g.getNode(n3)->isReachableBy(eve));
}

TEST(ReachabilityTest, CyclesTerminate) {
    AttackGraph g;
    uint64_t a = g.addNode(AttackGraphNode("a", StepType::Or));
    uint64_t b = g.addNode(AttackGraphNode("b", StepType::Or));
    uint64_t c = g.addNode(AttackGraphNode("c", StepType::And));
    g.link(a, b);
    g.link(b, a);
    g.link(b, c);
    g.link(c, a);
    uint64_t eve = g.addAttacker(Attacker("Eve"), {a});
    ReachabilityCalculator::calculate(g);
    EXPECT_EQ(g.getAttacker(eve)->reachable_attack_steps, (std::set<uint64_t>{a, b, c}));
}

TEST(ReachabilityTest, GeneratedGraph) {
    LanguageSpec language = LanguageSpec::fromJson(networkLanguage());
    Model model = networkModel();
    uint64_t eve = model.addAttacker("Eve", {{kNet, {"access"}}});
    GraphBuilder builder(language, model);
    AttackGraph g = builder.build();
    builder.attachAttackers(g);
    ReachabilityCalculator::calculate(g);

    std::set<std::string> reachable;
    for (uint64_t id : g.getAttacker(eve)->reachable_attack_steps) {
        reachable.insert(g.getNode(id)->full_name);
    }
    EXPECT_EQ(reachable, (std::set<std::string>{
        "net:access", "host1:connect", "host2:connect", "host1:access", "host2:access",
        "data:read", "secret:read", "secret:exfiltrate"}));
    EXPECT_FALSE(g.getNodeByFullName("host1:patched")->isReachable());
}
