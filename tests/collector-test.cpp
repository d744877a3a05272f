// Tests of the per-step statistics: wealth classes, totals, and the Gini coefficient.

#include <bankres/DataCollector.hpp>
#include <bankres/Model.hpp>
#include <gtest/gtest.h>
#include <vector>

using namespace bankres;

namespace {
// Three people with $10 each, then: person 1 saves 8, person 2 borrows 3, person 3 does nothing.
Parameters three() {
    Parameters p;
    p.width = p.height = 5;
    p.agents = 3;
    p.initial_cash = 10;
    p.reserve_ratio = 0.5;
    p.seed = 1;
    return p;
}
void setup(Model &m) {
    m.bank().deposit(m.person(1), 8);
    m.bank().loan(m.person(2), 3);
}
}

TEST(Gini, Values) {
    EXPECT_DOUBLE_EQ(0, DataCollector::gini({}));
    EXPECT_DOUBLE_EQ(0, DataCollector::gini({0, 0, 0}));
    EXPECT_DOUBLE_EQ(0, DataCollector::gini({5, 5, 5}));
    EXPECT_DOUBLE_EQ(0, DataCollector::gini({7}));
    EXPECT_NEAR(2.0 / 3.0, DataCollector::gini({0, 0, 10}), 1e-12);
    EXPECT_NEAR(2.0 / 3.0, DataCollector::gini({10, 0, 0}), 1e-12);
    EXPECT_NEAR(0.5, DataCollector::gini({0, 10}), 1e-12);
    EXPECT_NEAR(0.25, DataCollector::gini({1, 3}), 1e-12);
}

TEST(Collector, Totals) {
    Model m(three());
    setup(m);

    DataCollector dc(5, 1);
    Trade t1, t2;
    t1.payer = 1; t1.payee = 2; t1.amount = 5;
    t2.payer = 3; t2.payee = 1; t2.amount = 2;
    dc.collect(m, {t1, t2});

    ASSERT_EQ(1u, dc.steps().size());
    const StepStats &s = dc.steps().front();
    EXPECT_EQ(0u, s.step);
    EXPECT_EQ(25, s.wallets);
    EXPECT_EQ(8, s.savings);
    EXPECT_EQ(3, s.loans);
    EXPECT_EQ(33, s.money);
    EXPECT_DOUBLE_EQ(4, s.reserves);
    EXPECT_DOUBLE_EQ(1, s.available_to_lend);
    EXPECT_EQ(2u, s.trades);
    EXPECT_EQ(7, s.trade_volume);
    // Holdings (cash + savings) are 10, 13, 10
    EXPECT_NEAR(2.0 * 69 / (3 * 33) - 4.0 / 3.0, s.gini, 1e-12);
    EXPECT_TRUE(dc.agents().empty());
}

TEST(Collector, Classes) {
    Model m(three());
    setup(m);

    DataCollector dc(5, 1);
    dc.collect(m, {});
    EXPECT_EQ(1u, dc.steps()[0].rich);
    EXPECT_EQ(1u, dc.steps()[0].poor);
    EXPECT_EQ(1u, dc.steps()[0].middle_class);
    EXPECT_EQ(0u, dc.steps()[0].trades);
    EXPECT_EQ(0, dc.steps()[0].trade_volume);
}

TEST(Collector, ThresholdBoundaries) {
    Model m(three());
    setup(m);

    // Person 1's savings of 8 is exactly the rich threshold, person 2's loans of 3 exactly the poor
    // threshold: neither is counted in any class.
    DataCollector dc(8, 3);
    dc.collect(m, {});
    EXPECT_EQ(0u, dc.steps()[0].rich);
    EXPECT_EQ(0u, dc.steps()[0].poor);
    EXPECT_EQ(1u, dc.steps()[0].middle_class);

    DataCollector high(20, 20);
    high.collect(m, {});
    EXPECT_EQ(0u, high.steps()[0].rich);
    EXPECT_EQ(0u, high.steps()[0].poor);
    EXPECT_EQ(3u, high.steps()[0].middle_class);
}

TEST(Collector, AgentRecords) {
    Model m(three());
    setup(m);

    DataCollector dc(5, 1, true);
    dc.collect(m, {});
    dc.collect(m, {});
    ASSERT_EQ(6u, dc.agents().size());
    ASSERT_EQ(2u, dc.steps().size());

    const auto &a = dc.agents();
    EXPECT_EQ(1u, a[0].id);
    EXPECT_EQ(2, a[0].cash);
    EXPECT_EQ(8, a[0].savings);
    EXPECT_EQ(8, a[0].wealth);
    EXPECT_EQ(2u, a[1].id);
    EXPECT_EQ(13, a[1].cash);
    EXPECT_EQ(3, a[1].loans);
    EXPECT_EQ(-3, a[1].wealth);
    EXPECT_EQ(3u, a[2].id);
    EXPECT_EQ(0, a[2].wealth);
    EXPECT_EQ(1u, a[3].id);
}

TEST(Collector, ModelRecordsEveryStep) {
    Parameters p = three();
    p.rich_threshold = 4;
    p.poor_threshold = 2;
    Model m(p);
    m.run(30);
    ASSERT_EQ(30u, m.statistics().size());
    EXPECT_TRUE(m.data().agents().empty());

    // Recomputing the last step's classes from the people gives the same counts
    size_t rich = 0, poor = 0, middle = 0;
    for (const auto &pp : m.people()) {
        if (pp->savings() > 4) rich++;
        if (pp->loans() > 2) poor++;
        if (pp->loans() < 2 and pp->savings() < 4) middle++;
    }
    const StepStats &s = m.statistics().back();
    EXPECT_EQ(30u, s.step);
    EXPECT_EQ(rich, s.rich);
    EXPECT_EQ(poor, s.poor);
    EXPECT_EQ(middle, s.middle_class);
    EXPECT_EQ(m.bank().deposits(), s.savings);
    EXPECT_EQ(m.bank().loans(), s.loans);
}
