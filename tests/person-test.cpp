// Tests of a Person's payments, deficit coverage, end-of-step settlement and movement.

#include <bankres/Bank.hpp>
#include <bankres/Grid.hpp>
#include <bankres/Person.hpp>
#include <bankres/errors.hpp>
#include <bankres/random/rng.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

using namespace bankres;

TEST(Person, Construction) {
    Bank b(0.1);
    Person p(4, {2, 3}, b, 10);
    EXPECT_EQ(4u, p.id());
    EXPECT_EQ(Position(2, 3), p.position());
    EXPECT_EQ(10, p.cash());
    EXPECT_EQ(0, p.savings());
    EXPECT_EQ(0, p.loans());
    EXPECT_EQ(0, p.wealth());
    EXPECT_EQ(&b, &p.bank());

    EXPECT_THROW(Person(5, {0, 0}, b, -1), std::invalid_argument);

    std::ostringstream os;
    os << p;
    EXPECT_EQ("Person[4 @ Position[2, 3]: cash=10 savings=0 loans=0]", os.str());
}

TEST(Payment, FromCash) {
    Bank b(0.1);
    Person payer(1, {0, 0}, b, 10), payee(2, {0, 0}, b, 0);

    payer.pay(payee, Person::large_payment);
    EXPECT_EQ(5, payer.cash());
    EXPECT_EQ(5, payee.cash());

    payer.pay(payee, Person::large_payment);
    EXPECT_EQ(0, payer.cash());
    EXPECT_EQ(0, payer.loans());
    EXPECT_EQ(10, payee.cash());
}

TEST(Payment, DeficitFromSavings) {
    Bank b(0.1);
    Person payer(1, {0, 0}, b, 10), payee(2, {0, 0}, b, 0);
    b.deposit(payer, 9);

    payer.pay(payee, 5);
    EXPECT_EQ(0, payer.cash());
    EXPECT_EQ(5, payer.savings());
    EXPECT_EQ(0, payer.loans());
    EXPECT_EQ(5, payee.cash());
    EXPECT_EQ(5, b.deposits());
}

TEST(Payment, DeficitFromSavingsThenLoan) {
    Bank b(0.1);
    Person payer(1, {0, 0}, b, 3), payee(2, {0, 0}, b, 0);
    b.deposit(payer, 2);
    ASSERT_EQ(1, payer.cash());

    payer.pay(payee, 5);
    // 1 cash + 2 savings leaves 2 to borrow
    EXPECT_EQ(0, payer.cash());
    EXPECT_EQ(0, payer.savings());
    EXPECT_EQ(2, payer.loans());
    EXPECT_EQ(-2, payer.wealth());
    EXPECT_EQ(5, payee.cash());
    EXPECT_EQ(0, b.deposits());
    EXPECT_EQ(2, b.loans());
}

TEST(Payment, DeficitFromLoan) {
    Bank b(0.1);
    Person payer(1, {0, 0}, b, 0), payee(2, {0, 0}, b, 0);

    payer.pay(payee, 2);
    EXPECT_EQ(0, payer.cash());
    EXPECT_EQ(2, payer.loans());
    EXPECT_EQ(2, payee.cash());

    payer.pay(payee, 5);
    EXPECT_EQ(0, payer.cash());
    EXPECT_EQ(7, payer.loans());
    EXPECT_EQ(7, payee.cash());
    EXPECT_EQ(7, b.loansIssued());
}

TEST(Payment, Errors) {
    Bank b(0.1);
    Person p1(1, {0, 0}, b, 10), p2(2, {0, 0}, b, 10);
    EXPECT_THROW(p1.pay(p2, 0), std::invalid_argument);
    EXPECT_THROW(p1.pay(p2, -5), std::invalid_argument);
    EXPECT_THROW(p1.pay(p1, 5), std::invalid_argument);
    EXPECT_EQ(10, p1.cash());
    EXPECT_EQ(10, p2.cash());
}

TEST(Settle, DepositsSurplus) {
    Bank b(0.5);
    Person p(1, {0, 0}, b, 10);

    p.settle(0, true);
    EXPECT_EQ(0, p.cash());
    EXPECT_EQ(10, p.savings());
    EXPECT_EQ(10, b.deposits());

    Person q(2, {0, 0}, b, 10);
    q.settle(4, true);
    EXPECT_EQ(4, q.cash());
    EXPECT_EQ(6, q.savings());

    // Nothing above the comfortable amount: nothing happens
    Person r(3, {0, 0}, b, 3);
    r.settle(4, true);
    EXPECT_EQ(3, r.cash());
    EXPECT_EQ(0, r.savings());
}

TEST(Settle, RepaysBeforeSaving) {
    Bank b(0.1);
    Person p(1, {0, 0}, b, 0), other(2, {0, 0}, b, 10);
    p.pay(other, 2);
    ASSERT_EQ(2, p.loans());
    other.pay(p, 5);
    ASSERT_EQ(5, p.cash());

    p.settle(0, false);
    EXPECT_EQ(0, p.loans());
    EXPECT_EQ(0, p.cash());
    EXPECT_EQ(3, p.savings());
    EXPECT_EQ(2, b.loansRepaid());
}

TEST(Settle, PartialRepayment) {
    Bank b(0.1);
    Person p(1, {0, 0}, b, 0), other(2, {0, 0}, b, 10);
    p.pay(other, 5);
    p.pay(other, 5);
    ASSERT_EQ(10, p.loans());
    other.pay(p, 5);

    p.settle(2, false);
    // Only the surplus above the comfortable cash goes to the loan
    EXPECT_EQ(2, p.cash());
    EXPECT_EQ(7, p.loans());
    EXPECT_EQ(0, p.savings());
}

TEST(Settle, OffsetsLoansWithSavings) {
    Bank b(0.1);
    Person p(1, {0, 0}, b, 5), other(2, {0, 0}, b, 0);
    b.deposit(p, 5);
    b.loan(p, 3);
    b.deposit(p, 3);
    ASSERT_EQ(0, p.cash());
    ASSERT_EQ(8, p.savings());
    ASSERT_EQ(3, p.loans());

    p.settle(0, false);
    EXPECT_EQ(8, p.savings());
    EXPECT_EQ(3, p.loans());

    p.settle(0, true);
    EXPECT_EQ(0, p.cash());
    EXPECT_EQ(5, p.savings());
    EXPECT_EQ(0, p.loans());
    EXPECT_EQ(5, p.wealth());
    EXPECT_EQ(5, b.deposits());
    EXPECT_EQ(0, b.loans());

    // Savings smaller than the loan retire part of it
    Person q(3, {0, 0}, b, 0);
    q.pay(other, 5);
    b.loan(q, 2);
    b.deposit(q, 2);
    q.settle(0, true);
    EXPECT_EQ(0, q.savings());
    EXPECT_EQ(5, q.loans());
    EXPECT_EQ(0, q.cash());
}

TEST(Person, MoveNeverChangesBalances) {
    Bank b(0.1);
    Grid g(10, 10, Topology::torus);
    random::rng_t rng(5);
    Person p(1, {0, 9}, b, 10);
    g.place(p.id(), p.position());

    for (int i = 0; i < 200; i++) {
        Position before = p.position();
        p.move(g, rng);
        // On a torus a step off one edge lands on the opposite edge
        bool adjacent = false;
        for (const auto &o : g.offsets())
            if (p.position() == g.normalize(before + o)) adjacent = true;
        ASSERT_TRUE(adjacent) << "moved from " << before << " to " << p.position();
        ASSERT_NE(before, p.position());
        ASSERT_EQ(1u, g.colocated(p.position()).size());
        ASSERT_TRUE(g.colocated(before).empty());
    }
    EXPECT_EQ(10, p.cash());
    EXPECT_EQ(0, p.savings());
    EXPECT_EQ(0, p.loans());
    EXPECT_EQ(1u, g.population());
}
