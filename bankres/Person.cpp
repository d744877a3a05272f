#include <bankres/Person.hpp>
#include <bankres/Bank.hpp>
#include <bankres/Grid.hpp>
#include <bankres/Model.hpp>
#include <bankres/errors.hpp>
#include <bankres/random/util.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace bankres {

constexpr money_t Person::large_payment;
constexpr money_t Person::small_payment;

Person::Person(id_t id, const Position &p, Bank &bank, money_t cash)
    : id_{id}, position_{p}, bank_(bank), cash_{cash} {
    if (cash_ < 0)
        throw std::invalid_argument("Person initial cash cannot be negative");
}

Trade Person::step(Model &model) {
    move(model.grid(), model.rng());
    return trade(model);
}

void Person::move(Grid &grid, random::rng_t &rng) {
    Position dest = grid.randomAdjacent(position_, rng);
    grid.move(id_, position_, dest);
    position_ = dest;
}

Trade Person::trade(Model &model) {
    const auto &here = model.grid().colocated(position_);
    if (here.size() < 2) return Trade();

    auto &rng = model.rng();
    if (not random::rbernoulli(rng)) return Trade();

    // Draw the partner's rank among the other occupants, then find it (skipping ourself)
    const size_t pick = random::rindex(rng, here.size() - 1);
    id_t partner = 0;
    size_t seen = 0;
    for (const id_t other : here) {
        if (other == id_) continue;
        if (seen++ == pick) { partner = other; break; }
    }

    const money_t amount = random::rbernoulli(rng) ? large_payment : small_payment;
    pay(model.person(partner), amount);

    Trade t;
    t.payer = id_;
    t.payee = partner;
    t.amount = amount;
    return t;
}

void Person::pay(Person &payee, money_t amount) {
    if (amount <= 0)
        throw std::invalid_argument("Person::pay() requires a positive amount");
    if (&payee == this)
        throw std::invalid_argument("Person::pay(): a person cannot pay itself");

    cash_ -= amount;
    payee.cash_ += amount;
    if (cash_ < 0) coverDeficit();
}

void Person::coverDeficit() {
    money_t shortfall = -cash_;
    shortfall -= bank_.withdraw(*this, shortfall);
    if (shortfall > 0) bank_.loan(*this, shortfall);

    if (cash_ != 0)
        throw InvariantViolation("person " + std::to_string(id_) + " left with cash " + std::to_string(cash_)
                + " after covering a deficit");
}

void Person::settle(money_t comfortable_cash, bool offset_loans) {
    if (cash_ < 0)
        throw InvariantViolation("person " + std::to_string(id_) + " has negative cash " + std::to_string(cash_)
                + " at settlement");

    // Loans are repaid with priority over saving
    money_t surplus = cash_ - comfortable_cash;
    if (surplus > 0 and loans_ > 0)
        surplus -= bank_.repay(*this, surplus);

    if (offset_loans and loans_ > 0 and savings_ > 0) {
        const money_t w = bank_.withdraw(*this, std::min(savings_, loans_));
        bank_.repay(*this, w);
    }

    if (surplus > 0) bank_.deposit(*this, surplus);
}

std::ostream& operator<<(std::ostream &os, const Person &p) {
    return os << "Person[" << p.id_ << " @ " << p.position_ << ": cash=" << p.cash_
        << " savings=" << p.savings_ << " loans=" << p.loans_ << "]";
}

}
