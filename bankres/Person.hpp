#pragma once
#include <bankres/Position.hpp>
#include <bankres/noncopyable.hpp>
#include <bankres/random/rng.hpp>
#include <bankres/types.hpp>
#include <ostream>

namespace bankres {

class Bank;
class Grid;
class Model;

/** Record of a single payment made during a trade.  A default-constructed Trade (amount 0)
 * represents "no trade happened"; it converts to false.
 */
struct Trade {
    /// The paying (activated) person
    id_t payer = 0;
    /// The receiving person
    id_t payee = 0;
    /// The amount paid: always Person::large_payment or Person::small_payment for a real trade
    money_t amount = 0;

    /// True if this records an actual payment.
    explicit operator bool() const { return amount > 0; }
};

/** An agent of the model: a person who wanders the grid, trades with whoever shares its cell, and
 * keeps its money as cash on hand, savings at the bank, and loans from the bank.
 *
 * Balances are only changed through pay() (a trade), settle() (end of step), and the Bank (which
 * is a friend so that it can change an account's balances together with its own totals).  After
 * every completed activation and settlement, cash, savings and loans are all non-negative.
 */
class Person final : private noncopyable {
    public:
        /// The larger of the two possible trade amounts.
        static constexpr money_t large_payment = 5;
        /// The smaller of the two possible trade amounts.
        static constexpr money_t small_payment = 2;

        /** Creates a person at `p` holding `cash` and banking with `bank`.  Savings and loans
         * start at zero.  The caller is responsible for placing the person on the grid.
         *
         * \throws std::invalid_argument if cash is negative.
         */
        Person(id_t id, const Position &p, Bank &bank, money_t cash);

        /// The person's unique id.
        id_t id() const { return id_; }

        /// The cell the person currently occupies.
        const Position& position() const { return position_; }

        /// Money on hand.
        money_t cash() const { return cash_; }

        /// Money deposited at the bank.
        money_t savings() const { return savings_; }

        /// Money owed to the bank.
        money_t loans() const { return loans_; }

        /// Net worth at the bank: savings less loans.  Can be negative.
        money_t wealth() const { return savings_ - loans_; }

        /// The bank this person deals with.
        Bank& bank() const { return bank_; }

        /** Performs one activation: move() followed by trade().
         *
         * \returns the trade made, if any.
         */
        Trade step(Model &model);

        /** Relocates to a uniformly chosen cell adjacent to the current one, updating the grid's
         * index.  Consumes exactly one random draw.  Moving never changes any balance.
         */
        void move(Grid &grid, random::rng_t &rng);

        /** Trades with the people sharing this person's cell.  If nobody else is on the cell this
         * does nothing and draws no random numbers.  Otherwise a fair coin decides whether a trade
         * happens; if it does, a partner is drawn uniformly among the others on the cell and a
         * second coin decides whether this person pays large_payment or small_payment to the
         * partner (see pay()).
         *
         * \returns the trade made, or an empty Trade if none happened.
         */
        Trade trade(Model &model);

        /** Pays `amount` to `payee`.  If that leaves this person's cash negative, the deficit is
         * covered first by withdrawing savings and then, for whatever savings could not cover, by
         * a new loan, so that cash ends at exactly 0.
         *
         * \throws std::invalid_argument if amount is not positive or payee is this person.
         */
        void pay(Person &payee, money_t amount);

        /** End-of-step bookkeeping.  Cash above `comfortable_cash` is surplus: the surplus first
         * repays outstanding loans, and whatever remains is deposited.  If `offset_loans` is true,
         * savings are also withdrawn to retire as much of any remaining loan as they can.
         */
        void settle(money_t comfortable_cash, bool offset_loans);

        /// Prints the person as e.g. `Person[3 @ Position[1, 4]: cash=2 savings=10 loans=0]`
        friend std::ostream& operator<<(std::ostream &os, const Person &p);

    private:
        friend class Bank;

        const id_t id_;
        Position position_;
        Bank &bank_;
        money_t cash_;
        money_t savings_ = 0;
        money_t loans_ = 0;

        // Covers a negative cash balance from savings, then loans.
        void coverDeficit();
};

}
