#pragma once
#include <bankres/noncopyable.hpp>
#include <bankres/types.hpp>

namespace bankres {

class Person;

/** The single aggregate bank of a Model.  It holds every Person's savings and extends every
 * Person's loans, and tracks the totals of both.
 *
 * Each operation changes the account holder's balances and the bank's totals together, so that
 * `deposits() == sum of savings` and `loans() == sum of loans` hold between any two calls.
 *
 * The bank is an unlimited external source of liquidity: loan() never fails.  The reserve ratio
 * only determines the reported reserve requirement (reserveRequirement()) and the reported amount
 * available to lend (availableToLend(), which may go negative); it never denies a loan.
 */
class Bank final : private noncopyable {
    public:
        /** Creates a bank with no deposits or loans.
         *
         * \param reserve_ratio the fraction of deposits the bank targets to hold in reserve, in
         * [0, 1].
         * \throws std::invalid_argument if reserve_ratio is outside [0, 1].
         */
        explicit Bank(double reserve_ratio);

        /** Moves `amount` of `account`'s cash into its savings.
         *
         * \throws std::invalid_argument if amount is negative.
         * \throws InvariantViolation if amount exceeds the account's cash.
         */
        void deposit(Person &account, money_t amount);

        /** Moves up to `amount` of `account`'s savings into its cash.  The withdrawal is capped at
         * the account's savings, which therefore never go negative.
         *
         * \returns the amount actually withdrawn.
         * \throws std::invalid_argument if amount is negative.
         */
        money_t withdraw(Person &account, money_t amount);

        /** Lends `amount` to `account`: its loans and its cash both increase by `amount`.  Always
         * succeeds.
         *
         * \throws std::invalid_argument if amount is negative.
         */
        void loan(Person &account, money_t amount);

        /** Repays up to `amount` of `account`'s loans out of its cash.  The repayment is capped at
         * the outstanding loan, which therefore never goes negative.
         *
         * \returns the amount actually repaid.
         * \throws std::invalid_argument if amount is negative.
         * \throws InvariantViolation if the capped repayment exceeds the account's cash.
         */
        money_t repay(Person &account, money_t amount);

        /// The configured reserve ratio.
        double reserveRatio() const { return reserve_ratio_; }

        /// Total savings deposited by all account holders.
        money_t deposits() const { return deposits_; }

        /// Total outstanding loans of all account holders.
        money_t loans() const { return loans_; }

        /// Cumulative amount lent since the bank was created.
        money_t loansIssued() const { return issued_; }

        /// Cumulative amount repaid since the bank was created.
        money_t loansRepaid() const { return repaid_; }

        /** Returns the reserve the bank should hold: `deposits() * reserveRatio()`.  Reporting only:
         * nothing in the model is denied because of it.
         */
        double reserveRequirement() const;

        /** Returns `deposits() - reserveRequirement() - loans()`, the amount the bank could still
         * lend while meeting its reserve target.  Negative values mean the bank has lent beyond
         * its target.
         */
        double availableToLend() const;

    private:
        const double reserve_ratio_;
        money_t deposits_ = 0;
        money_t loans_ = 0;
        money_t issued_ = 0;
        money_t repaid_ = 0;
};

}
