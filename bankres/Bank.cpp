#include <bankres/Bank.hpp>
#include <bankres/Person.hpp>
#include <bankres/errors.hpp>
#include <bankres/debug.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace bankres {

namespace {
inline void require_non_negative(money_t amount, const char *method) {
    if (amount < 0)
        throw std::invalid_argument(std::string("Bank::") + method + "() called with negative amount " + std::to_string(amount));
}
}

Bank::Bank(double reserve_ratio) : reserve_ratio_{reserve_ratio} {
    if (not(reserve_ratio_ >= 0.0 and reserve_ratio_ <= 1.0))
        throw std::invalid_argument("Bank reserve ratio must be in [0, 1]");
}

void Bank::deposit(Person &account, money_t amount) {
    require_non_negative(amount, "deposit");
    if (amount > account.cash_)
        throw InvariantViolation("person " + std::to_string(account.id()) + " cannot deposit " + std::to_string(amount)
                + " with only " + std::to_string(account.cash_) + " cash");

    account.cash_ -= amount;
    account.savings_ += amount;
    deposits_ += amount;
}

money_t Bank::withdraw(Person &account, money_t amount) {
    require_non_negative(amount, "withdraw");
    const money_t w = std::min(amount, account.savings_);

    account.savings_ -= w;
    account.cash_ += w;
    deposits_ -= w;
    return w;
}

void Bank::loan(Person &account, money_t amount) {
    require_non_negative(amount, "loan");

    account.loans_ += amount;
    account.cash_ += amount;
    loans_ += amount;
    issued_ += amount;
    BANKRES_DBG("lent " << amount << " to person " << account.id() << "; outstanding loans now " << loans_);
}

money_t Bank::repay(Person &account, money_t amount) {
    require_non_negative(amount, "repay");
    const money_t r = std::min(amount, account.loans_);
    if (r > account.cash_)
        throw InvariantViolation("person " + std::to_string(account.id()) + " cannot repay " + std::to_string(r)
                + " with only " + std::to_string(account.cash_) + " cash");

    account.cash_ -= r;
    account.loans_ -= r;
    loans_ -= r;
    repaid_ += r;
    return r;
}

double Bank::reserveRequirement() const {
    return static_cast<double>(deposits_) * reserve_ratio_;
}

double Bank::availableToLend() const {
    return static_cast<double>(deposits_) - reserveRequirement() - static_cast<double>(loans_);
}

}
