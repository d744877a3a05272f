#pragma once
#include <bankres/Person.hpp>
#include <bankres/types.hpp>
#include <vector>

namespace bankres {

class Model;

/** Aggregate statistics of a Model after one completed step. */
struct StepStats {
    /// The step these statistics describe (1 for the first step)
    step_t step = 0;
    /// Number of people with savings above the rich threshold
    size_t rich = 0;
    /// Number of people with loans above the poor threshold
    size_t poor = 0;
    /// Number of people with loans below the poor threshold and savings below the rich threshold
    size_t middle_class = 0;
    /// Total cash on hand
    money_t wallets = 0;
    /// Total savings (equal to the bank's deposits)
    money_t savings = 0;
    /// Total outstanding loans (equal to the bank's loans)
    money_t loans = 0;
    /// Total money: wallets plus savings
    money_t money = 0;
    /// The bank's reserve requirement
    double reserves = 0;
    /// The bank's reported lending capacity (may be negative)
    double available_to_lend = 0;
    /// Gini coefficient of people's holdings (cash plus savings); 0 when nobody holds anything
    double gini = 0;
    /// Number of trades made during the step
    size_t trades = 0;
    /// Total amount paid in those trades
    money_t trade_volume = 0;
};

/** One person's balances after a step; only recorded when agent data collection is enabled. */
struct AgentRecord {
    /// The step these balances describe
    step_t step = 0;
    /// The person
    id_t id = 0;
    /// Cash on hand
    money_t cash = 0;
    /// Savings at the bank
    money_t savings = 0;
    /// Loans from the bank
    money_t loans = 0;
    /// Savings less loans
    money_t wealth = 0;
};

/** Records the statistics of a Model once per step.  The recorded sequences are append-only: a
 * record is never changed after collect() returns.
 */
class DataCollector final {
    public:
        /** Creates a collector with the given wealth class thresholds.  If `collect_agents` is
         * true, every person's balances are recorded at every step as well.
         */
        DataCollector(money_t rich_threshold, money_t poor_threshold, bool collect_agents = false);

        /** Appends the statistics of `model` at the model's current step.  `trades` are the trades
         * made during that step.
         */
        void collect(const Model &model, const std::vector<Trade> &trades);

        /// The per-step statistics, in step order.
        const std::vector<StepStats>& steps() const { return steps_; }

        /// The per-agent records, in step order and, within a step, in id order.
        const std::vector<AgentRecord>& agents() const { return agents_; }

        /** Returns the Gini coefficient of the given non-negative values: 0 for perfect equality, and
         * approaching 1 as one value holds everything.  Returns 0 for an empty set or a set of
         * zeros.
         */
        static double gini(std::vector<money_t> values);

    private:
        money_t rich_threshold_, poor_threshold_;
        bool collect_agents_;
        std::vector<StepStats> steps_;
        std::vector<AgentRecord> agents_;
};

}
