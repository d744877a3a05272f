#pragma once
#include <bankres/Bank.hpp>
#include <bankres/DataCollector.hpp>
#include <bankres/Grid.hpp>
#include <bankres/Parameters.hpp>
#include <bankres/Person.hpp>
#include <bankres/Scheduler.hpp>
#include <bankres/noncopyable.hpp>
#include <bankres/random/rng.hpp>
#include <bankres/types.hpp>
#include <atomic>
#include <memory>
#include <vector>

namespace bankres {

/** This class is at the centre of a Bank Reserves model: it owns the grid, the bank, the
 * population of people, the scheduler, the random number generator and the data collector, and
 * it dispatches the stages of each step.
 *
 * A Model is entirely self-contained: nothing it owns is shared with any other Model, so
 * independent models may be run concurrently on different threads.  Given the same Parameters
 * (including the seed), two models produce identical runs.
 */
class Model final : private noncopyable {
    public:
        /** Creates the model: validates the parameters, seeds the generator with
         * `params.seed`, creates the bank and grid, and creates `params.agents` people (with ids
         * 1 through `params.agents`), each placed on a uniformly random cell with
         * `params.initial_cash` cash.
         *
         * \throws ConfigurationError if the parameters are invalid.
         */
        explicit Model(const Parameters &params);

        /// The stages of a step.  `idle` is the stage between steps.
        enum class RunStage { idle, activate, settle, record };

        /** Runs one step of the model.  The following happens, in order:
         *
         * - The step counter (accessible by `t()`) is incremented.
         * - Activation: the scheduler activates every person exactly once, in its activation
         *   order; each person moves and then trades (see Person::step()).  Right after each
         *   activation, the person's cash is checked to be non-negative.
         * - Settlement: every person, in id order, settles its books (see Person::settle()).
         * - The bank's totals are checked against the sums over all people (see
         *   checkConsistency()).
         * - Recording: the step's statistics are appended to statistics().
         *
         * A step is never partially recorded: if an invariant check fails, InvariantViolation is
         * thrown and no statistics are recorded for the step.
         *
         * \throws std::logic_error if called recursively (i.e. during a step).
         * \throws InvariantViolation if an invariant check fails.
         */
        void step();

        /** Runs up to `steps` steps.  If `abort` is given, it is checked before each step and the
         * run stops as soon as it is found to be true; a step in progress always completes.
         *
         * \returns the number of steps run by this call.
         */
        step_t run(step_t steps, const std::atomic<bool> *abort = nullptr);

        /// Returns the number of completed or in-progress steps; 0 before the first step().
        step_t t() const { return t_; }

        /// The current stage of the model.
        RunStage runStage() const { return stage_; }

        /// The (validated) parameters the model was created with.
        const Parameters& parameters() const { return params_; }

        /// The grid.
        Grid& grid() { return grid_; }
        /// `const` access to the grid.
        const Grid& grid() const { return grid_; }

        /// The bank.
        Bank& bank() { return bank_; }
        /// `const` access to the bank.
        const Bank& bank() const { return bank_; }

        /** The model's random number generator.  Every random draw of the model (placement,
         * activation order, movement, trading) comes from this generator.
         */
        random::rng_t& rng() { return rng_; }

        /// The scheduler.
        const Scheduler& schedule() const { return schedule_; }

        /** Accesses a person by id.
         *
         * \throws std::out_of_range if no person has that id.
         */
        Person& person(id_t id);
        /// `const` access to a person by id.
        const Person& person(id_t id) const;

        /// All people, in id order.
        const std::vector<std::unique_ptr<Person>>& people() const { return people_; }

        /// The trades made during the most recent step.
        const std::vector<Trade>& lastTrades() const { return trades_; }

        /// The data collector.
        const DataCollector& data() const { return data_; }

        /// The recorded statistics, one entry per completed step, in step order.
        const std::vector<StepStats>& statistics() const { return data_.steps(); }

        /// Total cash held by the population at creation.
        money_t initialMoney() const { return initial_money_; }

        /** Checks the model's balance-sheet invariants:
         * - every person's cash, savings and loans are non-negative;
         * - the bank's deposits equal the sum of all savings, and its loans the sum of all loans;
         * - total money (cash plus savings) equals the initial money plus the loans issued less
         *   the loans repaid.
         *
         * \throws InvariantViolation describing the first failed check.
         */
        void checkConsistency() const;

    private:
        const Parameters params_;
        random::rng_t rng_;
        Bank bank_;
        Grid grid_;
        Scheduler schedule_;
        DataCollector data_;
        std::vector<std::unique_ptr<Person>> people_;
        std::vector<Trade> trades_;
        money_t initial_money_ = 0;
        step_t t_ = 0;
        RunStage stage_ = RunStage::idle;

        // Validates and returns the parameters; used to validate before any member is built.
        static const Parameters& validated(const Parameters &params);
};

}
