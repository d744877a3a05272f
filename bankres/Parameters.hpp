#pragma once
#include <bankres/Grid.hpp>
#include <bankres/types.hpp>
#include <cstdint>
#include <ostream>
#include <string>

namespace bankres {

/** Order in which the Scheduler activates people within a step: a fresh uniformly random
 * permutation every step (`random`, the default), or ascending id order every step
 * (`sequential`).
 */
enum class Activation { random, sequential };

/// Returns "random" or "sequential".
std::string to_string(Activation a);

/** Configuration of a single Model run.  Every field has a usable default; the defaults for grid
 * size, population, reserve ratio and thresholds are those of the classic Bank Reserves
 * model.
 */
struct Parameters {
    /// Grid width (number of columns)
    int width = 20;
    /// Grid height (number of rows)
    int height = 20;
    /// Edge policy of the grid
    Topology topology = Topology::bounded;
    /// Adjacency used for movement
    Neighbourhood neighbourhood = Neighbourhood::moore;

    /// Number of people
    unsigned int agents = 2;
    /// Cash each person starts with
    money_t initial_cash = 10;

    /// Fraction of deposits the bank targets to hold in reserve (reporting only), in [0, 1]
    double reserve_ratio = 0.5;

    /** Working cash: at the end of every step, cash above this amount repays loans and is then
     * deposited.  The default, 0, sweeps all cash into the bank.
     */
    money_t comfortable_cash = 0;

    /** If true (the default), a person holding both savings and loans uses its savings to pay
     * the loans down during settlement.
     */
    bool offset_loans_with_savings = true;

    /// A person with savings above this is counted as rich
    money_t rich_threshold = 10;
    /// A person with loans above this is counted as poor
    money_t poor_threshold = 10;

    /// Activation order of the scheduler
    Activation activation = Activation::random;

    /// If true, the Model also records every person's balances after every step
    bool collect_agent_data = false;

    /// Seed for the model's random number generator
    std::uint64_t seed = 0;

    /** Checks the parameters for consistency.
     *
     * \throws ConfigurationError describing the first problem found: non-positive grid
     * dimensions, zero agents, a reserve ratio outside [0, 1], or a negative initial cash,
     * comfortable cash or threshold.
     */
    void validate() const;

    /// Prints the parameters as `key=value` pairs, for log messages.
    friend std::ostream& operator<<(std::ostream &os, const Parameters &p);
};

}
