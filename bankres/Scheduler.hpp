#pragma once
#include <bankres/Parameters.hpp>
#include <bankres/random/rng.hpp>
#include <bankres/types.hpp>
#include <functional>
#include <vector>

namespace bankres {

/** Activates every registered agent exactly once per step.
 *
 * With Activation::random the order is a uniformly random permutation drawn afresh from the
 * model's generator at the start of every step (a Fisher-Yates shuffle consuming `n-1` draws for
 * `n` agents), so that, for a given seed, the sequence of orders is reproducible.  With
 * Activation::sequential agents are activated in the order they were added and no random numbers
 * are drawn.
 */
class Scheduler final {
    public:
        /// Creates an empty scheduler using the given activation order.
        explicit Scheduler(Activation activation = Activation::random) : activation_{activation} {}

        /** Registers an agent.
         *
         * \throws std::invalid_argument if the id is already registered.
         */
        void add(id_t id);

        /// The activation order policy.
        Activation activation() const { return activation_; }

        /// The registered agents, in registration order.
        const std::vector<id_t>& agents() const { return agents_; }

        /// The number of registered agents.
        size_t size() const { return agents_.size(); }

        /// The number of completed calls to step().
        step_t steps() const { return steps_; }

        /** Returns the activation order for one step: every registered agent exactly once.  Draws
         * from `rng` when the activation order is random.
         */
        std::vector<id_t> order(random::rng_t &rng) const;

        /** Runs one step: draws an order and calls `activate` for each agent in it.  If
         * `activate` throws, the exception propagates and the step is not counted.
         */
        void step(random::rng_t &rng, const std::function<void(id_t)> &activate);

    private:
        Activation activation_;
        std::vector<id_t> agents_;
        step_t steps_ = 0;
};

}
