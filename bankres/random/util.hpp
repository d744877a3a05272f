#pragma once
#include <bankres/random/rng.hpp>
#include <bankres/types.hpp>
#include <boost/random/bernoulli_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

// Small drawing helpers shared by the grid, the scheduler and the agents.  Boost.Random
// distributions are used rather than the <random> ones because their algorithms are fixed by
// boost, so a given seed yields the same run with any standard library.

namespace bankres { namespace random {

/// Returns true with probability `p`.
inline bool rbernoulli(rng_t &rng, double p = 0.5) {
    return boost::random::bernoulli_distribution<double>(p)(rng);
}

/** Returns an index drawn uniformly from [0, n).
 *
 * \throws std::invalid_argument if n is 0.
 */
inline size_t rindex(rng_t &rng, size_t n) {
    if (n == 0) throw std::invalid_argument("rindex() requires a non-empty range");
    return boost::random::uniform_int_distribution<size_t>(0, n - 1)(rng);
}

/** Shuffles the given vector in place with a Fisher-Yates shuffle.  std::shuffle is not used
 * because its algorithm is implementation-defined.
 */
template <typename T>
void shuffle(rng_t &rng, std::vector<T> &v) {
    for (size_t i = v.size(); i > 1; i--) {
        size_t j = rindex(rng, i);
        if (j != i - 1) std::swap(v[i - 1], v[j]);
    }
}

}}
