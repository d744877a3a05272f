#pragma once
#include <boost/random/mersenne_twister.hpp>
#include <bankres/noncopyable.hpp>

namespace bankres {
/// Namespace for random number generation
namespace random {

/** The bankres RNG class, currently boost::random::mt19937_64.  The wrapper class is non-copyable,
 * thus ensuring that a Model's generator isn't accidentally copied (which would silently fork
 * the random sequence of a run).
 *
 * There is no global generator: every Model owns one rng_t, seeded from its Parameters, and
 * passes it explicitly to everything that draws random numbers.  This keeps runs reproducible
 * and lets independent Models run on different threads.
 */
class rng_t : public boost::random::mt19937_64, private bankres::noncopyable {
    public:
        /// Seeds the generator with the given value.
        explicit rng_t(result_type s) : boost::random::mt19937_64(s) {}
};

/** Returns a fresh seed obtained from the operating system via std::random_device.  Used when no
 * explicit seed is configured; the seed actually used is always recorded so that a run can be
 * repeated.
 */
rng_t::result_type seed();

}}
