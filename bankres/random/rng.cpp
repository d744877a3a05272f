#include <bankres/random/rng.hpp>
#include <random>

namespace bankres { namespace random {

rng_t::result_type seed() {
    // random_device produces 32-bit values; combine two to fill the 64-bit seed
    std::random_device rd;
    rng_t::result_type s = rd();
    s = (s << 32) | rd();
    return s;
}

}}
