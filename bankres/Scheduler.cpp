#include <bankres/Scheduler.hpp>
#include <bankres/random/util.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace bankres {

void Scheduler::add(id_t id) {
    if (std::find(agents_.begin(), agents_.end(), id) != agents_.end())
        throw std::invalid_argument("agent " + std::to_string(id) + " is already scheduled");
    agents_.push_back(id);
}

std::vector<id_t> Scheduler::order(random::rng_t &rng) const {
    std::vector<id_t> o(agents_);
    if (activation_ == Activation::random)
        random::shuffle(rng, o);
    return o;
}

void Scheduler::step(random::rng_t &rng, const std::function<void(id_t)> &activate) {
    for (const id_t id : order(rng))
        activate(id);
    steps_++;
}

}
