#include <bankres/Parameters.hpp>
#include <bankres/errors.hpp>
#include <string>

namespace bankres {

std::string to_string(Activation a) {
    return a == Activation::sequential ? "sequential" : "random";
}

void Parameters::validate() const {
    if (width <= 0 or height <= 0)
        throw ConfigurationError("grid dimensions must be positive (got " + std::to_string(width) + "x" + std::to_string(height) + ")");
    if (agents == 0)
        throw ConfigurationError("agent count must be positive");
    // Written this way so that NaN is rejected too
    if (not(reserve_ratio >= 0.0 and reserve_ratio <= 1.0))
        throw ConfigurationError("reserve ratio must be in [0, 1] (got " + std::to_string(reserve_ratio) + ")");
    if (initial_cash < 0)
        throw ConfigurationError("initial cash cannot be negative");
    if (comfortable_cash < 0)
        throw ConfigurationError("comfortable cash threshold cannot be negative");
    if (rich_threshold < 0 or poor_threshold < 0)
        throw ConfigurationError("wealth class thresholds cannot be negative");
}

std::ostream& operator<<(std::ostream &os, const Parameters &p) {
    return os << "grid=" << p.width << "x" << p.height << " topology=" << to_string(p.topology)
        << " neighbourhood=" << to_string(p.neighbourhood) << " agents=" << p.agents
        << " initial_cash=" << p.initial_cash << " reserve_ratio=" << p.reserve_ratio
        << " comfortable_cash=" << p.comfortable_cash << " offset_loans=" << (p.offset_loans_with_savings ? "yes" : "no")
        << " rich_threshold=" << p.rich_threshold << " poor_threshold=" << p.poor_threshold
        << " activation=" << to_string(p.activation) << " seed=" << p.seed;
}

}
