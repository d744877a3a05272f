#pragma once
#include <stdexcept>
#include <string>

namespace bankres {

/** Exception thrown when a model or batch is given an invalid parameter combination (zero grid
 * dimensions, a reserve ratio outside [0, 1], and so on).  Parameters are validated before any
 * run starts, so this is always raised before a partial run could exist.
 */
class ConfigurationError : public std::invalid_argument {
    public:
        /// ConfigurationError constructor.  \param what an error message
        explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
        ConfigurationError() = delete;
};

/** Exception thrown when an internal consistency rule is broken: an agent left with negative cash,
 * bank totals that no longer match the sums over agents, or a balance that would be pushed below
 * zero.  This always indicates a programming defect; it aborts the run rather than clamping the
 * offending value.
 */
class InvariantViolation : public std::logic_error {
    public:
        /// InvariantViolation constructor.  \param what an error message
        explicit InvariantViolation(const std::string &what) : std::logic_error(what) {}
        InvariantViolation() = delete;
};

}
