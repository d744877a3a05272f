#include <bankres/Position.hpp>
#include <algorithm>
#include <cstdlib>

namespace bankres {

int Position::chebyshev(const Position &other) const {
    return std::max(std::abs(x - other.x), std::abs(y - other.y));
}

int Position::manhattan(const Position &other) const {
    return std::abs(x - other.x) + std::abs(y - other.y);
}

std::ostream& operator<<(std::ostream &os, const Position &p) {
    return os << "Position[" << p.x << ", " << p.y << "]";
}

}
