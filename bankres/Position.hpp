#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

namespace bankres {

/** Class representing a cell of the two-dimensional simulation grid.  Coordinates are integers;
 * whether a Position is actually inside a grid is up to the Grid (see Grid::contains()).
 */
class Position final {
    public:
        /// Default constructor; creates the origin cell (0, 0).
        Position() = default;

        /// Creates a Position at the given coordinates.
        Position(int x, int y) : x{x}, y{y} {}

        /// The horizontal coordinate (column).
        int x = 0;
        /// The vertical coordinate (row).
        int y = 0;

        /// Equality; true iff both coordinates are equal.
        bool operator==(const Position &other) const { return x == other.x and y == other.y; }

        /// Inequality; true iff equality is false.
        bool operator!=(const Position &other) const { return not(*this == other); }

        /// Adding two positions adds the coordinates; used to apply a movement offset.
        Position operator+(const Position &add) const { return Position(x + add.x, y + add.y); }

        /** Returns the Chebyshev (king's move) distance between this position and another.  Two
         * positions are Moore neighbours when this is 1.
         */
        int chebyshev(const Position &other) const;

        /** Returns the Manhattan distance between this position and another.  Two positions are
         * von Neumann neighbours when this is 1.
         */
        int manhattan(const Position &other) const;

        /** Overloaded so that a Position can be sent to an output stream, resulting in output such
         * as `Position[3, 7]`.
         */
        friend std::ostream& operator<<(std::ostream &os, const Position &p);
};

}

namespace std {
/// Hash specialization so that a Position can key an unordered container (see Grid).
template <> struct hash<bankres::Position> {
    size_t operator()(const bankres::Position &p) const {
        return hash<std::uint64_t>()((static_cast<std::uint64_t>(static_cast<std::uint32_t>(p.x)) << 32)
                | static_cast<std::uint32_t>(p.y));
    }
};
}
