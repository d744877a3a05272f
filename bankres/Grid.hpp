#pragma once
#include <bankres/Position.hpp>
#include <bankres/noncopyable.hpp>
#include <bankres/random/rng.hpp>
#include <bankres/types.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace bankres {

/** Edge policy of a Grid.  With `bounded`, a move that would leave the grid is clipped to the
 * nearest cell on the boundary (so an agent on an edge may stay where it is); with `torus`, the
 * grid wraps around in both dimensions.
 */
enum class Topology { bounded, torus };

/** Which cells count as adjacent: the 8 surrounding cells (`moore`) or only the 4 orthogonal
 * ones (`von_neumann`).
 */
enum class Neighbourhood { moore, von_neumann };

/// Returns "bounded" or "torus".
std::string to_string(Topology t);
/// Returns "moore" or "von_neumann".
std::string to_string(Neighbourhood n);

/** Two-dimensional grid of cells on which people move.  Any number of agents may share a cell.
 *
 * The grid stores no per-cell state: occupancy is an index from occupied positions to the agents
 * on them, so memory grows with the population rather than the grid area.  The index is a pure
 * function of the agents' positions: it is updated by place() and move(), which the Model calls
 * whenever a Person is created or relocated, and agents within a cell are kept in arrival order
 * so that colocated() (and hence trade partner selection) is deterministic.
 */
class Grid final : private noncopyable {
    public:
        /** Creates an empty grid of the given dimensions.
         *
         * \throws std::invalid_argument if width or height is not positive.
         */
        Grid(int width, int height, Topology topology = Topology::bounded,
                Neighbourhood neighbourhood = Neighbourhood::moore);

        /// The number of columns.
        int width() const { return width_; }
        /// The number of rows.
        int height() const { return height_; }
        /// The edge policy.
        Topology topology() const { return topology_; }
        /// The adjacency rule used by randomAdjacent().
        Neighbourhood neighbourhood() const { return neighbourhood_; }

        /// Returns true if `p` is a cell of this grid.
        bool contains(const Position &p) const;

        /** Maps an arbitrary position onto the grid according to the topology: clipped to the
         * nearest boundary cell for a bounded grid, wrapped around for a torus.  Positions already
         * on the grid are returned unchanged.
         */
        Position normalize(const Position &p) const;

        /** Returns the movement offsets for the grid's neighbourhood: 8 for Moore (in row-major
         * order, starting at (-1,-1)), 4 for von Neumann (up, left, right, down).
         */
        const std::vector<Position>& offsets() const;

        /** Returns a cell adjacent to `p`, chosen uniformly among the neighbourhood's offsets and
         * then normalized onto the grid.  One random draw is consumed.  On a bounded grid the
         * result may equal `p` when `p` is on an edge; the result is always on the grid.
         */
        Position randomAdjacent(const Position &p, random::rng_t &rng) const;

        /// Returns a cell drawn uniformly from the whole grid (two draws: x, then y).
        Position randomCell(random::rng_t &rng) const;

        /** Records agent `id` as occupying `p`.
         *
         * \throws std::out_of_range if `p` is not on the grid.
         */
        void place(id_t id, const Position &p);

        /** Moves agent `id` from cell `from` to cell `to`; the agent becomes the last arrival at
         * `to`.  Moving to the same cell leaves the index untouched.
         *
         * \throws std::out_of_range if `to` is not on the grid.
         * \throws InvariantViolation if `id` is not recorded at `from`.
         */
        void move(id_t id, const Position &from, const Position &to);

        /** Returns the ids of every agent on exactly cell `p`, in arrival order.  Agents on
         * neighbouring cells are not included.  The reference stays valid until the next place()
         * or move().
         *
         * \throws std::out_of_range if `p` is not on the grid.
         */
        const std::vector<id_t>& colocated(const Position &p) const;

        /// Returns the number of agents placed on the grid.
        size_t population() const { return population_; }

    private:
        int width_, height_;
        Topology topology_;
        Neighbourhood neighbourhood_;
        size_t population_ = 0;
        // Occupied cells only; a cell is erased when its last agent leaves
        std::unordered_map<Position, std::vector<id_t>> occupied_;

        // Throws std::out_of_range unless `p` is on the grid
        void require(const Position &p) const;
};

}
