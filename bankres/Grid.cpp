#include <bankres/Grid.hpp>
#include <bankres/errors.hpp>
#include <bankres/random/util.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace bankres {

namespace {
const std::vector<Position> moore_offsets{
    {-1, -1}, {0, -1}, {1, -1},
    {-1,  0},          {1,  0},
    {-1,  1}, {0,  1}, {1,  1}};
const std::vector<Position> von_neumann_offsets{
    {0, -1}, {-1, 0}, {1, 0}, {0, 1}};

const std::vector<id_t> nobody;

// Wraps v into [0, n)
inline int wrap_coord(int v, int n) {
    int r = v % n;
    return r < 0 ? r + n : r;
}
}

std::string to_string(Topology t) {
    return t == Topology::torus ? "torus" : "bounded";
}

std::string to_string(Neighbourhood n) {
    return n == Neighbourhood::von_neumann ? "von_neumann" : "moore";
}

Grid::Grid(int width, int height, Topology topology, Neighbourhood neighbourhood)
    : width_{width}, height_{height}, topology_{topology}, neighbourhood_{neighbourhood} {
    if (width_ <= 0 or height_ <= 0)
        throw std::invalid_argument("Grid dimensions must be positive");
}

bool Grid::contains(const Position &p) const {
    return p.x >= 0 and p.x < width_ and p.y >= 0 and p.y < height_;
}

Position Grid::normalize(const Position &p) const {
    if (topology_ == Topology::torus)
        return Position(wrap_coord(p.x, width_), wrap_coord(p.y, height_));

    return Position(std::min(std::max(p.x, 0), width_ - 1), std::min(std::max(p.y, 0), height_ - 1));
}

const std::vector<Position>& Grid::offsets() const {
    return neighbourhood_ == Neighbourhood::moore ? moore_offsets : von_neumann_offsets;
}

Position Grid::randomAdjacent(const Position &p, random::rng_t &rng) const {
    const auto &off = offsets();
    return normalize(p + off[random::rindex(rng, off.size())]);
}

Position Grid::randomCell(random::rng_t &rng) const {
    int x = static_cast<int>(random::rindex(rng, static_cast<size_t>(width_)));
    int y = static_cast<int>(random::rindex(rng, static_cast<size_t>(height_)));
    return Position(x, y);
}

void Grid::require(const Position &p) const {
    if (not contains(p)) {
        std::ostringstream msg;
        msg << p << " is outside the " << width_ << "x" << height_ << " grid";
        throw std::out_of_range(msg.str());
    }
}

void Grid::place(id_t id, const Position &p) {
    require(p);
    occupied_[p].push_back(id);
    population_++;
}

void Grid::move(id_t id, const Position &from, const Position &to) {
    require(to);
    require(from);
    auto cell = occupied_.find(from);
    std::vector<id_t>::iterator it;
    bool found = false;
    if (cell != occupied_.end()) {
        it = std::find(cell->second.begin(), cell->second.end(), id);
        found = it != cell->second.end();
    }
    if (not found) {
        std::ostringstream msg;
        msg << "agent " << id << " is not recorded at " << from;
        throw InvariantViolation(msg.str());
    }
    if (from == to) return;

    cell->second.erase(it);
    if (cell->second.empty()) occupied_.erase(cell);
    occupied_[to].push_back(id);
}

const std::vector<id_t>& Grid::colocated(const Position &p) const {
    require(p);
    auto cell = occupied_.find(p);
    return cell == occupied_.end() ? nobody : cell->second;
}

}
