// Tests of the Grid's edge policies, random movement and co-location index.

#include <bankres/Grid.hpp>
#include <bankres/errors.hpp>
#include <bankres/random/rng.hpp>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace bankres;
using ids = std::vector<bankres::id_t>;

TEST(Grid, Construction) {
    Grid g(10, 5);
    EXPECT_EQ(10, g.width());
    EXPECT_EQ(5, g.height());
    EXPECT_EQ(Topology::bounded, g.topology());
    EXPECT_EQ(Neighbourhood::moore, g.neighbourhood());
    EXPECT_EQ(0u, g.population());

    EXPECT_THROW(Grid(0, 5), std::invalid_argument);
    EXPECT_THROW(Grid(5, 0), std::invalid_argument);
    EXPECT_THROW(Grid(-3, 5), std::invalid_argument);
}

TEST(Grid, Contains) {
    Grid g(3, 4);
    EXPECT_TRUE(g.contains({0, 0}));
    EXPECT_TRUE(g.contains({2, 3}));
    EXPECT_FALSE(g.contains({3, 0}));
    EXPECT_FALSE(g.contains({0, 4}));
    EXPECT_FALSE(g.contains({-1, 2}));
}

TEST(Grid, BoundedClips) {
    Grid g(5, 5, Topology::bounded);
    EXPECT_EQ(Position(0, 0), g.normalize({-1, -1}));
    EXPECT_EQ(Position(4, 0), g.normalize({5, -1}));
    EXPECT_EQ(Position(4, 4), g.normalize({7, 9}));
    EXPECT_EQ(Position(2, 3), g.normalize({2, 3}));
}

TEST(Grid, TorusWraps) {
    Grid g(5, 4, Topology::torus);
    EXPECT_EQ(Position(4, 3), g.normalize({-1, -1}));
    EXPECT_EQ(Position(0, 0), g.normalize({5, 4}));
    EXPECT_EQ(Position(3, 1), g.normalize({-2, 9}));
    EXPECT_EQ(Position(2, 3), g.normalize({2, 3}));
}

TEST(Grid, Offsets) {
    Grid moore(3, 3, Topology::bounded, Neighbourhood::moore);
    Grid vn(3, 3, Topology::bounded, Neighbourhood::von_neumann);
    ASSERT_EQ(8u, moore.offsets().size());
    ASSERT_EQ(4u, vn.offsets().size());
    for (const auto &o : moore.offsets()) EXPECT_EQ(1, o.chebyshev({0, 0}));
    for (const auto &o : vn.offsets()) EXPECT_EQ(1, o.manhattan({0, 0}));
}

TEST(Movement, BoundedStaysOnGrid) {
    Grid g(3, 3, Topology::bounded);
    random::rng_t rng(7);
    std::set<std::pair<int,int>> seen;
    for (int i = 0; i < 500; i++) {
        Position p = g.randomAdjacent({0, 0}, rng);
        ASSERT_TRUE(g.contains(p));
        ASSERT_LE(p.chebyshev({0, 0}), 1);
        seen.insert({p.x, p.y});
    }
    // From the corner: clipped moves stay put, the others reach the three neighbours
    EXPECT_EQ(4u, seen.size());
    EXPECT_TRUE(seen.count({0, 0}));
}

TEST(Movement, TorusReachesAllNeighbours) {
    Grid g(5, 5, Topology::torus);
    random::rng_t rng(11);
    std::set<std::pair<int,int>> seen;
    for (int i = 0; i < 500; i++) {
        Position p = g.randomAdjacent({0, 0}, rng);
        ASSERT_TRUE(g.contains(p));
        ASSERT_NE(Position(0, 0), p);
        seen.insert({p.x, p.y});
    }
    std::set<std::pair<int,int>> expect{{4,4}, {0,4}, {1,4}, {4,0}, {1,0}, {4,1}, {0,1}, {1,1}};
    EXPECT_EQ(expect, seen);
}

TEST(Movement, VonNeumann) {
    Grid g(5, 5, Topology::torus, Neighbourhood::von_neumann);
    random::rng_t rng(3);
    std::set<std::pair<int,int>> seen;
    for (int i = 0; i < 200; i++) {
        Position p = g.randomAdjacent({2, 2}, rng);
        ASSERT_EQ(1, p.manhattan({2, 2}));
        seen.insert({p.x, p.y});
    }
    EXPECT_EQ(4u, seen.size());
}

TEST(Movement, Reproducible) {
    Grid g(10, 10, Topology::bounded);
    random::rng_t rng1(42), rng2(42);
    Position a(5, 5), b(5, 5);
    for (int i = 0; i < 100; i++) {
        a = g.randomAdjacent(a, rng1);
        b = g.randomAdjacent(b, rng2);
        ASSERT_EQ(a, b);
    }
}

TEST(Occupancy, Colocated) {
    Grid g(4, 4);
    g.place(1, {1, 1});
    g.place(2, {1, 1});
    g.place(3, {2, 1});
    EXPECT_EQ(3u, g.population());

    EXPECT_EQ(ids({1, 2}), g.colocated({1, 1}));
    // Neighbouring cells don't count
    EXPECT_EQ(ids({3}), g.colocated({2, 1}));
    EXPECT_TRUE(g.colocated({0, 0}).empty());

    g.move(1, {1, 1}, {2, 1});
    EXPECT_EQ(ids({2}), g.colocated({1, 1}));
    // Arrival order is kept
    EXPECT_EQ(ids({3, 1}), g.colocated({2, 1}));

    // Staying put changes nothing
    g.move(3, {2, 1}, {2, 1});
    EXPECT_EQ(ids({3, 1}), g.colocated({2, 1}));
    EXPECT_EQ(3u, g.population());
}

TEST(Occupancy, Errors) {
    Grid g(4, 4);
    EXPECT_THROW(g.place(1, {4, 0}), std::out_of_range);
    EXPECT_THROW(g.colocated({0, -1}), std::out_of_range);

    g.place(1, {0, 0});
    EXPECT_THROW(g.move(1, {0, 0}, {0, 4}), std::out_of_range);
    EXPECT_THROW(g.move(2, {0, 0}, {1, 0}), InvariantViolation);
    EXPECT_THROW(g.move(1, {1, 1}, {1, 0}), InvariantViolation);
    EXPECT_EQ(ids({1}), g.colocated({0, 0}));
}

TEST(Occupancy, VacatedCellsEmpty) {
    Grid g(3, 3, Topology::torus);
    g.place(7, {2, 2});
    g.move(7, {2, 2}, {0, 0});
    EXPECT_TRUE(g.colocated({2, 2}).empty());
    g.move(7, {0, 0}, {2, 2});
    EXPECT_EQ(ids({7}), g.colocated({2, 2}));
    EXPECT_TRUE(g.colocated({0, 0}).empty());
    EXPECT_EQ(1u, g.population());
}

TEST(Occupancy, LargeSparseGrid) {
    // Storage follows the agents, not the area
    Grid g(100000, 100000, Topology::torus);
    random::rng_t rng(8);
    g.place(1, {99999, 99999});
    g.place(2, {0, 0});
    g.move(1, {99999, 99999}, g.normalize({100000, 100000}));
    EXPECT_EQ(ids({2, 1}), g.colocated({0, 0}));
    EXPECT_TRUE(g.colocated({99999, 99999}).empty());
    EXPECT_TRUE(g.contains(g.randomCell(rng)));
}
