#include <gtest/gtest.h>

#include "hex/HexMap.h"
#include "path/Pathfinder.h"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <map>
#include <random>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace hexkit;

namespace
{
// 5x5 parallelogram of axial coordinates around the origin
HexMap<> MakeOpenMap()
{
    HexMap<> map;
    for (int q = -2; q <= 2; q++)
    {
        for (int r = -2; r <= 2; r++)
        {
            map.Insert(CubeCoord::FromAxial(q, r), HexCell{});
        }
    }
    return map;
}

HexMap<> MakeRandomMap(int radius, unsigned seed)
{
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> cost(1, 5);
    std::uniform_int_distribution<int> wall(0, 5);

    HexMap<> map;
    for (const auto& c : HexAlgebra::Range(CubeCoord::Zero(), radius))
    {
        map.Insert(c, HexCell{cost(rng), wall(rng) != 0, 0});
    }
    map.Get(CubeCoord::Zero())->passable = true;
    return map;
}

// Path must start and end correctly, move one step at a time over passable cells,
// and report the sum of entry costs.
void ExpectValidPath(const HexMap<>& map, const Path& path, const CubeCoord& start, const CubeCoord& goal)
{
    ASSERT_FALSE(path.cells.empty());
    EXPECT_EQ(path.cells.front(), start);
    EXPECT_EQ(path.cells.back(), goal);

    int64_t cost = 0;
    for (size_t i = 1; i < path.cells.size(); i++)
    {
        EXPECT_EQ(CubeCoord::Distance(path.cells[i - 1], path.cells[i]), 1);
        EXPECT_TRUE(map.IsPassable(path.cells[i]));
        cost += map.MovementCost(path.cells[i]);
    }
    EXPECT_EQ(path.totalCost, cost);
}

// Relax every edge until nothing changes
std::map<CubeCoord, int> RelaxAllEdges(const HexMap<>& map, const CubeCoord& start)
{
    std::map<CubeCoord, int> best;
    for (const auto& [coord, cell] : map)
    {
        best[coord] = INT_MAX;
    }
    best[start] = 0;

    bool changed = true;
    while (changed)
    {
        changed = false;
        for (const auto& [coord, cell] : map)
        {
            if (best[coord] == INT_MAX) continue;
            for (const auto& neighbor : map.Neighbors(coord))
            {
                if (!map.IsPassable(neighbor)) continue;
                int candidate = best[coord] + map.MovementCost(neighbor);
                if (candidate < best[neighbor])
                {
                    best[neighbor] = candidate;
                    changed = true;
                }
            }
        }
    }
    return best;
}

// Cheapest simple path by trying every one of them
void Enumerate(const HexMap<>& map, const CubeCoord& at, const CubeCoord& goal, int cost,
               std::set<CubeCoord>& visited, int& best)
{
    if (at == goal)
    {
        best = std::min(best, cost);
        return;
    }
    for (const auto& neighbor : map.Neighbors(at))
    {
        if (!map.IsPassable(neighbor) || visited.count(neighbor)) continue;
        visited.insert(neighbor);
        Enumerate(map, neighbor, goal, cost + map.MovementCost(neighbor), visited, best);
        visited.erase(neighbor);
    }
}
}

TEST(Pathfinder, StraightPathOnOpenMap) {
    HexMap<> map = MakeOpenMap();
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord(0, 0, 0), CubeCoord(2, -1, -1));
    ASSERT_TRUE(result.Found());
    EXPECT_FALSE(result.bounded);
    EXPECT_EQ(result.path->cells.size(), 3u);
    EXPECT_EQ(result.path->totalCost, 2);
    ExpectValidPath(map, *result.path, CubeCoord(0, 0, 0), CubeCoord(2, -1, -1));
}

TEST(Pathfinder, StartEqualsGoal) {
    HexMap<> map = MakeOpenMap();
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord(1, 0, -1), CubeCoord(1, 0, -1));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.path->cells, std::vector<CubeCoord>{CubeCoord(1, 0, -1)});
    EXPECT_EQ(result.path->totalCost, 0);
}

TEST(Pathfinder, GoalOffMapHasNoPath) {
    HexMap<> map = MakeOpenMap();
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord::Zero(), CubeCoord(9, -9, 0));
    EXPECT_FALSE(result.Found());
    EXPECT_FALSE(result.bounded);
}

TEST(Pathfinder, StartOffMapHasNoPath) {
    HexMap<> map = MakeOpenMap();
    Pathfinder pathfinder(map);
    EXPECT_FALSE(pathfinder.FindPath(CubeCoord(9, -9, 0), CubeCoord::Zero()).Found());
}

TEST(Pathfinder, ImpassableGoalHasNoPath) {
    HexMap<> map = MakeOpenMap();
    map.Get(CubeCoord(2, -1, -1))->passable = false;
    Pathfinder pathfinder(map);
    EXPECT_FALSE(pathfinder.FindPath(CubeCoord::Zero(), CubeCoord(2, -1, -1)).Found());
}

TEST(Pathfinder, ImpassableStartIsAllowed) {
    HexMap<> map = MakeOpenMap();
    map.Get(CubeCoord::Zero())->passable = false;
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord::Zero(), CubeCoord(0, 2, -2));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.path->totalCost, 2);
}

TEST(Pathfinder, EnclosedGoalIsUnreachable) {
    HexMap<> map;
    map.FillHexagon(CubeCoord::Zero(), 3, HexCell{});
    for (const auto& c : HexAlgebra::Ring(CubeCoord::Zero(), 1))
    {
        map.Get(c)->passable = false;
    }
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord(3, -3, 0), CubeCoord::Zero());
    EXPECT_FALSE(result.Found());
    EXPECT_FALSE(result.bounded);
    EXPECT_GT(result.expandedCount, 0);
}

TEST(Pathfinder, DetoursAroundWall) {
    HexMap<> map;
    map.FillHexagon(CubeCoord::Zero(), 3, HexCell{});
    // Wall along the q = 0 column except the bottom end
    for (int r = -3; r <= 2; r++)
    {
        map.Get(CubeCoord::FromAxial(0, r))->passable = false;
    }
    Pathfinder pathfinder(map);

    CubeCoord start(-2, 0, 2);
    CubeCoord goal(2, 0, -2);
    PathResult result = pathfinder.FindPath(start, goal);
    ASSERT_TRUE(result.Found());
    ExpectValidPath(map, *result.path, start, goal);
    EXPECT_GT(result.path->totalCost, CubeCoord::Distance(start, goal));
    EXPECT_NE(std::find(result.path->cells.begin(), result.path->cells.end(), CubeCoord(0, 3, -3)),
              result.path->cells.end());
}

TEST(Pathfinder, AvoidsExpensiveCells) {
    HexMap<> map = MakeOpenMap();
    map.Get(CubeCoord(1, 0, -1))->movementCost = 10;
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord(0, 0, 0), CubeCoord(2, 0, -2));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.path->totalCost, 3);
    ExpectValidPath(map, *result.path, CubeCoord(0, 0, 0), CubeCoord(2, 0, -2));
}

TEST(Pathfinder, MatchesExhaustiveSearchOnSmallMap) {
    for (unsigned seed = 1; seed <= 5; seed++)
    {
        HexMap<> map = MakeRandomMap(1, seed);
        Pathfinder pathfinder(map);
        for (const auto& start : map.GetAllCoords())
        {
            for (const auto& goal : map.GetAllCoords())
            {
                int best = INT_MAX;
                if (map.IsPassable(goal))
                {
                    std::set<CubeCoord> visited{start};
                    Enumerate(map, start, goal, 0, visited, best);
                }

                PathResult result = pathfinder.FindPath(start, goal);
                if (best == INT_MAX)
                {
                    EXPECT_FALSE(result.Found()) << start << " -> " << goal;
                    continue;
                }
                ASSERT_TRUE(result.Found()) << start << " -> " << goal;
                EXPECT_EQ(result.path->totalCost, best) << start << " -> " << goal;
                ExpectValidPath(map, *result.path, start, goal);
            }
        }
    }
}

TEST(Pathfinder, MatchesRelaxationOnLargerMap) {
    for (unsigned seed = 11; seed <= 14; seed++)
    {
        HexMap<> map = MakeRandomMap(4, seed);
        Pathfinder pathfinder(map);
        std::map<CubeCoord, int> best = RelaxAllEdges(map, CubeCoord::Zero());

        for (const auto& goal : map.GetAllCoords())
        {
            PathResult result = pathfinder.FindPath(CubeCoord::Zero(), goal);
            if (!map.IsPassable(goal) && goal != CubeCoord::Zero())
            {
                EXPECT_FALSE(result.Found());
                continue;
            }
            if (best[goal] == INT_MAX)
            {
                EXPECT_FALSE(result.Found()) << goal;
                continue;
            }
            ASSERT_TRUE(result.Found()) << goal;
            EXPECT_EQ(result.path->totalCost, best[goal]) << goal;
            ExpectValidPath(map, *result.path, CubeCoord::Zero(), goal);
        }
    }
}

TEST(Pathfinder, RepeatedQueriesAreIdentical) {
    HexMap<> map = MakeRandomMap(5, 99);
    Pathfinder pathfinder(map);

    for (const auto& goal : HexAlgebra::Ring(CubeCoord::Zero(), 5))
    {
        PathResult first = pathfinder.FindPath(CubeCoord::Zero(), goal);
        PathResult second = pathfinder.FindPath(CubeCoord::Zero(), goal);
        ASSERT_EQ(first.Found(), second.Found());
        if (first.Found())
        {
            EXPECT_EQ(first.path->cells, second.path->cells);
        }
        EXPECT_EQ(first.expandedCount, second.expandedCount);
    }
}

TEST(Pathfinder, ConcurrentQueriesShareMap) {
    HexMap<> map = MakeRandomMap(6, 7);
    Pathfinder pathfinder(map);
    const auto goals = HexAlgebra::Ring(CubeCoord::Zero(), 6);

    std::vector<PathResult> expected;
    for (const auto& goal : goals)
    {
        expected.push_back(pathfinder.FindPath(CubeCoord::Zero(), goal));
    }

    std::vector<std::vector<PathResult>> results(4);
    std::vector<std::thread> threads;
    for (auto& slot : results)
    {
        threads.emplace_back([&pathfinder, &goals, &slot]() {
            for (const auto& goal : goals)
            {
                slot.push_back(pathfinder.FindPath(CubeCoord::Zero(), goal));
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    for (const auto& slot : results)
    {
        ASSERT_EQ(slot.size(), expected.size());
        for (size_t i = 0; i < slot.size(); i++)
        {
            ASSERT_EQ(slot[i].Found(), expected[i].Found());
            if (slot[i].Found())
            {
                EXPECT_EQ(slot[i].path->cells, expected[i].path->cells);
            }
        }
    }
}

TEST(Pathfinder, ExpansionLimitBoundsSearch) {
    HexMap<> map;
    map.FillHexagon(CubeCoord::Zero(), 6, HexCell{});
    PathfinderConfig config;
    config.maxExpansions = 1;
    Pathfinder pathfinder(map, config);

    PathResult result = pathfinder.FindPath(CubeCoord::Zero(), CubeCoord(6, -6, 0));
    EXPECT_FALSE(result.Found());
    EXPECT_TRUE(result.bounded);
    EXPECT_EQ(result.expandedCount, 1);

    // A neighbor is found before the limit is reached
    EXPECT_TRUE(pathfinder.FindPath(CubeCoord::Zero(), CubeCoord(1, 0, -1)).Found());
}

TEST(Pathfinder, CostLimitBoundsSearch) {
    HexMap<> map;
    map.FillHexagon(CubeCoord::Zero(), 6, HexCell{});

    PathfinderConfig tight;
    tight.maxCost = 2;
    PathResult result = Pathfinder(map, tight).FindPath(CubeCoord::Zero(), CubeCoord(5, -5, 0));
    EXPECT_FALSE(result.Found());
    EXPECT_TRUE(result.bounded);

    PathfinderConfig loose;
    loose.maxCost = 5;
    result = Pathfinder(map, loose).FindPath(CubeCoord::Zero(), CubeCoord(5, -5, 0));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.path->totalCost, 5);
    EXPECT_FALSE(result.bounded);
}

TEST(Pathfinder, NegativeCostTreatedAsZero) {
    HexMap<> map = MakeOpenMap();
    map.Get(CubeCoord(1, 0, -1))->movementCost = -4;
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord(0, 0, 0), CubeCoord(2, 0, -2));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.path->totalCost, 1);
}

TEST(Pathfinder, LargeStepCostsDoNotWrap) {
    HexMap<> map;
    map.Insert(CubeCoord(0, 0, 0), HexCell{});
    map.Insert(CubeCoord(1, 0, -1), HexCell{INT_MAX - 1, true, 0});
    map.Insert(CubeCoord(2, 0, -2), HexCell{INT_MAX - 1, true, 0});
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord(0, 0, 0), CubeCoord(2, 0, -2));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.path->cells.size(), 3u);
    EXPECT_EQ(result.path->totalCost, 2 * static_cast<int64_t>(INT_MAX - 1));
    ExpectValidPath(map, *result.path, CubeCoord(0, 0, 0), CubeCoord(2, 0, -2));
}

TEST(Pathfinder, LargeStepCostPrefersCheapDetour) {
    HexMap<> map = MakeOpenMap();
    map.Get(CubeCoord(1, 0, -1))->movementCost = IMPASSABLE_COST;
    Pathfinder pathfinder(map);

    PathResult result = pathfinder.FindPath(CubeCoord(0, 0, 0), CubeCoord(2, 0, -2));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.path->totalCost, 3);
}

TEST(Pathfinder, ReachableIgnoresHugeCostsBeyondBudget) {
    HexMap<> map;
    map.Insert(CubeCoord(0, 0, 0), HexCell{});
    map.Insert(CubeCoord(1, 0, -1), HexCell{INT_MAX, true, 0});
    map.Insert(CubeCoord(-1, 0, 1), HexCell{3, true, 0});
    Pathfinder pathfinder(map);

    std::map<CubeCoord, int> reached = pathfinder.FindReachable(CubeCoord::Zero(), INT_MAX - 1);
    EXPECT_EQ(reached.size(), 2u);
    EXPECT_EQ(reached[CubeCoord(-1, 0, 1)], 3);
    EXPECT_FALSE(reached.count(CubeCoord(1, 0, -1)));
}

TEST(Pathfinder, ReachableWithinBudgetOnOpenMap) {
    HexMap<> map;
    map.FillHexagon(CubeCoord::Zero(), 4, HexCell{});
    Pathfinder pathfinder(map);

    std::map<CubeCoord, int> reached = pathfinder.FindReachable(CubeCoord(1, -1, 0), 2);
    auto area = HexAlgebra::Range(CubeCoord(1, -1, 0), 2);
    ASSERT_EQ(reached.size(), area.size());
    for (const auto& c : area)
    {
        ASSERT_TRUE(reached.count(c)) << c;
        EXPECT_EQ(reached[c], CubeCoord::Distance(c, CubeCoord(1, -1, 0)));
    }
}

TEST(Pathfinder, ReachableMatchesRelaxation) {
    HexMap<> map = MakeRandomMap(4, 21);
    Pathfinder pathfinder(map);
    std::map<CubeCoord, int> best = RelaxAllEdges(map, CubeCoord::Zero());

    std::map<CubeCoord, int> reached = pathfinder.FindReachable(CubeCoord::Zero(), 6);
    for (const auto& [coord, cost] : best)
    {
        if (cost <= 6)
        {
            ASSERT_TRUE(reached.count(coord)) << coord;
            EXPECT_EQ(reached[coord], cost);
        }
        else
        {
            EXPECT_FALSE(reached.count(coord)) << coord;
        }
    }
}

TEST(Pathfinder, ReachableEdgeCases) {
    HexMap<> map = MakeOpenMap();
    Pathfinder pathfinder(map);

    std::map<CubeCoord, int> reached = pathfinder.FindReachable(CubeCoord::Zero(), 0);
    EXPECT_EQ(reached.size(), 1u);
    EXPECT_EQ(reached[CubeCoord::Zero()], 0);

    EXPECT_TRUE(pathfinder.FindReachable(CubeCoord(9, -9, 0), 5).empty());
    EXPECT_THROW((void)pathfinder.FindReachable(CubeCoord::Zero(), -1), std::invalid_argument);
}
