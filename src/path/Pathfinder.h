//
// Pathfinder.h - A* shortest path search over a hex map
//

#ifndef HEXKIT_PATHFINDER_H
#define HEXKIT_PATHFINDER_H

#include "../hex/HexCoord.h"
#include "../hex/HexGraph.h"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace hexkit
{

struct PathfinderConfig {
    int maxExpansions = 0; // Stop after expanding this many nodes (0 = unlimited)
    int maxCost = 0; // Never open nodes costlier than this (0 = unlimited)
};

struct Path {
    std::vector<CubeCoord> cells; // start .. goal, both inclusive
    int64_t totalCost = 0; // Sum of MovementCost over cells, excluding start
};

struct PathResult {
    std::optional<Path> path; // Empty when no path was found
    bool bounded = false; // A configured limit cut the search short
    int expandedCount = 0;

    [[nodiscard]] bool Found() const { return path.has_value(); }
};

// Holds no search state between calls; FindPath and FindReachable may run
// concurrently as long as the graph is not mutated meanwhile.
//
// Costs must be non-negative. The returned path is optimal when every step
// costs at least 1, since Distance() is then an admissible, consistent heuristic.
class Pathfinder {
public:
    explicit Pathfinder(const HexGraph &graph, PathfinderConfig config = {});

    // Start must be on the map (its passability is not checked) and goal must be
    // passable; otherwise no path is returned.
    [[nodiscard]] PathResult FindPath(const CubeCoord &start, const CubeCoord &goal) const;

    // Every cell reachable from start with total cost <= budget, with its minimal cost.
    // Start is included with cost 0. Throws std::invalid_argument for a negative budget.
    [[nodiscard]] std::map<CubeCoord, int> FindReachable(const CubeCoord &start, int budget) const;

    [[nodiscard]] const PathfinderConfig &GetConfig() const { return _config; }

private:
    const HexGraph &_graph;
    PathfinderConfig _config;

    // MovementCost with negative values clamped to 0
    [[nodiscard]] int StepCost(const CubeCoord &coord) const;
};

} // namespace hexkit

#endif // HEXKIT_PATHFINDER_H
