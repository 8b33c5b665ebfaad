//
// Pathfinder.cpp - A* and cost-bounded flood fill implementation
//

#include "Pathfinder.h"
#include "../Log.h"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <queue>
#include <stdexcept>
#include <unordered_map>

#include <tracy/Tracy.hpp>

namespace hexkit
{

namespace
{
    // Open set entry; equal scores pop in insertion order.
    // Accumulated costs are 64-bit, step costs are int.
    struct OpenEntry
    {
        int64_t score;
        uint64_t order;
        int64_t cost;
        CubeCoord coord;

        bool operator>(const OpenEntry& other) const
        {
            if (score != other.score) return score > other.score;
            return order > other.order;
        }
    };

    using OpenQueue = std::priority_queue<OpenEntry, std::vector<OpenEntry>, std::greater<>>;

    struct NodeRecord
    {
        int64_t cost = 0;
        CubeCoord parent;
        bool closed = false;
    };
}

Pathfinder::Pathfinder(const HexGraph& graph, PathfinderConfig config)
    : _graph(graph),
      _config(config)
{
}

int Pathfinder::StepCost(const CubeCoord& coord) const
{
    int cost = _graph.MovementCost(coord);
    if (cost < 0)
    {
        LogWarn("Negative movement cost %d at (%d, %d, %d) treated as 0",
                cost, coord.Q(), coord.R(), coord.S());
        return 0;
    }
    return cost;
}

PathResult Pathfinder::FindPath(const CubeCoord& start, const CubeCoord& goal) const
{
    ZoneScoped;
    PathResult result;

    if (!_graph.Contains(start) || !_graph.IsPassable(goal))
    {
        LogDebug("No path: start on map = %d, goal passable = %d",
                 _graph.Contains(start) ? 1 : 0, _graph.IsPassable(goal) ? 1 : 0);
        return result;
    }

    if (start == goal)
    {
        result.path = Path{{start}, 0};
        return result;
    }

    std::unordered_map<CubeCoord, NodeRecord, CubeCoordHash> nodes;
    OpenQueue open;
    uint64_t order = 0;
    bool pruned = false;

    nodes[start] = NodeRecord{0, start, false};
    open.push({CubeCoord::Distance(start, goal), order++, 0, start});

    while (!open.empty())
    {
        OpenEntry current = open.top();
        open.pop();

        NodeRecord& record = nodes[current.coord];

        // Skip entries superseded by a cheaper route or already finalized
        if (record.closed || current.cost != record.cost) continue;

        if (current.coord == goal)
        {
            Path path;
            path.totalCost = record.cost;

            CubeCoord at = goal;
            path.cells.push_back(at);
            while (at != start)
            {
                at = nodes[at].parent;
                path.cells.push_back(at);
            }
            std::reverse(path.cells.begin(), path.cells.end());

            LogDebug("Path found: %d cells, cost %lld, %d expansions",
                     static_cast<int>(path.cells.size()), static_cast<long long>(path.totalCost),
                     result.expandedCount);
            result.path = std::move(path);
            return result;
        }

        if (_config.maxExpansions > 0 && result.expandedCount >= _config.maxExpansions)
        {
            result.bounded = true;
            break;
        }

        record.closed = true;
        result.expandedCount++;

        for (const auto& neighbor : _graph.Neighbors(current.coord))
        {
            if (!_graph.IsPassable(neighbor)) continue;

            auto it = nodes.find(neighbor);
            if (it != nodes.end() && it->second.closed) continue;

            const int64_t candidate = current.cost + StepCost(neighbor);
            if (_config.maxCost > 0 && candidate > _config.maxCost)
            {
                pruned = true;
                continue;
            }

            if (it == nodes.end() || candidate < it->second.cost)
            {
                nodes[neighbor] = NodeRecord{candidate, current.coord, false};
                open.push({candidate + CubeCoord::Distance(neighbor, goal), order++, candidate, neighbor});
            }
        }
    }

    if (pruned) result.bounded = true;

    LogDebug("No path after %d expansions (bounded = %d)",
             result.expandedCount, result.bounded ? 1 : 0);
    return result;
}

std::map<CubeCoord, int> Pathfinder::FindReachable(const CubeCoord& start, int budget) const
{
    ZoneScoped;
    if (budget < 0)
    {
        LogError("FindReachable called with negative budget %d", budget);
        throw std::invalid_argument("Movement budget must not be negative");
    }

    std::map<CubeCoord, int> reached;
    if (!_graph.Contains(start)) return reached;

    // Dijkstra flood: the same open set as FindPath without a heuristic
    std::unordered_map<CubeCoord, int64_t, CubeCoordHash> best;
    OpenQueue open;
    uint64_t order = 0;

    best[start] = 0;
    open.push({0, order++, 0, start});

    while (!open.empty())
    {
        OpenEntry current = open.top();
        open.pop();

        if (reached.find(current.coord) != reached.end()) continue;
        if (current.cost != best[current.coord]) continue;

        // Never above budget, so it fits in an int
        reached[current.coord] = static_cast<int>(current.cost);

        for (const auto& neighbor : _graph.Neighbors(current.coord))
        {
            if (!_graph.IsPassable(neighbor)) continue;
            if (reached.find(neighbor) != reached.end()) continue;

            const int64_t candidate = current.cost + StepCost(neighbor);
            if (candidate > budget) continue;

            auto it = best.find(neighbor);
            if (it == best.end() || candidate < it->second)
            {
                best[neighbor] = candidate;
                open.push({candidate, order++, candidate, neighbor});
            }
        }
    }

    return reached;
}

} // namespace hexkit
