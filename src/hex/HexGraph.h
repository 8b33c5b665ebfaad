//
// HexGraph.h - Adjacency and cost view of a hex map, consumed by the pathfinder
//

#ifndef HEXKIT_HEXGRAPH_H
#define HEXKIT_HEXGRAPH_H

#include "HexCoord.h"
#include <limits>
#include <vector>

namespace hexkit
{

// Movement cost reported for cells that are absent or impassable
constexpr int IMPASSABLE_COST = std::numeric_limits<int>::max();

class HexGraph
{
public:
    virtual ~HexGraph() = default;

    [[nodiscard]] virtual bool Contains(const CubeCoord& coord) const = 0;

    // Neighbors of coord that are present in the map, in direction order
    [[nodiscard]] virtual std::vector<CubeCoord> Neighbors(const CubeCoord& coord) const = 0;

    // Absent cells are never passable
    [[nodiscard]] virtual bool IsPassable(const CubeCoord& coord) const = 0;

    // Cost of entering coord; IMPASSABLE_COST when !IsPassable(coord)
    [[nodiscard]] virtual int MovementCost(const CubeCoord& coord) const = 0;
};

} // namespace hexkit

#endif // HEXKIT_HEXGRAPH_H
