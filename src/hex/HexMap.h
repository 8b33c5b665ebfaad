//
// HexMap.h - Sparse map of hex cells with per-cell payload
//
// Reads may run concurrently; Insert/Remove/Fill must be externally synchronized
// against every other access. No internal locking.
//

#ifndef HEXKIT_HEXMAP_H
#define HEXKIT_HEXMAP_H

#include "HexAlgebra.h"
#include "HexCoord.h"
#include "HexGraph.h"
#include "../Log.h"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <vector>

#include <tracy/Tracy.hpp>

namespace hexkit
{

// Default cell payload
struct HexCell {
    int movementCost = 1; // Cost of entering this cell, must not be negative
    bool passable = true;
    uint32_t tag = 0; // Free for the caller (terrain id, occupant id, ...)

    [[nodiscard]] bool IsPassable() const { return passable; }
    [[nodiscard]] int MovementCost() const { return movementCost; }

    [[nodiscard]] bool operator==(const HexCell& other) const
    {
        return movementCost == other.movementCost && passable == other.passable && tag == other.tag;
    }
};

// How HexMap reads passability and cost out of a payload.
// Specialize for payload types that do not provide IsPassable()/MovementCost().
template<typename Payload>
struct HexCellTraits {
    static bool IsPassable(const Payload& cell) { return cell.IsPassable(); }
    static int MovementCost(const Payload& cell) { return cell.MovementCost(); }
};

template<typename Payload = HexCell>
class HexMap final : public HexGraph {
public:
    using Traits = HexCellTraits<Payload>;
    using Storage = std::map<CubeCoord, Payload>;
    using const_iterator = typename Storage::const_iterator;

    HexMap() = default;

    // Upsert; returns true if the cell did not exist before
    bool Insert(const CubeCoord &coord, const Payload &payload)
    {
        return _cells.insert_or_assign(coord, payload).second;
    }

    // Returns true if a cell was erased
    bool Remove(const CubeCoord &coord)
    {
        return _cells.erase(coord) > 0;
    }

    // nullptr when the cell is absent
    [[nodiscard]] const Payload *Get(const CubeCoord &coord) const
    {
        auto it = _cells.find(coord);
        if (it != _cells.end()) return &it->second;
        return nullptr;
    }

    [[nodiscard]] Payload *Get(const CubeCoord &coord)
    {
        auto it = _cells.find(coord);
        if (it != _cells.end()) return &it->second;
        return nullptr;
    }

    [[nodiscard]] bool Contains(const CubeCoord &coord) const override
    {
        return _cells.find(coord) != _cells.end();
    }

    [[nodiscard]] std::vector<CubeCoord> Neighbors(const CubeCoord &coord) const override
    {
        std::vector<CubeCoord> neighbors;
        neighbors.reserve(6);

        for (int i = 0; i < 6; i++)
        {
            CubeCoord neighbor = coord.Neighbor(i);
            if (Contains(neighbor))
            {
                neighbors.push_back(neighbor);
            }
        }

        return neighbors;
    }

    [[nodiscard]] bool IsPassable(const CubeCoord &coord) const override
    {
        const Payload *cell = Get(coord);
        return cell && Traits::IsPassable(*cell);
    }

    [[nodiscard]] int MovementCost(const CubeCoord &coord) const override
    {
        const Payload *cell = Get(coord);
        if (!cell || !Traits::IsPassable(*cell)) return IMPASSABLE_COST;
        return Traits::MovementCost(*cell);
    }

    // Hexagon-shaped area of cells around center
    void FillHexagon(const CubeCoord &center, int radius, const Payload &payload)
    {
        ZoneScoped;
        for (const auto &coord : HexAlgebra::Range(center, radius))
        {
            _cells.insert_or_assign(coord, payload);
        }
    }

    // Rectangle of cells addressed by offset coordinates (0..cols-1, 0..rows-1)
    void FillRectangle(const OffsetLayout &layout, int cols, int rows, const Payload &payload)
    {
        ZoneScoped;
        if (cols < 0 || rows < 0)
        {
            LogError("FillRectangle called with negative size %dx%d", cols, rows);
            throw std::invalid_argument("Rectangle size must not be negative");
        }

        for (int row = 0; row < rows; row++)
        {
            for (int col = 0; col < cols; col++)
            {
                _cells.insert_or_assign(OffsetCoord(col, row).ToCube(layout), payload);
            }
        }
    }

    void Clear() { _cells.clear(); }

    [[nodiscard]] size_t Size() const { return _cells.size(); }
    [[nodiscard]] bool Empty() const { return _cells.empty(); }

    // All coordinates, ordered by q then r
    [[nodiscard]] std::vector<CubeCoord> GetAllCoords() const
    {
        std::vector<CubeCoord> coords;
        coords.reserve(_cells.size());
        for (const auto &[coord, payload] : _cells)
        {
            coords.push_back(coord);
        }
        return coords;
    }

    [[nodiscard]] const_iterator begin() const { return _cells.begin(); }
    [[nodiscard]] const_iterator end() const { return _cells.end(); }

private:
    Storage _cells;
};

} // namespace hexkit

#endif // HEXKIT_HEXMAP_H
