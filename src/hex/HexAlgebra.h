//
// HexAlgebra.h - Pure geometric queries over cube coordinates
//
// Every function here is stateless and safe to call from any thread.
// Direction indices follow HEX_DIRECTIONS (0 = East, counter-clockwise).
//

#ifndef HEXKIT_HEXALGEBRA_H
#define HEXKIT_HEXALGEBRA_H

#include "HexCoord.h"
#include <array>
#include <cstddef>
#include <vector>

namespace hexkit
{

enum class HexAxis
{
    Q,
    R,
    S
};

// Offset applied to the start of a line so samples never land exactly on a cell edge.
// Components sum to zero.
inline constexpr double LINE_EPSILON_Q = 1e-6;
inline constexpr double LINE_EPSILON_R = 2e-6;
inline constexpr double LINE_EPSILON_S = -3e-6;

namespace HexAlgebra
{
    [[nodiscard]] inline int Distance(const CubeCoord& a, const CubeCoord& b)
    {
        return CubeCoord::Distance(a, b);
    }

    [[nodiscard]] inline CubeCoord Neighbor(const CubeCoord& a, int direction)
    {
        return a.Neighbor(direction);
    }

    [[nodiscard]] inline CubeCoord Scale(const CubeCoord& a, int factor)
    {
        return a * factor;
    }

    // All six neighbors in direction order
    [[nodiscard]] std::array<CubeCoord, 6> Neighbors(const CubeCoord& a);

    // Rotate a around pivot by steps * 60 degrees.
    // One step turns direction d into direction d + 1; negative steps rotate the other way.
    [[nodiscard]] CubeCoord Rotate(const CubeCoord& a, const CubeCoord& pivot, int steps);

    // Mirror across the line through pivot along the given axis (that component is kept)
    [[nodiscard]] CubeCoord Reflect(const CubeCoord& a, HexAxis axis,
                                    const CubeCoord& pivot = CubeCoord::Zero());

    // Mirror across the line through pivot perpendicular to the given axis
    [[nodiscard]] CubeCoord ReflectAcross(const CubeCoord& a, HexAxis axis,
                                          const CubeCoord& pivot = CubeCoord::Zero());

    [[nodiscard]] FractionalCube Lerp(const FractionalCube& a, const FractionalCube& b, double t);
    [[nodiscard]] FractionalCube Lerp(const CubeCoord& a, const CubeCoord& b, double t);

    [[nodiscard]] inline CubeCoord Round(const FractionalCube& f)
    {
        return f.Round();
    }

    // Cells along the segment a -> b, both inclusive; size is Distance(a, b) + 1
    [[nodiscard]] std::vector<CubeCoord> Line(const CubeCoord& a, const CubeCoord& b);

    [[nodiscard]] std::vector<CubeCoord> LineFromCenter(const CubeCoord& end);

    // Number of cells Range(center, radius) yields: 1 + 3 * radius * (radius + 1)
    [[nodiscard]] constexpr size_t RangeSize(int radius)
    {
        const size_t r = radius < 0 ? 0 : static_cast<size_t>(radius);
        return 1 + 3 * r * (r + 1);
    }

    // All cells within radius of center, ordered by q then r.
    // Throws std::invalid_argument for a negative radius.
    [[nodiscard]] std::vector<CubeCoord> Range(const CubeCoord& center, int radius);

    // Cells at exactly radius from center. Starts at center + HEX_DIRECTIONS[4] * radius
    // and walks radius steps along directions 0 through 5.
    // Throws std::invalid_argument for a negative radius.
    [[nodiscard]] std::vector<CubeCoord> Ring(const CubeCoord& center, int radius);

    // Rings 0..radius concatenated, innermost first
    [[nodiscard]] std::vector<CubeCoord> Spiral(const CubeCoord& center, int radius);
}

} // namespace hexkit

#endif // HEXKIT_HEXALGEBRA_H
