//
// HexAlgebra.cpp - Rotation, reflection, line drawing and area enumeration
//

#include "HexAlgebra.h"
#include "../Log.h"

#include <algorithm>
#include <stdexcept>

#include <tracy/Tracy.hpp>

namespace hexkit
{

namespace
{
    void RequireRadius(int radius, const char* operation)
    {
        if (radius < 0)
        {
            LogError("%s called with negative radius %d", operation, radius);
            throw std::invalid_argument("Radius must not be negative");
        }
    }
}

std::array<CubeCoord, 6> HexAlgebra::Neighbors(const CubeCoord& a)
{
    std::array<CubeCoord, 6> neighbors;
    for (int i = 0; i < 6; i++)
    {
        neighbors[i] = a.Neighbor(i);
    }
    return neighbors;
}

CubeCoord HexAlgebra::Rotate(const CubeCoord& a, const CubeCoord& pivot, int steps)
{
    CubeCoord v = a - pivot;
    const int turns = NormalizeDirection(steps);

    // (q, r, s) -> (-s, -q, -r) moves HEX_DIRECTIONS[d] onto HEX_DIRECTIONS[d + 1]
    for (int i = 0; i < turns; i++)
    {
        v = CubeCoord::FromAxial(-v.S(), -v.Q());
    }

    return pivot + v;
}

CubeCoord HexAlgebra::Reflect(const CubeCoord& a, HexAxis axis, const CubeCoord& pivot)
{
    const CubeCoord v = a - pivot;
    CubeCoord mirrored;

    switch (axis)
    {
        case HexAxis::Q: mirrored = CubeCoord::FromAxial(v.Q(), v.S()); break;  // (q, s, r)
        case HexAxis::R: mirrored = CubeCoord::FromAxial(v.S(), v.R()); break;  // (s, r, q)
        case HexAxis::S: mirrored = CubeCoord::FromAxial(v.R(), v.Q()); break;  // (r, q, s)
    }

    return pivot + mirrored;
}

CubeCoord HexAlgebra::ReflectAcross(const CubeCoord& a, HexAxis axis, const CubeCoord& pivot)
{
    return pivot - (Reflect(a, axis, pivot) - pivot);
}

FractionalCube HexAlgebra::Lerp(const FractionalCube& a, const FractionalCube& b, double t)
{
    // a * (1 - t) + b * t lands exactly on b at t == 1
    return {
        a.q * (1.0 - t) + b.q * t,
        a.r * (1.0 - t) + b.r * t,
        a.s * (1.0 - t) + b.s * t
    };
}

FractionalCube HexAlgebra::Lerp(const CubeCoord& a, const CubeCoord& b, double t)
{
    return Lerp(FractionalCube::From(a), FractionalCube::From(b), t);
}

std::vector<CubeCoord> HexAlgebra::Line(const CubeCoord& a, const CubeCoord& b)
{
    ZoneScoped;
    const int n = Distance(a, b);
    if (n == 0) return {a};

    FractionalCube start = FractionalCube::From(a);
    start.q += LINE_EPSILON_Q;
    start.r += LINE_EPSILON_R;
    start.s += LINE_EPSILON_S;
    const FractionalCube end = FractionalCube::From(b);

    std::vector<CubeCoord> line;
    line.reserve(static_cast<size_t>(n) + 1);

    for (int i = 0; i <= n; i++)
    {
        const double t = static_cast<double>(i) / static_cast<double>(n);
        line.push_back(Lerp(start, end, t).Round());
    }

    return line;
}

std::vector<CubeCoord> HexAlgebra::LineFromCenter(const CubeCoord& end)
{
    return Line(CubeCoord::Zero(), end);
}

std::vector<CubeCoord> HexAlgebra::Range(const CubeCoord& center, int radius)
{
    ZoneScoped;
    RequireRadius(radius, "Range");

    std::vector<CubeCoord> cells;
    cells.reserve(RangeSize(radius));

    for (int q = -radius; q <= radius; q++)
    {
        int r1 = std::max(-radius, -q - radius);
        int r2 = std::min(radius, -q + radius);
        for (int r = r1; r <= r2; r++)
        {
            cells.push_back(center + CubeCoord::FromAxial(q, r));
        }
    }

    return cells;
}

std::vector<CubeCoord> HexAlgebra::Ring(const CubeCoord& center, int radius)
{
    ZoneScoped;
    RequireRadius(radius, "Ring");
    if (radius == 0) return {center};

    std::vector<CubeCoord> cells;
    cells.reserve(6 * static_cast<size_t>(radius));

    CubeCoord hex = center + HEX_DIRECTIONS[4] * radius;
    for (int side = 0; side < 6; side++)
    {
        for (int step = 0; step < radius; step++)
        {
            cells.push_back(hex);
            hex = hex.Neighbor(side);
        }
    }

    return cells;
}

std::vector<CubeCoord> HexAlgebra::Spiral(const CubeCoord& center, int radius)
{
    ZoneScoped;
    RequireRadius(radius, "Spiral");

    std::vector<CubeCoord> cells;
    cells.reserve(RangeSize(radius));

    for (int k = 0; k <= radius; k++)
    {
        std::vector<CubeCoord> ring = Ring(center, k);
        cells.insert(cells.end(), ring.begin(), ring.end());
    }

    return cells;
}

} // namespace hexkit
