//
// HexCoord.h - Cube, axial, offset and fractional hex coordinates
//

#ifndef HEXKIT_HEXCOORD_H
#define HEXKIT_HEXCOORD_H

#include <array>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <iosfwd>

namespace hexkit
{

struct AxialCoord;
struct OffsetCoord;
struct OffsetLayout;

enum class Orientation
{
    PointyTop,
    FlatTop
};

// Which lines of an offset layout are shoved by half a hex, and in which direction
enum class OffsetParity
{
    OddRow,     // odd rows shoved right
    EvenRow,    // even rows shoved right
    OddColumn,  // odd columns shoved down
    EvenColumn  // even columns shoved down
};

// Cube coordinates (q, r, s) with q + r + s == 0.
// Canonical form; every other representation converts through it.
class CubeCoord
{
public:
    constexpr CubeCoord() = default;

    // Throws std::invalid_argument when q + r + s != 0
    CubeCoord(int q, int r, int s);

    [[nodiscard]] static constexpr CubeCoord FromAxial(int q, int r)
    {
        return CubeCoord(q, r, Unchecked{});
    }

    [[nodiscard]] static constexpr CubeCoord Zero() { return {}; }

    [[nodiscard]] constexpr int Q() const { return _q; }
    [[nodiscard]] constexpr int R() const { return _r; }
    [[nodiscard]] constexpr int S() const { return _s; }

    // Distance between two cube coordinates (in hex steps)
    [[nodiscard]] static int Distance(const CubeCoord& a, const CubeCoord& b)
    {
        return (std::abs(a._q - b._q) + std::abs(a._r - b._r) + std::abs(a._s - b._s)) / 2;
    }

    [[nodiscard]] int DistanceTo(const CubeCoord& other) const
    {
        return Distance(*this, other);
    }

    // Get neighbor in specified direction (0-5, taken modulo 6)
    [[nodiscard]] CubeCoord Neighbor(int direction) const;

    [[nodiscard]] AxialCoord ToAxial() const;
    [[nodiscard]] OffsetCoord ToOffset(const OffsetLayout& layout) const;

    // Operators
    [[nodiscard]] constexpr bool operator==(const CubeCoord& other) const
    {
        return _q == other._q && _r == other._r;
    }

    [[nodiscard]] constexpr bool operator!=(const CubeCoord& other) const
    {
        return !(*this == other);
    }

    [[nodiscard]] constexpr CubeCoord operator+(const CubeCoord& other) const
    {
        return FromAxial(_q + other._q, _r + other._r);
    }

    [[nodiscard]] constexpr CubeCoord operator-(const CubeCoord& other) const
    {
        return FromAxial(_q - other._q, _r - other._r);
    }

    [[nodiscard]] constexpr CubeCoord operator-() const
    {
        return FromAxial(-_q, -_r);
    }

    [[nodiscard]] constexpr CubeCoord operator*(int factor) const
    {
        return FromAxial(_q * factor, _r * factor);
    }

    CubeCoord& operator+=(const CubeCoord& other)
    {
        *this = *this + other;
        return *this;
    }

    CubeCoord& operator-=(const CubeCoord& other)
    {
        *this = *this - other;
        return *this;
    }

    // For ordered containers (std::map, std::set)
    [[nodiscard]] constexpr bool operator<(const CubeCoord& other) const
    {
        if (_q != other._q) return _q < other._q;
        return _r < other._r;
    }

private:
    struct Unchecked {};

    constexpr CubeCoord(int q, int r, Unchecked) : _q(q), _r(r), _s(-q - r) {}

    int _q = 0;
    int _r = 0;
    int _s = 0;
};

// Axial coordinates (q, r); s is derived as -q - r
struct AxialCoord
{
    int q = 0;
    int r = 0;

    AxialCoord() = default;
    constexpr AxialCoord(int q, int r) : q(q), r(r) {}

    [[nodiscard]] constexpr int S() const { return -q - r; }

    [[nodiscard]] constexpr CubeCoord ToCube() const { return CubeCoord::FromAxial(q, r); }
    [[nodiscard]] OffsetCoord ToOffset(const OffsetLayout& layout) const;

    [[nodiscard]] constexpr bool operator==(const AxialCoord& other) const
    {
        return q == other.q && r == other.r;
    }

    [[nodiscard]] constexpr bool operator!=(const AxialCoord& other) const
    {
        return !(*this == other);
    }

    [[nodiscard]] constexpr AxialCoord operator+(const AxialCoord& other) const
    {
        return AxialCoord(q + other.q, r + other.r);
    }

    [[nodiscard]] constexpr AxialCoord operator-(const AxialCoord& other) const
    {
        return AxialCoord(q - other.q, r - other.r);
    }

    AxialCoord& operator+=(const AxialCoord& other)
    {
        q += other.q;
        r += other.r;
        return *this;
    }

    AxialCoord& operator-=(const AxialCoord& other)
    {
        q -= other.q;
        r -= other.r;
        return *this;
    }

    [[nodiscard]] constexpr bool operator<(const AxialCoord& other) const
    {
        if (q != other.q) return q < other.q;
        return r < other.r;
    }
};

// Orientation and parity an offset coordinate is addressed in.
// Converting out and back with a different layout yields a valid but different cell.
struct OffsetLayout
{
    Orientation orientation = Orientation::PointyTop;
    OffsetParity parity = OffsetParity::OddRow;
};

// Rectangular (col, row) address, only meaningful together with an OffsetLayout
struct OffsetCoord
{
    int col = 0;
    int row = 0;

    OffsetCoord() = default;
    constexpr OffsetCoord(int col, int row) : col(col), row(row) {}

    [[nodiscard]] AxialCoord ToAxial(const OffsetLayout& layout) const;
    [[nodiscard]] CubeCoord ToCube(const OffsetLayout& layout) const;

    [[nodiscard]] constexpr bool operator==(const OffsetCoord& other) const
    {
        return col == other.col && row == other.row;
    }

    [[nodiscard]] constexpr bool operator!=(const OffsetCoord& other) const
    {
        return !(*this == other);
    }
};

// Floating point cube coordinates produced by interpolation and world-space mapping.
// Must be rounded before use in discrete queries.
struct FractionalCube
{
    double q = 0.0;
    double r = 0.0;
    double s = 0.0;

    FractionalCube() = default;
    constexpr FractionalCube(double q, double r, double s) : q(q), r(r), s(s) {}

    // Round each component, then recompute the one with the largest rounding error
    [[nodiscard]] CubeCoord Round() const;

    [[nodiscard]] static FractionalCube From(const CubeCoord& c)
    {
        return {static_cast<double>(c.Q()), static_cast<double>(c.R()), static_cast<double>(c.S())};
    }
};

// 6 neighbor directions, starting from East, going counter-clockwise (+r pointing down)
inline constexpr std::array<CubeCoord, 6> HEX_DIRECTIONS = {
    CubeCoord::FromAxial(+1,  0),  // 0 East
    CubeCoord::FromAxial(+1, -1),  // 1 Northeast
    CubeCoord::FromAxial( 0, -1),  // 2 Northwest
    CubeCoord::FromAxial(-1,  0),  // 3 West
    CubeCoord::FromAxial(-1, +1),  // 4 Southwest
    CubeCoord::FromAxial( 0, +1)   // 5 Southeast
};

[[nodiscard]] constexpr int NormalizeDirection(int direction)
{
    return ((direction % 6) + 6) % 6;
}

[[nodiscard]] constexpr int OppositeDirection(int direction)
{
    return NormalizeDirection(direction + 3);
}

inline CubeCoord CubeCoord::Neighbor(int direction) const
{
    return *this + HEX_DIRECTIONS[NormalizeDirection(direction)];
}

// Hash functions for use in unordered_map/unordered_set
struct CubeCoordHash
{
    std::size_t operator()(const CubeCoord& coord) const noexcept
    {
        std::size_t h1 = std::hash<int>{}(coord.Q());
        std::size_t h2 = std::hash<int>{}(coord.R());
        return h1 ^ (h2 << 1);
    }
};

struct AxialCoordHash
{
    std::size_t operator()(const AxialCoord& coord) const noexcept
    {
        std::size_t h1 = std::hash<int>{}(coord.q);
        std::size_t h2 = std::hash<int>{}(coord.r);
        return h1 ^ (h2 << 1);
    }
};

std::ostream& operator<<(std::ostream& out, const CubeCoord& c);
std::ostream& operator<<(std::ostream& out, const AxialCoord& c);
std::ostream& operator<<(std::ostream& out, const OffsetCoord& c);
std::ostream& operator<<(std::ostream& out, const FractionalCube& c);

} // namespace hexkit

#endif // HEXKIT_HEXCOORD_H
