//
// HexCoord.cpp - Coordinate construction, conversion and rounding
//

#include "HexCoord.h"
#include "../Log.h"

#include <cmath>
#include <ostream>
#include <stdexcept>

namespace hexkit
{

CubeCoord::CubeCoord(int q, int r, int s)
    : _q(q), _r(r), _s(s)
{
    if (q + r + s != 0)
    {
        LogError("Invalid cube coordinate (%d, %d, %d): components must sum to 0", q, r, s);
        throw std::invalid_argument("Cube coordinate components must sum to 0");
    }
}

AxialCoord CubeCoord::ToAxial() const
{
    return AxialCoord(_q, _r);
}

OffsetCoord CubeCoord::ToOffset(const OffsetLayout& layout) const
{
    return ToAxial().ToOffset(layout);
}

// (x & 1) is the parity bit for negative values as well
OffsetCoord AxialCoord::ToOffset(const OffsetLayout& layout) const
{
    switch (layout.parity)
    {
        case OffsetParity::OddRow:
            return {q + (r - (r & 1)) / 2, r};
        case OffsetParity::EvenRow:
            return {q + (r + (r & 1)) / 2, r};
        case OffsetParity::OddColumn:
            return {q, r + (q - (q & 1)) / 2};
        case OffsetParity::EvenColumn:
            return {q, r + (q + (q & 1)) / 2};
    }
    return {q, r};
}

AxialCoord OffsetCoord::ToAxial(const OffsetLayout& layout) const
{
    switch (layout.parity)
    {
        case OffsetParity::OddRow:
            return {col - (row - (row & 1)) / 2, row};
        case OffsetParity::EvenRow:
            return {col - (row + (row & 1)) / 2, row};
        case OffsetParity::OddColumn:
            return {col, row - (col - (col & 1)) / 2};
        case OffsetParity::EvenColumn:
            return {col, row - (col + (col & 1)) / 2};
    }
    return {col, row};
}

CubeCoord OffsetCoord::ToCube(const OffsetLayout& layout) const
{
    return ToAxial(layout).ToCube();
}

CubeCoord FractionalCube::Round() const
{
    int rq = static_cast<int>(std::round(q));
    int rr = static_cast<int>(std::round(r));
    int rs = static_cast<int>(std::round(s));

    double qDiff = std::abs(static_cast<double>(rq) - q);
    double rDiff = std::abs(static_cast<double>(rr) - r);
    double sDiff = std::abs(static_cast<double>(rs) - s);

    // Reset the coordinate with the largest rounding error
    if (qDiff > rDiff && qDiff > sDiff)
    {
        rq = -rr - rs;
    }
    else if (rDiff > sDiff)
    {
        rr = -rq - rs;
    }

    // s is derived from q and r, which also covers the s-has-largest-error case
    return CubeCoord::FromAxial(rq, rr);
}

std::ostream& operator<<(std::ostream& out, const CubeCoord& c)
{
    return out << "(" << c.Q() << ", " << c.R() << ", " << c.S() << ")";
}

std::ostream& operator<<(std::ostream& out, const AxialCoord& c)
{
    return out << "(" << c.q << ", " << c.r << ")";
}

std::ostream& operator<<(std::ostream& out, const OffsetCoord& c)
{
    return out << "[col " << c.col << ", row " << c.row << "]";
}

std::ostream& operator<<(std::ostream& out, const FractionalCube& c)
{
    return out << "(" << c.q << ", " << c.r << ", " << c.s << ")";
}

} // namespace hexkit
