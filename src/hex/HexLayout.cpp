//
// HexLayout.cpp - World-space layout implementation
//

#include "HexLayout.h"
#include "../Log.h"

#include <cmath>
#include <stdexcept>

namespace hexkit
{

using HexGeometry::SQRT3;

HexLayout::HexLayout(const HexLayoutConfig& config)
    : _config(config)
{
    if (!(config.hexSize > 0.0f))
    {
        LogError("HexLayout hexSize must be positive, got %f", static_cast<double>(config.hexSize));
        throw std::invalid_argument("HexLayout hexSize must be positive");
    }
}

Vector2 HexLayout::HexToWorld(const CubeCoord& coord) const
{
    const float q = static_cast<float>(coord.Q());
    const float r = static_cast<float>(coord.R());
    const float size = _config.hexSize;

    float x;
    float y;
    if (_config.orientation == Orientation::PointyTop)
    {
        // x = size * (sqrt(3) * q + sqrt(3)/2 * r)
        // y = size * (3/2 * r)
        x = size * (SQRT3 * q + SQRT3 / 2.0f * r);
        y = size * (1.5f * r);
    }
    else
    {
        // x = size * (3/2 * q)
        // y = size * (sqrt(3)/2 * q + sqrt(3) * r)
        x = size * (1.5f * q);
        y = size * (SQRT3 / 2.0f * q + SQRT3 * r);
    }

    return _config.origin + Vector2(x, y);
}

FractionalCube HexLayout::WorldToFractional(const Vector2& worldPos) const
{
    const Vector2 local = worldPos - _config.origin;
    const double size = _config.hexSize;
    const double x = local.x;
    const double y = local.y;
    const double sqrt3 = std::sqrt(3.0);

    double fq;
    double fr;
    if (_config.orientation == Orientation::PointyTop)
    {
        fq = (sqrt3 / 3.0 * x - 1.0 / 3.0 * y) / size;
        fr = (2.0 / 3.0 * y) / size;
    }
    else
    {
        fq = (2.0 / 3.0 * x) / size;
        fr = (-1.0 / 3.0 * x + sqrt3 / 3.0 * y) / size;
    }

    return {fq, fr, -fq - fr};
}

CubeCoord HexLayout::WorldToHex(const Vector2& worldPos) const
{
    return WorldToFractional(worldPos).Round();
}

std::array<Vector2, 6> HexLayout::GetHexCorners(const CubeCoord& coord) const
{
    const Vector2 center = HexToWorld(coord);
    // Pointy-top: first corner at 30 degrees, flat-top: first corner at 0 degrees
    const float startAngle = _config.orientation == Orientation::PointyTop ? 30.0f : 0.0f;

    std::array<Vector2, 6> corners;
    for (int i = 0; i < 6; i++)
    {
        float angleDeg = 60.0f * static_cast<float>(i) + startAngle;
        float angleRad = angleDeg * 3.14159265359f / 180.0f;
        corners[i] = Vector2(
            center.x + _config.hexSize * std::cos(angleRad),
            center.y + _config.hexSize * std::sin(angleRad)
        );
    }
    return corners;
}

float HexLayout::TileWidth() const
{
    return _config.orientation == Orientation::PointyTop
        ? SQRT3 * _config.hexSize
        : 2.0f * _config.hexSize;
}

float HexLayout::TileHeight() const
{
    return _config.orientation == Orientation::PointyTop
        ? 2.0f * _config.hexSize
        : SQRT3 * _config.hexSize;
}

float HexLayout::HorizontalSpacing() const
{
    return _config.orientation == Orientation::PointyTop
        ? SQRT3 * _config.hexSize
        : 1.5f * _config.hexSize;
}

float HexLayout::VerticalSpacing() const
{
    return _config.orientation == Orientation::PointyTop
        ? 1.5f * _config.hexSize
        : SQRT3 * _config.hexSize;
}

} // namespace hexkit
