//
// HexLayout.h - Mapping between hex cells and world-space positions
//

#ifndef HEXKIT_HEXLAYOUT_H
#define HEXKIT_HEXLAYOUT_H

#include "HexCoord.h"
#include "../math.h"
#include <array>

namespace hexkit
{

struct HexLayoutConfig {
    Orientation orientation = Orientation::PointyTop;
    float hexSize = 32.0f; // Outer radius of each hex in world units
    Vector2 origin; // World position of the center of hex (0, 0, 0)
};

namespace HexGeometry
{
    constexpr float SQRT3 = 1.7320508075688772f;
    constexpr float SQRT3_OVER_2 = 0.8660254037844386f;

    // Get inner radius (distance from center to edge midpoint)
    inline float InnerRadius(float outerRadius)
    {
        return outerRadius * SQRT3_OVER_2;
    }
}

class HexLayout {
public:
    HexLayout() = default;
    explicit HexLayout(const HexLayoutConfig &config);

    // Center of a hex in world space
    [[nodiscard]] Vector2 HexToWorld(const CubeCoord &coord) const;

    // Unrounded cube position of a world point
    [[nodiscard]] FractionalCube WorldToFractional(const Vector2 &worldPos) const;

    // Hex containing a world point
    [[nodiscard]] CubeCoord WorldToHex(const Vector2 &worldPos) const;

    // The 6 corner vertices of a hex in world space
    [[nodiscard]] std::array<Vector2, 6> GetHexCorners(const CubeCoord &coord) const;

    // Tile extents and center-to-center spacing
    [[nodiscard]] float TileWidth() const;
    [[nodiscard]] float TileHeight() const;
    [[nodiscard]] float HorizontalSpacing() const;
    [[nodiscard]] float VerticalSpacing() const;

    [[nodiscard]] const HexLayoutConfig &GetConfig() const { return _config; }
    [[nodiscard]] Orientation GetOrientation() const { return _config.orientation; }
    [[nodiscard]] float GetHexSize() const { return _config.hexSize; }

private:
    HexLayoutConfig _config;
};

} // namespace hexkit

#endif // HEXKIT_HEXLAYOUT_H
