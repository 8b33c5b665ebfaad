//
// math.h - 2D vector used at the world-space boundary
//

#ifndef HEXKIT_MATH_H
#define HEXKIT_MATH_H

#include <SDL3/SDL_stdinc.h>

namespace hexkit
{

struct Vector2
{
    float x = 0, y = 0;

    [[nodiscard]] static float DistanceBetween(const Vector2& v1, const Vector2& v2)
    {
        const float dx = v2.x - v1.x;
        const float dy = v2.y - v1.y;
        return SDL_sqrtf(dx * dx + dy * dy);
    }

    Vector2() = default;

    Vector2(const float x, const float y) : x(x), y(y)
    {
    }

    [[nodiscard]] Vector2 operator*(const float f) const { return {x * f, y * f}; }
    [[nodiscard]] Vector2 operator+(const Vector2& v) const { return {x + v.x, y + v.y}; }
    [[nodiscard]] Vector2 operator-(const Vector2& v) const { return {x - v.x, y - v.y}; }
};

} // namespace hexkit

#endif // HEXKIT_MATH_H
