#ifndef MAGTORQ_MATH_VEC2_HPP
#define MAGTORQ_MATH_VEC2_HPP

#include <cmath>

namespace magtorq {

// Point or direction in the board plane, meters.
// x runs along the board width, y along the board length.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Reflection across the y axis (x -> -x)
    constexpr Vec2 mirrored_x() const {
        return {-x, y};
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

}  // namespace magtorq

#endif // MAGTORQ_MATH_VEC2_HPP
