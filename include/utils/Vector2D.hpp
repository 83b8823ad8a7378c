/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>

// Playfield coordinates: x grows right, y grows down
class Vector2D {
public:
    constexpr Vector2D() = default;
    constexpr Vector2D(float x, float y) : m_x(x), m_y(y) {}

    // Vector of the given magnitude pointing along angle (radians)
    static Vector2D fromAngle(float radians, float magnitude) {
        return Vector2D(std::cos(radians) * magnitude, std::sin(radians) * magnitude);
    }

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float lengthSquared() const { return m_x * m_x + m_y * m_y; }
    float length() const { return std::sqrt(lengthSquared()); }
    bool isZero() const { return m_x == 0.0f && m_y == 0.0f; }

    // Zero stays zero so a missile sitting on its aim point never gets NaN velocity
    Vector2D normalized() const {
        const float len = length();
        if (len <= 0.0f) {
            return Vector2D();
        }
        return Vector2D(m_x / len, m_y / len);
    }

    float dot(const Vector2D& rhs) const { return m_x * rhs.m_x + m_y * rhs.m_y; }

    Vector2D lerp(const Vector2D& to, float t) const {
        return *this + (to - *this) * t;
    }

    Vector2D operator+(const Vector2D& rhs) const { return Vector2D(m_x + rhs.m_x, m_y + rhs.m_y); }
    Vector2D operator-(const Vector2D& rhs) const { return Vector2D(m_x - rhs.m_x, m_y - rhs.m_y); }
    Vector2D operator*(float s) const { return Vector2D(m_x * s, m_y * s); }

    Vector2D& operator+=(const Vector2D& rhs) {
        m_x += rhs.m_x;
        m_y += rhs.m_y;
        return *this;
    }

    Vector2D& operator*=(float s) {
        m_x *= s;
        m_y *= s;
        return *this;
    }

    bool operator==(const Vector2D& rhs) const { return m_x == rhs.m_x && m_y == rhs.m_y; }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        return (a - b).lengthSquared();
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return (a - b).length();
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
