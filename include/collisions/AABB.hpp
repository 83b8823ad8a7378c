/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace CloudDefenders {

// Axis-aligned bounds stored as edges, derived from an entity's top-left
// position, size and scale.
struct AABB {
    float left{0.0f};
    float top{0.0f};
    float right{0.0f};
    float bottom{0.0f};
    float centerX{0.0f};
    float centerY{0.0f};

    AABB() = default;
    AABB(float l, float t, float r, float b)
        : left(l), top(t), right(r), bottom(b),
          centerX((l + r) * 0.5f), centerY((t + b) * 0.5f) {}

    static AABB fromRect(float x, float y, float width, float height, float scale = 1.0f);

    float width() const { return right - left; }
    float height() const { return bottom - top; }
    Vector2D center() const { return Vector2D(centerX, centerY); }

    // Inclusive overlap: boxes sharing an edge intersect
    bool intersects(const AABB& other) const;
    bool contains(const Vector2D& p) const;
};

} // namespace CloudDefenders

#endif // AABB_HPP
