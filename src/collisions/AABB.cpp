/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"

namespace CloudDefenders {

AABB AABB::fromRect(float x, float y, float width, float height, float scale) {
    return AABB(x, y, x + width * scale, y + height * scale);
}

bool AABB::intersects(const AABB& other) const {
    if (right < other.left || other.right < left) return false;
    if (bottom < other.top || other.bottom < top) return false;
    return true;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left && p.getX() <= right &&
           p.getY() >= top  && p.getY() <= bottom;
}

} // namespace CloudDefenders
