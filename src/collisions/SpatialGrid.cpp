/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialGrid.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include <boost/container/flat_set.hpp>
#include <algorithm> // std::remove, std::min, std::max
#include <cmath>     // std::floor, std::abs
#include <string>
#include <utility>

namespace CloudDefenders {

SpatialGrid::SpatialGrid(float cellSize)
    : m_cellSize(cellSize > 0.0f ? cellSize : DEFAULT_CELL_SIZE) {}

SpatialGrid::CellRange SpatialGrid::computeRange(const AABB& bounds) const {
    CellRange range;
    range.minX = static_cast<int>(std::floor(bounds.left / m_cellSize));
    range.maxX = static_cast<int>(std::floor(bounds.right / m_cellSize));
    range.minY = static_cast<int>(std::floor(bounds.top / m_cellSize));
    range.maxY = static_cast<int>(std::floor(bounds.bottom / m_cellSize));
    return range;
}

bool SpatialGrid::isIndexable(const AABB& bounds, const CellRange& range) const {
    if (!std::isfinite(bounds.left) || !std::isfinite(bounds.right) ||
        !std::isfinite(bounds.top) || !std::isfinite(bounds.bottom)) {
        return false;
    }
    if (std::abs(bounds.left) > MAX_COORDINATE || std::abs(bounds.right) > MAX_COORDINATE ||
        std::abs(bounds.top) > MAX_COORDINATE || std::abs(bounds.bottom) > MAX_COORDINATE) {
        return false;
    }
    return (range.maxX - range.minX) <= MAX_CELL_SPAN && (range.maxY - range.minY) <= MAX_CELL_SPAN;
}

bool SpatialGrid::addEntity(const EntityPtr& entity) {
    if (!entity) return false;

    const AABB& bounds = entity->getBounds();
    const CellRange range = computeRange(bounds);
    if (!isIndexable(bounds, range)) {
        COLLISION_WARN("Entity " + std::to_string(entity->getID()) +
                       " has out-of-range bounds, not indexed");
        removeEntity(entity->getID());
        return false;
    }

    // Re-adding an entity replaces its previous cells
    removeEntity(entity->getID());

    const EntityID id = entity->getID();
    forEachCell(range, [&](CellCoord c) {
        auto& cell = m_cells[c];
        if (cell.capacity() == 0) {
            cell.reserve(8);
        }
        cell.push_back(id);
    });
    m_records.emplace(id, Record{entity, range});
    return true;
}

bool SpatialGrid::updateEntity(const EntityPtr& entity) {
    if (!entity) return false;

    auto it = m_records.find(entity->getID());
    if (it == m_records.end()) {
        return addEntity(entity);
    }

    const AABB& bounds = entity->getBounds();
    const CellRange newRange = computeRange(bounds);
    if (!isIndexable(bounds, newRange)) {
        COLLISION_WARN("Entity " + std::to_string(entity->getID()) +
                       " moved out of the indexable range, evicting");
        removeEntity(entity->getID());
        return false;
    }

    const CellRange oldRange = it->second.range;
    if (oldRange == newRange) {
        return true;
    }

    const EntityID id = entity->getID();

    // Remove from old cells that are no longer overlapped
    forEachCell(oldRange, [&](CellCoord c) {
        if (!newRange.contains(c.x, c.y)) {
            removeFromCell(c, id);
        }
    });

    // Add to new cells that weren't previously overlapped
    forEachCell(newRange, [&](CellCoord c) {
        if (!oldRange.contains(c.x, c.y)) {
            m_cells[c].push_back(id);
        }
    });

    it->second.range = newRange;
    return true;
}

void SpatialGrid::removeEntity(EntityID id) {
    auto it = m_records.find(id);
    if (it == m_records.end()) return;

    forEachCell(it->second.range, [&](CellCoord c) { removeFromCell(c, id); });
    m_records.erase(it);
}

void SpatialGrid::removeFromCell(const CellCoord& cell, EntityID id) {
    auto cit = m_cells.find(cell);
    if (cit == m_cells.end()) return;

    auto& v = cit->second;
    v.erase(std::remove(v.begin(), v.end(), id), v.end());
    if (v.empty()) {
        m_cells.erase(cit);
    }
}

void SpatialGrid::clear() {
    m_cells.clear();
    m_records.clear();
}

std::vector<SpatialGrid::EntityPair> SpatialGrid::getPotentialCollisions() const {
    std::vector<EntityPair> pairs;
    boost::container::flat_set<std::pair<EntityID, EntityID>> seen;

    for (const auto& [coord, ids] : m_cells) {
        for (size_t i = 0; i < ids.size(); ++i) {
            for (size_t j = i + 1; j < ids.size(); ++j) {
                const EntityID a = std::min(ids[i], ids[j]);
                const EntityID b = std::max(ids[i], ids[j]);
                if (!seen.emplace(a, b).second) continue;

                auto first = m_records.find(a);
                auto second = m_records.find(b);
                if (first == m_records.end() || second == m_records.end()) continue;
                pairs.emplace_back(first->second.entity, second->second.entity);
            }
        }
    }
    return pairs;
}

SpatialGrid::CellList SpatialGrid::getCellsForEntity(EntityID id) const {
    CellList cells;
    auto it = m_records.find(id);
    if (it != m_records.end()) {
        forEachCell(it->second.range, [&](CellCoord c) { cells.push_back(c); });
    }
    return cells;
}

std::vector<EntityID> SpatialGrid::getEntitiesInCell(const CellCoord& cell) const {
    auto it = m_cells.find(cell);
    return it != m_cells.end() ? it->second : std::vector<EntityID>{};
}

bool SpatialGrid::isTracked(EntityID id) const {
    return m_records.find(id) != m_records.end();
}

void SpatialGrid::forEachCell(const CellRange& range, const std::function<void(CellCoord)>& fn) const {
    for (int y = range.minY; y <= range.maxY; ++y) {
        for (int x = range.minX; x <= range.maxX; ++x) {
            fn(CellCoord{x, y});
        }
    }
}

} // namespace CloudDefenders
