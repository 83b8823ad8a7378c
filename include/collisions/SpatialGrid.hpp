/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_GRID_HPP
#define SPATIAL_GRID_HPP

#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>
#include "collisions/AABB.hpp"
#include "entities/EntityTypes.hpp"

namespace CloudDefenders {

/**
 * @brief Uniform grid that narrows the broad phase of the collision pass.
 *
 * Every tracked entity is filed under each cell its bounds touch. Two
 * entities sharing a cell form a candidate pair; confirming the overlap is
 * left to Entity::isCollidingWith. The grid holds shared ownership of the
 * entities it tracks so that candidate pairs can be handed out directly.
 *
 * Cells and records are kept in sorted flat maps, which makes the order of
 * candidate pairs reproducible for a given sequence of insertions.
 */
class SpatialGrid {
public:
    static constexpr float DEFAULT_CELL_SIZE = 64.0f;
    static constexpr float MAX_COORDINATE = 10000.0f;
    static constexpr int MAX_CELL_SPAN = 100;

    struct CellCoord {
        int x;
        int y;

        bool operator==(const CellCoord& other) const { return x == other.x && y == other.y; }
        bool operator<(const CellCoord& other) const {
            return y < other.y || (y == other.y && x < other.x);
        }
    };

    using CellList = boost::container::small_vector<CellCoord, 4>;
    using EntityPair = std::pair<EntityPtr, EntityPtr>;

    explicit SpatialGrid(float cellSize = DEFAULT_CELL_SIZE);

    /**
     * @brief Index an entity under every cell covered by its bounds.
     * @return false if the bounds are out of the indexable range (logged)
     */
    bool addEntity(const EntityPtr& entity);

    /**
     * @brief Re-index after movement. Untracked entities are added.
     *
     * Nothing is rehashed when the covered cell range is unchanged. An entity
     * that moved out of the indexable range is evicted.
     * @return false if the entity is not indexed after the call
     */
    bool updateEntity(const EntityPtr& entity);

    void removeEntity(EntityID id);
    void clear();

    /**
     * @brief Unordered pairs of entities sharing at least one cell.
     *
     * Each pair appears once, lower id first.
     */
    std::vector<EntityPair> getPotentialCollisions() const;

    // Cells an entity is filed under; empty if not tracked
    CellList getCellsForEntity(EntityID id) const;
    std::vector<EntityID> getEntitiesInCell(const CellCoord& cell) const;
    bool isTracked(EntityID id) const;

    size_t getTrackedEntityCount() const { return m_records.size(); }
    size_t getCellCount() const { return m_cells.size(); }
    float getCellSize() const { return m_cellSize; }

private:
    struct CellRange {
        int minX{0};
        int maxX{-1};
        int minY{0};
        int maxY{-1};

        bool operator==(const CellRange& other) const {
            return minX == other.minX && maxX == other.maxX &&
                   minY == other.minY && maxY == other.maxY;
        }
        bool contains(int x, int y) const {
            return x >= minX && x <= maxX && y >= minY && y <= maxY;
        }
    };

    struct Record {
        EntityPtr entity;
        CellRange range;
    };

    using CellVector = std::vector<EntityID>;

    float m_cellSize{DEFAULT_CELL_SIZE};
    boost::container::flat_map<EntityID, Record> m_records;
    boost::container::flat_map<CellCoord, CellVector> m_cells;

    CellRange computeRange(const AABB& bounds) const;
    bool isIndexable(const AABB& bounds, const CellRange& range) const;
    void forEachCell(const CellRange& range, const std::function<void(CellCoord)>& fn) const;
    void removeFromCell(const CellCoord& cell, EntityID id);
};

} // namespace CloudDefenders

#endif // SPATIAL_GRID_HPP
