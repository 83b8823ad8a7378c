/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_MANAGER_HPP
#define ENTITY_MANAGER_HPP

#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <unordered_map>
#include <vector>

#include "collisions/SpatialGrid.hpp"
#include "entities/EntityTypes.hpp"
#include "utils/UniqueID.hpp"

namespace CloudDefenders {

class DrawContext;

/**
 * @brief Owns every live entity of a session.
 *
 * Additions and removals requested at any time are queued and applied by
 * update(), so entity lists never change under an iteration. Per frame:
 *   1. pending additions are filed into their layer, the id index and the grid
 *   2. every entity is updated in insertion order
 *   3. moved entities are re-indexed in the grid
 *   4. entities marked for destruction or queued for removal are evicted
 *
 * The collision pass (checkCollisions) is a separate step so callers can run
 * other systems between movement and collision resolution.
 */
class EntityManager {
public:
    using CollisionPair = SpatialGrid::EntityPair;

    explicit EntityManager(float cellSize = SpatialGrid::DEFAULT_CELL_SIZE);

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    // Next unused entity id; ids are never reused, not even after clear()
    EntityID nextEntityId() { return m_idGenerator.generate(); }

    /**
     * @brief Queue an entity for insertion on the next update.
     *
     * The one-argument form files the entity under its own layer tag; the
     * two-argument form retags the entity first.
     */
    void addEntity(const EntityPtr& entity);
    void addEntity(const EntityPtr& entity, EntityLayer layer);

    // Queue a removal; applied by the sweep of the next update
    void removeEntity(EntityID id);

    void update(float deltaTime);

    /**
     * @brief Resolve overlaps among grid candidate pairs.
     *
     * Both sides of a confirmed pair receive onCollision. A pair is skipped
     * when either side was destroyed earlier in the same pass.
     * @return Confirmed pairs in the order they were resolved
     */
    std::vector<CollisionPair> checkCollisions();

    // Draws layers back to front; see RENDER_LAYER_ORDER
    void render(DrawContext& ctx) const;

    const std::vector<EntityPtr>& getEntitiesByLayer(EntityLayer layer) const;

    /**
     * @brief Whether a layer holds any entity that is not already destroyed.
     * @param includePending Also count entities still waiting to be added
     */
    bool hasEntitiesInLayer(EntityLayer layer, bool includePending = true) const;
    size_t countEntitiesInLayer(EntityLayer layer, bool includePending = true) const;

    EntityPtr getEntity(EntityID id) const;
    const std::vector<EntityPtr>& getAllEntities() const { return m_entities; }
    size_t getEntityCount() const { return m_entities.size(); }
    size_t getPendingAddCount() const { return m_pendingAdd.size(); }
    size_t getPendingRemoveCount() const { return m_pendingRemove.size(); }

    // Drops every entity, pending queue and grid entry
    void clear();

    const SpatialGrid& getSpatialGrid() const { return m_spatialGrid; }

private:
    void flushPendingAdditions();
    void syncSpatialGrid();
    void sweepDestroyed();

    std::vector<EntityPtr> m_entities;  // insertion order
    boost::container::flat_map<EntityLayer, std::vector<EntityPtr>> m_layers;
    std::unordered_map<EntityID, EntityPtr> m_index;
    std::vector<EntityPtr> m_pendingAdd;
    std::vector<EntityID> m_pendingRemove;

    SpatialGrid m_spatialGrid;
    UniqueIDGenerator m_idGenerator;
};

} // namespace CloudDefenders

#endif // ENTITY_MANAGER_HPP
