/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityManager.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "utils/DrawContext.hpp"
#include <algorithm>
#include <string>
#include <unordered_set>

namespace CloudDefenders {

namespace {
const std::vector<EntityPtr> EMPTY_LAYER;
}

EntityManager::EntityManager(float cellSize) : m_spatialGrid(cellSize) {}

void EntityManager::addEntity(const EntityPtr& entity) {
    if (!entity) {
        ENTITYMGR_WARN("Ignoring null entity");
        return;
    }
    m_pendingAdd.push_back(entity);
}

void EntityManager::addEntity(const EntityPtr& entity, EntityLayer layer) {
    if (entity) {
        entity->setLayer(layer);
    }
    addEntity(entity);
}

void EntityManager::removeEntity(EntityID id) {
    m_pendingRemove.push_back(id);
}

void EntityManager::update(float deltaTime) {
    flushPendingAdditions();

    // Index loop: nothing can be appended to m_entities while it runs
    for (size_t i = 0; i < m_entities.size(); ++i) {
        m_entities[i]->update(deltaTime);
    }

    syncSpatialGrid();
    sweepDestroyed();
}

void EntityManager::flushPendingAdditions() {
    if (m_pendingAdd.empty()) return;

    std::vector<EntityPtr> pending;
    pending.swap(m_pendingAdd);

    for (const auto& entity : pending) {
        const EntityID id = entity->getID();
        if (m_index.find(id) != m_index.end()) {
            ENTITYMGR_WARN("Entity " + std::to_string(id) + " already managed, skipping");
            continue;
        }
        m_entities.push_back(entity);
        m_layers[entity->getLayer()].push_back(entity);
        m_index.emplace(id, entity);
        m_spatialGrid.addEntity(entity);
    }
}

void EntityManager::syncSpatialGrid() {
    for (const auto& entity : m_entities) {
        if (!entity->isMarkedForDestruction()) {
            m_spatialGrid.updateEntity(entity);
        }
    }
}

void EntityManager::sweepDestroyed() {
    std::unordered_set<EntityID> doomed(m_pendingRemove.begin(), m_pendingRemove.end());
    m_pendingRemove.clear();

    for (const auto& entity : m_entities) {
        if (entity->isMarkedForDestruction()) {
            doomed.insert(entity->getID());
        }
    }
    if (doomed.empty()) return;

    auto isDoomed = [&doomed](const EntityPtr& entity) {
        return doomed.count(entity->getID()) > 0;
    };

    m_entities.erase(std::remove_if(m_entities.begin(), m_entities.end(), isDoomed), m_entities.end());
    for (auto& [layer, entities] : m_layers) {
        entities.erase(std::remove_if(entities.begin(), entities.end(), isDoomed), entities.end());
    }
    for (EntityID id : doomed) {
        m_index.erase(id);
        m_spatialGrid.removeEntity(id);
    }
}

std::vector<EntityManager::CollisionPair> EntityManager::checkCollisions() {
    std::vector<CollisionPair> collisions;

    for (const auto& [first, second] : m_spatialGrid.getPotentialCollisions()) {
        if (first->isMarkedForDestruction() || second->isMarkedForDestruction()) {
            continue;
        }
        if (!first->isCollidingWith(*second)) {
            continue;
        }

        first->onCollision(*second);
        second->onCollision(*first);
        collisions.emplace_back(first, second);
    }
    return collisions;
}

void EntityManager::render(DrawContext& ctx) const {
    for (EntityLayer layer : RENDER_LAYER_ORDER) {
        for (const auto& entity : getEntitiesByLayer(layer)) {
            entity->render(ctx);
        }
    }
}

const std::vector<EntityPtr>& EntityManager::getEntitiesByLayer(EntityLayer layer) const {
    auto it = m_layers.find(layer);
    return it != m_layers.end() ? it->second : EMPTY_LAYER;
}

bool EntityManager::hasEntitiesInLayer(EntityLayer layer, bool includePending) const {
    auto alive = [](const EntityPtr& entity) { return !entity->isMarkedForDestruction(); };

    const auto& entities = getEntitiesByLayer(layer);
    if (std::any_of(entities.begin(), entities.end(), alive)) {
        return true;
    }
    if (!includePending) {
        return false;
    }
    return std::any_of(m_pendingAdd.begin(), m_pendingAdd.end(),
                       [&](const EntityPtr& entity) { return entity->getLayer() == layer && alive(entity); });
}

size_t EntityManager::countEntitiesInLayer(EntityLayer layer, bool includePending) const {
    auto alive = [](const EntityPtr& entity) { return !entity->isMarkedForDestruction(); };

    const auto& entities = getEntitiesByLayer(layer);
    size_t count = static_cast<size_t>(std::count_if(entities.begin(), entities.end(), alive));
    if (includePending) {
        count += static_cast<size_t>(std::count_if(m_pendingAdd.begin(), m_pendingAdd.end(),
            [&](const EntityPtr& entity) { return entity->getLayer() == layer && alive(entity); }));
    }
    return count;
}

EntityPtr EntityManager::getEntity(EntityID id) const {
    auto it = m_index.find(id);
    return it != m_index.end() ? it->second : nullptr;
}

void EntityManager::clear() {
    m_entities.clear();
    m_layers.clear();
    m_index.clear();
    m_pendingAdd.clear();
    m_pendingRemove.clear();
    m_spatialGrid.clear();
    ENTITYMGR_DEBUG("All entities cleared");
}

} // namespace CloudDefenders
