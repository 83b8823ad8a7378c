/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_BEHAVIOR_HPP
#define ENTITY_BEHAVIOR_HPP

#include "entities/EntityTypes.hpp"

/**
 * @brief Common base of the behavior alternatives an Entity can carry.
 *
 * Holds a non-owning pointer back to the entity the behavior lives in.
 * The pointer is set by the Entity constructor (and by setBehavior) once the
 * behavior sits in its final storage, so a behavior copied or moved outside
 * an entity is detached until it is installed again.
 */
class EntityBehavior {
public:
    Entity* owner() const { return m_owner; }
    bool isAttached() const { return m_owner != nullptr; }

    void attach(Entity* owner) { m_owner = owner; }

protected:
    EntityBehavior() = default;

    Entity* m_owner{nullptr};
};

#endif // ENTITY_BEHAVIOR_HPP
