/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/ExplosiveBomb.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include <cmath>
#include <string>

namespace {
const CloudDefenders::Color BOMB_COLOR(255, 215, 0);
const CloudDefenders::Color EXPLOSION_COLOR(255, 107, 53);
}

ExplosiveBomb::ExplosiveBomb(const Vector2D& targetPoint) : m_targetPoint(targetPoint) {}

EntityPtr ExplosiveBomb::create(EntityID id, float startX, float startY, float targetX, float targetY) {
    auto entity = std::make_shared<Entity>(id, startX, startY, SIZE, SIZE,
                                           ExplosiveBomb(Vector2D(targetX, targetY)));
    entity->setLayer(EntityLayer::Countermeasures);
    entity->setColor(BOMB_COLOR);
    entity->as<ExplosiveBomb>()->launch();
    return entity;
}

void ExplosiveBomb::launch() {
    if (!m_owner) return;
    m_direction = (m_targetPoint - m_owner->getPosition()).normalized();
    m_owner->setVelocity(m_direction * SPEED);
}

// Position is already integrated for this step when onUpdate runs
bool ExplosiveBomb::hasPassedTarget() const {
    if (m_direction.isZero()) return false;
    return (m_targetPoint - m_owner->getPosition()).dot(m_direction) <= 0.0f;
}

void ExplosiveBomb::onUpdate(float deltaTime) {
    if (!m_owner) return;

    if (!m_reachedTarget) {
        if (Vector2D::distance(m_targetPoint, m_owner->getPosition()) < ARRIVAL_DISTANCE || hasPassedTarget()) {
            m_owner->setPosition(m_targetPoint);
            startExplosion();
        } else if (m_owner->getAge() > MAX_FLIGHT_TIME) {
            ENTITY_WARN("Countermeasure " + std::to_string(m_owner->getID()) + " expired before detonating");
            m_owner->destroy();
        }
    } else if (m_exploding) {
        updateExplosion(deltaTime);
    }
}

void ExplosiveBomb::startExplosion() {
    m_reachedTarget = true;
    m_exploding = true;
    m_explosionTimer = 0.0f;
    m_explosionRadius = INITIAL_RADIUS;
    m_owner->setVelocity(0.0f, 0.0f);
}

void ExplosiveBomb::updateExplosion(float deltaTime) {
    m_explosionTimer += deltaTime;

    if (m_explosionTimer < EXPLOSION_DURATION) {
        const float progress = m_explosionTimer / EXPLOSION_DURATION;
        const float eased = 1.0f - std::pow(1.0f - progress, 3.0f);
        m_explosionRadius = MAX_RADIUS * eased;
    } else {
        m_explosionRadius = MAX_RADIUS;
        m_exploded = true;
        m_exploding = false;
        m_owner->destroy();
    }
}

std::vector<EntityPtr> ExplosiveBomb::getMissilesInRadius(const std::vector<EntityPtr>& missiles) const {
    std::vector<EntityPtr> caught;
    if (!m_exploding || m_explosionRadius <= 0.0f || !m_owner) {
        return caught;
    }

    const Vector2D center = m_owner->getCenter();
    for (const auto& missile : missiles) {
        if (!missile || !missile->isActive()) continue;
        if (Vector2D::distance(missile->getCenter(), center) <= m_explosionRadius) {
            caught.push_back(missile);
        }
    }
    return caught;
}

void ExplosiveBomb::renderBody(CloudDefenders::DrawContext& ctx) const {
    const Vector2D center = m_owner->getCenter();

    if (!m_reachedTarget) {
        ctx.fillCircle(center.getX(), center.getY(), SIZE, BOMB_COLOR.withAlpha(0.3f));
        ctx.fillCircle(center.getX(), center.getY(), SIZE * 0.5f, BOMB_COLOR);
        return;
    }

    if (m_exploding) {
        const float fade = 1.0f - m_explosionTimer / EXPLOSION_DURATION;
        ctx.fillCircle(center.getX(), center.getY(), m_explosionRadius, EXPLOSION_COLOR.withAlpha(fade * 0.6f));
        ctx.strokeCircle(center.getX(), center.getY(), m_explosionRadius, BOMB_COLOR.withAlpha(fade), 3.0f);
    }
}
