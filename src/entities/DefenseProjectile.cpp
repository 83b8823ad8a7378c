/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/DefenseProjectile.hpp"
#include "entities/Entity.hpp"

DefenseProjectile::DefenseProjectile(const Vector2D& targetPoint, int damage, float speed,
                                     EntityWeakPtr source, const CloudDefenders::Color& color)
    : m_targetPoint(targetPoint), m_damage(damage), m_speed(speed),
      m_source(std::move(source)), m_color(color) {}

EntityPtr DefenseProjectile::create(EntityID id, float startX, float startY,
                                    float targetX, float targetY, int damage, float speed,
                                    const EntityPtr& source) {
    const CloudDefenders::Color color = source ? source->getColor() : CloudDefenders::Color();
    auto entity = std::make_shared<Entity>(id, startX, startY, WIDTH, HEIGHT,
                                           DefenseProjectile(Vector2D(targetX, targetY), damage,
                                                             speed, source, color));
    entity->setLayer(EntityLayer::Defences);
    entity->setColor(color);
    entity->as<DefenseProjectile>()->launch();
    return entity;
}

void DefenseProjectile::launch() {
    if (!m_owner) return;
    Vector2D direction = (m_targetPoint - m_owner->getPosition()).normalized();
    m_owner->setVelocity(direction * m_speed);
}

void DefenseProjectile::onUpdate(float) {
    if (!m_owner) return;

    if (Vector2D::distance(m_targetPoint, m_owner->getPosition()) < ARRIVAL_DISTANCE ||
        m_owner->getAge() > MAX_LIFETIME) {
        m_owner->destroy();
    }
}

void DefenseProjectile::onCollision(Entity& other) {
    if (!m_owner || other.getLayer() != EntityLayer::Missiles) return;

    if (Missile* missile = other.as<Missile>()) {
        missile->takeDamage();
    } else {
        other.destroy();
    }

    if (EntityPtr source = m_source.lock()) {
        if (Defense* defense = source->as<Defense>()) {
            defense->recordHit(other.isMarkedForDestruction());
        }
    }

    m_owner->destroy();
}

void DefenseProjectile::renderBody(CloudDefenders::DrawContext& ctx) const {
    const auto& bounds = m_owner->getBounds();
    ctx.fillRect(bounds.left, bounds.top, bounds.width(), bounds.height(), m_color);
}

void DefenseProjectile::onRender(CloudDefenders::DrawContext& ctx) const {
    const auto& bounds = m_owner->getBounds();
    ctx.fillRect(bounds.left + bounds.width() * 0.25f, bounds.top + bounds.height() * 0.25f,
                 bounds.width() * 0.5f, bounds.height() * 0.5f, CloudDefenders::Color(255, 255, 255));
}
