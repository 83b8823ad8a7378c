/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DEFENSE_PROJECTILE_HPP
#define DEFENSE_PROJECTILE_HPP

#include "entities/EntityBehavior.hpp"
#include "utils/DrawContext.hpp"
#include "utils/Vector2D.hpp"

// Shot fired by a Defense at the point where its target was aimed
class DefenseProjectile : public EntityBehavior {
public:
    static constexpr float WIDTH = 4.0f;
    static constexpr float HEIGHT = 8.0f;
    static constexpr float MAX_LIFETIME = 5.0f;
    static constexpr float ARRIVAL_DISTANCE = 5.0f;

    DefenseProjectile(const Vector2D& targetPoint, int damage, float speed,
                      EntityWeakPtr source, const CloudDefenders::Color& color);

    static EntityPtr create(EntityID id, float startX, float startY,
                            float targetX, float targetY, int damage, float speed,
                            const EntityPtr& source);

    // Aims the owner at the target point at the configured speed
    void launch();

    void onUpdate(float deltaTime);
    void renderBody(CloudDefenders::DrawContext& ctx) const;
    void onRender(CloudDefenders::DrawContext& ctx) const;
    void onCollision(Entity& other);
    void onDestroy() {}

    int getDamage() const { return m_damage; }
    float getSpeed() const { return m_speed; }
    const Vector2D& getTargetPoint() const { return m_targetPoint; }
    EntityPtr getSource() const { return m_source.lock(); }

private:
    Vector2D m_targetPoint;
    int m_damage;
    float m_speed;
    EntityWeakPtr m_source;
    CloudDefenders::Color m_color;
};

#endif // DEFENSE_PROJECTILE_HPP
