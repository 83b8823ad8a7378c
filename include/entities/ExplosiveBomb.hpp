/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef EXPLOSIVE_BOMB_HPP
#define EXPLOSIVE_BOMB_HPP

#include "entities/EntityBehavior.hpp"
#include "utils/DrawContext.hpp"
#include "utils/Vector2D.hpp"
#include <vector>

/**
 * @brief Player countermeasure that travels to a point and detonates.
 *
 * Phases: travelling, exploding (radius eases out toward MAX_RADIUS over
 * EXPLOSION_DURATION), then the bomb destroys itself. A step that carries
 * the bomb past its aim point still detonates it, on the aim point.
 */
class ExplosiveBomb : public EntityBehavior {
public:
    static constexpr float SIZE = 8.0f;
    static constexpr float SPEED = 300.0f;
    static constexpr float ARRIVAL_DISTANCE = 5.0f;
    static constexpr float INITIAL_RADIUS = 10.0f;
    static constexpr float MAX_RADIUS = 50.0f;
    static constexpr float EXPLOSION_DURATION = 1.0f;
    // Flight time after which a bomb that never detonated is removed
    static constexpr float MAX_FLIGHT_TIME = 5.0f;

    explicit ExplosiveBomb(const Vector2D& targetPoint);

    static EntityPtr create(EntityID id, float startX, float startY, float targetX, float targetY);

    void launch();

    void onUpdate(float deltaTime);
    void renderBody(CloudDefenders::DrawContext& ctx) const;
    void onRender(CloudDefenders::DrawContext&) const {}
    void onCollision(Entity&) {}
    void onDestroy() {}

    /**
     * @brief Missiles whose center lies inside the current blast radius.
     * @param missiles Candidates, usually the missiles layer
     * @return Empty unless the bomb is exploding
     */
    std::vector<EntityPtr> getMissilesInRadius(const std::vector<EntityPtr>& missiles) const;

    bool hasReachedTarget() const { return m_reachedTarget; }
    bool isExploding() const { return m_exploding; }
    bool hasExploded() const { return m_exploded; }
    float getExplosionRadius() const { return m_explosionRadius; }
    float getExplosionTimer() const { return m_explosionTimer; }
    const Vector2D& getTargetPoint() const { return m_targetPoint; }

private:
    bool hasPassedTarget() const;
    void startExplosion();
    void updateExplosion(float deltaTime);

    Vector2D m_targetPoint;
    Vector2D m_direction;
    bool m_reachedTarget{false};
    bool m_exploding{false};
    bool m_exploded{false};
    float m_explosionRadius{0.0f};
    float m_explosionTimer{0.0f};
};

#endif // EXPLOSIVE_BOMB_HPP
