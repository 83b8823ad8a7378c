/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MISSILE_HPP
#define MISSILE_HPP

#include "entities/EntityBehavior.hpp"
#include "utils/DrawContext.hpp"
#include "utils/Vector2D.hpp"
#include <boost/circular_buffer.hpp>
#include <cstdint>
#include <random>
#include <string_view>

enum class MissileType : uint8_t {
    CostSpike,
    DataBreach,
    LatencyGhost,
    PolicyViolator,
    Unknown
};

enum class MovementPattern : uint8_t {
    Direct,
    Seeking,
    Erratic,
    Slow
};

/**
 * @brief Static balance row for one missile type.
 */
struct MissileStats {
    const char* name;
    const char* icon;
    const char* color;
    float width;
    float height;
    float speed;
    int damage;
    MovementPattern movement;
    float acceleration;
    float wobble;
    float seekingStrength;
    float threatWeight;
    int interceptPoints;
};

const MissileStats& getMissileStats(MissileType type);

// Unknown names resolve to MissileType::Unknown (the default row)
MissileType missileTypeFromString(std::string_view name);
const char* toString(MissileType type);

/**
 * @brief Behavior of an incoming threat.
 *
 * A missile flies from its spawn point toward a fixed point (the center of
 * the target it was aimed at), steering according to its movement pattern.
 * It destroys itself on arrival, when it leaves the playfield, or when it
 * outlives MAX_LIFETIME.
 */
class Missile : public EntityBehavior {
public:
    static constexpr float MAX_LIFETIME = 30.0f;
    static constexpr size_t MAX_TRAIL_LENGTH = 8;
    static constexpr float TARGET_REACHED_DISTANCE = 10.0f;
    static constexpr float OFFSCREEN_MARGIN = 50.0f;
    static constexpr float SPEED_BOOST = 1.2f;
    static constexpr float BOSS_SCALE = 1.5f;

    Missile(MissileType type, const Vector2D& targetPoint, uint32_t seed);

    /**
     * @brief Build a missile entity with its type's size, launched at the target point.
     * @param id Identifier from the owning EntityManager
     * @param type Type key ("cost-spike", ...); unknown keys use the default row
     * @param x Spawn position (top-left)
     * @param y Spawn position (top-left)
     * @param targetX Point the missile is aimed at
     * @param targetY Point the missile is aimed at
     * @param seed Seed of the missile's private random engine
     */
    static EntityPtr create(EntityID id, std::string_view type, float x, float y,
                            float targetX, float targetY, uint32_t seed);

    // Computes the trajectory from the owner's current position and sets the
    // initial velocity. Called once by create().
    void launch();

    void onUpdate(float deltaTime);
    void renderBody(CloudDefenders::DrawContext& ctx) const;
    void onRender(CloudDefenders::DrawContext& ctx) const;
    void onCollision(Entity& other);
    void onDestroy() {}

    /**
     * @brief Remove one hit point; the missile is destroyed at zero.
     * @return true if this hit destroyed the missile
     */
    bool takeDamage();

    void applyDifficulty(float multiplier);

    // Scale 1.5, double damage, two hit points, red. Only the first call has effect.
    void makeBoss();

    void setPlayfieldSize(float width, float height);

    bool hasReachedTarget() const;
    bool isOffScreen() const;

    MissileType getType() const { return m_type; }
    const MissileStats& getStats() const { return getMissileStats(m_type); }
    float getSpeed() const { return m_speed; }
    int getDamage() const { return m_damage; }
    int getHitPoints() const { return m_hitPoints; }
    bool isBoss() const { return m_isBoss; }
    int getInterceptPoints() const { return getStats().interceptPoints; }
    float getThreatWeight() const { return getStats().threatWeight; }
    const Vector2D& getTargetPoint() const { return m_targetPoint; }
    const Vector2D& getDirection() const { return m_direction; }
    float getTrajectoryDistance() const { return m_distance; }
    const boost::circular_buffer<Vector2D>& getTrail() const { return m_trail; }
    const CloudDefenders::Color& getColor() const { return m_color; }
    const char* getDisplayName() const { return getStats().name; }

private:
    void updateMovement(float deltaTime);
    void seekTowardTarget(float deltaTime);
    void updateErratic(float deltaTime);
    void updateSlow();
    float randomUnit();

    void renderTypeEffect(CloudDefenders::DrawContext& ctx) const;

    MissileType m_type;
    MovementPattern m_movement;
    Vector2D m_targetPoint;
    Vector2D m_direction;
    float m_distance{0.0f};
    float m_speed;
    int m_damage;
    int m_hitPoints{1};
    bool m_isBoss{false};
    float m_playfieldWidth{800.0f};
    float m_playfieldHeight{600.0f};
    CloudDefenders::Color m_color;
    boost::circular_buffer<Vector2D> m_trail;
    std::mt19937 m_rng;
};

#endif // MISSILE_HPP
