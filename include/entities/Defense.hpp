/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DEFENSE_HPP
#define DEFENSE_HPP

#include "entities/EntityBehavior.hpp"
#include "utils/DrawContext.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace CloudDefenders {
    class EntityManager;
}

enum class DefenseType : uint8_t {
    Firewall,
    Antivirus,
    WAF,
    DDoSProtection,
    Encryption,
    Monitoring,
    Backup,
    ShieldNode,
    Unknown
};

enum class TargetingMode : uint8_t {
    Nearest,
    Strongest,
    Fastest,
    Multiple,
    All
};

struct DefenseStats {
    const char* name;
    const char* icon;
    const char* color;
    float width;
    float height;
    float range;
    int damage;
    float cooldown;
    float projectileSpeed;
    float chargeTime;
    TargetingMode targeting;
    int deploymentCost;
};

const DefenseStats& getDefenseStats(DefenseType type);
DefenseType defenseTypeFromString(std::string_view name);
const char* toString(DefenseType type);

/**
 * @brief A missile seen by a defense during target acquisition.
 */
struct TargetCandidate {
    EntityPtr entity;
    float distance{0.0f};
    float threat{0.0f};
};

struct DefenseCombatStats {
    int shotsFired{0};
    int hits{0};
    int threatsDestroyed{0};
    float efficiency{0.0f};
};

/**
 * @brief Behavior of a player-placed countermeasure.
 *
 * Firing is a two step state machine: the first fire() call on a ready
 * defense starts charging, and once the charge time has elapsed the next
 * fire() call spawns a DefenseProjectile and puts the defense on cooldown.
 */
class Defense : public EntityBehavior {
public:
    static constexpr float FIRING_EFFECT_DURATION = 0.3f;
    static constexpr float MAX_SHIELD_ENERGY = 100.0f;
    static constexpr float SHIELD_SHOT_COST = 20.0f;
    static constexpr float SHIELD_REGEN_PER_SECOND = 10.0f;
    static constexpr size_t MULTIPLE_TARGET_COUNT = 3;

    explicit Defense(DefenseType type);

    static EntityPtr create(EntityID id, std::string_view type, float x, float y);

    void onUpdate(float deltaTime);
    void renderBody(CloudDefenders::DrawContext& ctx) const;
    void onRender(CloudDefenders::DrawContext& ctx) const;
    void onCollision(Entity&) {}
    void onDestroy();

    /**
     * @brief Collect active missiles whose center lies within range.
     * @param entities Any entities; non-missile layers are skipped
     * @return Candidates in input order
     */
    std::vector<TargetCandidate> findTargetsInRange(const std::vector<EntityPtr>& entities) const;

    /**
     * @brief Apply the targeting mode to a candidate list.
     *
     * Nearest, strongest and fastest yield one entity (the earliest candidate
     * wins ties); multiple yields the three nearest; all yields every
     * candidate. An empty input yields an empty selection.
     */
    std::vector<EntityPtr> selectTarget(const std::vector<TargetCandidate>& candidates) const;

    float calculateThreatLevel(const Entity& missile) const;

    /**
     * @brief Advance the firing state machine toward the given target.
     * @param target Missile to shoot at; null is rejected
     * @param manager Receives the projectile on the defences layer
     * @return The projectile entity, or null while idle, charging or cooling down
     */
    EntityPtr fire(const EntityPtr& target, CloudDefenders::EntityManager& manager);

    bool canFire() const;
    bool canStartCharging() const;
    bool startCharging();

    void activate();
    void deactivate();
    void setDeployed(bool deployed) { m_deployed = deployed; }

    void showRangeIndicator() { m_rangeIndicatorVisible = true; }
    void hideRangeIndicator() { m_rangeIndicatorVisible = false; }
    void toggleRangeIndicator() { m_rangeIndicatorVisible = !m_rangeIndicatorVisible; }
    bool isRangeIndicatorVisible() const { return m_rangeIndicatorVisible; }

    // Credited by projectiles fired from this defense
    void recordHit(bool destroyedTarget);

    DefenseCombatStats getCombatStats() const;
    float getEfficiency() const;

    DefenseType getType() const { return m_type; }
    const DefenseStats& getStats() const { return getDefenseStats(m_type); }
    TargetingMode getTargetingMode() const { return getStats().targeting; }
    float getRange() const { return getStats().range; }
    int getDamage() const { return getStats().damage; }
    float getCooldownTime() const { return getStats().cooldown; }
    float getCurrentCooldown() const { return m_currentCooldown; }
    float getChargeTime() const { return m_chargeTime; }
    float getMaxChargeTime() const { return getStats().chargeTime; }
    bool isCharging() const { return m_charging; }
    bool isActive() const { return m_active; }
    bool isDeployed() const { return m_deployed; }
    bool isShieldNode() const { return m_type == DefenseType::ShieldNode; }
    float getShieldEnergy() const { return m_shieldEnergy; }
    float getFiringEffectTimer() const { return m_firingEffectTimer; }
    int getDeploymentCost() const { return getStats().deploymentCost; }
    const char* getDisplayName() const { return getStats().name; }
    const EntityWeakPtr& getCurrentTarget() const { return m_currentTarget; }

private:
    CloudDefenders::Color currentBodyColor() const;

    DefenseType m_type;
    bool m_active{true};
    bool m_deployed{true};
    bool m_charging{false};
    float m_chargeTime{0.0f};
    float m_currentCooldown{0.0f};
    float m_firingEffectTimer{0.0f};
    float m_shieldEnergy{0.0f};
    bool m_rangeIndicatorVisible{false};
    EntityWeakPtr m_currentTarget;

    int m_shotsFired{0};
    int m_hits{0};
    int m_threatsDestroyed{0};
};

#endif // DEFENSE_HPP
