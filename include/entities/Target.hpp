/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TARGET_HPP
#define TARGET_HPP

#include "entities/EntityBehavior.hpp"
#include "utils/DrawContext.hpp"
#include <cstdint>
#include <string_view>

enum class TargetType : uint8_t {
    S3,
    Lambda,
    RDS,
    EC2,
    APIGateway,
    DynamoDB,
    CloudFront,
    IAM,
    Unknown
};

struct TargetStats {
    const char* name;
    const char* icon;
    const char* color;
    float width;
    float height;
    int maxHealth;
};

const TargetStats& getTargetStats(TargetType type);
TargetType targetTypeFromString(std::string_view name);
const char* toString(TargetType type);

/**
 * @brief Behavior of a defended cloud service.
 *
 * A destroyed target is not removed from the world. It stops colliding and
 * stays on the targets layer as a wreck, so that "every target destroyed"
 * can still be observed by the game conditions.
 */
class Target : public EntityBehavior {
public:
    static constexpr float DAMAGE_FLASH_DURATION = 0.2f;
    static constexpr int FALLBACK_COLLISION_DAMAGE = 25;
    static constexpr float HEALTHY_THRESHOLD = 0.7f;
    static constexpr float CRITICAL_THRESHOLD = 0.3f;

    explicit Target(TargetType type);

    static EntityPtr create(EntityID id, std::string_view type, float x, float y);

    void onUpdate(float deltaTime);
    void renderBody(CloudDefenders::DrawContext& ctx) const;
    void onRender(CloudDefenders::DrawContext& ctx) const;
    void onCollision(Entity& other);
    void onDestroy() {}

    /**
     * @brief Apply damage, clamped at zero health.
     *
     * No-op once destroyed. Starts the damage flash.
     * @return true only on the call that destroys the target
     */
    bool takeDamage(int amount);

    // Restores health up to the maximum; ignored once destroyed
    void heal(int amount);

    float getHealthPercentage() const;
    bool isHealthy() const;
    bool isDamaged() const;
    bool isCritical() const;

    TargetType getType() const { return m_type; }
    const TargetStats& getStats() const { return getTargetStats(m_type); }
    int getMaxHealth() const { return m_maxHealth; }
    int getCurrentHealth() const { return m_currentHealth; }
    bool isDestroyed() const { return m_destroyed; }
    bool isFlashing() const { return m_flashing; }
    bool hasPlayedDestructionEffect() const { return m_destructionEffectPlayed; }
    const char* getDisplayName() const { return getStats().name; }

private:
    void playDestructionEffect();

    TargetType m_type;
    int m_maxHealth;
    int m_currentHealth;
    bool m_destroyed{false};
    bool m_destructionEffectPlayed{false};
    bool m_flashing{false};
    float m_damageFlashTimer{0.0f};
};

#endif // TARGET_HPP
