/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Target.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include <algorithm>
#include <array>
#include <string>

namespace {
// name, icon, color, w, h, max health
constexpr std::array<TargetStats, 9> TARGET_TABLE = {{
    {"S3 Bucket", "S3", "#FF9900", 48.0f, 48.0f, 100},
    {"Lambda Function", "L", "#FF9900", 40.0f, 40.0f, 75},
    {"RDS Database", "DB", "#3F48CC", 56.0f, 48.0f, 150},
    {"EC2 Instance", "EC2", "#FF9900", 52.0f, 44.0f, 125},
    {"API Gateway", "API", "#FF4B4B", 44.0f, 40.0f, 90},
    {"DynamoDB Table", "DDB", "#3F48CC", 50.0f, 46.0f, 120},
    {"CloudFront CDN", "CDN", "#9D5AAE", 48.0f, 42.0f, 110},
    {"IAM Service", "IAM", "#DD344C", 42.0f, 42.0f, 80},
    {"Unknown Service", "?", "#888888", 48.0f, 48.0f, 100},
}};

constexpr std::array<const char*, 9> TARGET_KEYS = {
    "s3", "lambda", "rds", "ec2", "apigateway", "dynamodb", "cloudfront", "iam", "unknown"
};

const CloudDefenders::Color CRITICAL_COLOR(255, 68, 68);
const CloudDefenders::Color DAMAGED_COLOR(255, 170, 68);
const CloudDefenders::Color FLASH_COLOR(255, 255, 255);
}

const TargetStats& getTargetStats(TargetType type) {
    auto index = static_cast<size_t>(type);
    return index < TARGET_TABLE.size() ? TARGET_TABLE[index]
                                       : TARGET_TABLE[static_cast<size_t>(TargetType::Unknown)];
}

TargetType targetTypeFromString(std::string_view name) {
    for (size_t i = 0; i < static_cast<size_t>(TargetType::Unknown); ++i) {
        if (name == TARGET_KEYS[i]) {
            return static_cast<TargetType>(i);
        }
    }
    TARGET_INFO("Unknown target type '" + std::string(name) + "', using default stats");
    return TargetType::Unknown;
}

const char* toString(TargetType type) {
    auto index = static_cast<size_t>(type);
    return index < TARGET_KEYS.size() ? TARGET_KEYS[index] : "unknown";
}

Target::Target(TargetType type)
    : m_type(type),
      m_maxHealth(getTargetStats(type).maxHealth),
      m_currentHealth(getTargetStats(type).maxHealth) {}

EntityPtr Target::create(EntityID id, std::string_view type, float x, float y) {
    TargetType targetType = targetTypeFromString(type);
    const TargetStats& stats = getTargetStats(targetType);

    auto entity = std::make_shared<Entity>(id, x, y, stats.width, stats.height, Target(targetType));
    entity->setLayer(EntityLayer::Targets);
    entity->setColor(CloudDefenders::Color::fromHex(stats.color));
    return entity;
}

bool Target::takeDamage(int amount) {
    if (m_destroyed) return false;

    m_currentHealth = std::max(0, m_currentHealth - amount);
    m_damageFlashTimer = DAMAGE_FLASH_DURATION;
    m_flashing = true;

    if (m_currentHealth <= 0) {
        m_destroyed = true;
        // A wreck takes no further hits, even later in the same collision pass
        if (m_owner) {
            m_owner->setCollidable(false);
        }
        return true;
    }
    return false;
}

void Target::heal(int amount) {
    if (m_destroyed) return;
    m_currentHealth = std::min(m_maxHealth, m_currentHealth + amount);
}

float Target::getHealthPercentage() const {
    return m_maxHealth > 0 ? static_cast<float>(m_currentHealth) / static_cast<float>(m_maxHealth) : 0.0f;
}

bool Target::isHealthy() const {
    return getHealthPercentage() > HEALTHY_THRESHOLD;
}

bool Target::isDamaged() const {
    const float health = getHealthPercentage();
    return health <= HEALTHY_THRESHOLD && health > CRITICAL_THRESHOLD;
}

bool Target::isCritical() const {
    return getHealthPercentage() <= CRITICAL_THRESHOLD && !m_destroyed;
}

void Target::onUpdate(float deltaTime) {
    if (m_flashing) {
        m_damageFlashTimer -= deltaTime;
        if (m_damageFlashTimer <= 0.0f) {
            m_flashing = false;
            m_damageFlashTimer = 0.0f;
        }
    }

    if (m_destroyed && !m_destructionEffectPlayed) {
        playDestructionEffect();
    }
}

void Target::playDestructionEffect() {
    m_destructionEffectPlayed = true;
    TARGET_INFO(std::string(getDisplayName()) + " destroyed");
}

void Target::onCollision(Entity& other) {
    if (other.getLayer() != EntityLayer::Missiles) return;

    const Missile* missile = other.as<Missile>();
    takeDamage(missile ? missile->getDamage() : FALLBACK_COLLISION_DAMAGE);
    other.destroy();
}

void Target::renderBody(CloudDefenders::DrawContext& ctx) const {
    const auto& bounds = m_owner->getBounds();

    CloudDefenders::Color background = m_owner->getColor();
    if (isCritical()) {
        background = CRITICAL_COLOR;
    } else if (isDamaged()) {
        background = DAMAGED_COLOR;
    }
    if (m_flashing) {
        background = FLASH_COLOR;
    }
    if (m_destroyed) {
        background = CloudDefenders::Color(68, 68, 68);
    }

    ctx.fillRect(bounds.left + 2.0f, bounds.top + 2.0f, bounds.width() - 4.0f, bounds.height() - 4.0f,
                 background);
    ctx.strokeRect(bounds.left, bounds.top, bounds.width(), bounds.height(),
                   CloudDefenders::Color(0, 0, 0), 2.0f);
}

void Target::onRender(CloudDefenders::DrawContext& ctx) const {
    const auto& bounds = m_owner->getBounds();

    // Health bar above the service
    constexpr float barHeight = 8.0f;
    constexpr float barOffset = -12.0f;
    const float health = getHealthPercentage();
    CloudDefenders::Color barColor(76, 175, 80);
    if (health <= 0.25f) {
        barColor = CloudDefenders::Color(244, 67, 54);
    } else if (health <= 0.5f) {
        barColor = CloudDefenders::Color(255, 193, 7);
    }
    ctx.fillRect(bounds.left, bounds.top + barOffset, bounds.width(), barHeight,
                 CloudDefenders::Color(51, 51, 51));
    ctx.fillRect(bounds.left, bounds.top + barOffset, bounds.width() * health, barHeight, barColor);

    ctx.drawText(getStats().icon, bounds.centerX, bounds.centerY, CloudDefenders::Color(255, 255, 255));

    if (m_flashing) {
        ctx.fillRect(bounds.left, bounds.top, bounds.width(), bounds.height(),
                     CloudDefenders::Color(255, 0, 0).withAlpha(0.3f));
    }

    if (m_destroyed) {
        const float radius = std::max(bounds.width(), bounds.height()) * 0.5f + 10.0f;
        ctx.strokeCircle(bounds.centerX, bounds.centerY, radius, CloudDefenders::Color(255, 68, 68), 3.0f);
        ctx.drawLine(bounds.left, bounds.top, bounds.right, bounds.bottom, CRITICAL_COLOR, 3.0f);
        ctx.drawLine(bounds.right, bounds.top, bounds.left, bounds.bottom, CRITICAL_COLOR, 3.0f);
    }
}
