/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Missile.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace {
// name, icon, color, w, h, speed, damage, movement, accel, wobble, seek, threat weight, points
constexpr std::array<MissileStats, 5> MISSILE_TABLE = {{
    {"Cost Spike", "$", "#FF6B35", 20.0f, 28.0f, 120.0f, 35, MovementPattern::Direct, 1.2f, 0.0f, 0.0f, 1.2f, 100},
    {"Data Breach", "!", "#DC143C", 24.0f, 24.0f, 80.0f, 50, MovementPattern::Seeking, 1.0f, 0.1f, 0.8f, 1.5f, 150},
    {"Latency Ghost", "~", "#9370DB", 18.0f, 22.0f, 200.0f, 20, MovementPattern::Erratic, 0.9f, 0.5f, 0.3f, 0.8f, 75},
    {"Policy Violator", "X", "#FF1493", 22.0f, 26.0f, 60.0f, 40, MovementPattern::Slow, 1.0f, 0.05f, 0.2f, 1.3f, 125},
    {"Unknown Threat", "?", "#FF4444", 20.0f, 24.0f, 100.0f, 25, MovementPattern::Direct, 1.0f, 0.0f, 0.0f, 1.0f, 100},
}};

constexpr std::array<const char*, 5> MISSILE_KEYS = {
    "cost-spike", "data-breach", "latency-ghost", "policy-violator", "unknown"
};

constexpr float TWO_PI = 6.28318530718f;
constexpr float ERRATIC_CHANGE_STRENGTH = 0.5f;
constexpr float ERRATIC_INITIAL_JITTER = 0.3f;
constexpr float ERRATIC_SEEK_CHANCE = 0.1f;
constexpr float SLOW_CORRECTION_CHANCE = 0.05f;
constexpr float SLOW_CORRECTION_STRENGTH = 0.1f;
const CloudDefenders::Color BOSS_COLOR(255, 0, 0);
}

const MissileStats& getMissileStats(MissileType type) {
    auto index = static_cast<size_t>(type);
    return index < MISSILE_TABLE.size() ? MISSILE_TABLE[index]
                                        : MISSILE_TABLE[static_cast<size_t>(MissileType::Unknown)];
}

MissileType missileTypeFromString(std::string_view name) {
    for (size_t i = 0; i < static_cast<size_t>(MissileType::Unknown); ++i) {
        if (name == MISSILE_KEYS[i]) {
            return static_cast<MissileType>(i);
        }
    }
    MISSILE_INFO("Unknown missile type '" + std::string(name) + "', using default stats");
    return MissileType::Unknown;
}

const char* toString(MissileType type) {
    auto index = static_cast<size_t>(type);
    return index < MISSILE_KEYS.size() ? MISSILE_KEYS[index] : "unknown";
}

Missile::Missile(MissileType type, const Vector2D& targetPoint, uint32_t seed)
    : m_type(type),
      m_movement(getMissileStats(type).movement),
      m_targetPoint(targetPoint),
      m_speed(getMissileStats(type).speed),
      m_damage(getMissileStats(type).damage),
      m_color(CloudDefenders::Color::fromHex(getMissileStats(type).color)),
      m_trail(MAX_TRAIL_LENGTH),
      m_rng(seed) {}

EntityPtr Missile::create(EntityID id, std::string_view type, float x, float y,
                          float targetX, float targetY, uint32_t seed) {
    MissileType missileType = missileTypeFromString(type);
    const MissileStats& stats = getMissileStats(missileType);

    auto entity = std::make_shared<Entity>(id, x, y, stats.width, stats.height,
                                           Missile(missileType, Vector2D(targetX, targetY), seed));
    entity->setLayer(EntityLayer::Missiles);
    entity->setColor(CloudDefenders::Color::fromHex(stats.color));
    entity->as<Missile>()->launch();
    return entity;
}

float Missile::randomUnit() {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(m_rng);
}

void Missile::launch() {
    if (!m_owner) return;

    Vector2D delta = m_targetPoint - m_owner->getPosition();
    m_distance = delta.length();
    m_direction = delta.normalized();

    const float boostedSpeed = m_speed * SPEED_BOOST;
    Vector2D velocity = m_direction * boostedSpeed;

    if (m_movement == MovementPattern::Erratic) {
        velocity += Vector2D((randomUnit() - 0.5f) * boostedSpeed * ERRATIC_INITIAL_JITTER,
                             (randomUnit() - 0.5f) * boostedSpeed * ERRATIC_INITIAL_JITTER);
    }
    m_owner->setVelocity(velocity);
}

void Missile::onUpdate(float deltaTime) {
    if (!m_owner) return;

    updateMovement(deltaTime);

    m_trail.push_back(m_owner->getCenter());

    if (hasReachedTarget() || isOffScreen() || m_owner->getAge() > MAX_LIFETIME) {
        m_owner->destroy();
    }
}

void Missile::updateMovement(float deltaTime) {
    const MissileStats& stats = getStats();

    switch (m_movement) {
        case MovementPattern::Direct:
            break;
        case MovementPattern::Seeking:
            seekTowardTarget(deltaTime);
            break;
        case MovementPattern::Erratic:
            updateErratic(deltaTime);
            break;
        case MovementPattern::Slow:
            updateSlow();
            break;
    }

    Vector2D velocity = m_owner->getVelocity();
    if (stats.acceleration != 1.0f) {
        velocity *= 1.0f + (stats.acceleration - 1.0f) * deltaTime;
    }

    if (stats.wobble > 0.0f) {
        const float wobbleStrength = stats.wobble * m_speed * SPEED_BOOST;
        velocity += Vector2D((randomUnit() - 0.5f) * wobbleStrength * deltaTime,
                             (randomUnit() - 0.5f) * wobbleStrength * deltaTime);
    }
    m_owner->setVelocity(velocity);
}

void Missile::seekTowardTarget(float deltaTime) {
    Vector2D toTarget = m_targetPoint - m_owner->getPosition();
    if (toTarget.isZero()) return;

    const float blend = getStats().seekingStrength * deltaTime;
    Vector2D desired = toTarget.normalized() * (m_speed * SPEED_BOOST);
    m_owner->setVelocity(m_owner->getVelocity().lerp(desired, blend));
}

void Missile::updateErratic(float deltaTime) {
    const float angle = randomUnit() * TWO_PI;
    const float magnitude = m_speed * SPEED_BOOST * ERRATIC_CHANGE_STRENGTH * deltaTime;
    m_owner->setVelocity(m_owner->getVelocity() + Vector2D::fromAngle(angle, magnitude));

    if (randomUnit() < ERRATIC_SEEK_CHANCE) {
        seekTowardTarget(deltaTime);
    }
}

void Missile::updateSlow() {
    if (randomUnit() >= SLOW_CORRECTION_CHANCE) return;

    Vector2D toTarget = m_targetPoint - m_owner->getPosition();
    if (toTarget.isZero()) return;

    Vector2D correction = toTarget.normalized() * (m_speed * SPEED_BOOST * SLOW_CORRECTION_STRENGTH);
    m_owner->setVelocity(m_owner->getVelocity() + correction);
}

bool Missile::hasReachedTarget() const {
    if (!m_owner) return false;
    return Vector2D::distance(m_targetPoint, m_owner->getCenter()) < TARGET_REACHED_DISTANCE;
}

bool Missile::isOffScreen() const {
    if (!m_owner) return false;
    const float x = m_owner->getX();
    const float y = m_owner->getY();
    return x < -OFFSCREEN_MARGIN || x > m_playfieldWidth + OFFSCREEN_MARGIN ||
           y < -OFFSCREEN_MARGIN || y > m_playfieldHeight + OFFSCREEN_MARGIN;
}

void Missile::onCollision(Entity& other) {
    if (other.getLayer() != EntityLayer::Defences || !m_owner) return;

    // Projectiles deliver their hit through takeDamage from their own side
    if (other.as<DefenseProjectile>()) return;

    MISSILE_DEBUG(std::string(getDisplayName()) + " intercepted by entity " +
                  std::to_string(other.getID()));
    m_owner->destroy();
}

bool Missile::takeDamage() {
    if (!m_owner || m_owner->isMarkedForDestruction()) return false;

    m_hitPoints = std::max(0, m_hitPoints - 1);
    if (m_hitPoints == 0) {
        MISSILE_DEBUG(std::string(getDisplayName()) + " destroyed");
        m_owner->destroy();
        return true;
    }
    return false;
}

void Missile::applyDifficulty(float multiplier) {
    m_speed *= multiplier;
    m_damage = static_cast<int>(std::floor(static_cast<float>(m_damage) * multiplier));
    if (m_owner) {
        m_owner->setVelocity(m_owner->getVelocity() * multiplier);
    }
}

void Missile::makeBoss() {
    if (m_isBoss) return;

    m_isBoss = true;
    m_damage *= 2;
    m_hitPoints = 2;
    m_color = BOSS_COLOR;
    if (m_owner) {
        m_owner->setScale(BOSS_SCALE);
        m_owner->setColor(BOSS_COLOR);
    }
    MISSILE_INFO("Boss " + std::string(getDisplayName()) + " spawned");
}

void Missile::setPlayfieldSize(float width, float height) {
    m_playfieldWidth = width;
    m_playfieldHeight = height;
}

void Missile::renderBody(CloudDefenders::DrawContext& ctx) const {
    const auto& bounds = m_owner->getBounds();
    const CloudDefenders::Color outline(0, 0, 0);

    // Pointed body: base along the bottom edge, tip at the top center
    const Vector2D baseLeft(bounds.left, bounds.bottom);
    const Vector2D baseRight(bounds.right, bounds.bottom);
    const Vector2D tip(bounds.centerX, bounds.top);

    ctx.fillRect(bounds.left + bounds.width() * 0.25f, bounds.top + bounds.height() * 0.25f,
                 bounds.width() * 0.5f, bounds.height() * 0.75f, m_color);
    ctx.drawLine(baseLeft.getX(), baseLeft.getY(), baseRight.getX(), baseRight.getY(), outline);
    ctx.drawLine(baseRight.getX(), baseRight.getY(), tip.getX(), tip.getY(), outline);
    ctx.drawLine(tip.getX(), tip.getY(), baseLeft.getX(), baseLeft.getY(), outline);
}

void Missile::onRender(CloudDefenders::DrawContext& ctx) const {
    if (m_trail.size() >= 2) {
        for (size_t i = 1; i < m_trail.size(); ++i) {
            const float alpha = static_cast<float>(i) / static_cast<float>(m_trail.size());
            ctx.drawLine(m_trail[i - 1].getX(), m_trail[i - 1].getY(),
                         m_trail[i].getX(), m_trail[i].getY(),
                         m_color.withAlpha(alpha * 0.6f), alpha * 3.0f);
        }
    }

    const Vector2D center = m_owner->getCenter();
    ctx.drawText(getStats().icon, center.getX(), center.getY(), CloudDefenders::Color(255, 255, 255));

    renderTypeEffect(ctx);
}

void Missile::renderTypeEffect(CloudDefenders::DrawContext& ctx) const {
    const Vector2D center = m_owner->getCenter();
    const float age = m_owner->getAge();
    const float width = m_owner->getWidth();

    switch (m_type) {
        case MissileType::CostSpike: {
            const float pulse = std::sin(age * 8.0f) * 0.3f + 0.7f;
            ctx.fillCircle(center.getX(), center.getY(), width * 0.8f, m_color.withAlpha(pulse * 0.3f));
            break;
        }
        case MissileType::DataBreach: {
            const CloudDefenders::Color spark = CloudDefenders::Color(255, 255, 255).withAlpha(0.8f);
            for (int i = 0; i < 3; ++i) {
                const float angle = std::fmod(age * 10.0f + static_cast<float>(i) * TWO_PI / 3.0f, TWO_PI);
                const float length = 8.0f + std::sin(age * 15.0f + static_cast<float>(i)) * 4.0f;
                ctx.drawLine(center.getX(), center.getY(),
                             center.getX() + std::cos(angle) * length,
                             center.getY() + std::sin(angle) * length, spark);
            }
            break;
        }
        case MissileType::LatencyGhost: {
            const Vector2D velocity = m_owner->getVelocity();
            for (int i = 1; i <= 2; ++i) {
                const float offset = 0.016f * static_cast<float>(i) * 0.1f;
                ctx.fillRect(m_owner->getX() - velocity.getX() * offset,
                             m_owner->getY() - velocity.getY() * offset,
                             width, m_owner->getHeight(),
                             m_color.withAlpha(0.3f - static_cast<float>(i) * 0.1f));
            }
            break;
        }
        case MissileType::PolicyViolator: {
            const CloudDefenders::Color stripe(255, 255, 0);
            for (int i = -1; i <= 1; ++i) {
                const float y = center.getY() + static_cast<float>(i) * 4.0f;
                ctx.drawLine(center.getX() - width * 0.5f, y, center.getX() + width * 0.5f, y, stripe);
            }
            break;
        }
        case MissileType::Unknown:
            break;
    }
}
