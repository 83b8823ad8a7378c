/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Defense.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "managers/EntityManager.hpp"
#include <algorithm>
#include <array>
#include <string>

namespace {
// name, icon, color, w, h, range, damage, cooldown, projectile speed, charge time, targeting, cost
constexpr std::array<DefenseStats, 9> DEFENSE_TABLE = {{
    {"Firewall", "SHIELD", "#FF6B35", 32.0f, 32.0f, 80.0f, 30, 1.0f, 300.0f, 0.2f, TargetingMode::Nearest, 50},
    {"Antivirus", "SCAN", "#4CAF50", 28.0f, 28.0f, 60.0f, 40, 1.5f, 250.0f, 0.3f, TargetingMode::Strongest, 60},
    {"Web App Firewall", "WEB", "#2196F3", 36.0f, 30.0f, 70.0f, 25, 0.8f, 350.0f, 0.15f, TargetingMode::Fastest, 45},
    {"DDoS Protection", "BOLT", "#9C27B0", 40.0f, 35.0f, 100.0f, 20, 2.0f, 200.0f, 0.5f, TargetingMode::Multiple, 80},
    {"Encryption", "LOCK", "#FFC107", 30.0f, 30.0f, 50.0f, 35, 1.2f, 280.0f, 0.25f, TargetingMode::Nearest, 55},
    {"Monitoring", "EYE", "#607D8B", 34.0f, 32.0f, 120.0f, 15, 0.5f, 400.0f, 0.1f, TargetingMode::All, 40},
    {"Backup System", "BAK", "#795548", 38.0f, 34.0f, 40.0f, 50, 3.0f, 150.0f, 0.8f, TargetingMode::Strongest, 70},
    {"Shield Node", "O", "#00BCD4", 24.0f, 24.0f, 60.0f, 20, 0.6f, 320.0f, 0.2f, TargetingMode::Nearest, 30},
    {"Unknown Defense", "?", "#888888", 32.0f, 32.0f, 80.0f, 30, 1.0f, 300.0f, 0.2f, TargetingMode::Nearest, 50},
}};

constexpr std::array<const char*, 9> DEFENSE_KEYS = {
    "firewall", "antivirus", "waf", "ddos-protection", "encryption",
    "monitoring", "backup", "shield-node", "unknown"
};

constexpr float FALLBACK_THREAT_DAMAGE = 25.0f;
constexpr float SPEED_THREAT_FACTOR = 0.1f;
}

const DefenseStats& getDefenseStats(DefenseType type) {
    auto index = static_cast<size_t>(type);
    return index < DEFENSE_TABLE.size() ? DEFENSE_TABLE[index]
                                        : DEFENSE_TABLE[static_cast<size_t>(DefenseType::Unknown)];
}

DefenseType defenseTypeFromString(std::string_view name) {
    for (size_t i = 0; i < static_cast<size_t>(DefenseType::Unknown); ++i) {
        if (name == DEFENSE_KEYS[i]) {
            return static_cast<DefenseType>(i);
        }
    }
    DEFENSE_INFO("Unknown defense type '" + std::string(name) + "', using default stats");
    return DefenseType::Unknown;
}

const char* toString(DefenseType type) {
    auto index = static_cast<size_t>(type);
    return index < DEFENSE_KEYS.size() ? DEFENSE_KEYS[index] : "unknown";
}

Defense::Defense(DefenseType type)
    : m_type(type),
      m_shieldEnergy(type == DefenseType::ShieldNode ? MAX_SHIELD_ENERGY : 0.0f) {}

EntityPtr Defense::create(EntityID id, std::string_view type, float x, float y) {
    DefenseType defenseType = defenseTypeFromString(type);
    const DefenseStats& stats = getDefenseStats(defenseType);

    auto entity = std::make_shared<Entity>(id, x, y, stats.width, stats.height, Defense(defenseType));
    entity->setLayer(EntityLayer::Defences);
    entity->setColor(CloudDefenders::Color::fromHex(stats.color));
    return entity;
}

void Defense::onUpdate(float deltaTime) {
    if (m_currentCooldown > 0.0f) {
        m_currentCooldown = std::max(0.0f, m_currentCooldown - deltaTime);
    }

    if (m_charging) {
        m_chargeTime = std::min(m_chargeTime + deltaTime, getMaxChargeTime());
    }

    if (isShieldNode() && m_shieldEnergy < MAX_SHIELD_ENERGY) {
        m_shieldEnergy = std::min(MAX_SHIELD_ENERGY,
                                  m_shieldEnergy + SHIELD_REGEN_PER_SECOND * deltaTime);
    }

    if (m_firingEffectTimer > 0.0f) {
        m_firingEffectTimer = std::max(0.0f, m_firingEffectTimer - deltaTime);
    }
}

void Defense::onDestroy() {
    m_charging = false;
    m_currentTarget.reset();
}

float Defense::calculateThreatLevel(const Entity& missile) const {
    const Missile* behavior = missile.as<Missile>();
    float threat = behavior ? static_cast<float>(behavior->getDamage()) : FALLBACK_THREAT_DAMAGE;
    threat += missile.getSpeed() * SPEED_THREAT_FACTOR;
    if (behavior) {
        threat *= behavior->getThreatWeight();
    }
    return threat;
}

std::vector<TargetCandidate> Defense::findTargetsInRange(const std::vector<EntityPtr>& entities) const {
    std::vector<TargetCandidate> candidates;
    if (!m_owner) return candidates;

    const float range = getRange();
    for (const auto& entity : entities) {
        if (!entity || entity->getLayer() != EntityLayer::Missiles || !entity->isActive()) {
            continue;
        }
        const float distance = m_owner->distanceTo(*entity);
        if (distance <= range) {
            candidates.push_back({entity, distance, calculateThreatLevel(*entity)});
        }
    }
    return candidates;
}

std::vector<EntityPtr> Defense::selectTarget(const std::vector<TargetCandidate>& candidates) const {
    std::vector<EntityPtr> selection;
    if (candidates.empty()) return selection;

    switch (getTargetingMode()) {
        case TargetingMode::Nearest: {
            // min_element keeps the first of equal elements
            auto best = std::min_element(candidates.begin(), candidates.end(),
                [](const TargetCandidate& a, const TargetCandidate& b) {
                    return a.distance < b.distance;
                });
            selection.push_back(best->entity);
            break;
        }
        case TargetingMode::Strongest: {
            auto best = candidates.begin();
            for (auto it = candidates.begin() + 1; it != candidates.end(); ++it) {
                if (it->threat > best->threat) best = it;
            }
            selection.push_back(best->entity);
            break;
        }
        case TargetingMode::Fastest: {
            auto best = candidates.begin();
            for (auto it = candidates.begin() + 1; it != candidates.end(); ++it) {
                if (it->entity->getSpeed() > best->entity->getSpeed()) best = it;
            }
            selection.push_back(best->entity);
            break;
        }
        case TargetingMode::Multiple: {
            std::vector<TargetCandidate> sorted = candidates;
            std::stable_sort(sorted.begin(), sorted.end(),
                [](const TargetCandidate& a, const TargetCandidate& b) {
                    return a.distance < b.distance;
                });
            const size_t count = std::min(sorted.size(), MULTIPLE_TARGET_COUNT);
            for (size_t i = 0; i < count; ++i) {
                selection.push_back(sorted[i].entity);
            }
            break;
        }
        case TargetingMode::All:
            for (const auto& candidate : candidates) {
                selection.push_back(candidate.entity);
            }
            break;
    }
    return selection;
}

bool Defense::canFire() const {
    return m_active && m_deployed && m_currentCooldown <= 0.0f &&
           (!isShieldNode() || m_shieldEnergy > SHIELD_SHOT_COST);
}

bool Defense::canStartCharging() const {
    return canFire() && !m_charging;
}

bool Defense::startCharging() {
    if (!canStartCharging()) return false;
    m_charging = true;
    m_chargeTime = 0.0f;
    return true;
}

EntityPtr Defense::fire(const EntityPtr& target, CloudDefenders::EntityManager& manager) {
    if (!target || !m_owner) return nullptr;

    if (!m_charging) {
        startCharging();
        return nullptr;
    }

    if (m_chargeTime < getMaxChargeTime() || !canFire()) {
        return nullptr;
    }

    const Vector2D origin = m_owner->getCenter();
    const Vector2D aim = target->getCenter();
    EntityPtr projectile = DefenseProjectile::create(manager.nextEntityId(),
                                                     origin.getX(), origin.getY(),
                                                     aim.getX(), aim.getY(),
                                                     getDamage(), getStats().projectileSpeed,
                                                     m_owner->shared_this());
    manager.addEntity(projectile, EntityLayer::Defences);

    m_charging = false;
    m_chargeTime = 0.0f;
    m_currentCooldown = getCooldownTime();
    m_firingEffectTimer = FIRING_EFFECT_DURATION;
    m_currentTarget = target;

    if (isShieldNode()) {
        m_shieldEnergy = std::max(0.0f, m_shieldEnergy - SHIELD_SHOT_COST);
    }

    ++m_shotsFired;
    DEFENSE_DEBUG(std::string(getDisplayName()) + " fired at entity " + std::to_string(target->getID()));
    return projectile;
}

void Defense::activate() {
    m_active = true;
}

void Defense::deactivate() {
    m_active = false;
    m_charging = false;
    m_currentTarget.reset();
}

void Defense::recordHit(bool destroyedTarget) {
    ++m_hits;
    if (destroyedTarget) {
        ++m_threatsDestroyed;
    }
}

float Defense::getEfficiency() const {
    return m_shotsFired > 0 ? static_cast<float>(m_hits) / static_cast<float>(m_shotsFired) : 0.0f;
}

DefenseCombatStats Defense::getCombatStats() const {
    return DefenseCombatStats{m_shotsFired, m_hits, m_threatsDestroyed, getEfficiency()};
}

CloudDefenders::Color Defense::currentBodyColor() const {
    const CloudDefenders::Color base = CloudDefenders::Color::fromHex(getStats().color);
    if (!m_active) return CloudDefenders::Color(102, 102, 102);
    if (m_currentCooldown > 0.0f) return base.withAlpha(0.6f);
    if (m_charging) return CloudDefenders::Color(255, 255, 255);
    return base;
}

void Defense::renderBody(CloudDefenders::DrawContext& ctx) const {
    const auto& bounds = m_owner->getBounds();
    const CloudDefenders::Color border(0, 0, 0);

    if (isShieldNode()) {
        const float radius = bounds.width() * 0.5f;
        ctx.fillCircle(bounds.centerX, bounds.centerY, radius, currentBodyColor());
        ctx.strokeCircle(bounds.centerX, bounds.centerY, radius, border, 2.0f);
    } else {
        ctx.fillRect(bounds.left, bounds.top, bounds.width(), bounds.height(), currentBodyColor());
        ctx.strokeRect(bounds.left, bounds.top, bounds.width(), bounds.height(), border, 2.0f);
    }
}

void Defense::onRender(CloudDefenders::DrawContext& ctx) const {
    const auto& bounds = m_owner->getBounds();
    const CloudDefenders::Color base = CloudDefenders::Color::fromHex(getStats().color);

    if (m_rangeIndicatorVisible) {
        ctx.strokeCircle(bounds.centerX, bounds.centerY, getRange(), base.withAlpha(0.3f));
    }

    ctx.drawText(getStats().icon, bounds.centerX, bounds.centerY, CloudDefenders::Color(255, 255, 255));

    if (m_charging && getMaxChargeTime() > 0.0f) {
        const float progress = m_chargeTime / getMaxChargeTime();
        ctx.strokeCircle(bounds.centerX, bounds.centerY,
                         bounds.width() * 0.5f + 4.0f * progress,
                         CloudDefenders::Color(255, 255, 0).withAlpha(progress), 2.0f);
    }

    if (m_firingEffectTimer > 0.0f) {
        const float alpha = m_firingEffectTimer / FIRING_EFFECT_DURATION;
        ctx.fillCircle(bounds.centerX, bounds.centerY, bounds.width() * 0.75f,
                       CloudDefenders::Color(255, 255, 255).withAlpha(alpha * 0.5f));
    }

    if (isShieldNode()) {
        const float fraction = m_shieldEnergy / MAX_SHIELD_ENERGY;
        ctx.fillRect(bounds.left, bounds.bottom + 2.0f, bounds.width(), 3.0f,
                     CloudDefenders::Color(51, 51, 51));
        ctx.fillRect(bounds.left, bounds.bottom + 2.0f, bounds.width() * fraction, 3.0f,
                     CloudDefenders::Color(0, 188, 212));
    }
}
