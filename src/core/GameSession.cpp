/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "entities/Defense.hpp"
#include "entities/Entity.hpp"
#include "entities/ExplosiveBomb.hpp"
#include "entities/Missile.hpp"
#include "entities/Target.hpp"
#include "utils/DrawContext.hpp"
#include <array>
#include <string>

using CloudDefenders::Color;
using CloudDefenders::DrawContext;

namespace {

struct TargetPlacement {
    const char* type;
    float x;
    float y;
};

constexpr std::array<TargetPlacement, 5> INITIAL_TARGETS = {{
    {"s3", 150.0f, 400.0f},
    {"lambda", 300.0f, 350.0f},
    {"rds", 450.0f, 400.0f},
    {"ec2", 600.0f, 350.0f},
    {"dynamodb", 375.0f, 450.0f},
}};

const Color BACKGROUND_TOP(0, 17, 34);
const Color BACKGROUND_BOTTOM(0, 51, 102);
const Color TITLE_COLOR(74, 144, 226);
const Color TEXT_COLOR(255, 255, 255);
const Color GAME_OVER_COLOR(255, 68, 68);

uint32_t resolveSeed(uint32_t configured) {
    if (configured != 0) {
        return configured;
    }
    std::random_device device;
    return device();
}

} // namespace

const char* toString(SessionState state) {
    switch (state) {
    case SessionState::Menu: return "menu";
    case SessionState::Playing: return "playing";
    case SessionState::Paused: return "paused";
    case SessionState::GameOver: return "game_over";
    }
    return "unknown";
}

GameSession::GameSession(const CloudDefenders::GameSettings& settings)
    : m_settings(settings)
    , m_rng(resolveSeed(settings.randomSeed))
    , m_entityManager(settings.cellSize)
    , m_waveManager(m_entityManager, m_rng, settings.playfieldWidth, settings.playfieldHeight,
                    settings.maxWaves, settings.timeBetweenWaves)
    , m_conditions(m_entityManager, m_waveManager, settings.maxLives)
{
    connectListeners();
    SESSION_INFO("Session created, playfield " + std::to_string(static_cast<int>(settings.playfieldWidth)) +
                 "x" + std::to_string(static_cast<int>(settings.playfieldHeight)));
}

void GameSession::connectListeners() {
    m_waveManager.addWaveCompleteListener([this](int wave) {
        m_conditions.onWaveCompleted(wave);
    });

    m_conditions.addVictoryListener([this](CloudDefenders::VictoryType type, int finalScore) {
        m_state = SessionState::GameOver;
        SESSION_INFO("Victory (" + std::string(CloudDefenders::toString(type)) + "), score " +
                     std::to_string(finalScore));
    });

    m_conditions.addDefeatListener([this](CloudDefenders::DefeatReason reason, int finalScore) {
        m_state = SessionState::GameOver;
        SESSION_INFO("Defeat (" + std::string(CloudDefenders::toString(reason)) + "), score " +
                     std::to_string(finalScore));
    });
}

void GameSession::setModalPresenter(CloudDefenders::ModalPresenter* presenter) {
    m_conditions.setModalPresenter(presenter);
}

bool GameSession::startGame() {
    if (m_state == SessionState::Paused) {
        resumeGame();
        return true;
    }
    if (m_state != SessionState::Menu) {
        SESSION_WARN("Cannot start a game from state " + std::string(toString(m_state)));
        return false;
    }

    m_state = SessionState::Playing;
    m_missilesIntercepted = 0;
    m_targetHits = 0;

    addInitialTargets();
    m_conditions.startGame();
    m_waveManager.startWave();

    SESSION_INFO("Game started");
    return true;
}

void GameSession::pauseGame() {
    if (m_state != SessionState::Playing) return;
    m_state = SessionState::Paused;
    SESSION_INFO("Game paused");
}

void GameSession::resumeGame() {
    if (m_state != SessionState::Paused) return;
    m_state = SessionState::Playing;
    SESSION_INFO("Game resumed");
}

void GameSession::restartGame() {
    m_entityManager.clear();
    m_waveManager.reset();
    m_conditions.reset();
    m_missilesIntercepted = 0;
    m_targetHits = 0;
    m_state = SessionState::Menu;
    SESSION_INFO("Game restarted");
}

void GameSession::addInitialTargets() {
    for (const auto& placement : INITIAL_TARGETS) {
        m_entityManager.addEntity(Target::create(
            m_entityManager.nextEntityId(), placement.type, placement.x, placement.y));
    }
}

void GameSession::update(float deltaTime) {
    if (m_state != SessionState::Playing) return;

    m_entityManager.update(deltaTime);
    m_waveManager.update(deltaTime);
    m_conditions.update(deltaTime);
    if (m_state != SessionState::Playing) return;

    updateDefenses();
    updateBombs();
    processCollisions(m_entityManager.checkCollisions());
}

void GameSession::updateDefenses() {
    const auto& missiles = m_entityManager.getEntitiesByLayer(EntityLayer::Missiles);

    // Projectiles fired below land in the pending queue, not in this list
    for (const auto& entity : m_entityManager.getEntitiesByLayer(EntityLayer::Defences)) {
        Defense* defense = entity->as<Defense>();
        if (!defense || entity->isMarkedForDestruction() || !defense->isActive()) continue;

        const auto selected = defense->selectTarget(defense->findTargetsInRange(missiles));
        if (!selected.empty()) {
            defense->fire(selected.front(), m_entityManager);
        }
    }
}

void GameSession::updateBombs() {
    const auto& missiles = m_entityManager.getEntitiesByLayer(EntityLayer::Missiles);

    for (const auto& entity : m_entityManager.getEntitiesByLayer(EntityLayer::Countermeasures)) {
        const ExplosiveBomb* bomb = entity->as<ExplosiveBomb>();
        if (!bomb || !bomb->isExploding()) continue;

        for (const auto& missile : bomb->getMissilesInRadius(missiles)) {
            if (missile->isMarkedForDestruction()) continue;
            missile->destroy();
            interceptMissile(*missile);
        }
    }
}

void GameSession::processCollisions(const std::vector<CloudDefenders::EntityManager::CollisionPair>& collisions) {
    for (const auto& [first, second] : collisions) {
        Entity* missile = nullptr;
        Entity* other = nullptr;
        if (first->getLayer() == EntityLayer::Missiles) {
            missile = first.get();
            other = second.get();
        } else if (second->getLayer() == EntityLayer::Missiles) {
            missile = second.get();
            other = first.get();
        }
        if (!missile || other->getLayer() == EntityLayer::Missiles) continue;

        if (other->getLayer() == EntityLayer::Targets) {
            ++m_targetHits;
            m_conditions.onTargetHit(*other, *missile);
        } else if (other->getLayer() == EntityLayer::Defences && missile->isMarkedForDestruction()) {
            interceptMissile(*missile);
        }
    }
}

void GameSession::interceptMissile(Entity& missile) {
    ++m_missilesIntercepted;
    m_conditions.onMissileIntercepted(missile);
}

EntityPtr GameSession::deployDefense(std::string_view type, float x, float y) {
    if (m_state != SessionState::Playing) {
        SESSION_WARN("Defences can only be deployed while playing");
        return nullptr;
    }
    if (x < 0.0f || y < 0.0f || x > m_settings.playfieldWidth || y > m_settings.playfieldHeight) {
        SESSION_WARN("Deployment point outside the playfield");
        return nullptr;
    }

    const DefenseStats& stats = getDefenseStats(defenseTypeFromString(type));
    EntityPtr defense = Defense::create(m_entityManager.nextEntityId(), type,
                                        x - stats.width * 0.5f, y - stats.height * 0.5f);
    m_entityManager.addEntity(defense);
    SESSION_DEBUG(std::string(stats.name) + " deployed");
    return defense;
}

size_t GameSession::getActiveBombCount() const {
    return m_entityManager.countEntitiesInLayer(EntityLayer::Countermeasures);
}

EntityPtr GameSession::launchBomb(float x, float y) {
    if (m_state != SessionState::Playing) {
        SESSION_WARN("Countermeasures can only be launched while playing");
        return nullptr;
    }
    if (getActiveBombCount() >= MAX_ACTIVE_BOMBS) {
        SESSION_DEBUG("All countermeasures in use");
        return nullptr;
    }

    const float startX = m_settings.playfieldWidth * 0.5f - ExplosiveBomb::SIZE * 0.5f;
    const float startY = m_settings.playfieldHeight - ExplosiveBomb::SIZE;
    EntityPtr bomb = ExplosiveBomb::create(m_entityManager.nextEntityId(), startX, startY, x, y);
    m_entityManager.addEntity(bomb);
    return bomb;
}

void GameSession::render(DrawContext& ctx) const {
    renderBackground(ctx);

    switch (m_state) {
    case SessionState::Menu:
        renderCentered(ctx, "CLOUD DEFENDERS", "Press SPACE to start");
        break;
    case SessionState::Playing:
        m_entityManager.render(ctx);
        renderHud(ctx);
        break;
    case SessionState::Paused:
        m_entityManager.render(ctx);
        renderHud(ctx);
        ctx.fillRect(0.0f, 0.0f, m_settings.playfieldWidth, m_settings.playfieldHeight,
                     Color(0, 0, 0).withAlpha(0.7f));
        renderCentered(ctx, "PAUSED", "Press SPACE to resume");
        break;
    case SessionState::GameOver: {
        const bool won = m_conditions.isGameWon();
        const std::string score = "Final Score: " + std::to_string(m_conditions.getCurrentScore());
        ctx.drawText(won ? "VICTORY" : "GAME OVER", m_settings.playfieldWidth * 0.5f,
                     m_settings.playfieldHeight * 0.5f - 50.0f, won ? TITLE_COLOR : GAME_OVER_COLOR);
        ctx.drawText(score, m_settings.playfieldWidth * 0.5f, m_settings.playfieldHeight * 0.5f + 20.0f,
                     TEXT_COLOR);
        ctx.drawText("Press R to restart", m_settings.playfieldWidth * 0.5f,
                     m_settings.playfieldHeight * 0.5f + 50.0f, TEXT_COLOR);
        break;
    }
    }
}

void GameSession::renderBackground(DrawContext& ctx) const {
    // Two-band stand-in for the vertical gradient
    const float half = m_settings.playfieldHeight * 0.5f;
    ctx.fillRect(0.0f, 0.0f, m_settings.playfieldWidth, half, BACKGROUND_TOP);
    ctx.fillRect(0.0f, half, m_settings.playfieldWidth, m_settings.playfieldHeight - half, BACKGROUND_BOTTOM);
}

void GameSession::renderHud(DrawContext& ctx) const {
    using CloudDefenders::TextAlign;
    const float bottom = m_settings.playfieldHeight;

    ctx.drawText("Entities: " + std::to_string(m_entityManager.getEntityCount()), 10.0f, bottom - 80.0f,
                 TEXT_COLOR, TextAlign::Left);
    ctx.drawText("Wave " + std::to_string(getCurrentWave()) + " - Score: " + std::to_string(getCurrentScore()),
                 10.0f, bottom - 60.0f, TEXT_COLOR, TextAlign::Left);
    ctx.drawText("Lives: " + std::to_string(getCurrentLives()) + "/" + std::to_string(m_conditions.getMaxLives()),
                 10.0f, bottom - 40.0f, TEXT_COLOR, TextAlign::Left);
    ctx.drawText("Countermeasures: " + std::to_string(getActiveBombCount()) + "/" +
                     std::to_string(MAX_ACTIVE_BOMBS),
                 10.0f, bottom - 20.0f, TEXT_COLOR, TextAlign::Left);

    if (m_waveManager.isInTransition()) {
        const int seconds = static_cast<int>(m_waveManager.getTransitionTimeRemaining() + 0.999f);
        ctx.drawText("Next wave in " + std::to_string(seconds), m_settings.playfieldWidth * 0.5f, 40.0f,
                     TITLE_COLOR);
    }
}

void GameSession::renderCentered(DrawContext& ctx, const char* title, const char* subtitle) const {
    const float cx = m_settings.playfieldWidth * 0.5f;
    const float cy = m_settings.playfieldHeight * 0.5f;
    ctx.drawText(title, cx, cy - 50.0f, TITLE_COLOR);
    ctx.drawText(subtitle, cx, cy, TEXT_COLOR);
}
