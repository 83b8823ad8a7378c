/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/GameConditions.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "entities/Missile.hpp"
#include "entities/Target.hpp"
#include "managers/EntityManager.hpp"
#include "managers/WaveManager.hpp"
#include "ui/ModalPresenter.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace CloudDefenders {

namespace {
constexpr int FALLBACK_INTERCEPT_POINTS = 100;
}

const char* toString(ConditionsState state) {
    switch (state) {
    case ConditionsState::Idle: return "idle";
    case ConditionsState::Active: return "active";
    case ConditionsState::Won: return "won";
    case ConditionsState::Lost: return "lost";
    }
    return "unknown";
}

const char* toString(VictoryType type) {
    return type == VictoryType::Perfect ? "perfect" : "pyrrhic";
}

const char* toString(DefeatReason reason) {
    return reason == DefeatReason::TargetsDestroyed ? "targets_destroyed" : "lives_exhausted";
}

GameConditions::GameConditions(const EntityManager& entityManager, const WaveManager& waveManager,
                               int maxLives)
    : m_entityManager(entityManager),
      m_waveManager(waveManager),
      m_maxLives(std::max(1, maxLives)),
      m_lives(std::max(1, maxLives)) {}

void GameConditions::startGame() {
    reset();
    m_state = ConditionsState::Active;
    CONDITIONS_INFO("Game started with " + std::to_string(m_lives) + " lives");
}

void GameConditions::reset() {
    m_state = ConditionsState::Idle;
    m_victoryType = VictoryType::Perfect;
    m_defeatReason = DefeatReason::LivesExhausted;
    m_lives = m_maxLives;
    m_score = 0;
    m_scoreRemainder = 0.0f;
    m_scoreMultiplier = 1.0f;
}

void GameConditions::update(float deltaTime) {
    if (m_state != ConditionsState::Active) return;

    accrueSurvivalScore(deltaTime);
    checkVictoryConditions();
    if (m_state == ConditionsState::Active) {
        checkDefeatConditions();
    }
}

void GameConditions::accrueSurvivalScore(float deltaTime) {
    if (deltaTime <= 0.0f) return;

    m_scoreRemainder += SURVIVAL_POINTS_PER_SECOND * deltaTime * m_scoreMultiplier;
    const float whole = std::floor(m_scoreRemainder);
    if (whole >= 1.0f) {
        m_scoreRemainder -= whole;
        changeScore(m_score + static_cast<int>(whole));
    }
}

std::pair<size_t, size_t> GameConditions::countTargets() const {
    size_t total = 0;
    size_t intact = 0;
    for (const auto& entity : m_entityManager.getEntitiesByLayer(EntityLayer::Targets)) {
        const Target* target = entity->as<Target>();
        if (!target) continue;
        ++total;
        if (!target->isDestroyed()) ++intact;
    }
    return {total, intact};
}

void GameConditions::checkVictoryConditions() {
    if (!m_waveManager.areAllWavesCompleted()) return;

    const auto [total, intact] = countTargets();
    triggerVictory(total > 0 && intact == total ? VictoryType::Perfect : VictoryType::Pyrrhic);
}

void GameConditions::checkDefeatConditions() {
    if (m_lives <= 0) {
        triggerDefeat(DefeatReason::LivesExhausted);
        return;
    }

    const auto [total, intact] = countTargets();
    if (total > 0 && intact == 0) {
        triggerDefeat(DefeatReason::TargetsDestroyed);
    }
}

void GameConditions::triggerVictory(VictoryType type) {
    if (m_state != ConditionsState::Active) return;

    m_state = ConditionsState::Won;
    m_victoryType = type;

    const float bonus = type == VictoryType::Perfect ? PERFECT_BONUS : PYRRHIC_BONUS;
    m_score += static_cast<int>(std::floor(static_cast<float>(m_score) * bonus));

    CONDITIONS_INFO("Victory (" + std::string(toString(type)) + "), final score " + std::to_string(m_score));

    if (m_modalPresenter) {
        std::string message = type == VictoryType::Perfect
            ? "Perfect Victory! All infrastructure defended successfully!"
            : "Victory achieved, but at great cost. Infrastructure was compromised.";
        message += "\nFinal Score: " + std::to_string(m_score);
        message += "\nWaves Completed: " + std::to_string(m_waveManager.getMaxWaves()) + "/" +
                   std::to_string(m_waveManager.getMaxWaves());
        message += "\nLives Remaining: " + std::to_string(m_lives);
        m_modalPresenter->showModal("Victory!", message, m_score);
    }

    m_onVictory.notify(type, m_score);
}

void GameConditions::triggerDefeat(DefeatReason reason) {
    if (m_state != ConditionsState::Active) return;

    m_state = ConditionsState::Lost;
    m_defeatReason = reason;

    CONDITIONS_INFO("Defeat (" + std::string(toString(reason)) + "), final score " + std::to_string(m_score));

    if (m_modalPresenter) {
        std::string message = reason == DefeatReason::TargetsDestroyed
            ? "Game Over! All cloud infrastructure has been compromised."
            : "Game Over! No more chances remaining.";
        message += "\nFinal Score: " + std::to_string(m_score);
        message += "\nWaves Survived: " + std::to_string(m_waveManager.getCurrentWave() - 1) + "/" +
                   std::to_string(m_waveManager.getMaxWaves());
        message += "\nLives Used: " + std::to_string(m_maxLives - m_lives);
        m_modalPresenter->showModal("Game Over", message, m_score);
    }

    m_onDefeat.notify(reason, m_score);
}

void GameConditions::onMissileIntercepted(const Entity& missile) {
    if (m_state != ConditionsState::Active) return;

    const Missile* behavior = missile.as<Missile>();
    const int basePoints = behavior ? behavior->getInterceptPoints() : FALLBACK_INTERCEPT_POINTS;
    const int points = static_cast<int>(std::floor(static_cast<float>(basePoints) * m_scoreMultiplier));

    CONDITIONS_DEBUG("Missile intercepted: +" + std::to_string(points) + " points");
    changeScore(m_score + points);
}

void GameConditions::onWaveCompleted(int waveNumber) {
    if (m_state != ConditionsState::Active) return;

    const int bonus = static_cast<int>(
        std::floor(static_cast<float>(waveNumber * WAVE_BONUS_POINTS) * m_scoreMultiplier));
    m_scoreMultiplier += MULTIPLIER_STEP;

    CONDITIONS_INFO("Wave " + std::to_string(waveNumber) + " completed: +" + std::to_string(bonus) + " points");
    changeScore(m_score + bonus);
}

void GameConditions::onTargetHit(const Entity& target, const Entity& missile) {
    if (m_state != ConditionsState::Active) return;

    m_lives = std::max(0, m_lives - 1);

    const Target* hit = target.as<Target>();
    CONDITIONS_INFO(std::string(hit ? hit->getDisplayName() : "Target") + " hit by entity " +
                    std::to_string(missile.getID()) + ", lives remaining " + std::to_string(m_lives));

    m_onLivesChanged.notify(m_lives);

    if (m_lives <= 0) {
        triggerDefeat(DefeatReason::LivesExhausted);
    }
}

void GameConditions::setScore(int score) {
    changeScore(std::max(0, score));
}

void GameConditions::addScore(int points) {
    changeScore(m_score + std::max(0, points));
}

void GameConditions::setLives(int lives) {
    m_lives = std::clamp(lives, 0, m_maxLives);
    m_onLivesChanged.notify(m_lives);
}

void GameConditions::changeScore(int score) {
    if (score == m_score) return;
    m_score = score;
    m_onScoreChanged.notify(m_score);
}

GameResult GameConditions::getFinalResult() const {
    return GameResult{m_score, m_waveManager.getCurrentWave(), m_lives};
}

} // namespace CloudDefenders
