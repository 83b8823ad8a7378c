/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

#include <cstdint>
#include <memory>
#include <random>
#include <string_view>
#include <vector>

#include "core/GameSettings.hpp"
#include "entities/EntityTypes.hpp"
#include "managers/EntityManager.hpp"
#include "managers/GameConditions.hpp"
#include "managers/WaveManager.hpp"

namespace CloudDefenders {
class DrawContext;
class ModalPresenter;
}

enum class SessionState : uint8_t {
    Menu,
    Playing,
    Paused,
    GameOver
};

const char* toString(SessionState state);

/**
 * GameSession owns one playthrough: the entity store, the wave driver, the
 * score/lives state machine and the random engine feeding all of them.
 *
 * Per update, while Playing:
 *   entities -> waves -> conditions -> defences -> bombs -> collisions
 * Collision outcomes are forwarded to GameConditions: a missile reaching a
 * target costs a life, a missile killed by the defences layer or a bomb
 * blast scores an interception.
 */
class GameSession {
public:
    static constexpr size_t MAX_ACTIVE_BOMBS = 4;

    explicit GameSession(const CloudDefenders::GameSettings& settings = CloudDefenders::GameSettings{});

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    // Not owned; forwarded to GameConditions
    void setModalPresenter(CloudDefenders::ModalPresenter* presenter);

    /**
     * Begin a run from the menu: places the initial services, starts the
     * conditions and the first wave. From Paused this resumes instead.
     * @return false if the session was already playing or is over
     */
    bool startGame();
    void pauseGame();
    void resumeGame();

    // Clears the run and returns to the menu
    void restartGame();

    void update(float deltaTime);
    void render(CloudDefenders::DrawContext& ctx) const;

    /**
     * Place a defence centered on (x, y). Only while Playing and inside the
     * playfield.
     * @return the new defence entity, or nullptr if refused (logged)
     */
    EntityPtr deployDefense(std::string_view type, float x, float y);

    /**
     * Launch a countermeasure from the bottom center toward (x, y). At most
     * MAX_ACTIVE_BOMBS may be in flight or exploding at once.
     */
    EntityPtr launchBomb(float x, float y);

    // Wave commands
    void skipToWave(int waveNumber) { m_waveManager.skipToWave(waveNumber); }
    void pauseWave() { m_waveManager.pauseWave(); }
    void resumeWave() { m_waveManager.resumeWave(); }

    SessionState getState() const { return m_state; }
    bool isPlaying() const { return m_state == SessionState::Playing; }

    int getCurrentScore() const { return m_conditions.getCurrentScore(); }
    int getCurrentLives() const { return m_conditions.getCurrentLives(); }
    int getCurrentWave() const { return m_waveManager.getCurrentWave(); }
    size_t getActiveBombCount() const;
    int getMissilesIntercepted() const { return m_missilesIntercepted; }
    int getTargetHits() const { return m_targetHits; }

    const CloudDefenders::GameSettings& getSettings() const { return m_settings; }
    CloudDefenders::EntityManager& getEntityManager() { return m_entityManager; }
    const CloudDefenders::EntityManager& getEntityManager() const { return m_entityManager; }
    CloudDefenders::WaveManager& getWaveManager() { return m_waveManager; }
    const CloudDefenders::WaveManager& getWaveManager() const { return m_waveManager; }
    CloudDefenders::GameConditions& getGameConditions() { return m_conditions; }
    const CloudDefenders::GameConditions& getGameConditions() const { return m_conditions; }

private:
    void connectListeners();
    void addInitialTargets();
    void updateDefenses();
    void updateBombs();
    void processCollisions(const std::vector<CloudDefenders::EntityManager::CollisionPair>& collisions);
    void interceptMissile(Entity& missile);

    void renderBackground(CloudDefenders::DrawContext& ctx) const;
    void renderHud(CloudDefenders::DrawContext& ctx) const;
    void renderCentered(CloudDefenders::DrawContext& ctx, const char* title, const char* subtitle) const;

    CloudDefenders::GameSettings m_settings;
    std::mt19937 m_rng;
    CloudDefenders::EntityManager m_entityManager;
    CloudDefenders::WaveManager m_waveManager;
    CloudDefenders::GameConditions m_conditions;

    SessionState m_state{SessionState::Menu};
    int m_missilesIntercepted{0};
    int m_targetHits{0};
};

#endif // GAME_SESSION_HPP
