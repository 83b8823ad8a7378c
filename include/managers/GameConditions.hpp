/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_CONDITIONS_HPP
#define GAME_CONDITIONS_HPP

#include <cstdint>
#include <functional>
#include <utility>

#include "entities/EntityTypes.hpp"
#include "utils/CallbackList.hpp"

namespace CloudDefenders {

class EntityManager;
class WaveManager;
class ModalPresenter;

enum class ConditionsState : uint8_t {
    Idle,
    Active,
    Won,
    Lost
};

enum class VictoryType : uint8_t {
    Perfect,  // every target intact
    Pyrrhic
};

enum class DefeatReason : uint8_t {
    TargetsDestroyed,
    LivesExhausted
};

const char* toString(ConditionsState state);
const char* toString(VictoryType type);
const char* toString(DefeatReason reason);

// Handed to the score submission collaborator once the run is over
struct GameResult {
    int score{0};
    int wave{1};
    int livesRemaining{0};
};

/**
 * @brief Score, lives and the win/lose state machine of a run.
 *
 * Idle -> Active -> Won | Lost. Each terminal transition happens once per
 * run; listeners receive the reason tag and the final score, and the
 * attached ModalPresenter (if any) is asked to show the end dialog.
 */
class GameConditions {
public:
    static constexpr int DEFAULT_MAX_LIVES = 3;
    static constexpr float SURVIVAL_POINTS_PER_SECOND = 10.0f;
    static constexpr int WAVE_BONUS_POINTS = 500;
    static constexpr float MULTIPLIER_STEP = 0.1f;
    static constexpr float PERFECT_BONUS = 0.5f;
    static constexpr float PYRRHIC_BONUS = 0.1f;

    using VictoryCallback = std::function<void(VictoryType type, int finalScore)>;
    using DefeatCallback = std::function<void(DefeatReason reason, int finalScore)>;
    using ScoreCallback = std::function<void(int score)>;
    using LivesCallback = std::function<void(int lives)>;

    GameConditions(const EntityManager& entityManager, const WaveManager& waveManager,
                   int maxLives = DEFAULT_MAX_LIVES);

    GameConditions(const GameConditions&) = delete;
    GameConditions& operator=(const GameConditions&) = delete;

    // Not owned; pass nullptr to detach
    void setModalPresenter(ModalPresenter* presenter) { m_modalPresenter = presenter; }

    void startGame();
    void reset();

    void update(float deltaTime);

    // Game event hooks; ignored unless the run is active
    void onMissileIntercepted(const Entity& missile);
    void onWaveCompleted(int waveNumber);
    void onTargetHit(const Entity& target, const Entity& missile);

    void setScore(int score);
    void addScore(int points);
    void setLives(int lives);

    size_t addVictoryListener(VictoryCallback callback) { return m_onVictory.add(std::move(callback)); }
    size_t addDefeatListener(DefeatCallback callback) { return m_onDefeat.add(std::move(callback)); }
    size_t addScoreChangedListener(ScoreCallback callback) { return m_onScoreChanged.add(std::move(callback)); }
    size_t addLivesChangedListener(LivesCallback callback) { return m_onLivesChanged.add(std::move(callback)); }
    bool removeVictoryListener(size_t id) { return m_onVictory.remove(id); }
    bool removeDefeatListener(size_t id) { return m_onDefeat.remove(id); }
    bool removeScoreChangedListener(size_t id) { return m_onScoreChanged.remove(id); }
    bool removeLivesChangedListener(size_t id) { return m_onLivesChanged.remove(id); }

    ConditionsState getState() const { return m_state; }
    bool isGameActive() const { return m_state == ConditionsState::Active; }
    bool isGameWon() const { return m_state == ConditionsState::Won; }
    bool isGameOver() const { return m_state == ConditionsState::Lost; }

    int getCurrentScore() const { return m_score; }
    int getCurrentLives() const { return m_lives; }
    int getMaxLives() const { return m_maxLives; }
    float getScoreMultiplier() const { return m_scoreMultiplier; }

    // Set once the run ended in victory or defeat respectively
    VictoryType getVictoryType() const { return m_victoryType; }
    DefeatReason getDefeatReason() const { return m_defeatReason; }

    GameResult getFinalResult() const;

private:
    void accrueSurvivalScore(float deltaTime);
    void checkVictoryConditions();
    void checkDefeatConditions();
    void triggerVictory(VictoryType type);
    void triggerDefeat(DefeatReason reason);

    // {targets in the layer, targets still intact}
    std::pair<size_t, size_t> countTargets() const;

    void changeScore(int score);

    const EntityManager& m_entityManager;
    const WaveManager& m_waveManager;
    ModalPresenter* m_modalPresenter{nullptr};

    ConditionsState m_state{ConditionsState::Idle};
    VictoryType m_victoryType{VictoryType::Perfect};
    DefeatReason m_defeatReason{DefeatReason::LivesExhausted};

    int m_maxLives;
    int m_lives;
    int m_score{0};
    float m_scoreRemainder{0.0f};
    float m_scoreMultiplier{1.0f};

    CallbackList<VictoryType, int> m_onVictory;
    CallbackList<DefeatReason, int> m_onDefeat;
    CallbackList<int> m_onScoreChanged;
    CallbackList<int> m_onLivesChanged;
};

} // namespace CloudDefenders

#endif // GAME_CONDITIONS_HPP
