/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WAVE_MANAGER_HPP
#define WAVE_MANAGER_HPP

#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <functional>
#include <random>
#include <vector>

#include "entities/EntityTypes.hpp"
#include "entities/Missile.hpp"
#include "utils/CallbackList.hpp"

namespace CloudDefenders {

class EntityManager;

enum class WaveState : uint8_t {
    Idle,
    Active,
    Completed,
    Transitioning,
    AllWavesCompleted
};

enum class SpecialEvent : uint8_t {
    BossWave,
    SpeedBurst,
    MultiSpawn
};

const char* toString(WaveState state);
const char* toString(SpecialEvent event);

struct WaveConfig {
    int waveNumber{1};
    int missileCount{0};
    float spawnInterval{1.5f};
    std::vector<MissileType> missileTypes;
    float difficultyMultiplier{1.0f};
    boost::container::small_vector<SpecialEvent, 3> specialEvents;

    bool hasEvent(SpecialEvent event) const;
};

/**
 * @brief Drives wave progression: per-wave tuning, missile spawning and the
 * transition between waves.
 *
 * Idle -> Active -> Completed -> Transitioning -> Active ... -> AllWavesCompleted
 *
 * The tuning of every wave is generated once, at construction, from the
 * injected random engine. The same engine feeds spawn positions, type picks
 * and special event rolls, so a seeded engine replays the same session.
 */
class WaveManager {
public:
    static constexpr int DEFAULT_MAX_WAVES = 15;
    static constexpr float DEFAULT_TIME_BETWEEN_WAVES = 3.0f;
    static constexpr int MAX_MISSILES_PER_WAVE = 50;
    static constexpr float SPAWN_MARGIN = 25.0f;
    static constexpr float SPAWN_Y = -30.0f;

    static constexpr float BOSS_CHANCE = 0.3f;
    static constexpr float SPEED_BURST_CHANCE = 0.1f;
    static constexpr float SPEED_BURST_TIMER = 0.2f;
    static constexpr float MULTI_SPAWN_CHANCE = 0.05f;

    using WaveStartCallback = std::function<void(int wave, const WaveConfig& config)>;
    using WaveCompleteCallback = std::function<void(int wave)>;
    using AllWavesCompleteCallback = std::function<void()>;

    WaveManager(EntityManager& entityManager, std::mt19937& rng,
                float playfieldWidth, float playfieldHeight,
                int maxWaves = DEFAULT_MAX_WAVES,
                float timeBetweenWaves = DEFAULT_TIME_BETWEEN_WAVES);

    WaveManager(const WaveManager&) = delete;
    WaveManager& operator=(const WaveManager&) = delete;

    // Wave tuning curves
    static int calculateMissileCount(int wave, int variation);
    static float calculateSpawnInterval(int wave);
    static std::vector<MissileType> getMissileTypesForWave(int wave);
    static float calculateDifficultyMultiplier(int wave);
    static boost::container::small_vector<SpecialEvent, 3> getSpecialEventsForWave(int wave);

    /**
     * @brief Start the current wave (or wave @p waveNumber).
     *
     * Resets the spawn counters and clears the pause flag. The first missile
     * spawns on the next update. Starting past the last wave completes the run.
     */
    void startWave();
    void startWave(int waveNumber);

    void update(float deltaTime);

    void skipToWave(int waveNumber);
    void pauseWave();
    void resumeWave();

    // Back to wave 1, Idle; the generated wave tuning is kept
    void reset();

    size_t addWaveStartListener(WaveStartCallback callback) { return m_onWaveStart.add(std::move(callback)); }
    size_t addWaveCompleteListener(WaveCompleteCallback callback) { return m_onWaveComplete.add(std::move(callback)); }
    size_t addAllWavesCompleteListener(AllWavesCompleteCallback callback) {
        return m_onAllWavesComplete.add(std::move(callback));
    }
    bool removeWaveStartListener(size_t id) { return m_onWaveStart.remove(id); }
    bool removeWaveCompleteListener(size_t id) { return m_onWaveComplete.remove(id); }
    bool removeAllWavesCompleteListener(size_t id) { return m_onAllWavesComplete.remove(id); }

    int getCurrentWave() const { return m_currentWave; }
    int getMaxWaves() const { return m_maxWaves; }
    WaveState getState() const { return m_state; }
    bool isPaused() const { return m_paused; }
    bool isWaveActive() const { return m_state == WaveState::Active && !m_paused; }
    bool isInTransition() const { return m_state == WaveState::Transitioning; }
    bool areAllWavesCompleted() const { return m_state == WaveState::AllWavesCompleted; }

    // Fraction of the current wave's missiles already spawned; 1 outside an active wave
    float getWaveProgress() const;
    float getTransitionTimeRemaining() const;

    // nullptr when the current wave number is out of range
    const WaveConfig* getCurrentWaveConfig() const;
    const std::vector<WaveConfig>& getWaveConfigs() const { return m_waveConfigs; }

    int getMissilesSpawned() const { return m_missilesSpawned; }
    int getMissilesInWave() const { return m_missilesInWave; }
    float getSpawnTimer() const { return m_spawnTimer; }

private:
    void generateWaveConfigs();
    void updateTransition(float deltaTime);
    void updateActiveWave(float deltaTime);
    EntityPtr spawnMissile(const WaveConfig& config);
    void applySpecialEvents(const WaveConfig& config, const EntityPtr& spawned);
    EntityPtr pickLiveTarget();
    void completeWave();
    void completeAllWaves();
    float randomUnit();

    EntityManager& m_entityManager;
    std::mt19937& m_rng;
    float m_playfieldWidth;
    float m_playfieldHeight;
    int m_maxWaves;
    float m_timeBetweenWaves;

    std::vector<WaveConfig> m_waveConfigs;

    WaveState m_state{WaveState::Idle};
    bool m_paused{false};
    bool m_allWavesNotified{false};
    int m_currentWave{1};
    int m_missilesInWave{0};
    int m_missilesSpawned{0};
    float m_spawnTimer{0.0f};
    float m_spawnInterval{1.5f};
    float m_transitionTimer{0.0f};

    CallbackList<int, const WaveConfig&> m_onWaveStart;
    CallbackList<int> m_onWaveComplete;
    CallbackList<> m_onAllWavesComplete;
};

} // namespace CloudDefenders

#endif // WAVE_MANAGER_HPP
