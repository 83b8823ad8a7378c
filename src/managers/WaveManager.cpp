/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/WaveManager.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "entities/Target.hpp"
#include "managers/EntityManager.hpp"
#include <algorithm>
#include <string>

namespace CloudDefenders {

const char* toString(WaveState state) {
    switch (state) {
    case WaveState::Idle: return "idle";
    case WaveState::Active: return "active";
    case WaveState::Completed: return "completed";
    case WaveState::Transitioning: return "transitioning";
    case WaveState::AllWavesCompleted: return "all_waves_completed";
    }
    return "unknown";
}

const char* toString(SpecialEvent event) {
    switch (event) {
    case SpecialEvent::BossWave: return "boss_wave";
    case SpecialEvent::SpeedBurst: return "speed_burst";
    case SpecialEvent::MultiSpawn: return "multi_spawn";
    }
    return "unknown";
}

bool WaveConfig::hasEvent(SpecialEvent event) const {
    return std::find(specialEvents.begin(), specialEvents.end(), event) != specialEvents.end();
}

WaveManager::WaveManager(EntityManager& entityManager, std::mt19937& rng,
                         float playfieldWidth, float playfieldHeight,
                         int maxWaves, float timeBetweenWaves)
    : m_entityManager(entityManager),
      m_rng(rng),
      m_playfieldWidth(playfieldWidth),
      m_playfieldHeight(playfieldHeight),
      m_maxWaves(std::max(1, maxWaves)),
      m_timeBetweenWaves(std::max(0.0f, timeBetweenWaves)) {
    generateWaveConfigs();
    WAVE_INFO("WaveManager initialized with " + std::to_string(m_maxWaves) + " waves");
}

int WaveManager::calculateMissileCount(int wave, int variation) {
    const int increment = wave / 2 + 1;
    return std::min(5 + (wave - 1) * increment + variation, MAX_MISSILES_PER_WAVE);
}

float WaveManager::calculateSpawnInterval(int wave) {
    return std::max(1.5f - static_cast<float>(wave - 1) * 0.08f, 0.3f);
}

std::vector<MissileType> WaveManager::getMissileTypesForWave(int wave) {
    std::vector<MissileType> types{MissileType::CostSpike};
    if (wave >= 3) types.push_back(MissileType::DataBreach);
    if (wave >= 6) types.push_back(MissileType::LatencyGhost);
    if (wave >= 10) types.push_back(MissileType::PolicyViolator);
    return types;
}

float WaveManager::calculateDifficultyMultiplier(int wave) {
    return 1.0f + static_cast<float>(wave - 1) * 0.1f;
}

boost::container::small_vector<SpecialEvent, 3> WaveManager::getSpecialEventsForWave(int wave) {
    boost::container::small_vector<SpecialEvent, 3> events;
    if (wave % 5 == 0) events.push_back(SpecialEvent::BossWave);
    if (wave % 3 == 0 && wave > 3) events.push_back(SpecialEvent::SpeedBurst);
    if (wave % 4 == 0 && wave > 4) events.push_back(SpecialEvent::MultiSpawn);
    return events;
}

void WaveManager::generateWaveConfigs() {
    std::uniform_int_distribution<int> variation(0, 2);

    m_waveConfigs.clear();
    m_waveConfigs.reserve(static_cast<size_t>(m_maxWaves));
    for (int wave = 1; wave <= m_maxWaves; ++wave) {
        WaveConfig config;
        config.waveNumber = wave;
        config.missileCount = calculateMissileCount(wave, variation(m_rng));
        config.spawnInterval = calculateSpawnInterval(wave);
        config.missileTypes = getMissileTypesForWave(wave);
        config.difficultyMultiplier = calculateDifficultyMultiplier(wave);
        config.specialEvents = getSpecialEventsForWave(wave);
        m_waveConfigs.push_back(std::move(config));
    }
}

void WaveManager::startWave() {
    startWave(m_currentWave);
}

void WaveManager::startWave(int waveNumber) {
    if (m_state == WaveState::AllWavesCompleted) {
        WAVE_WARN("All waves already completed, ignoring start of wave " + std::to_string(waveNumber));
        return;
    }
    if (waveNumber < 1) {
        WAVE_WARN("Invalid wave number " + std::to_string(waveNumber) + ", starting wave 1");
        waveNumber = 1;
    }

    m_currentWave = waveNumber;
    if (m_currentWave > m_maxWaves) {
        completeAllWaves();
        return;
    }

    const WaveConfig& config = m_waveConfigs[static_cast<size_t>(m_currentWave - 1)];
    m_state = WaveState::Active;
    m_paused = false;
    m_missilesInWave = config.missileCount;
    m_missilesSpawned = 0;
    m_spawnTimer = 0.0f;
    m_spawnInterval = config.spawnInterval;
    m_transitionTimer = 0.0f;

    WAVE_INFO("Starting wave " + std::to_string(m_currentWave) + ": " +
              std::to_string(config.missileCount) + " missiles, " +
              std::to_string(config.spawnInterval) + "s interval");

    m_onWaveStart.notify(m_currentWave, config);
}

void WaveManager::update(float deltaTime) {
    if (m_paused) return;

    switch (m_state) {
    case WaveState::Transitioning:
        updateTransition(deltaTime);
        break;
    case WaveState::Active:
        updateActiveWave(deltaTime);
        break;
    default:
        break;
    }
}

void WaveManager::updateTransition(float deltaTime) {
    m_transitionTimer -= deltaTime;
    if (m_transitionTimer <= 0.0f) {
        m_transitionTimer = 0.0f;
        startWave(m_currentWave + 1);
    }
}

void WaveManager::updateActiveWave(float deltaTime) {
    const WaveConfig& config = m_waveConfigs[static_cast<size_t>(m_currentWave - 1)];

    if (m_missilesSpawned < m_missilesInWave) {
        m_spawnTimer -= deltaTime;
        if (m_spawnTimer <= 0.0f) {
            EntityPtr spawned = spawnMissile(config);
            m_spawnTimer = m_spawnInterval;
            if (spawned) {
                applySpecialEvents(config, spawned);
            }
        }
    }

    if (m_missilesSpawned >= m_missilesInWave &&
        !m_entityManager.hasEntitiesInLayer(EntityLayer::Missiles)) {
        completeWave();
    }
}

EntityPtr WaveManager::pickLiveTarget() {
    std::vector<EntityPtr> live;
    for (const auto& entity : m_entityManager.getEntitiesByLayer(EntityLayer::Targets)) {
        if (entity->isMarkedForDestruction()) continue;
        const Target* target = entity->as<Target>();
        if (target && target->isDestroyed()) continue;
        live.push_back(entity);
    }
    if (live.empty()) return nullptr;

    std::uniform_int_distribution<size_t> pick(0, live.size() - 1);
    return live[pick(m_rng)];
}

EntityPtr WaveManager::spawnMissile(const WaveConfig& config) {
    EntityPtr target = pickLiveTarget();
    if (!target) {
        WAVE_WARN("No targets available for missile spawning");
        return nullptr;
    }

    std::uniform_int_distribution<size_t> typePick(0, config.missileTypes.size() - 1);
    const MissileType type = config.missileTypes[typePick(m_rng)];

    const float maxX = std::max(SPAWN_MARGIN, m_playfieldWidth - SPAWN_MARGIN);
    std::uniform_real_distribution<float> spawnX(SPAWN_MARGIN, maxX);
    const float x = spawnX(m_rng);

    const Vector2D aim = target->getCenter();
    EntityPtr entity = Missile::create(m_entityManager.nextEntityId(), toString(type), x, SPAWN_Y,
                                       aim.getX(), aim.getY(), static_cast<uint32_t>(m_rng()));

    Missile* missile = entity->as<Missile>();
    missile->setPlayfieldSize(m_playfieldWidth, m_playfieldHeight);
    missile->applyDifficulty(config.difficultyMultiplier);

    m_entityManager.addEntity(entity, EntityLayer::Missiles);
    ++m_missilesSpawned;

    WAVE_DEBUG("Spawned " + std::string(toString(type)) + " missile (" +
               std::to_string(m_missilesSpawned) + "/" + std::to_string(m_missilesInWave) + ")");
    return entity;
}

void WaveManager::applySpecialEvents(const WaveConfig& config, const EntityPtr& spawned) {
    for (SpecialEvent event : config.specialEvents) {
        switch (event) {
        case SpecialEvent::BossWave:
            // Each missile gets exactly one roll, when it spawns
            if (randomUnit() < BOSS_CHANCE) {
                spawned->as<Missile>()->makeBoss();
            }
            break;
        case SpecialEvent::SpeedBurst:
            if (randomUnit() < SPEED_BURST_CHANCE) {
                m_spawnTimer = std::min(m_spawnTimer, SPEED_BURST_TIMER);
            }
            break;
        case SpecialEvent::MultiSpawn:
            if (randomUnit() < MULTI_SPAWN_CHANCE && m_missilesSpawned < m_missilesInWave) {
                EntityPtr extra = spawnMissile(config);
                if (extra && config.hasEvent(SpecialEvent::BossWave) && randomUnit() < BOSS_CHANCE) {
                    extra->as<Missile>()->makeBoss();
                }
            }
            break;
        }
    }
}

void WaveManager::completeWave() {
    if (m_state != WaveState::Active) return;

    m_state = WaveState::Completed;
    WAVE_INFO("Wave " + std::to_string(m_currentWave) + " completed");
    m_onWaveComplete.notify(m_currentWave);

    if (m_currentWave >= m_maxWaves) {
        completeAllWaves();
    } else {
        m_state = WaveState::Transitioning;
        m_transitionTimer = m_timeBetweenWaves;
    }
}

void WaveManager::completeAllWaves() {
    m_state = WaveState::AllWavesCompleted;
    if (m_allWavesNotified) return;

    m_allWavesNotified = true;
    WAVE_INFO("All waves completed");
    m_onAllWavesComplete.notify();
}

void WaveManager::skipToWave(int waveNumber) {
    if (waveNumber < 1 || waveNumber > m_maxWaves) {
        WAVE_WARN("Cannot skip to wave " + std::to_string(waveNumber) + ", valid range is 1-" +
                  std::to_string(m_maxWaves));
        return;
    }
    if (m_state == WaveState::AllWavesCompleted) {
        WAVE_WARN("Cannot skip waves after all waves completed");
        return;
    }
    startWave(waveNumber);
}

void WaveManager::pauseWave() {
    m_paused = true;
}

void WaveManager::resumeWave() {
    if (m_state == WaveState::AllWavesCompleted) return;
    m_paused = false;
}

void WaveManager::reset() {
    m_state = WaveState::Idle;
    m_paused = false;
    m_allWavesNotified = false;
    m_currentWave = 1;
    m_missilesInWave = 0;
    m_missilesSpawned = 0;
    m_spawnTimer = 0.0f;
    m_transitionTimer = 0.0f;
    WAVE_DEBUG("WaveManager reset");
}

float WaveManager::getWaveProgress() const {
    if (m_state != WaveState::Active || m_missilesInWave <= 0) return 1.0f;
    return static_cast<float>(m_missilesSpawned) / static_cast<float>(m_missilesInWave);
}

float WaveManager::getTransitionTimeRemaining() const {
    return std::max(0.0f, m_transitionTimer);
}

const WaveConfig* WaveManager::getCurrentWaveConfig() const {
    if (m_currentWave < 1 || m_currentWave > m_maxWaves) return nullptr;
    return &m_waveConfigs[static_cast<size_t>(m_currentWave - 1)];
}

float WaveManager::randomUnit() {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(m_rng);
}

} // namespace CloudDefenders
