/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE GameConditionsTests
#include <boost/test/unit_test.hpp>

#include "entities/Entity.hpp"
#include "entities/Missile.hpp"
#include "entities/Target.hpp"
#include "managers/EntityManager.hpp"
#include "managers/GameConditions.hpp"
#include "managers/WaveManager.hpp"
#include "mocks/MockModalPresenter.hpp"
#include <random>
#include <vector>

using namespace CloudDefenders;

struct GameConditionsFixture {
    EntityManager manager;
    std::mt19937 rng{7};
    WaveManager waves{manager, rng, 800.0f, 600.0f, 2, 1.0f};
    GameConditions conditions{manager, waves, 3};
    MockModalPresenter presenter;

    EntityPtr firstTarget;
    EntityPtr secondTarget;

    GameConditionsFixture() {
        firstTarget = Target::create(manager.nextEntityId(), "s3", 100.0f, 400.0f);
        secondTarget = Target::create(manager.nextEntityId(), "lambda", 300.0f, 400.0f);
        manager.addEntity(firstTarget);
        manager.addEntity(secondTarget);
        manager.update(0.0f);

        conditions.setModalPresenter(&presenter);
        conditions.startGame();
    }

    EntityPtr makeMissile(std::string_view type = "cost-spike") {
        return Missile::create(manager.nextEntityId(), type, 0.0f, 0.0f, 100.0f, 400.0f, 1);
    }

    // Runs every configured wave out; the run then has nothing left to spawn
    void finishAllWaves() {
        waves.startWave(waves.getMaxWaves() + 1);
    }
};

BOOST_FIXTURE_TEST_SUITE(GameConditionsScoreTests, GameConditionsFixture)

BOOST_AUTO_TEST_CASE(TestStartState) {
    BOOST_CHECK(conditions.isGameActive());
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 0);
    BOOST_CHECK_EQUAL(conditions.getCurrentLives(), 3);
    BOOST_CHECK_EQUAL(conditions.getScoreMultiplier(), 1.0f);
}

BOOST_AUTO_TEST_CASE(TestSurvivalScoreCarriesFractions) {
    conditions.update(0.05f);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 0);

    conditions.update(0.05f);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 1);

    conditions.update(1.0f);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 11);
}

BOOST_AUTO_TEST_CASE(TestInterceptUsesMissilePoints) {
    auto dataBreach = makeMissile("data-breach");
    conditions.onMissileIntercepted(*dataBreach);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 150);

    auto plain = std::make_shared<Entity>(manager.nextEntityId(), 0.0f, 0.0f);
    conditions.onMissileIntercepted(*plain);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 250);
}

BOOST_AUTO_TEST_CASE(TestWaveBonusRaisesMultiplier) {
    conditions.onWaveCompleted(1);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 500);
    BOOST_CHECK_CLOSE(conditions.getScoreMultiplier(), 1.1f, 0.001f);

    conditions.onWaveCompleted(2);
    // floor(2 * 500 * 1.1)
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 500 + 1100);

    auto missile = makeMissile();
    conditions.onMissileIntercepted(*missile);
    // floor(100 * 1.2)
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 1600 + 120);
}

BOOST_AUTO_TEST_CASE(TestScoreListenerFiresOnChangeOnly) {
    std::vector<int> scores;
    conditions.addScoreChangedListener([&](int score) { scores.push_back(score); });

    conditions.setScore(40);
    conditions.setScore(40);
    conditions.addScore(-10);
    conditions.setScore(-5);

    BOOST_REQUIRE_EQUAL(scores.size(), 2u);
    BOOST_CHECK_EQUAL(scores[0], 40);
    BOOST_CHECK_EQUAL(scores[1], 0);
}

BOOST_AUTO_TEST_CASE(TestEventsIgnoredWhenInactive) {
    conditions.reset();
    auto missile = makeMissile();

    conditions.onMissileIntercepted(*missile);
    conditions.onWaveCompleted(1);
    conditions.onTargetHit(*firstTarget, *missile);
    conditions.update(10.0f);

    BOOST_CHECK(conditions.getState() == ConditionsState::Idle);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 0);
    BOOST_CHECK_EQUAL(conditions.getCurrentLives(), 3);
}

BOOST_AUTO_TEST_CASE(TestSetLivesClamps) {
    std::vector<int> lives;
    conditions.addLivesChangedListener([&](int value) { lives.push_back(value); });

    conditions.setLives(10);
    conditions.setLives(-1);

    BOOST_REQUIRE_EQUAL(lives.size(), 2u);
    BOOST_CHECK_EQUAL(lives[0], 3);
    BOOST_CHECK_EQUAL(lives[1], 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GameConditionsOutcomeTests, GameConditionsFixture)

BOOST_AUTO_TEST_CASE(TestTargetHitsExhaustLives) {
    int defeats = 0;
    DefeatReason reason = DefeatReason::TargetsDestroyed;
    conditions.addDefeatListener([&](DefeatReason r, int) {
        ++defeats;
        reason = r;
    });
    auto missile = makeMissile();

    conditions.onTargetHit(*firstTarget, *missile);
    conditions.onTargetHit(*firstTarget, *missile);
    BOOST_CHECK_EQUAL(conditions.getCurrentLives(), 1);
    BOOST_CHECK(conditions.isGameActive());

    conditions.onTargetHit(*firstTarget, *missile);
    conditions.onTargetHit(*firstTarget, *missile);

    BOOST_CHECK(conditions.isGameOver());
    BOOST_CHECK_EQUAL(conditions.getCurrentLives(), 0);
    BOOST_CHECK_EQUAL(defeats, 1);
    BOOST_CHECK(reason == DefeatReason::LivesExhausted);
    BOOST_CHECK_EQUAL(presenter.showCount, 1);
    BOOST_CHECK_EQUAL(presenter.lastTitle, "Game Over");
    BOOST_CHECK(presenter.lastMessage.find("No more chances remaining") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestAllTargetsDestroyedIsDefeat) {
    firstTarget->as<Target>()->takeDamage(1000);
    conditions.update(0.0f);
    BOOST_CHECK(conditions.isGameActive());

    secondTarget->as<Target>()->takeDamage(1000);
    conditions.update(0.0f);

    BOOST_CHECK(conditions.isGameOver());
    BOOST_CHECK(conditions.getDefeatReason() == DefeatReason::TargetsDestroyed);
    BOOST_CHECK(presenter.lastMessage.find("compromised") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestPerfectVictoryBonus) {
    int victories = 0;
    int reportedScore = 0;
    conditions.addVictoryListener([&](VictoryType, int score) {
        ++victories;
        reportedScore = score;
    });
    conditions.setScore(1000);

    finishAllWaves();
    conditions.update(0.0f);
    conditions.update(0.0f);

    BOOST_CHECK(conditions.isGameWon());
    BOOST_CHECK(conditions.getVictoryType() == VictoryType::Perfect);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 1500);
    BOOST_CHECK_EQUAL(reportedScore, 1500);
    BOOST_CHECK_EQUAL(victories, 1);
    BOOST_CHECK_EQUAL(presenter.showCount, 1);
    BOOST_CHECK_EQUAL(presenter.lastTitle, "Victory!");
    BOOST_CHECK_EQUAL(presenter.lastScore, 1500);
}

BOOST_AUTO_TEST_CASE(TestPyrrhicVictoryWithDamagedInfrastructure) {
    firstTarget->as<Target>()->takeDamage(1000);
    conditions.setScore(1000);

    finishAllWaves();
    conditions.update(0.0f);

    BOOST_CHECK(conditions.isGameWon());
    BOOST_CHECK(conditions.getVictoryType() == VictoryType::Pyrrhic);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 1100);
}

BOOST_AUTO_TEST_CASE(TestVictoryCheckedBeforeDefeat) {
    firstTarget->as<Target>()->takeDamage(1000);
    secondTarget->as<Target>()->takeDamage(1000);

    finishAllWaves();
    conditions.update(0.0f);

    BOOST_CHECK(conditions.isGameWon());
    BOOST_CHECK(conditions.getVictoryType() == VictoryType::Pyrrhic);
}

BOOST_AUTO_TEST_CASE(TestNoModalWhenDetached) {
    conditions.setModalPresenter(nullptr);
    finishAllWaves();
    conditions.update(0.0f);

    BOOST_CHECK(conditions.isGameWon());
    BOOST_CHECK_EQUAL(presenter.showCount, 0);
}

BOOST_AUTO_TEST_CASE(TestFinalResult) {
    conditions.setScore(250);
    auto missile = makeMissile();
    conditions.onTargetHit(*firstTarget, *missile);

    GameResult result = conditions.getFinalResult();

    BOOST_CHECK_EQUAL(result.score, 250);
    BOOST_CHECK_EQUAL(result.wave, 1);
    BOOST_CHECK_EQUAL(result.livesRemaining, 2);
}

BOOST_AUTO_TEST_CASE(TestRestartAfterDefeat) {
    conditions.setLives(0);
    conditions.update(0.0f);
    BOOST_REQUIRE(conditions.isGameOver());

    conditions.startGame();

    BOOST_CHECK(conditions.isGameActive());
    BOOST_CHECK_EQUAL(conditions.getCurrentLives(), 3);
    BOOST_CHECK_EQUAL(conditions.getCurrentScore(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
