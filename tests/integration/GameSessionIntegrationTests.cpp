/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE GameSessionIntegrationTests
#include <boost/test/unit_test.hpp>

#include "core/GameSession.hpp"
#include "entities/Defense.hpp"
#include "entities/Entity.hpp"
#include "entities/ExplosiveBomb.hpp"
#include "entities/Missile.hpp"
#include "entities/Target.hpp"
#include "mocks/MockDrawContext.hpp"
#include "mocks/MockModalPresenter.hpp"

using CloudDefenders::GameSettings;

namespace {

constexpr float FRAME = 1.0f / 60.0f;

GameSettings makeSettings(int maxWaves = 1) {
    GameSettings settings;
    settings.randomSeed = 42;
    settings.maxWaves = maxWaves;
    settings.timeBetweenWaves = 0.5f;
    return settings;
}

} // namespace

struct GameSessionFixture {
    GameSession session{makeSettings()};
    MockModalPresenter presenter;

    GameSessionFixture() {
        session.setModalPresenter(&presenter);
    }

    // Start and run two frames so the services and the first missile are live
    void startAndSettle() {
        session.startGame();
        session.update(FRAME);
        session.update(FRAME);
    }

    const std::vector<EntityPtr>& layer(EntityLayer which) {
        return session.getEntityManager().getEntitiesByLayer(which);
    }

    // Parked missile aimed far away, so only the overlap decides what happens
    EntityPtr parkMissile(float x, float y) {
        auto& manager = session.getEntityManager();
        EntityPtr missile = Missile::create(manager.nextEntityId(), "cost-spike", x, y, x, y + 5000.0f, 3);
        missile->setVelocity(0.0f, 0.0f);
        manager.addEntity(missile);
        return missile;
    }
};

BOOST_FIXTURE_TEST_SUITE(SessionLifecycleTests, GameSessionFixture)

BOOST_AUTO_TEST_CASE(TestStartFromMenu) {
    BOOST_CHECK(session.getState() == SessionState::Menu);
    BOOST_CHECK(session.startGame());
    BOOST_CHECK(session.isPlaying());
    BOOST_CHECK(session.getWaveManager().isWaveActive());
    BOOST_CHECK(session.getGameConditions().isGameActive());

    // Already playing
    BOOST_CHECK(!session.startGame());
}

BOOST_AUTO_TEST_CASE(TestInitialServicesPlaced) {
    startAndSettle();

    const auto& targets = layer(EntityLayer::Targets);
    BOOST_REQUIRE_EQUAL(targets.size(), 5u);
    BOOST_CHECK(targets[0]->as<Target>()->getType() == TargetType::S3);
    BOOST_CHECK_EQUAL(targets[0]->getX(), 150.0f);
    BOOST_CHECK_EQUAL(targets[0]->getY(), 400.0f);
    BOOST_CHECK(targets[4]->as<Target>()->getType() == TargetType::DynamoDB);

    BOOST_CHECK_EQUAL(layer(EntityLayer::Missiles).size(), 1u);
    BOOST_CHECK_EQUAL(session.getWaveManager().getMissilesSpawned(), 1);
}

BOOST_AUTO_TEST_CASE(TestPauseFreezesSimulation) {
    startAndSettle();
    const EntityPtr missile = layer(EntityLayer::Missiles).front();
    const float y = missile->getY();

    session.pauseGame();
    BOOST_CHECK(session.getState() == SessionState::Paused);
    for (int i = 0; i < 120; ++i) {
        session.update(FRAME);
    }

    BOOST_CHECK_EQUAL(missile->getY(), y);
    BOOST_CHECK_EQUAL(session.getWaveManager().getMissilesSpawned(), 1);

    // Start doubles as resume while paused
    BOOST_CHECK(session.startGame());
    BOOST_CHECK(session.isPlaying());
    session.update(FRAME);
    BOOST_CHECK_GT(missile->getY(), y);
}

BOOST_AUTO_TEST_CASE(TestRestartReturnsToMenu) {
    startAndSettle();
    session.getGameConditions().addScore(300);

    session.restartGame();

    BOOST_CHECK(session.getState() == SessionState::Menu);
    BOOST_CHECK_EQUAL(session.getEntityManager().getEntityCount(), 0u);
    BOOST_CHECK_EQUAL(session.getCurrentScore(), 0);
    BOOST_CHECK_EQUAL(session.getCurrentWave(), 1);

    BOOST_CHECK(session.startGame());
    session.update(FRAME);
    BOOST_CHECK_EQUAL(layer(EntityLayer::Targets).size(), 5u);
}

BOOST_AUTO_TEST_CASE(TestSameSeedReplaysSpawns) {
    GameSession other(makeSettings());
    other.startGame();
    other.update(FRAME);
    other.update(FRAME);
    startAndSettle();

    const auto& ours = layer(EntityLayer::Missiles);
    const auto& theirs = other.getEntityManager().getEntitiesByLayer(EntityLayer::Missiles);
    BOOST_REQUIRE_EQUAL(ours.size(), 1u);
    BOOST_REQUIRE_EQUAL(theirs.size(), 1u);
    BOOST_CHECK_EQUAL(ours[0]->getX(), theirs[0]->getX());
    BOOST_CHECK_EQUAL(session.getWaveManager().getWaveConfigs()[0].missileCount,
                      other.getWaveManager().getWaveConfigs()[0].missileCount);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SessionCombatTests, GameSessionFixture)

BOOST_AUTO_TEST_CASE(TestMissileOnTargetCostsLife) {
    startAndSettle();
    const EntityPtr s3 = layer(EntityLayer::Targets).front();
    const EntityPtr missile = parkMissile(s3->getX(), s3->getY());

    session.update(FRAME);

    BOOST_CHECK(missile->isMarkedForDestruction());
    BOOST_CHECK_EQUAL(session.getTargetHits(), 1);
    BOOST_CHECK_EQUAL(session.getCurrentLives(), 2);
    BOOST_CHECK_EQUAL(s3->as<Target>()->getCurrentHealth(), 100 - 35);
    BOOST_CHECK(session.isPlaying());
}

BOOST_AUTO_TEST_CASE(TestLivesExhaustedEndsRun) {
    startAndSettle();
    const EntityPtr rds = layer(EntityLayer::Targets)[2];

    for (int hit = 0; hit < 3; ++hit) {
        parkMissile(rds->getX(), rds->getY());
        session.update(FRAME);
    }

    BOOST_CHECK_EQUAL(session.getCurrentLives(), 0);
    BOOST_CHECK(session.getState() == SessionState::GameOver);
    BOOST_CHECK(session.getGameConditions().isGameOver());
    BOOST_CHECK_EQUAL(presenter.showCount, 1);
    BOOST_CHECK_EQUAL(presenter.lastTitle, "Game Over");

    // Frozen once over
    const int score = session.getCurrentScore();
    session.update(1.0f);
    BOOST_CHECK_EQUAL(session.getCurrentScore(), score);
    BOOST_CHECK(!session.startGame());
}

BOOST_AUTO_TEST_CASE(TestDefenceBodyInterceptsMissile) {
    startAndSettle();
    const EntityPtr defense = session.deployDefense("firewall", 700.0f, 150.0f);
    BOOST_REQUIRE(defense);
    session.update(FRAME);

    const EntityPtr missile = parkMissile(defense->getX(), defense->getY());
    session.update(FRAME);

    BOOST_CHECK(missile->isMarkedForDestruction());
    BOOST_CHECK_EQUAL(session.getMissilesIntercepted(), 1);
    BOOST_CHECK_GE(session.getCurrentScore(), 100);
    BOOST_CHECK_EQUAL(session.getCurrentLives(), 3);
}

BOOST_AUTO_TEST_CASE(TestDefenceShootsDownMissile) {
    startAndSettle();
    session.deployDefense("firewall", 700.0f, 150.0f);
    session.update(FRAME);

    // Inside the 80px range but not touching the defence
    const EntityPtr missile = parkMissile(740.0f, 100.0f);

    for (int i = 0; i < 120 && !missile->isMarkedForDestruction(); ++i) {
        missile->setVelocity(0.0f, 0.0f);
        session.update(FRAME);
    }

    BOOST_CHECK(missile->isMarkedForDestruction());
    BOOST_CHECK_EQUAL(session.getMissilesIntercepted(), 1);
}

BOOST_AUTO_TEST_CASE(TestBombBlastInterceptsMissile) {
    startAndSettle();
    const float startX = 400.0f - ExplosiveBomb::SIZE * 0.5f;
    const float startY = 600.0f - ExplosiveBomb::SIZE;

    // Missile centered on the launch point
    const EntityPtr missile = parkMissile(390.0f, 582.0f);
    session.update(FRAME);
    BOOST_REQUIRE(!missile->isMarkedForDestruction());

    // Aimed at its own launch point, so it detonates on the next update
    const EntityPtr bomb = session.launchBomb(startX, startY);
    BOOST_REQUIRE(bomb);
    session.update(FRAME);

    BOOST_CHECK(bomb->as<ExplosiveBomb>()->isExploding());
    BOOST_CHECK(missile->isMarkedForDestruction());
    BOOST_CHECK_EQUAL(session.getMissilesIntercepted(), 1);
    BOOST_CHECK_GE(session.getCurrentScore(), 100);
}

BOOST_AUTO_TEST_CASE(TestBombCap) {
    startAndSettle();

    for (size_t i = 0; i < GameSession::MAX_ACTIVE_BOMBS; ++i) {
        BOOST_CHECK(session.launchBomb(100.0f + 100.0f * static_cast<float>(i), 100.0f));
    }
    BOOST_CHECK(!session.launchBomb(400.0f, 100.0f));
    BOOST_CHECK_EQUAL(session.getActiveBombCount(), GameSession::MAX_ACTIVE_BOMBS);

    // Launch point sits at the bottom center of the playfield
    session.update(FRAME);
    const auto& bombs = layer(EntityLayer::Countermeasures);
    BOOST_REQUIRE_EQUAL(bombs.size(), GameSession::MAX_ACTIVE_BOMBS);
    BOOST_CHECK_LT(bombs[0]->getY(), 600.0f - ExplosiveBomb::SIZE);
}

BOOST_AUTO_TEST_CASE(TestDeployValidation) {
    BOOST_CHECK(!session.deployDefense("firewall", 100.0f, 100.0f));
    BOOST_CHECK(!session.launchBomb(100.0f, 100.0f));

    startAndSettle();
    BOOST_CHECK(!session.deployDefense("firewall", -1.0f, 100.0f));
    BOOST_CHECK(!session.deployDefense("firewall", 100.0f, 601.0f));

    const EntityPtr defense = session.deployDefense("firewall", 400.0f, 300.0f);
    BOOST_REQUIRE(defense);
    BOOST_CHECK_EQUAL(defense->getX(), 384.0f);
    BOOST_CHECK_EQUAL(defense->getY(), 284.0f);
    BOOST_CHECK(defense->getLayer() == EntityLayer::Defences);
    BOOST_CHECK(defense->as<Defense>()->getType() == DefenseType::Firewall);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SessionOutcomeTests, GameSessionFixture)

BOOST_AUTO_TEST_CASE(TestPerfectVictory) {
    session.startGame();

    for (int i = 0; i < 400 && session.isPlaying(); ++i) {
        session.update(0.1f);
        for (const auto& missile : layer(EntityLayer::Missiles)) {
            missile->destroy();
        }
    }

    BOOST_CHECK(session.getState() == SessionState::GameOver);
    BOOST_CHECK(session.getGameConditions().isGameWon());
    BOOST_CHECK(session.getGameConditions().getVictoryType() == CloudDefenders::VictoryType::Perfect);
    BOOST_CHECK_EQUAL(session.getTargetHits(), 0);
    BOOST_CHECK_GE(session.getCurrentScore(), 750);
    BOOST_CHECK_EQUAL(presenter.showCount, 1);
    BOOST_CHECK_EQUAL(presenter.lastTitle, "Victory!");
    BOOST_CHECK_EQUAL(presenter.lastScore, session.getCurrentScore());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SessionRenderTests, GameSessionFixture)

BOOST_AUTO_TEST_CASE(TestMenuScreen) {
    MockDrawContext ctx;
    session.render(ctx);

    BOOST_CHECK(ctx.hasText("CLOUD DEFENDERS"));
    BOOST_CHECK(ctx.hasText("Press SPACE to start"));
    BOOST_CHECK(!ctx.hasText("Lives"));
}

BOOST_AUTO_TEST_CASE(TestPlayingHud) {
    startAndSettle();
    session.launchBomb(400.0f, 100.0f);
    MockDrawContext ctx;

    session.render(ctx);

    BOOST_CHECK(ctx.hasText("Wave 1 - Score: "));
    BOOST_CHECK(ctx.hasText("Lives: 3/3"));
    BOOST_CHECK(ctx.hasText("Countermeasures: 1/4"));
    BOOST_CHECK(ctx.hasText("S3"));
}

BOOST_AUTO_TEST_CASE(TestPausedOverlay) {
    startAndSettle();
    session.pauseGame();
    MockDrawContext ctx;

    session.render(ctx);

    BOOST_CHECK(ctx.hasText("PAUSED"));
    BOOST_CHECK(ctx.hasText("Press SPACE to resume"));
    BOOST_CHECK(ctx.hasText("Lives: 3/3"));
}

BOOST_AUTO_TEST_CASE(TestGameOverScreen) {
    startAndSettle();
    session.getGameConditions().setLives(0);
    session.update(FRAME);
    BOOST_REQUIRE(session.getState() == SessionState::GameOver);
    MockDrawContext ctx;

    session.render(ctx);

    BOOST_CHECK(ctx.hasText("GAME OVER"));
    BOOST_CHECK(ctx.hasText("Final Score: " + std::to_string(session.getCurrentScore())));
    BOOST_CHECK(ctx.hasText("Press R to restart"));
}

BOOST_AUTO_TEST_CASE(TestTransitionCountdown) {
    GameSession twoWaves(makeSettings(2));
    twoWaves.startGame();
    for (int i = 0; i < 400 && !twoWaves.getWaveManager().isInTransition(); ++i) {
        twoWaves.update(0.1f);
        for (const auto& missile : twoWaves.getEntityManager().getEntitiesByLayer(EntityLayer::Missiles)) {
            missile->destroy();
        }
    }
    BOOST_REQUIRE(twoWaves.getWaveManager().isInTransition());
    MockDrawContext ctx;

    twoWaves.render(ctx);

    BOOST_CHECK(ctx.hasText("Next wave in 1"));
}

BOOST_AUTO_TEST_SUITE_END()
