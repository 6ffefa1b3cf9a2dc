#include <gtest/gtest.h>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/sim_manager.hpp"
#include "reefsim/game/game_session.hpp"

namespace {

Game::GameConfig quietSession() {
    Game::GameConfig config;
    config.starsPerLevel = 0;
    config.oceanObjectCount = 0;
    config.seed = 11u;
    return config;
}

} // namespace

class SimManagerTest : public ::testing::Test {
protected:
    SimManagerTest() : session(quietSession()), manager(session) {}

    double elapsed() const { return session.getParticleSystem().getElapsedTime(); }

    Game::GameSession session;
    SimManager manager;
};

TEST_F(SimManagerTest, FrameAdvancesSession) {
    EXPECT_FALSE(manager.isPaused());
    EXPECT_TRUE(manager.frame(0.02));
    EXPECT_EQ(manager.getFramesAdvanced(), 1u);
    EXPECT_DOUBLE_EQ(elapsed(), 0.02);
}

TEST_F(SimManagerTest, PausedFramesDoNothing) {
    manager.togglePause();
    EXPECT_TRUE(manager.isPaused());

    EXPECT_FALSE(manager.frame(0.02));
    EXPECT_EQ(manager.getFramesAdvanced(), 0u);
    EXPECT_DOUBLE_EQ(elapsed(), 0.0);

    manager.togglePause();
    EXPECT_FALSE(manager.isPaused());
    EXPECT_TRUE(manager.frame(0.02));
}

TEST_F(SimManagerTest, StepAdvancesOneNominalFrame) {
    manager.togglePause();
    manager.stepOnce();

    EXPECT_TRUE(manager.frame(0.5));
    EXPECT_DOUBLE_EQ(elapsed(), SimulatorConstants::DefaultFrameDelta);

    EXPECT_FALSE(manager.frame(0.5));
    EXPECT_EQ(manager.getFramesAdvanced(), 1u);
}

TEST_F(SimManagerTest, StepIgnoredWhileRunning) {
    manager.stepOnce();
    EXPECT_TRUE(manager.frame(0.02));
    EXPECT_DOUBLE_EQ(elapsed(), 0.02);
}

TEST_F(SimManagerTest, InputProviderSteersPlayer) {
    int calls = 0;
    manager.setInputProvider([&calls](const Game::GameSession&) {
        calls++;
        return Vector(0.0, 0.0, 1.0);
    });

    manager.frame(SimulatorConstants::DefaultFrameDelta);

    EXPECT_EQ(calls, 1);
    EXPECT_DOUBLE_EQ(session.getPlayer().getMovementVector().z, 1.0);
}

TEST_F(SimManagerTest, RunStopsAtFrameLimit) {
    manager.setFrameLimit(3);
    manager.run();

    EXPECT_FALSE(manager.isRunning());
    EXPECT_EQ(manager.getFramesAdvanced(), 3u);
}

TEST_F(SimManagerTest, StopClearsRunning) {
    manager.stop();
    EXPECT_FALSE(manager.isRunning());
}
