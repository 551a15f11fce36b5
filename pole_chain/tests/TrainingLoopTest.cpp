#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QThread>
#include <algorithm>
#include <functional>
#include <limits>
#include <vector>
#include "TrainingLoop.h"

namespace {

TrainingConfig loopConfig(bool async)
{
    TrainingConfig config;
    config.seed = 7;
    config.hiddenWidth = 16;
    config.asyncUpdates = async;
    config.tickIntervalMs = 1;
    return config;
}

bool waitUntil(const std::function<bool()>& condition, int timeoutMs = 10000)
{
    QElapsedTimer timer;
    timer.start();
    while (!condition()) {
        if (timer.elapsed() > timeoutMs) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

// Runs a few ticks, then ends the episode through the track limit
void finishEpisode(TrainingLoop& loop, int ticks)
{
    for (int i = 0; i < ticks - 1; ++i) loop.step(20.0);

    PhysicsEngine::State s = loop.session().physics().state();
    s(PhysicsEngine::cartPositionIndex()) = 2.5;
    s(PhysicsEngine::cartVelocityIndex()) = 0.0;
    ASSERT_TRUE(loop.session().physics().setState(s));
    loop.step(20.0);
}

}

TEST(TrainingLoopTest, SyncUpdateAppliesBeforeNextTick) {
    TrainingLoop loop(loopConfig(false));
    const Eigen::VectorXf before = loop.session().model().getActorParams();

    int episodes = 0;
    int lastSteps = 0;
    int updates = 0;
    bool lastApplied = false;
    QObject::connect(&loop, &TrainingLoop::episodeFinished, [&](int, int steps, double reward) {
        episodes++;
        lastSteps = steps;
        EXPECT_DOUBLE_EQ(reward, static_cast<double>(steps));
    });
    QObject::connect(&loop, &TrainingLoop::updateFinished, [&](int, const UpdateStats&, bool applied) {
        updates++;
        lastApplied = applied;
    });

    finishEpisode(loop, 8);

    EXPECT_EQ(episodes, 1);
    EXPECT_EQ(lastSteps, 8);
    EXPECT_EQ(updates, 1);
    EXPECT_TRUE(lastApplied);
    EXPECT_EQ(loop.appliedUpdates(), 1);
    EXPECT_FALSE(loop.isUpdating());
    EXPECT_NE(loop.session().model().getActorParams(), before);
}

TEST(TrainingLoopTest, AsyncUpdateIsAppliedOnReturn) {
    TrainingLoop loop(loopConfig(true));
    const Eigen::VectorXf before = loop.session().model().getActorParams();

    int updates = 0;
    QObject::connect(&loop, &TrainingLoop::updateFinished, [&](int episode, const UpdateStats& stats, bool applied) {
        updates++;
        EXPECT_EQ(episode, 1);
        EXPECT_TRUE(applied);
        EXPECT_EQ(stats.samples, 5);
    });

    finishEpisode(loop, 5);
    EXPECT_TRUE(loop.isUpdating());

    // Ticks keep running on the current parameters while the update trains
    loop.step(20.0);
    EXPECT_EQ(loop.session().buffer().size(), 1u);

    ASSERT_TRUE(waitUntil([&] { return updates == 1; }));
    EXPECT_EQ(loop.appliedUpdates(), 1);
    EXPECT_NE(loop.session().model().getActorParams(), before);
}

TEST(TrainingLoopTest, ReconfigureDiscardsInFlightUpdate) {
    TrainingLoop loop(loopConfig(true));

    int updates = 0;
    int reconfiguredTo = 0;
    QObject::connect(&loop, &TrainingLoop::updateFinished, [&](int, const UpdateStats&, bool) { updates++; });
    QObject::connect(&loop, &TrainingLoop::reconfigured, [&](int poles) { reconfiguredTo = poles; });

    finishEpisode(loop, 5);
    ASSERT_TRUE(loop.isUpdating());

    ASSERT_TRUE(loop.reconfigure(2));
    EXPECT_EQ(reconfiguredTo, 2);
    const Eigen::VectorXf fresh = loop.session().model().getActorParams();

    ASSERT_TRUE(waitUntil([&] { return !loop.isUpdating(); }));
    EXPECT_EQ(updates, 0);
    EXPECT_EQ(loop.appliedUpdates(), 0);
    EXPECT_EQ(loop.numPoles(), 2);
    EXPECT_EQ(loop.simulationState().size(), 6);
    EXPECT_EQ(loop.session().model().getActorParams(), fresh);
}

TEST(TrainingLoopTest, InvalidReconfigureIsRejected) {
    TrainingLoop loop(loopConfig(false));
    int reconfigured = 0;
    QObject::connect(&loop, &TrainingLoop::reconfigured, [&](int) { reconfigured++; });

    EXPECT_FALSE(loop.reconfigure(0));
    EXPECT_EQ(reconfigured, 0);
    EXPECT_EQ(loop.numPoles(), 1);
    EXPECT_EQ(loop.simulationState().size(), 4);
}

TEST(TrainingLoopTest, ReportsDivergence) {
    TrainingLoop loop(loopConfig(false));
    int consecutive = 0;
    QObject::connect(&loop, &TrainingLoop::divergenceDetected, [&](int count) { consecutive = count; });

    for (int i = 0; i < 2; ++i) {
        PhysicsEngine::State s = loop.session().physics().state();
        s(PhysicsEngine::poleAngleIndex(0)) = std::numeric_limits<double>::infinity();
        ASSERT_TRUE(loop.session().physics().setState(s));
        loop.step(20.0);
    }
    EXPECT_EQ(consecutive, 2);
    EXPECT_EQ(loop.session().episodeCount(), 0);
}

TEST(TrainingLoopTest, DivergingUpdatesBuildAStreak) {
    TrainingConfig config = loopConfig(false);
    config.ppo.actorLr = 1e38f;
    config.divergenceWarningThreshold = 5;
    TrainingLoop loop(config);
    const Eigen::VectorXf before = loop.session().model().getActorParams();

    int diverged = 0;
    int maxStreak = 0;
    QObject::connect(&loop, &TrainingLoop::updateFinished, [&](int, const UpdateStats& stats, bool applied) {
        EXPECT_FALSE(applied);
        if (stats.diverged) diverged++;
    });
    QObject::connect(&loop, &TrainingLoop::divergenceDetected, [&](int count) {
        maxStreak = std::max(maxStreak, count);
    });

    for (int episode = 0; episode < 7; ++episode) {
        finishEpisode(loop, 3);
    }

    EXPECT_EQ(diverged, 7);
    EXPECT_GE(maxStreak, config.divergenceWarningThreshold);
    EXPECT_EQ(loop.session().consecutiveDivergences(), 7);
    EXPECT_EQ(loop.appliedUpdates(), 0);
    EXPECT_EQ(loop.session().model().getActorParams(), before);
}

TEST(TrainingLoopTest, AppliedUpdateEndsStreak) {
    TrainingLoop loop(loopConfig(false));

    PhysicsEngine::State s = loop.session().physics().state();
    s(PhysicsEngine::poleAngleIndex(0)) = std::numeric_limits<double>::quiet_NaN();
    ASSERT_TRUE(loop.session().physics().setState(s));
    loop.step(20.0);
    ASSERT_EQ(loop.session().consecutiveDivergences(), 1);

    finishEpisode(loop, 4);
    EXPECT_EQ(loop.appliedUpdates(), 1);
    EXPECT_EQ(loop.session().consecutiveDivergences(), 0);
}

TEST(TrainingLoopTest, FullQueueDropsOldestEpisode) {
    TrainingConfig config = loopConfig(true);
    config.maxPendingUpdates = 1;
    TrainingLoop loop(config);

    std::vector<int> trained;
    QObject::connect(&loop, &TrainingLoop::updateFinished, [&](int episode, const UpdateStats&, bool) {
        trained.push_back(episode);
    });

    // Episode 1 starts training; results are only delivered by the event loop
    finishEpisode(loop, 3);
    ASSERT_TRUE(loop.isUpdating());
    EXPECT_EQ(loop.pendingUpdates(), 0);

    finishEpisode(loop, 3);
    EXPECT_EQ(loop.pendingUpdates(), 1);
    finishEpisode(loop, 3);
    finishEpisode(loop, 3);
    EXPECT_EQ(loop.pendingUpdates(), 1);

    ASSERT_TRUE(waitUntil([&] { return trained.size() == 2 && !loop.isUpdating(); }));
    EXPECT_EQ(trained, (std::vector<int>{1, 4}));
    EXPECT_EQ(loop.pendingUpdates(), 0);
    EXPECT_EQ(loop.appliedUpdates(), 2);
}

TEST(TrainingLoopTest, TimerDrivesTicks) {
    TrainingConfig config = loopConfig(true);
    config.timeScale = 40.0;
    TrainingLoop loop(config);

    loop.start();
    EXPECT_TRUE(loop.isRunning());
    ASSERT_TRUE(waitUntil([&] {
        return loop.session().buffer().size() >= 3 || loop.session().episodeCount() > 0;
    }));

    loop.pause();
    EXPECT_TRUE(loop.isPaused());
    EXPECT_FALSE(loop.isRunning());

    loop.resume();
    EXPECT_FALSE(loop.isPaused());
    EXPECT_TRUE(loop.isRunning());

    loop.stop();
    EXPECT_FALSE(loop.isRunning());
}
