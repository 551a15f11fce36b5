#include <gtest/gtest.h>
#include "RolloutBuffer.h"

namespace {

Transition makeTransition(float marker, bool done)
{
    Transition t;
    t.state = Eigen::VectorXf::Constant(4, marker);
    t.action = Eigen::VectorXf::Constant(1, marker);
    t.reward = 1.0f;
    t.done = done;
    return t;
}

}

TEST(RolloutBufferTest, TakeEpisodeEmptiesBuffer) {
    RolloutBuffer buffer;
    buffer.push(makeTransition(0.0f, false));
    buffer.push(makeTransition(1.0f, false));
    buffer.push(makeTransition(2.0f, true));
    ASSERT_EQ(buffer.size(), 3u);

    std::vector<Transition> episode = buffer.takeEpisode();
    ASSERT_EQ(episode.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(episode[i].state(0), static_cast<float>(i));
    }
    EXPECT_TRUE(episode.back().done);

    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.clearCount(), 1u);
}

TEST(RolloutBufferTest, NextEpisodeStartsClean) {
    RolloutBuffer buffer;
    buffer.push(makeTransition(0.0f, true));
    buffer.takeEpisode();

    buffer.push(makeTransition(5.0f, true));
    std::vector<Transition> episode = buffer.takeEpisode();
    ASSERT_EQ(episode.size(), 1u);
    EXPECT_EQ(episode[0].state(0), 5.0f);
    EXPECT_EQ(buffer.clearCount(), 2u);
}

TEST(RolloutBufferTest, ClearCounts) {
    RolloutBuffer buffer;
    buffer.push(makeTransition(0.0f, false));
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.clearCount(), 1u);
}
