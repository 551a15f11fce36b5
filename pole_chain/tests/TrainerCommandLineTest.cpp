#include <gtest/gtest.h>
#include "TrainerCommandLine.h"

TEST(TrainerCommandLineTest, DefaultsWithoutArguments) {
    TrainerCommandLine commandLine;
    TrainerOptions options;
    QString error;
    ASSERT_TRUE(commandLine.parse({"pole_chain_trainer"}, options, &error)) << error.toStdString();

    EXPECT_EQ(options.config.numPoles, 1);
    EXPECT_EQ(options.config.seed, 0u);
    EXPECT_TRUE(options.config.asyncUpdates);
    EXPECT_EQ(options.maxEpisodes, 0);
}

TEST(TrainerCommandLineTest, ReadsEveryOption) {
    TrainerCommandLine commandLine;
    TrainerOptions options;
    QString error;
    const QStringList args = {"pole_chain_trainer", "--poles", "3", "--seed", "77", "--tick-ms", "5",
                              "--time-scale", "4", "--gravity", "3.7", "--max-episodes", "12",
                              "--sync-updates", "--normalize-advantages", "--reshuffle-epochs"};
    ASSERT_TRUE(commandLine.parse(args, options, &error)) << error.toStdString();

    EXPECT_EQ(options.config.numPoles, 3);
    EXPECT_EQ(options.config.seed, 77u);
    EXPECT_EQ(options.config.tickIntervalMs, 5);
    EXPECT_DOUBLE_EQ(options.config.timeScale, 4.0);
    EXPECT_DOUBLE_EQ(options.config.physics.gravity, 3.7);
    EXPECT_EQ(options.maxEpisodes, 12);
    EXPECT_FALSE(options.config.asyncUpdates);
    EXPECT_TRUE(options.config.ppo.normalizeAdvantages);
    EXPECT_TRUE(options.config.ppo.reshuffleEachEpoch);
}

TEST(TrainerCommandLineTest, RejectsNegativeSeed) {
    TrainerCommandLine commandLine;
    TrainerOptions options;
    options.maxEpisodes = 99;
    QString error;
    EXPECT_FALSE(commandLine.parse({"pole_chain_trainer", "--seed", "-1"}, options, &error));
    EXPECT_TRUE(error.contains("--seed"));
    // Left untouched on failure
    EXPECT_EQ(options.config.seed, 0u);
    EXPECT_EQ(options.maxEpisodes, 99);

    TrainerCommandLine again;
    EXPECT_FALSE(again.parse({"pole_chain_trainer", "--seed", "4294967296"}, options, &error));
    EXPECT_EQ(options.config.seed, 0u);
}

TEST(TrainerCommandLineTest, RejectsMalformedNumbers) {
    TrainerCommandLine commandLine;
    TrainerOptions options;
    QString error;
    EXPECT_FALSE(commandLine.parse({"pole_chain_trainer", "--poles", "two"}, options, &error));
    EXPECT_TRUE(error.contains("--poles"));
}

TEST(TrainerCommandLineTest, RejectsInvalidConfiguration) {
    TrainerCommandLine commandLine;
    TrainerOptions options;
    QString error;
    EXPECT_FALSE(commandLine.parse({"pole_chain_trainer", "--poles", "0"}, options, &error));
    EXPECT_TRUE(error.contains("numPoles"));

    TrainerCommandLine again;
    EXPECT_FALSE(again.parse({"pole_chain_trainer", "--max-episodes", "-3"}, options, &error));
}

TEST(TrainerCommandLineTest, RejectsUnknownOption) {
    TrainerCommandLine commandLine;
    TrainerOptions options;
    QString error;
    EXPECT_FALSE(commandLine.parse({"pole_chain_trainer", "--speed", "2"}, options, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(TrainerCommandLineTest, HelpIsReportedNotHandled) {
    TrainerCommandLine commandLine;
    TrainerOptions options;
    ASSERT_TRUE(commandLine.parse({"pole_chain_trainer", "--help"}, options));
    EXPECT_TRUE(commandLine.helpRequested());
    EXPECT_FALSE(commandLine.versionRequested());
}
