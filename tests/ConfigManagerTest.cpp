#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "config/ConfigManager.hpp"
#include "config/ServerSettings.hpp"

namespace {

nlohmann::json MinimalConfig() {
    return {
        {"server", {{"host", "127.0.0.1"}, {"port", 9000}}},
        {"game", {{"max_players_per_session", 3}, {"max_actions_per_round", 6}}},
        {"logging", {{"level", "debug"}}}
    };
}

} // namespace

TEST(ConfigManagerTest, AcceptsMinimalConfigAndFillsDefaults) {
    auto& config = ConfigManager::GetInstance();
    ASSERT_TRUE(config.LoadFromJson(MinimalConfig()));

    EXPECT_EQ(config.GetServerHost(), "127.0.0.1");
    EXPECT_EQ(config.GetServerPort(), 9000);
    EXPECT_EQ(config.GetMaxPlayersPerSession(), 3);
    EXPECT_EQ(config.GetMaxActionsPerRound(), 6);
    EXPECT_EQ(config.GetDisconnectDeadlineSeconds(), 120);
    EXPECT_EQ(config.GetSessionGracePeriodSeconds(), 60);
    EXPECT_EQ(config.GetAuthTimeoutSeconds(), 30);
    EXPECT_EQ(config.GetWorldSeed(), 0u);
    EXPECT_EQ(config.GetLogLevel(), "debug");
    EXPECT_TRUE(config.GetConsoleOutput());
}

TEST(ConfigManagerTest, RejectsInvalidConfigs) {
    auto& config = ConfigManager::GetInstance();

    auto noServer = MinimalConfig();
    noServer.erase("server");
    EXPECT_FALSE(config.LoadFromJson(noServer));

    auto badPort = MinimalConfig();
    badPort["server"]["port"] = 70000;
    EXPECT_FALSE(config.LoadFromJson(badPort));

    auto zeroActions = MinimalConfig();
    zeroActions["game"]["max_actions_per_round"] = 0;
    EXPECT_FALSE(config.LoadFromJson(zeroActions));

    auto badLevel = MinimalConfig();
    badLevel["logging"]["level"] = "verbose";
    EXPECT_FALSE(config.LoadFromJson(badLevel));

    auto badDeadline = MinimalConfig();
    badDeadline["game"]["disconnect_deadline_seconds"] = "soon";
    EXPECT_FALSE(config.LoadFromJson(badDeadline));
}

TEST(ConfigManagerTest, DottedKeyLookup) {
    auto& config = ConfigManager::GetInstance();
    auto json = MinimalConfig();
    json["network"] = {{"outbound_queue_size", 32}};
    ASSERT_TRUE(config.LoadFromJson(json));

    EXPECT_TRUE(config.HasKey("network.outbound_queue_size"));
    EXPECT_FALSE(config.HasKey("network.missing"));
    EXPECT_EQ(config.GetInt("network.outbound_queue_size", 1), 32);
    EXPECT_EQ(config.GetString("server.host"), "127.0.0.1");
    EXPECT_EQ(config.GetString("server.nothing", "fallback"), "fallback");
}

TEST(ServerSettingsTest, ClampsOutOfRangeValues) {
    auto& config = ConfigManager::GetInstance();
    auto json = MinimalConfig();
    json["game"]["disconnect_deadline_seconds"] = 45;
    json["game"]["world_seed"] = 1234;
    json["network"] = {{"outbound_queue_size", 64}, {"outbound_hard_limit", 8}, {"sweep_interval_ms", 1}};
    ASSERT_TRUE(config.LoadFromJson(json));

    ServerSettings settings = ServerSettings::FromConfig(config);
    EXPECT_EQ(settings.maxPlayersPerSession, 3u);
    EXPECT_EQ(settings.maxActionsPerRound, 6u);
    EXPECT_EQ(settings.disconnectDeadline, std::chrono::seconds(45));
    EXPECT_EQ(settings.worldSeed, 1234u);
    EXPECT_EQ(settings.outboundQueueSize, 64u);
    EXPECT_EQ(settings.outboundHardLimit, 64u);
    EXPECT_EQ(settings.sweepInterval, std::chrono::milliseconds(50));
}
