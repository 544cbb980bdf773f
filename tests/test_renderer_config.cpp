#include <gtest/gtest.h>
#include "render/RendererConfig.hpp"
#include "render/RenderStats.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(RendererConfigTest, Defaults) {
    RendererConfig c;
    EXPECT_DOUBLE_EQ(c.fullRedrawThreshold, 1.0);
    EXPECT_TRUE(c.synchronizedOutput);
    EXPECT_FALSE(c.alternateScreen);
    EXPECT_TRUE(c.hideCursor);
    EXPECT_TRUE(c.title.empty());
    EXPECT_EQ(c.ellipsis, "…");
}

TEST(RendererConfigTest, MissingKeysKeepDefaults) {
    auto c = RendererConfig::fromJson({{"alternate_screen", true}, {"title", "chat"}});

    EXPECT_TRUE(c.alternateScreen);
    EXPECT_EQ(c.title, "chat");
    EXPECT_TRUE(c.synchronizedOutput);
    EXPECT_DOUBLE_EQ(c.fullRedrawThreshold, 1.0);
}

TEST(RendererConfigTest, ThresholdIsClamped) {
    EXPECT_DOUBLE_EQ(RendererConfig::fromJson({{"full_redraw_threshold", 3.0}}).fullRedrawThreshold, 1.0);
    EXPECT_DOUBLE_EQ(RendererConfig::fromJson({{"full_redraw_threshold", -2.0}}).fullRedrawThreshold, 0.0);
    EXPECT_DOUBLE_EQ(RendererConfig::fromJson({{"full_redraw_threshold", 0.6}}).fullRedrawThreshold, 0.6);
}

TEST(RendererConfigTest, NonObjectGivesDefaults) {
    auto c = RendererConfig::fromJson(nlohmann::json::array());
    EXPECT_TRUE(c.hideCursor);
}

TEST(RendererConfigTest, WrongTypeThrows) {
    EXPECT_THROW(RendererConfig::fromJson({{"hide_cursor", "yes"}}),
                 nlohmann::json::type_error);
}

TEST(RendererConfigTest, SerializesEveryKey) {
    RendererConfig c;
    c.synchronizedOutput = false;
    c.ellipsis = "...";

    auto j = c.toJson();
    EXPECT_EQ(j["synchronized_output"], false);
    EXPECT_EQ(j["ellipsis"], "...");
    EXPECT_TRUE(j.contains("full_redraw_threshold"));
    EXPECT_TRUE(j.contains("alternate_screen"));
    EXPECT_TRUE(j.contains("hide_cursor"));
    EXPECT_TRUE(j.contains("title"));

    auto back = RendererConfig::fromJson(j);
    EXPECT_FALSE(back.synchronizedOutput);
    EXPECT_EQ(back.ellipsis, "...");
}

TEST(RendererConfigTest, LoadsFromFile) {
    auto path = fs::temp_directory_path() / "diffterm_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"title": "from file", "hide_cursor": false})";
    }

    auto c = RendererConfig::load(path.string());
    EXPECT_EQ(c.title, "from file");
    EXPECT_FALSE(c.hideCursor);
    fs::remove(path);
}

TEST(RendererConfigTest, LoadErrors) {
    EXPECT_THROW(RendererConfig::load("/nonexistent/diffterm.json"), std::runtime_error);

    auto path = fs::temp_directory_path() / "diffterm_config_bad.json";
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    EXPECT_THROW(RendererConfig::load(path.string()), nlohmann::json::parse_error);
    fs::remove(path);
}

TEST(RenderStatsTest, JsonUsesSnakeCase) {
    RenderStats s;
    s.frames = 3;
    s.fullRedraws = 1;
    s.lastDecision = "incremental";

    auto j = s.toJson();
    EXPECT_EQ(j["frames"], 3);
    EXPECT_EQ(j["full_redraws"], 1);
    EXPECT_EQ(j["last_decision"], "incremental");
}
