#include <reelsync/core/config.hpp>
#include <reelsync/core/logger.hpp>
#include <reelsync/core/result.hpp>
#include <reelsync/core/settings.hpp>
#include <reelsync/core/signals.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace reelsync;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

TEST(Config, DefaultsArePresent) {
    Config config;
    EXPECT_EQ(config.get<int>("timeline.maxOffset"), 60);
    EXPECT_TRUE(config.get<bool>("playback.parallelDecode"));
    EXPECT_EQ(config.get<std::string>("export.videoCodec"), "libx264");
    EXPECT_EQ(config.get<int>("export.crf"), 18);
    EXPECT_EQ(config.get<std::string>("export.boundaryPolicy"), "pad");
    EXPECT_TRUE(config.has("log.level"));
    EXPECT_FALSE(config.has("log.colour"));
}

TEST(Config, MissingOrMistypedKeysFallBack) {
    Config config;
    EXPECT_EQ(config.get<int>("no.such.key", 7), 7);
    EXPECT_EQ(config.get<int>("export.videoCodec", 3), 3);
    EXPECT_EQ(config.get<std::string>("timeline.maxOffset.deeper", "x"), "x");
}

TEST(Config, MergeKeepsUntouchedKeys) {
    Config config;
    config.loadFromJson(json{{"export", {{"crf", 23}}}});

    EXPECT_EQ(config.get<int>("export.crf"), 23);
    EXPECT_EQ(config.get<std::string>("export.preset"), "medium");
    EXPECT_EQ(config.get<int>("timeline.maxOffset"), 60);
}

TEST(Config, ReplaceDropsEverythingElse) {
    Config config;
    config.loadFromJson(json{{"export", {{"crf", 23}}}}, false);

    EXPECT_EQ(config.get<int>("export.crf"), 23);
    EXPECT_FALSE(config.has("timeline.maxOffset"));
}

TEST(Config, SetCreatesNestedKeysAndNotifies) {
    Config config;
    std::vector<std::string> changed;
    const size_t id = config.addChangeListener(
        [&changed](const std::string& key, const json&, const json&) { changed.push_back(key); });

    EXPECT_TRUE(config.set<std::string>("export.outputDirectory", "/tmp/out"));
    EXPECT_TRUE(config.set<double>("playback.rateOverride", 29.97));
    config.removeChangeListener(id);
    EXPECT_TRUE(config.set<int>("export.crf", 30));

    EXPECT_EQ(config.get<std::string>("export.outputDirectory"), "/tmp/out");
    EXPECT_DOUBLE_EQ(config.get<double>("playback.rateOverride"), 29.97);
    EXPECT_EQ(changed, (std::vector<std::string>{"export.outputDirectory", "playback.rateOverride"}));
    EXPECT_EQ(config.toJson()["export"]["crf"], 30);
}

TEST(Config, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "reelsync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"timeline": {"maxOffset": 12}, "log": {"level": "debug"}})";
    }

    Config config;
    config.loadFromFile(path.string());
    EXPECT_EQ(config.get<int>("timeline.maxOffset"), 12);
    EXPECT_EQ(config.get<std::string>("log.level"), "debug");
    EXPECT_EQ(config.get<int>("export.crf"), 18);

    std::filesystem::remove(path);
}

TEST(Config, LoadFromFileErrors) {
    Config config;
    EXPECT_THROW(config.loadFromFile("/nonexistent/reelsync.json"), std::runtime_error);

    const auto path = std::filesystem::temp_directory_path() / "reelsync_config_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(config.loadFromFile(path.string()), std::runtime_error);
    std::filesystem::remove(path);

    // A failed load leaves the previous values
    EXPECT_EQ(config.get<int>("timeline.maxOffset"), 60);
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

TEST(Settings, FromDefaults) {
    Config config;
    const auto s = ReelSyncSettings::fromConfig(config);

    EXPECT_EQ(s.timeline.maxOffset, 60);
    EXPECT_TRUE(s.playback.parallelDecode);
    EXPECT_EQ(s.exporting.videoCodec, "libx264");
    EXPECT_EQ(s.exporting.crf, 18);
    EXPECT_EQ(s.exporting.preset, "medium");
    EXPECT_EQ(s.exporting.jpegQScale, 2);
    EXPECT_EQ(s.exporting.boundaryPolicy, "pad");
    EXPECT_TRUE(s.exporting.outputDirectory.empty());
    EXPECT_EQ(s.log.level, "info");
}

TEST(Settings, Overrides) {
    Config config;
    config.loadFromJson(json{
        {"timeline", {{"maxOffset", 90}}},
        {"playback", {{"parallelDecode", false}}},
        {"export", {{"boundaryPolicy", "overlap"}, {"jpegQScale", 5}}}});

    const auto s = ReelSyncSettings::fromConfig(config);
    EXPECT_EQ(s.timeline.maxOffset, 90);
    EXPECT_FALSE(s.playback.parallelDecode);
    EXPECT_EQ(s.exporting.boundaryPolicy, "overlap");
    EXPECT_EQ(s.exporting.jpegQScale, 5);
}

TEST(Settings, NegativeBoundFallsBack) {
    Config config;
    config.set<int>("timeline.maxOffset", -4);
    EXPECT_EQ(ReelSyncSettings::fromConfig(config).timeline.maxOffset, kDefaultMaxOffset);
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

TEST(Logger, ParseLevel) {
    EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_EQ(parseLogLevel("chatty"), spdlog::level::info);
}

TEST(Logger, LoggerIsAlwaysAvailable) {
    ASSERT_NE(getLogger(), nullptr);
    LOG_INFO("logger smoke test {}", 1);
}

// ---------------------------------------------------------------------------
// Result
// ---------------------------------------------------------------------------

TEST(Result, ContextKeepsTheCode) {
    Error base(ErrorCode::FileNotFound, "no such file");
    Error wrapped = base.withContext("Error opening video a.mp4");
    EXPECT_EQ(wrapped.code(), ErrorCode::FileNotFound);
    EXPECT_EQ(wrapped.message(), "Error opening video a.mp4: no such file");

    Error bare(ErrorCode::RangeError);
    EXPECT_STREQ(bare.what(), errorCodeToString(ErrorCode::RangeError));
}

TEST(Result, AccessorsGuardMisuse) {
    Result<int> failed = Error(ErrorCode::DecodeFailure, "corrupt");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.valueOr(3), 3);
    EXPECT_THROW((void)failed.value(), std::runtime_error);

    Result<int> good = 7;
    EXPECT_EQ(good.value(), 7);
    EXPECT_THROW((void)good.error(), std::logic_error);

    Result<void> done = Ok();
    EXPECT_TRUE(done.ok());
    EXPECT_THROW((void)done.error(), std::logic_error);
}

// ---------------------------------------------------------------------------
// Signals
// ---------------------------------------------------------------------------

TEST(Signal, ScopedConnectionDisconnects) {
    Signal<int> changed;
    int sum = 0;
    {
        auto conn = changed.connectScoped([&sum](int v) { sum += v; });
        changed.fire(2);
        EXPECT_EQ(changed.slotCount(), 1u);
    }
    changed.fire(5);
    EXPECT_EQ(sum, 2);
    EXPECT_EQ(changed.slotCount(), 0u);
}

TEST(Signal, SlotDisconnectedMidFireIsSkipped) {
    Signal<> fired;
    int calls = 0;
    ScopedConnection second;
    auto first = fired.connectScoped([&second]() { second.disconnect(); });
    second = fired.connectScoped([&calls]() { ++calls; });

    fired.fire();
    EXPECT_EQ(calls, 0);
}

TEST(Signal, ConnectionOutlivesSignal) {
    Connection conn;
    {
        Signal<int> temporary;
        conn = temporary.connect([](int) {});
        EXPECT_TRUE(conn.connected());
    }
    EXPECT_FALSE(conn.connected());
    conn.disconnect();
}
