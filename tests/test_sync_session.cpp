#include "fakes.hpp"

#include <reelsync/engine/sync_session.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

using namespace reelsync;
using reelsync::engine::ExportStatus;
using reelsync::engine::SyncSession;
using reelsync::model::TrimRange;
using reelsync::test::FakeMedia;
using reelsync::test::makeStream;
using reelsync::test::waitFor;

namespace {

class SyncSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        media = std::make_shared<FakeMedia>();
        media->addStream(makeStream("/v/a.mp4", 30, 30));
        media->addStream(makeStream("/v/b.mp4", 20, 30));
        media->addStream(makeStream("/v/c.mp4", 30, 30));
        createSession(ReelSyncSettings{});
    }

    void createSession(const ReelSyncSettings& settings) {
        session.reset();
        session = std::make_unique<SyncSession>(media->decoderFactory(),
                                                media->sinkFactory(), settings);
    }

    void loadTwo() {
        auto loaded = session->loadStreams({"/v/a.mp4", "/v/b.mp4"});
        ASSERT_TRUE(loaded.ok()) << loaded.error().what();
    }

    std::shared_ptr<FakeMedia> media;
    std::unique_ptr<SyncSession> session;
};

} // namespace

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

TEST_F(SyncSessionTest, LoadPresentsFirstFrame) {
    std::vector<bool> loadedSignals;
    auto conn = session->videosLoadedChanged.connectScoped(
        [&loadedSignals](bool loaded) { loadedSignals.push_back(loaded); });

    loadTwo();

    EXPECT_TRUE(session->videosLoaded());
    EXPECT_EQ(session->videoCount(), 2);
    EXPECT_EQ(session->totalFrames(), 30);
    EXPECT_DOUBLE_EQ(session->timelineFrameRate(), 30.0);
    EXPECT_DOUBLE_EQ(session->frameRate(1), 30.0);
    EXPECT_DOUBLE_EQ(session->frameRate(7), 0.0);
    EXPECT_EQ(session->currentFrame(), 0);
    EXPECT_EQ(session->frameOffsets(), (std::vector<int>{0, 0}));
    EXPECT_EQ(session->trimRange(), (TrimRange{0, 29}));
    EXPECT_FALSE(session->isPlaying());
    EXPECT_TRUE(session->canPlay());
    EXPECT_TRUE(session->canExport());

    EXPECT_EQ(media->requests("/v/a.mp4"), (std::vector<FrameIndex>{0}));
    EXPECT_EQ(media->requests("/v/b.mp4"), (std::vector<FrameIndex>{0}));
    EXPECT_EQ(loadedSignals, (std::vector<bool>{true}));
}

TEST_F(SyncSessionTest, ReloadResetsOffsetsAndTrim) {
    loadTwo();
    ASSERT_TRUE(session->setFrameOffset(1, 5).ok());
    ASSERT_TRUE(session->setTrimRange(3, 9).ok());
    session->seek(12);

    auto loaded = session->loadStreams({"/v/c.mp4", "/v/b.mp4", "/v/a.mp4"});
    ASSERT_TRUE(loaded.ok());

    EXPECT_EQ(session->frameOffsets(), (std::vector<int>{0, 0, 0}));
    EXPECT_EQ(session->trimRange(), (TrimRange{0, 29}));
    EXPECT_EQ(session->currentFrame(), 0);
    EXPECT_EQ(session->paths().front(), "/v/c.mp4");
}

TEST_F(SyncSessionTest, FailedLoadKeepsPreviousStreams) {
    loadTwo();
    ASSERT_TRUE(session->setFrameOffset(1, 4).ok());

    auto loaded = session->loadStreams({"/v/a.mp4", "/v/missing.mp4"});
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.error().code(), ErrorCode::FileNotFound);

    EXPECT_EQ(session->videoCount(), 2);
    EXPECT_EQ(session->frameOffsets(), (std::vector<int>{0, 4}));
    EXPECT_EQ(session->paths().back(), "/v/b.mp4");
}

TEST_F(SyncSessionTest, EmptyLoadIsRejected) {
    auto loaded = session->loadStreams({});
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(session->videosLoaded());
    EXPECT_FALSE(session->canPlay());
    EXPECT_FALSE(session->canExport());
}

TEST_F(SyncSessionTest, UnloadClearsEverything) {
    loadTwo();
    std::vector<bool> loadedSignals;
    auto conn = session->videosLoadedChanged.connectScoped(
        [&loadedSignals](bool loaded) { loadedSignals.push_back(loaded); });

    session->unloadStreams();

    EXPECT_FALSE(session->videosLoaded());
    EXPECT_EQ(session->totalFrames(), 0);
    EXPECT_TRUE(session->frameOffsets().empty());
    EXPECT_EQ(loadedSignals, (std::vector<bool>{false}));
}

TEST_F(SyncSessionTest, PreferredViewSize) {
    auto wide = makeStream("/v/wide.mp4", 30, 30);
    wide.resolution = {1280, 720};
    auto tall = makeStream("/v/tall.mp4", 30, 30);
    tall.resolution = {1280, 1080};
    media->addStream(wide);
    media->addStream(tall);

    loadTwo();
    EXPECT_EQ(session->preferredViewSize().width, 8);
    EXPECT_EQ(session->preferredViewSize().height, 2);

    ASSERT_TRUE(session->loadStreams({"/v/wide.mp4", "/v/tall.mp4"}).ok());
    EXPECT_EQ(session->preferredViewSize().width, 1920);
    EXPECT_EQ(session->preferredViewSize().height, 1080);
}

// ---------------------------------------------------------------------------
// Editing
// ---------------------------------------------------------------------------

TEST_F(SyncSessionTest, OffsetChangeRepresentsWhenStopped) {
    loadTwo();
    session->seek(4);
    media->clearRequests();

    ASSERT_TRUE(session->setFrameOffset(1, 3).ok());

    EXPECT_EQ(media->requests("/v/b.mp4"), (std::vector<FrameIndex>{7}));
    EXPECT_EQ(session->currentFrame(), 4);
}

TEST_F(SyncSessionTest, RejectedOffsetChangesNothing) {
    loadTwo();
    media->clearRequests();

    auto result = session->setFrameOffset(1, 61);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code(), ErrorCode::RangeError);

    result = session->setFrameOffset(0, 1);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code(), ErrorCode::RangeError);

    EXPECT_EQ(session->frameOffsets(), (std::vector<int>{0, 0}));
    EXPECT_EQ(media->totalRequests(), 0u);
}

TEST_F(SyncSessionTest, ConfiguredOffsetBound) {
    ReelSyncSettings settings;
    settings.timeline.maxOffset = 5;
    createSession(settings);
    loadTwo();

    EXPECT_TRUE(session->setFrameOffset(1, -5).ok());
    EXPECT_FALSE(session->setFrameOffset(1, 6).ok());
}

TEST_F(SyncSessionTest, FrameRateOverride) {
    loadTwo();
    session->setFrameRate(60.0);
    EXPECT_EQ(session->totalFrames(), 60);

    session->setFrameRate(0.0);
    EXPECT_EQ(session->totalFrames(), 0);
    EXPECT_FALSE(session->canPlay());
    EXPECT_FALSE(session->canExport());
}

// ---------------------------------------------------------------------------
// Export
// ---------------------------------------------------------------------------

TEST_F(SyncSessionTest, ExportUsesSessionState) {
    loadTwo();
    ASSERT_TRUE(session->setFrameOffset(1, 3).ok());
    ASSERT_TRUE(session->setTrimRange(2, 5).ok());

    auto job = session->exportSyncedVideos();
    ASSERT_TRUE(job.ok()) << job.error().what();
    session->exporter().waitForIdle();
    ASSERT_EQ(session->exporter().status(), ExportStatus::Succeeded);

    auto sinks = media->sinks();
    ASSERT_EQ(sinks.size(), 2u);
    EXPECT_EQ(sinks[0].location, "/v/synced/a.mp4");
    EXPECT_EQ(sinks[0].sourceFrames, (std::vector<FrameIndex>{2, 3, 4, 5}));
    EXPECT_EQ(sinks[1].sourceFrames, (std::vector<FrameIndex>{5, 6, 7, 8}));
}

TEST_F(SyncSessionTest, ExportHonoursConfiguredPolicyAndDirectory) {
    ReelSyncSettings settings;
    settings.exporting.boundaryPolicy = "overlap";
    settings.exporting.outputDirectory = "/out";
    createSession(settings);
    loadTwo();
    ASSERT_TRUE(session->setFrameOffset(1, 5).ok());

    ASSERT_TRUE(session->exportSyncedImageSequence().ok());
    session->exporter().waitForIdle();

    // b holds 20 frames: offset 5 leaves global 0..14
    auto sinks = media->sinks();
    ASSERT_EQ(sinks.size(), 2u);
    EXPECT_EQ(sinks[0].location, "/out/a");
    EXPECT_EQ(sinks[0].outputIndices.size(), 15u);
    EXPECT_EQ(sinks[1].outputIndices.size(), 15u);
}

TEST_F(SyncSessionTest, ExplicitExportProbesUnloadedPaths) {
    loadTwo();

    auto job = session->exportSyncedImageSequence({"/v/c.mp4"}, {0}, 30.0, 0, 9);
    ASSERT_TRUE(job.ok()) << job.error().what();
    session->exporter().waitForIdle();

    auto sinks = media->sinks();
    ASSERT_EQ(sinks.size(), 1u);
    EXPECT_EQ(sinks[0].location, "/v/c");
    EXPECT_EQ(sinks[0].outputIndices.size(), 10u);

    auto missing = session->exportSyncedVideos({"/v/none.mp4"}, {0}, 30.0, 0, 9);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code(), ErrorCode::InvalidExportRequest);
}

TEST_F(SyncSessionTest, ExportPausesAndBlocksPlayback) {
    loadTwo();
    session->play();
    ASSERT_TRUE(session->isPlaying());

    media->holdDecodes();
    auto job = session->exportSyncedVideos();
    ASSERT_TRUE(job.ok());

    EXPECT_FALSE(session->isPlaying());
    EXPECT_FALSE(session->canPlay());
    EXPECT_FALSE(session->canExport());
    session->play();
    EXPECT_FALSE(session->isPlaying());

    auto busy = session->exportSyncedImageSequence();
    ASSERT_FALSE(busy.ok());
    EXPECT_EQ(busy.error().code(), ErrorCode::ExportBusy);

    auto reload = session->loadStreams({"/v/a.mp4"});
    ASSERT_FALSE(reload.ok());
    EXPECT_EQ(reload.error().code(), ErrorCode::NotReady);

    media->release();
    session->exporter().waitForIdle();

    EXPECT_TRUE(session->canPlay());
    EXPECT_TRUE(session->canExport());
}

TEST_F(SyncSessionTest, InvalidExportLeavesPlaybackUsable) {
    loadTwo();
    auto job = session->exportSyncedVideos({"/v/a.mp4", "/v/b.mp4"}, {0, 0}, 30.0, 9, 2);
    ASSERT_FALSE(job.ok());
    EXPECT_EQ(job.error().code(), ErrorCode::InvalidExportRequest);
    EXPECT_TRUE(session->canPlay());
}

TEST_F(SyncSessionTest, RejectedExportDoesNotPausePlayback) {
    media->addStream(makeStream("/v/long.mp4", 600, 30));
    auto loaded = session->loadStreams({"/v/long.mp4", "/v/a.mp4"});
    ASSERT_TRUE(loaded.ok()) << loaded.error().what();

    std::atomic<int> stops{0};
    auto conn = session->clock().stateChanged.connectScoped(
        [&stops](engine::PlaybackState state) {
            if (state == engine::PlaybackState::Stopped) ++stops;
        });

    session->togglePlayPause();
    ASSERT_TRUE(session->isPlaying());

    auto job = session->exportSyncedVideos({"/v/a.mp4", "/v/b.mp4"}, {0, 0}, 30.0, 9, 2);
    ASSERT_FALSE(job.ok());
    EXPECT_EQ(job.error().code(), ErrorCode::InvalidExportRequest);

    EXPECT_TRUE(session->isPlaying());
    EXPECT_TRUE(session->canPlay());
    EXPECT_EQ(stops.load(), 0);
    EXPECT_TRUE(media->sinks().empty());

    session->togglePlayPause();
    EXPECT_FALSE(session->isPlaying());
}

TEST_F(SyncSessionTest, PlaybackRunsToTheEnd) {
    loadTwo();
    session->seek(25);

    std::atomic<bool> ended{false};
    auto conn = session->clock().playbackEnded.connectScoped([&ended]() { ended = true; });
    session->togglePlayPause();

    ASSERT_TRUE(waitFor([&ended]() { return ended.load(); }));
    EXPECT_EQ(session->currentFrame(), 29);
    EXPECT_FALSE(session->isPlaying());
}
