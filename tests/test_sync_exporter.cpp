#include "fakes.hpp"

#include <reelsync/engine/sync_exporter.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace reelsync;
using reelsync::engine::BoundaryPolicy;
using reelsync::engine::ExportRequest;
using reelsync::engine::ExportStatus;
using reelsync::engine::SyncExporter;
using reelsync::test::FakeMedia;
using reelsync::test::SinkRecord;
using reelsync::test::makeStream;

namespace {

std::vector<FrameIndex> range(FrameIndex first, FrameIndex last) {
    std::vector<FrameIndex> out;
    for (FrameIndex i = first; i <= last; ++i) out.push_back(i);
    return out;
}

std::vector<FrameIndex> concat(std::vector<FrameIndex> a, const std::vector<FrameIndex>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

std::vector<FrameIndex> blanks(int count) {
    return std::vector<FrameIndex>(count, kNoFrame);
}

/// Records reporter events in order; callable from the worker thread
struct EventLog {
    EventLog(SyncExporter& exporter, std::shared_ptr<FakeMedia> media)
        : media(std::move(media)) {
        auto& reporter = exporter.reporter();
        started = reporter.exportStarted.connectScoped([this]() {
            std::lock_guard lock(mutex);
            events.push_back("started");
        });
        progress = reporter.exportProgress.connectScoped([this](FrameIndex done, FrameIndex total) {
            std::lock_guard lock(mutex);
            events.push_back("progress");
            lastDone = done;
            lastTotal = total;
        });
        finished = reporter.exportFinished.connectScoped([this](bool ok, const std::string& msg) {
            bool closed = true;
            for (const auto& sink : this->media->sinks()) {
                closed = closed && sink.closed;
            }
            std::lock_guard lock(mutex);
            events.push_back("finished");
            success = ok;
            message = msg;
            sinksClosedAtFinish = closed;
            ++finishCount;
        });
    }

    std::vector<std::string> snapshot() {
        std::lock_guard lock(mutex);
        return events;
    }

    std::shared_ptr<FakeMedia> media;
    std::mutex mutex;
    std::vector<std::string> events;
    FrameIndex lastDone = 0;
    FrameIndex lastTotal = 0;
    bool success = false;
    std::string message;
    bool sinksClosedAtFinish = false;
    int finishCount = 0;

    ScopedConnection started;
    ScopedConnection progress;
    ScopedConnection finished;
};

class SyncExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        media = std::make_shared<FakeMedia>();
        media->addStream(reference);
        media->addStream(shorter);
        exporter = std::make_unique<SyncExporter>(media->decoderFactory(), media->sinkFactory());
        log = std::make_unique<EventLog>(*exporter, media);
    }

    void TearDown() override {
        exporter->waitForIdle();
        log.reset();
        exporter.reset();
    }

    // 24 frames at 24 fps (one second) and a 12-frame stream offset by +5
    ExportRequest request(BoundaryPolicy policy = BoundaryPolicy::Pad) const {
        ExportRequest r;
        r.streams = {reference, shorter};
        r.offsets = {0, 5};
        r.frameRate = 24.0;
        r.trimStart = 0;
        r.trimEnd = 9;
        r.policy = policy;
        return r;
    }

    SinkRecord sinkFor(const std::string& location) const {
        for (const auto& sink : media->sinks()) {
            if (sink.location == location) return sink;
        }
        ADD_FAILURE() << "no sink for " << location;
        return {};
    }

    media::StreamInfo reference = makeStream("/videos/a.mp4", 24, 24);
    media::StreamInfo shorter = makeStream("/videos/b.mp4", 12, 24);
    std::shared_ptr<FakeMedia> media;
    std::unique_ptr<SyncExporter> exporter;
    std::unique_ptr<EventLog> log;
};

} // namespace

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

TEST(SyncExporterStatic, TimelineLengthFromReferenceDuration) {
    ExportRequest r;
    r.streams = {makeStream("a.mp4", 24, 24), makeStream("b.mp4", 12, 24)};
    r.frameRate = 24.0;
    EXPECT_EQ(SyncExporter::timelineLength(r), 24);

    r.frameRate = 48.0;
    EXPECT_EQ(SyncExporter::timelineLength(r), 48);

    r.frameRate = 0.0;
    EXPECT_EQ(SyncExporter::timelineLength(r), 0);

    r.streams.clear();
    r.frameRate = 24.0;
    EXPECT_EQ(SyncExporter::timelineLength(r), 0);
}

TEST_F(SyncExporterTest, RejectsBadRequestsBeforeStarting) {
    std::vector<ExportRequest> bad(6, request());
    bad[0].trimStart = 5;
    bad[0].trimEnd = 4;
    bad[1].frameRate = 0.0;
    bad[2].trimEnd = 24;
    bad[3].offsets = {0};
    bad[4].offsets = {3, 5};
    bad[5].streams.clear();
    bad[5].offsets.clear();

    for (size_t i = 0; i < bad.size(); ++i) {
        auto job = exporter->exportSyncedVideos(bad[i]);
        ASSERT_FALSE(job.ok()) << i;
        EXPECT_EQ(job.error().code(), ErrorCode::InvalidExportRequest) << i;
    }

    EXPECT_TRUE(log->snapshot().empty());
    EXPECT_EQ(exporter->status(), ExportStatus::Idle);
    EXPECT_EQ(exporter->currentJob(), 0u);
    EXPECT_FALSE(exporter->isRunning());
    EXPECT_TRUE(media->sinks().empty());
}

TEST_F(SyncExporterTest, EmptyRequestMessage) {
    ExportRequest r;
    r.frameRate = 24.0;
    auto job = exporter->exportSyncedImageSequence(r);
    ASSERT_FALSE(job.ok());
    EXPECT_EQ(job.error().message(), "No videos to export.");
}

TEST_F(SyncExporterTest, RejectsCollidingOutputs) {
    // Same stem: distinct videos, same image-sequence directory
    auto mov = makeStream("/videos/a.mov", 24, 24);
    media->addStream(mov);

    ExportRequest r = request();
    r.streams = {reference, mov};
    r.offsets = {0, 0};

    auto sequence = exporter->exportSyncedImageSequence(r);
    ASSERT_FALSE(sequence.ok());
    EXPECT_EQ(sequence.error().code(), ErrorCode::InvalidExportRequest);

    auto video = exporter->exportSyncedVideos(r);
    ASSERT_TRUE(video.ok()) << video.error().what();
}

// ---------------------------------------------------------------------------
// Pad policy
// ---------------------------------------------------------------------------

TEST_F(SyncExporterTest, VideoPadsWithBlankFrames) {
    auto job = exporter->exportSyncedVideos(request());
    ASSERT_TRUE(job.ok()) << job.error().what();
    exporter->waitForIdle();

    EXPECT_EQ(exporter->status(), ExportStatus::Succeeded);
    EXPECT_EQ(exporter->lastMessage(), "Export complete!");

    auto a = sinkFor("/videos/synced/a.mp4");
    EXPECT_EQ(a.mode, media::ExportMode::Video);
    EXPECT_EQ(a.outputIndices, range(0, 9));
    EXPECT_EQ(a.sourceFrames, range(0, 9));
    EXPECT_TRUE(a.closed);

    auto b = sinkFor("/videos/synced/b.mp4");
    EXPECT_EQ(b.outputIndices, range(0, 9));
    EXPECT_EQ(b.sourceFrames, concat(range(5, 11), blanks(3)));
    EXPECT_TRUE(b.closed);

    // Past the end of b nothing is decoded
    EXPECT_EQ(media->requests("/videos/b.mp4"), range(5, 11));
}

TEST_F(SyncExporterTest, NegativeOffsetPadsTheStart) {
    ExportRequest r = request();
    r.offsets = {0, -3};

    ASSERT_TRUE(exporter->exportSyncedVideos(r).ok());
    exporter->waitForIdle();

    auto b = sinkFor("/videos/synced/b.mp4");
    EXPECT_EQ(b.sourceFrames, concat(blanks(3), range(0, 6)));
}

TEST_F(SyncExporterTest, SequenceSkipsMissingFrames) {
    ASSERT_TRUE(exporter->exportSyncedImageSequence(request()).ok());
    exporter->waitForIdle();
    ASSERT_EQ(exporter->status(), ExportStatus::Succeeded);

    auto a = sinkFor("/videos/a");
    EXPECT_EQ(a.mode, media::ExportMode::ImageSequence);
    EXPECT_EQ(a.outputIndices, range(0, 9));

    auto b = sinkFor("/videos/b");
    EXPECT_EQ(b.outputIndices, range(0, 6));
    EXPECT_EQ(b.sourceFrames, range(5, 11));
}

TEST_F(SyncExporterTest, ReportsProgressThenFinishes) {
    ASSERT_TRUE(exporter->exportSyncedVideos(request()).ok());
    exporter->waitForIdle();

    auto events = log->snapshot();
    ASSERT_EQ(events.size(), 22u);
    EXPECT_EQ(events.front(), "started");
    EXPECT_EQ(events.back(), "finished");
    for (size_t i = 1; i + 1 < events.size(); ++i) {
        EXPECT_EQ(events[i], "progress");
    }

    std::lock_guard lock(log->mutex);
    EXPECT_EQ(log->lastDone, 20);
    EXPECT_EQ(log->lastTotal, 20);
    EXPECT_TRUE(log->success);
    EXPECT_TRUE(log->sinksClosedAtFinish);
    EXPECT_EQ(log->finishCount, 1);
}

// ---------------------------------------------------------------------------
// ClampToOverlap policy
// ---------------------------------------------------------------------------

TEST_F(SyncExporterTest, OverlapNarrowsTheRange) {
    ASSERT_TRUE(exporter->exportSyncedVideos(request(BoundaryPolicy::ClampToOverlap)).ok());
    exporter->waitForIdle();
    ASSERT_EQ(exporter->status(), ExportStatus::Succeeded);

    auto a = sinkFor("/videos/synced/a.mp4");
    EXPECT_EQ(a.outputIndices, range(0, 6));
    EXPECT_EQ(a.sourceFrames, range(0, 6));

    auto b = sinkFor("/videos/synced/b.mp4");
    EXPECT_EQ(b.sourceFrames, range(5, 11));

    std::lock_guard lock(log->mutex);
    EXPECT_EQ(log->lastTotal, 14);
}

TEST_F(SyncExporterTest, NoOverlapFails) {
    ExportRequest r = request(BoundaryPolicy::ClampToOverlap);
    r.offsets = {0, 20};

    ASSERT_TRUE(exporter->exportSyncedVideos(r).ok());
    exporter->waitForIdle();

    EXPECT_EQ(exporter->status(), ExportStatus::Failed);
    EXPECT_EQ(exporter->lastMessage(),
              "No overlapping frames to export. Check video offsets and trim range.");
    EXPECT_TRUE(media->sinks().empty());

    std::lock_guard lock(log->mutex);
    EXPECT_FALSE(log->success);
    EXPECT_EQ(log->finishCount, 1);
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------

TEST_F(SyncExporterTest, DecodeFailureAbortsTheJob) {
    media->failFrame("/videos/b.mp4", 8);

    ASSERT_TRUE(exporter->exportSyncedVideos(request()).ok());
    exporter->waitForIdle();

    EXPECT_EQ(exporter->status(), ExportStatus::Failed);
    EXPECT_EQ(exporter->lastMessage().rfind("An error occurred during export: ", 0), 0u);

    auto b = sinkFor("/videos/synced/b.mp4");
    EXPECT_EQ(b.sourceFrames, range(5, 7));
    EXPECT_TRUE(b.closed);

    std::lock_guard lock(log->mutex);
    EXPECT_FALSE(log->success);
    EXPECT_TRUE(log->sinksClosedAtFinish);
    EXPECT_EQ(log->message, exporter->lastMessage());
}

TEST_F(SyncExporterTest, MissingInputFails) {
    ExportRequest r = request();
    r.streams[1] = makeStream("/videos/missing.mp4", 12, 24);

    ASSERT_TRUE(exporter->exportSyncedVideos(r).ok());
    exporter->waitForIdle();

    EXPECT_EQ(exporter->status(), ExportStatus::Failed);
    EXPECT_NE(exporter->lastMessage().find("missing.mp4"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Single flight
// ---------------------------------------------------------------------------

TEST_F(SyncExporterTest, SecondExportIsBusy) {
    media->holdDecodes();

    auto first = exporter->exportSyncedVideos(request());
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(exporter->isRunning());
    EXPECT_EQ(exporter->status(), ExportStatus::Running);

    auto second = exporter->exportSyncedImageSequence(request());
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error().code(), ErrorCode::ExportBusy);

    // Busy wins over validation
    ExportRequest broken = request();
    broken.frameRate = -1.0;
    auto third = exporter->exportSyncedVideos(broken);
    ASSERT_FALSE(third.ok());
    EXPECT_EQ(third.error().code(), ErrorCode::ExportBusy);

    media->release();
    exporter->waitForIdle();

    EXPECT_EQ(exporter->status(), ExportStatus::Succeeded);
    EXPECT_EQ(exporter->currentJob(), first.value());
    EXPECT_EQ(media->sinks().size(), 2u);

    std::lock_guard lock(log->mutex);
    EXPECT_EQ(log->finishCount, 1);
}

TEST_F(SyncExporterTest, JobsRunBackToBack) {
    auto first = exporter->exportSyncedVideos(request());
    ASSERT_TRUE(first.ok());
    exporter->waitForIdle();

    auto second = exporter->exportSyncedImageSequence(request());
    ASSERT_TRUE(second.ok());
    exporter->waitForIdle();

    EXPECT_EQ(second.value(), first.value() + 1);
    EXPECT_EQ(media->sinks().size(), 4u);

    std::lock_guard lock(log->mutex);
    EXPECT_EQ(log->finishCount, 2);
}

TEST_F(SyncExporterTest, AcceptHookRunsOnlyForAcceptedJobs) {
    int accepted = 0;
    size_t eventsSeenByHook = 99;
    auto hook = [&]() {
        ++accepted;
        eventsSeenByHook = log->snapshot().size();
    };

    ExportRequest broken = request();
    broken.trimEnd = 24;
    auto rejected = exporter->start(engine::ExportMode::Video, broken, hook);
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(accepted, 0);

    media->holdDecodes();
    auto job = exporter->start(engine::ExportMode::Video, request(), hook);
    ASSERT_TRUE(job.ok());
    EXPECT_EQ(accepted, 1);
    EXPECT_EQ(eventsSeenByHook, 0u);

    auto busy = exporter->start(engine::ExportMode::ImageSequence, request(), hook);
    ASSERT_FALSE(busy.ok());
    EXPECT_EQ(busy.error().code(), ErrorCode::ExportBusy);
    EXPECT_EQ(accepted, 1);

    media->release();
    exporter->waitForIdle();
    EXPECT_EQ(exporter->status(), ExportStatus::Succeeded);
}
