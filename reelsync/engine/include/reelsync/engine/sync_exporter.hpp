/**
 * @file sync_exporter.hpp
 * @brief Offset-corrected multi-stream export
 *
 * Every stream is written over the same global frame range, so all
 * outputs line up frame for frame. One job runs at a time on a worker
 * thread with its own decoders.
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/result.hpp>
#include <reelsync/media/stream_decoder.hpp>
#include <reelsync/media/frame_sink.hpp>
#include <reelsync/engine/export_types.hpp>
#include <reelsync/engine/export_progress_reporter.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace reelsync::engine {

/**
 * @brief Export job runner
 *
 * Usage:
 * @code
 *   SyncExporter exporter(media::ffmpegDecoderFactory(), media::ffmpegSinkFactory(settings));
 *   (void)exporter.reporter().exportFinished.connect([](bool ok, const std::string& msg) { ... });
 *   auto job = exporter.exportSyncedVideos(request);
 *   if (!job) { ... rejected synchronously ... }
 * @endcode
 */
class SyncExporter {
public:
    SyncExporter(media::StreamDecoderFactory decoderFactory,
                 media::FrameSinkFactory sinkFactory);

    /// Waits for a running job
    ~SyncExporter();

    SyncExporter(const SyncExporter&) = delete;
    SyncExporter& operator=(const SyncExporter&) = delete;

    // ========== Jobs ==========

    /**
     * @brief Write one re-encoded video per stream
     *
     * @return Job id, ExportBusy while another job runs, or
     *         InvalidExportRequest. A rejected request writes nothing
     *         and fires no event.
     */
    Result<JobId, Error> exportSyncedVideos(ExportRequest request);

    /// Write one numbered image per frame per stream
    Result<JobId, Error> exportSyncedImageSequence(ExportRequest request);

    /**
     * @brief Start a job in either mode
     *
     * @param onAccepted Runs on the calling thread once the request has
     *        passed the busy check and validation, before any event
     *        fires. Not called for a rejected request.
     */
    Result<JobId, Error> start(ExportMode mode, ExportRequest request,
                               const std::function<void()>& onAccepted = {});

    /**
     * @brief Check a request without running it
     *
     * frameRate > 0, at least one stream, one offset per stream,
     * 0 <= trimStart <= trimEnd < totalFrames, distinct outputs.
     */
    static Result<void, Error> validate(ExportMode mode, const ExportRequest& request);

    /// Timeline length implied by a request (reference duration x frame rate)
    static FrameIndex timelineLength(const ExportRequest& request);

    /// Block until no job is running
    void waitForIdle();

    // ========== State ==========

    [[nodiscard]] ExportStatus status() const;
    [[nodiscard]] bool isRunning() const { return m_running.load(); }
    [[nodiscard]] JobId currentJob() const;

    /// Terminal message of the last finished job
    [[nodiscard]] std::string lastMessage() const;

    /// Started / progress / finished events
    ExportProgressReporter& reporter() { return m_reporter; }

private:
    struct Job {
        JobId id = 0;
        ExportMode mode = ExportMode::Video;
        ExportRequest request;
    };

    void run(Job job);
    Result<void, Error> runStreams(const Job& job, FrameIndex start, FrameIndex end);
    void complete(JobId id, bool success, const std::string& message);

    media::StreamDecoderFactory m_decoderFactory;
    media::FrameSinkFactory m_sinkFactory;
    ExportProgressReporter m_reporter;

    std::atomic<bool> m_running{false};
    mutable std::mutex m_mutex;
    std::condition_variable m_idleCv;
    ExportStatus m_status = ExportStatus::Idle;
    JobId m_lastJobId = 0;
    std::string m_lastMessage;
    std::thread m_worker;
};

} // namespace reelsync::engine
