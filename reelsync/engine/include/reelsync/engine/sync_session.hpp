/**
 * @file sync_session.hpp
 * @brief Presentation-facing facade over one set of loaded streams
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/result.hpp>
#include <reelsync/core/settings.hpp>
#include <reelsync/core/signals.hpp>
#include <reelsync/media/stream_decoder.hpp>
#include <reelsync/media/frame_sink.hpp>
#include <reelsync/model/frame_offset_table.hpp>
#include <reelsync/model/timeline_model.hpp>
#include <reelsync/engine/playback_clock.hpp>
#include <reelsync/engine/sync_exporter.hpp>

#include <filesystem>
#include <mutex>
#include <vector>

namespace reelsync::engine {

/**
 * @brief Owns offsets, timeline, playback and export for one session
 *
 * Components are reachable for signal subscription:
 * clock().frameUpdated, exporter().reporter().exportFinished, ...
 *
 * Usage:
 * @code
 *   SyncSession session(media::ffmpegDecoderFactory(),
 *                       media::ffmpegSinkFactory(settings.exporting), settings);
 *   session.loadStreams({"a.mp4", "b.mp4"});
 *   session.setFrameOffset(1, 5);
 *   session.exportSyncedVideos();
 * @endcode
 */
class SyncSession {
public:
    SyncSession(media::StreamDecoderFactory decoderFactory,
                media::FrameSinkFactory sinkFactory,
                const ReelSyncSettings& settings = {});
    ~SyncSession();

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;

    // ========== Streams ==========

    /**
     * @brief Open every path and make it the new stream set
     *
     * Offsets, trim range and position reset; frame 0 is presented.
     * On failure the previous stream set stays loaded.
     */
    Result<void, Error> loadStreams(const std::vector<std::filesystem::path>& paths);

    void unloadStreams();

    // ========== Editing ==========

    /// RangeError as FrameOffsetTable::setOffset; re-presents when stopped
    Result<void, Error> setFrameOffset(int streamIndex, int value);

    Result<void, Error> setTrimRange(FrameIndex start, FrameIndex end);

    /// Override the timeline frame rate (defaults to the reference stream's)
    void setFrameRate(double fps);

    // ========== Playback ==========

    void seek(FrameIndex frame);
    void togglePlayPause();
    void play();
    void pause();

    // ========== Export ==========

    /**
     * @brief Export the loaded streams with the session's offsets,
     *        frame rate and trim range
     *
     * Pauses playback first; playback stays disabled until the job
     * finishes.
     */
    Result<JobId, Error> exportSyncedVideos();
    Result<JobId, Error> exportSyncedImageSequence();

    /**
     * @brief Export explicit parameters
     *
     * Paths that are not loaded are probed through the decoder factory.
     */
    Result<JobId, Error> exportSyncedVideos(const std::vector<std::filesystem::path>& paths,
                                            std::vector<int> offsets, double frameRate,
                                            FrameIndex trimStart, FrameIndex trimEnd);
    Result<JobId, Error> exportSyncedImageSequence(const std::vector<std::filesystem::path>& paths,
                                                   std::vector<int> offsets, double frameRate,
                                                   FrameIndex trimStart, FrameIndex trimEnd);

    // ========== State ==========

    [[nodiscard]] FrameIndex currentFrame() const { return m_clock.position(); }
    [[nodiscard]] FrameIndex totalFrames() const { return m_timeline.totalFrames(); }
    [[nodiscard]] bool isPlaying() const { return m_clock.isPlaying(); }
    [[nodiscard]] std::vector<int> frameOffsets() const { return m_offsets.values(); }
    [[nodiscard]] bool videosLoaded() const;
    [[nodiscard]] int videoCount() const { return m_timeline.streamCount(); }

    /// Native frame rate of a stream, 0 for unknown indices
    [[nodiscard]] double frameRate(int streamIndex) const;

    /// Timeline frame rate
    [[nodiscard]] double timelineFrameRate() const { return m_timeline.frameRate(); }

    [[nodiscard]] model::TrimRange trimRange() const { return m_timeline.trimRange(); }
    [[nodiscard]] std::vector<std::filesystem::path> paths() const;

    [[nodiscard]] bool canPlay() const { return m_clock.canPlay(); }
    [[nodiscard]] bool canExport() const;

    /// Side-by-side size of all streams: summed widths (max 1920) x tallest height
    [[nodiscard]] Size preferredViewSize() const;

    // ========== Components ==========

    model::FrameOffsetTable& offsets() { return m_offsets; }
    model::TimelineModel& timeline() { return m_timeline; }
    PlaybackClock& clock() { return m_clock; }
    SyncExporter& exporter() { return m_exporter; }

    // ========== Signals ==========

    Signal<bool> videosLoadedChanged;

private:
    Result<JobId, Error> startExport(ExportMode mode, ExportRequest request);
    Result<ExportRequest, Error> buildRequest(const std::vector<std::filesystem::path>& paths,
                                              std::vector<int> offsets, double frameRate,
                                              FrameIndex trimStart, FrameIndex trimEnd) const;
    ExportRequest sessionRequest() const;

    media::StreamDecoderFactory m_decoderFactory;
    ReelSyncSettings m_settings;

    model::FrameOffsetTable m_offsets;
    model::TimelineModel m_timeline;
    PlaybackClock m_clock;
    SyncExporter m_exporter;

    mutable std::mutex m_mutex;
    std::vector<std::filesystem::path> m_paths;

    ScopedConnection m_offsetConnection;
    ScopedConnection m_finishedConnection;
};

} // namespace reelsync::engine
