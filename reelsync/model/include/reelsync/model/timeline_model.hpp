/**
 * @file timeline_model.hpp
 * @brief Unified timeline over offset streams
 *
 * The timeline is the reference stream's duration sampled at the
 * timeline frame rate. Every other stream is mapped onto it through
 * its offset: local = global + offset.
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/result.hpp>
#include <reelsync/core/signals.hpp>
#include <reelsync/media/stream_info.hpp>
#include <reelsync/model/frame_offset_table.hpp>
#include <reelsync/model/trim_range.hpp>
#include <vector>
#include <mutex>

namespace reelsync::model {

class TimelineModel {
public:
    /// The offset table must outlive the model
    explicit TimelineModel(FrameOffsetTable& offsets);
    ~TimelineModel();

    TimelineModel(const TimelineModel&) = delete;
    TimelineModel& operator=(const TimelineModel&) = delete;

    // ========== Streams and Rate ==========

    /**
     * @brief Replace the stream set
     *
     * Recomputes totalFrames and resets the trim range. Does not
     * touch the offset table; callers resize it.
     */
    void setStreams(std::vector<media::StreamInfo> streams);

    /// Timeline frame rate; <= 0 puts the timeline in the not-ready state
    void setFrameRate(double fps);

    [[nodiscard]] double frameRate() const;
    [[nodiscard]] int streamCount() const;
    [[nodiscard]] std::vector<media::StreamInfo> streams() const;

    /// Native frame count of a stream, 0 for unknown indices
    [[nodiscard]] FrameIndex nativeFrameCount(int streamIndex) const;

    // ========== Frame Mapping ==========

    /**
     * @brief round(referenceDurationMs / 1000 * frameRate)
     *
     * 0 when frameRate <= 0 or no reference stream is loaded.
     */
    [[nodiscard]] FrameIndex totalFrames() const;

    [[nodiscard]] bool isReady() const { return totalFrames() > 0; }

    /// globalFrame + offset[streamIndex]
    [[nodiscard]] FrameIndex localFrame(int streamIndex, FrameIndex globalFrame) const;

    /**
     * @brief Whether a stream has no content at a global frame
     *
     * Local frame < 0 or >= native frame count. The reference
     * stream only checks the lower bound.
     */
    [[nodiscard]] bool isOutOfBounds(int streamIndex, FrameIndex globalFrame) const;

    /// In-bounds flag per stream, cached for the last queried frame
    [[nodiscard]] std::vector<bool> visibility(FrameIndex globalFrame) const;

    /// Clamp into [0, totalFrames); 0 when not ready
    [[nodiscard]] FrameIndex clampFrame(FrameIndex frame) const;

    // ========== Trim ==========

    [[nodiscard]] TrimRange trimRange() const;

    /**
     * @brief Select the export range (inclusive)
     * @return RangeError when start > end, start < 0 or end >= totalFrames
     */
    Result<void, Error> setTrimRange(FrameIndex start, FrameIndex end);

    void resetTrimRange();

    // ========== Signals ==========

    Signal<FrameIndex> totalFramesChanged;
    Signal<TrimRange> trimRangeChanged;

private:
    FrameIndex computeTotalFrames() const;
    bool outOfBoundsLocked(int streamIndex, FrameIndex globalFrame) const;
    void invalidateVisibility();
    void recompute();

    FrameOffsetTable& m_offsets;
    ScopedConnection m_offsetConnection;
    ScopedConnection m_resetConnection;

    mutable std::mutex m_mutex;
    std::vector<media::StreamInfo> m_streams;
    double m_frameRate = 0.0;
    FrameIndex m_totalFrames = 0;
    TrimRange m_trim;

    mutable FrameIndex m_visibilityFrame = kNoFrame;
    mutable std::vector<bool> m_visibility;
};

} // namespace reelsync::model
