/**
 * @file playback_clock.hpp
 * @brief Coordinated playback of all streams under one clock
 *
 * One coordinating thread ticks at 1 / frameRate. Every tick issues a
 * decode-or-skip instruction per stream at that stream's local frame;
 * the decodes of one tick run in parallel and all finish before the
 * position advances.
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/signals.hpp>
#include <reelsync/media/frame.hpp>
#include <reelsync/media/stream_decoder.hpp>
#include <reelsync/model/timeline_model.hpp>

#include <memory>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>

namespace reelsync::engine {

enum class PlaybackState {
    Stopped,    ///< Paused, at the end, or never started
    Playing,    ///< Tick thread is advancing the position
};

struct PlaybackSnapshot {
    FrameIndex position = 0;
    bool playing = false;
};

/**
 * @brief Playback clock and tick coordinator
 *
 * Owns the playback position and the playback decoders. Reaching the
 * last frame stops playback (no looping).
 *
 * Usage:
 * @code
 *   PlaybackClock clock(timeline);
 *   clock.setDecoders(std::move(decoders));
 *   (void)clock.frameUpdated.connect([](int stream, FrameIndex local, auto frame) {
 *       view.show(stream, frame);   // null frame = placeholder
 *   });
 *   clock.seek(0);
 *   clock.play();
 * @endcode
 */
class PlaybackClock {
public:
    using FramePtr = std::shared_ptr<const media::VideoFrame>;

    /**
     * @param timeline Frame mapping and length, must outlive the clock
     * @param parallelDecode Decode the streams of one tick concurrently
     */
    explicit PlaybackClock(model::TimelineModel& timeline, bool parallelDecode = true);
    ~PlaybackClock();

    PlaybackClock(const PlaybackClock&) = delete;
    PlaybackClock& operator=(const PlaybackClock&) = delete;

    // ========== Streams ==========

    /**
     * @brief Replace the playback decoders (index = stream index)
     *
     * Stops playback and resets the position to 0. Nothing is
     * presented until the next seek or play.
     */
    void setDecoders(std::vector<media::StreamDecoderPtr> decoders);

    void clearDecoders();

    // ========== Transport Controls ==========

    /// Start playing; from the last frame playback restarts at 0
    void play();

    void pause();

    void togglePlayPause();

    /**
     * @brief Move the playback position
     *
     * Clamps into [0, totalFrames). Stopped: presents the frame
     * before returning. Playing: the next tick presents it.
     * Seeking to the frame already on screen decodes nothing.
     */
    void seek(FrameIndex frame);

    /// Mark the presented frame stale (offsets or streams changed)
    void invalidate();

    /// Re-present the current position when stopped and stale
    void refresh();

    /// While an export runs playback is paused and play() is refused
    void setExportActive(bool active);

    // ========== State Queries ==========

    [[nodiscard]] bool canPlay() const;
    [[nodiscard]] PlaybackState state() const;
    [[nodiscard]] bool isPlaying() const { return state() == PlaybackState::Playing; }
    [[nodiscard]] FrameIndex position() const;
    [[nodiscard]] PlaybackSnapshot snapshot() const;
    [[nodiscard]] int streamCount() const;

    // ========== Signals ==========

    /// (streamIndex, localFrame, frame); null frame when out of bounds or undecodable
    Signal<int, FrameIndex, FramePtr> frameUpdated;
    Signal<FrameIndex> positionChanged;
    Signal<PlaybackState> stateChanged;
    VoidSignal playbackEnded;

private:
    bool canPlayLocked() const;
    void playbackLoop(uint64_t runId);
    void present(FrameIndex frame);
    void presentLocked(FrameIndex frame);
    FramePtr decodeStream(int streamIndex, FrameIndex localFrame);
    void joinThread();
    void onTotalFramesChanged(FrameIndex total);

    model::TimelineModel& m_timeline;
    const bool m_parallelDecode;
    ScopedConnection m_totalConnection;

    // Decoders; only touched while holding m_presentMutex
    std::vector<media::StreamDecoderPtr> m_decoders;
    std::mutex m_presentMutex;

    // Playback state; guarded by m_mutex
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    PlaybackState m_state = PlaybackState::Stopped;
    FrameIndex m_position = 0;
    FrameIndex m_presentedFrame = kNoFrame;
    bool m_pendingSeek = false;
    bool m_dirty = true;
    bool m_exportActive = false;
    bool m_stopping = false;
    int m_streamCount = 0;
    uint64_t m_generation = 0;
    uint64_t m_runId = 0;

    // Thread inside present(); a nested present() from a slot is deferred
    std::thread::id m_presentingThread;
    FrameIndex m_deferredFrame = kNoFrame;

    std::thread m_thread;
};

} // namespace reelsync::engine
