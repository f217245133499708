/**
 * @file playback_clock.cpp
 * @brief PlaybackClock implementation
 */

#include <reelsync/engine/playback_clock.hpp>
#include <reelsync/core/logger.hpp>

#include <algorithm>
#include <cmath>
#include <future>
#include <utility>

namespace reelsync::engine {

namespace {

Microseconds tickInterval(double fps) {
    if (fps <= 0.0) {
        return Microseconds(33333);
    }
    return Microseconds(std::llround(static_cast<double>(kTimeBaseUs) / fps));
}

} // anonymous namespace

PlaybackClock::PlaybackClock(model::TimelineModel& timeline, bool parallelDecode)
    : m_timeline(timeline)
    , m_parallelDecode(parallelDecode) {
    m_totalConnection = m_timeline.totalFramesChanged.connectScoped(
        [this](FrameIndex total) { onTotalFramesChanged(total); });
}

PlaybackClock::~PlaybackClock() {
    m_totalConnection.disconnect();
    {
        std::lock_guard lock(m_mutex);
        m_stopping = true;
        m_state = PlaybackState::Stopped;
    }
    m_cv.notify_all();
    joinThread();
}

// ============================================================================
// Streams
// ============================================================================

void PlaybackClock::setDecoders(std::vector<media::StreamDecoderPtr> decoders) {
    bool wasPlaying = false;
    {
        std::lock_guard lock(m_mutex);
        wasPlaying = m_state == PlaybackState::Playing;
        m_state = PlaybackState::Stopped;
    }
    m_cv.notify_all();
    joinThread();

    const int count = static_cast<int>(decoders.size());
    {
        std::lock_guard presentLock(m_presentMutex);
        m_decoders = std::move(decoders);
    }
    {
        std::lock_guard lock(m_mutex);
        m_streamCount = count;
        m_position = 0;
        m_presentedFrame = kNoFrame;
        m_pendingSeek = false;
        m_dirty = true;
        ++m_generation;
    }

    LOG_DEBUG("Playback clock now drives {} stream(s)", count);

    if (wasPlaying) {
        stateChanged.fire(PlaybackState::Stopped);
    }
    positionChanged.fire(0);
}

void PlaybackClock::clearDecoders() {
    setDecoders({});
}

int PlaybackClock::streamCount() const {
    std::lock_guard lock(m_mutex);
    return m_streamCount;
}

// ============================================================================
// Transport Controls
// ============================================================================

void PlaybackClock::play() {
    std::thread previous;
    bool restarted = false;
    {
        std::lock_guard lock(m_mutex);
        if (m_state == PlaybackState::Playing) return;
        if (!canPlayLocked()) {
            LOG_DEBUG("Play ignored: playback unavailable");
            return;
        }

        const FrameIndex total = m_timeline.totalFrames();
        if (m_position >= total - 1) {
            restarted = m_position != 0;
            m_position = 0;
        }
        m_pendingSeek = m_dirty || m_presentedFrame != m_position;
        m_state = PlaybackState::Playing;

        // A slot on the tick thread restarting playback keeps the running loop
        const bool onTickThread = m_thread.joinable() &&
                                  m_thread.get_id() == std::this_thread::get_id();
        if (!onTickThread) {
            previous = std::move(m_thread);
            const uint64_t runId = ++m_runId;
            m_thread = std::thread([this, runId]() { playbackLoop(runId); });
        }
    }

    if (previous.joinable()) {
        previous.join();
    }

    if (restarted) {
        positionChanged.fire(0);
    }
    stateChanged.fire(PlaybackState::Playing);
}

void PlaybackClock::pause() {
    {
        std::lock_guard lock(m_mutex);
        if (m_state != PlaybackState::Playing) return;
        m_state = PlaybackState::Stopped;
    }
    m_cv.notify_all();
    stateChanged.fire(PlaybackState::Stopped);
}

void PlaybackClock::togglePlayPause() {
    if (isPlaying()) {
        pause();
    } else {
        play();
    }
}

void PlaybackClock::seek(FrameIndex frame) {
    const FrameIndex total = m_timeline.totalFrames();
    if (total <= 0) {
        return;
    }
    const FrameIndex target = std::clamp<FrameIndex>(frame, 0, total - 1);

    bool moved = false;
    bool playing = false;
    {
        std::lock_guard lock(m_mutex);
        moved = target != m_position;
        m_position = target;
        playing = m_state == PlaybackState::Playing;
        if (playing && (moved || m_dirty)) {
            m_pendingSeek = true;
        }
    }

    if (moved) {
        positionChanged.fire(target);
    }
    if (!playing) {
        present(target);
    }
}

void PlaybackClock::invalidate() {
    std::lock_guard lock(m_mutex);
    m_dirty = true;
    ++m_generation;
}

void PlaybackClock::refresh() {
    FrameIndex frame = 0;
    {
        std::lock_guard lock(m_mutex);
        if (m_state == PlaybackState::Playing || !m_dirty) return;
        frame = m_position;
    }
    if (m_timeline.totalFrames() <= 0) {
        return;
    }
    present(frame);
}

void PlaybackClock::setExportActive(bool active) {
    {
        std::lock_guard lock(m_mutex);
        m_exportActive = active;
    }
    if (active) {
        pause();
    }
}

// ============================================================================
// State Queries
// ============================================================================

bool PlaybackClock::canPlay() const {
    std::lock_guard lock(m_mutex);
    return canPlayLocked();
}

bool PlaybackClock::canPlayLocked() const {
    return !m_exportActive && m_streamCount > 0 &&
           m_timeline.frameRate() > 0.0 && m_timeline.totalFrames() > 0;
}

PlaybackState PlaybackClock::state() const {
    std::lock_guard lock(m_mutex);
    return m_state;
}

FrameIndex PlaybackClock::position() const {
    std::lock_guard lock(m_mutex);
    return m_position;
}

PlaybackSnapshot PlaybackClock::snapshot() const {
    std::lock_guard lock(m_mutex);
    return {m_position, m_state == PlaybackState::Playing};
}

// ============================================================================
// Tick Loop
// ============================================================================

void PlaybackClock::playbackLoop(uint64_t runId) {
    TimePoint deadline;
    {
        std::lock_guard lock(m_mutex);
        deadline = m_pendingSeek ? Clock::now()
                                 : Clock::now() + tickInterval(m_timeline.frameRate());
    }

    while (true) {
        FrameIndex frame = 0;
        bool advanced = false;
        bool ended = false;
        {
            std::unique_lock lock(m_mutex);
            auto stopRequested = [this, runId]() {
                return m_stopping || m_state != PlaybackState::Playing || m_runId != runId;
            };
            m_cv.wait_until(lock, deadline, stopRequested);
            if (stopRequested()) break;

            if (!m_pendingSeek) {
                if (m_position + 1 >= m_timeline.totalFrames()) {
                    m_state = PlaybackState::Stopped;
                    ended = true;
                } else {
                    ++m_position;
                    advanced = true;
                }
            }
            m_pendingSeek = false;
            frame = m_position;
        }

        if (!ended) {
            if (advanced) {
                positionChanged.fire(frame);
            }
            present(frame);

            std::lock_guard lock(m_mutex);
            if (m_runId == runId && m_state == PlaybackState::Playing && !m_pendingSeek &&
                m_position >= m_timeline.totalFrames() - 1) {
                m_state = PlaybackState::Stopped;
                ended = true;
            }
        }

        deadline += tickInterval(m_timeline.frameRate());
        const auto now = Clock::now();
        if (deadline < now) {
            deadline = now;
        }

        if (ended) {
            LOG_DEBUG("Playback reached the last frame ({})", frame);
            stateChanged.fire(PlaybackState::Stopped);
            playbackEnded.fire();
        }
    }
}

void PlaybackClock::present(FrameIndex frame) {
    {
        std::lock_guard lock(m_mutex);
        if (m_presentingThread == std::this_thread::get_id()) {
            // Re-entered from a frameUpdated slot; the outer call presents it next
            m_deferredFrame = frame;
            return;
        }
    }

    std::lock_guard presentLock(m_presentMutex);
    {
        std::lock_guard lock(m_mutex);
        m_presentingThread = std::this_thread::get_id();
    }

    FrameIndex next = frame;
    while (next != kNoFrame) {
        presentLocked(next);
        std::lock_guard lock(m_mutex);
        next = std::exchange(m_deferredFrame, kNoFrame);
    }

    std::lock_guard lock(m_mutex);
    m_presentingThread = std::thread::id();
}

void PlaybackClock::presentLocked(FrameIndex frame) {
    uint64_t generation = 0;
    {
        std::lock_guard lock(m_mutex);
        if (!m_dirty && m_presentedFrame == frame) {
            return;
        }
        generation = m_generation;
    }

    const int count = static_cast<int>(m_decoders.size());
    if (count == 0) {
        return;
    }

    const std::vector<bool> visible = m_timeline.visibility(frame);
    std::vector<FrameIndex> locals(count, kNoFrame);
    std::vector<bool> inBounds(count, false);
    int visibleCount = 0;
    for (int i = 0; i < count; ++i) {
        locals[i] = m_timeline.localFrame(i, frame);
        inBounds[i] = i < static_cast<int>(visible.size()) && visible[i];
        if (inBounds[i]) ++visibleCount;
    }

    std::vector<FramePtr> frames(count);
    std::vector<std::future<FramePtr>> pending(count);
    const bool parallel = m_parallelDecode && visibleCount > 1;

    for (int i = 0; i < count; ++i) {
        if (!inBounds[i]) continue;
        if (parallel) {
            pending[i] = std::async(std::launch::async,
                [this, i, local = locals[i]]() { return decodeStream(i, local); });
        } else {
            frames[i] = decodeStream(i, locals[i]);
        }
    }

    // Barrier: every stream of this tick is done before anything is shown
    for (int i = 0; i < count; ++i) {
        if (pending[i].valid()) {
            frames[i] = pending[i].get();
        }
    }

    {
        std::lock_guard lock(m_mutex);
        m_presentedFrame = frame;
        if (m_generation == generation) {
            m_dirty = false;
        }
    }

    for (int i = 0; i < count; ++i) {
        frameUpdated.fire(i, locals[i], frames[i]);
    }
}

PlaybackClock::FramePtr PlaybackClock::decodeStream(int streamIndex, FrameIndex localFrame) {
    media::StreamDecoder* decoder = m_decoders[streamIndex].get();
    if (!decoder) {
        return nullptr;
    }

    try {
        auto result = decoder->decodeFrame(localFrame);
        if (!result.ok()) {
            LOG_WARN("Stream {}: frame {} unavailable: {}", streamIndex, localFrame,
                     result.error().what());
            return nullptr;
        }
        return std::make_shared<const media::VideoFrame>(std::move(result).value());
    } catch (const std::exception& e) {
        LOG_WARN("Stream {}: decoding frame {} threw: {}", streamIndex, localFrame, e.what());
        return nullptr;
    }
}

void PlaybackClock::joinThread() {
    if (!m_thread.joinable()) {
        return;
    }
    if (m_thread.get_id() == std::this_thread::get_id()) {
        // Called from a slot on the tick thread; the loop exits on its own
        m_thread.detach();
        return;
    }
    m_thread.join();
}

void PlaybackClock::onTotalFramesChanged(FrameIndex total) {
    bool moved = false;
    bool stopped = false;
    FrameIndex position = 0;
    {
        std::lock_guard lock(m_mutex);
        const FrameIndex clamped = total > 0 ? std::clamp<FrameIndex>(m_position, 0, total - 1) : 0;
        moved = clamped != m_position;
        m_position = clamped;
        position = clamped;
        m_dirty = true;
        ++m_generation;
        if (total <= 0 && m_state == PlaybackState::Playing) {
            m_state = PlaybackState::Stopped;
            stopped = true;
        }
    }

    if (stopped) {
        m_cv.notify_all();
        stateChanged.fire(PlaybackState::Stopped);
    }
    if (moved) {
        positionChanged.fire(position);
    }
}

} // namespace reelsync::engine
