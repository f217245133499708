/**
 * @file timeline_model.cpp
 * @brief TimelineModel implementation
 */

#include <reelsync/model/timeline_model.hpp>
#include <reelsync/core/logger.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace reelsync::model {

TimelineModel::TimelineModel(FrameOffsetTable& offsets)
    : m_offsets(offsets) {
    m_offsetConnection = m_offsets.offsetChanged.connectScoped(
        [this](int, int) { invalidateVisibility(); });
    m_resetConnection = m_offsets.reset.connectScoped(
        [this](int) { invalidateVisibility(); });
}

TimelineModel::~TimelineModel() = default;

// ============================================================================
// Streams and Rate
// ============================================================================

void TimelineModel::setStreams(std::vector<media::StreamInfo> streams) {
    {
        std::lock_guard lock(m_mutex);
        m_streams = std::move(streams);
        m_visibilityFrame = kNoFrame;
    }
    recompute();
}

void TimelineModel::setFrameRate(double fps) {
    {
        std::lock_guard lock(m_mutex);
        m_frameRate = fps;
        m_visibilityFrame = kNoFrame;
    }
    recompute();
}

double TimelineModel::frameRate() const {
    std::lock_guard lock(m_mutex);
    return m_frameRate;
}

int TimelineModel::streamCount() const {
    std::lock_guard lock(m_mutex);
    return static_cast<int>(m_streams.size());
}

std::vector<media::StreamInfo> TimelineModel::streams() const {
    std::lock_guard lock(m_mutex);
    return m_streams;
}

FrameIndex TimelineModel::nativeFrameCount(int streamIndex) const {
    std::lock_guard lock(m_mutex);
    if (streamIndex < 0 || streamIndex >= static_cast<int>(m_streams.size())) {
        return 0;
    }
    return m_streams[streamIndex].frameCount;
}

void TimelineModel::recompute() {
    FrameIndex oldTotal = 0;
    FrameIndex newTotal = 0;
    TrimRange oldTrim;
    TrimRange newTrim;
    {
        std::lock_guard lock(m_mutex);
        oldTotal = m_totalFrames;
        oldTrim = m_trim;
        m_totalFrames = computeTotalFrames();
        m_trim = TrimRange::full(m_totalFrames);
        newTotal = m_totalFrames;
        newTrim = m_trim;
    }

    if (newTotal != oldTotal) {
        LOG_DEBUG("Timeline length {} -> {} frames", oldTotal, newTotal);
        totalFramesChanged.fire(newTotal);
    }
    if (newTrim != oldTrim) {
        trimRangeChanged.fire(newTrim);
    }
}

FrameIndex TimelineModel::computeTotalFrames() const {
    if (m_frameRate <= 0.0 || m_streams.empty()) {
        return 0;
    }
    const double durationMs = m_streams.front().durationMs();
    if (durationMs <= 0.0) {
        return 0;
    }
    return static_cast<FrameIndex>(std::llround(durationMs / 1000.0 * m_frameRate));
}

// ============================================================================
// Frame Mapping
// ============================================================================

FrameIndex TimelineModel::totalFrames() const {
    std::lock_guard lock(m_mutex);
    return m_totalFrames;
}

FrameIndex TimelineModel::localFrame(int streamIndex, FrameIndex globalFrame) const {
    return globalFrame + m_offsets.get(streamIndex);
}

bool TimelineModel::isOutOfBounds(int streamIndex, FrameIndex globalFrame) const {
    std::lock_guard lock(m_mutex);
    return outOfBoundsLocked(streamIndex, globalFrame);
}

bool TimelineModel::outOfBoundsLocked(int streamIndex, FrameIndex globalFrame) const {
    if (streamIndex < 0 || streamIndex >= static_cast<int>(m_streams.size())) {
        return true;
    }
    const FrameIndex local = localFrame(streamIndex, globalFrame);
    if (local < 0) {
        return true;
    }
    if (streamIndex == 0) {
        return false;
    }
    return local >= m_streams[streamIndex].frameCount;
}

std::vector<bool> TimelineModel::visibility(FrameIndex globalFrame) const {
    std::lock_guard lock(m_mutex);
    if (m_visibilityFrame == globalFrame && m_visibility.size() == m_streams.size()) {
        return m_visibility;
    }

    m_visibility.assign(m_streams.size(), false);
    for (size_t i = 0; i < m_streams.size(); ++i) {
        m_visibility[i] = !outOfBoundsLocked(static_cast<int>(i), globalFrame);
    }
    m_visibilityFrame = globalFrame;
    return m_visibility;
}

void TimelineModel::invalidateVisibility() {
    std::lock_guard lock(m_mutex);
    m_visibilityFrame = kNoFrame;
}

FrameIndex TimelineModel::clampFrame(FrameIndex frame) const {
    std::lock_guard lock(m_mutex);
    if (m_totalFrames <= 0) {
        return 0;
    }
    return std::clamp<FrameIndex>(frame, 0, m_totalFrames - 1);
}

// ============================================================================
// Trim
// ============================================================================

TrimRange TimelineModel::trimRange() const {
    std::lock_guard lock(m_mutex);
    return m_trim;
}

Result<void, Error> TimelineModel::setTrimRange(FrameIndex start, FrameIndex end) {
    TrimRange updated{start, end};
    {
        std::lock_guard lock(m_mutex);
        if (start < 0 || start > end || end >= m_totalFrames) {
            return Error(ErrorCode::RangeError,
                         "Trim range [" + std::to_string(start) + ", " + std::to_string(end) +
                         "] outside [0, " + std::to_string(m_totalFrames) + ")");
        }
        if (m_trim == updated) {
            return Ok();
        }
        m_trim = updated;
    }

    trimRangeChanged.fire(updated);
    return Ok();
}

void TimelineModel::resetTrimRange() {
    TrimRange updated;
    {
        std::lock_guard lock(m_mutex);
        updated = TrimRange::full(m_totalFrames);
        if (m_trim == updated) {
            return;
        }
        m_trim = updated;
    }
    trimRangeChanged.fire(updated);
}

} // namespace reelsync::model
