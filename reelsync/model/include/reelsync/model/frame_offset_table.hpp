/**
 * @file frame_offset_table.hpp
 * @brief Per-stream frame offsets relative to the reference stream
 */

#pragma once

#include <reelsync/core/result.hpp>
#include <reelsync/core/signals.hpp>
#include <reelsync/core/settings.hpp>
#include <vector>
#include <mutex>

namespace reelsync::model {

/**
 * @brief Owned offset state with change notification
 *
 * Entry 0 belongs to the reference stream and is always 0.
 * A stream's local frame is globalFrame + offset.
 *
 * Thread-safe; offsetChanged fires outside the lock on the
 * caller's thread.
 */
class FrameOffsetTable {
public:
    explicit FrameOffsetTable(int maxOffset = kDefaultMaxOffset);

    FrameOffsetTable(const FrameOffsetTable&) = delete;
    FrameOffsetTable& operator=(const FrameOffsetTable&) = delete;

    /**
     * @brief Replace one offset
     *
     * @param streamIndex Non-reference stream, 1 <= streamIndex < size()
     * @param value Offset in frames, |value| <= maxOffset()
     * @return RangeError without any state change when out of domain
     */
    Result<void, Error> setOffset(int streamIndex, int value);

    /// 0 for the reference stream and for unknown indices
    [[nodiscard]] int get(int streamIndex) const;

    [[nodiscard]] std::vector<int> values() const;

    /// Clear every offset and size the table for a new stream set
    void resize(int streamCount);

    [[nodiscard]] int size() const;
    [[nodiscard]] int maxOffset() const { return m_maxOffset; }

    // ========== Signals ==========

    /// (streamIndex, newValue), only for actual changes
    Signal<int, int> offsetChanged;

    /// Table cleared by resize()
    Signal<int> reset;

private:
    const int m_maxOffset;
    mutable std::mutex m_mutex;
    std::vector<int> m_offsets;
};

} // namespace reelsync::model
