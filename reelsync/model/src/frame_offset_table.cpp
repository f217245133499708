#include <reelsync/model/frame_offset_table.hpp>
#include <reelsync/core/logger.hpp>
#include <cstdlib>
#include <string>

namespace reelsync::model {

FrameOffsetTable::FrameOffsetTable(int maxOffset)
    : m_maxOffset(maxOffset < 0 ? kDefaultMaxOffset : maxOffset) {}

Result<void, Error> FrameOffsetTable::setOffset(int streamIndex, int value) {
    {
        std::lock_guard lock(m_mutex);

        if (streamIndex == 0) {
            return Error(ErrorCode::RangeError, "The reference stream cannot be offset");
        }
        if (streamIndex < 0 || streamIndex >= static_cast<int>(m_offsets.size())) {
            return Error(ErrorCode::RangeError,
                         "No stream at index " + std::to_string(streamIndex));
        }
        if (std::abs(value) > m_maxOffset) {
            return Error(ErrorCode::RangeError,
                         "Offset " + std::to_string(value) + " outside [-" +
                         std::to_string(m_maxOffset) + ", " + std::to_string(m_maxOffset) + "]");
        }

        if (m_offsets[streamIndex] == value) {
            return Ok();
        }
        m_offsets[streamIndex] = value;
    }

    LOG_DEBUG("Offset of stream {} set to {}", streamIndex, value);
    offsetChanged.fire(streamIndex, value);
    return Ok();
}

int FrameOffsetTable::get(int streamIndex) const {
    std::lock_guard lock(m_mutex);
    if (streamIndex < 0 || streamIndex >= static_cast<int>(m_offsets.size())) {
        return 0;
    }
    return m_offsets[streamIndex];
}

std::vector<int> FrameOffsetTable::values() const {
    std::lock_guard lock(m_mutex);
    return m_offsets;
}

void FrameOffsetTable::resize(int streamCount) {
    {
        std::lock_guard lock(m_mutex);
        m_offsets.assign(streamCount > 0 ? streamCount : 0, 0);
    }
    reset.fire(streamCount);
}

int FrameOffsetTable::size() const {
    std::lock_guard lock(m_mutex);
    return static_cast<int>(m_offsets.size());
}

} // namespace reelsync::model
