#include <reelsync/engine/export_progress_reporter.hpp>
#include <reelsync/core/logger.hpp>

namespace reelsync::engine {

bool ExportProgressReporter::started() {
    {
        std::lock_guard lock(m_mutex);
        if (m_phase == Phase::Started) {
            LOG_WARN("Export started twice; dropping the second notification");
            return false;
        }
        m_phase = Phase::Started;
    }
    exportStarted.fire();
    return true;
}

bool ExportProgressReporter::progress(FrameIndex done, FrameIndex total) {
    {
        std::lock_guard lock(m_mutex);
        if (m_phase != Phase::Started) {
            LOG_WARN("Export progress {}/{} outside a running export; dropped", done, total);
            return false;
        }
    }
    exportProgress.fire(done, total);
    return true;
}

bool ExportProgressReporter::finished(bool success, const std::string& message) {
    {
        std::lock_guard lock(m_mutex);
        if (m_phase != Phase::Started) {
            LOG_WARN("Export finished ({}) outside a running export; dropped", message);
            return false;
        }
        m_phase = Phase::Finished;
    }
    exportFinished.fire(success, message);
    return true;
}

bool ExportProgressReporter::isActive() const {
    std::lock_guard lock(m_mutex);
    return m_phase == Phase::Started;
}

} // namespace reelsync::engine
