/**
 * @file export_progress_reporter.hpp
 * @brief Ordered export notifications
 */

#pragma once

#include <reelsync/core/types.hpp>
#include <reelsync/core/signals.hpp>
#include <mutex>
#include <string>

namespace reelsync::engine {

/**
 * @brief Relays export events to observers in a fixed order
 *
 * Per job: exactly one started, any number of progress, exactly one
 * finished. Calls arriving out of that order are logged and dropped,
 * so observers never see a second finished or a late progress.
 */
class ExportProgressReporter {
public:
    ExportProgressReporter() = default;

    ExportProgressReporter(const ExportProgressReporter&) = delete;
    ExportProgressReporter& operator=(const ExportProgressReporter&) = delete;

    /// @return false (dropped) while a job is still open
    bool started();

    /// @return false (dropped) outside an open job
    bool progress(FrameIndex done, FrameIndex total);

    /// @return false (dropped) outside an open job
    bool finished(bool success, const std::string& message);

    /// Between started() and finished()
    [[nodiscard]] bool isActive() const;

    // ========== Signals ==========

    VoidSignal exportStarted;
    Signal<FrameIndex, FrameIndex> exportProgress;
    Signal<bool, std::string> exportFinished;

private:
    enum class Phase { Idle, Started, Finished };

    mutable std::mutex m_mutex;
    Phase m_phase = Phase::Idle;
};

} // namespace reelsync::engine
