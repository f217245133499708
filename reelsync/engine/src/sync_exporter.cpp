/**
 * @file sync_exporter.cpp
 * @brief SyncExporter implementation
 */

#include <reelsync/engine/sync_exporter.hpp>
#include <reelsync/core/logger.hpp>

#include <algorithm>
#include <cmath>
#include <set>

namespace reelsync::engine {

namespace {

const char* kNoOverlapMessage =
    "No overlapping frames to export. Check video offsets and trim range.";
const char* kSuccessMessage = "Export complete!";
const char* kFailurePrefix = "An error occurred during export: ";

Error invalid(const std::string& message) {
    return Error(ErrorCode::InvalidExportRequest, message);
}

} // anonymous namespace

SyncExporter::SyncExporter(media::StreamDecoderFactory decoderFactory,
                           media::FrameSinkFactory sinkFactory)
    : m_decoderFactory(std::move(decoderFactory))
    , m_sinkFactory(std::move(sinkFactory)) {}

SyncExporter::~SyncExporter() {
    waitForIdle();
    if (m_worker.joinable()) {
        if (m_worker.get_id() == std::this_thread::get_id()) {
            m_worker.detach();
        } else {
            m_worker.join();
        }
    }
}

// ============================================================================
// Jobs
// ============================================================================

Result<JobId, Error> SyncExporter::exportSyncedVideos(ExportRequest request) {
    return start(ExportMode::Video, std::move(request));
}

Result<JobId, Error> SyncExporter::exportSyncedImageSequence(ExportRequest request) {
    return start(ExportMode::ImageSequence, std::move(request));
}

Result<JobId, Error> SyncExporter::start(ExportMode mode, ExportRequest request,
                                        const std::function<void()>& onAccepted) {
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        LOG_WARN("Export request rejected: another export is running");
        return Error(ErrorCode::ExportBusy, "An export is already running");
    }

    auto valid = validate(mode, request);
    if (!valid.ok()) {
        {
            std::lock_guard lock(m_mutex);
            m_running = false;
        }
        m_idleCv.notify_all();
        LOG_WARN("Export request rejected: {}", valid.error().what());
        return valid.error();
    }

    if (onAccepted) {
        onAccepted();
    }

    Job job;
    job.mode = mode;
    job.request = std::move(request);

    std::thread previous;
    {
        std::lock_guard lock(m_mutex);
        previous = std::move(m_worker);
        job.id = ++m_lastJobId;
        m_status = ExportStatus::Running;
        m_lastMessage.clear();
    }
    if (previous.joinable()) {
        if (previous.get_id() == std::this_thread::get_id()) {
            previous.detach();
        } else {
            previous.join();
        }
    }

    LOG_INFO("Export job {} ({}): {} stream(s), frames [{}, {}] at {} fps, policy {}",
             job.id, media::exportModeName(mode), job.request.streams.size(),
             job.request.trimStart, job.request.trimEnd, job.request.frameRate,
             boundaryPolicyName(job.request.policy));

    const JobId id = job.id;
    m_reporter.started();

    std::lock_guard lock(m_mutex);
    m_worker = std::thread([this, job = std::move(job)]() mutable { run(std::move(job)); });
    return id;
}

FrameIndex SyncExporter::timelineLength(const ExportRequest& request) {
    if (request.streams.empty() || !(request.frameRate > 0.0)) {
        return 0;
    }
    return static_cast<FrameIndex>(std::llround(
        request.streams.front().durationMs() / 1000.0 * request.frameRate));
}

Result<void, Error> SyncExporter::validate(ExportMode mode, const ExportRequest& request) {
    if (!(request.frameRate > 0.0)) {
        return invalid("Frame rate must be positive");
    }
    if (request.streams.empty()) {
        return invalid("No videos to export.");
    }
    if (request.offsets.size() != request.streams.size()) {
        return invalid("Expected " + std::to_string(request.streams.size()) +
                       " offsets, got " + std::to_string(request.offsets.size()));
    }
    if (request.offsets.front() != 0) {
        return invalid("The reference stream cannot be offset");
    }

    const FrameIndex total = timelineLength(request);
    if (request.trimStart < 0 || request.trimStart > request.trimEnd ||
        request.trimEnd >= total) {
        return invalid("Trim range [" + std::to_string(request.trimStart) + ", " +
                       std::to_string(request.trimEnd) + "] outside [0, " +
                       std::to_string(total) + ")");
    }

    std::set<std::filesystem::path> outputs;
    for (const auto& stream : request.streams) {
        auto location = media::outputLocation(mode, stream.path, request.outputDirectory);
        if (!outputs.insert(location).second) {
            return invalid("Two streams would write to " + location.string());
        }
    }

    return Ok();
}

void SyncExporter::waitForIdle() {
    std::unique_lock lock(m_mutex);
    m_idleCv.wait(lock, [this]() { return !m_running.load(); });
}

// ============================================================================
// State
// ============================================================================

ExportStatus SyncExporter::status() const {
    std::lock_guard lock(m_mutex);
    return m_status;
}

JobId SyncExporter::currentJob() const {
    std::lock_guard lock(m_mutex);
    return m_lastJobId;
}

std::string SyncExporter::lastMessage() const {
    std::lock_guard lock(m_mutex);
    return m_lastMessage;
}

// ============================================================================
// Worker
// ============================================================================

void SyncExporter::run(Job job) {
    const ExportRequest& request = job.request;
    FrameIndex start = request.trimStart;
    FrameIndex end = request.trimEnd;

    try {
        if (request.policy == BoundaryPolicy::ClampToOverlap) {
            for (size_t i = 0; i < request.streams.size(); ++i) {
                auto range = ContentRange::of(request.streams[i], request.offsets[i]);
                start = std::max(start, range.firstContent);
                end = std::min(end, range.lastContent);
            }
            if (start > end) {
                complete(job.id, false, kNoOverlapMessage);
                return;
            }
            LOG_DEBUG("Job {}: overlap narrows the range to [{}, {}]", job.id, start, end);
        }

        auto result = runStreams(job, start, end);
        if (!result.ok()) {
            complete(job.id, false, kFailurePrefix + std::string(result.error().what()));
            return;
        }
        complete(job.id, true, kSuccessMessage);
    } catch (const std::exception& e) {
        complete(job.id, false, kFailurePrefix + std::string(e.what()));
    }
}

Result<void, Error> SyncExporter::runStreams(const Job& job, FrameIndex start, FrameIndex end) {
    const ExportRequest& request = job.request;
    const FrameIndex length = end - start + 1;
    const FrameIndex totalWork = length * static_cast<FrameIndex>(request.streams.size());
    const Rational rate = Rational::fromFrameRate(request.frameRate);
    FrameIndex done = 0;

    for (size_t i = 0; i < request.streams.size(); ++i) {
        const media::StreamInfo& stream = request.streams[i];
        const int offset = request.offsets[i];
        const auto content = ContentRange::of(stream, offset);

        auto decoder = m_decoderFactory(stream.path);
        if (!decoder.ok()) {
            return decoder.error().withContext("Failed to open " + stream.path.string());
        }

        media::SinkRequest sinkRequest;
        sinkRequest.mode = job.mode;
        sinkRequest.source = stream;
        sinkRequest.location = media::outputLocation(job.mode, stream.path, request.outputDirectory);
        sinkRequest.frameRate = rate;

        auto sink = m_sinkFactory(sinkRequest);
        if (!sink.ok()) {
            return sink.error().withContext("Failed to create " + sinkRequest.location.string());
        }

        LOG_INFO("Exporting {} (offset {}) -> {}", stream.path.string(), offset,
                 sinkRequest.location.string());

        media::FrameSink& out = *sink.value();
        for (FrameIndex global = start; global <= end; ++global) {
            Result<void, Error> written;

            if (content.contains(global)) {
                const FrameIndex local = global + offset;
                auto frame = decoder.value()->decodeFrame(local);
                if (!frame.ok()) {
                    auto closed = out.close();
                    if (!closed.ok()) {
                        LOG_WARN("Closing {} after a failure: {}",
                                 out.location().string(), closed.error().what());
                    }
                    return Error(ErrorCode::DecodeFailure,
                                 "Failed to decode frame " + std::to_string(local) + " of " +
                                 stream.path.filename().string() + ": " + frame.error().what());
                }
                written = out.writeFrame(frame.value(), global);
            } else if (job.mode == ExportMode::Video) {
                written = out.writeBlank(global);
            }

            if (!written.ok()) {
                auto closed = out.close();
                if (!closed.ok()) {
                    LOG_WARN("Closing {} after a failure: {}",
                             out.location().string(), closed.error().what());
                }
                return Error(written.error().code(), "Failed to write frame " +
                             std::to_string(global) + " to " + out.location().string() +
                             ": " + written.error().what());
            }

            m_reporter.progress(++done, totalWork);
        }

        auto closed = out.close();
        if (!closed.ok()) {
            return closed.error().withContext("Failed to finalize " + out.location().string());
        }
        LOG_INFO("Exported {} frame(s) of {}", out.framesWritten(), stream.path.string());
    }

    return Ok();
}

void SyncExporter::complete(JobId id, bool success, const std::string& message) {
    {
        std::lock_guard lock(m_mutex);
        m_status = success ? ExportStatus::Succeeded : ExportStatus::Failed;
        m_lastMessage = message;
    }

    if (success) {
        LOG_INFO("Export job {} finished: {}", id, message);
    } else {
        LOG_ERROR("Export job {} failed: {}", id, message);
    }

    m_reporter.finished(success, message);

    {
        std::lock_guard lock(m_mutex);
        m_running = false;
    }
    m_idleCv.notify_all();
}

} // namespace reelsync::engine
