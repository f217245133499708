/**
 * @file sync_session.cpp
 * @brief SyncSession implementation
 */

#include <reelsync/engine/sync_session.hpp>
#include <reelsync/core/logger.hpp>

#include <algorithm>

namespace reelsync::engine {

namespace {

constexpr int kMaxViewWidth = 1920;

} // anonymous namespace

SyncSession::SyncSession(media::StreamDecoderFactory decoderFactory,
                         media::FrameSinkFactory sinkFactory,
                         const ReelSyncSettings& settings)
    : m_decoderFactory(decoderFactory)
    , m_settings(settings)
    , m_offsets(settings.timeline.maxOffset)
    , m_timeline(m_offsets)
    , m_clock(m_timeline, settings.playback.parallelDecode)
    , m_exporter(std::move(decoderFactory), std::move(sinkFactory)) {

    m_offsetConnection = m_offsets.offsetChanged.connectScoped([this](int, int) {
        m_clock.invalidate();
        m_clock.refresh();
    });

    m_finishedConnection = m_exporter.reporter().exportFinished.connectScoped(
        [this](bool, const std::string&) { m_clock.setExportActive(false); });
}

SyncSession::~SyncSession() {
    m_finishedConnection.disconnect();
    m_offsetConnection.disconnect();
    m_exporter.waitForIdle();
}

// ============================================================================
// Streams
// ============================================================================

Result<void, Error> SyncSession::loadStreams(const std::vector<std::filesystem::path>& paths) {
    if (paths.empty()) {
        return Error(ErrorCode::InvalidArgument, "No videos to load");
    }
    if (m_exporter.isRunning()) {
        return Error(ErrorCode::NotReady, "Cannot load videos while an export is running");
    }

    std::vector<media::StreamDecoderPtr> decoders;
    std::vector<media::StreamInfo> infos;
    decoders.reserve(paths.size());
    infos.reserve(paths.size());

    for (const auto& path : paths) {
        auto decoder = m_decoderFactory(path);
        if (!decoder.ok()) {
            auto error = decoder.error().withContext("Error opening video " + path.string());
            LOG_ERROR("{}", error.what());
            return error;
        }
        infos.push_back(decoder.value()->info());
        decoders.push_back(std::move(decoder.value()));
    }

    const bool wasLoaded = videosLoaded();

    m_clock.pause();
    m_offsets.resize(static_cast<int>(paths.size()));
    m_clock.setDecoders(std::move(decoders));
    m_timeline.setStreams(infos);
    m_timeline.setFrameRate(infos.front().fps());
    {
        std::lock_guard lock(m_mutex);
        m_paths = paths;
    }

    LOG_INFO("Loaded {} video(s), {} frames at {:.3f} fps", paths.size(),
             m_timeline.totalFrames(), m_timeline.frameRate());

    m_clock.seek(0);
    if (!wasLoaded) {
        videosLoadedChanged.fire(true);
    }
    return Ok();
}

void SyncSession::unloadStreams() {
    const bool wasLoaded = videosLoaded();

    m_clock.pause();
    m_clock.clearDecoders();
    m_offsets.resize(0);
    m_timeline.setStreams({});
    {
        std::lock_guard lock(m_mutex);
        m_paths.clear();
    }

    if (wasLoaded) {
        videosLoadedChanged.fire(false);
    }
}

bool SyncSession::videosLoaded() const {
    std::lock_guard lock(m_mutex);
    return !m_paths.empty();
}

std::vector<std::filesystem::path> SyncSession::paths() const {
    std::lock_guard lock(m_mutex);
    return m_paths;
}

double SyncSession::frameRate(int streamIndex) const {
    auto streams = m_timeline.streams();
    if (streamIndex < 0 || streamIndex >= static_cast<int>(streams.size())) {
        return 0.0;
    }
    return streams[streamIndex].fps();
}

Size SyncSession::preferredViewSize() const {
    Size size;
    for (const auto& stream : m_timeline.streams()) {
        size.width += stream.resolution.width;
        size.height = std::max(size.height, stream.resolution.height);
    }
    size.width = std::min(size.width, kMaxViewWidth);
    return size;
}

// ============================================================================
// Editing
// ============================================================================

Result<void, Error> SyncSession::setFrameOffset(int streamIndex, int value) {
    auto result = m_offsets.setOffset(streamIndex, value);
    if (!result.ok()) {
        LOG_WARN("setFrameOffset({}, {}) rejected: {}", streamIndex, value, result.error().what());
    }
    return result;
}

Result<void, Error> SyncSession::setTrimRange(FrameIndex start, FrameIndex end) {
    return m_timeline.setTrimRange(start, end);
}

void SyncSession::setFrameRate(double fps) {
    m_timeline.setFrameRate(fps);
    m_clock.invalidate();
    m_clock.refresh();
}

// ============================================================================
// Playback
// ============================================================================

void SyncSession::seek(FrameIndex frame) {
    m_clock.seek(frame);
}

void SyncSession::togglePlayPause() {
    m_clock.togglePlayPause();
}

void SyncSession::play() {
    m_clock.play();
}

void SyncSession::pause() {
    m_clock.pause();
}

// ============================================================================
// Export
// ============================================================================

bool SyncSession::canExport() const {
    return videosLoaded() && m_timeline.frameRate() > 0.0 &&
           m_timeline.totalFrames() > 0 && !m_exporter.isRunning();
}

ExportRequest SyncSession::sessionRequest() const {
    ExportRequest request;
    request.streams = m_timeline.streams();
    request.offsets = m_offsets.values();
    request.frameRate = m_timeline.frameRate();
    const auto trim = m_timeline.trimRange();
    request.trimStart = trim.start;
    request.trimEnd = trim.end;
    return request;
}

Result<ExportRequest, Error> SyncSession::buildRequest(
    const std::vector<std::filesystem::path>& paths, std::vector<int> offsets,
    double frameRate, FrameIndex trimStart, FrameIndex trimEnd) const
{
    const auto loaded = m_timeline.streams();

    ExportRequest request;
    request.offsets = std::move(offsets);
    request.frameRate = frameRate;
    request.trimStart = trimStart;
    request.trimEnd = trimEnd;

    for (const auto& path : paths) {
        auto it = std::find_if(loaded.begin(), loaded.end(),
            [&path](const media::StreamInfo& info) { return info.path == path; });
        if (it != loaded.end()) {
            request.streams.push_back(*it);
            continue;
        }

        auto decoder = m_decoderFactory(path);
        if (!decoder.ok()) {
            return Error(ErrorCode::InvalidExportRequest,
                         "Cannot open " + path.string() + ": " + decoder.error().what());
        }
        request.streams.push_back(decoder.value()->info());
    }
    return request;
}

Result<JobId, Error> SyncSession::startExport(ExportMode mode, ExportRequest request) {
    if (m_exporter.isRunning()) {
        return Error(ErrorCode::ExportBusy, "An export is already running");
    }

    auto policy = parseBoundaryPolicy(m_settings.exporting.boundaryPolicy);
    if (!policy.ok()) {
        LOG_WARN("{}; using pad", policy.error().what());
    }
    request.policy = policy.valueOr(BoundaryPolicy::Pad);
    request.outputDirectory = m_settings.exporting.outputDirectory;

    // Playback and export never contend for decoders; only an accepted job pauses
    return m_exporter.start(mode, std::move(request),
                            [this]() { m_clock.setExportActive(true); });
}

Result<JobId, Error> SyncSession::exportSyncedVideos() {
    return startExport(ExportMode::Video, sessionRequest());
}

Result<JobId, Error> SyncSession::exportSyncedImageSequence() {
    return startExport(ExportMode::ImageSequence, sessionRequest());
}

Result<JobId, Error> SyncSession::exportSyncedVideos(
    const std::vector<std::filesystem::path>& paths, std::vector<int> offsets,
    double frameRate, FrameIndex trimStart, FrameIndex trimEnd)
{
    auto request = buildRequest(paths, std::move(offsets), frameRate, trimStart, trimEnd);
    if (!request.ok()) {
        return request.error();
    }
    return startExport(ExportMode::Video, std::move(request).value());
}

Result<JobId, Error> SyncSession::exportSyncedImageSequence(
    const std::vector<std::filesystem::path>& paths, std::vector<int> offsets,
    double frameRate, FrameIndex trimStart, FrameIndex trimEnd)
{
    auto request = buildRequest(paths, std::move(offsets), frameRate, trimStart, trimEnd);
    if (!request.ok()) {
        return request.error();
    }
    return startExport(ExportMode::ImageSequence, std::move(request).value());
}

} // namespace reelsync::engine
