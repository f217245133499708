#include <reelsync/engine/export_types.hpp>
#include <algorithm>
#include <cctype>

namespace reelsync::engine {

const char* boundaryPolicyName(BoundaryPolicy policy) {
    switch (policy) {
        case BoundaryPolicy::Pad: return "pad";
        case BoundaryPolicy::ClampToOverlap: return "overlap";
        default: return "unknown";
    }
}

Result<BoundaryPolicy, Error> parseBoundaryPolicy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return std::tolower(c); });

    if (lower == "pad") {
        return BoundaryPolicy::Pad;
    }
    if (lower == "overlap" || lower == "clamp") {
        return BoundaryPolicy::ClampToOverlap;
    }
    return Error(ErrorCode::InvalidArgument, "Unknown boundary policy: " + name);
}

} // namespace reelsync::engine
