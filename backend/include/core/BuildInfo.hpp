#pragma once

#include <string>

namespace punchsync::buildinfo {

inline std::string version() {
#ifdef PUNCHSYNC_VERSION
    return std::string(PUNCHSYNC_VERSION);
#else
    return "0.0.0";
#endif
}

inline std::string git_commit() {
#ifdef PUNCHSYNC_GIT_COMMIT
    return std::string(PUNCHSYNC_GIT_COMMIT);
#else
    return "unknown";
#endif
}

inline std::string build_time_utc_approx() {
    // Not truly UTC, but stable and available without runtime deps.
    return std::string(__DATE__) + " " + std::string(__TIME__);
}

} // namespace punchsync::buildinfo
