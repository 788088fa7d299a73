// Logging policy: redaction of sensitive fields (hosts, user names, source
// links) and the Qt category rules for the mirrorcore.* categories.
#pragma once
#include <string>

namespace mirrorcore {

struct LoggingPolicy {
    // MIRRORCORE_ENV is dev, development, local or debug
    bool devEnvironment = false;
    // dev environment and MIRRORCORE_LOG_SENSITIVE enabled
    bool sensitive = false;
    // MIRRORCORE_LOG_DEBUG enabled
    bool debugCategories = false;

    static LoggingPolicy fromEnvironment();
};

// Read from the environment on first use.
const LoggingPolicy &loggingPolicy();

inline bool sensitiveLoggingEnabled() { return loggingPolicy().sensitive; }

// Value to log for a sensitive field.
std::string sensitive(const std::string &value);

// Turns on mirrorcore.*.debug when requested; Qt's rules are left alone
// otherwise. Safe to call more than once.
void applyLoggingRules();

} // namespace mirrorcore
