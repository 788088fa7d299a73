// Limits and timeouts of the orchestration core.
// Sources, later wins: built-in defaults, a QSettings store, environment.
#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <string>

class QSettings;

namespace mirrorcore {

struct CoreConfig {
    // Concurrency caps per bucket; 0 = unlimited.
    std::size_t queueAll = 0;
    std::size_t queueDownload = 0;
    std::size_t queueUpload = 0;

    // Threads for short native calls (login, resolve, logout).
    int workerThreads = 4;
    // Threads for long transfers, kept apart so running transfers never
    // hold up another task's handshake.
    int transferThreads = 8;

    // Handshake-style bridge calls.
    std::chrono::milliseconds loginTimeout{30000};
    std::chrono::milliseconds resolveTimeout{15000};
    int handshakeAttempts = 3;
    double timeoutEscalation = 2.0;
    std::chrono::milliseconds logoutTimeout{10000};

    // Status board polling period.
    std::chrono::milliseconds statusInterval{2000};

    // Overrides fields present in the settings store:
    //   Queue/all, Queue/download, Queue/upload, Workers/threads,
    //   Workers/transferThreads,
    //   Bridge/loginTimeoutMs, Bridge/resolveTimeoutMs,
    //   Bridge/handshakeAttempts, Bridge/timeoutEscalation,
    //   Bridge/logoutTimeoutMs, Status/intervalMs
    // Returns false (err set) for values that do not parse.
    bool loadSettings(const QSettings &s, std::string &err);

    // Environment overrides: MIRRORCORE_QUEUE_ALL, MIRRORCORE_QUEUE_DOWNLOAD,
    // MIRRORCORE_QUEUE_UPLOAD, MIRRORCORE_WORKER_THREADS,
    // MIRRORCORE_TRANSFER_THREADS,
    // MIRRORCORE_LOGIN_TIMEOUT_MS, MIRRORCORE_RESOLVE_TIMEOUT_MS,
    // MIRRORCORE_HANDSHAKE_ATTEMPTS, MIRRORCORE_TIMEOUT_ESCALATION,
    // MIRRORCORE_LOGOUT_TIMEOUT_MS, MIRRORCORE_STATUS_INTERVAL_MS.
    bool loadEnvironment(std::string &err);

    bool validate(std::string &err) const;

    // Caps in the form AdmissionController expects.
    std::map<std::string, std::size_t> bucketCaps() const;

    // Defaults, then the INI file at iniPath (skipped when empty), then the
    // environment; validated.
    static bool load(const std::string &iniPath, CoreConfig &out,
                     std::string &err);
};

} // namespace mirrorcore
