#include "mirrorcore/CoreConfig.hpp"
#include "mirrorcore/RuntimeLogging.hpp"
#include "mirrorcore/TaskTypes.hpp"
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <cstdlib>
Q_LOGGING_CATEGORY(mcConfig, "mirrorcore.config")

namespace mirrorcore {

namespace {

bool parseCount(const QString &raw, const char *key, std::size_t &out,
                std::string &err) {
    bool ok = false;
    const qulonglong v = raw.trimmed().toULongLong(&ok);
    if (!ok) {
        err = std::string("Invalid value for ") + key + ": " +
              raw.toStdString();
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

bool parseInt(const QString &raw, const char *key, int &out,
              std::string &err) {
    bool ok = false;
    const int v = raw.trimmed().toInt(&ok);
    if (!ok) {
        err = std::string("Invalid value for ") + key + ": " +
              raw.toStdString();
        return false;
    }
    out = v;
    return true;
}

bool parseMillis(const QString &raw, const char *key,
                 std::chrono::milliseconds &out, std::string &err) {
    bool ok = false;
    const qlonglong v = raw.trimmed().toLongLong(&ok);
    if (!ok) {
        err = std::string("Invalid value for ") + key + ": " +
              raw.toStdString();
        return false;
    }
    out = std::chrono::milliseconds(v);
    return true;
}

bool parseDouble(const QString &raw, const char *key, double &out,
                 std::string &err) {
    bool ok = false;
    const double v = raw.trimmed().toDouble(&ok);
    if (!ok) {
        err = std::string("Invalid value for ") + key + ": " +
              raw.toStdString();
        return false;
    }
    out = v;
    return true;
}

// Raw environment value; the variable is considered unset when empty.
QString envValue(const char *name) {
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    return QString::fromLocal8Bit(raw);
}

} // namespace

bool CoreConfig::loadSettings(const QSettings &s, std::string &err) {
    auto has = [&s](const char *key) { return s.contains(key); };
    auto str = [&s](const char *key) { return s.value(key).toString(); };

    if (has("Queue/all") && !parseCount(str("Queue/all"), "Queue/all",
                                        queueAll, err))
        return false;
    if (has("Queue/download") &&
        !parseCount(str("Queue/download"), "Queue/download", queueDownload,
                    err))
        return false;
    if (has("Queue/upload") &&
        !parseCount(str("Queue/upload"), "Queue/upload", queueUpload, err))
        return false;
    if (has("Workers/threads") &&
        !parseInt(str("Workers/threads"), "Workers/threads", workerThreads,
                  err))
        return false;
    if (has("Workers/transferThreads") &&
        !parseInt(str("Workers/transferThreads"), "Workers/transferThreads",
                  transferThreads, err))
        return false;
    if (has("Bridge/loginTimeoutMs") &&
        !parseMillis(str("Bridge/loginTimeoutMs"), "Bridge/loginTimeoutMs",
                     loginTimeout, err))
        return false;
    if (has("Bridge/resolveTimeoutMs") &&
        !parseMillis(str("Bridge/resolveTimeoutMs"),
                     "Bridge/resolveTimeoutMs", resolveTimeout, err))
        return false;
    if (has("Bridge/handshakeAttempts") &&
        !parseInt(str("Bridge/handshakeAttempts"), "Bridge/handshakeAttempts",
                  handshakeAttempts, err))
        return false;
    if (has("Bridge/timeoutEscalation") &&
        !parseDouble(str("Bridge/timeoutEscalation"),
                     "Bridge/timeoutEscalation", timeoutEscalation, err))
        return false;
    if (has("Bridge/logoutTimeoutMs") &&
        !parseMillis(str("Bridge/logoutTimeoutMs"), "Bridge/logoutTimeoutMs",
                     logoutTimeout, err))
        return false;
    if (has("Status/intervalMs") &&
        !parseMillis(str("Status/intervalMs"), "Status/intervalMs",
                     statusInterval, err))
        return false;
    return true;
}

bool CoreConfig::loadEnvironment(std::string &err) {
    QString v;
    if (!(v = envValue("MIRRORCORE_QUEUE_ALL")).isEmpty() &&
        !parseCount(v, "MIRRORCORE_QUEUE_ALL", queueAll, err))
        return false;
    if (!(v = envValue("MIRRORCORE_QUEUE_DOWNLOAD")).isEmpty() &&
        !parseCount(v, "MIRRORCORE_QUEUE_DOWNLOAD", queueDownload, err))
        return false;
    if (!(v = envValue("MIRRORCORE_QUEUE_UPLOAD")).isEmpty() &&
        !parseCount(v, "MIRRORCORE_QUEUE_UPLOAD", queueUpload, err))
        return false;
    if (!(v = envValue("MIRRORCORE_WORKER_THREADS")).isEmpty() &&
        !parseInt(v, "MIRRORCORE_WORKER_THREADS", workerThreads, err))
        return false;
    if (!(v = envValue("MIRRORCORE_TRANSFER_THREADS")).isEmpty() &&
        !parseInt(v, "MIRRORCORE_TRANSFER_THREADS", transferThreads, err))
        return false;
    if (!(v = envValue("MIRRORCORE_LOGIN_TIMEOUT_MS")).isEmpty() &&
        !parseMillis(v, "MIRRORCORE_LOGIN_TIMEOUT_MS", loginTimeout, err))
        return false;
    if (!(v = envValue("MIRRORCORE_RESOLVE_TIMEOUT_MS")).isEmpty() &&
        !parseMillis(v, "MIRRORCORE_RESOLVE_TIMEOUT_MS", resolveTimeout, err))
        return false;
    if (!(v = envValue("MIRRORCORE_HANDSHAKE_ATTEMPTS")).isEmpty() &&
        !parseInt(v, "MIRRORCORE_HANDSHAKE_ATTEMPTS", handshakeAttempts, err))
        return false;
    if (!(v = envValue("MIRRORCORE_TIMEOUT_ESCALATION")).isEmpty() &&
        !parseDouble(v, "MIRRORCORE_TIMEOUT_ESCALATION", timeoutEscalation,
                     err))
        return false;
    if (!(v = envValue("MIRRORCORE_LOGOUT_TIMEOUT_MS")).isEmpty() &&
        !parseMillis(v, "MIRRORCORE_LOGOUT_TIMEOUT_MS", logoutTimeout, err))
        return false;
    if (!(v = envValue("MIRRORCORE_STATUS_INTERVAL_MS")).isEmpty() &&
        !parseMillis(v, "MIRRORCORE_STATUS_INTERVAL_MS", statusInterval, err))
        return false;
    return true;
}

bool CoreConfig::validate(std::string &err) const {
    if (workerThreads < 1) {
        err = "workerThreads must be at least 1";
        return false;
    }
    if (transferThreads < 1) {
        err = "transferThreads must be at least 1";
        return false;
    }
    if (loginTimeout.count() <= 0 || resolveTimeout.count() <= 0 ||
        logoutTimeout.count() <= 0) {
        err = "Bridge timeouts must be positive";
        return false;
    }
    if (handshakeAttempts < 1) {
        err = "handshakeAttempts must be at least 1";
        return false;
    }
    if (timeoutEscalation < 1.0) {
        err = "timeoutEscalation must be >= 1";
        return false;
    }
    if (statusInterval.count() <= 0) {
        err = "statusInterval must be positive";
        return false;
    }
    return true;
}

std::map<std::string, std::size_t> CoreConfig::bucketCaps() const {
    return {{kBucketAll, queueAll},
            {kBucketDownload, queueDownload},
            {kBucketUpload, queueUpload}};
}

bool CoreConfig::load(const std::string &iniPath, CoreConfig &out,
                      std::string &err) {
    CoreConfig cfg;
    if (!iniPath.empty()) {
        const QString path = QString::fromStdString(iniPath);
        if (!QFileInfo::exists(path)) {
            err = "Config file not found: " + iniPath;
            return false;
        }
        QSettings s(path, QSettings::IniFormat);
        if (s.status() != QSettings::NoError) {
            err = "Could not read config file: " + iniPath;
            return false;
        }
        if (!cfg.loadSettings(s, err))
            return false;
    }
    if (!cfg.loadEnvironment(err))
        return false;
    if (!cfg.validate(err))
        return false;
    out = cfg;
    qCInfo(mcConfig) << "config loaded"
                     << "queueAll=" << cfg.queueAll
                     << "queueDownload=" << cfg.queueDownload
                     << "queueUpload=" << cfg.queueUpload
                     << "workers=" << cfg.workerThreads
                     << "transferThreads=" << cfg.transferThreads;
    // Every task counts against "all", so it bounds concurrent transfers.
    if (cfg.queueAll == 0 ||
        cfg.queueAll > static_cast<std::size_t>(cfg.transferThreads)) {
        qCWarning(mcConfig) << "admission allows more transfers than"
                            << "transferThreads; the rest wait for a thread"
                            << "transferThreads=" << cfg.transferThreads;
    }
    if (sensitiveLoggingEnabled() && !iniPath.empty())
        qCDebug(mcConfig) << "config source" << iniPath.c_str();
    return true;
}

} // namespace mirrorcore
