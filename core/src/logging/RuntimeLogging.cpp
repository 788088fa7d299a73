#include "mirrorcore/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <QString>
#include <cstdlib>
#include <mutex>

namespace mirrorcore {

namespace {

std::once_flag g_rulesApplied;

// Lower-cased environment value without surrounding blanks.
QString envValue(const char *name) {
    const char *raw = std::getenv(name);
    if (!raw)
        return {};
    return QString::fromLocal8Bit(raw).trimmed().toLower();
}

bool envFlag(const char *name) {
    const QString v = envValue(name);
    return v == QLatin1String("1") || v == QLatin1String("true") ||
           v == QLatin1String("yes") || v == QLatin1String("on");
}

} // namespace

LoggingPolicy LoggingPolicy::fromEnvironment() {
    LoggingPolicy p;
    const QString env = envValue("MIRRORCORE_ENV");
    p.devEnvironment = env == QLatin1String("dev") ||
                       env == QLatin1String("development") ||
                       env == QLatin1String("local") ||
                       env == QLatin1String("debug");
    p.sensitive = p.devEnvironment && envFlag("MIRRORCORE_LOG_SENSITIVE");
    p.debugCategories = envFlag("MIRRORCORE_LOG_DEBUG");
    return p;
}

const LoggingPolicy &loggingPolicy() {
    static const LoggingPolicy policy = LoggingPolicy::fromEnvironment();
    return policy;
}

std::string sensitive(const std::string &value) {
    return loggingPolicy().sensitive ? value : std::string("<redacted>");
}

void applyLoggingRules() {
    std::call_once(g_rulesApplied, [] {
        if (loggingPolicy().debugCategories)
            QLoggingCategory::setFilterRules(
                QStringLiteral("mirrorcore.*.debug=true"));
    });
}

} // namespace mirrorcore
