#include "vitals/service_config.hpp"

#include <QFile>
#include <QStringList>
#include <QTextStream>

namespace vitals {

namespace {

QString unquote(const QString& value) {
    if (value.size() >= 2) {
        const QChar first = value.front();
        const QChar last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.mid(1, value.size() - 2);
        }
    }
    return value;
}

}  // namespace

QMap<QString, QString> loadEnvFile(const QString& path) {
    QMap<QString, QString> values;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return values;
    }

    QTextStream stream(&file);
    while (!stream.atEnd()) {
        QString line = stream.readLine().trimmed();
        if (line.isEmpty() || line.startsWith('#')) {
            continue;
        }
        if (line.startsWith("export ")) {
            line = line.mid(QString("export ").size()).trimmed();
        }
        const int idx = line.indexOf('=');
        if (idx <= 0) {
            continue;
        }
        const QString key = line.left(idx).trimmed();
        QString value = line.mid(idx + 1).trimmed();
        if (!value.startsWith('"') && !value.startsWith('\'')) {
            const int comment = value.indexOf(" #");
            if (comment >= 0) {
                value = value.left(comment).trimmed();
            }
        }
        values.insert(key, unquote(value));
    }
    return values;
}

QProcessEnvironment mergedEnvironment(
    const QProcessEnvironment& base,
    const QMap<QString, QString>& overrides) {
    QProcessEnvironment env = base;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }
    return env;
}

int envInt(const QProcessEnvironment& env, const QString& key, int fallback, int minValue, int maxValue) {
    const QString raw = env.value(key).trimmed();
    if (raw.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok) {
        return fallback;
    }
    return qBound(minValue, value, maxValue);
}

DataStoreSettings ApiServerConfig::dataStoreSettings() const {
    DataStoreSettings settings = DataStoreSettings::fromUrl(databaseUrl);
    settings.timeoutMs = probeTimeoutMs;
    return settings;
}

ApiServerConfig ApiServerConfig::fromEnvironment(const QProcessEnvironment& env) {
    ApiServerConfig config;
    config.port = static_cast<quint16>(envInt(env, "PORT", 8080, 1, 65535));
    config.probeTimeoutMs = envInt(env, "PROBE_TIMEOUT_MS", 5000, 100, 60000);

    const QString databaseUrl = env.value("DATABASE_URL").trimmed();
    if (!databaseUrl.isEmpty()) {
        config.databaseUrl = QUrl(databaseUrl);
    } else if (!env.value("DB_NAME").isEmpty()) {
        QUrl url;
        url.setScheme("postgres");
        url.setHost(env.value("DB_HOST", "localhost"));
        url.setPort(envInt(env, "DB_PORT", 5432, 1, 65535));
        url.setUserName(env.value("DB_USER"));
        url.setPassword(env.value("DB_PASSWORD"));
        url.setPath("/" + env.value("DB_NAME"));
        config.databaseUrl = url;
    }

    const QString redisUrl = env.value("REDIS_URL").trimmed();
    if (!redisUrl.isEmpty()) {
        config.redisUrl = QUrl(redisUrl);
    }
    return config;
}

DashboardConfig DashboardConfig::fromEnvironment(const QProcessEnvironment& env) {
    DashboardConfig config;
    const QString apiUrl = env.value("API_URL").trimmed();
    if (!apiUrl.isEmpty()) {
        config.apiUrl = QUrl(apiUrl);
    }
    config.pollIntervalMs = envInt(env, "POLL_INTERVAL_MS", 5000, 250, 3600000);
    return config;
}

QString WaitConfig::apiBaseUrl() const {
    return QString("http://%1:%2").arg(host).arg(apiPort);
}

QString WaitConfig::frontendBaseUrl() const {
    return QString("http://%1:%2").arg(host).arg(frontendPort);
}

QVector<WaitTarget> WaitConfig::defaultTargets() const {
    const QString api = apiBaseUrl();
    return {
        {"API", QUrl(api + "/health")},
        {"Frontend", QUrl(frontendBaseUrl())},
        {"Database", QUrl(api + "/api/health/db")},
        {"Redis", QUrl(api + "/api/health/redis")},
    };
}

WaitConfig WaitConfig::fromEnvironment(const QProcessEnvironment& env) {
    WaitConfig config;
    const QString host = env.value("API_HOST").trimmed();
    if (!host.isEmpty()) {
        config.host = host;
    }
    config.apiPort = static_cast<quint16>(envInt(env, "API_PORT", 8080, 1, 65535));
    config.frontendPort = static_cast<quint16>(envInt(env, "FRONTEND_PORT", 3000, 1, 65535));
    config.maxWaitSec = envInt(env, "MAX_WAIT", 60, 0, 86400);
    config.intervalSec = envInt(env, "CHECK_INTERVAL", 2, 1, 3600);
    return config;
}

WaitTarget parseTargetSpec(const QString& spec) {
    const int idx = spec.indexOf('=');
    if (idx <= 0) {
        return {};
    }
    const QUrl url(spec.mid(idx + 1).trimmed());
    if (!url.isValid() || url.host().isEmpty()) {
        return {};
    }
    return {spec.left(idx).trimmed(), url};
}

}  // namespace vitals
