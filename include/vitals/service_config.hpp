#pragma once

#include <QMap>
#include <QProcessEnvironment>
#include <QString>
#include <QUrl>
#include <QVector>

#include "vitals/data_store_probe.hpp"

namespace vitals {

// KEY=VALUE lines; blank lines, '#' comments and an "export " prefix are
// ignored, surrounding quotes are stripped. Missing file yields an empty map.
QMap<QString, QString> loadEnvFile(const QString& path);

// Values from overrides win over the base environment.
QProcessEnvironment mergedEnvironment(
    const QProcessEnvironment& base,
    const QMap<QString, QString>& overrides);

int envInt(const QProcessEnvironment& env, const QString& key, int fallback, int minValue, int maxValue);

struct ApiServerConfig {
    quint16 port = 8080;
    QUrl databaseUrl;
    QUrl redisUrl = QUrl("redis://localhost:6379");
    int probeTimeoutMs = 5000;

    [[nodiscard]] bool hasDatabase() const { return databaseUrl.isValid() && !databaseUrl.isEmpty(); }
    [[nodiscard]] DataStoreSettings dataStoreSettings() const;

    static ApiServerConfig fromEnvironment(const QProcessEnvironment& env);
};

struct DashboardConfig {
    QUrl apiUrl = QUrl("http://localhost:8080");
    int pollIntervalMs = 5000;
    int requestTimeoutMs = 5000;

    static DashboardConfig fromEnvironment(const QProcessEnvironment& env);
};

struct WaitTarget {
    QString name;
    QUrl url;
};

struct WaitConfig {
    QString host = "localhost";
    quint16 apiPort = 8080;
    quint16 frontendPort = 3000;
    int maxWaitSec = 60;
    int intervalSec = 2;
    int attemptTimeoutMs = 5000;

    [[nodiscard]] QVector<WaitTarget> defaultTargets() const;
    [[nodiscard]] QString apiBaseUrl() const;
    [[nodiscard]] QString frontendBaseUrl() const;

    static WaitConfig fromEnvironment(const QProcessEnvironment& env);
};

// "NAME=URL"; returns a target with an empty name when malformed.
WaitTarget parseTargetSpec(const QString& spec);

}  // namespace vitals
