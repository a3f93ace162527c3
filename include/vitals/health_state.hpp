#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMap>
#include <QMetaType>
#include <QString>

namespace vitals {

// Unknown never leaves the server; it marks "not evaluated yet" or an
// unrecognized status string read by a client.
enum class HealthStatus {
    Healthy,
    Unhealthy,
    Unknown,
    Error,
};

enum class ComponentStatus {
    Healthy,
    Unhealthy,
    Unknown,
};

QString toString(HealthStatus status);
QString toString(ComponentStatus status);

// Trimmed, case-insensitive. Anything unrecognized yields Unknown.
HealthStatus parseHealthStatus(const QString& text);
ComponentStatus parseComponentStatus(const QString& text);

QString isoTimestamp(const QDateTime& instant);

struct HealthState {
    HealthStatus overall = HealthStatus::Unknown;
    QDateTime timestamp;
    QMap<QString, ComponentStatus> components;
    QString error;
    // Set by fromJson when the payload carried no status at all.
    bool statusMissing = false;

    // An empty component map is an aggregation failure, not a healthy system.
    static HealthState fromComponents(const QMap<QString, ComponentStatus>& components);
    static HealthState failed(const QString& error);

    [[nodiscard]] bool isHealthy() const { return overall == HealthStatus::Healthy; }
    [[nodiscard]] bool hasComponents() const { return !components.isEmpty(); }
    [[nodiscard]] bool hasError() const { return !error.isEmpty(); }

    // Wire shape: {status, timestamp, services?, error?}.
    [[nodiscard]] QJsonObject toJson() const;
    static HealthState fromJson(const QJsonObject& object);
};

struct ComponentReading {
    QString component;
    ComponentStatus status = ComponentStatus::Unknown;
    QDateTime timestamp;
    QString error;

    [[nodiscard]] bool isHealthy() const { return status == ComponentStatus::Healthy; }
    [[nodiscard]] QJsonObject toJson() const;
};

}  // namespace vitals

Q_DECLARE_METATYPE(vitals::HealthState)
