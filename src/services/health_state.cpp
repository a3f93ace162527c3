#include "vitals/health_state.hpp"

#include <QJsonValue>

namespace vitals {

QString toString(HealthStatus status) {
    switch (status) {
    case HealthStatus::Healthy:
        return "healthy";
    case HealthStatus::Unhealthy:
        return "unhealthy";
    case HealthStatus::Error:
        return "error";
    case HealthStatus::Unknown:
        break;
    }
    return "unknown";
}

QString toString(ComponentStatus status) {
    switch (status) {
    case ComponentStatus::Healthy:
        return "healthy";
    case ComponentStatus::Unhealthy:
        return "unhealthy";
    case ComponentStatus::Unknown:
        break;
    }
    return "unknown";
}

HealthStatus parseHealthStatus(const QString& text) {
    const QString value = text.trimmed().toLower();
    if (value == "healthy") {
        return HealthStatus::Healthy;
    }
    if (value == "unhealthy") {
        return HealthStatus::Unhealthy;
    }
    if (value == "error") {
        return HealthStatus::Error;
    }
    return HealthStatus::Unknown;
}

ComponentStatus parseComponentStatus(const QString& text) {
    const QString value = text.trimmed().toLower();
    if (value == "healthy") {
        return ComponentStatus::Healthy;
    }
    if (value == "unhealthy") {
        return ComponentStatus::Unhealthy;
    }
    return ComponentStatus::Unknown;
}

QString isoTimestamp(const QDateTime& instant) {
    return instant.toUTC().toString(Qt::ISODateWithMs);
}

HealthState HealthState::fromComponents(const QMap<QString, ComponentStatus>& components) {
    if (components.isEmpty()) {
        return failed("No health probes registered.");
    }

    HealthState state;
    state.timestamp = QDateTime::currentDateTimeUtc();
    state.components = components;
    state.overall = HealthStatus::Healthy;
    for (auto it = components.constBegin(); it != components.constEnd(); ++it) {
        if (it.value() != ComponentStatus::Healthy) {
            state.overall = HealthStatus::Unhealthy;
            break;
        }
    }
    return state;
}

HealthState HealthState::failed(const QString& error) {
    HealthState state;
    state.overall = HealthStatus::Error;
    state.timestamp = QDateTime::currentDateTimeUtc();
    state.error = error.isEmpty() ? QString("Unknown error") : error;
    return state;
}

QJsonObject HealthState::toJson() const {
    QJsonObject out;
    out.insert("status", toString(overall));
    out.insert("timestamp", isoTimestamp(timestamp.isValid() ? timestamp : QDateTime::currentDateTimeUtc()));
    if (!components.isEmpty()) {
        QJsonObject services;
        for (auto it = components.constBegin(); it != components.constEnd(); ++it) {
            services.insert(it.key(), toString(it.value()));
        }
        out.insert("services", services);
    }
    if (!error.isEmpty()) {
        out.insert("error", error);
    }
    return out;
}

HealthState HealthState::fromJson(const QJsonObject& object) {
    HealthState state;
    const QJsonValue status = object.value("status");
    state.statusMissing = status.isUndefined() || status.isNull();
    state.overall = parseHealthStatus(status.toString());
    state.timestamp = QDateTime::fromString(object.value("timestamp").toString(), Qt::ISODateWithMs);
    const QJsonObject services = object.value("services").toObject();
    for (auto it = services.constBegin(); it != services.constEnd(); ++it) {
        state.components.insert(it.key(), parseComponentStatus(it.value().toString()));
    }
    state.error = object.value("error").toString();
    return state;
}

QJsonObject ComponentReading::toJson() const {
    QJsonObject out;
    out.insert("status", status == ComponentStatus::Healthy ? "healthy" : "unhealthy");
    out.insert("timestamp", isoTimestamp(timestamp.isValid() ? timestamp : QDateTime::currentDateTimeUtc()));
    if (!error.isEmpty()) {
        out.insert("error", error);
    }
    return out;
}

}  // namespace vitals
