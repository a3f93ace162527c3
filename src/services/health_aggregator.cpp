#include "vitals/health_aggregator.hpp"

#include <QDateTime>
#include <QElapsedTimer>
#include <QMap>

#include <exception>

#include "vitals/telemetry.hpp"

namespace vitals {

HealthAggregator::HealthAggregator(const QVector<DependencyProbe*>& probes) {
    for (DependencyProbe* probe : probes) {
        addProbe(probe);
    }
}

void HealthAggregator::addProbe(DependencyProbe* probe) {
    if (probe != nullptr) {
        probes_.append(probe);
    }
}

QStringList HealthAggregator::componentNames() const {
    QStringList names;
    names.reserve(probes_.size());
    for (const DependencyProbe* probe : probes_) {
        names.append(probe->name());
    }
    return names;
}

ComponentReading HealthAggregator::runProbe(DependencyProbe& probe) const {
    ComponentReading reading;
    reading.component = probe.name();

    QElapsedTimer elapsed;
    elapsed.start();
    bool healthy = false;
    try {
        healthy = probe.check();
    } catch (const ProbeError& e) {
        reading.error = QString::fromStdString(e.what());
    }
    reading.status = healthy ? ComponentStatus::Healthy : ComponentStatus::Unhealthy;
    reading.timestamp = QDateTime::currentDateTimeUtc();

    Telemetry::instance().recordProbe(reading.component, healthy, elapsed.elapsed());
    if (!healthy) {
        Telemetry::instance().recordEvent(
            "probe_failed",
            {
                {"component", reading.component},
                {"error", reading.error},
            });
        if (!reading.error.isEmpty()) {
            qWarning("Probe %s failed: %s", qPrintable(reading.component), qPrintable(reading.error));
        }
    }
    return reading;
}

HealthState HealthAggregator::evaluate() const {
    QElapsedTimer elapsed;
    elapsed.start();
    Telemetry::instance().incrementCounter("aggregator.evaluations");

    HealthState state;
    try {
        QMap<QString, ComponentStatus> components;
        for (DependencyProbe* probe : probes_) {
            const ComponentReading reading = runProbe(*probe);
            components.insert(reading.component, reading.status);
        }
        state = HealthState::fromComponents(components);
    } catch (const std::exception& e) {
        state = HealthState::failed(QString::fromStdString(e.what()));
    } catch (...) {
        state = HealthState::failed("Unknown error");
    }

    if (state.overall == HealthStatus::Error) {
        Telemetry::instance().incrementCounter("aggregator.failures");
        Telemetry::instance().recordEvent("aggregation_failed", {{"error", state.error}});
        qWarning("Health check failed: %s", qPrintable(state.error));
    }
    Telemetry::instance().recordDurationMs("aggregator.duration_ms", elapsed.elapsed());
    return state;
}

ComponentReading HealthAggregator::readComponent(const QString& name) const {
    for (DependencyProbe* probe : probes_) {
        if (probe->name() != name) {
            continue;
        }
        try {
            return runProbe(*probe);
        } catch (const std::exception& e) {
            ComponentReading reading;
            reading.component = name;
            reading.status = ComponentStatus::Unhealthy;
            reading.timestamp = QDateTime::currentDateTimeUtc();
            reading.error = QString::fromStdString(e.what());
            Telemetry::instance().recordEvent("probe_crashed", {{"component", name}, {"error", reading.error}});
            return reading;
        }
    }

    ComponentReading reading;
    reading.component = name;
    reading.status = ComponentStatus::Unhealthy;
    reading.timestamp = QDateTime::currentDateTimeUtc();
    reading.error = QString("No probe registered for component '%1'.").arg(name);
    return reading;
}

}  // namespace vitals
