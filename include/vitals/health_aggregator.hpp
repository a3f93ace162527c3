#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "vitals/dependency_probe.hpp"
#include "vitals/health_state.hpp"

namespace vitals {

// Folds the registered probes into one HealthState. Probes are borrowed and
// must outlive the aggregator.
class HealthAggregator {
public:
    HealthAggregator() = default;
    explicit HealthAggregator(const QVector<DependencyProbe*>& probes);

    void addProbe(DependencyProbe* probe);
    [[nodiscard]] QStringList componentNames() const;

    HealthState evaluate() const;
    ComponentReading readComponent(const QString& name) const;

private:
    ComponentReading runProbe(DependencyProbe& probe) const;

    QVector<DependencyProbe*> probes_;
};

}  // namespace vitals
