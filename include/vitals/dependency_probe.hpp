#pragma once

#include <QString>

#include <stdexcept>

namespace vitals {

// Expected failure mode of a probe: the dependency is unreachable or
// answered with something unexpected.
class ProbeError : public std::runtime_error {
public:
    explicit ProbeError(const QString& diagnostic)
        : std::runtime_error(diagnostic.toStdString()) {}
};

class DependencyProbe {
public:
    virtual ~DependencyProbe() = default;

    // Stable component identifier, e.g. "database".
    [[nodiscard]] virtual QString name() const = 0;

    // True when the dependency is reachable and responsive. Throws
    // ProbeError with a diagnostic on failure. Must not block longer than
    // the probe's own per-attempt timeout.
    virtual bool check() = 0;
};

}  // namespace vitals
