#pragma once

#include <QMutex>
#include <QString>
#include <QUrl>
#include <QVector>

#include <functional>

#include "vitals/http_probe_client.hpp"
#include "vitals/service_config.hpp"

namespace vitals {

struct WaitSettings {
    int maxWaitSec = 60;
    int intervalSec = 2;
    int attemptTimeoutMs = 5000;
};

struct TargetOutcome {
    QString name;
    QUrl url;
    bool ready = false;
    int attempts = 0;
    int waitedSec = 0;
    QString lastError;
};

// Append-only, shared by the per-target tasks. Each task appends once.
class OutcomeLedger {
public:
    void append(const TargetOutcome& outcome);
    [[nodiscard]] QVector<TargetOutcome> outcomes() const;
    [[nodiscard]] int size() const;

private:
    mutable QMutex mutex_;
    QVector<TargetOutcome> outcomes_;
};

// Polls targets until each answers 2xx or spends its budget.
class ReadinessWaiter {
public:
    using Attempt = std::function<HttpProbeResult(const QUrl& url, int timeoutMs)>;
    using Sleeper = std::function<void(int ms)>;
    using ProgressTick = std::function<void()>;

    explicit ReadinessWaiter(WaitSettings settings, Attempt attempt = {}, Sleeper sleeper = {});

    // Budget is counted in interval steps, not wall time spent in attempts.
    TargetOutcome waitFor(const WaitTarget& target) const;

    // One task per target; waits for all of them regardless of outcome.
    // progress runs on the calling thread every progressIntervalMs while
    // any task is still running.
    QVector<TargetOutcome> waitForAll(
        const QVector<WaitTarget>& targets,
        const ProgressTick& progress = {},
        int progressIntervalMs = 200) const;

    [[nodiscard]] const WaitSettings& settings() const { return settings_; }

    // True only when every one of expectedCount targets reported ready.
    static bool allReady(const QVector<TargetOutcome>& outcomes, int expectedCount);

private:
    WaitSettings settings_;
    Attempt attempt_;
    Sleeper sleeper_;
};

}  // namespace vitals
