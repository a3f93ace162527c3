#include "vitals/readiness_waiter.hpp"

#include <QFuture>
#include <QFutureSynchronizer>
#include <QMutexLocker>
#include <QThread>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>

#include <algorithm>
#include <exception>
#include <utility>

#include "vitals/telemetry.hpp"

namespace vitals {

void OutcomeLedger::append(const TargetOutcome& outcome) {
    QMutexLocker lock(&mutex_);
    outcomes_.append(outcome);
}

QVector<TargetOutcome> OutcomeLedger::outcomes() const {
    QMutexLocker lock(&mutex_);
    return outcomes_;
}

int OutcomeLedger::size() const {
    QMutexLocker lock(&mutex_);
    return outcomes_.size();
}

ReadinessWaiter::ReadinessWaiter(WaitSettings settings, Attempt attempt, Sleeper sleeper)
    : settings_(settings),
      attempt_(std::move(attempt)),
      sleeper_(std::move(sleeper)) {
    settings_.intervalSec = qMax(1, settings_.intervalSec);
    settings_.maxWaitSec = qMax(0, settings_.maxWaitSec);
    if (!attempt_) {
        attempt_ = [](const QUrl& url, int timeoutMs) { return HttpProbeClient::get(url, timeoutMs); };
    }
    if (!sleeper_) {
        sleeper_ = [](int ms) { QThread::msleep(static_cast<unsigned long>(ms)); };
    }
}

TargetOutcome ReadinessWaiter::waitFor(const WaitTarget& target) const {
    TargetOutcome outcome;
    outcome.name = target.name;
    outcome.url = target.url;

    while (outcome.waitedSec < settings_.maxWaitSec) {
        outcome.attempts++;
        Telemetry::instance().incrementCounter("waiter.attempts");
        HttpProbeResult result;
        try {
            result = attempt_(target.url, settings_.attemptTimeoutMs);
        } catch (const std::exception& e) {
            result.error = QString::fromStdString(e.what());
        }
        if (result.success()) {
            outcome.ready = true;
            outcome.lastError.clear();
            Telemetry::instance().recordEvent(
                "target_ready",
                {
                    {"target", target.name},
                    {"attempts", outcome.attempts},
                    {"waited_sec", outcome.waitedSec},
                });
            return outcome;
        }
        outcome.lastError = result.error.isEmpty()
                                ? QString("HTTP %1").arg(result.statusCode)
                                : result.error;
        sleeper_(settings_.intervalSec * 1000);
        outcome.waitedSec += settings_.intervalSec;
    }

    Telemetry::instance().incrementCounter("waiter.timeouts");
    Telemetry::instance().recordEvent(
        "target_timed_out",
        {
            {"target", target.name},
            {"attempts", outcome.attempts},
            {"last_error", outcome.lastError},
        });
    return outcome;
}

QVector<TargetOutcome> ReadinessWaiter::waitForAll(
    const QVector<WaitTarget>& targets,
    const ProgressTick& progress,
    int progressIntervalMs) const {
    if (targets.isEmpty()) {
        return {};
    }

    OutcomeLedger ledger;
    QThreadPool pool;
    pool.setMaxThreadCount(targets.size());

    QVector<QFuture<void>> futures;
    QFutureSynchronizer<void> synchronizer;
    for (const WaitTarget& target : targets) {
        const QFuture<void> future = QtConcurrent::run(&pool, [this, target, &ledger]() {
            ledger.append(waitFor(target));
        });
        futures.append(future);
        synchronizer.addFuture(future);
    }

    const auto running = [&futures]() {
        return std::any_of(futures.cbegin(), futures.cend(), [](const QFuture<void>& f) {
            return !f.isFinished();
        });
    };
    while (progress && running()) {
        progress();
        QThread::msleep(static_cast<unsigned long>(qMax(10, progressIntervalMs)));
    }
    synchronizer.waitForFinished();
    pool.waitForDone();
    return ledger.outcomes();
}

bool ReadinessWaiter::allReady(const QVector<TargetOutcome>& outcomes, int expectedCount) {
    if (outcomes.size() != expectedCount) {
        return false;
    }
    return std::all_of(outcomes.cbegin(), outcomes.cend(), [](const TargetOutcome& outcome) {
        return outcome.ready;
    });
}

}  // namespace vitals
