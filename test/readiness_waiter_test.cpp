#include "vitals/readiness_waiter.hpp"

#include <QAtomicInt>
#include <QMutex>
#include <QMutexLocker>
#include <QThread>
#include <QVector>

#include <stdexcept>

#include <gtest/gtest.h>

using vitals::HttpProbeResult;
using vitals::ReadinessWaiter;
using vitals::TargetOutcome;
using vitals::WaitSettings;
using vitals::WaitTarget;

namespace {

HttpProbeResult answer(int statusCode) {
    HttpProbeResult result;
    result.statusCode = statusCode;
    return result;
}

HttpProbeResult refused() {
    HttpProbeResult result;
    result.error = "Connection refused";
    return result;
}

WaitSettings settings(int maxWaitSec, int intervalSec) {
    WaitSettings s;
    s.maxWaitSec = maxWaitSec;
    s.intervalSec = intervalSec;
    s.attemptTimeoutMs = 100;
    return s;
}

// Virtual clock: the sleeper advances it, attempts record when they ran.
class ScriptedClock {
public:
    ReadinessWaiter::Sleeper sleeper() {
        return [this](int ms) {
            QMutexLocker lock(&mutex_);
            nowMs_ += ms;
        };
    }

    void markAttempt() {
        QMutexLocker lock(&mutex_);
        attemptTimesSec_.append(nowMs_ / 1000);
    }

    QVector<int> attemptTimesSec() const {
        QMutexLocker lock(&mutex_);
        return attemptTimesSec_;
    }

private:
    mutable QMutex mutex_;
    int nowMs_ = 0;
    QVector<int> attemptTimesSec_;
};

const WaitTarget kApi{"API", QUrl("http://localhost:8080/health")};
const WaitTarget kDb{"Database", QUrl("http://localhost:8080/api/health/db")};

}  // namespace

TEST(ReadinessWaiterTest, AttemptsAtEachIntervalUntilBudgetSpent) {
    ScriptedClock clock;
    const ReadinessWaiter waiter(
        settings(6, 2),
        [&clock](const QUrl&, int) {
            clock.markAttempt();
            return refused();
        },
        clock.sleeper());

    const TargetOutcome outcome = waiter.waitFor(kApi);

    EXPECT_FALSE(outcome.ready);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(clock.attemptTimesSec(), QVector<int>({0, 2, 4}));
    EXPECT_EQ(outcome.waitedSec, 6);
    EXPECT_EQ(outcome.lastError, "Connection refused");
}

TEST(ReadinessWaiterTest, StopsAtFirstSuccess) {
    int calls = 0;
    int sleeps = 0;
    const ReadinessWaiter waiter(
        settings(60, 2),
        [&calls](const QUrl&, int) { return ++calls < 3 ? answer(503) : answer(200); },
        [&sleeps](int) { sleeps++; });

    const TargetOutcome outcome = waiter.waitFor(kDb);

    EXPECT_TRUE(outcome.ready);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(sleeps, 2);
    EXPECT_EQ(outcome.waitedSec, 4);
    EXPECT_TRUE(outcome.lastError.isEmpty());
}

TEST(ReadinessWaiterTest, NonSuccessStatusRecordedAsError) {
    const ReadinessWaiter waiter(
        settings(2, 2),
        [](const QUrl&, int) { return answer(503); },
        [](int) {});

    const TargetOutcome outcome = waiter.waitFor(kDb);

    EXPECT_FALSE(outcome.ready);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.lastError, "HTTP 503");
}

TEST(ReadinessWaiterTest, ZeroBudgetMakesNoAttempt) {
    int calls = 0;
    const ReadinessWaiter waiter(
        settings(0, 2),
        [&calls](const QUrl&, int) {
            calls++;
            return answer(200);
        },
        [](int) {});

    EXPECT_FALSE(waiter.waitFor(kApi).ready);
    EXPECT_EQ(calls, 0);
}

TEST(ReadinessWaiterTest, ThrowingAttemptCountsAsFailure) {
    const ReadinessWaiter waiter(
        settings(4, 2),
        [](const QUrl&, int) -> HttpProbeResult { throw std::runtime_error("resolver exploded"); },
        [](int) {});

    const TargetOutcome outcome = waiter.waitFor(kApi);

    EXPECT_FALSE(outcome.ready);
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(outcome.lastError, "resolver exploded");
}

TEST(ReadinessWaiterTest, IntervalIsClampedToOneSecond) {
    int sleptMs = 0;
    const ReadinessWaiter waiter(
        settings(3, 0),
        [](const QUrl&, int) { return refused(); },
        [&sleptMs](int ms) { sleptMs += ms; });

    EXPECT_EQ(waiter.settings().intervalSec, 1);
    EXPECT_EQ(waiter.waitFor(kApi).attempts, 3);
    EXPECT_EQ(sleptMs, 3000);
}

TEST(ReadinessWaiterTest, PassesAttemptTimeoutThrough) {
    int seenTimeout = 0;
    const ReadinessWaiter waiter(
        settings(2, 1),
        [&seenTimeout](const QUrl&, int timeoutMs) {
            seenTimeout = timeoutMs;
            return answer(200);
        },
        [](int) {});

    EXPECT_TRUE(waiter.waitFor(kApi).ready);
    EXPECT_EQ(seenTimeout, 100);
}

TEST(ReadinessWaiterTest, WaitForAllRecordsEveryTargetDespiteFailure) {
    const ReadinessWaiter waiter(
        settings(4, 1),
        [](const QUrl& url, int) { return url.path() == "/health" ? answer(200) : refused(); },
        [](int) {});

    const QVector<TargetOutcome> outcomes = waiter.waitForAll({kApi, kDb});

    ASSERT_EQ(outcomes.size(), 2);
    EXPECT_FALSE(ReadinessWaiter::allReady(outcomes, 2));
    int ready = 0;
    for (const TargetOutcome& outcome : outcomes) {
        if (outcome.name == "API") {
            EXPECT_TRUE(outcome.ready);
            ready++;
        } else {
            EXPECT_EQ(outcome.name, "Database");
            EXPECT_FALSE(outcome.ready);
            EXPECT_EQ(outcome.attempts, 4);
        }
    }
    EXPECT_EQ(ready, 1);
}

TEST(ReadinessWaiterTest, WaitForAllRunsTargetsConcurrently) {
    QAtomicInt inFlight = 0;
    QAtomicInt peak = 0;
    const ReadinessWaiter waiter(
        settings(10, 1),
        [&](const QUrl&, int) {
            const int now = inFlight.fetchAndAddOrdered(1) + 1;
            int seen = peak.loadAcquire();
            while (now > seen && !peak.testAndSetOrdered(seen, now)) {
                seen = peak.loadAcquire();
            }
            QThread::msleep(100);
            inFlight.fetchAndAddOrdered(-1);
            return answer(200);
        },
        [](int) {});

    const QVector<TargetOutcome> outcomes = waiter.waitForAll({
        kApi,
        kDb,
        {"Redis", QUrl("http://localhost:8080/api/health/redis")},
    });

    EXPECT_EQ(outcomes.size(), 3);
    EXPECT_TRUE(ReadinessWaiter::allReady(outcomes, 3));
    EXPECT_EQ(peak.loadAcquire(), 3);
}

TEST(ReadinessWaiterTest, ProgressTicksWhileTargetsRun) {
    int ticks = 0;
    const ReadinessWaiter waiter(
        settings(10, 1),
        [](const QUrl&, int) {
            QThread::msleep(150);
            return answer(200);
        },
        [](int) {});

    waiter.waitForAll({kApi}, [&ticks]() { ticks++; }, 10);

    EXPECT_GE(ticks, 2);
}

TEST(ReadinessWaiterTest, EmptyTargetListIsVacuouslyReady) {
    const ReadinessWaiter waiter(settings(1, 1), [](const QUrl&, int) { return answer(200); }, [](int) {});
    const QVector<TargetOutcome> outcomes = waiter.waitForAll({});
    EXPECT_TRUE(outcomes.isEmpty());
    EXPECT_TRUE(ReadinessWaiter::allReady(outcomes, 0));
}

TEST(ReadinessWaiterTest, MissingOutcomeIsNotReady) {
    TargetOutcome ready;
    ready.name = "API";
    ready.ready = true;

    EXPECT_TRUE(ReadinessWaiter::allReady({ready, ready}, 2));
    EXPECT_FALSE(ReadinessWaiter::allReady({ready}, 2));
    EXPECT_FALSE(ReadinessWaiter::allReady({}, 1));
}

TEST(OutcomeLedgerTest, AppendsInOrder) {
    vitals::OutcomeLedger ledger;
    TargetOutcome first;
    first.name = "a";
    TargetOutcome second;
    second.name = "b";
    ledger.append(first);
    ledger.append(second);

    ASSERT_EQ(ledger.size(), 2);
    EXPECT_EQ(ledger.outcomes().at(0).name, "a");
    EXPECT_EQ(ledger.outcomes().at(1).name, "b");
}
