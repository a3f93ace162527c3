#pragma once

#include <QString>
#include <QVector>

#include <stdexcept>
#include <utility>

#include "vitals/dependency_probe.hpp"
#include "vitals/health_fetcher.hpp"
#include "vitals/health_state.hpp"

namespace vitals::test {

// Scripted probe: returns `healthy`, or throws when a failure mode is set.
class FakeProbe final : public DependencyProbe {
public:
    enum class Mode {
        Answer,
        ProbeFailure,
        Crash,
    };

    FakeProbe(QString name, bool healthy, Mode mode = Mode::Answer)
        : name_(std::move(name)),
          healthy_(healthy),
          mode_(mode) {}

    QString name() const override { return name_; }

    bool check() override {
        calls++;
        switch (mode_) {
        case Mode::ProbeFailure:
            throw ProbeError(name_ + " unreachable");
        case Mode::Crash:
            throw std::runtime_error("probe crashed");
        case Mode::Answer:
            break;
        }
        return healthy_;
    }

    void setHealthy(bool healthy) { healthy_ = healthy; }
    void setMode(Mode mode) { mode_ = mode; }

    int calls = 0;

private:
    QString name_;
    bool healthy_;
    Mode mode_;
};

// Holds completions until the test resolves them.
class ManualFetcher final : public HealthFetcher {
public:
    void fetch(Completion done) override {
        pending.append(std::move(done));
        fetches++;
    }

    void cancelAll() override {
        cancels++;
        pending.clear();
    }

    // Completes the oldest pending fetch; false when nothing is pending.
    bool resolve(const HealthState& state) {
        if (pending.isEmpty()) {
            return false;
        }
        const Completion done = pending.takeFirst();
        done(state);
        return true;
    }

    QVector<Completion> pending;
    int fetches = 0;
    int cancels = 0;
};

}  // namespace vitals::test
