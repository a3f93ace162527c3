#pragma once

#include <QObject>
#include <QTimer>

#include <memory>

#include "vitals/health_fetcher.hpp"
#include "vitals/health_state.hpp"

namespace vitals {

// Evaluates once on start(), then on every interval tick until stop().
// Results arriving after stop() are dropped; the last completed one wins.
class HealthPoller final : public QObject {
    Q_OBJECT

public:
    static constexpr int kDefaultIntervalMs = 5000;

    explicit HealthPoller(
        std::unique_ptr<HealthFetcher> fetcher,
        int intervalMs = kDefaultIntervalMs,
        QObject* parent = nullptr);
    ~HealthPoller() override;

    void start();
    // Idempotent.
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool isLoading() const { return loading_; }
    [[nodiscard]] const HealthState& current() const { return current_; }
    [[nodiscard]] int intervalMs() const { return timer_.interval(); }
    [[nodiscard]] int evaluationsStarted() const { return evaluationsStarted_; }

signals:
    void stateChanged(const vitals::HealthState& state);

private:
    void evaluate();
    void apply(const HealthState& state);

    std::unique_ptr<HealthFetcher> fetcher_;
    QTimer timer_;
    HealthState current_;
    bool running_ = false;
    bool loading_ = true;
    int evaluationsStarted_ = 0;
    quint64 generation_ = 0;
};

}  // namespace vitals
