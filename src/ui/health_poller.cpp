#include "vitals/health_poller.hpp"

#include <utility>

#include "vitals/telemetry.hpp"

namespace vitals {

HealthPoller::HealthPoller(std::unique_ptr<HealthFetcher> fetcher, int intervalMs, QObject* parent)
    : QObject(parent),
      fetcher_(std::move(fetcher)) {
    timer_.setInterval(qMax(1, intervalMs));
    timer_.setSingleShot(false);
    connect(&timer_, &QTimer::timeout, this, [this]() { evaluate(); });
}

HealthPoller::~HealthPoller() {
    stop();
}

void HealthPoller::start() {
    if (running_ || !fetcher_) {
        return;
    }
    running_ = true;
    evaluate();
    timer_.start();
}

void HealthPoller::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    generation_++;
    timer_.stop();
    fetcher_->cancelAll();
}

void HealthPoller::evaluate() {
    if (!running_) {
        return;
    }
    evaluationsStarted_++;
    Telemetry::instance().incrementCounter("poller.evaluations");
    const quint64 generation = generation_;
    fetcher_->fetch([this, generation](const HealthState& state) {
        if (!running_ || generation != generation_) {
            return;
        }
        apply(state);
    });
}

void HealthPoller::apply(const HealthState& state) {
    current_ = state;
    loading_ = false;
    if (state.overall == HealthStatus::Error) {
        Telemetry::instance().incrementCounter("poller.errors");
    }
    emit stateChanged(current_);
}

}  // namespace vitals
