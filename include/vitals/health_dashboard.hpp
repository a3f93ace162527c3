#pragma once

#include <QLabel>
#include <QMainWindow>
#include <QUrl>
#include <QWidget>

#include "vitals/health_poller.hpp"
#include "vitals/health_state.hpp"
#include "vitals/service_config.hpp"
#include "vitals/status_presentation.hpp"

class QCloseEvent;

namespace vitals {

class HealthDashboard final : public QMainWindow {
    Q_OBJECT

public:
    explicit HealthDashboard(const DashboardConfig& config, QWidget* parent = nullptr);
    ~HealthDashboard() override;

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void setupUi();
    void setupConnections();

    void render(const HealthState& state);
    void renderLoading();
    static void applyBadge(QLabel* label, const QString& status);
    static void applyBadge(QLabel* label, const StatusBadge& badge);
    void showMessage(const QString& message, bool error = false) const;

    DashboardConfig config_;
    HealthPoller* poller_ = nullptr;

    QWidget* central_ = nullptr;
    QLabel* loadingLabel_ = nullptr;
    QWidget* statusPanel_ = nullptr;
    QLabel* overallBadge_ = nullptr;
    QWidget* databaseRow_ = nullptr;
    QLabel* databaseBadge_ = nullptr;
    QWidget* redisRow_ = nullptr;
    QLabel* redisBadge_ = nullptr;
    QLabel* errorLabel_ = nullptr;
    QLabel* lastCheckedLabel_ = nullptr;
};

}  // namespace vitals
