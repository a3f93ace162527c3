#include "vitals/health_dashboard.hpp"

#include <QCloseEvent>
#include <QHBoxLayout>
#include <QStatusBar>
#include <QVBoxLayout>

#include <memory>

#include "vitals/status_presentation.hpp"

namespace vitals {

namespace {

QWidget* makeStatusRow(const QString& title, QLabel** badge) {
    auto* row = new QWidget();
    row->setStyleSheet("background:#1f252c;border-radius:8px;");
    auto* layout = new QHBoxLayout(row);
    layout->setContentsMargins(14, 10, 14, 10);
    auto* name = new QLabel(title);
    name->setStyleSheet("font-weight:600;color:#c7d0d9;");
    *badge = new QLabel();
    layout->addWidget(name);
    layout->addStretch(1);
    layout->addWidget(*badge);
    return row;
}

}  // namespace

HealthDashboard::HealthDashboard(const DashboardConfig& config, QWidget* parent)
    : QMainWindow(parent),
      config_(config) {
    setupUi();
    poller_ = new HealthPoller(
        std::make_unique<NetworkHealthFetcher>(config_.apiUrl, config_.requestTimeoutMs),
        config_.pollIntervalMs,
        this);
    setupConnections();
    renderLoading();
    poller_->start();
}

HealthDashboard::~HealthDashboard() {
    if (poller_ != nullptr) {
        poller_->stop();
    }
}

void HealthDashboard::closeEvent(QCloseEvent* event) {
    poller_->stop();
    QMainWindow::closeEvent(event);
}

void HealthDashboard::setupUi() {
    setWindowTitle("Vitals");
    resize(720, 480);
    setMinimumSize(520, 360);

    central_ = new QWidget(this);
    setCentralWidget(central_);
    setStyleSheet(
        "QWidget { background:#171b20; color:#e3e7ec; font-size:13px; }"
        "QLabel { color:#e3e7ec; }"
        "QStatusBar { background:#1d232a; color:#9faebb; border-top:1px solid #3a444f; }");

    auto* root = new QVBoxLayout(central_);
    root->setContentsMargins(18, 18, 18, 18);
    root->setSpacing(10);

    auto* title = new QLabel("System Health");
    title->setStyleSheet("font-size:20px;font-weight:700;");
    root->addWidget(title);

    loadingLabel_ = new QLabel("Checking services...");
    loadingLabel_->setAlignment(Qt::AlignCenter);
    loadingLabel_->setStyleSheet("font-size:15px;color:#9faebb;padding:24px;");
    root->addWidget(loadingLabel_);

    statusPanel_ = new QWidget();
    auto* panel = new QVBoxLayout(statusPanel_);
    panel->setContentsMargins(0, 0, 0, 0);
    panel->setSpacing(8);
    panel->addWidget(makeStatusRow("Overall Status", &overallBadge_));
    databaseRow_ = makeStatusRow("PostgreSQL", &databaseBadge_);
    redisRow_ = makeStatusRow("Redis", &redisBadge_);
    panel->addWidget(databaseRow_);
    panel->addWidget(redisRow_);

    errorLabel_ = new QLabel();
    errorLabel_->setWordWrap(true);
    errorLabel_->setTextFormat(Qt::RichText);
    errorLabel_->setStyleSheet(
        "background:#432125;color:#ffd6da;border-left:4px solid #d64545;border-radius:6px;padding:10px;");
    panel->addWidget(errorLabel_);

    lastCheckedLabel_ = new QLabel();
    lastCheckedLabel_->setAlignment(Qt::AlignRight);
    lastCheckedLabel_->setStyleSheet("font-size:11px;color:#8f9ba7;");
    panel->addWidget(lastCheckedLabel_);
    root->addWidget(statusPanel_);
    root->addStretch(1);

    statusBar()->showMessage(QString("Polling %1").arg(NetworkHealthFetcher::healthUrlFor(config_.apiUrl).toString()));
}

void HealthDashboard::setupConnections() {
    connect(poller_, &HealthPoller::stateChanged, this, [this](const HealthState& state) {
        render(state);
    });
}

void HealthDashboard::renderLoading() {
    loadingLabel_->setVisible(true);
    statusPanel_->setVisible(false);
}

void HealthDashboard::applyBadge(QLabel* label, const QString& status) {
    applyBadge(label, badgeFor(status));
}

void HealthDashboard::applyBadge(QLabel* label, const StatusBadge& badge) {
    label->setStyleSheet(badge.styleSheet);
    label->setText(QString("%1 %2").arg(badge.icon, badge.label));
}

void HealthDashboard::render(const HealthState& state) {
    loadingLabel_->setVisible(false);
    statusPanel_->setVisible(true);

    applyBadge(overallBadge_, badgeFor(state));

    const bool hasServices = state.hasComponents();
    databaseRow_->setVisible(hasServices);
    redisRow_->setVisible(hasServices);
    if (hasServices) {
        applyBadge(
            databaseBadge_,
            state.components.contains("database") ? toString(state.components.value("database")) : QString());
        applyBadge(
            redisBadge_,
            state.components.contains("redis") ? toString(state.components.value("redis")) : QString());
    }

    errorLabel_->setVisible(state.hasError());
    if (state.hasError()) {
        errorLabel_->setText(
            QString("<b>Error:</b> %1<br><small>Make sure the API server is running at <code>%2</code></small>")
                .arg(state.error.toHtmlEscaped(), config_.apiUrl.toString().toHtmlEscaped()));
        showMessage(state.error, true);
    } else {
        showMessage(QString("Status: %1").arg(badgeFor(state).label));
    }

    lastCheckedLabel_->setVisible(state.timestamp.isValid());
    if (state.timestamp.isValid()) {
        lastCheckedLabel_->setText(
            QString("Last checked: %1").arg(state.timestamp.toLocalTime().toString("HH:mm:ss")));
    }
}

void HealthDashboard::showMessage(const QString& message, bool error) const {
    if (error) {
        statusBar()->showMessage("ERROR: " + message);
    } else {
        statusBar()->showMessage(message);
    }
}

}  // namespace vitals
