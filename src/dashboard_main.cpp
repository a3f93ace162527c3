#include <QApplication>
#include <QDir>
#include <QProcessEnvironment>

#include "vitals/health_dashboard.hpp"
#include "vitals/service_config.hpp"
#include "vitals/telemetry.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("Vitals");
    QObject::connect(&app, &QCoreApplication::aboutToQuit, []() {
        const QString path = QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json");
        vitals::Telemetry::instance().exportToFile(path);
    });

    const vitals::DashboardConfig config =
        vitals::DashboardConfig::fromEnvironment(QProcessEnvironment::systemEnvironment());
    vitals::HealthDashboard window(config);
    window.show();

    return QApplication::exec();
}
