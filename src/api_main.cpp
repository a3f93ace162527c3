#include <QCoreApplication>
#include <QDir>
#include <QProcessEnvironment>
#include <QTimer>
#include <QVector>

#include <csignal>

#include "vitals/api_server.hpp"
#include "vitals/cache_probe.hpp"
#include "vitals/data_store_probe.hpp"
#include "vitals/health_aggregator.hpp"
#include "vitals/health_endpoints.hpp"
#include "vitals/redis_client.hpp"
#include "vitals/service_config.hpp"
#include "vitals/telemetry.hpp"

namespace {

volatile std::sig_atomic_t shutdownRequested = 0;

void requestShutdown(int) {
    shutdownRequested = 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("vitals-api");

    const vitals::ApiServerConfig config =
        vitals::ApiServerConfig::fromEnvironment(QProcessEnvironment::systemEnvironment());
    if (!config.hasDatabase()) {
        qWarning("No DATABASE_URL or DB_NAME set: probing the default data store at localhost:5432.");
    }

    vitals::DataStoreProbe databaseProbe(config.dataStoreSettings());
    vitals::RedisClient redis(config.redisUrl);
    vitals::CacheProbe cacheProbe(redis);
    const vitals::HealthAggregator aggregator(QVector<vitals::DependencyProbe*>{&databaseProbe, &cacheProbe});
    const vitals::HealthEndpoints endpoints(aggregator);
    vitals::ApiServer server(endpoints);

    QString listenError;
    if (!server.listen(config.port, &listenError)) {
        qCritical("Failed to listen on port %d: %s", config.port, qPrintable(listenError));
        return 1;
    }
    redis.connectToServer();

    qInfo("API server running on http://localhost:%d", server.serverPort());
    qInfo("API endpoints available at /api/*");
    qInfo("Health check available at /health");

    std::signal(SIGINT, requestShutdown);
    std::signal(SIGTERM, requestShutdown);
    QTimer shutdownWatch;
    shutdownWatch.setInterval(200);
    QObject::connect(&shutdownWatch, &QTimer::timeout, &app, []() {
        if (shutdownRequested != 0) {
            qInfo("Shutdown signal received: closing HTTP server");
            QCoreApplication::quit();
        }
    });
    shutdownWatch.start();

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        server.close();
        redis.quit();
        databaseProbe.close();
        vitals::Telemetry::instance().exportToFile(
            QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json"));
    });

    return QCoreApplication::exec();
}
