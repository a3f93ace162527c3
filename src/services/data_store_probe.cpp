#include "vitals/data_store_probe.hpp"

#include <QElapsedTimer>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>
#include <QVariant>

#include <utility>

#include "vitals/telemetry.hpp"

namespace vitals {

DataStoreSettings DataStoreSettings::fromUrl(const QUrl& url) {
    DataStoreSettings settings;
    if (!url.host().isEmpty()) {
        settings.host = url.host();
    }
    settings.port = url.port(5432);
    settings.user = url.userName(QUrl::FullyDecoded);
    settings.password = url.password(QUrl::FullyDecoded);
    QString path = url.path(QUrl::FullyDecoded);
    if (path.startsWith('/')) {
        path.remove(0, 1);
    }
    settings.databaseName = path;
    return settings;
}

QString DataStoreSettings::connectOptions() const {
    if (driver != "QPSQL") {
        return {};
    }
    // A partitioned peer never answers; tcp_user_timeout and keepalives
    // bound the client-side read that statement_timeout cannot.
    const int seconds = qMax(1, timeoutMs / 1000);
    return QStringList{
        QString("connect_timeout=%1").arg(seconds),
        QString("tcp_user_timeout=%1").arg(qMax(1, timeoutMs)),
        "keepalives=1",
        "keepalives_idle=1",
        "keepalives_interval=1",
        QString("keepalives_count=%1").arg(seconds),
    }.join(';');
}

DataStoreProbe::DataStoreProbe(DataStoreSettings settings)
    : settings_(std::move(settings)) {
    db_ = QSqlDatabase::addDatabase(settings_.driver, settings_.connectionName);
    db_.setHostName(settings_.host);
    db_.setPort(settings_.port);
    db_.setDatabaseName(settings_.databaseName);
    db_.setUserName(settings_.user);
    db_.setPassword(settings_.password);
    db_.setConnectOptions(settings_.connectOptions());
}

DataStoreProbe::~DataStoreProbe() {
    close();
    db_ = QSqlDatabase();
    QSqlDatabase::removeDatabase(settings_.connectionName);
}

void DataStoreProbe::close() {
    if (db_.isOpen()) {
        db_.close();
    }
}

void DataStoreProbe::ensureOpen() {
    if (db_.isOpen()) {
        return;
    }
    if (!db_.isValid()) {
        throw ProbeError(QString("SQL driver %1 is not available.").arg(settings_.driver));
    }
    if (!db_.open()) {
        throw ProbeError(db_.lastError().text());
    }
    if (settings_.driver == "QPSQL") {
        QSqlQuery limit(db_);
        if (!limit.exec(QString("SET statement_timeout = %1").arg(settings_.timeoutMs))) {
            const QString error = limit.lastError().text();
            db_.close();
            throw ProbeError(error);
        }
    }
}

bool DataStoreProbe::check() {
    QElapsedTimer elapsed;
    elapsed.start();
    ensureOpen();

    QSqlQuery query(db_);
    query.setForwardOnly(true);
    if (!query.exec(settings_.query)) {
        const QString error = query.lastError().text();
        query.finish();
        db_.close();
        throw ProbeError(error);
    }

    int rows = 0;
    QVariant first;
    while (query.next()) {
        if (rows == 0) {
            first = query.value(0);
        }
        rows++;
    }
    query.finish();
    Telemetry::instance().recordDurationMs("probe.database.query_ms", elapsed.elapsed());

    if (rows != 1) {
        throw ProbeError(QString("Expected exactly one row from probe query, got %1.").arg(rows));
    }
    bool ok = false;
    const int value = first.toInt(&ok);
    if (!ok || value != 1) {
        throw ProbeError(QString("Unexpected probe query result: %1").arg(first.toString()));
    }
    return true;
}

}  // namespace vitals
