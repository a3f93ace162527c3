#include "vitals/redis_client.hpp"

#include <QtGlobal>

#include "vitals/telemetry.hpp"

namespace vitals {

RedisClient::RedisClient(const QUrl& url, QObject* parent)
    : QObject(parent),
      url_(url) {
    reconnectTimer_.setSingleShot(true);
    connect(&reconnectTimer_, &QTimer::timeout, this, &RedisClient::connectToServer);
    connect(&socket_, &QTcpSocket::connected, this, &RedisClient::onConnected);
    connect(&socket_, &QTcpSocket::stateChanged, this, &RedisClient::onStateChanged);
    connect(&socket_, &QTcpSocket::errorOccurred, this, &RedisClient::onErrorOccurred);
    connect(&socket_, &QTcpSocket::readyRead, this, &RedisClient::onReadyRead);
}

RedisClient::~RedisClient() {
    stopping_ = true;
    reconnectTimer_.stop();
    socket_.abort();
}

QByteArray RedisClient::encodeCommand(const QStringList& arguments) {
    QByteArray out = "*" + QByteArray::number(arguments.size()) + "\r\n";
    for (const QString& argument : arguments) {
        const QByteArray bytes = argument.toUtf8();
        out += "$" + QByteArray::number(bytes.size()) + "\r\n" + bytes + "\r\n";
    }
    return out;
}

void RedisClient::connectToServer() {
    if (stopping_ || socket_.state() != QAbstractSocket::UnconnectedState) {
        return;
    }
    socket_.connectToHost(url_.host().isEmpty() ? QString("localhost") : url_.host(), url_.port(6379));
}

void RedisClient::quit(int timeoutMs) {
    stopping_ = true;
    reconnectTimer_.stop();
    if (socket_.state() == QAbstractSocket::ConnectedState) {
        socket_.write(encodeCommand({"QUIT"}));
        socket_.flush();
        socket_.disconnectFromHost();
        if (socket_.state() != QAbstractSocket::UnconnectedState) {
            socket_.waitForDisconnected(timeoutMs);
        }
    } else {
        socket_.abort();
    }
    if (connected_.exchange(false)) {
        Telemetry::instance().setGauge("redis.connected", 0);
    }
}

void RedisClient::onConnected() {
    reconnectAttempts_ = 0;
    lastError_.clear();

    const QString password = url_.password(QUrl::FullyDecoded);
    if (!password.isEmpty()) {
        const QString user = url_.userName(QUrl::FullyDecoded);
        socket_.write(user.isEmpty() || user == "default"
                          ? encodeCommand({"AUTH", password})
                          : encodeCommand({"AUTH", user, password}));
    }
    const QString dbIndex = url_.path().mid(1);
    bool ok = false;
    const int db = dbIndex.toInt(&ok);
    if (ok && db > 0) {
        socket_.write(encodeCommand({"SELECT", QString::number(db)}));
    }

    connected_.store(true);
    Telemetry::instance().setGauge("redis.connected", 1);
    Telemetry::instance().recordEvent("redis_connected", {{"host", url_.host()}, {"port", url_.port(6379)}});
    qInfo("Connected to Redis at %s:%d", qPrintable(url_.host()), url_.port(6379));
    emit connectionChanged(true);
}

void RedisClient::onStateChanged(QAbstractSocket::SocketState state) {
    if (state != QAbstractSocket::UnconnectedState) {
        return;
    }
    if (connected_.exchange(false)) {
        Telemetry::instance().setGauge("redis.connected", 0);
        Telemetry::instance().recordEvent("redis_disconnected", {{"host", url_.host()}});
        emit connectionChanged(false);
    }
    scheduleReconnect();
}

void RedisClient::onErrorOccurred(QAbstractSocket::SocketError error) {
    if (error == QAbstractSocket::RemoteHostClosedError && stopping_) {
        return;
    }
    lastError_ = socket_.errorString();
    Telemetry::instance().incrementCounter("redis.errors");
    Telemetry::instance().recordEvent("redis_error", {{"error", lastError_}});
    qWarning("Redis client error: %s", qPrintable(lastError_));
}

void RedisClient::onReadyRead() {
    const QByteArray reply = socket_.readAll();
    for (const QByteArray& line : reply.split('\n')) {
        if (line.startsWith('-')) {
            lastError_ = QString::fromUtf8(line.mid(1).trimmed());
            Telemetry::instance().recordEvent("redis_reply_error", {{"error", lastError_}});
            qWarning("Redis replied with error: %s", qPrintable(lastError_));
        }
    }
}

void RedisClient::scheduleReconnect() {
    if (stopping_ || reconnectTimer_.isActive()) {
        return;
    }
    reconnectAttempts_++;
    reconnectTimer_.start(qMin(reconnectAttempts_ * 50, 500));
}

}  // namespace vitals
