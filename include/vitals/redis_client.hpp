#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTcpSocket>
#include <QTimer>
#include <QUrl>

#include <atomic>

namespace vitals {

// Owns one connection to the cache. The connected flag mirrors the socket
// state as last reported by Qt, so a silently dropped peer stays "open"
// until the socket notices.
class RedisClient final : public QObject {
    Q_OBJECT

public:
    explicit RedisClient(const QUrl& url, QObject* parent = nullptr);
    ~RedisClient() override;

    void connectToServer();
    // Sends QUIT and stops reconnecting.
    void quit(int timeoutMs = 1000);

    [[nodiscard]] bool isOpen() const { return connected_.load(); }
    // Last socket or reply error; cleared on connect.
    [[nodiscard]] QString lastError() const { return lastError_; }

    static QByteArray encodeCommand(const QStringList& arguments);

signals:
    void connectionChanged(bool connected);

private:
    void onConnected();
    void onStateChanged(QAbstractSocket::SocketState state);
    void onErrorOccurred(QAbstractSocket::SocketError error);
    void onReadyRead();
    void scheduleReconnect();

    QUrl url_;
    QTcpSocket socket_;
    QTimer reconnectTimer_;
    std::atomic<bool> connected_{false};
    QString lastError_;
    int reconnectAttempts_ = 0;
    bool stopping_ = false;
};

}  // namespace vitals
