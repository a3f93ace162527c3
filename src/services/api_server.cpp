#include "vitals/api_server.hpp"

#include <QHostAddress>
#include <QHttpServerRequest>
#include <QHttpServerResponder>

#include <memory>

#include "vitals/telemetry.hpp"

namespace vitals {

ApiServer::ApiServer(const HealthEndpoints& endpoints)
    : endpoints_(endpoints) {
    registerRoutes();
}

ApiServer::~ApiServer() {
    close();
}

QHttpServerResponse ApiServer::toResponse(const EndpointResponse& response) {
    Telemetry::instance().incrementCounter(QString("http.status.%1").arg(response.statusCode));
    return QHttpServerResponse(
        response.body,
        static_cast<QHttpServerResponder::StatusCode>(response.statusCode));
}

void ApiServer::registerRoutes() {
    const auto get = QHttpServerRequest::Method::Get;

    // Bare path for platform liveness/readiness probes.
    server_.route("/health", get, [this](const QHttpServerRequest&) {
        return toResponse(endpoints_.composite());
    });
    server_.route("/api/health", get, [this](const QHttpServerRequest&) {
        return toResponse(endpoints_.composite());
    });
    server_.route("/api/health/db", get, [this](const QHttpServerRequest&) {
        return toResponse(endpoints_.database());
    });
    server_.route("/api/health/redis", get, [this](const QHttpServerRequest&) {
        return toResponse(endpoints_.redis());
    });
    server_.route("/api", get, [this](const QHttpServerRequest&) {
        return toResponse(endpoints_.index());
    });
    server_.route("/api/", get, [this](const QHttpServerRequest&) {
        return toResponse(endpoints_.index());
    });
}

bool ApiServer::listen(quint16 port, QString* error) {
    auto listener = std::make_unique<QTcpServer>();
    if (!listener->listen(QHostAddress::Any, port)) {
        if (error != nullptr) {
            *error = listener->errorString();
        }
        return false;
    }
    // The HTTP server takes ownership of the listener.
    tcpServer_ = listener.release();
    server_.bind(tcpServer_);
    Telemetry::instance().recordEvent("api_listening", {{"port", tcpServer_->serverPort()}});
    return true;
}

void ApiServer::close() {
    if (tcpServer_ != nullptr && tcpServer_->isListening()) {
        tcpServer_->close();
    }
}

quint16 ApiServer::serverPort() const {
    return tcpServer_ != nullptr ? tcpServer_->serverPort() : 0;
}

}  // namespace vitals
