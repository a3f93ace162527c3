#pragma once

#include <QHttpServer>
#include <QHttpServerResponse>
#include <QString>
#include <QTcpServer>

#include "vitals/health_endpoints.hpp"

namespace vitals {

// Binds the health routes onto a Qt HTTP server. Handlers run on the
// thread that owns the server.
class ApiServer {
public:
    explicit ApiServer(const HealthEndpoints& endpoints);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    bool listen(quint16 port, QString* error = nullptr);
    void close();

    [[nodiscard]] quint16 serverPort() const;

private:
    void registerRoutes();
    static QHttpServerResponse toResponse(const EndpointResponse& response);

    const HealthEndpoints& endpoints_;
    QHttpServer server_;
    QTcpServer* tcpServer_ = nullptr;
};

}  // namespace vitals
