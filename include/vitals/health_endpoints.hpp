#pragma once

#include <QJsonObject>
#include <QString>

#include "vitals/health_aggregator.hpp"

namespace vitals {

struct EndpointResponse {
    int statusCode = 200;
    QJsonObject body;
};

// Status code and body for every health route, independent of the HTTP
// server that carries them.
class HealthEndpoints {
public:
    static constexpr int kOk = 200;
    static constexpr int kServiceUnavailable = 503;

    explicit HealthEndpoints(const HealthAggregator& aggregator, QString version = "1.0.0");

    EndpointResponse composite() const;
    EndpointResponse component(const QString& name) const;
    EndpointResponse database() const { return component("database"); }
    EndpointResponse redis() const { return component("redis"); }
    EndpointResponse index() const;

private:
    const HealthAggregator& aggregator_;
    QString version_;
};

}  // namespace vitals
