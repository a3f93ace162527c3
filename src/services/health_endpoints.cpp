#include "vitals/health_endpoints.hpp"

#include <utility>

#include "vitals/telemetry.hpp"

namespace vitals {

HealthEndpoints::HealthEndpoints(const HealthAggregator& aggregator, QString version)
    : aggregator_(aggregator),
      version_(std::move(version)) {}

EndpointResponse HealthEndpoints::composite() const {
    const HealthState state = aggregator_.evaluate();
    Telemetry::instance().incrementCounter("http.health.composite");
    return {state.isHealthy() ? kOk : kServiceUnavailable, state.toJson()};
}

EndpointResponse HealthEndpoints::component(const QString& name) const {
    const ComponentReading reading = aggregator_.readComponent(name);
    Telemetry::instance().incrementCounter("http.health." + name);
    return {reading.isHealthy() ? kOk : kServiceUnavailable, reading.toJson()};
}

EndpointResponse HealthEndpoints::index() const {
    return {
        kOk,
        {
            {"message", "Vitals API"},
            {"version", version_},
            {"endpoints",
             QJsonObject{
                 {"health", "/api/health"},
                 {"healthDb", "/api/health/db"},
                 {"healthRedis", "/api/health/redis"},
             }},
        },
    };
}

}  // namespace vitals
