#pragma once

#include <QNetworkAccessManager>
#include <QObject>
#include <QUrl>

#include <functional>

#include "vitals/health_state.hpp"

class QNetworkReply;

namespace vitals {

// Asynchronous source of HealthState. Completion is delivered on the
// fetcher's thread, exactly once per fetch() unless cancelled.
class HealthFetcher {
public:
    using Completion = std::function<void(const HealthState& state)>;

    virtual ~HealthFetcher() = default;

    virtual void fetch(Completion done) = 0;
    // Drops every in-flight request without invoking its completion.
    virtual void cancelAll() = 0;
};

class NetworkHealthFetcher final : public QObject, public HealthFetcher {
    Q_OBJECT

public:
    static constexpr const char* kConnectError = "Failed to connect to API";

    explicit NetworkHealthFetcher(const QUrl& apiUrl, int timeoutMs = 5000, QObject* parent = nullptr);

    void fetch(Completion done) override;
    void cancelAll() override;

    static QUrl healthUrlFor(const QUrl& apiUrl);
    // A reply carrying an HTTP status (503 included) is a HealthState; a
    // missing status or unparsable body becomes an error state.
    static HealthState stateFromReply(int httpStatus, const QByteArray& body, const QString& transportError);

private:
    QNetworkAccessManager manager_;
    QUrl healthUrl_;
    int timeoutMs_;
};

}  // namespace vitals
