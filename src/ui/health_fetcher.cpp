#include "vitals/health_fetcher.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkReply>
#include <QNetworkRequest>

#include "vitals/telemetry.hpp"

namespace vitals {

NetworkHealthFetcher::NetworkHealthFetcher(const QUrl& apiUrl, int timeoutMs, QObject* parent)
    : QObject(parent),
      healthUrl_(healthUrlFor(apiUrl)),
      timeoutMs_(timeoutMs) {}

QUrl NetworkHealthFetcher::healthUrlFor(const QUrl& apiUrl) {
    QString base = apiUrl.toString(QUrl::StripTrailingSlash);
    while (base.endsWith('/')) {
        base.chop(1);
    }
    return QUrl(base + "/health");
}

HealthState NetworkHealthFetcher::stateFromReply(
    int httpStatus,
    const QByteArray& body,
    const QString& transportError) {
    if (httpStatus <= 0) {
        if (!transportError.isEmpty()) {
            Telemetry::instance().recordEvent("poll_transport_error", {{"error", transportError}});
        }
        return HealthState::failed(kConnectError);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        Telemetry::instance().recordEvent(
            "poll_bad_body",
            {
                {"http_status", httpStatus},
                {"error", parseError.errorString()},
            });
        return HealthState::failed(kConnectError);
    }

    HealthState state = HealthState::fromJson(doc.object());
    if (!state.timestamp.isValid()) {
        state.timestamp = QDateTime::currentDateTimeUtc();
    }
    return state;
}

void NetworkHealthFetcher::fetch(Completion done) {
    QNetworkRequest request(healthUrl_);
    request.setTransferTimeout(timeoutMs_);
    request.setRawHeader("Accept", "application/json");

    QNetworkReply* reply = manager_.get(request);
    connect(reply, &QNetworkReply::finished, this, [reply, done = std::move(done)]() {
        reply->deleteLater();
        const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        const int httpStatus = statusAttr.isValid() ? statusAttr.toInt() : 0;
        const QString transportError = reply->error() == QNetworkReply::NoError ? QString() : reply->errorString();
        const HealthState state = stateFromReply(httpStatus, reply->readAll(), transportError);
        if (done) {
            done(state);
        }
    });
}

void NetworkHealthFetcher::cancelAll() {
    const QList<QNetworkReply*> replies = manager_.findChildren<QNetworkReply*>();
    for (QNetworkReply* reply : replies) {
        disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
    }
}

}  // namespace vitals
