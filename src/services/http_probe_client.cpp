#include "vitals/http_probe_client.hpp"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <memory>

#include "vitals/telemetry.hpp"

namespace vitals {

HttpProbeResult HttpProbeClient::get(const QUrl& url, int timeoutMs) {
    HttpProbeResult result;
    if ((url.scheme() != "http" && url.scheme() != "https") || url.host().isEmpty()) {
        result.error = QString("Unsupported probe URL: %1").arg(url.toString());
        return result;
    }

    QElapsedTimer elapsed;
    elapsed.start();
    Telemetry::instance().incrementCounter("http_probe.requests");

    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setTransferTimeout(timeoutMs);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    request.setHeader(QNetworkRequest::UserAgentHeader, "vitals-wait");
    request.setRawHeader("Accept", "*/*");

    const std::unique_ptr<QNetworkReply> reply(manager.get(request));

    // The transfer timeout only measures inactivity; the deadline bounds the
    // whole attempt.
    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    bool deadlineHit = false;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&]() {
        deadlineHit = true;
        reply->abort();
    });
    if (!reply->isFinished()) {
        deadline.start(qMax(1, timeoutMs));
        loop.exec(QEventLoop::ExcludeUserInputEvents);
    }
    deadline.stop();
    Telemetry::instance().recordDurationMs("http_probe.duration_ms", elapsed.elapsed());

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    result.statusCode = statusAttr.isValid() ? statusAttr.toInt() : 0;
    result.body = reply->readAll();

    const QNetworkReply::NetworkError error = reply->error();
    // Nothing else aborts the reply, so a cancel means a timer expired.
    result.timedOut = deadlineHit || error == QNetworkReply::TimeoutError
                      || (result.statusCode == 0 && error == QNetworkReply::OperationCanceledError);
    if (result.timedOut) {
        result.error = QString("Timed out after %1 ms.").arg(timeoutMs);
        Telemetry::instance().incrementCounter("http_probe.timeouts");
    } else if (result.statusCode == 0 && error != QNetworkReply::NoError) {
        result.error = reply->errorString();
        Telemetry::instance().incrementCounter("http_probe.connect_failures");
    }
    return result;
}

}  // namespace vitals
