#pragma once

#include <QByteArray>
#include <QString>
#include <QUrl>

namespace vitals {

struct HttpProbeResult {
    int statusCode = 0;
    QByteArray body;
    QString error;
    bool timedOut = false;

    [[nodiscard]] bool success() const {
        return error.isEmpty() && !timedOut && statusCode >= 200 && statusCode < 300;
    }
};

// One blocking GET bounded by timeoutMs end to end, host lookup included.
// Safe to call from any thread; the network manager and event loop live on
// the calling thread for the duration of the call. Redirects are not
// followed.
class HttpProbeClient {
public:
    static HttpProbeResult get(const QUrl& url, int timeoutMs = 5000);
};

}  // namespace vitals
