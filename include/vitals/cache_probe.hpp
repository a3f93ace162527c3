#pragma once

#include "vitals/dependency_probe.hpp"
#include "vitals/redis_client.hpp"

namespace vitals {

// Reports the client's connection flag instead of issuing PING. A dropped
// connection the socket has not noticed yet still reads healthy. When the
// flag is down the client's last error becomes the diagnostic.
class CacheProbe final : public DependencyProbe {
public:
    explicit CacheProbe(const RedisClient& client) : client_(client) {}

    [[nodiscard]] QString name() const override { return "redis"; }
    bool check() override {
        if (client_.isOpen()) {
            return true;
        }
        const QString error = client_.lastError();
        if (!error.isEmpty()) {
            throw ProbeError(error);
        }
        return false;
    }

private:
    const RedisClient& client_;
};

}  // namespace vitals
