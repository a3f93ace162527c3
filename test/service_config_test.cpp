#include "vitals/service_config.hpp"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using vitals::ApiServerConfig;
using vitals::DashboardConfig;
using vitals::WaitConfig;
using vitals::WaitTarget;

namespace {

QProcessEnvironment envOf(const QMap<QString, QString>& values) {
    return vitals::mergedEnvironment(QProcessEnvironment(), values);
}

}  // namespace

TEST(ServiceConfigTest, EnvIntFallsBackAndClamps) {
    const QProcessEnvironment env = envOf({{"A", "12"}, {"B", "junk"}, {"C", "-4"}, {"D", " 7 "}});
    EXPECT_EQ(vitals::envInt(env, "A", 1, 0, 100), 12);
    EXPECT_EQ(vitals::envInt(env, "B", 5, 0, 100), 5);
    EXPECT_EQ(vitals::envInt(env, "C", 5, 1, 100), 1);
    EXPECT_EQ(vitals::envInt(env, "D", 5, 0, 100), 7);
    EXPECT_EQ(vitals::envInt(env, "MISSING", 9, 0, 100), 9);
}

TEST(ServiceConfigTest, ApiServerDefaultsToLocalDataStore) {
    const ApiServerConfig config = ApiServerConfig::fromEnvironment(envOf({}));
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(config.hasDatabase());
    EXPECT_EQ(config.redisUrl, QUrl("redis://localhost:6379"));

    const vitals::DataStoreSettings settings = config.dataStoreSettings();
    EXPECT_EQ(settings.host, "localhost");
    EXPECT_EQ(settings.port, 5432);
    EXPECT_EQ(settings.driver, "QPSQL");
}

TEST(ServiceConfigTest, ApiServerReadsUrls) {
    const ApiServerConfig config = ApiServerConfig::fromEnvironment(envOf({
        {"PORT", "9000"},
        {"DATABASE_URL", "postgres://app:pw@db:5433/shop"},
        {"REDIS_URL", "redis://cache:6380"},
        {"PROBE_TIMEOUT_MS", "2500"},
    }));
    EXPECT_EQ(config.port, 9000);
    ASSERT_TRUE(config.hasDatabase());
    EXPECT_EQ(config.redisUrl.host(), "cache");

    const vitals::DataStoreSettings settings = config.dataStoreSettings();
    EXPECT_EQ(settings.host, "db");
    EXPECT_EQ(settings.port, 5433);
    EXPECT_EQ(settings.databaseName, "shop");
    EXPECT_EQ(settings.timeoutMs, 2500);
}

TEST(ServiceConfigTest, DatabaseUrlBuiltFromParts) {
    const ApiServerConfig config = ApiServerConfig::fromEnvironment(envOf({
        {"DB_HOST", "postgres"},
        {"DB_NAME", "shop"},
        {"DB_USER", "app"},
        {"DB_PASSWORD", "pw"},
    }));
    ASSERT_TRUE(config.hasDatabase());
    const vitals::DataStoreSettings settings = config.dataStoreSettings();
    EXPECT_EQ(settings.host, "postgres");
    EXPECT_EQ(settings.port, 5432);
    EXPECT_EQ(settings.user, "app");
    EXPECT_EQ(settings.password, "pw");
    EXPECT_EQ(settings.databaseName, "shop");
}

TEST(ServiceConfigTest, DashboardConfig) {
    const DashboardConfig defaults = DashboardConfig::fromEnvironment(envOf({}));
    EXPECT_EQ(defaults.apiUrl, QUrl("http://localhost:8080"));
    EXPECT_EQ(defaults.pollIntervalMs, 5000);

    const DashboardConfig custom = DashboardConfig::fromEnvironment(envOf({
        {"API_URL", "http://api.internal:9000"},
        {"POLL_INTERVAL_MS", "1000"},
    }));
    EXPECT_EQ(custom.apiUrl.host(), "api.internal");
    EXPECT_EQ(custom.pollIntervalMs, 1000);
}

TEST(ServiceConfigTest, WaitConfigDefaultsAndTargets) {
    const WaitConfig config = WaitConfig::fromEnvironment(envOf({}));
    EXPECT_EQ(config.maxWaitSec, 60);
    EXPECT_EQ(config.intervalSec, 2);

    const QVector<WaitTarget> targets = config.defaultTargets();
    ASSERT_EQ(targets.size(), 4);
    EXPECT_EQ(targets.at(0).name, "API");
    EXPECT_EQ(targets.at(0).url, QUrl("http://localhost:8080/health"));
    EXPECT_EQ(targets.at(1).name, "Frontend");
    EXPECT_EQ(targets.at(1).url, QUrl("http://localhost:3000"));
    EXPECT_EQ(targets.at(2).url, QUrl("http://localhost:8080/api/health/db"));
    EXPECT_EQ(targets.at(3).url, QUrl("http://localhost:8080/api/health/redis"));
}

TEST(ServiceConfigTest, WaitConfigClampsInterval) {
    const WaitConfig config = WaitConfig::fromEnvironment(envOf({
        {"MAX_WAIT", "10"},
        {"CHECK_INTERVAL", "0"},
        {"API_HOST", "api"},
        {"API_PORT", "9090"},
    }));
    EXPECT_EQ(config.maxWaitSec, 10);
    EXPECT_EQ(config.intervalSec, 1);
    EXPECT_EQ(config.apiBaseUrl(), "http://api:9090");
}

TEST(ServiceConfigTest, LoadsEnvFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(".env");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write(
        "# comment\n"
        "\n"
        "MAX_WAIT=30\n"
        "export API_PORT=9090\n"
        "DB_PASSWORD=\"p#w d\"\n"
        "FRONTEND_PORT=4000 # trailing\n"
        "not a pair\n");
    file.close();

    const QMap<QString, QString> values = vitals::loadEnvFile(path);
    EXPECT_EQ(values.size(), 4);
    EXPECT_EQ(values.value("MAX_WAIT"), "30");
    EXPECT_EQ(values.value("API_PORT"), "9090");
    EXPECT_EQ(values.value("DB_PASSWORD"), "p#w d");
    EXPECT_EQ(values.value("FRONTEND_PORT"), "4000");

    EXPECT_TRUE(vitals::loadEnvFile(dir.filePath("missing.env")).isEmpty());
}

TEST(ServiceConfigTest, EnvFileOverridesProcessEnvironment) {
    const QProcessEnvironment merged = vitals::mergedEnvironment(
        envOf({{"MAX_WAIT", "60"}, {"API_HOST", "localhost"}}),
        {{"MAX_WAIT", "5"}});
    EXPECT_EQ(merged.value("MAX_WAIT"), "5");
    EXPECT_EQ(merged.value("API_HOST"), "localhost");
}

TEST(ServiceConfigTest, ParsesTargetSpecs) {
    const WaitTarget target = vitals::parseTargetSpec("Worker=http://worker:7000/ready");
    EXPECT_EQ(target.name, "Worker");
    EXPECT_EQ(target.url, QUrl("http://worker:7000/ready"));

    EXPECT_TRUE(vitals::parseTargetSpec("no-equals").name.isEmpty());
    EXPECT_TRUE(vitals::parseTargetSpec("=http://x:1").name.isEmpty());
    EXPECT_TRUE(vitals::parseTargetSpec("Bad=not a url").name.isEmpty());
}
