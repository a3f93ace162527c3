#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QProcessEnvironment>
#include <QTextStream>

#include <cstdio>
#include <unistd.h>

#include "vitals/readiness_waiter.hpp"
#include "vitals/service_config.hpp"
#include "vitals/telemetry.hpp"

namespace {

const char* kGreen = "\033[0;32m";
const char* kRed = "\033[0;31m";
const char* kBlue = "\033[0;34m";
const char* kBold = "\033[1m";
const char* kReset = "\033[0m";
const char* kRule = "━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━";

int parseSeconds(const QString& text, int fallback, int minValue) {
    bool ok = false;
    const int value = text.toInt(&ok);
    return ok ? qMax(minValue, value) : fallback;
}

void printSummary(
    QTextStream& out,
    const QVector<vitals::TargetOutcome>& outcomes,
    const vitals::WaitConfig& config,
    bool usingDefaults) {
    out << "\n";
    int failed = 0;
    for (const vitals::TargetOutcome& outcome : outcomes) {
        if (outcome.ready) {
            out << "  " << kGreen << "✅ " << outcome.name << " is healthy" << kReset << "\n";
        } else {
            out << "  " << kRed << "❌ " << outcome.name << " health check failed";
            if (!outcome.lastError.isEmpty()) {
                out << " (" << outcome.lastError << ")";
            }
            out << kReset << "\n";
            failed++;
        }
    }

    out << "\n" << kBlue << kRule << kReset << "\n";
    if (failed == 0) {
        out << kGreen << kBold << "🎉 All services are healthy!" << kReset << "\n";
        if (usingDefaults) {
            out << "\n" << kBold << "Access Your Application:" << kReset << "\n\n";
            out << "  " << kBold << "Frontend:" << kReset << "  " << config.frontendBaseUrl() << "\n";
            out << "  " << kBold << "API:" << kReset << "       " << config.apiBaseUrl() << "\n";
        }
    } else {
        out << kRed << kBold << "❌ " << failed << " service(s) failed health checks" << kReset << "\n";
        out << "\n" << kBold << "Troubleshooting:" << kReset << "\n\n";
        out << "  " << kBlue << "•" << kReset << " Check service logs and that every container is running\n";
        out << "  " << kBlue << "•" << kReset << " Raise the budget with --max-wait or MAX_WAIT\n";
        out << "  " << kBlue << "•" << kReset << " Probe a single target with --target NAME=URL\n";
    }
    out << "\n";
    out.flush();
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("vitals-wait");

    QCommandLineParser parser;
    parser.setApplicationDescription("Wait in parallel until every service answers its health URL.");
    parser.addHelpOption();
    const QCommandLineOption maxWaitOption("max-wait", "Budget per target in seconds.", "seconds");
    const QCommandLineOption intervalOption("interval", "Seconds between attempts.", "seconds");
    const QCommandLineOption attemptTimeoutOption("attempt-timeout", "Per-attempt timeout in ms.", "ms");
    const QCommandLineOption targetOption("target", "Target as NAME=URL; repeatable.", "spec");
    const QCommandLineOption noProgressOption("no-progress", "Disable the progress spinner.");
    const QCommandLineOption envFileOption("env-file", "Environment file to load.", "path", ".env");
    parser.addOptions({maxWaitOption, intervalOption, attemptTimeoutOption, targetOption, noProgressOption, envFileOption});
    parser.process(app);

    const QProcessEnvironment env = vitals::mergedEnvironment(
        QProcessEnvironment::systemEnvironment(),
        vitals::loadEnvFile(parser.value(envFileOption)));
    vitals::WaitConfig config = vitals::WaitConfig::fromEnvironment(env);
    if (parser.isSet(maxWaitOption)) {
        config.maxWaitSec = parseSeconds(parser.value(maxWaitOption), config.maxWaitSec, 0);
    }
    if (parser.isSet(intervalOption)) {
        config.intervalSec = parseSeconds(parser.value(intervalOption), config.intervalSec, 1);
    }
    if (parser.isSet(attemptTimeoutOption)) {
        config.attemptTimeoutMs = parseSeconds(parser.value(attemptTimeoutOption), config.attemptTimeoutMs, 100);
    }

    QVector<vitals::WaitTarget> targets;
    for (const QString& spec : parser.values(targetOption)) {
        const vitals::WaitTarget target = vitals::parseTargetSpec(spec);
        if (target.name.isEmpty()) {
            qCritical("Invalid --target '%s', expected NAME=http://host:port/path", qPrintable(spec));
            return 1;
        }
        targets.append(target);
    }
    const bool usingDefaults = targets.isEmpty();
    if (usingDefaults) {
        targets = config.defaultTargets();
    }

    QTextStream out(stdout);
    out << "\n" << kBlue << kBold << "🏥 Running Health Checks" << kReset << "\n";
    out << kBlue << kRule << kReset << "\n\n";
    out.flush();

    vitals::WaitSettings settings;
    settings.maxWaitSec = config.maxWaitSec;
    settings.intervalSec = config.intervalSec;
    settings.attemptTimeoutMs = config.attemptTimeoutMs;
    const vitals::ReadinessWaiter waiter(settings);

    const bool showProgress = !parser.isSet(noProgressOption) && isatty(fileno(stderr)) != 0;
    int spinIndex = 0;
    const auto spinner = [&spinIndex]() {
        static const char frames[] = {'-', '\\', '|', '/'};
        spinIndex = (spinIndex + 1) % 4;
        std::fprintf(stderr, "\r  %sChecking services... %c%s", kBlue, frames[spinIndex], kReset);
        std::fflush(stderr);
    };

    const QVector<vitals::TargetOutcome> outcomes =
        waiter.waitForAll(targets, showProgress ? vitals::ReadinessWaiter::ProgressTick(spinner) : nullptr);
    if (showProgress) {
        std::fprintf(stderr, "\r\033[K");
        std::fflush(stderr);
    }

    printSummary(out, outcomes, config, usingDefaults);
    if (outcomes.size() != targets.size()) {
        qCritical("Only %d of %d targets reported an outcome.", int(outcomes.size()), int(targets.size()));
    }
    vitals::Telemetry::instance().exportToFile(
        QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json"));
    return vitals::ReadinessWaiter::allReady(outcomes, static_cast<int>(targets.size())) ? 0 : 1;
}
