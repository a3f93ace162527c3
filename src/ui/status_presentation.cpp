#include "vitals/status_presentation.hpp"

namespace vitals {

namespace {

const char* kBadgeBase = "font-size:15px;font-weight:700;padding:6px 12px;border-radius:12px;";

StatusBadge makeBadge(BadgeTone tone, const QString& label) {
    StatusBadge badge;
    badge.tone = tone;
    badge.label = label;
    switch (tone) {
    case BadgeTone::Positive:
        badge.icon = QString::fromUtf8("✓");
        badge.styleSheet = QString(kBadgeBase) + "background:#23412a;color:#d7f3dd;";
        break;
    case BadgeTone::Negative:
        badge.icon = QString::fromUtf8("✗");
        badge.styleSheet = QString(kBadgeBase) + "background:#4a252a;color:#ffd6da;";
        break;
    case BadgeTone::Caution:
        badge.icon = QString::fromUtf8("⚠");
        badge.styleSheet = QString(kBadgeBase) + "background:#4a3e20;color:#ffefc0;";
        break;
    case BadgeTone::Neutral:
        badge.icon = QString::fromUtf8("⏺");
        badge.styleSheet = QString(kBadgeBase) + "background:#26303a;color:#9faebb;";
        break;
    }
    return badge;
}

}  // namespace

StatusBadge badgeFor(const QString& status) {
    if (status.isNull()) {
        return makeBadge(BadgeTone::Neutral, "unknown");
    }
    const QString value = status.trimmed().toLower();
    if (value == "healthy") {
        return makeBadge(BadgeTone::Positive, status);
    }
    if (value == "unhealthy") {
        return makeBadge(BadgeTone::Negative, status);
    }
    return makeBadge(BadgeTone::Caution, value.isEmpty() ? QString("unknown") : status);
}

StatusBadge badgeFor(HealthStatus status) {
    return badgeFor(toString(status));
}

StatusBadge badgeFor(ComponentStatus status) {
    return badgeFor(toString(status));
}

StatusBadge badgeFor(const HealthState& state) {
    return state.statusMissing ? badgeFor(QString()) : badgeFor(state.overall);
}

}  // namespace vitals
