#pragma once

#include <QString>

#include "vitals/health_state.hpp"

namespace vitals {

enum class BadgeTone {
    Positive,
    Negative,
    Caution,
    Neutral,
};

struct StatusBadge {
    BadgeTone tone = BadgeTone::Neutral;
    QString icon;
    QString label;
    QString styleSheet;
};

// Total over every input. A null QString means the status was absent and
// renders neutral; any present but unrecognized value renders as caution.
StatusBadge badgeFor(const QString& status);
StatusBadge badgeFor(HealthStatus status);
StatusBadge badgeFor(ComponentStatus status);
// Overall badge; neutral when the reported state carried no status.
StatusBadge badgeFor(const HealthState& state);

}  // namespace vitals
