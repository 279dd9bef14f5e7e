#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <optional>

namespace goalglide {
namespace session {

// The single in-flight timer. Running while lastStart is set, paused otherwise.
struct ActiveSessionState
{
    std::optional<QString> goalId;
    QDateTime start;
    int durationSec = 0;
    int elapsedSec = 0;
    bool paused = false;
    std::optional<QDateTime> lastStart;
};

bool operator==(const ActiveSessionState &lhs, const ActiveSessionState &rhs);

// Live view of the active session at one instant.
struct SessionStatus
{
    ActiveSessionState state;
    int elapsedSec = 0;
    int remainingSec = 0;
};

QJsonObject toJson(const ActiveSessionState &state);
// Missing elapsed_sec, paused or last_start fall back to 0, false and start.
// Throws CorruptDataError when start or duration_sec is unusable.
ActiveSessionState activeSessionFromJson(const QJsonObject &object);

} // namespace session
} // namespace goalglide
