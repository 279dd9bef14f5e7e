#pragma once

#include <QDateTime>
#include <QString>

#include <optional>

namespace goalglide {
namespace data {

// A finished Pomodoro as stored in the session history table.
struct PomodoroSession
{
    QString id;
    std::optional<QString> goalId;
    QDateTime start;
    int durationSec = 0;
};

bool operator==(const PomodoroSession &lhs, const PomodoroSession &rhs);

PomodoroSession makeSession(std::optional<QString> goalId, const QDateTime &start, int durationSec);

} // namespace data
} // namespace goalglide
