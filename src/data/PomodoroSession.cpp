#include "goalglide/data/PomodoroSession.hpp"

#include <QUuid>

namespace goalglide {
namespace data {

bool operator==(const PomodoroSession &lhs, const PomodoroSession &rhs)
{
    return lhs.id == rhs.id && lhs.goalId == rhs.goalId && lhs.start == rhs.start
        && lhs.durationSec == rhs.durationSec;
}

PomodoroSession makeSession(std::optional<QString> goalId, const QDateTime &start, int durationSec)
{
    PomodoroSession session;
    session.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    session.goalId = std::move(goalId);
    session.start = start;
    session.durationSec = durationSec;
    return session;
}

} // namespace data
} // namespace goalglide
