#include "goalglide/session/ActiveSession.hpp"

#include "goalglide/core/Clock.hpp"
#include "goalglide/core/Errors.hpp"

namespace goalglide {
namespace session {

bool operator==(const ActiveSessionState &lhs, const ActiveSessionState &rhs)
{
    return lhs.goalId == rhs.goalId && lhs.start == rhs.start && lhs.durationSec == rhs.durationSec
        && lhs.elapsedSec == rhs.elapsedSec && lhs.paused == rhs.paused && lhs.lastStart == rhs.lastStart;
}

QJsonObject toJson(const ActiveSessionState &state)
{
    QJsonObject object;
    object.insert(QStringLiteral("start"), core::formatTimestamp(state.start));
    object.insert(QStringLiteral("duration_sec"), state.durationSec);
    object.insert(QStringLiteral("goal_id"),
                  state.goalId ? QJsonValue(*state.goalId) : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("elapsed_sec"), state.elapsedSec);
    object.insert(QStringLiteral("paused"), state.paused);
    object.insert(QStringLiteral("last_start"),
                  state.lastStart ? QJsonValue(core::formatTimestamp(*state.lastStart))
                                  : QJsonValue(QJsonValue::Null));
    return object;
}

ActiveSessionState activeSessionFromJson(const QJsonObject &object)
{
    ActiveSessionState state;
    state.start = core::parseTimestamp(object.value(QLatin1String("start")).toString());
    if (!state.start.isValid()) {
        throw core::CorruptDataError(QStringLiteral("Session file has no valid start time"));
    }
    const QJsonValue duration = object.value(QLatin1String("duration_sec"));
    if (!duration.isDouble()) {
        throw core::CorruptDataError(QStringLiteral("Session file has no duration"));
    }
    state.durationSec = duration.toInt();

    const QJsonValue goalId = object.value(QLatin1String("goal_id"));
    if (goalId.isString()) {
        state.goalId = goalId.toString();
    }
    state.elapsedSec = object.value(QLatin1String("elapsed_sec")).toInt(0);
    state.paused = object.value(QLatin1String("paused")).toBool(false);

    const QJsonValue lastStart = object.value(QLatin1String("last_start"));
    if (lastStart.isUndefined()) {
        state.lastStart = state.start;
    } else if (lastStart.isString()) {
        const QDateTime parsed = core::parseTimestamp(lastStart.toString());
        if (parsed.isValid()) {
            state.lastStart = parsed;
        }
    }
    return state;
}

} // namespace session
} // namespace goalglide
