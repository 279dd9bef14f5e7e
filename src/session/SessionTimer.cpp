#include "goalglide/session/SessionTimer.hpp"

#include "goalglide/core/Clock.hpp"
#include "goalglide/core/Config.hpp"
#include "goalglide/core/Errors.hpp"
#include "goalglide/core/Logging.hpp"
#include "goalglide/session/SessionHooks.hpp"

#include <algorithm>

namespace goalglide {
namespace session {

namespace {
[[noreturn]] void throwNoActiveSession()
{
    throw core::InvalidStateError(QStringLiteral("No active session"));
}
} // namespace

SessionTimer::SessionTimer(QString statePath, std::shared_ptr<const core::Clock> clock,
                           const SessionHooks &hooks)
    : m_stateFile(std::move(statePath))
    , m_clock(std::move(clock))
    , m_hooks(hooks)
{
}

const QString &SessionTimer::statePath() const
{
    return m_stateFile.filePath();
}

QDateTime SessionTimer::now() const
{
    return core::truncateToSeconds(m_clock->now()).toUTC();
}

int SessionTimer::runningSeconds(const ActiveSessionState &state, const QDateTime &now) const
{
    if (state.paused || !state.lastStart) {
        return 0;
    }
    // A clock that moved backwards must not shrink elapsed time.
    return static_cast<int>(std::max<qint64>(state.lastStart->secsTo(now), 0));
}

ActiveSessionState SessionTimer::start(int durationMin, std::optional<QString> goalId)
{
    if (durationMin < 1 || durationMin > core::Config::kMaxPomoDurationMin) {
        throw core::ValidationError(QStringLiteral("Duration must be between 1 and %1 minutes")
                                        .arg(core::Config::kMaxPomoDurationMin));
    }

    const QDateTime startedAt = now();
    ActiveSessionState fresh;
    fresh.goalId = std::move(goalId);
    fresh.start = startedAt;
    fresh.durationSec = durationMin * 60;
    fresh.elapsedSec = 0;
    fresh.paused = false;
    fresh.lastStart = startedAt;

    m_stateFile.transition([&](std::optional<ActiveSessionState> &state) {
        if (state) {
            spdlog::warn("Discarding active session started at {}",
                         core::str(core::formatTimestamp(state->start)));
        }
        state = fresh;
    });

    spdlog::info("Started {} minute session", durationMin);
    m_hooks.notifyNewSession(fresh);
    return fresh;
}

ActiveSessionState SessionTimer::pause()
{
    const QDateTime pausedAt = now();
    const ActiveSessionState updated = m_stateFile.transition([&](std::optional<ActiveSessionState> &state) {
        if (!state) {
            throwNoActiveSession();
        }
        if (state->paused) {
            throw core::InvalidStateError(QStringLiteral("Session already paused"));
        }
        state->elapsedSec += runningSeconds(*state, pausedAt);
        state->paused = true;
        state->lastStart.reset();
        return *state;
    });
    spdlog::debug("Session paused at {}s", updated.elapsedSec);
    return updated;
}

ActiveSessionState SessionTimer::resume()
{
    const QDateTime resumedAt = now();
    const ActiveSessionState updated = m_stateFile.transition([&](std::optional<ActiveSessionState> &state) {
        if (!state) {
            throwNoActiveSession();
        }
        if (!state->paused) {
            throw core::InvalidStateError(QStringLiteral("Session is not paused"));
        }
        state->paused = false;
        state->lastStart = resumedAt;
        return *state;
    });
    spdlog::debug("Session resumed with {}s elapsed", updated.elapsedSec);
    return updated;
}

data::PomodoroSession SessionTimer::stop()
{
    const QDateTime stoppedAt = now();
    const ActiveSessionState finished = m_stateFile.transition([&](std::optional<ActiveSessionState> &state) {
        if (!state) {
            throwNoActiveSession();
        }
        ActiveSessionState last = *state;
        last.elapsedSec += runningSeconds(last, stoppedAt);
        state.reset();
        return last;
    });

    spdlog::info("Stopped session after {}s of focus", finished.elapsedSec);
    const data::PomodoroSession session = data::makeSession(finished.goalId, finished.start, finished.durationSec);
    m_hooks.notifySessionEnd(session);
    return session;
}

std::optional<ActiveSessionState> SessionTimer::loadActive() const
{
    return m_stateFile.load();
}

std::optional<SessionStatus> SessionTimer::status() const
{
    const auto state = m_stateFile.load();
    if (!state) {
        return std::nullopt;
    }
    SessionStatus status;
    status.state = *state;
    status.elapsedSec = state->elapsedSec + runningSeconds(*state, now());
    status.remainingSec = std::max(state->durationSec - status.elapsedSec, 0);
    return status;
}

} // namespace session
} // namespace goalglide
