#pragma once

#include "goalglide/data/PomodoroSession.hpp"
#include "goalglide/session/ActiveSession.hpp"
#include "goalglide/session/SessionStateFile.hpp"

#include <memory>
#include <optional>

namespace goalglide {
namespace core {
class Clock;
}

namespace session {

class SessionHooks;

// Pomodoro state machine over the session state file:
// Absent -> Running <-> Paused -> Absent.
class SessionTimer
{
public:
    SessionTimer(QString statePath, std::shared_ptr<const core::Clock> clock, const SessionHooks &hooks);

    // Replaces any active session. durationMin must be within 1..600.
    ActiveSessionState start(int durationMin, std::optional<QString> goalId = std::nullopt);
    ActiveSessionState pause();
    ActiveSessionState resume();
    // Returns the finished session with its original start and nominal
    // duration, ready for the history table.
    data::PomodoroSession stop();

    std::optional<ActiveSessionState> loadActive() const;
    std::optional<SessionStatus> status() const;

    const QString &statePath() const;

private:
    QDateTime now() const;
    int runningSeconds(const ActiveSessionState &state, const QDateTime &now) const;

    SessionStateFile m_stateFile;
    std::shared_ptr<const core::Clock> m_clock;
    const SessionHooks &m_hooks;
};

} // namespace session
} // namespace goalglide
