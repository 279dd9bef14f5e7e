#pragma once

#include "goalglide/data/PomodoroSession.hpp"
#include "goalglide/session/ActiveSession.hpp"

#include <functional>
#include <vector>

namespace goalglide {
namespace session {

// Callbacks for collaborators that react to timer events, e.g. reminder
// scheduling. Owned by the application context.
class SessionHooks
{
public:
    using NewSessionCallback = std::function<void(const ActiveSessionState &)>;
    using SessionEndCallback = std::function<void(const data::PomodoroSession &)>;

    void onNewSession(NewSessionCallback callback);
    void onSessionEnd(SessionEndCallback callback);

    void notifyNewSession(const ActiveSessionState &state) const;
    void notifySessionEnd(const data::PomodoroSession &session) const;

private:
    std::vector<NewSessionCallback> m_newSession;
    std::vector<SessionEndCallback> m_sessionEnd;
};

} // namespace session
} // namespace goalglide
