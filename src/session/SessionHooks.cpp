#include "goalglide/session/SessionHooks.hpp"

namespace goalglide {
namespace session {

void SessionHooks::onNewSession(NewSessionCallback callback)
{
    if (callback) {
        m_newSession.push_back(std::move(callback));
    }
}

void SessionHooks::onSessionEnd(SessionEndCallback callback)
{
    if (callback) {
        m_sessionEnd.push_back(std::move(callback));
    }
}

void SessionHooks::notifyNewSession(const ActiveSessionState &state) const
{
    for (const auto &callback : m_newSession) {
        callback(state);
    }
}

void SessionHooks::notifySessionEnd(const data::PomodoroSession &session) const
{
    for (const auto &callback : m_sessionEnd) {
        callback(session);
    }
}

} // namespace session
} // namespace goalglide
