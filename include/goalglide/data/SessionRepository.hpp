#pragma once

#include <vector>

#include "goalglide/data/PomodoroSession.hpp"

namespace goalglide {
namespace data {

// Append-only history of finished Pomodoro sessions.
class SessionRepository
{
public:
    virtual ~SessionRepository() = default;

    virtual void addSession(const PomodoroSession &session) = 0;
    virtual std::vector<PomodoroSession> fetchSessions() const = 0;
};

} // namespace data
} // namespace goalglide
