#pragma once

#include <QString>

#include <memory>

namespace goalglide {
namespace data {
class DataProvider;
class GoalRepository;
class SessionRepository;
class ThoughtRepository;
}

namespace session {
class SessionHooks;
class SessionTimer;
}

namespace core {

class Clock;
class Config;

// Everything one command invocation needs. Built once per process and
// passed down explicitly.
class AppContext
{
public:
    explicit AppContext(QString dataDir, std::shared_ptr<const Clock> clock = nullptr);
    ~AppContext();

    // $GOAL_GLIDE_DB_DIR, or ~/.goal_glide when unset.
    static QString defaultDataDir();

    const QString &dataDir() const;
    const Clock &clock() const;
    Config &config();
    data::GoalRepository &goalRepository();
    data::SessionRepository &sessionRepository();
    data::ThoughtRepository &thoughtRepository();
    session::SessionHooks &sessionHooks();
    session::SessionTimer &sessionTimer();

private:
    QString m_dataDir;
    std::shared_ptr<const Clock> m_clock;
    std::unique_ptr<Config> m_config;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<session::SessionHooks> m_sessionHooks;
    std::unique_ptr<session::SessionTimer> m_sessionTimer;
};

} // namespace core
} // namespace goalglide
