#include "goalglide/core/AppContext.hpp"

#include "goalglide/core/Clock.hpp"
#include "goalglide/core/Config.hpp"
#include "goalglide/core/Errors.hpp"
#include "goalglide/data/DataProvider.hpp"
#include "goalglide/session/SessionHooks.hpp"
#include "goalglide/session/SessionTimer.hpp"

#include <QDir>
#include <QtGlobal>

namespace goalglide {
namespace core {

AppContext::AppContext(QString dataDir, std::shared_ptr<const Clock> clock)
    : m_dataDir(std::move(dataDir))
    , m_clock(clock ? std::move(clock) : std::shared_ptr<const Clock>(std::make_shared<SystemClock>()))
{
    QDir dir(m_dataDir);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw StorageError(QStringLiteral("Could not create data directory %1").arg(m_dataDir));
    }

    m_config = std::make_unique<Config>(Config::configPath(m_dataDir));
    m_dataProvider = std::make_unique<data::DataProvider>(m_dataDir);
    m_sessionHooks = std::make_unique<session::SessionHooks>();
    m_sessionTimer = std::make_unique<session::SessionTimer>(dir.filePath(QStringLiteral("session.json")),
                                                             m_clock, *m_sessionHooks);
}

AppContext::~AppContext() = default;

QString AppContext::defaultDataDir()
{
    const QString fromEnv = qEnvironmentVariable("GOAL_GLIDE_DB_DIR");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    return QDir::homePath() + QStringLiteral("/.goal_glide");
}

const QString &AppContext::dataDir() const
{
    return m_dataDir;
}

const Clock &AppContext::clock() const
{
    return *m_clock;
}

Config &AppContext::config()
{
    return *m_config;
}

data::GoalRepository &AppContext::goalRepository()
{
    return m_dataProvider->goalRepository();
}

data::SessionRepository &AppContext::sessionRepository()
{
    return m_dataProvider->sessionRepository();
}

data::ThoughtRepository &AppContext::thoughtRepository()
{
    return m_dataProvider->thoughtRepository();
}

session::SessionHooks &AppContext::sessionHooks()
{
    return *m_sessionHooks;
}

session::SessionTimer &AppContext::sessionTimer()
{
    return *m_sessionTimer;
}

} // namespace core
} // namespace goalglide
