#include "goalglide/data/DataProvider.hpp"

#include "goalglide/data/FileGoalRepository.hpp"
#include "goalglide/data/FileSessionRepository.hpp"
#include "goalglide/data/FileThoughtRepository.hpp"
#include "goalglide/data/JsonDocumentStore.hpp"

#include <QDir>

namespace goalglide {
namespace data {

DataProvider::DataProvider(const QString &dataDir)
{
    m_documentStore = std::make_shared<JsonDocumentStore>(databasePath(dataDir));
    m_goalRepository = std::make_unique<FileGoalRepository>(m_documentStore);
    m_sessionRepository = std::make_unique<FileSessionRepository>(m_documentStore);
    m_thoughtRepository = std::make_unique<FileThoughtRepository>(m_documentStore);
}

DataProvider::~DataProvider() = default;

QString DataProvider::databasePath(const QString &dataDir)
{
    return QDir(dataDir).filePath(QStringLiteral("db.json"));
}

GoalRepository &DataProvider::goalRepository()
{
    return *m_goalRepository;
}

SessionRepository &DataProvider::sessionRepository()
{
    return *m_sessionRepository;
}

ThoughtRepository &DataProvider::thoughtRepository()
{
    return *m_thoughtRepository;
}

} // namespace data
} // namespace goalglide
