#pragma once

#include <memory>
#include <QString>

namespace goalglide {
namespace data {

class GoalRepository;
class SessionRepository;
class ThoughtRepository;
class JsonDocumentStore;

// Opens db.json in the data directory and hands out the repositories that
// share it. Opening migrates legacy goal rows.
class DataProvider
{
public:
    explicit DataProvider(const QString &dataDir);
    ~DataProvider();

    static QString databasePath(const QString &dataDir);

    GoalRepository &goalRepository();
    SessionRepository &sessionRepository();
    ThoughtRepository &thoughtRepository();

private:
    std::shared_ptr<JsonDocumentStore> m_documentStore;
    std::unique_ptr<GoalRepository> m_goalRepository;
    std::unique_ptr<SessionRepository> m_sessionRepository;
    std::unique_ptr<ThoughtRepository> m_thoughtRepository;
};

} // namespace data
} // namespace goalglide
