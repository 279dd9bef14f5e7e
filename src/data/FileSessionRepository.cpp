#include "goalglide/data/FileSessionRepository.hpp"

#include "goalglide/core/Clock.hpp"

namespace goalglide {
namespace data {

const QString FileSessionRepository::kTableName = QStringLiteral("sessions");

FileSessionRepository::FileSessionRepository(std::shared_ptr<JsonDocumentStore> store)
    : m_store(std::move(store))
{
}

void FileSessionRepository::addSession(const PomodoroSession &session)
{
    QJsonObject row;
    row.insert(QStringLiteral("id"), session.id);
    row.insert(QStringLiteral("goal_id"),
               session.goalId ? QJsonValue(*session.goalId) : QJsonValue(QJsonValue::Null));
    row.insert(QStringLiteral("start"), core::formatTimestamp(session.start));
    row.insert(QStringLiteral("duration_sec"), session.durationSec);

    m_store->modifyTable(kTableName, [&row](DocumentRows &rows) { JsonDocumentStore::insertRow(rows, row); });
}

std::vector<PomodoroSession> FileSessionRepository::fetchSessions() const
{
    std::vector<PomodoroSession> sessions;
    const DocumentRows rows = m_store->readTable(kTableName);
    sessions.reserve(rows.size());
    for (const auto &entry : rows) {
        const QJsonObject &row = entry.second;
        PomodoroSession session;
        session.id = row.value(QLatin1String("id")).toString();
        const QJsonValue goalId = row.value(QLatin1String("goal_id"));
        if (goalId.isString()) {
            session.goalId = goalId.toString();
        }
        session.start = core::parseTimestamp(row.value(QLatin1String("start")).toString());
        session.durationSec = row.value(QLatin1String("duration_sec")).toInt();
        sessions.push_back(std::move(session));
    }
    return sessions;
}

} // namespace data
} // namespace goalglide
