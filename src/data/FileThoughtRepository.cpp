#include "goalglide/data/FileThoughtRepository.hpp"

#include "goalglide/core/Clock.hpp"
#include "goalglide/core/Logging.hpp"

#include <algorithm>

namespace goalglide {
namespace data {

const QString FileThoughtRepository::kTableName = QStringLiteral("thoughts");

FileThoughtRepository::FileThoughtRepository(std::shared_ptr<JsonDocumentStore> store)
    : m_store(std::move(store))
{
}

void FileThoughtRepository::addThought(const Thought &thought)
{
    QJsonObject row;
    row.insert(QStringLiteral("id"), thought.id);
    row.insert(QStringLiteral("text"), thought.text);
    row.insert(QStringLiteral("timestamp"), core::formatTimestamp(thought.timestamp));
    row.insert(QStringLiteral("goal_id"),
               thought.goalId ? QJsonValue(*thought.goalId) : QJsonValue(QJsonValue::Null));

    m_store->modifyTable(kTableName, [&row](DocumentRows &rows) { JsonDocumentStore::insertRow(rows, row); });
}

std::vector<Thought> FileThoughtRepository::fetchThoughts(const ThoughtQuery &query) const
{
    std::vector<Thought> thoughts;
    const DocumentRows rows = m_store->readTable(kTableName);
    for (const auto &entry : rows) {
        const QJsonObject &row = entry.second;
        Thought thought;
        thought.id = row.value(QLatin1String("id")).toString();
        thought.text = row.value(QLatin1String("text")).toString();
        thought.timestamp = core::parseTimestamp(row.value(QLatin1String("timestamp")).toString());
        const QJsonValue goalId = row.value(QLatin1String("goal_id"));
        if (goalId.isString()) {
            thought.goalId = goalId.toString();
        }
        if (query.goalId && thought.goalId != query.goalId) {
            continue;
        }
        thoughts.push_back(std::move(thought));
    }

    std::stable_sort(thoughts.begin(), thoughts.end(), [&query](const Thought &lhs, const Thought &rhs) {
        return query.newestFirst ? lhs.timestamp > rhs.timestamp : lhs.timestamp < rhs.timestamp;
    });

    if (query.limit && thoughts.size() > static_cast<size_t>(std::max(*query.limit, 0))) {
        thoughts.resize(static_cast<size_t>(std::max(*query.limit, 0)));
    }
    return thoughts;
}

bool FileThoughtRepository::removeThought(const QString &id)
{
    const bool removed = m_store->modifyTable(kTableName, [&id](DocumentRows &rows) {
        for (auto it = rows.begin(); it != rows.end(); ++it) {
            if (it->second.value(QLatin1String("id")).toString() == id) {
                rows.erase(it);
                return true;
            }
        }
        return false;
    });
    if (!removed) {
        spdlog::debug("No thought with id {}", core::str(id));
    }
    return removed;
}

} // namespace data
} // namespace goalglide
