#include "goalglide/data/FileGoalRepository.hpp"

#include "goalglide/core/Clock.hpp"
#include "goalglide/core/Errors.hpp"
#include "goalglide/core/Logging.hpp"

#include <QJsonArray>
#include <QSet>

#include <algorithm>
#include <utility>

namespace goalglide {
namespace data {

namespace {
constexpr qint64 DUE_SOON_WINDOW_SECS = 3 * 24 * 60 * 60;

DocumentRows::iterator findRow(DocumentRows &rows, const QString &id)
{
    return std::find_if(rows.begin(), rows.end(), [&id](const auto &entry) {
        return entry.second.value(QLatin1String("id")).toString() == id;
    });
}

DocumentRows::const_iterator findRow(const DocumentRows &rows, const QString &id)
{
    return std::find_if(rows.cbegin(), rows.cend(), [&id](const auto &entry) {
        return entry.second.value(QLatin1String("id")).toString() == id;
    });
}

[[noreturn]] void throwNotFound(const QString &id)
{
    throw core::NotFoundError(QStringLiteral("Goal %1 not found").arg(id));
}

QJsonValue optionalString(const std::optional<QString> &value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

// Writes only the fields whose serialized value differs, so untouched
// fields keep their stored text.
void mergeChanges(QJsonObject &row, const QJsonObject &before, const QJsonObject &after)
{
    for (auto it = after.constBegin(); it != after.constEnd(); ++it) {
        if (!row.contains(it.key()) || before.value(it.key()) != it.value()) {
            row.insert(it.key(), it.value());
        }
    }
}

bool matchesDeadline(const Goal &goal, const GoalFilter &filter, const QDateTime &now)
{
    if (!goal.deadline) {
        return false;
    }
    const QDateTime &deadline = *goal.deadline;
    if (filter.overdue && deadline < now) {
        return true;
    }
    if (filter.dueSoon && deadline >= now && deadline <= now.addSecs(DUE_SOON_WINDOW_SECS)) {
        return true;
    }
    return false;
}
} // namespace

const QString FileGoalRepository::kTableName = QStringLiteral("goals");

FileGoalRepository::FileGoalRepository(std::shared_ptr<JsonDocumentStore> store)
    : m_store(std::move(store))
{
    migrate();
}

int FileGoalRepository::migrate()
{
    const std::pair<QLatin1String, QJsonValue> defaults[] = {
        {QLatin1String("tags"), QJsonArray()},
        {QLatin1String("parent_id"), QJsonValue(QJsonValue::Null)},
        {QLatin1String("deadline"), QJsonValue(QJsonValue::Null)},
        {QLatin1String("completed"), false},
    };

    const int migrated = m_store->modifyTable(kTableName, [&](DocumentRows &rows) {
        int count = 0;
        for (auto &entry : rows) {
            bool touched = false;
            for (const auto &field : defaults) {
                if (!entry.second.contains(field.first)) {
                    entry.second.insert(field.first, field.second);
                    touched = true;
                }
            }
            if (touched) {
                ++count;
            }
        }
        return count;
    });

    if (migrated > 0) {
        spdlog::info("Migrated {} goal rows in {}", migrated, core::str(m_store->filePath()));
    }
    return migrated;
}

QJsonObject FileGoalRepository::toJson(const Goal &goal)
{
    QJsonObject row;
    row.insert(QStringLiteral("id"), goal.id);
    row.insert(QStringLiteral("title"), goal.title);
    row.insert(QStringLiteral("created"), core::formatTimestamp(goal.created));
    row.insert(QStringLiteral("priority"), priorityToString(goal.priority));
    row.insert(QStringLiteral("archived"), goal.archived);
    row.insert(QStringLiteral("completed"), goal.completed);
    row.insert(QStringLiteral("tags"), QJsonArray::fromStringList(goal.tags));
    row.insert(QStringLiteral("parent_id"), optionalString(goal.parentId));
    row.insert(QStringLiteral("deadline"),
               goal.deadline ? QJsonValue(core::formatTimestamp(*goal.deadline))
                             : QJsonValue(QJsonValue::Null));
    return row;
}

Goal FileGoalRepository::fromJson(const QJsonObject &row)
{
    Goal goal;
    goal.id = row.value(QLatin1String("id")).toString();
    goal.title = row.value(QLatin1String("title")).toString();
    goal.created = core::parseTimestamp(row.value(QLatin1String("created")).toString(), Qt::UTC);
    try {
        goal.priority = priorityFromString(
            row.value(QLatin1String("priority")).toString(QStringLiteral("medium")));
    } catch (const core::ValidationError &) {
        spdlog::warn("Goal {} has an unknown priority, reading it as medium", core::str(goal.id));
        goal.priority = Priority::Medium;
    }
    goal.archived = row.value(QLatin1String("archived")).toBool(false);
    goal.completed = row.value(QLatin1String("completed")).toBool(false);
    const QJsonArray tags = row.value(QLatin1String("tags")).toArray();
    for (const QJsonValue &tag : tags) {
        goal.tags << tag.toString();
    }
    const QJsonValue parent = row.value(QLatin1String("parent_id"));
    if (parent.isString()) {
        goal.parentId = parent.toString();
    }
    const QJsonValue deadline = row.value(QLatin1String("deadline"));
    if (deadline.isString()) {
        const QDateTime parsed = core::parseTimestamp(deadline.toString(), Qt::UTC);
        if (parsed.isValid()) {
            goal.deadline = parsed;
        }
    }
    return goal;
}

template <typename Transform>
Goal FileGoalRepository::modifyGoal(const QString &id, Transform &&transform)
{
    return m_store->modifyTable(kTableName, [&](DocumentRows &rows) {
        auto it = findRow(rows, id);
        if (it == rows.end()) {
            throwNotFound(id);
        }
        const Goal current = fromJson(it->second);
        Goal updated = transform(current);
        if (updated != current) {
            mergeChanges(it->second, toJson(current), toJson(updated));
        }
        return updated;
    });
}

void FileGoalRepository::addGoal(const Goal &goal)
{
    m_store->modifyTable(kTableName, [&](DocumentRows &rows) {
        JsonDocumentStore::insertRow(rows, toJson(goal));
    });
    spdlog::debug("Added goal {}", core::str(goal.id));
}

Goal FileGoalRepository::getGoal(const QString &id) const
{
    const DocumentRows rows = m_store->readTable(kTableName);
    const auto it = findRow(rows, id);
    if (it == rows.cend()) {
        throwNotFound(id);
    }
    return fromJson(it->second);
}

std::optional<Goal> FileGoalRepository::findByTitle(const QString &title) const
{
    const DocumentRows rows = m_store->readTable(kTableName);
    for (const auto &entry : rows) {
        if (entry.second.value(QLatin1String("title")).toString() == title) {
            return fromJson(entry.second);
        }
    }
    return std::nullopt;
}

void FileGoalRepository::updateGoal(const Goal &goal)
{
    m_store->modifyTable(kTableName, [&](DocumentRows &rows) {
        auto it = findRow(rows, goal.id);
        if (it == rows.end()) {
            throwNotFound(goal.id);
        }
        mergeChanges(it->second, toJson(fromJson(it->second)), toJson(goal));
    });
}

Goal FileGoalRepository::editGoal(const QString &id, const std::function<void(Goal &)> &edit)
{
    return modifyGoal(id, [&edit, &id](Goal goal) {
        edit(goal);
        goal.id = id;
        return goal;
    });
}

void FileGoalRepository::removeGoal(const QString &id)
{
    m_store->modifyTable(kTableName, [&](DocumentRows &rows) {
        auto it = findRow(rows, id);
        if (it == rows.end()) {
            throwNotFound(id);
        }
        rows.erase(it);
    });
    spdlog::debug("Removed goal {}", core::str(id));
}

Goal FileGoalRepository::archiveGoal(const QString &id)
{
    return modifyGoal(id, [&id](Goal goal) {
        if (goal.archived) {
            throw core::InvalidStateError(QStringLiteral("Goal %1 already archived").arg(id));
        }
        goal.archived = true;
        return goal;
    });
}

Goal FileGoalRepository::restoreGoal(const QString &id)
{
    return modifyGoal(id, [&id](Goal goal) {
        if (!goal.archived) {
            throw core::InvalidStateError(QStringLiteral("Goal %1 is not archived").arg(id));
        }
        goal.archived = false;
        return goal;
    });
}

Goal FileGoalRepository::completeGoal(const QString &id)
{
    return modifyGoal(id, [](Goal goal) {
        goal.completed = true;
        return goal;
    });
}

Goal FileGoalRepository::reopenGoal(const QString &id)
{
    return modifyGoal(id, [](Goal goal) {
        goal.completed = false;
        return goal;
    });
}

Goal FileGoalRepository::addTags(const QString &id, const QStringList &tags)
{
    const QStringList normalized = normalizeTags(tags);
    return modifyGoal(id, [&normalized](Goal goal) {
        QSet<QString> merged(goal.tags.cbegin(), goal.tags.cend());
        for (const QString &tag : normalized) {
            merged.insert(tag);
        }
        QStringList sorted(merged.cbegin(), merged.cend());
        sorted.sort();
        goal.tags = sorted;
        return goal;
    });
}

Goal FileGoalRepository::removeTag(const QString &id, const QString &tag)
{
    const QString normalized = normalizeTag(tag);
    return modifyGoal(id, [&normalized](Goal goal) {
        goal.tags.removeAll(normalized);
        return goal;
    });
}

QMap<QString, int> FileGoalRepository::tagCounts() const
{
    QMap<QString, int> counts;
    const DocumentRows rows = m_store->readTable(kTableName);
    for (const auto &entry : rows) {
        const QJsonArray tags = entry.second.value(QLatin1String("tags")).toArray();
        for (const QJsonValue &tag : tags) {
            counts[tag.toString()] += 1;
        }
    }
    return counts;
}

std::vector<Goal> FileGoalRepository::listGoals(const GoalFilter &filter, const QDateTime &now) const
{
    std::vector<Goal> result;
    const DocumentRows rows = m_store->readTable(kTableName);
    for (const auto &entry : rows) {
        Goal goal = fromJson(entry.second);
        if (filter.onlyArchived) {
            if (!goal.archived) {
                continue;
            }
        } else if (!filter.includeArchived && goal.archived) {
            continue;
        }
        if (filter.priority && goal.priority != *filter.priority) {
            continue;
        }
        const bool hasAllTags = std::all_of(filter.tags.cbegin(), filter.tags.cend(),
                                            [&goal](const QString &tag) { return goal.tags.contains(tag); });
        if (!hasAllTags) {
            continue;
        }
        if (filter.parentId && goal.parentId != filter.parentId) {
            continue;
        }
        result.push_back(std::move(goal));
    }

    if (filter.dueSoon || filter.overdue) {
        result.erase(std::remove_if(result.begin(), result.end(),
                                    [&](const Goal &goal) { return !matchesDeadline(goal, filter, now); }),
                     result.end());
    }
    return result;
}

} // namespace data
} // namespace goalglide
