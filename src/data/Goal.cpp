#include "goalglide/data/Goal.hpp"

#include "goalglide/core/Clock.hpp"
#include "goalglide/core/Errors.hpp"

#include <QRegularExpression>
#include <QUuid>

#include <algorithm>

namespace goalglide {
namespace data {

namespace {
const QRegularExpression &tagPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^[a-z0-9][a-z0-9_-]{0,29}$"));
    return pattern;
}
} // namespace

bool operator==(const Goal &lhs, const Goal &rhs)
{
    return lhs.id == rhs.id && lhs.title == rhs.title && lhs.created == rhs.created
        && lhs.priority == rhs.priority && lhs.archived == rhs.archived
        && lhs.completed == rhs.completed && lhs.tags == rhs.tags
        && lhs.parentId == rhs.parentId && lhs.deadline == rhs.deadline;
}

bool operator!=(const Goal &lhs, const Goal &rhs)
{
    return !(lhs == rhs);
}

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::Low:
        return QStringLiteral("low");
    case Priority::High:
        return QStringLiteral("high");
    case Priority::Medium:
    default:
        return QStringLiteral("medium");
    }
}

Priority priorityFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("low")) {
        return Priority::Low;
    }
    if (normalized == QLatin1String("medium")) {
        return Priority::Medium;
    }
    if (normalized == QLatin1String("high")) {
        return Priority::High;
    }
    throw core::ValidationError(QStringLiteral("Invalid priority '%1'. Use low, medium or high").arg(value));
}

Goal makeGoal(const QString &title, Priority priority, std::optional<QDateTime> deadline,
              std::optional<QString> parentId)
{
    const QString trimmed = title.trimmed();
    if (trimmed.isEmpty()) {
        throw core::ValidationError(QStringLiteral("Title cannot be empty."));
    }

    Goal goal;
    goal.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    goal.title = trimmed;
    goal.created = core::truncateToSeconds(QDateTime::currentDateTimeUtc());
    goal.priority = priority;
    goal.parentId = std::move(parentId);
    if (deadline && deadline->isValid()) {
        goal.deadline = core::truncateToSeconds(deadline->toUTC());
    }
    return goal;
}

QString normalizeTag(const QString &tag)
{
    const QString lowered = tag.trimmed().toLower();
    if (!tagPattern().match(lowered).hasMatch()) {
        throw core::ValidationError(QStringLiteral("Invalid tag '%1'. Tags must match %2")
                                        .arg(tag, tagPattern().pattern()));
    }
    return lowered;
}

QStringList normalizeTags(const QStringList &tags)
{
    QStringList normalized;
    normalized.reserve(tags.size());
    for (const QString &tag : tags) {
        normalized << normalizeTag(tag);
    }
    return normalized;
}

} // namespace data
} // namespace goalglide
