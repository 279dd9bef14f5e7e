#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <optional>

namespace goalglide {
namespace data {

enum class Priority
{
    Low,
    Medium,
    High,
};

struct Goal
{
    QString id;
    QString title;
    QDateTime created;
    Priority priority = Priority::Medium;
    bool archived = false;
    bool completed = false;
    QStringList tags;
    std::optional<QString> parentId;
    std::optional<QDateTime> deadline;
};

bool operator==(const Goal &lhs, const Goal &rhs);
bool operator!=(const Goal &lhs, const Goal &rhs);

QString priorityToString(Priority priority);
// Throws ValidationError for anything but low, medium or high.
Priority priorityFromString(const QString &value);

Goal makeGoal(const QString &title,
              Priority priority = Priority::Medium,
              std::optional<QDateTime> deadline = std::nullopt,
              std::optional<QString> parentId = std::nullopt);

// Lowercases and validates a tag; throws ValidationError when malformed.
QString normalizeTag(const QString &tag);
QStringList normalizeTags(const QStringList &tags);

} // namespace data
} // namespace goalglide
