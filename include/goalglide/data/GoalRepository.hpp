#pragma once

#include <QDateTime>
#include <QMap>
#include <QStringList>

#include <functional>
#include <optional>
#include <vector>

#include "goalglide/data/Goal.hpp"

namespace goalglide {
namespace data {

// Predicates combine with AND. dueSoon and overdue are applied last and
// keep a goal matching either of them.
struct GoalFilter
{
    bool includeArchived = false;
    bool onlyArchived = false;
    std::optional<Priority> priority;
    QStringList tags;
    std::optional<QString> parentId;
    bool dueSoon = false;
    bool overdue = false;
};

class GoalRepository
{
public:
    virtual ~GoalRepository() = default;

    virtual void addGoal(const Goal &goal) = 0;
    virtual Goal getGoal(const QString &id) const = 0;
    virtual std::optional<Goal> findByTitle(const QString &title) const = 0;
    virtual void updateGoal(const Goal &goal) = 0;
    // Runs edit on the stored goal and writes the result back under one lock.
    virtual Goal editGoal(const QString &id, const std::function<void(Goal &)> &edit) = 0;
    virtual void removeGoal(const QString &id) = 0;

    virtual Goal archiveGoal(const QString &id) = 0;
    virtual Goal restoreGoal(const QString &id) = 0;
    virtual Goal completeGoal(const QString &id) = 0;
    virtual Goal reopenGoal(const QString &id) = 0;

    // Tags pass through normalizeTag; a malformed one throws ValidationError.
    virtual Goal addTags(const QString &id, const QStringList &tags) = 0;
    virtual Goal removeTag(const QString &id, const QString &tag) = 0;
    virtual QMap<QString, int> tagCounts() const = 0;

    virtual std::vector<Goal> listGoals(const GoalFilter &filter, const QDateTime &now) const = 0;
    std::vector<Goal> listGoals(const GoalFilter &filter = {}) const
    {
        return listGoals(filter, QDateTime::currentDateTimeUtc());
    }
};

} // namespace data
} // namespace goalglide
