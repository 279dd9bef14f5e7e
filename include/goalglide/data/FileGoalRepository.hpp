#pragma once

#include "goalglide/data/GoalRepository.hpp"
#include "goalglide/data/JsonDocumentStore.hpp"

#include <QJsonObject>

#include <memory>

namespace goalglide {
namespace data {

class FileGoalRepository : public GoalRepository
{
public:
    static const QString kTableName;

    // Migrates legacy rows on construction.
    explicit FileGoalRepository(std::shared_ptr<JsonDocumentStore> store);
    ~FileGoalRepository() override = default;

    using GoalRepository::listGoals;

    void addGoal(const Goal &goal) override;
    Goal getGoal(const QString &id) const override;
    std::optional<Goal> findByTitle(const QString &title) const override;
    void updateGoal(const Goal &goal) override;
    Goal editGoal(const QString &id, const std::function<void(Goal &)> &edit) override;
    void removeGoal(const QString &id) override;

    Goal archiveGoal(const QString &id) override;
    Goal restoreGoal(const QString &id) override;
    Goal completeGoal(const QString &id) override;
    Goal reopenGoal(const QString &id) override;

    Goal addTags(const QString &id, const QStringList &tags) override;
    Goal removeTag(const QString &id, const QString &tag) override;
    QMap<QString, int> tagCounts() const override;

    std::vector<Goal> listGoals(const GoalFilter &filter, const QDateTime &now) const override;

    // Adds fields introduced after the first schema to rows lacking them.
    // Returns the number of rows written back.
    int migrate();

    static QJsonObject toJson(const Goal &goal);
    static Goal fromJson(const QJsonObject &row);

private:
    template <typename Transform>
    Goal modifyGoal(const QString &id, Transform &&transform);

    std::shared_ptr<JsonDocumentStore> m_store;
};

} // namespace data
} // namespace goalglide
