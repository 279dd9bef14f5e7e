#include "goalglide/data/Thought.hpp"

#include "goalglide/core/Clock.hpp"
#include "goalglide/core/Errors.hpp"

#include <QUuid>

namespace goalglide {
namespace data {

bool operator==(const Thought &lhs, const Thought &rhs)
{
    return lhs.id == rhs.id && lhs.text == rhs.text && lhs.timestamp == rhs.timestamp
        && lhs.goalId == rhs.goalId;
}

Thought makeThought(const QString &text, std::optional<QString> goalId, const QDateTime &timestamp)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        throw core::ValidationError(QStringLiteral("Thought cannot be empty"));
    }
    if (trimmed.size() > kMaxThoughtLength) {
        throw core::ValidationError(
            QStringLiteral("Thought must be %1 characters or less").arg(kMaxThoughtLength));
    }

    Thought thought;
    thought.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    thought.text = trimmed;
    thought.timestamp = core::truncateToSeconds(timestamp);
    thought.goalId = std::move(goalId);
    return thought;
}

} // namespace data
} // namespace goalglide
