#pragma once

#include <QDateTime>
#include <QString>

#include <optional>

namespace goalglide {
namespace data {

constexpr int kMaxThoughtLength = 500;

struct Thought
{
    QString id;
    QString text;
    QDateTime timestamp;
    std::optional<QString> goalId;
};

bool operator==(const Thought &lhs, const Thought &rhs);

// Trims the text and rejects empty or overlong notes with ValidationError.
Thought makeThought(const QString &text, std::optional<QString> goalId, const QDateTime &timestamp);

} // namespace data
} // namespace goalglide
