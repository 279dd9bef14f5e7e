#pragma once

#include <QString>
#include <stdexcept>

namespace goalglide {
namespace core {

class GoalGlideError : public std::runtime_error
{
public:
    explicit GoalGlideError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

class NotFoundError : public GoalGlideError
{
public:
    using GoalGlideError::GoalGlideError;
};

class InvalidStateError : public GoalGlideError
{
public:
    using GoalGlideError::GoalGlideError;
};

class ValidationError : public GoalGlideError
{
public:
    using GoalGlideError::GoalGlideError;
};

// The on-disk document is not valid JSON. Never recovered from.
class CorruptDataError : public GoalGlideError
{
public:
    using GoalGlideError::GoalGlideError;
};

// A file could not be locked, opened or committed.
class StorageError : public GoalGlideError
{
public:
    using GoalGlideError::GoalGlideError;
};

} // namespace core
} // namespace goalglide
