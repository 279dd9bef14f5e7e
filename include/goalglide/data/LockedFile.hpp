#pragma once

#include "goalglide/core/Errors.hpp"

#include <QByteArray>
#include <QLockFile>
#include <QString>

#include <optional>
#include <utility>

namespace goalglide {
namespace data {

// A data file guarded by an advisory lock file next to it
// (<dir>/<basename>.lock). The lock serializes processes on one machine only.
class LockedFile
{
public:
    explicit LockedFile(QString filePath);

    const QString &filePath() const;
    QString lockPath() const;

    // Runs fn while holding the exclusive lock. The lock is released on every
    // exit path, including exceptions thrown by fn.
    template <typename Fn>
    decltype(auto) withLock(Fn &&fn) const
    {
        QLockFile lock(prepareLockPath());
        lock.setStaleLockTime(kStaleLockTimeMs);
        if (!lock.lock()) {
            throw core::StorageError(QStringLiteral("Could not lock %1 (error %2)")
                                         .arg(lockPath())
                                         .arg(static_cast<int>(lock.error())));
        }
        return std::forward<Fn>(fn)();
    }

    // The helpers below expect the caller to hold the lock.
    std::optional<QByteArray> read() const;
    void write(const QByteArray &data) const;
    bool remove() const;

private:
    static constexpr int kStaleLockTimeMs = 30000;

    QString prepareLockPath() const;

    QString m_filePath;
};

} // namespace data
} // namespace goalglide
