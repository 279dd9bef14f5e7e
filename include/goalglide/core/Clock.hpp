#pragma once

#include <QDateTime>

namespace goalglide {
namespace core {

class Clock
{
public:
    virtual ~Clock() = default;
    virtual QDateTime now() const = 0;
};

class SystemClock : public Clock
{
public:
    QDateTime now() const override;
};

// Drops the millisecond part; stored timestamps carry whole seconds only.
QDateTime truncateToSeconds(const QDateTime &dt);

QString formatTimestamp(const QDateTime &dt);
// Values without an offset are read in naiveSpec: goal rows from older
// files hold UTC, session and thought timestamps hold local time.
QDateTime parseTimestamp(const QString &value, Qt::TimeSpec naiveSpec = Qt::LocalTime);

} // namespace core
} // namespace goalglide
