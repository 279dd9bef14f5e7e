#include "goalglide/core/Clock.hpp"

#include <QTime>

namespace goalglide {
namespace core {

QDateTime SystemClock::now() const
{
    return QDateTime::currentDateTimeUtc();
}

QDateTime truncateToSeconds(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return dt;
    }
    return dt.addMSecs(-dt.time().msec());
}

QString formatTimestamp(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(Qt::ISODate);
}

QDateTime parseTimestamp(const QString &value, Qt::TimeSpec naiveSpec)
{
    if (value.isEmpty()) {
        return {};
    }
    // Older files carry naive timestamps with microseconds; Qt::ISODateWithMs
    // accepts a fractional part, Qt::ISODate covers the rest.
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    if (dt.isValid() && dt.timeSpec() == Qt::LocalTime && naiveSpec == Qt::UTC) {
        dt.setTimeSpec(Qt::UTC);
    }
    return truncateToSeconds(dt).toUTC();
}

} // namespace core
} // namespace goalglide
