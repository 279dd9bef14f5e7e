#include "goalglide/core/Config.hpp"

#include "goalglide/core/Errors.hpp"
#include "goalglide/core/Logging.hpp"

#include <QDir>

namespace goalglide {
namespace core {

namespace {
const QString KEY_POMO_DURATION = QStringLiteral("pomo_duration_min");
const QString KEY_QUOTES = QStringLiteral("quotes_enabled");
const QString KEY_REMINDERS = QStringLiteral("reminders_enabled");
const QString KEY_REMINDER_BREAK = QStringLiteral("reminder_break_min");
const QString KEY_REMINDER_INTERVAL = QStringLiteral("reminder_interval_min");

constexpr int MAX_REMINDER_MIN = 120;

void requireRange(const QString &name, int value, int min, int max)
{
    if (value < min || value > max) {
        throw ValidationError(QStringLiteral("%1 must be between %2 and %3").arg(name).arg(min).arg(max));
    }
}

int parseInt(const QString &key, const QString &value)
{
    bool ok = false;
    const int parsed = value.trimmed().toInt(&ok);
    if (!ok) {
        throw ValidationError(QStringLiteral("%1 expects a whole number, got '%2'").arg(key, value));
    }
    return parsed;
}

bool parseBool(const QString &key, const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("true") || normalized == QLatin1String("on")
        || normalized == QLatin1String("1")) {
        return true;
    }
    if (normalized == QLatin1String("false") || normalized == QLatin1String("off")
        || normalized == QLatin1String("0")) {
        return false;
    }
    throw ValidationError(QStringLiteral("%1 expects true or false, got '%2'").arg(key, value));
}
} // namespace

Config::Config(const QString &filePath)
    : m_settings(filePath, QSettings::IniFormat)
{
    if (m_settings.status() == QSettings::FormatError) {
        spdlog::warn("Ignoring malformed config file {}", str(filePath));
    }
}

QString Config::configPath(const QString &dataDir)
{
    return QDir(dataDir).filePath(QStringLiteral("config.ini"));
}

int Config::pomoDurationMin() const
{
    return m_settings.value(KEY_POMO_DURATION, kDefaultPomoDurationMin).toInt();
}

bool Config::quotesEnabled() const
{
    return m_settings.value(KEY_QUOTES, true).toBool();
}

bool Config::remindersEnabled() const
{
    return m_settings.value(KEY_REMINDERS, false).toBool();
}

int Config::reminderBreakMin() const
{
    return m_settings.value(KEY_REMINDER_BREAK, kDefaultReminderBreakMin).toInt();
}

int Config::reminderIntervalMin() const
{
    return m_settings.value(KEY_REMINDER_INTERVAL, kDefaultReminderIntervalMin).toInt();
}

void Config::setPomoDurationMin(int minutes)
{
    requireRange(QStringLiteral("duration"), minutes, 1, kMaxPomoDurationMin);
    store(KEY_POMO_DURATION, minutes);
}

void Config::setQuotesEnabled(bool enabled)
{
    store(KEY_QUOTES, enabled);
}

void Config::setRemindersEnabled(bool enabled)
{
    store(KEY_REMINDERS, enabled);
}

void Config::setReminderBreakMin(int minutes)
{
    requireRange(QStringLiteral("break"), minutes, 1, MAX_REMINDER_MIN);
    store(KEY_REMINDER_BREAK, minutes);
}

void Config::setReminderIntervalMin(int minutes)
{
    requireRange(QStringLiteral("interval"), minutes, 1, MAX_REMINDER_MIN);
    store(KEY_REMINDER_INTERVAL, minutes);
}

void Config::set(const QString &key, const QString &value)
{
    if (key == KEY_POMO_DURATION) {
        setPomoDurationMin(parseInt(key, value));
    } else if (key == KEY_QUOTES) {
        setQuotesEnabled(parseBool(key, value));
    } else if (key == KEY_REMINDERS) {
        setRemindersEnabled(parseBool(key, value));
    } else if (key == KEY_REMINDER_BREAK) {
        setReminderBreakMin(parseInt(key, value));
    } else if (key == KEY_REMINDER_INTERVAL) {
        setReminderIntervalMin(parseInt(key, value));
    } else {
        throw ValidationError(QStringLiteral("Unknown config key '%1'").arg(key));
    }
}

QVariantMap Config::values() const
{
    QVariantMap map;
    map.insert(KEY_POMO_DURATION, pomoDurationMin());
    map.insert(KEY_QUOTES, quotesEnabled());
    map.insert(KEY_REMINDERS, remindersEnabled());
    map.insert(KEY_REMINDER_BREAK, reminderBreakMin());
    map.insert(KEY_REMINDER_INTERVAL, reminderIntervalMin());
    return map;
}

void Config::store(const QString &key, const QVariant &value)
{
    m_settings.setValue(key, value);
    m_settings.sync();
    if (m_settings.status() != QSettings::NoError) {
        throw StorageError(QStringLiteral("Could not save %1").arg(m_settings.fileName()));
    }
    spdlog::debug("Config {} set to {}", str(key), str(value.toString()));
}

} // namespace core
} // namespace goalglide
