#pragma once

#include <QSettings>
#include <QString>
#include <QVariantMap>

namespace goalglide {
namespace core {

// User preferences in <data dir>/config.ini.
class Config
{
public:
    static constexpr int kDefaultPomoDurationMin = 25;
    static constexpr int kMaxPomoDurationMin = 600;
    static constexpr int kDefaultReminderBreakMin = 5;
    static constexpr int kDefaultReminderIntervalMin = 30;

    explicit Config(const QString &filePath);

    static QString configPath(const QString &dataDir);

    int pomoDurationMin() const;
    bool quotesEnabled() const;
    bool remindersEnabled() const;
    int reminderBreakMin() const;
    int reminderIntervalMin() const;

    void setPomoDurationMin(int minutes);
    void setQuotesEnabled(bool enabled);
    void setRemindersEnabled(bool enabled);
    void setReminderBreakMin(int minutes);
    void setReminderIntervalMin(int minutes);

    // Parses a textual value for one of the keys returned by values().
    void set(const QString &key, const QString &value);
    QVariantMap values() const;

private:
    void store(const QString &key, const QVariant &value);

    mutable QSettings m_settings;
};

} // namespace core
} // namespace goalglide
