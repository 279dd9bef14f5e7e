#include <QtTest/QtTest>

#include "goalglide/core/Config.hpp"
#include "goalglide/core/Errors.hpp"

#include <QTemporaryDir>

using namespace goalglide::core;

class ConfigTest : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void defaults();
    void persistsAcrossInstances();
    void rejectsOutOfRange_data();
    void rejectsOutOfRange();
    void parsesTextualValues();
    void rejectsUnknownKey();

private:
    QString path() const { return Config::configPath(m_dir->path()); }

    std::unique_ptr<QTemporaryDir> m_dir;
};

void ConfigTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void ConfigTest::defaults()
{
    Config config(path());
    QCOMPARE(config.pomoDurationMin(), 25);
    QVERIFY(config.quotesEnabled());
    QVERIFY(!config.remindersEnabled());
    QCOMPARE(config.reminderBreakMin(), 5);
    QCOMPARE(config.reminderIntervalMin(), 30);
    QVERIFY(!QFile::exists(path()));

    const QVariantMap values = config.values();
    QCOMPARE(values.size(), 5);
    QCOMPARE(values.value(QStringLiteral("pomo_duration_min")).toInt(), 25);
}

void ConfigTest::persistsAcrossInstances()
{
    {
        Config config(path());
        config.setPomoDurationMin(50);
        config.setQuotesEnabled(false);
        config.setRemindersEnabled(true);
        config.setReminderBreakMin(10);
        config.setReminderIntervalMin(45);
    }
    QVERIFY(QFile::exists(path()));

    Config reloaded(path());
    QCOMPARE(reloaded.pomoDurationMin(), 50);
    QVERIFY(!reloaded.quotesEnabled());
    QVERIFY(reloaded.remindersEnabled());
    QCOMPARE(reloaded.reminderBreakMin(), 10);
    QCOMPARE(reloaded.reminderIntervalMin(), 45);
}

void ConfigTest::rejectsOutOfRange_data()
{
    QTest::addColumn<QString>("key");
    QTest::addColumn<QString>("value");

    QTest::newRow("break zero") << QStringLiteral("reminder_break_min") << QStringLiteral("0");
    QTest::newRow("break too long") << QStringLiteral("reminder_break_min") << QStringLiteral("121");
    QTest::newRow("interval zero") << QStringLiteral("reminder_interval_min") << QStringLiteral("0");
    QTest::newRow("interval too long") << QStringLiteral("reminder_interval_min") << QStringLiteral("500");
    QTest::newRow("duration negative") << QStringLiteral("pomo_duration_min") << QStringLiteral("-5");
    QTest::newRow("duration not a number") << QStringLiteral("pomo_duration_min") << QStringLiteral("ten");
    QTest::newRow("bool garbage") << QStringLiteral("quotes_enabled") << QStringLiteral("maybe");
}

void ConfigTest::rejectsOutOfRange()
{
    QFETCH(QString, key);
    QFETCH(QString, value);

    Config config(path());
    const QVariantMap before = config.values();
    QVERIFY_EXCEPTION_THROWN(config.set(key, value), ValidationError);
    QCOMPARE(config.values(), before);
}

void ConfigTest::parsesTextualValues()
{
    Config config(path());
    config.set(QStringLiteral("pomo_duration_min"), QStringLiteral(" 40 "));
    config.set(QStringLiteral("quotes_enabled"), QStringLiteral("off"));
    config.set(QStringLiteral("reminders_enabled"), QStringLiteral("TRUE"));
    config.set(QStringLiteral("reminder_break_min"), QStringLiteral("120"));
    config.set(QStringLiteral("reminder_interval_min"), QStringLiteral("1"));

    QCOMPARE(config.pomoDurationMin(), 40);
    QVERIFY(!config.quotesEnabled());
    QVERIFY(config.remindersEnabled());
    QCOMPARE(config.reminderBreakMin(), 120);
    QCOMPARE(config.reminderIntervalMin(), 1);
}

void ConfigTest::rejectsUnknownKey()
{
    Config config(path());
    QVERIFY_EXCEPTION_THROWN(config.set(QStringLiteral("theme"), QStringLiteral("dark")), ValidationError);
}

QTEST_MAIN(ConfigTest)
#include "ConfigTest.moc"
