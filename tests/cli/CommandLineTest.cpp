#include <QtTest/QtTest>

#include "../ManualClock.hpp"

#include "goalglide/cli/CommandLine.hpp"
#include "goalglide/core/AppContext.hpp"
#include "goalglide/core/Errors.hpp"
#include "goalglide/data/GoalRepository.hpp"
#include "goalglide/data/SessionRepository.hpp"
#include "goalglide/data/ThoughtRepository.hpp"
#include "goalglide/session/SessionHooks.hpp"
#include "goalglide/session/SessionTimer.hpp"

#include <QTemporaryDir>

using namespace goalglide;

class CommandLineTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void addAndListGoals();
    void duplicateTitleWarns();
    void domainErrorsExitWithFailure();
    void unknownCommandIsUsageError();
    void tagCommands();
    void thoughtOnArchivedGoalRejected();
    void thoughtJotAndList();
    void pomodoroLifecycle();
    void pomodoroUsesConfiguredDuration();
    void pomodoroDurationIsBounded();
    void goalUpdateEditsStoredGoal();
    void configSetValidates();
    void corruptDatabaseReported();

private:
    int run(const QStringList &args);
    QString onlyGoalId();

    std::unique_ptr<QTemporaryDir> m_dir;
    std::shared_ptr<ManualClock> m_clock;
    std::unique_ptr<core::AppContext> m_context;
    QString m_out;
    QString m_err;
};

void CommandLineTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_clock = std::make_shared<ManualClock>(QDateTime(QDate(2024, 3, 10), QTime(9, 0), Qt::UTC));
    m_context = std::make_unique<core::AppContext>(m_dir->path(), m_clock);
    QCOMPARE(m_context->dataDir(), m_dir->path());
}

void CommandLineTest::cleanup()
{
    m_context.reset();
}

int CommandLineTest::run(const QStringList &args)
{
    m_out.clear();
    m_err.clear();
    QTextStream out(&m_out);
    QTextStream err(&m_err);
    cli::CommandLine commandLine(*m_context, out, err);
    return commandLine.run(QStringList{QStringLiteral("goalglide")} + args);
}

QString CommandLineTest::onlyGoalId()
{
    const std::vector<data::Goal> goals = m_context->goalRepository().listGoals();
    if (goals.size() != 1) {
        return QString();
    }
    return goals.front().id;
}

void CommandLineTest::addAndListGoals()
{
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("list")}), 0);
    QCOMPARE(m_out, QStringLiteral("No goals.\n"));

    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("Write thesis"),
                  QStringLiteral("--priority"), QStringLiteral("high")}),
             0);
    const QString id = onlyGoalId();
    QVERIFY(!id.isEmpty());
    QCOMPARE(m_out, QStringLiteral("Added goal Write thesis (%1)\n").arg(id));

    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("list")}), 0);
    QVERIFY(m_out.contains(QStringLiteral("Write thesis")));
    QVERIFY(m_out.contains(QStringLiteral("[high]")));

    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("archive"), id}), 0);
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("list")}), 0);
    QCOMPARE(m_out, QStringLiteral("No goals.\n"));
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("list"), QStringLiteral("--archived")}), 0);
    QVERIFY(m_out.contains(QStringLiteral("(archived)")));
}

void CommandLineTest::duplicateTitleWarns()
{
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("Read")}), 0);
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("Read")}), 0);
    QVERIFY(m_out.startsWith(QStringLiteral("Warning: goal with this title already exists.\n")));

    data::GoalFilter everything;
    everything.includeArchived = true;
    QCOMPARE(m_context->goalRepository().listGoals(everything).size(), static_cast<size_t>(2));
}

void CommandLineTest::domainErrorsExitWithFailure()
{
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("   ")}), 1);
    QCOMPARE(m_err, QStringLiteral("Error: Title cannot be empty.\n"));

    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("archive"), QStringLiteral("missing")}), 1);
    QCOMPARE(m_err, QStringLiteral("Error: Goal missing not found\n"));

    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("stop")}), 1);
    QCOMPARE(m_err, QStringLiteral("Error: No active session\n"));

    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("Late"),
                  QStringLiteral("--deadline"), QStringLiteral("next week")}),
             1);
    QVERIFY(m_err.startsWith(QStringLiteral("Error: ")));
}

void CommandLineTest::unknownCommandIsUsageError()
{
    QCOMPARE(run({QStringLiteral("juggle"), QStringLiteral("now")}), 2);
    QVERIFY(m_err.contains(QStringLiteral("juggle")));
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("x"), QStringLiteral("--bogus")}),
             2);
    QCOMPARE(run({}), 2);
    QVERIFY(m_out.startsWith(QStringLiteral("Usage:")));
}

void CommandLineTest::tagCommands()
{
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("Tagged")}), 0);
    const QString id = onlyGoalId();

    QCOMPARE(run({QStringLiteral("tag"), QStringLiteral("add"), id, QStringLiteral("Work"), QStringLiteral("deep")}),
             0);
    QCOMPARE(m_out, QStringLiteral("Tags for %1: deep, work\n").arg(id));

    QCOMPARE(run({QStringLiteral("tag"), QStringLiteral("rm"), id, QStringLiteral("home")}), 0);
    QVERIFY(m_out.startsWith(QStringLiteral("Tag 'home' not present\n")));

    QCOMPARE(run({QStringLiteral("tag"), QStringLiteral("rm"), id, QStringLiteral("deep")}), 0);
    QCOMPARE(m_out, QStringLiteral("Tags for %1: work\n").arg(id));

    QCOMPARE(run({QStringLiteral("tag"), QStringLiteral("add"), id, QStringLiteral("no spaces")}), 1);
    QVERIFY(m_err.startsWith(QStringLiteral("Error: Invalid tag")));

    QCOMPARE(run({QStringLiteral("tag"), QStringLiteral("list")}), 0);
    QCOMPARE(m_out, QStringLiteral("work\t1\n"));
}

void CommandLineTest::thoughtOnArchivedGoalRejected()
{
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("Old")}), 0);
    const QString id = onlyGoalId();
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("archive"), id}), 0);

    QCOMPARE(run({QStringLiteral("thought"), QStringLiteral("jot"), QStringLiteral("idea"), QStringLiteral("--goal"),
                  id}),
             1);
    QCOMPARE(m_err, QStringLiteral("Error: Goal is archived\n"));
    QVERIFY(m_context->thoughtRepository().fetchThoughts().empty());
}

void CommandLineTest::thoughtJotAndList()
{
    QCOMPARE(run({QStringLiteral("thought"), QStringLiteral("list")}), 0);
    QCOMPARE(m_out, QStringLiteral("No thoughts.\n"));

    QCOMPARE(run({QStringLiteral("thought"), QStringLiteral("jot"), QStringLiteral("first")}), 0);
    QCOMPARE(m_out, QStringLiteral("noted\n"));
    m_clock->advance(60);
    QCOMPARE(run({QStringLiteral("thought"), QStringLiteral("jot"), QStringLiteral("second")}), 0);

    QCOMPARE(run({QStringLiteral("thought"), QStringLiteral("list"), QStringLiteral("--limit"), QStringLiteral("1")}),
             0);
    QVERIFY(m_out.contains(QStringLiteral("second")));
    QVERIFY(!m_out.contains(QStringLiteral("first")));

    const std::vector<data::Thought> thoughts = m_context->thoughtRepository().fetchThoughts();
    QCOMPARE(thoughts.size(), static_cast<size_t>(2));
    const QString id = thoughts.back().id;
    QCOMPARE(run({QStringLiteral("thought"), QStringLiteral("rm"), id}), 0);
    QCOMPARE(m_out, QStringLiteral("Removed %1\n").arg(id));
    QCOMPARE(run({QStringLiteral("thought"), QStringLiteral("rm"), id}), 0);
    QCOMPARE(m_out, QStringLiteral("Thought %1 not found\n").arg(id));
}

void CommandLineTest::pomodoroLifecycle()
{
    int finishedSeconds = 0;
    m_context->sessionHooks().onSessionEnd(
        [&finishedSeconds](const data::PomodoroSession &session) { finishedSeconds = session.durationSec; });

    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("status")}), 0);
    QCOMPARE(m_out, QStringLiteral("No active session\n"));

    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("start"), QStringLiteral("--duration"),
                  QStringLiteral("1")}),
             0);
    QCOMPARE(m_out, QStringLiteral("Started pomodoro for 1m\n"));

    m_clock->advance(30);
    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("pause")}), 0);
    QCOMPARE(m_out, QStringLiteral("Session paused\n"));
    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("pause")}), 1);

    m_clock->advance(600);
    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("status")}), 0);
    QCOMPARE(m_out, QStringLiteral("Elapsed 0m | Remaining 0m (paused)\n"));

    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("resume")}), 0);
    QCOMPARE(m_out, QStringLiteral("Session resumed\n"));

    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("stop")}), 0);
    QCOMPARE(m_out, QStringLiteral("Pomodoro complete (1m)\n"));
    QCOMPARE(finishedSeconds, 60);
    QVERIFY(!m_context->sessionTimer().loadActive());

    const std::vector<data::PomodoroSession> history = m_context->sessionRepository().fetchSessions();
    QCOMPARE(history.size(), static_cast<size_t>(1));
    QCOMPARE(history.front().durationSec, 60);
    QCOMPARE(history.front().start, QDateTime(QDate(2024, 3, 10), QTime(9, 0), Qt::UTC));
}

void CommandLineTest::pomodoroUsesConfiguredDuration()
{
    QCOMPARE(run({QStringLiteral("config"), QStringLiteral("set"), QStringLiteral("pomo_duration_min"),
                  QStringLiteral("50")}),
             0);
    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("start")}), 0);
    QCOMPARE(m_out, QStringLiteral("Started pomodoro for 50m\n"));

    m_clock->advance(10 * 60);
    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("status")}), 0);
    QCOMPARE(m_out, QStringLiteral("Elapsed 10m | Remaining 40m\n"));
}

void CommandLineTest::pomodoroDurationIsBounded()
{
    QCOMPARE(run({QStringLiteral("pomo"), QStringLiteral("start"), QStringLiteral("--duration"),
                  QStringLiteral("2147483647")}),
             1);
    QCOMPARE(m_err, QStringLiteral("Error: Duration must be between 1 and 600 minutes\n"));
    QVERIFY(!m_context->sessionTimer().loadActive());
}

void CommandLineTest::goalUpdateEditsStoredGoal()
{
    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("add"), QStringLiteral("Draft")}), 0);
    const QString id = onlyGoalId();
    m_context->goalRepository().addTags(id, {QStringLiteral("writing")});
    m_context->goalRepository().completeGoal(id);

    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("update"), id, QStringLiteral("--title"),
                  QStringLiteral("Final draft"), QStringLiteral("--priority"), QStringLiteral("high")}),
             0);
    QCOMPARE(m_out, QStringLiteral("Updated goal %1\n").arg(id));

    const data::Goal goal = m_context->goalRepository().getGoal(id);
    QCOMPARE(goal.title, QStringLiteral("Final draft"));
    QCOMPARE(goal.priority, data::Priority::High);
    QCOMPARE(goal.tags, QStringList({QStringLiteral("writing")}));
    QVERIFY(goal.completed);

    QCOMPARE(run({QStringLiteral("goal"), QStringLiteral("update"), id, QStringLiteral("--title"),
                  QStringLiteral("  ")}),
             1);
    QCOMPARE(m_context->goalRepository().getGoal(id).title, QStringLiteral("Final draft"));
}

void CommandLineTest::configSetValidates()
{
    QCOMPARE(run({QStringLiteral("config"), QStringLiteral("set"), QStringLiteral("reminder_break_min"),
                  QStringLiteral("0")}),
             1);
    QVERIFY(m_err.startsWith(QStringLiteral("Error: break must be between 1 and 120")));

    QCOMPARE(run({QStringLiteral("config"), QStringLiteral("show")}), 0);
    QVERIFY(m_out.contains(QStringLiteral("reminder_break_min = 5\n")));
    QVERIFY(m_out.contains(QStringLiteral("quotes_enabled = true\n")));
}

void CommandLineTest::corruptDatabaseReported()
{
    m_context.reset();
    QFile db(m_dir->filePath(QStringLiteral("db.json")));
    QVERIFY(db.open(QIODevice::WriteOnly));
    db.write("{ not json");
    db.close();

    QString errText;
    QTextStream err(&errText);
    const int code = cli::runGuarded(err, [&]() {
        core::AppContext context(m_dir->path(), m_clock);
        return 0;
    });
    QCOMPARE(code, 1);
    QVERIFY(errText.startsWith(QStringLiteral("Error: ")));
    QVERIFY(errText.contains(QStringLiteral("not valid JSON")));

    QVERIFY_EXCEPTION_THROWN(core::AppContext(m_dir->path(), m_clock), core::CorruptDataError);
}

QTEST_MAIN(CommandLineTest)
#include "CommandLineTest.moc"
