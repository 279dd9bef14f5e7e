#include "goalglide/cli/CommandLine.hpp"

#include "goalglide/core/AppContext.hpp"
#include "goalglide/core/Clock.hpp"
#include "goalglide/core/Config.hpp"
#include "goalglide/core/Errors.hpp"
#include "goalglide/core/Logging.hpp"
#include "goalglide/data/GoalRepository.hpp"
#include "goalglide/data/SessionRepository.hpp"
#include "goalglide/data/ThoughtRepository.hpp"
#include "goalglide/session/SessionTimer.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDate>
#include <QHash>

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace goalglide {
namespace cli {

namespace {
constexpr int DEFAULT_THOUGHT_LIMIT = 10;

class UsageError : public std::runtime_error
{
public:
    explicit UsageError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

void parseOrThrow(QCommandLineParser &parser, const QStringList &args)
{
    if (!parser.parse(QStringList{QStringLiteral("goalglide")} + args)) {
        throw UsageError(parser.errorText());
    }
}

QString positional(const QCommandLineParser &parser, int index, const QString &name)
{
    const QStringList values = parser.positionalArguments();
    if (index >= values.size()) {
        throw UsageError(QStringLiteral("Missing argument <%1>").arg(name));
    }
    return values.at(index);
}

QDateTime parseDeadline(const QString &value)
{
    const QDate date = QDate::fromString(value, QStringLiteral("yyyy-MM-dd"));
    if (!date.isValid()) {
        throw core::ValidationError(QStringLiteral("Deadline '%1' is not in YYYY-MM-DD format").arg(value));
    }
    return date.startOfDay().toUTC();
}

int parseCount(const QString &name, const QString &value)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok || parsed <= 0) {
        throw core::ValidationError(QStringLiteral("%1 must be a positive number").arg(name));
    }
    return parsed;
}

QString minutes(int seconds)
{
    return QStringLiteral("%1m").arg(seconds / 60);
}

int priorityRank(data::Priority priority)
{
    switch (priority) {
    case data::Priority::High:
        return 0;
    case data::Priority::Medium:
        return 1;
    case data::Priority::Low:
    default:
        return 2;
    }
}

QString describeGoal(const data::Goal &goal)
{
    QStringList flags;
    if (goal.archived) {
        flags << QStringLiteral("archived");
    }
    if (goal.completed) {
        flags << QStringLiteral("done");
    }
    QString line = QStringLiteral("%1  %2  [%3]").arg(goal.id, goal.title, data::priorityToString(goal.priority));
    if (!flags.isEmpty()) {
        line += QStringLiteral(" (%1)").arg(flags.join(QStringLiteral(", ")));
    }
    if (!goal.tags.isEmpty()) {
        line += QStringLiteral("  tags: %1").arg(goal.tags.join(QLatin1Char(',')));
    }
    if (goal.deadline) {
        line += QStringLiteral("  due %1").arg(goal.deadline->toLocalTime().date().toString(Qt::ISODate));
    }
    return line;
}
} // namespace

int runGuarded(QTextStream &err, const std::function<int()> &body)
{
    try {
        return body();
    } catch (const core::GoalGlideError &error) {
        spdlog::info("Command failed: {}", error.what());
        err << "Error: " << error.what() << '\n';
    } catch (const std::exception &error) {
        spdlog::warn("Unexpected error: {}", error.what());
        err << "An unexpected error occurred: " << error.what() << '\n';
    }
    err.flush();
    return ExitFailure;
}

CommandLine::CommandLine(core::AppContext &context, QTextStream &out, QTextStream &err)
    : m_context(context)
    , m_out(out)
    , m_err(err)
{
}

int CommandLine::run(const QStringList &arguments)
{
    const int code = runGuarded(m_err, [&]() -> int {
        try {
            return dispatch(arguments);
        } catch (const UsageError &error) {
            m_err << error.what() << '\n';
            return ExitUsage;
        }
    });
    m_out.flush();
    m_err.flush();
    return code;
}

int CommandLine::dispatch(const QStringList &arguments)
{
    const QStringList args = arguments.mid(1);
    if (args.isEmpty() || args.first() == QLatin1String("help") || args.first() == QLatin1String("--help")) {
        usage();
        return args.isEmpty() ? ExitUsage : ExitSuccess;
    }
    if (args.size() < 2) {
        throw UsageError(QStringLiteral("Missing subcommand for '%1'").arg(args.first()));
    }

    const QString group = args.at(0);
    const QString action = args.at(1);
    const QStringList rest = args.mid(2);
    spdlog::debug("Running {} {} with {} arguments", core::str(group), core::str(action), rest.size());

    if (group == QLatin1String("goal")) {
        return goalCommand(action, rest);
    }
    if (group == QLatin1String("tag")) {
        return tagCommand(action, rest);
    }
    if (group == QLatin1String("thought")) {
        return thoughtCommand(action, rest);
    }
    if (group == QLatin1String("pomo")) {
        return pomoCommand(action, rest);
    }
    if (group == QLatin1String("config")) {
        return configCommand(action, rest);
    }
    throw UsageError(QStringLiteral("Unknown command '%1'").arg(group));
}

int CommandLine::usage()
{
    m_out << "Usage: goalglide <command> <action> [arguments]\n"
             "  goal add <title> [--priority low|medium|high] [--deadline YYYY-MM-DD] [--parent id]\n"
             "  goal list [--archived|--all] [--priority p] [--tag t]... [--parent id] [--due-soon] [--overdue]\n"
             "  goal update <id> [--title t] [--priority p] [--deadline YYYY-MM-DD]\n"
             "  goal archive|restore|complete|reopen|remove <id>\n"
             "  tag add <id> <tag>... | tag rm <id> <tag> | tag list\n"
             "  thought jot <text> [--goal id] | thought list [--goal id] [--limit n] | thought rm <id>\n"
             "  pomo start [--duration min] [--goal id] | pomo stop|pause|resume|status\n"
             "  config show | config set <key> <value>\n";
    return ExitSuccess;
}

int CommandLine::goalCommand(const QString &action, const QStringList &args)
{
    data::GoalRepository &goals = m_context.goalRepository();
    QCommandLineParser parser;

    if (action == QLatin1String("add")) {
        const QCommandLineOption priorityOption({QStringLiteral("p"), QStringLiteral("priority")},
                                                QStringLiteral("Goal priority"), QStringLiteral("priority"),
                                                QStringLiteral("medium"));
        const QCommandLineOption deadlineOption(QStringLiteral("deadline"), QStringLiteral("Deadline"),
                                                QStringLiteral("date"));
        const QCommandLineOption parentOption(QStringLiteral("parent"), QStringLiteral("Parent goal id"),
                                              QStringLiteral("id"));
        parser.addOptions({priorityOption, deadlineOption, parentOption});
        parseOrThrow(parser, args);

        std::optional<QDateTime> deadline;
        if (parser.isSet(deadlineOption)) {
            deadline = parseDeadline(parser.value(deadlineOption));
        }
        std::optional<QString> parentId;
        if (parser.isSet(parentOption)) {
            parentId = parser.value(parentOption);
            goals.getGoal(*parentId);
        }

        const data::Goal goal = data::makeGoal(positional(parser, 0, QStringLiteral("title")),
                                               data::priorityFromString(parser.value(priorityOption)),
                                               deadline, parentId);
        if (goals.findByTitle(goal.title)) {
            m_out << "Warning: goal with this title already exists.\n";
        }
        goals.addGoal(goal);
        m_out << "Added goal " << goal.title << " (" << goal.id << ")\n";
        return ExitSuccess;
    }

    if (action == QLatin1String("list")) {
        const QCommandLineOption archivedOption(QStringLiteral("archived"), QStringLiteral("Only archived goals"));
        const QCommandLineOption allOption(QStringLiteral("all"), QStringLiteral("Active and archived goals"));
        const QCommandLineOption priorityOption(QStringLiteral("priority"), QStringLiteral("Filter by priority"),
                                                QStringLiteral("priority"));
        const QCommandLineOption tagOption(QStringLiteral("tag"), QStringLiteral("Required tag"),
                                           QStringLiteral("tag"));
        const QCommandLineOption parentOption(QStringLiteral("parent"), QStringLiteral("Parent goal id"),
                                              QStringLiteral("id"));
        const QCommandLineOption dueSoonOption(QStringLiteral("due-soon"), QStringLiteral("Due in three days"));
        const QCommandLineOption overdueOption(QStringLiteral("overdue"), QStringLiteral("Past deadline"));
        parser.addOptions(
            {archivedOption, allOption, priorityOption, tagOption, parentOption, dueSoonOption, overdueOption});
        parseOrThrow(parser, args);

        data::GoalFilter filter;
        filter.onlyArchived = parser.isSet(archivedOption);
        filter.includeArchived = parser.isSet(allOption);
        if (parser.isSet(priorityOption)) {
            filter.priority = data::priorityFromString(parser.value(priorityOption));
        }
        filter.tags = data::normalizeTags(parser.values(tagOption));
        if (parser.isSet(parentOption)) {
            filter.parentId = parser.value(parentOption);
        }
        filter.dueSoon = parser.isSet(dueSoonOption);
        filter.overdue = parser.isSet(overdueOption);

        std::vector<data::Goal> result = goals.listGoals(filter, m_context.clock().now());
        std::sort(result.begin(), result.end(), [](const data::Goal &lhs, const data::Goal &rhs) {
            const auto left = std::make_tuple(lhs.archived, priorityRank(lhs.priority), lhs.created);
            const auto right = std::make_tuple(rhs.archived, priorityRank(rhs.priority), rhs.created);
            return left < right;
        });
        if (result.empty()) {
            m_out << "No goals.\n";
        }
        for (const data::Goal &goal : result) {
            m_out << describeGoal(goal) << '\n';
        }
        return ExitSuccess;
    }

    if (action == QLatin1String("update")) {
        const QCommandLineOption titleOption(QStringLiteral("title"), QStringLiteral("New title"),
                                             QStringLiteral("title"));
        const QCommandLineOption priorityOption(QStringLiteral("priority"), QStringLiteral("New priority"),
                                                QStringLiteral("priority"));
        const QCommandLineOption deadlineOption(QStringLiteral("deadline"), QStringLiteral("New deadline"),
                                                QStringLiteral("date"));
        parser.addOptions({titleOption, priorityOption, deadlineOption});
        parseOrThrow(parser, args);

        const QString id = positional(parser, 0, QStringLiteral("id"));
        std::optional<QString> title;
        if (parser.isSet(titleOption)) {
            title = parser.value(titleOption).trimmed();
            if (title->isEmpty()) {
                throw core::ValidationError(QStringLiteral("Title cannot be empty."));
            }
        }
        std::optional<data::Priority> priority;
        if (parser.isSet(priorityOption)) {
            priority = data::priorityFromString(parser.value(priorityOption));
        }
        std::optional<QDateTime> deadline;
        if (parser.isSet(deadlineOption)) {
            deadline = parseDeadline(parser.value(deadlineOption));
        }

        const data::Goal goal = goals.editGoal(id, [&](data::Goal &stored) {
            if (title) {
                stored.title = *title;
            }
            if (priority) {
                stored.priority = *priority;
            }
            if (deadline) {
                stored.deadline = deadline;
            }
        });
        m_out << "Updated goal " << goal.id << '\n';
        return ExitSuccess;
    }

    parseOrThrow(parser, args);
    const QString id = positional(parser, 0, QStringLiteral("id"));
    if (action == QLatin1String("archive")) {
        goals.archiveGoal(id);
        m_out << "Goal " << id << " archived\n";
    } else if (action == QLatin1String("restore")) {
        goals.restoreGoal(id);
        m_out << "Goal " << id << " restored\n";
    } else if (action == QLatin1String("complete")) {
        goals.completeGoal(id);
        m_out << "Goal " << id << " completed\n";
    } else if (action == QLatin1String("reopen")) {
        goals.reopenGoal(id);
        m_out << "Goal " << id << " reopened\n";
    } else if (action == QLatin1String("remove")) {
        goals.removeGoal(id);
        m_out << "Removed " << id << '\n';
    } else {
        throw UsageError(QStringLiteral("Unknown goal action '%1'").arg(action));
    }
    return ExitSuccess;
}

int CommandLine::tagCommand(const QString &action, const QStringList &args)
{
    data::GoalRepository &goals = m_context.goalRepository();
    QCommandLineParser parser;
    parseOrThrow(parser, args);

    if (action == QLatin1String("list")) {
        const QMap<QString, int> counts = goals.tagCounts();
        if (counts.isEmpty()) {
            m_out << "No tags.\n";
        }
        for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
            m_out << it.key() << '\t' << it.value() << '\n';
        }
        return ExitSuccess;
    }

    const QString id = positional(parser, 0, QStringLiteral("id"));
    if (action == QLatin1String("add")) {
        const QStringList requested = parser.positionalArguments().mid(1);
        if (requested.isEmpty()) {
            throw UsageError(QStringLiteral("Missing argument <tag>"));
        }
        const data::Goal goal = goals.addTags(id, data::normalizeTags(requested));
        m_out << "Tags for " << goal.id << ": " << goal.tags.join(QStringLiteral(", ")) << '\n';
        return ExitSuccess;
    }
    if (action == QLatin1String("rm")) {
        const QString tag = data::normalizeTag(positional(parser, 1, QStringLiteral("tag")));
        const data::Goal before = goals.getGoal(id);
        const data::Goal after = goals.removeTag(id, tag);
        if (before.tags == after.tags) {
            m_out << "Tag '" << tag << "' not present\n";
        }
        m_out << "Tags for " << after.id << ": " << after.tags.join(QStringLiteral(", ")) << '\n';
        return ExitSuccess;
    }
    throw UsageError(QStringLiteral("Unknown tag action '%1'").arg(action));
}

int CommandLine::thoughtCommand(const QString &action, const QStringList &args)
{
    data::ThoughtRepository &thoughts = m_context.thoughtRepository();
    data::GoalRepository &goals = m_context.goalRepository();
    QCommandLineParser parser;
    const QCommandLineOption goalOption({QStringLiteral("g"), QStringLiteral("goal")},
                                        QStringLiteral("Goal id"), QStringLiteral("id"));

    if (action == QLatin1String("jot")) {
        parser.addOption(goalOption);
        parseOrThrow(parser, args);

        std::optional<QString> goalId;
        if (parser.isSet(goalOption)) {
            goalId = parser.value(goalOption);
            if (goals.getGoal(*goalId).archived) {
                throw core::ValidationError(QStringLiteral("Goal is archived"));
            }
        }
        const QString text = parser.positionalArguments().join(QLatin1Char(' '));
        thoughts.addThought(data::makeThought(text, goalId, m_context.clock().now()));
        m_out << "noted\n";
        return ExitSuccess;
    }

    if (action == QLatin1String("list")) {
        const QCommandLineOption limitOption(QStringLiteral("limit"), QStringLiteral("Max rows"),
                                             QStringLiteral("n"), QString::number(DEFAULT_THOUGHT_LIMIT));
        parser.addOptions({goalOption, limitOption});
        parseOrThrow(parser, args);

        data::ThoughtQuery query;
        if (parser.isSet(goalOption)) {
            query.goalId = parser.value(goalOption);
        }
        query.limit = parseCount(QStringLiteral("limit"), parser.value(limitOption));

        data::GoalFilter everything;
        everything.includeArchived = true;
        QHash<QString, QString> titles;
        for (const data::Goal &goal : goals.listGoals(everything)) {
            titles.insert(goal.id, goal.title);
        }

        const std::vector<data::Thought> result = thoughts.fetchThoughts(query);
        if (result.empty()) {
            m_out << "No thoughts.\n";
        }
        for (const data::Thought &thought : result) {
            QString goalLabel;
            if (thought.goalId) {
                goalLabel = titles.value(*thought.goalId, *thought.goalId);
            }
            m_out << thought.id << "  " << core::formatTimestamp(thought.timestamp) << "  " << goalLabel << "  "
                  << thought.text << '\n';
        }
        return ExitSuccess;
    }

    if (action == QLatin1String("rm")) {
        parseOrThrow(parser, args);
        const QString id = positional(parser, 0, QStringLiteral("id"));
        if (thoughts.removeThought(id)) {
            m_out << "Removed " << id << '\n';
        } else {
            m_out << "Thought " << id << " not found\n";
        }
        return ExitSuccess;
    }
    throw UsageError(QStringLiteral("Unknown thought action '%1'").arg(action));
}

int CommandLine::pomoCommand(const QString &action, const QStringList &args)
{
    session::SessionTimer &timer = m_context.sessionTimer();
    QCommandLineParser parser;

    if (action == QLatin1String("start")) {
        const QCommandLineOption durationOption(QStringLiteral("duration"), QStringLiteral("Minutes"),
                                                QStringLiteral("min"));
        const QCommandLineOption goalOption({QStringLiteral("g"), QStringLiteral("goal")},
                                            QStringLiteral("Goal id"), QStringLiteral("id"));
        parser.addOptions({durationOption, goalOption});
        parseOrThrow(parser, args);

        int duration = m_context.config().pomoDurationMin();
        if (parser.isSet(durationOption)) {
            duration = parseCount(QStringLiteral("duration"), parser.value(durationOption));
        }
        std::optional<QString> goalId;
        if (parser.isSet(goalOption)) {
            goalId = parser.value(goalOption);
        }
        timer.start(duration, goalId);
        m_out << "Started pomodoro for " << duration << "m\n";
        return ExitSuccess;
    }

    parseOrThrow(parser, args);
    if (action == QLatin1String("stop")) {
        const data::PomodoroSession finished = timer.stop();
        m_context.sessionRepository().addSession(finished);
        m_out << "Pomodoro complete (" << minutes(finished.durationSec) << ")\n";
    } else if (action == QLatin1String("pause")) {
        timer.pause();
        m_out << "Session paused\n";
    } else if (action == QLatin1String("resume")) {
        timer.resume();
        m_out << "Session resumed\n";
    } else if (action == QLatin1String("status")) {
        const auto status = timer.status();
        if (!status) {
            m_out << "No active session\n";
            return ExitSuccess;
        }
        m_out << "Elapsed " << minutes(status->elapsedSec) << " | Remaining " << minutes(status->remainingSec);
        if (status->state.paused) {
            m_out << " (paused)";
        }
        m_out << '\n';
    } else {
        throw UsageError(QStringLiteral("Unknown pomo action '%1'").arg(action));
    }
    return ExitSuccess;
}

int CommandLine::configCommand(const QString &action, const QStringList &args)
{
    core::Config &config = m_context.config();
    QCommandLineParser parser;
    parseOrThrow(parser, args);

    if (action == QLatin1String("show")) {
        const QVariantMap values = config.values();
        for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
            m_out << it.key() << " = " << it.value().toString() << '\n';
        }
        return ExitSuccess;
    }
    if (action == QLatin1String("set")) {
        const QString key = positional(parser, 0, QStringLiteral("key"));
        config.set(key, positional(parser, 1, QStringLiteral("value")));
        m_out << key << " = " << config.values().value(key).toString() << '\n';
        return ExitSuccess;
    }
    throw UsageError(QStringLiteral("Unknown config action '%1'").arg(action));
}

} // namespace cli
} // namespace goalglide
