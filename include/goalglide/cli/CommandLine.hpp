#pragma once

#include <QStringList>
#include <QTextStream>

#include <functional>

namespace goalglide {
namespace core {
class AppContext;
}

namespace cli {

enum ExitCode
{
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2,
};

// Runs body and turns exceptions into a message on err and ExitFailure.
int runGuarded(QTextStream &err, const std::function<int()> &body);

// Text front end over the repositories and the session timer.
// Arguments follow the QCoreApplication::arguments() convention, program
// name first: "goalglide goal add 'Write thesis' --priority high".
class CommandLine
{
public:
    CommandLine(core::AppContext &context, QTextStream &out, QTextStream &err);

    int run(const QStringList &arguments);

private:
    int dispatch(const QStringList &arguments);
    int usage();

    int goalCommand(const QString &action, const QStringList &args);
    int tagCommand(const QString &action, const QStringList &args);
    int thoughtCommand(const QString &action, const QStringList &args);
    int pomoCommand(const QString &action, const QStringList &args);
    int configCommand(const QString &action, const QStringList &args);

    core::AppContext &m_context;
    QTextStream &m_out;
    QTextStream &m_err;
};

} // namespace cli
} // namespace goalglide
