#include <QCoreApplication>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "goalglide/cli/CommandLine.hpp"
#include "goalglide/core/AppContext.hpp"
#include "goalglide/core/Logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Goal Glide"));
    QCoreApplication::setApplicationName(QStringLiteral("goalglide"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kGoalGlideVersion));

    QCoreApplication app(argc, argv);
    goalglide::core::initLogging();

    QTextStream out(stdout);
    QTextStream err(stderr);

    return goalglide::cli::runGuarded(err, [&]() {
        goalglide::core::AppContext context(goalglide::core::AppContext::defaultDataDir());
        goalglide::cli::CommandLine commandLine(context, out, err);
        return commandLine.run(app.arguments());
    });
}
