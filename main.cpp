// main.cpp
#include "librarymanager.h"
#include "logging.h"

#include <QCommandLineParser>
#include <QCoreApplication>

#include <cstdio>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // 设置应用程序信息
    app.setApplicationName("schoollib");
    app.setOrganizationName("LibrarySoft");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("School library management");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "INI configuration file.", "file");
    QCommandLineOption dbOption("db", "Database file (overrides the configuration).", "file");
    QCommandLineOption schoolOption("school", "School name.", "name");
    QCommandLineOption schoolPasswordOption("school-password", "School password.", "password");
    QCommandLineOption userOption("user", "Username.", "name");
    QCommandLineOption passwordOption("password", "User password.", "password");
    QCommandLineOption daysOption("days", "Loan period in days for borrow.", "days");
    QCommandLineOption limitOption("limit", "Number of deletions to list.", "count");
    QCommandLineOption nonCirculatingOption("non-circulating", "Mark a new book as reference only.");
    QCommandLineOption conditionOption("condition", "Condition of a new book.", "condition");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Enable debug logging.");

    parser.addOptions(QList<QCommandLineOption>()
                      << configOption << dbOption << schoolOption << schoolPasswordOption
                      << userOption << passwordOption << daysOption << limitOption
                      << nonCirculatingOption << conditionOption << verboseOption);
    parser.addPositionalArgument("command", "One of: " + LibraryManager::commands().join(", "));
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        err << parser.helpText();
        err.flush();
        return 1;
    }
    const QString command = positional.takeFirst();

    CommandOptions options;
    if (parser.isSet(daysOption)) {
        bool ok = false;
        options.days = parser.value(daysOption).toInt(&ok);
        if (!ok || options.days < 1) {
            err << "--days must be a positive number\n";
            err.flush();
            return 1;
        }
    }
    if (parser.isSet(limitOption)) {
        bool ok = false;
        options.limit = parser.value(limitOption).toInt(&ok);
        if (!ok || options.limit < 1) {
            err << "--limit must be a positive number\n";
            err.flush();
            return 1;
        }
    }
    options.nonCirculating = parser.isSet(nonCirculatingOption);
    options.condition = parser.value(conditionOption);

    const AppConfig config = AppConfig::load(parser.value(configOption));
    Log::init(config.logPath, parser.isSet(verboseOption));

    Credentials credentials;
    credentials.schoolName = parser.value(schoolOption);
    credentials.schoolPassword = parser.value(schoolPasswordOption);
    credentials.username = parser.value(userOption);
    credentials.password = parser.value(passwordOption);

    int exitCode = 0;
    try {
        LibraryManager manager(config, credentials, out, err);
        const QString dbPath = parser.isSet(dbOption) ? parser.value(dbOption) : config.databasePath;
        exitCode = manager.openDatabase(dbPath) ? manager.execute(command, positional, options) : 1;
    } catch (const StoreError &e) {
        qCCritical(lcApp) << "Database error:" << e.what();
        err << "Database error: " << e.what() << '\n';
        exitCode = 2;
    }

    out.flush();
    err.flush();
    Log::shutdown();
    return exitCode;
}
