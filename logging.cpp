// logging.cpp
#include "logging.h"

#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QScopedPointer>
#include <QTextStream>

#include <cstdio>

Q_LOGGING_CATEGORY(lcStore, "library.store")
Q_LOGGING_CATEGORY(lcLedger, "library.ledger")
Q_LOGGING_CATEGORY(lcUndo, "library.undo")
Q_LOGGING_CATEGORY(lcBackup, "library.backup")
Q_LOGGING_CATEGORY(lcApp, "library.app")

namespace
{
    QScopedPointer<QFile> logFile;
    QMutex logMutex;

    void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
    {
        const QString line = qFormatLogMessage(type, context, msg);

        QMutexLocker locker(&logMutex);
        if (logFile && logFile->isOpen()) {
            QTextStream out(logFile.data());
            out << line << '\n';
            out.flush();
        }

        if (type != QtDebugMsg && type != QtInfoMsg) {
            std::fprintf(stderr, "%s\n", qPrintable(line));
            std::fflush(stderr);
        }
    }
}

namespace Log
{
    void init(const QString &logFilePath, bool verbose)
    {
        qSetMessagePattern("[%{time yyyy-MM-dd hh:mm:ss.zzz}] [%{type}] %{category}: %{message}");

        if (verbose) {
            QLoggingCategory::setFilterRules("library.*.debug=true");
        } else {
            QLoggingCategory::setFilterRules("library.*.debug=false");
        }

        {
            QMutexLocker locker(&logMutex);
            logFile.reset();

            if (!logFilePath.isEmpty()) {
                logFile.reset(new QFile(logFilePath));
                if (!logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                    std::fprintf(stderr, "Cannot open log file %s: %s\n",
                                 qPrintable(logFilePath), qPrintable(logFile->errorString()));
                    logFile.reset();
                }
            }
        }

        qInstallMessageHandler(messageHandler);
    }

    void shutdown()
    {
        qInstallMessageHandler(nullptr);

        QMutexLocker locker(&logMutex);
        logFile.reset();
    }
}
