// logging.h
#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcLedger)
Q_DECLARE_LOGGING_CATEGORY(lcUndo)
Q_DECLARE_LOGGING_CATEGORY(lcBackup)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace Log
{
    // 安装日志处理器：写入日志文件，警告及以上同时输出到 stderr。
    // logFile 为空时只输出到 stderr。
    void init(const QString &logFile, bool verbose);

    // 恢复 Qt 默认处理器并关闭日志文件
    void shutdown();
}

#endif // LOGGING_H
