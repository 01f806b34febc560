// databasebackup.h
#ifndef DATABASEBACKUP_H
#define DATABASEBACKUP_H

#include <QString>

class LibraryStore;

// 整个数据库文件的备份与恢复。失败只返回 false 和错误信息，不会中断会话。
namespace DatabaseBackup
{
    bool exportDatabase(LibraryStore &store, const QString &destination, QString *error = nullptr);

    // 恢复时先关闭连接、原子替换数据库文件，再重新打开
    bool restoreDatabase(LibraryStore &store, const QString &source, QString *error = nullptr);

    bool isSqliteFile(const QString &path);
}

#endif // DATABASEBACKUP_H
