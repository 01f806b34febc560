// databasebackup.cpp
#include "databasebackup.h"
#include "librarystore.h"
#include "logging.h"

#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace
{
    const QByteArray SqliteMagic("SQLite format 3\0", 16);

    void setError(QString *error, const QString &message)
    {
        qCWarning(lcBackup) << message;
        if (error) {
            *error = message;
        }
    }

    bool readFile(const QString &path, QByteArray *data, QString *error)
    {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            setError(error, QString("Cannot read %1: %2").arg(path, file.errorString()));
            return false;
        }
        *data = file.readAll();
        return true;
    }

    bool writeFileAtomically(const QString &path, const QByteArray &data, QString *error)
    {
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            setError(error, QString("Cannot write %1: %2").arg(path, file.errorString()));
            return false;
        }
        if (file.write(data) != data.size() || !file.commit()) {
            setError(error, QString("Cannot write %1: %2").arg(path, file.errorString()));
            return false;
        }
        return true;
    }

    bool isFileBacked(const LibraryStore &store)
    {
        const QString path = store.databasePath();
        return !path.isEmpty() && path != ":memory:";
    }
}

namespace DatabaseBackup
{
    bool exportDatabase(LibraryStore &store, const QString &destination, QString *error)
    {
        if (!store.isOpen() || !isFileBacked(store)) {
            setError(error, "Export failed: no database file is open");
            return false;
        }

        const QString source = store.databasePath();
        if (QFileInfo(destination).absoluteFilePath() == QFileInfo(source).absoluteFilePath()) {
            setError(error, "Export failed: destination is the open database");
            return false;
        }

        QByteArray data;
        if (!readFile(source, &data, error) || !writeFileAtomically(destination, data, error)) {
            return false;
        }

        qCInfo(lcBackup) << "Database exported to" << destination << "(" << data.size() << "bytes )";
        return true;
    }

    bool restoreDatabase(LibraryStore &store, const QString &source, QString *error)
    {
        if (!isFileBacked(store)) {
            setError(error, "Restore failed: no database file is open");
            return false;
        }

        if (!isSqliteFile(source)) {
            setError(error, QString("Restore failed: %1 is not an SQLite database").arg(source));
            return false;
        }

        QByteArray data;
        if (!readFile(source, &data, error)) {
            return false;
        }

        const QString target = store.databasePath();

        // 替换文件期间不能有打开的连接
        store.close();
        const bool replaced = writeFileAtomically(target, data, error);

        if (!store.open(target)) {
            setError(error, QString("Cannot reopen database %1").arg(target));
            return false;
        }

        try {
            store.initSchema();
        } catch (const StoreError &e) {
            setError(error, QString("Restored database is unusable: %1").arg(e.what()));
            return false;
        }

        if (!replaced) {
            return false;
        }

        qCInfo(lcBackup) << "Database restored from" << source;
        return true;
    }

    bool isSqliteFile(const QString &path)
    {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            return false;
        }
        return file.read(SqliteMagic.size()) == SqliteMagic;
    }
}
