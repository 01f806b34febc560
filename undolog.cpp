// undolog.cpp
#include "undolog.h"
#include "librarystore.h"
#include "logging.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QSqlDatabase>

namespace
{
    bool restoreStudent(LibraryStore &store, int schoolId, const QJsonObject &data)
    {
        return store.addStudent(schoolId,
                                data.value("admission_no").toString(),
                                data.value("name").toString(),
                                data.value("class").toString());
    }

    bool restoreBook(LibraryStore &store, int schoolId, const QJsonObject &data)
    {
        // 旧快照中 non_circulating 可能是整数或布尔值
        const QJsonValue nonCirc = data.value("non_circulating");
        const bool nonCirculating = nonCirc.isBool() ? nonCirc.toBool() : nonCirc.toInt() != 0;

        BookCondition condition = BookCondition::Good;
        if (!conditionFromString(data.value("condition").toString(), &condition)) {
            condition = BookCondition::Good;
        }

        return store.addBook(schoolId,
                             data.value("title").toString(),
                             data.value("author").toString(),
                             data.value("barcode").toString(),
                             nonCirculating,
                             condition);
    }
}

UndoLog::UndoLog(LibraryStore &store)
    : store(store)
{
    registerRestorer("students", restoreStudent);
    registerRestorer("books", restoreBook);
}

void UndoLog::registerRestorer(const QString &tableName, Restorer restorer)
{
    restorers.insert(tableName, restorer);
}

bool UndoLog::canRestore(const QString &tableName) const
{
    return restorers.contains(tableName);
}

QList<UndoEntry> UndoLog::listRecent(int schoolId, int limit) const
{
    return store.recentDeletions(schoolId, limit);
}

LedgerResult UndoLog::undo(int schoolId, int entryId)
{
    QSqlDatabase db = store.database();
    if (!db.transaction()) {
        throw StoreError(db.lastError(), "begin undo");
    }

    try {
        const UndoEntry entry = store.undoEntry(schoolId, entryId);
        if (!entry.isValid()) {
            throw LedgerResult::failure(LedgerStatus::NotFound, "Undo record not found");
        }

        if (!restorers.contains(entry.tableName)) {
            throw LedgerResult::failure(LedgerStatus::NotFound,
                                        QString("Cannot restore records of table '%1'").arg(entry.tableName));
        }

        const QJsonObject data = snapshot(entry);
        if (data.isEmpty()) {
            throw LedgerResult::failure(LedgerStatus::InvalidArgument, "Undo record is corrupt");
        }

        // 编号/条码已被重新占用时恢复失败，保留日志条目
        if (!restorers.value(entry.tableName)(store, schoolId, data)) {
            throw LedgerResult::failure(LedgerStatus::DuplicateKey,
                                        "Failed to restore: a record with the same key already exists");
        }

        store.removeUndoEntry(schoolId, entryId);

        if (!db.commit()) {
            throw StoreError(db.lastError(), "commit undo");
        }

        qCInfo(lcUndo) << "Restored" << entry.tableName << "record from undo entry" << entryId;
        return LedgerResult::success("Record restored");

    } catch (const LedgerResult &failure) {
        db.rollback();
        qCInfo(lcUndo) << "Undo of entry" << entryId << "failed:" << failure.message;
        return failure;
    } catch (const StoreError &) {
        db.rollback();
        throw;
    }
}

QJsonObject UndoLog::snapshot(const UndoEntry &entry)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(entry.recordData.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcUndo) << "Undo entry" << entry.id << "has invalid snapshot:" << error.errorString();
        return QJsonObject();
    }
    return doc.object();
}

QString UndoLog::describe(const UndoEntry &entry)
{
    const QJsonObject data = snapshot(entry);

    if (entry.tableName == "students") {
        return QString("%1 (%2)").arg(data.value("name").toString(), data.value("admission_no").toString());
    }
    if (entry.tableName == "books") {
        return QString("%1 - %2").arg(data.value("title").toString(), data.value("barcode").toString());
    }
    return "Unknown";
}
