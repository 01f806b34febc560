// undolog.h
#ifndef UNDOLOG_H
#define UNDOLOG_H

#include "loanledger.h"
#include "models.h"

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QString>

#include <functional>

class LibraryStore;

// 撤销学生/图书的删除：把快照重新插入，成功后移除日志条目。
// 只能撤销删除操作，不能撤销新增、修改或借还。
class UndoLog
{
public:
    // 把快照重新插入到对应的表；唯一约束冲突时返回 false
    typedef std::function<bool(LibraryStore &, int schoolId, const QJsonObject &snapshot)> Restorer;

    explicit UndoLog(LibraryStore &store);

    void registerRestorer(const QString &tableName, Restorer restorer);
    bool canRestore(const QString &tableName) const;

    QList<UndoEntry> listRecent(int schoolId, int limit = DefaultRecentDeletions) const;
    LedgerResult undo(int schoolId, int entryId);

    static QJsonObject snapshot(const UndoEntry &entry);
    static QString describe(const UndoEntry &entry);

private:
    LibraryStore &store;
    QHash<QString, Restorer> restorers;
};

#endif // UNDOLOG_H
