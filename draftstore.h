// draftstore.h
#ifndef DRAFTSTORE_H
#define DRAFTSTORE_H

#include <QJsonObject>
#include <QString>
#include <QVariantMap>

// 表单草稿：JSON 文件，按类别保存字段值。整体读写，不保证事务性。
class DraftStore
{
public:
    explicit DraftStore(const QString &path);

    bool save(const QString &category, const QVariantMap &fields);
    QVariantMap load(const QString &category) const;
    bool clear(const QString &category);

    QString filePath() const { return path; }

private:
    bool readAll(QJsonObject *drafts) const;
    bool writeAll(const QJsonObject &drafts);

    QString path;
};

#endif // DRAFTSTORE_H
