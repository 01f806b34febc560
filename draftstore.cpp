// draftstore.cpp
#include "draftstore.h"
#include "logging.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

DraftStore::DraftStore(const QString &path)
    : path(path)
{
}

bool DraftStore::save(const QString &category, const QVariantMap &fields)
{
    QJsonObject drafts;
    if (!readAll(&drafts)) {
        return false;
    }

    drafts.insert(category, QJsonObject::fromVariantMap(fields));
    return writeAll(drafts);
}

QVariantMap DraftStore::load(const QString &category) const
{
    QJsonObject drafts;
    if (!readAll(&drafts)) {
        return QVariantMap();
    }
    return drafts.value(category).toObject().toVariantMap();
}

bool DraftStore::clear(const QString &category)
{
    QJsonObject drafts;
    if (!readAll(&drafts)) {
        return false;
    }

    if (!drafts.contains(category)) {
        return true;
    }
    drafts.remove(category);
    return writeAll(drafts);
}

// 文件不存在视为空草稿
bool DraftStore::readAll(QJsonObject *drafts) const
{
    QFile file(path);
    if (!file.exists()) {
        *drafts = QJsonObject();
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcApp) << "Failed to load drafts from" << path << ":" << file.errorString();
        return false;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcApp) << "Failed to parse drafts in" << path << ":" << error.errorString();
        return false;
    }

    *drafts = doc.object();
    return true;
}

bool DraftStore::writeAll(const QJsonObject &drafts)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcApp) << "Failed to save drafts to" << path << ":" << file.errorString();
        return false;
    }

    if (file.write(QJsonDocument(drafts).toJson(QJsonDocument::Compact)) < 0 || !file.commit()) {
        qCWarning(lcApp) << "Failed to save drafts to" << path << ":" << file.errorString();
        return false;
    }
    return true;
}
