// licensevalidator.cpp
#include "licensevalidator.h"
#include "logging.h"

#include <QCryptographicHash>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QMessageAuthenticationCode>
#include <QSaveFile>

namespace
{
    // 比较耗时与内容无关
    bool constantTimeEquals(const QByteArray &a, const QByteArray &b)
    {
        if (a.size() != b.size()) {
            return false;
        }

        unsigned char diff = 0;
        for (int i = 0; i < a.size(); ++i) {
            diff |= static_cast<unsigned char>(a.at(i)) ^ static_cast<unsigned char>(b.at(i));
        }
        return diff == 0;
    }
}

namespace LicenseValidator
{
    QString licenseMac(const QString &schoolName, const QByteArray &secret)
    {
        const QByteArray mac = QMessageAuthenticationCode::hash(schoolName.toUtf8(), secret,
                                                                QCryptographicHash::Sha256);
        return QString::fromLatin1(mac.toHex());
    }

    LicenseCheck validateLicenseFile(const QString &path, const QString &expectedSchool, const QByteArray &secret)
    {
        LicenseCheck check;

        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            check.message = QString("Failed to read license: %1").arg(file.errorString());
            qCWarning(lcApp) << check.message;
            return check;
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            check.message = QString("Failed to read license: %1").arg(parseError.errorString());
            qCWarning(lcApp) << check.message;
            return check;
        }

        const QJsonObject data = doc.object();
        if (data.value("school").toString() != expectedSchool) {
            check.message = "License file school name mismatch";
            return check;
        }

        const QByteArray mac = data.value("mac").toString().toLatin1();
        const QByteArray expected = licenseMac(expectedSchool, secret).toLatin1();
        if (constantTimeEquals(mac, expected)) {
            check.valid = true;
            check.message = "License valid";
        } else {
            check.message = "License HMAC invalid";
        }
        return check;
    }

    bool writeLicenseFile(const QString &path, const QString &schoolName, const QByteArray &secret, QString *error)
    {
        QJsonObject data;
        data.insert("school", schoolName);
        data.insert("mac", licenseMac(schoolName, secret));

        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly)
            || file.write(QJsonDocument(data).toJson()) < 0
            || !file.commit()) {
            if (error) {
                *error = file.errorString();
            }
            qCWarning(lcApp) << "Cannot write license file" << path << ":" << file.errorString();
            return false;
        }
        return true;
    }
}
