// licensevalidator.h
#ifndef LICENSEVALIDATOR_H
#define LICENSEVALIDATOR_H

#include <QByteArray>
#include <QString>

struct LicenseCheck
{
    bool valid = false;
    QString message;
};

// 离线授权文件：{"school": "...", "mac": "<hex HMAC-SHA256>"}。
// 仅用于在设置中显示授权状态，不限制借还书操作。
namespace LicenseValidator
{
    QString licenseMac(const QString &schoolName, const QByteArray &secret);
    LicenseCheck validateLicenseFile(const QString &path, const QString &expectedSchool, const QByteArray &secret);
    bool writeLicenseFile(const QString &path, const QString &schoolName, const QByteArray &secret,
                          QString *error = nullptr);
}

#endif // LICENSEVALIDATOR_H
