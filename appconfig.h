// appconfig.h
#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QByteArray>
#include <QString>

struct AppConfig
{
    QString dataDir;
    QString databasePath;
    QString licensePath;
    QString draftsPath;
    QString logPath;

    int defaultFinePerDay;
    int defaultLoanDays;
    int recentDeletionsLimit;

    QByteArray licenseSecret;

    AppConfig();

    // 读取 INI 配置；iniPath 为空时使用 <AppDataLocation>/schoollib.ini。
    // 缺失的键使用默认值，数据目录不存在时自动创建。
    static AppConfig load(const QString &iniPath = QString());
    static QString defaultConfigPath();
};

#endif // APPCONFIG_H
