// appconfig.cpp
#include "appconfig.h"
#include "logging.h"
#include "models.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

namespace
{
    const char *DefaultLicenseSecret = "ellvins-offline-secret-v1";

    int readAtLeast(const QSettings &settings, const QString &key, int fallback, int minimum)
    {
        if (!settings.contains(key)) {
            return fallback;
        }

        bool ok = false;
        const int value = settings.value(key).toInt(&ok);
        if (!ok || value < minimum) {
            qCWarning(lcApp) << "Invalid value for" << key << ":" << settings.value(key).toString()
                             << "- using" << fallback;
            return fallback;
        }
        return value;
    }
}

AppConfig::AppConfig()
    : defaultFinePerDay(DefaultFinePerDay)
    , defaultLoanDays(DefaultLoanDays)
    , recentDeletionsLimit(DefaultRecentDeletions)
    , licenseSecret(DefaultLicenseSecret)
{
}

QString AppConfig::defaultConfigPath()
{
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)).filePath("schoollib.ini");
}

AppConfig AppConfig::load(const QString &iniPath)
{
    const QString configPath = iniPath.isEmpty() ? defaultConfigPath() : iniPath;
    QSettings settings(configPath, QSettings::IniFormat);

    AppConfig config;

    // 路径
    const QString defaultDataDir = iniPath.isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
        : QFileInfo(configPath).absolutePath();
    config.dataDir = settings.value("paths/data_dir", defaultDataDir).toString();

    QDir dir(config.dataDir);
    if (!dir.exists() && !dir.mkpath(".")) {
        qCWarning(lcApp) << "Cannot create data directory" << config.dataDir;
    }

    config.databasePath = settings.value("paths/database", dir.filePath("library.db")).toString();
    config.licensePath = settings.value("paths/license", dir.filePath("license.json")).toString();
    config.draftsPath = settings.value("paths/drafts", dir.filePath("drafts.json")).toString();
    config.logPath = settings.value("paths/log", dir.filePath("schoollib.log")).toString();

    // 新学校的默认值
    config.defaultFinePerDay = readAtLeast(settings, "defaults/fine_per_day", DefaultFinePerDay, 0);
    config.defaultLoanDays = readAtLeast(settings, "defaults/loan_days", DefaultLoanDays, 1);
    config.recentDeletionsLimit = readAtLeast(settings, "undo/recent_limit", DefaultRecentDeletions, 1);

    const QString secret = settings.value("license/secret").toString();
    if (!secret.isEmpty()) {
        config.licenseSecret = secret.toUtf8();
    }

    if (settings.status() != QSettings::NoError) {
        qCWarning(lcApp) << "Could not read configuration" << configPath;
    }

    return config;
}
