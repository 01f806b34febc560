// test_appconfig.cpp
#include "appconfig.h"
#include "testutil.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace
{
    QString writeIni(const QTemporaryDir &dir, const QByteArray &content)
    {
        const QString path = dir.filePath("schoollib.ini");
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write(content);
        }
        return path;
    }
}

TEST(AppConfigTest, DefaultsBesideConfigFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString ini = writeIni(dir, "");

    const AppConfig config = AppConfig::load(ini);
    EXPECT_EQ(QDir(config.dataDir).absolutePath(), QDir(dir.path()).absolutePath());
    EXPECT_EQ(config.databasePath, QDir(config.dataDir).filePath("library.db"));
    EXPECT_EQ(config.licensePath, QDir(config.dataDir).filePath("license.json"));
    EXPECT_EQ(config.draftsPath, QDir(config.dataDir).filePath("drafts.json"));
    EXPECT_EQ(config.defaultFinePerDay, 10);
    EXPECT_EQ(config.defaultLoanDays, 14);
    EXPECT_EQ(config.recentDeletionsLimit, 10);
    EXPECT_FALSE(config.licenseSecret.isEmpty());
}

TEST(AppConfigTest, ReadsValues)
{
    QTemporaryDir dir;
    const QString dataDir = dir.filePath("data");
    const QString ini = writeIni(dir,
                                 "[paths]\n"
                                 "data_dir=" + dataDir.toUtf8() + "\n"
                                 "[defaults]\n"
                                 "fine_per_day=0\n"
                                 "loan_days=21\n"
                                 "[undo]\n"
                                 "recent_limit=25\n"
                                 "[license]\n"
                                 "secret=school-secret\n");

    const AppConfig config = AppConfig::load(ini);
    EXPECT_EQ(config.dataDir, dataDir);
    EXPECT_TRUE(QDir(dataDir).exists());
    EXPECT_EQ(config.databasePath, QDir(dataDir).filePath("library.db"));
    EXPECT_EQ(config.defaultFinePerDay, 0);
    EXPECT_EQ(config.defaultLoanDays, 21);
    EXPECT_EQ(config.recentDeletionsLimit, 25);
    EXPECT_EQ(config.licenseSecret, QByteArray("school-secret"));
}

TEST(AppConfigTest, InvalidValuesFallBack)
{
    QTemporaryDir dir;
    const QString ini = writeIni(dir,
                                 "[defaults]\n"
                                 "fine_per_day=-3\n"
                                 "loan_days=soon\n"
                                 "[undo]\n"
                                 "recent_limit=0\n");

    const AppConfig config = AppConfig::load(ini);
    EXPECT_EQ(config.defaultFinePerDay, 10);
    EXPECT_EQ(config.defaultLoanDays, 14);
    EXPECT_EQ(config.recentDeletionsLimit, 10);
}
