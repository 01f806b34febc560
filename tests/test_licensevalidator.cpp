// test_licensevalidator.cpp
#include "licensevalidator.h"
#include "testutil.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace
{
    const QByteArray Secret("test-secret");

    void writeText(const QString &path, const QByteArray &text)
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(text);
    }
}

TEST(LicenseValidatorTest, MacIsHexSha256)
{
    const QString mac = LicenseValidator::licenseMac("Oakview", Secret);
    EXPECT_EQ(mac.size(), 64);
    EXPECT_EQ(mac, LicenseValidator::licenseMac("Oakview", Secret));
    EXPECT_NE(mac, LicenseValidator::licenseMac("Riverside", Secret));
    EXPECT_NE(mac, LicenseValidator::licenseMac("Oakview", "other-secret"));
}

TEST(LicenseValidatorTest, IssuedLicenseValidates)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("license.json");

    ASSERT_TRUE(LicenseValidator::writeLicenseFile(path, "Oakview", Secret));
    const LicenseCheck check = LicenseValidator::validateLicenseFile(path, "Oakview", Secret);
    EXPECT_TRUE(check.valid);
    EXPECT_EQ(check.message, QString("License valid"));
}

TEST(LicenseValidatorTest, SchoolMismatch)
{
    QTemporaryDir dir;
    const QString path = dir.filePath("license.json");
    ASSERT_TRUE(LicenseValidator::writeLicenseFile(path, "Oakview", Secret));

    const LicenseCheck check = LicenseValidator::validateLicenseFile(path, "Riverside", Secret);
    EXPECT_FALSE(check.valid);
    EXPECT_EQ(check.message, QString("License file school name mismatch"));
}

TEST(LicenseValidatorTest, WrongSecretOrTamperedMac)
{
    QTemporaryDir dir;
    const QString path = dir.filePath("license.json");
    ASSERT_TRUE(LicenseValidator::writeLicenseFile(path, "Oakview", Secret));
    EXPECT_EQ(LicenseValidator::validateLicenseFile(path, "Oakview", "other-secret").message,
              QString("License HMAC invalid"));

    writeText(path, "{\"school\": \"Oakview\", \"mac\": \"deadbeef\"}");
    EXPECT_FALSE(LicenseValidator::validateLicenseFile(path, "Oakview", Secret).valid);
}

TEST(LicenseValidatorTest, UnreadableFile)
{
    QTemporaryDir dir;
    EXPECT_FALSE(LicenseValidator::validateLicenseFile(dir.filePath("missing.json"), "Oakview", Secret).valid);

    const QString path = dir.filePath("broken.json");
    writeText(path, "{ not json");
    const LicenseCheck check = LicenseValidator::validateLicenseFile(path, "Oakview", Secret);
    EXPECT_FALSE(check.valid);
    EXPECT_TRUE(check.message.startsWith("Failed to read license"));
}
