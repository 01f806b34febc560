// test_draftstore.cpp
#include "draftstore.h"
#include "testutil.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

TEST(DraftStoreTest, MissingFileIsEmpty)
{
    QTemporaryDir dir;
    DraftStore drafts(dir.filePath("drafts.json"));
    EXPECT_TRUE(drafts.load("student").isEmpty());
    EXPECT_TRUE(drafts.clear("student"));
}

TEST(DraftStoreTest, SaveLoadClear)
{
    QTemporaryDir dir;
    const QString path = dir.filePath("drafts.json");

    QVariantMap student;
    student.insert("admission_no", "S001");
    student.insert("name", "Alice");
    QVariantMap book;
    book.insert("title", "Matilda");

    DraftStore drafts(path);
    ASSERT_TRUE(drafts.save("student", student));
    ASSERT_TRUE(drafts.save("book", book));

    // 新实例从文件读取
    DraftStore reopened(path);
    EXPECT_EQ(reopened.load("student").value("name").toString(), QString("Alice"));
    EXPECT_EQ(reopened.load("book").value("title").toString(), QString("Matilda"));

    ASSERT_TRUE(reopened.clear("student"));
    EXPECT_TRUE(drafts.load("student").isEmpty());
    EXPECT_FALSE(drafts.load("book").isEmpty());
}

TEST(DraftStoreTest, SaveReplacesCategory)
{
    QTemporaryDir dir;
    DraftStore drafts(dir.filePath("drafts.json"));

    QVariantMap first;
    first.insert("name", "Alice");
    first.insert("class", "5A");
    ASSERT_TRUE(drafts.save("student", first));

    QVariantMap second;
    second.insert("name", "Bob");
    ASSERT_TRUE(drafts.save("student", second));

    const QVariantMap loaded = drafts.load("student");
    EXPECT_EQ(loaded.value("name").toString(), QString("Bob"));
    EXPECT_FALSE(loaded.contains("class"));
}

TEST(DraftStoreTest, CorruptFileIsNotOverwritten)
{
    QTemporaryDir dir;
    const QString path = dir.filePath("drafts.json");
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write("[broken");
    }

    DraftStore drafts(path);
    EXPECT_TRUE(drafts.load("student").isEmpty());

    QVariantMap fields;
    fields.insert("name", "Alice");
    EXPECT_FALSE(drafts.save("student", fields));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(file.readAll(), QByteArray("[broken"));
}
