// models.h
#ifndef MODELS_H
#define MODELS_H

#include <QDateTime>
#include <QString>

// 默认值
const int DefaultFinePerDay = 10;
const int DefaultLoanDays = 14;
const int DefaultRecentDeletions = 10;

enum class Role
{
    Admin,
    Librarian,
    Assistant
};

QString roleToString(Role role);
bool roleFromString(const QString &text, Role *role);

enum class BookCondition
{
    New,
    Good,
    Fair,
    Poor,
    Damaged
};

QString conditionToString(BookCondition condition);
bool conditionFromString(const QString &text, BookCondition *condition);

struct School
{
    int id = 0;
    QString name;
    QString password;
    QDateTime createdAt;
    int finePerDay = DefaultFinePerDay;
    int defaultLoanDays = DefaultLoanDays;

    bool isValid() const { return id > 0; }
};

struct User
{
    int id = 0;
    int schoolId = 0;
    QString username;
    QString password;
    Role role = Role::Assistant;

    bool isValid() const { return id > 0; }
};

struct Student
{
    int id = 0;
    int schoolId = 0;
    QString admissionNo;
    QString name;
    QString klass;

    bool isValid() const { return id > 0; }
};

struct Book
{
    int id = 0;
    int schoolId = 0;
    QString title;
    QString author;
    QString barcode;
    bool nonCirculating = false;
    BookCondition condition = BookCondition::Good;

    bool isValid() const { return id > 0; }
};

// 借阅记录，附带联表查询得到的显示字段
struct LoanRecord
{
    int id = 0;
    int schoolId = 0;
    int bookId = 0;
    int studentId = 0;
    QDateTime borrowedAt;
    QDateTime dueDate;
    QDateTime returnedAt;   // 未归还时为空
    bool finePaid = false;  // 保留字段，目前不参与罚款逻辑

    QString bookTitle;
    QString barcode;
    QString condition;
    QString admissionNo;
    QString studentName;

    bool isValid() const { return id > 0; }
    bool isActive() const { return returnedAt.isNull(); }
};

struct UndoEntry
{
    int id = 0;
    int schoolId = 0;
    QString tableName;
    QString recordData;     // 被删除行的 JSON 快照
    QDateTime deletedAt;

    bool isValid() const { return id > 0; }
};

#endif // MODELS_H
