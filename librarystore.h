// librarystore.h
#ifndef LIBRARYSTORE_H
#define LIBRARYSTORE_H

#include "models.h"

#include <QList>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>
#include <QVariant>

#include <stdexcept>

// 存储层的意外错误（数据库不可用、SQL 执行失败等）。
// 业务上的预期情况（重复键、记录不存在）不会抛出此异常。
class StoreError : public std::runtime_error
{
public:
    StoreError(const QSqlError &error, const QString &context);

    QSqlError sqlError() const { return queryError; }

private:
    QSqlError queryError;
};

enum class DeleteResult
{
    Deleted,
    NotFound,        // 没有匹配记录，不做任何操作
    HasActiveLoans   // 存在未归还的借阅，拒绝删除
};

class LibraryStore
{
public:
    LibraryStore();
    ~LibraryStore();

    LibraryStore(const LibraryStore &) = delete;
    LibraryStore &operator=(const LibraryStore &) = delete;

    // 打开（不存在则创建）SQLite 数据库文件，":memory:" 为内存库
    bool open(const QString &path);
    void close();
    bool isOpen() const;
    QString databasePath() const { return path; }
    QSqlDatabase database() const { return db; }

    void initSchema();

    // 学校
    bool registerSchool(const QString &name, const QString &password,
                        int finePerDay = DefaultFinePerDay, int loanDays = DefaultLoanDays);
    School schoolByName(const QString &name) const;
    School schoolById(int schoolId) const;
    School validateSchoolCredentials(const QString &name, const QString &password) const;
    bool createDefaultAdmin(int schoolId);
    bool updateSchoolSettings(int schoolId, int finePerDay, int loanDays);

    // 用户
    bool addUser(int schoolId, const QString &username, const QString &password, Role role);
    QList<User> listUsers(int schoolId) const;
    User validateUser(int schoolId, const QString &username, const QString &password) const;
    bool deleteUser(int schoolId, const QString &username);

    // 学生
    bool addStudent(int schoolId, const QString &admissionNo, const QString &name, const QString &klass);
    DeleteResult deleteStudent(int schoolId, const QString &admissionNo);
    bool hasActiveLoansStudent(int schoolId, const QString &admissionNo) const;
    QList<Student> listStudents(int schoolId) const;
    Student findStudent(int schoolId, const QString &admissionNo) const;
    Student studentById(int schoolId, int studentId) const;
    QList<Student> searchStudents(int schoolId, const QString &term) const;
    QStringList uniqueClasses(int schoolId) const;

    // 图书
    bool addBook(int schoolId, const QString &title, const QString &author, const QString &barcode,
                 bool nonCirculating = false, BookCondition condition = BookCondition::Good);
    DeleteResult deleteBook(int schoolId, const QString &barcode);
    bool hasActiveLoansBook(int schoolId, const QString &barcode) const;
    QList<Book> listBooks(int schoolId) const;
    Book findBook(int schoolId, const QString &barcode) const;
    Book bookById(int schoolId, int bookId) const;
    QList<Book> searchBooks(int schoolId, const QString &term) const;
    QStringList uniqueAuthors(int schoolId) const;

    // 借阅（供 LoanLedger 使用）
    LoanRecord activeLoanForBook(int schoolId, int bookId) const;
    int insertLoan(int schoolId, int bookId, int studentId,
                   const QDateTime &borrowedAt, const QDateTime &dueDate);
    void markReturned(int loanId, const QDateTime &returnedAt);
    QList<LoanRecord> currentLoans(int schoolId) const;
    QList<LoanRecord> studentActiveLoans(int schoolId, int studentId) const;
    QList<LoanRecord> loanHistory(int schoolId) const;
    QList<LoanRecord> studentLoanHistory(int schoolId, int studentId) const;

    // 撤销日志（供 UndoLog 使用）
    QList<UndoEntry> recentDeletions(int schoolId, int limit = DefaultRecentDeletions) const;
    UndoEntry undoEntry(int schoolId, int entryId) const;
    void removeUndoEntry(int schoolId, int entryId);

    // 时间统一以 UTC ISO-8601（含毫秒）文本保存
    static QString toStoredTime(const QDateTime &time);
    static QDateTime fromStoredTime(const QString &text);

private:
    QSqlQuery prepare(const QString &sql) const;
    void exec(QSqlQuery &query, const QString &context) const;
    bool execWrite(QSqlQuery &query, const QString &context);
    void commit(const QString &context);
    QList<LoanRecord> selectLoans(const QString &sql, const QVariantList &values) const;
    DeleteResult deleteWithSnapshot(int schoolId, const QString &table, const QString &keyColumn,
                                    const QString &key, const QString &loanColumn);

    QSqlDatabase db;
    QString connectionName;
    QString path;
};

#endif // LIBRARYSTORE_H
