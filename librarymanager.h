// librarymanager.h
#ifndef LIBRARYMANAGER_H
#define LIBRARYMANAGER_H

#include "appconfig.h"
#include "accesspolicy.h"
#include "librarystore.h"
#include "loanledger.h"
#include "session.h"
#include "undolog.h"

#include <QStringList>
#include <QTextStream>

struct Credentials
{
    QString schoolName;
    QString schoolPassword;
    QString username;
    QString password;
};

// 命令的附加选项
struct CommandOptions
{
    int days = LoanLedger::UseSchoolLoanDays;
    int limit = 0;
    bool nonCirculating = false;
    QString condition;
};

// 命令行界面：登录、权限检查、按条码/学号查找记录，再调用借阅与撤销逻辑
class LibraryManager
{
public:
    LibraryManager(const AppConfig &config, const Credentials &credentials,
                   QTextStream &out, QTextStream &err);

    bool openDatabase(const QString &path);

    // 返回进程退出码：0 成功，1 操作失败或用法错误
    int execute(const QString &command, const QStringList &args, const CommandOptions &options);

    static QStringList commands();

private:
    bool login();
    bool checkAccess(Operation operation);
    bool requireArgs(const QStringList &args, int count, const QString &usage);

    // 学校与用户
    int registerSchool(const QStringList &args);
    int addUser(const QStringList &args);
    int listUsers();
    int deleteUser(const QStringList &args);
    int showSettings();
    int updateSettings(const QStringList &args);

    // 学生
    int addStudent(const QStringList &args);
    int deleteStudent(const QStringList &args);
    int listStudents();
    int searchStudents(const QStringList &args);
    int listClasses();

    // 图书
    int addBook(const QStringList &args, const CommandOptions &options);
    int deleteBook(const QStringList &args);
    int listBooks();
    int searchBooks(const QStringList &args);
    int listAuthors();

    // 借还书
    int borrowBook(const QStringList &args, const CommandOptions &options);
    int returnBook(const QStringList &args);
    int showLoans(const QList<LoanRecord> &loans);
    int studentLoans(const QStringList &args, bool historyOnly);
    int showHistory();

    // 撤销
    int listDeletions(const CommandOptions &options);
    int undoDeletion(const QStringList &args);

    // 系统
    int backupDatabase(const QStringList &args);
    int restoreDatabase(const QStringList &args);
    int checkLicense(const QStringList &args);
    int issueLicense(const QStringList &args);
    int saveDraft(const QStringList &args);
    int showDraft(const QStringList &args);
    int clearDraft(const QStringList &args);

    int report(bool ok, const QString &message);

    AppConfig config;
    Credentials credentials;
    QTextStream &out;
    QTextStream &err;

    LibraryStore store;
    LoanLedger ledger;
    UndoLog undoLog;
    TenantContext context;
};

#endif // LIBRARYMANAGER_H
