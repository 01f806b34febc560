// loanledger.h
#ifndef LOANLEDGER_H
#define LOANLEDGER_H

#include "models.h"

#include <QDateTime>
#include <QList>
#include <QString>

#include <functional>

class LibraryStore;

enum class LedgerStatus
{
    Ok,
    AlreadyBorrowed,
    NoActiveLoan,
    NotFound,
    DuplicateKey,
    InvalidArgument
};

struct LedgerResult
{
    LedgerStatus status = LedgerStatus::Ok;
    QString message;
    int daysLate = 0;
    int fine = 0;

    bool ok() const { return status == LedgerStatus::Ok; }

    static LedgerResult success(const QString &message)
    {
        LedgerResult result;
        result.message = message;
        return result;
    }

    static LedgerResult failure(LedgerStatus status, const QString &message)
    {
        LedgerResult result;
        result.status = status;
        result.message = message;
        return result;
    }
};

// 借还书规则与罚款计算。所有操作都以学校 id 限定范围。
// 不检查图书是否可外借（non_circulating），该检查由调用方完成。
class LoanLedger
{
public:
    typedef std::function<QDateTime()> Clock;

    static const int UseSchoolLoanDays = 0;

    explicit LoanLedger(LibraryStore &store, Clock clock = Clock());

    // days 为 0 时使用学校的默认借期
    LedgerResult borrow(int schoolId, int bookId, int studentId, int days = UseSchoolLoanDays);
    LedgerResult returnBook(int schoolId, int bookId);

    QList<LoanRecord> currentLoans(int schoolId) const;
    QList<LoanRecord> studentActiveLoans(int schoolId, int studentId) const;
    QList<LoanRecord> loanHistory(int schoolId) const;
    QList<LoanRecord> studentLoanHistory(int schoolId, int studentId) const;
    QList<LoanRecord> overdueLoans(int schoolId) const;

    // 按日历日期差计算逾期天数，忽略时刻；未逾期返回 0
    static int daysLate(const QDateTime &dueDate, const QDateTime &returnedAt);
    static int calculateFine(const QDateTime &dueDate, const QDateTime &returnedAt, int finePerDay);

private:
    QDateTime now() const;

    LibraryStore &store;
    Clock clock;
};

#endif // LOANLEDGER_H
