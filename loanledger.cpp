// loanledger.cpp
#include "loanledger.h"
#include "librarystore.h"
#include "logging.h"

#include <QSqlDatabase>

LoanLedger::LoanLedger(LibraryStore &store, Clock clock)
    : store(store)
    , clock(clock)
{
}

LedgerResult LoanLedger::borrow(int schoolId, int bookId, int studentId, int days)
{
    if (days < 0) {
        return LedgerResult::failure(LedgerStatus::InvalidArgument, "Loan days must be at least 1");
    }

    QSqlDatabase db = store.database();
    if (!db.transaction()) {
        throw StoreError(db.lastError(), "begin borrow");
    }

    try {
        if (!store.bookById(schoolId, bookId).isValid()) {
            throw LedgerResult::failure(LedgerStatus::NotFound, "Book not found");
        }
        if (!store.studentById(schoolId, studentId).isValid()) {
            throw LedgerResult::failure(LedgerStatus::NotFound, "Student not found");
        }

        // 同一本书同时只能有一条未归还的借阅
        if (store.activeLoanForBook(schoolId, bookId).isValid()) {
            throw LedgerResult::failure(LedgerStatus::AlreadyBorrowed, "Book already borrowed");
        }

        // 借期：显式指定，否则取学校默认借期
        int loanDays = days;
        if (loanDays == UseSchoolLoanDays) {
            const School school = store.schoolById(schoolId);
            loanDays = school.isValid() ? school.defaultLoanDays : DefaultLoanDays;
        }

        const QDateTime borrowedAt = now();
        const QDateTime dueDate = borrowedAt.addDays(loanDays);
        const int loanId = store.insertLoan(schoolId, bookId, studentId, borrowedAt, dueDate);

        if (!db.commit()) {
            throw StoreError(db.lastError(), "commit borrow");
        }

        qCInfo(lcLedger) << "Loan" << loanId << "book" << bookId << "student" << studentId
                         << "due" << dueDate.toString(Qt::ISODate);
        return LedgerResult::success(QString("Borrow recorded. Due %1").arg(dueDate.date().toString("yyyy-MM-dd")));

    } catch (const LedgerResult &failure) {
        db.rollback();
        qCInfo(lcLedger) << "Borrow refused for book" << bookId << ":" << failure.message;
        return failure;
    } catch (const StoreError &) {
        db.rollback();
        throw;
    }
}

LedgerResult LoanLedger::returnBook(int schoolId, int bookId)
{
    QSqlDatabase db = store.database();
    if (!db.transaction()) {
        throw StoreError(db.lastError(), "begin return");
    }

    try {
        const LoanRecord loan = store.activeLoanForBook(schoolId, bookId);
        if (!loan.isValid()) {
            throw LedgerResult::failure(LedgerStatus::NoActiveLoan, "No active loan");
        }

        const QDateTime returnedAt = now();
        store.markReturned(loan.id, returnedAt);

        const School school = store.schoolById(schoolId);
        const int finePerDay = school.isValid() ? school.finePerDay : DefaultFinePerDay;

        if (!db.commit()) {
            throw StoreError(db.lastError(), "commit return");
        }

        // 罚款只返回给调用方，不写入数据库
        LedgerResult result;
        result.daysLate = daysLate(loan.dueDate, returnedAt);
        if (result.daysLate > 0) {
            result.fine = calculateFine(loan.dueDate, returnedAt, finePerDay);
            result.message = QString("Returned. Fine due: %1 (days late: %2)").arg(result.fine).arg(result.daysLate);
        } else {
            result.message = "Returned. No fine.";
        }

        qCInfo(lcLedger) << "Loan" << loan.id << "returned, days late" << result.daysLate << "fine" << result.fine;
        return result;

    } catch (const LedgerResult &failure) {
        db.rollback();
        qCInfo(lcLedger) << "Return refused for book" << bookId << ":" << failure.message;
        return failure;
    } catch (const StoreError &) {
        db.rollback();
        throw;
    }
}

QList<LoanRecord> LoanLedger::currentLoans(int schoolId) const
{
    return store.currentLoans(schoolId);
}

QList<LoanRecord> LoanLedger::studentActiveLoans(int schoolId, int studentId) const
{
    return store.studentActiveLoans(schoolId, studentId);
}

QList<LoanRecord> LoanLedger::loanHistory(int schoolId) const
{
    return store.loanHistory(schoolId);
}

QList<LoanRecord> LoanLedger::studentLoanHistory(int schoolId, int studentId) const
{
    return store.studentLoanHistory(schoolId, studentId);
}

QList<LoanRecord> LoanLedger::overdueLoans(int schoolId) const
{
    const QDateTime current = now();

    QList<LoanRecord> overdue;
    for (const LoanRecord &loan : store.currentLoans(schoolId)) {
        if (daysLate(loan.dueDate, current) > 0) {
            overdue.append(loan);
        }
    }
    return overdue;
}

int LoanLedger::daysLate(const QDateTime &dueDate, const QDateTime &returnedAt)
{
    const qint64 days = dueDate.toUTC().date().daysTo(returnedAt.toUTC().date());
    return days > 0 ? static_cast<int>(days) : 0;
}

int LoanLedger::calculateFine(const QDateTime &dueDate, const QDateTime &returnedAt, int finePerDay)
{
    return daysLate(dueDate, returnedAt) * finePerDay;
}

QDateTime LoanLedger::now() const
{
    return clock ? clock().toUTC() : QDateTime::currentDateTimeUtc();
}
