// test_loanledger.cpp
#include "librarystore.h"
#include "loanledger.h"
#include "testutil.h"

#include <gtest/gtest.h>

class LoanLedgerTest : public ::testing::Test
{
protected:
    LoanLedgerTest()
        : ledger(store, [this]() { return current; })
    {
    }

    void SetUp() override
    {
        ASSERT_TRUE(store.open(":memory:"));
        store.initSchema();
        ASSERT_TRUE(store.registerSchool("Oakview", "oak-pass", 10, 14));
        ASSERT_TRUE(store.registerSchool("Riverside", "river-pass", 5, 7));
        oakview = store.schoolByName("Oakview").id;
        riverside = store.schoolByName("Riverside").id;

        ASSERT_TRUE(store.addStudent(oakview, "S001", "Alice", "5A"));
        ASSERT_TRUE(store.addStudent(oakview, "S002", "Bob", "5B"));
        ASSERT_TRUE(store.addBook(oakview, "Matilda", "Roald Dahl", "B001"));
        ASSERT_TRUE(store.addBook(oakview, "Holes", "Louis Sachar", "B002"));
        alice = store.findStudent(oakview, "S001").id;
        bob = store.findStudent(oakview, "S002").id;
        matilda = store.findBook(oakview, "B001").id;
        holes = store.findBook(oakview, "B002").id;

        current = utc(2024, 3, 1, 9, 0);
    }

    LibraryStore store;
    QDateTime current;
    LoanLedger ledger;

    int oakview = 0;
    int riverside = 0;
    int alice = 0;
    int bob = 0;
    int matilda = 0;
    int holes = 0;
};

// ==================== Borrow ====================

TEST_F(LoanLedgerTest, BorrowUsesSchoolLoanDays)
{
    const LedgerResult result = ledger.borrow(oakview, matilda, alice);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message, QString("Borrow recorded. Due 2024-03-15"));

    const QList<LoanRecord> loans = ledger.currentLoans(oakview);
    ASSERT_EQ(loans.size(), 1);
    EXPECT_EQ(loans.first().borrowedAt, utc(2024, 3, 1, 9, 0));
    EXPECT_EQ(loans.first().dueDate, utc(2024, 3, 15, 9, 0));
    EXPECT_EQ(loans.first().bookTitle, QString("Matilda"));
    EXPECT_EQ(loans.first().studentName, QString("Alice"));
    EXPECT_TRUE(loans.first().isActive());
}

TEST_F(LoanLedgerTest, BorrowWithExplicitDays)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice, 7).ok());
    EXPECT_EQ(ledger.currentLoans(oakview).first().dueDate, utc(2024, 3, 8, 9, 0));
}

TEST_F(LoanLedgerTest, BorrowFollowsUpdatedSchoolSettings)
{
    ASSERT_TRUE(store.updateSchoolSettings(oakview, 10, 21));
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());
    EXPECT_EQ(ledger.currentLoans(oakview).first().dueDate, utc(2024, 3, 22, 9, 0));
}

TEST_F(LoanLedgerTest, BorrowRejectsNegativeDays)
{
    const LedgerResult result = ledger.borrow(oakview, matilda, alice, -3);
    EXPECT_EQ(result.status, LedgerStatus::InvalidArgument);
    EXPECT_TRUE(ledger.currentLoans(oakview).isEmpty());
}

TEST_F(LoanLedgerTest, SecondBorrowOfSameBookRefused)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());

    const LedgerResult result = ledger.borrow(oakview, matilda, bob);
    EXPECT_EQ(result.status, LedgerStatus::AlreadyBorrowed);
    EXPECT_EQ(result.message, QString("Book already borrowed"));

    const QList<LoanRecord> loans = ledger.currentLoans(oakview);
    ASSERT_EQ(loans.size(), 1);
    EXPECT_EQ(loans.first().studentId, alice);
}

TEST_F(LoanLedgerTest, StudentMayHoldSeveralBooks)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());
    ASSERT_TRUE(ledger.borrow(oakview, holes, alice).ok());
    EXPECT_EQ(ledger.studentActiveLoans(oakview, alice).size(), 2);
}

TEST_F(LoanLedgerTest, BorrowOfUnknownRecordsRefused)
{
    EXPECT_EQ(ledger.borrow(oakview, 9999, alice).status, LedgerStatus::NotFound);
    EXPECT_EQ(ledger.borrow(oakview, matilda, 9999).status, LedgerStatus::NotFound);

    // 其他学校的图书和学生不可见
    EXPECT_EQ(ledger.borrow(riverside, matilda, alice).status, LedgerStatus::NotFound);
    EXPECT_TRUE(ledger.currentLoans(oakview).isEmpty());
    EXPECT_TRUE(ledger.currentLoans(riverside).isEmpty());
}

// ==================== Return ====================

TEST_F(LoanLedgerTest, LateReturnIsFined)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());

    current = utc(2024, 3, 18, 8, 0);
    const LedgerResult result = ledger.returnBook(oakview, matilda);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.daysLate, 3);
    EXPECT_EQ(result.fine, 30);
    EXPECT_EQ(result.message, QString("Returned. Fine due: 30 (days late: 3)"));

    EXPECT_TRUE(ledger.currentLoans(oakview).isEmpty());
    const QList<LoanRecord> history = ledger.loanHistory(oakview);
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history.first().returnedAt, utc(2024, 3, 18, 8, 0));
    EXPECT_FALSE(history.first().finePaid);
}

TEST_F(LoanLedgerTest, ReturnOnDueDateIsNotFined)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());

    // 同一天的晚些时候归还不算逾期
    current = utc(2024, 3, 15, 23, 59);
    const LedgerResult result = ledger.returnBook(oakview, matilda);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.daysLate, 0);
    EXPECT_EQ(result.fine, 0);
    EXPECT_EQ(result.message, QString("Returned. No fine."));
}

TEST_F(LoanLedgerTest, EarlyReturnIsNotFined)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());

    current = utc(2024, 3, 2, 9, 0);
    const LedgerResult result = ledger.returnBook(oakview, matilda);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.fine, 0);
}

TEST_F(LoanLedgerTest, FineUsesRateAtReturnTime)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());
    ASSERT_TRUE(store.updateSchoolSettings(oakview, 4, 14));

    current = utc(2024, 3, 20, 9, 0);
    const LedgerResult result = ledger.returnBook(oakview, matilda);
    EXPECT_EQ(result.daysLate, 5);
    EXPECT_EQ(result.fine, 20);
}

TEST_F(LoanLedgerTest, ReturnWithoutActiveLoanRefused)
{
    const LedgerResult result = ledger.returnBook(oakview, matilda);
    EXPECT_EQ(result.status, LedgerStatus::NoActiveLoan);
    EXPECT_EQ(result.message, QString("No active loan"));

    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());
    ASSERT_TRUE(ledger.returnBook(oakview, matilda).ok());
    EXPECT_EQ(ledger.returnBook(oakview, matilda).status, LedgerStatus::NoActiveLoan);
    EXPECT_EQ(ledger.loanHistory(oakview).size(), 1);
}

TEST_F(LoanLedgerTest, BookCanBeBorrowedAgainAfterReturn)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());
    current = utc(2024, 3, 5);
    ASSERT_TRUE(ledger.returnBook(oakview, matilda).ok());

    current = utc(2024, 3, 6);
    ASSERT_TRUE(ledger.borrow(oakview, matilda, bob).ok());

    const QList<LoanRecord> active = ledger.currentLoans(oakview);
    ASSERT_EQ(active.size(), 1);
    EXPECT_EQ(active.first().studentId, bob);
}

// ==================== Queries ====================

TEST_F(LoanLedgerTest, HistoryNewestFirst)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice).ok());
    current = utc(2024, 3, 2);
    ASSERT_TRUE(ledger.borrow(oakview, holes, bob).ok());
    current = utc(2024, 3, 3);
    ASSERT_TRUE(ledger.returnBook(oakview, matilda).ok());

    const QList<LoanRecord> history = ledger.loanHistory(oakview);
    ASSERT_EQ(history.size(), 2);
    EXPECT_EQ(history.at(0).bookId, holes);
    EXPECT_EQ(history.at(1).bookId, matilda);

    const QList<LoanRecord> aliceHistory = ledger.studentLoanHistory(oakview, alice);
    ASSERT_EQ(aliceHistory.size(), 1);
    EXPECT_FALSE(aliceHistory.first().isActive());
}

TEST_F(LoanLedgerTest, StudentActiveLoansByDueDate)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice, 10).ok());
    ASSERT_TRUE(ledger.borrow(oakview, holes, alice, 3).ok());

    const QList<LoanRecord> loans = ledger.studentActiveLoans(oakview, alice);
    ASSERT_EQ(loans.size(), 2);
    EXPECT_EQ(loans.at(0).bookId, holes);
    EXPECT_EQ(loans.at(1).bookId, matilda);
    EXPECT_TRUE(ledger.studentActiveLoans(oakview, bob).isEmpty());
}

TEST_F(LoanLedgerTest, OverdueLoans)
{
    ASSERT_TRUE(ledger.borrow(oakview, matilda, alice, 3).ok());
    ASSERT_TRUE(ledger.borrow(oakview, holes, bob, 10).ok());

    current = utc(2024, 3, 4, 23, 0);
    EXPECT_TRUE(ledger.overdueLoans(oakview).isEmpty());

    current = utc(2024, 3, 5, 0, 30);
    const QList<LoanRecord> overdue = ledger.overdueLoans(oakview);
    ASSERT_EQ(overdue.size(), 1);
    EXPECT_EQ(overdue.first().bookId, matilda);
}

// ==================== Fine calculation ====================

TEST(FineCalculationTest, CalendarDaysIgnoreTimeOfDay)
{
    EXPECT_EQ(LoanLedger::daysLate(utc(2024, 3, 15, 23, 0), utc(2024, 3, 16, 1, 0)), 1);
    EXPECT_EQ(LoanLedger::daysLate(utc(2024, 3, 15, 9, 0), utc(2024, 3, 15, 23, 59)), 0);
    EXPECT_EQ(LoanLedger::daysLate(utc(2024, 3, 15, 9, 0), utc(2024, 3, 1, 9, 0)), 0);
}

TEST(FineCalculationTest, CrossesMonthAndLeapDay)
{
    EXPECT_EQ(LoanLedger::daysLate(utc(2024, 2, 27), utc(2024, 3, 2)), 4);
    EXPECT_EQ(LoanLedger::calculateFine(utc(2024, 2, 27), utc(2024, 3, 2), 10), 40);
    EXPECT_EQ(LoanLedger::calculateFine(utc(2024, 2, 27), utc(2024, 3, 2), 0), 0);
}
