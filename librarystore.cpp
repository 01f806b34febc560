// librarystore.cpp
#include "librarystore.h"
#include "logging.h"

#include <QAtomicInt>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QSqlRecord>

namespace
{
    // SQLite 主结果码 SQLITE_CONSTRAINT，扩展结果码的低 8 位与之相同
    const int SqliteConstraint = 19;

    QAtomicInt connectionCounter(0);

    const char *LoanColumns =
        "SELECT loans.id AS loan_id, loans.school_id AS loan_school_id, loans.book_id, "
        "loans.student_id, loans.borrowed_at, loans.due_date, loans.returned_at, loans.fine_paid, "
        "books.title, books.barcode, books.condition, "
        "students.admission_no, students.name AS student_name "
        "FROM loans "
        "JOIN books ON books.id = loans.book_id "
        "JOIN students ON students.id = loans.student_id ";

    bool isConstraintViolation(const QSqlError &error)
    {
        bool ok = false;
        const int code = error.nativeErrorCode().toInt(&ok);
        return ok && (code & 0xff) == SqliteConstraint;
    }

    School schoolFromQuery(const QSqlQuery &query)
    {
        School school;
        school.id = query.value("id").toInt();
        school.name = query.value("name").toString();
        school.password = query.value("password").toString();
        school.createdAt = LibraryStore::fromStoredTime(query.value("created_at").toString());
        school.finePerDay = query.value("fine_per_day").toInt();
        school.defaultLoanDays = query.value("default_loan_days").toInt();
        return school;
    }

    User userFromQuery(const QSqlQuery &query)
    {
        User user;
        user.id = query.value("id").toInt();
        user.schoolId = query.value("school_id").toInt();
        user.username = query.value("username").toString();
        user.password = query.value("password").toString();
        if (!roleFromString(query.value("role").toString(), &user.role)) {
            qCWarning(lcStore) << "Unknown role" << query.value("role").toString()
                               << "for user" << user.username;
            user.role = Role::Assistant;
        }
        return user;
    }

    Student studentFromQuery(const QSqlQuery &query)
    {
        Student student;
        student.id = query.value("id").toInt();
        student.schoolId = query.value("school_id").toInt();
        student.admissionNo = query.value("admission_no").toString();
        student.name = query.value("name").toString();
        student.klass = query.value("class").toString();
        return student;
    }

    Book bookFromQuery(const QSqlQuery &query)
    {
        Book book;
        book.id = query.value("id").toInt();
        book.schoolId = query.value("school_id").toInt();
        book.title = query.value("title").toString();
        book.author = query.value("author").toString();
        book.barcode = query.value("barcode").toString();
        book.nonCirculating = query.value("non_circulating").toInt() != 0;
        if (!conditionFromString(query.value("condition").toString(), &book.condition)) {
            book.condition = BookCondition::Good;
        }
        return book;
    }

    LoanRecord loanFromQuery(const QSqlQuery &query)
    {
        LoanRecord loan;
        loan.id = query.value("loan_id").toInt();
        loan.schoolId = query.value("loan_school_id").toInt();
        loan.bookId = query.value("book_id").toInt();
        loan.studentId = query.value("student_id").toInt();
        loan.borrowedAt = LibraryStore::fromStoredTime(query.value("borrowed_at").toString());
        loan.dueDate = LibraryStore::fromStoredTime(query.value("due_date").toString());
        loan.returnedAt = LibraryStore::fromStoredTime(query.value("returned_at").toString());
        loan.finePaid = query.value("fine_paid").toInt() != 0;

        // 联表字段只在列表查询中存在
        if (query.record().contains("title")) {
            loan.bookTitle = query.value("title").toString();
            loan.barcode = query.value("barcode").toString();
            loan.condition = query.value("condition").toString();
            loan.admissionNo = query.value("admission_no").toString();
            loan.studentName = query.value("student_name").toString();
        }
        return loan;
    }

    UndoEntry undoEntryFromQuery(const QSqlQuery &query)
    {
        UndoEntry entry;
        entry.id = query.value("id").toInt();
        entry.schoolId = query.value("school_id").toInt();
        entry.tableName = query.value("table_name").toString();
        entry.recordData = query.value("record_data").toString();
        entry.deletedAt = LibraryStore::fromStoredTime(query.value("deleted_at").toString());
        return entry;
    }

    QString recordToJson(const QSqlRecord &record)
    {
        QJsonObject object;
        for (int i = 0; i < record.count(); ++i) {
            object.insert(record.fieldName(i), QJsonValue::fromVariant(record.value(i)));
        }
        return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
    }
}

StoreError::StoreError(const QSqlError &error, const QString &context)
    : std::runtime_error(QString("%1: %2").arg(context, error.text()).toStdString())
    , queryError(error)
{
}

LibraryStore::LibraryStore()
    : connectionName(QString("schoollib-%1").arg(connectionCounter.fetchAndAddRelaxed(1)))
{
}

LibraryStore::~LibraryStore()
{
    close();
}

bool LibraryStore::open(const QString &databasePath)
{
    close();

    db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
    db.setDatabaseName(databasePath);

    if (!db.open()) {
        qCCritical(lcStore) << "Cannot open database" << databasePath << ":" << db.lastError().text();
        db = QSqlDatabase();
        QSqlDatabase::removeDatabase(connectionName);
        return false;
    }

    path = databasePath;
    qCInfo(lcStore) << "Database opened:" << path;
    return true;
}

void LibraryStore::close()
{
    if (!db.isValid()) {
        return;
    }

    if (db.isOpen()) {
        db.close();
        qCInfo(lcStore) << "Database closed:" << path;
    }
    db = QSqlDatabase();
    QSqlDatabase::removeDatabase(connectionName);
}

bool LibraryStore::isOpen() const
{
    return db.isValid() && db.isOpen();
}

void LibraryStore::initSchema()
{
    const QStringList statements = {
        QString("CREATE TABLE IF NOT EXISTS schools ("
                "id INTEGER PRIMARY KEY,"
                "name TEXT UNIQUE,"
                "password TEXT,"
                "created_at TEXT,"
                "fine_per_day INTEGER DEFAULT %1,"
                "default_loan_days INTEGER DEFAULT %2)").arg(DefaultFinePerDay).arg(DefaultLoanDays),

        "CREATE TABLE IF NOT EXISTS users ("
        "id INTEGER PRIMARY KEY,"
        "school_id INTEGER,"
        "username TEXT,"
        "password TEXT,"
        "role TEXT,"
        "UNIQUE(school_id, username),"
        "FOREIGN KEY(school_id) REFERENCES schools(id))",

        "CREATE TABLE IF NOT EXISTS students ("
        "id INTEGER PRIMARY KEY,"
        "school_id INTEGER,"
        "admission_no TEXT,"
        "name TEXT,"
        "class TEXT,"
        "UNIQUE(school_id, admission_no),"
        "FOREIGN KEY(school_id) REFERENCES schools(id))",

        "CREATE TABLE IF NOT EXISTS books ("
        "id INTEGER PRIMARY KEY,"
        "school_id INTEGER,"
        "title TEXT,"
        "author TEXT,"
        "barcode TEXT,"
        "non_circulating INTEGER DEFAULT 0,"
        "condition TEXT DEFAULT 'Good',"
        "UNIQUE(school_id, barcode),"
        "FOREIGN KEY(school_id) REFERENCES schools(id))",

        "CREATE TABLE IF NOT EXISTS loans ("
        "id INTEGER PRIMARY KEY,"
        "school_id INTEGER,"
        "book_id INTEGER,"
        "student_id INTEGER,"
        "borrowed_at TEXT,"
        "due_date TEXT,"
        "returned_at TEXT,"
        "fine_paid INTEGER DEFAULT 0,"
        "FOREIGN KEY(book_id) REFERENCES books(id),"
        "FOREIGN KEY(student_id) REFERENCES students(id),"
        "FOREIGN KEY(school_id) REFERENCES schools(id))",

        "CREATE TABLE IF NOT EXISTS undo_log ("
        "id INTEGER PRIMARY KEY,"
        "school_id INTEGER,"
        "table_name TEXT,"
        "record_data TEXT,"
        "deleted_at TEXT)"
    };

    for (const QString &sql : statements) {
        QSqlQuery query = prepare(sql);
        exec(query, "create schema");
    }
    qCDebug(lcStore) << "Schema ready";
}

// 学校
bool LibraryStore::registerSchool(const QString &name, const QString &password, int finePerDay, int loanDays)
{
    if (name.trimmed().isEmpty() || password.isEmpty() || finePerDay < 0 || loanDays < 1) {
        qCWarning(lcStore) << "Rejected school registration with invalid parameters for" << name;
        return false;
    }

    if (!db.transaction()) {
        throw StoreError(db.lastError(), "begin register school");
    }

    try {
        QSqlQuery query = prepare("INSERT INTO schools (name, password, created_at, fine_per_day, default_loan_days) "
                                  "VALUES (?, ?, ?, ?, ?)");
        query.addBindValue(name);
        query.addBindValue(password);
        query.addBindValue(toStoredTime(QDateTime::currentDateTimeUtc()));
        query.addBindValue(finePerDay);
        query.addBindValue(loanDays);

        if (!execWrite(query, "register school")) {
            db.rollback();
            qCInfo(lcStore) << "School already exists:" << name;
            return false;
        }
        const int schoolId = query.lastInsertId().toInt();

        // 新学校自动创建默认管理员 admin/admin
        if (!createDefaultAdmin(schoolId)) {
            db.rollback();
            qCWarning(lcStore) << "Could not create default admin for" << name;
            return false;
        }

        commit("register school");
        qCInfo(lcStore) << "Registered school" << name << "with id" << schoolId;
        return true;
    } catch (const StoreError &) {
        db.rollback();
        throw;
    }
}

School LibraryStore::schoolByName(const QString &name) const
{
    QSqlQuery query = prepare("SELECT * FROM schools WHERE name = ?");
    query.addBindValue(name);
    exec(query, "find school");
    return query.next() ? schoolFromQuery(query) : School();
}

School LibraryStore::schoolById(int schoolId) const
{
    QSqlQuery query = prepare("SELECT * FROM schools WHERE id = ?");
    query.addBindValue(schoolId);
    exec(query, "find school");
    return query.next() ? schoolFromQuery(query) : School();
}

School LibraryStore::validateSchoolCredentials(const QString &name, const QString &password) const
{
    QSqlQuery query = prepare("SELECT * FROM schools WHERE name = ? AND password = ?");
    query.addBindValue(name);
    query.addBindValue(password);
    exec(query, "validate school");
    return query.next() ? schoolFromQuery(query) : School();
}

bool LibraryStore::createDefaultAdmin(int schoolId)
{
    QSqlQuery check = prepare("SELECT 1 FROM users WHERE school_id = ? LIMIT 1");
    check.addBindValue(schoolId);
    exec(check, "check users");
    if (check.next()) {
        return false;
    }
    return addUser(schoolId, "admin", "admin", Role::Admin);
}

bool LibraryStore::updateSchoolSettings(int schoolId, int finePerDay, int loanDays)
{
    if (finePerDay < 0 || loanDays < 1) {
        qCWarning(lcStore) << "Rejected settings fine_per_day =" << finePerDay << "loan_days =" << loanDays;
        return false;
    }

    QSqlQuery query = prepare("UPDATE schools SET fine_per_day = ?, default_loan_days = ? WHERE id = ?");
    query.addBindValue(finePerDay);
    query.addBindValue(loanDays);
    query.addBindValue(schoolId);
    exec(query, "update settings");
    return query.numRowsAffected() > 0;
}

// 用户
bool LibraryStore::addUser(int schoolId, const QString &username, const QString &password, Role role)
{
    if (username.trimmed().isEmpty() || password.isEmpty()) {
        return false;
    }

    QSqlQuery query = prepare("INSERT INTO users (school_id, username, password, role) VALUES (?, ?, ?, ?)");
    query.addBindValue(schoolId);
    query.addBindValue(username);
    query.addBindValue(password);
    query.addBindValue(roleToString(role));
    return execWrite(query, "add user");
}

QList<User> LibraryStore::listUsers(int schoolId) const
{
    QSqlQuery query = prepare("SELECT * FROM users WHERE school_id = ? ORDER BY id");
    query.addBindValue(schoolId);
    exec(query, "list users");

    QList<User> users;
    while (query.next()) {
        users.append(userFromQuery(query));
    }
    return users;
}

User LibraryStore::validateUser(int schoolId, const QString &username, const QString &password) const
{
    QSqlQuery query = prepare("SELECT * FROM users WHERE school_id = ? AND username = ? AND password = ?");
    query.addBindValue(schoolId);
    query.addBindValue(username);
    query.addBindValue(password);
    exec(query, "validate user");
    return query.next() ? userFromQuery(query) : User();
}

bool LibraryStore::deleteUser(int schoolId, const QString &username)
{
    QSqlQuery query = prepare("DELETE FROM users WHERE school_id = ? AND username = ?");
    query.addBindValue(schoolId);
    query.addBindValue(username);
    exec(query, "delete user");
    return query.numRowsAffected() > 0;
}

// 学生
bool LibraryStore::addStudent(int schoolId, const QString &admissionNo, const QString &name, const QString &klass)
{
    QSqlQuery query = prepare("INSERT INTO students (school_id, admission_no, name, class) VALUES (?, ?, ?, ?)");
    query.addBindValue(schoolId);
    query.addBindValue(admissionNo);
    query.addBindValue(name);
    query.addBindValue(klass);
    return execWrite(query, "add student");
}

DeleteResult LibraryStore::deleteStudent(int schoolId, const QString &admissionNo)
{
    return deleteWithSnapshot(schoolId, "students", "admission_no", admissionNo, "student_id");
}

bool LibraryStore::hasActiveLoansStudent(int schoolId, const QString &admissionNo) const
{
    QSqlQuery query = prepare("SELECT COUNT(*) FROM loans "
                              "JOIN students ON students.id = loans.student_id "
                              "WHERE loans.school_id = ? AND students.admission_no = ? "
                              "AND loans.returned_at IS NULL");
    query.addBindValue(schoolId);
    query.addBindValue(admissionNo);
    exec(query, "count student loans");
    return query.next() && query.value(0).toInt() > 0;
}

QList<Student> LibraryStore::listStudents(int schoolId) const
{
    QSqlQuery query = prepare("SELECT * FROM students WHERE school_id = ? ORDER BY name");
    query.addBindValue(schoolId);
    exec(query, "list students");

    QList<Student> students;
    while (query.next()) {
        students.append(studentFromQuery(query));
    }
    return students;
}

Student LibraryStore::findStudent(int schoolId, const QString &admissionNo) const
{
    QSqlQuery query = prepare("SELECT * FROM students WHERE school_id = ? AND admission_no = ?");
    query.addBindValue(schoolId);
    query.addBindValue(admissionNo);
    exec(query, "find student");
    return query.next() ? studentFromQuery(query) : Student();
}

Student LibraryStore::studentById(int schoolId, int studentId) const
{
    QSqlQuery query = prepare("SELECT * FROM students WHERE school_id = ? AND id = ?");
    query.addBindValue(schoolId);
    query.addBindValue(studentId);
    exec(query, "find student");
    return query.next() ? studentFromQuery(query) : Student();
}

QList<Student> LibraryStore::searchStudents(int schoolId, const QString &term) const
{
    const QString pattern = QString("%%1%").arg(term);

    QSqlQuery query = prepare("SELECT * FROM students "
                              "WHERE school_id = ? AND (admission_no LIKE ? OR name LIKE ?) "
                              "ORDER BY name");
    query.addBindValue(schoolId);
    query.addBindValue(pattern);
    query.addBindValue(pattern);
    exec(query, "search students");

    QList<Student> students;
    while (query.next()) {
        students.append(studentFromQuery(query));
    }
    return students;
}

QStringList LibraryStore::uniqueClasses(int schoolId) const
{
    QSqlQuery query = prepare("SELECT DISTINCT class FROM students "
                              "WHERE school_id = ? AND class IS NOT NULL AND class != '' "
                              "ORDER BY class");
    query.addBindValue(schoolId);
    exec(query, "list classes");

    QStringList classes;
    while (query.next()) {
        classes.append(query.value(0).toString());
    }
    return classes;
}

// 图书
bool LibraryStore::addBook(int schoolId, const QString &title, const QString &author, const QString &barcode,
                           bool nonCirculating, BookCondition condition)
{
    QSqlQuery query = prepare("INSERT INTO books (school_id, title, author, barcode, non_circulating, condition) "
                              "VALUES (?, ?, ?, ?, ?, ?)");
    query.addBindValue(schoolId);
    query.addBindValue(title);
    query.addBindValue(author);
    query.addBindValue(barcode);
    query.addBindValue(nonCirculating ? 1 : 0);
    query.addBindValue(conditionToString(condition));
    return execWrite(query, "add book");
}

DeleteResult LibraryStore::deleteBook(int schoolId, const QString &barcode)
{
    return deleteWithSnapshot(schoolId, "books", "barcode", barcode, "book_id");
}

bool LibraryStore::hasActiveLoansBook(int schoolId, const QString &barcode) const
{
    QSqlQuery query = prepare("SELECT COUNT(*) FROM loans "
                              "JOIN books ON books.id = loans.book_id "
                              "WHERE loans.school_id = ? AND books.barcode = ? "
                              "AND loans.returned_at IS NULL");
    query.addBindValue(schoolId);
    query.addBindValue(barcode);
    exec(query, "count book loans");
    return query.next() && query.value(0).toInt() > 0;
}

QList<Book> LibraryStore::listBooks(int schoolId) const
{
    QSqlQuery query = prepare("SELECT * FROM books WHERE school_id = ? ORDER BY title");
    query.addBindValue(schoolId);
    exec(query, "list books");

    QList<Book> books;
    while (query.next()) {
        books.append(bookFromQuery(query));
    }
    return books;
}

Book LibraryStore::findBook(int schoolId, const QString &barcode) const
{
    QSqlQuery query = prepare("SELECT * FROM books WHERE school_id = ? AND barcode = ?");
    query.addBindValue(schoolId);
    query.addBindValue(barcode);
    exec(query, "find book");
    return query.next() ? bookFromQuery(query) : Book();
}

Book LibraryStore::bookById(int schoolId, int bookId) const
{
    QSqlQuery query = prepare("SELECT * FROM books WHERE school_id = ? AND id = ?");
    query.addBindValue(schoolId);
    query.addBindValue(bookId);
    exec(query, "find book");
    return query.next() ? bookFromQuery(query) : Book();
}

QList<Book> LibraryStore::searchBooks(int schoolId, const QString &term) const
{
    const QString pattern = QString("%%1%").arg(term);

    QSqlQuery query = prepare("SELECT * FROM books "
                              "WHERE school_id = ? AND (title LIKE ? OR barcode LIKE ?) "
                              "ORDER BY title");
    query.addBindValue(schoolId);
    query.addBindValue(pattern);
    query.addBindValue(pattern);
    exec(query, "search books");

    QList<Book> books;
    while (query.next()) {
        books.append(bookFromQuery(query));
    }
    return books;
}

QStringList LibraryStore::uniqueAuthors(int schoolId) const
{
    QSqlQuery query = prepare("SELECT DISTINCT author FROM books "
                              "WHERE school_id = ? AND author IS NOT NULL AND author != '' "
                              "ORDER BY author");
    query.addBindValue(schoolId);
    exec(query, "list authors");

    QStringList authors;
    while (query.next()) {
        authors.append(query.value(0).toString());
    }
    return authors;
}

// 借阅
LoanRecord LibraryStore::activeLoanForBook(int schoolId, int bookId) const
{
    QSqlQuery query = prepare("SELECT id AS loan_id, school_id AS loan_school_id, book_id, student_id, "
                              "borrowed_at, due_date, returned_at, fine_paid FROM loans "
                              "WHERE school_id = ? AND book_id = ? AND returned_at IS NULL");
    query.addBindValue(schoolId);
    query.addBindValue(bookId);
    exec(query, "find active loan");
    return query.next() ? loanFromQuery(query) : LoanRecord();
}

int LibraryStore::insertLoan(int schoolId, int bookId, int studentId,
                             const QDateTime &borrowedAt, const QDateTime &dueDate)
{
    QSqlQuery query = prepare("INSERT INTO loans (school_id, book_id, student_id, borrowed_at, due_date) "
                              "VALUES (?, ?, ?, ?, ?)");
    query.addBindValue(schoolId);
    query.addBindValue(bookId);
    query.addBindValue(studentId);
    query.addBindValue(toStoredTime(borrowedAt));
    query.addBindValue(toStoredTime(dueDate));
    exec(query, "insert loan");
    return query.lastInsertId().toInt();
}

void LibraryStore::markReturned(int loanId, const QDateTime &returnedAt)
{
    QSqlQuery query = prepare("UPDATE loans SET returned_at = ? WHERE id = ?");
    query.addBindValue(toStoredTime(returnedAt));
    query.addBindValue(loanId);
    exec(query, "mark loan returned");
}

QList<LoanRecord> LibraryStore::currentLoans(int schoolId) const
{
    return selectLoans(QString(LoanColumns) +
                       "WHERE loans.school_id = ? AND loans.returned_at IS NULL "
                       "ORDER BY loans.id",
                       QVariantList() << schoolId);
}

QList<LoanRecord> LibraryStore::studentActiveLoans(int schoolId, int studentId) const
{
    return selectLoans(QString(LoanColumns) +
                       "WHERE loans.school_id = ? AND loans.student_id = ? AND loans.returned_at IS NULL "
                       "ORDER BY loans.due_date, loans.id",
                       QVariantList() << schoolId << studentId);
}

QList<LoanRecord> LibraryStore::loanHistory(int schoolId) const
{
    return selectLoans(QString(LoanColumns) +
                       "WHERE loans.school_id = ? "
                       "ORDER BY loans.borrowed_at DESC, loans.id DESC",
                       QVariantList() << schoolId);
}

QList<LoanRecord> LibraryStore::studentLoanHistory(int schoolId, int studentId) const
{
    return selectLoans(QString(LoanColumns) +
                       "WHERE loans.school_id = ? AND loans.student_id = ? "
                       "ORDER BY loans.borrowed_at DESC, loans.id DESC",
                       QVariantList() << schoolId << studentId);
}

// 撤销日志
QList<UndoEntry> LibraryStore::recentDeletions(int schoolId, int limit) const
{
    QSqlQuery query = prepare("SELECT * FROM undo_log WHERE school_id = ? "
                              "ORDER BY deleted_at DESC, id DESC LIMIT ?");
    query.addBindValue(schoolId);
    query.addBindValue(limit);
    exec(query, "list deletions");

    QList<UndoEntry> entries;
    while (query.next()) {
        entries.append(undoEntryFromQuery(query));
    }
    return entries;
}

UndoEntry LibraryStore::undoEntry(int schoolId, int entryId) const
{
    QSqlQuery query = prepare("SELECT * FROM undo_log WHERE id = ? AND school_id = ?");
    query.addBindValue(entryId);
    query.addBindValue(schoolId);
    exec(query, "find undo entry");
    return query.next() ? undoEntryFromQuery(query) : UndoEntry();
}

void LibraryStore::removeUndoEntry(int schoolId, int entryId)
{
    QSqlQuery query = prepare("DELETE FROM undo_log WHERE id = ? AND school_id = ?");
    query.addBindValue(entryId);
    query.addBindValue(schoolId);
    exec(query, "remove undo entry");
}

QString LibraryStore::toStoredTime(const QDateTime &time)
{
    return time.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime LibraryStore::fromStoredTime(const QString &text)
{
    if (text.isEmpty()) {
        return QDateTime();
    }

    QDateTime time = QDateTime::fromString(text, Qt::ISODateWithMs);
    // 没有时区后缀的时间按 UTC 处理
    if (time.timeSpec() == Qt::LocalTime) {
        time.setTimeSpec(Qt::UTC);
    }
    return time.toUTC();
}

QSqlQuery LibraryStore::prepare(const QString &sql) const
{
    QSqlQuery query(db);
    if (!query.prepare(sql)) {
        throw StoreError(query.lastError(), "prepare");
    }
    return query;
}

void LibraryStore::exec(QSqlQuery &query, const QString &context) const
{
    if (!query.exec()) {
        qCCritical(lcStore) << context << "failed:" << query.lastError().text();
        throw StoreError(query.lastError(), context);
    }
}

// 唯一约束冲突返回 false，其他错误抛出 StoreError
bool LibraryStore::execWrite(QSqlQuery &query, const QString &context)
{
    if (query.exec()) {
        return true;
    }

    if (isConstraintViolation(query.lastError())) {
        qCInfo(lcStore) << context << "rejected by constraint:" << query.lastError().databaseText();
        return false;
    }

    qCCritical(lcStore) << context << "failed:" << query.lastError().text();
    throw StoreError(query.lastError(), context);
}

void LibraryStore::commit(const QString &context)
{
    if (!db.commit()) {
        throw StoreError(db.lastError(), context);
    }
}

QList<LoanRecord> LibraryStore::selectLoans(const QString &sql, const QVariantList &values) const
{
    QSqlQuery query = prepare(sql);
    for (const QVariant &value : values) {
        query.addBindValue(value);
    }
    exec(query, "list loans");

    QList<LoanRecord> loans;
    while (query.next()) {
        loans.append(loanFromQuery(query));
    }
    return loans;
}

// 先把整行快照写入撤销日志，再删除；两步在同一事务中完成
DeleteResult LibraryStore::deleteWithSnapshot(int schoolId, const QString &table, const QString &keyColumn,
                                              const QString &key, const QString &loanColumn)
{
    if (!db.transaction()) {
        throw StoreError(db.lastError(), "begin delete");
    }

    try {
        QSqlQuery select = prepare(QString("SELECT * FROM %1 WHERE school_id = ? AND %2 = ?").arg(table, keyColumn));
        select.addBindValue(schoolId);
        select.addBindValue(key);
        exec(select, "select for delete");

        if (!select.next()) {
            db.rollback();
            qCDebug(lcStore) << "Nothing to delete in" << table << "for" << key;
            return DeleteResult::NotFound;
        }

        const int rowId = select.value("id").toInt();
        const QString snapshot = recordToJson(select.record());
        select.finish();

        // 检查是否有未归还的借阅
        QSqlQuery active = prepare(QString("SELECT COUNT(*) FROM loans "
                                           "WHERE school_id = ? AND %1 = ? AND returned_at IS NULL").arg(loanColumn));
        active.addBindValue(schoolId);
        active.addBindValue(rowId);
        exec(active, "check active loans");
        if (active.next() && active.value(0).toInt() > 0) {
            db.rollback();
            qCInfo(lcStore) << "Refused to delete" << key << "from" << table << ": active loans";
            return DeleteResult::HasActiveLoans;
        }
        active.finish();

        QSqlQuery log = prepare("INSERT INTO undo_log (school_id, table_name, record_data, deleted_at) "
                                "VALUES (?, ?, ?, ?)");
        log.addBindValue(schoolId);
        log.addBindValue(table);
        log.addBindValue(snapshot);
        log.addBindValue(toStoredTime(QDateTime::currentDateTimeUtc()));
        exec(log, "write undo entry");

        QSqlQuery remove = prepare(QString("DELETE FROM %1 WHERE id = ?").arg(table));
        remove.addBindValue(rowId);
        exec(remove, "delete row");

        commit("delete");
        qCInfo(lcStore) << "Deleted" << key << "from" << table;
        return DeleteResult::Deleted;
    } catch (const StoreError &) {
        db.rollback();
        throw;
    }
}
