// librarymanager.cpp
#include "librarymanager.h"
#include "databasebackup.h"
#include "draftstore.h"
#include "licensevalidator.h"
#include "logging.h"

namespace
{
    QString formatTime(const QDateTime &time)
    {
        return time.isNull() ? QString("-") : time.toLocalTime().toString("yyyy-MM-dd hh:mm");
    }

    QString formatDate(const QDateTime &time)
    {
        return time.isNull() ? QString("-") : time.toUTC().date().toString("yyyy-MM-dd");
    }

    void printRow(QTextStream &out, const QStringList &cells, const QList<int> &widths)
    {
        QString line;
        for (int i = 0; i < cells.size(); ++i) {
            const int width = i < widths.size() ? widths.at(i) : 0;
            line += cells.at(i).leftJustified(width) + "  ";
        }
        out << line.trimmed() << '\n';
    }

    bool parseNumber(const QString &text, int *value)
    {
        bool ok = false;
        *value = text.toInt(&ok);
        return ok;
    }
}

LibraryManager::LibraryManager(const AppConfig &config, const Credentials &credentials,
                               QTextStream &out, QTextStream &err)
    : config(config)
    , credentials(credentials)
    , out(out)
    , err(err)
    , ledger(store)
    , undoLog(store)
{
}

bool LibraryManager::openDatabase(const QString &path)
{
    if (!store.open(path)) {
        err << "Cannot open database: " << path << '\n';
        return false;
    }
    store.initSchema();
    return true;
}

QStringList LibraryManager::commands()
{
    return QStringList()
        << "register" << "add-user" << "list-users" << "delete-user" << "settings"
        << "add-student" << "delete-student" << "students" << "search-students" << "classes"
        << "add-book" << "delete-book" << "books" << "search-books" << "authors"
        << "borrow" << "return" << "loans" << "overdue" << "student-loans" << "history" << "student-history"
        << "deletions" << "undo"
        << "backup" << "restore" << "license" << "issue-license"
        << "draft-save" << "draft-show" << "draft-clear";
}

int LibraryManager::execute(const QString &command, const QStringList &args, const CommandOptions &options)
{
    // 不需要登录的命令
    if (command == "register") {
        return registerSchool(args);
    }
    if (command == "issue-license") {
        return issueLicense(args);
    }
    if (command == "draft-save") {
        return saveDraft(args);
    }
    if (command == "draft-show") {
        return showDraft(args);
    }
    if (command == "draft-clear") {
        return clearDraft(args);
    }

    if (!commands().contains(command)) {
        err << "Unknown command: " << command << '\n';
        return 1;
    }

    if (!login()) {
        return 1;
    }

    if (command == "add-user") return addUser(args);
    if (command == "list-users") return listUsers();
    if (command == "delete-user") return deleteUser(args);
    if (command == "settings") return args.isEmpty() ? showSettings() : updateSettings(args);

    if (command == "add-student") return addStudent(args);
    if (command == "delete-student") return deleteStudent(args);
    if (command == "students") return listStudents();
    if (command == "search-students") return searchStudents(args);
    if (command == "classes") return listClasses();

    if (command == "add-book") return addBook(args, options);
    if (command == "delete-book") return deleteBook(args);
    if (command == "books") return listBooks();
    if (command == "search-books") return searchBooks(args);
    if (command == "authors") return listAuthors();

    if (command == "borrow") return borrowBook(args, options);
    if (command == "return") return returnBook(args);
    if (command == "loans") return checkAccess(Operation::ViewRecords) ? showLoans(ledger.currentLoans(context.schoolId)) : 1;
    if (command == "overdue") return checkAccess(Operation::ViewRecords) ? showLoans(ledger.overdueLoans(context.schoolId)) : 1;
    if (command == "student-loans") return studentLoans(args, false);
    if (command == "history") return showHistory();
    if (command == "student-history") return studentLoans(args, true);

    if (command == "deletions") return listDeletions(options);
    if (command == "undo") return undoDeletion(args);

    if (command == "backup") return backupDatabase(args);
    if (command == "restore") return restoreDatabase(args);
    if (command == "license") return checkLicense(args);

    return 1;
}

bool LibraryManager::login()
{
    if (context.isValid()) {
        return true;
    }

    const LoginResult result = Session::login(store, credentials.schoolName, credentials.schoolPassword,
                                              credentials.username, credentials.password);
    if (!result.ok) {
        err << "Login failed: " << result.message << '\n';
        return false;
    }

    context = result.context;
    return true;
}

bool LibraryManager::checkAccess(Operation operation)
{
    if (AccessPolicy::isAllowed(operation, context.role)) {
        return true;
    }

    qCWarning(lcApp) << "Denied" << static_cast<int>(operation) << "for" << context.username
                     << "(" << roleToString(context.role) << ")";
    err << AccessPolicy::denialMessage(operation) << '\n';
    return false;
}

bool LibraryManager::requireArgs(const QStringList &args, int count, const QString &usage)
{
    if (args.size() >= count) {
        return true;
    }
    err << "Usage: " << usage << '\n';
    return false;
}

int LibraryManager::report(bool ok, const QString &message)
{
    if (ok) {
        out << message << '\n';
        return 0;
    }
    err << message << '\n';
    return 1;
}

// 学校与用户
int LibraryManager::registerSchool(const QStringList &args)
{
    if (!requireArgs(args, 2, "register <school> <password> [fine_per_day] [loan_days]")) {
        return 1;
    }

    int finePerDay = config.defaultFinePerDay;
    int loanDays = config.defaultLoanDays;
    if (args.size() > 2 && !parseNumber(args.at(2), &finePerDay)) {
        return report(false, "fine_per_day must be a number");
    }
    if (args.size() > 3 && !parseNumber(args.at(3), &loanDays)) {
        return report(false, "loan_days must be a number");
    }

    const QString name = args.at(0).trimmed();
    if (!store.registerSchool(name, args.at(1), finePerDay, loanDays)) {
        return report(false, store.schoolByName(name).isValid()
                                 ? QString("School already exists")
                                 : QString("Invalid school settings"));
    }

    return report(true, QString("School '%1' registered.\nDefault admin: username='admin', password='admin'").arg(name));
}

int LibraryManager::addUser(const QStringList &args)
{
    if (!checkAccess(Operation::ManageUsers)
        || !requireArgs(args, 3, "add-user <username> <password> <Admin|Librarian|Assistant>")) {
        return 1;
    }

    Role role;
    if (!roleFromString(args.at(2), &role)) {
        return report(false, QString("Unknown role: %1").arg(args.at(2)));
    }

    if (!store.addUser(context.schoolId, args.at(0).trimmed(), args.at(1), role)) {
        return report(false, "User exists");
    }
    return report(true, QString("User %1 created with role %2").arg(args.at(0).trimmed(), roleToString(role)));
}

int LibraryManager::listUsers()
{
    if (!checkAccess(Operation::ManageUsers)) {
        return 1;
    }

    const QList<int> widths = QList<int>() << 20 << 10;
    printRow(out, QStringList() << "Username" << "Role", widths);
    for (const User &user : store.listUsers(context.schoolId)) {
        printRow(out, QStringList() << user.username << roleToString(user.role), widths);
    }
    return 0;
}

int LibraryManager::deleteUser(const QStringList &args)
{
    if (!checkAccess(Operation::ManageUsers) || !requireArgs(args, 1, "delete-user <username>")) {
        return 1;
    }

    if (args.at(0) == context.username) {
        return report(false, "Cannot delete the logged-in user");
    }
    if (!store.deleteUser(context.schoolId, args.at(0))) {
        return report(false, QString("No user named %1").arg(args.at(0)));
    }
    return report(true, QString("User %1 deleted").arg(args.at(0)));
}

int LibraryManager::showSettings()
{
    const School school = store.schoolById(context.schoolId);
    const LicenseCheck license = LicenseValidator::validateLicenseFile(config.licensePath, school.name,
                                                                       config.licenseSecret);

    out << "School:            " << school.name << '\n';
    out << "Fine per day:      " << school.finePerDay << '\n';
    out << "Default loan days: " << school.defaultLoanDays << '\n';
    out << "License:           " << license.message << '\n';
    return 0;
}

int LibraryManager::updateSettings(const QStringList &args)
{
    if (!checkAccess(Operation::UpdateSettings)
        || !requireArgs(args, 2, "settings [<fine_per_day> <loan_days>]")) {
        return 1;
    }

    int finePerDay = 0;
    int loanDays = 0;
    if (!parseNumber(args.at(0), &finePerDay) || !parseNumber(args.at(1), &loanDays)) {
        return report(false, "fine_per_day and loan_days must be numbers");
    }

    if (!store.updateSchoolSettings(context.schoolId, finePerDay, loanDays)) {
        return report(false, "Invalid settings: fine must be >= 0 and loan days >= 1");
    }
    return report(true, "Settings updated!");
}

// 学生
int LibraryManager::addStudent(const QStringList &args)
{
    if (!checkAccess(Operation::AddStudent)
        || !requireArgs(args, 2, "add-student <admission_no> <name> [class]")) {
        return 1;
    }

    const QString admissionNo = args.at(0).trimmed();
    const QString name = args.at(1).trimmed();
    if (admissionNo.isEmpty() || name.isEmpty()) {
        return report(false, "Admission number and name required");
    }

    const QString klass = args.size() > 2 ? args.at(2).trimmed() : QString();
    if (!store.addStudent(context.schoolId, admissionNo, name, klass)) {
        return report(false, "Admission number exists");
    }
    return report(true, QString("Student %1 added").arg(name));
}

int LibraryManager::deleteStudent(const QStringList &args)
{
    if (!checkAccess(Operation::DeleteStudent) || !requireArgs(args, 1, "delete-student <admission_no>")) {
        return 1;
    }

    switch (store.deleteStudent(context.schoolId, args.at(0))) {
    case DeleteResult::Deleted:
        return report(true, QString("Student %1 deleted").arg(args.at(0)));
    case DeleteResult::NotFound:
        return report(true, QString("No student %1, nothing deleted").arg(args.at(0)));
    case DeleteResult::HasActiveLoans:
        return report(false, "Cannot delete: student has active loans");
    }
    return 1;
}

int LibraryManager::listStudents()
{
    if (!checkAccess(Operation::ViewRecords)) {
        return 1;
    }

    const QList<int> widths = QList<int>() << 12 << 28 << 12;
    printRow(out, QStringList() << "Adm No" << "Name" << "Class", widths);
    for (const Student &student : store.listStudents(context.schoolId)) {
        printRow(out, QStringList() << student.admissionNo << student.name << student.klass, widths);
    }
    return 0;
}

int LibraryManager::searchStudents(const QStringList &args)
{
    if (!checkAccess(Operation::ViewRecords) || !requireArgs(args, 1, "search-students <term>")) {
        return 1;
    }

    const QList<int> widths = QList<int>() << 12 << 28 << 12 << 8;
    printRow(out, QStringList() << "Adm No" << "Name" << "Class" << "Active", widths);
    for (const Student &student : store.searchStudents(context.schoolId, args.at(0))) {
        const int active = ledger.studentActiveLoans(context.schoolId, student.id).size();
        printRow(out, QStringList() << student.admissionNo << student.name << student.klass
                                    << QString::number(active), widths);
    }
    return 0;
}

int LibraryManager::listClasses()
{
    if (!checkAccess(Operation::ViewRecords)) {
        return 1;
    }

    for (const QString &klass : store.uniqueClasses(context.schoolId)) {
        out << klass << '\n';
    }
    return 0;
}

// 图书
int LibraryManager::addBook(const QStringList &args, const CommandOptions &options)
{
    if (!checkAccess(Operation::AddBook)
        || !requireArgs(args, 2, "add-book <barcode> <title> [author] [--condition C] [--non-circulating]")) {
        return 1;
    }

    const QString barcode = args.at(0).trimmed();
    const QString title = args.at(1).trimmed();
    if (barcode.isEmpty() || title.isEmpty()) {
        return report(false, "Title & barcode required");
    }

    BookCondition condition = BookCondition::Good;
    if (!options.condition.isEmpty() && !conditionFromString(options.condition, &condition)) {
        return report(false, QString("Unknown condition: %1 (New, Good, Fair, Poor, Damaged)").arg(options.condition));
    }

    const QString author = args.size() > 2 ? args.at(2).trimmed() : QString();
    if (!store.addBook(context.schoolId, title, author, barcode, options.nonCirculating, condition)) {
        return report(false, "Barcode exists");
    }
    return report(true, QString("Book %1 added").arg(title));
}

int LibraryManager::deleteBook(const QStringList &args)
{
    if (!checkAccess(Operation::DeleteBook) || !requireArgs(args, 1, "delete-book <barcode>")) {
        return 1;
    }

    switch (store.deleteBook(context.schoolId, args.at(0))) {
    case DeleteResult::Deleted:
        return report(true, QString("Book %1 deleted").arg(args.at(0)));
    case DeleteResult::NotFound:
        return report(true, QString("No book %1, nothing deleted").arg(args.at(0)));
    case DeleteResult::HasActiveLoans:
        return report(false, "Cannot delete: book is on loan");
    }
    return 1;
}

int LibraryManager::listBooks()
{
    if (!checkAccess(Operation::ViewRecords)) {
        return 1;
    }

    const QList<int> widths = QList<int>() << 12 << 30 << 20 << 8 << 12;
    printRow(out, QStringList() << "Barcode" << "Title" << "Author" << "Condition" << "Status", widths);
    for (const Book &book : store.listBooks(context.schoolId)) {
        QString status;
        if (book.nonCirculating) {
            status = "Reference";
        } else if (store.hasActiveLoansBook(context.schoolId, book.barcode)) {
            status = "On loan";
        } else {
            status = "Available";
        }
        printRow(out, QStringList() << book.barcode << book.title << book.author
                                    << conditionToString(book.condition) << status, widths);
    }
    return 0;
}

int LibraryManager::searchBooks(const QStringList &args)
{
    if (!checkAccess(Operation::ViewRecords) || !requireArgs(args, 1, "search-books <term>")) {
        return 1;
    }

    const QList<int> widths = QList<int>() << 12 << 30 << 20;
    printRow(out, QStringList() << "Barcode" << "Title" << "Author", widths);
    for (const Book &book : store.searchBooks(context.schoolId, args.at(0))) {
        printRow(out, QStringList() << book.barcode << book.title << book.author, widths);
    }
    return 0;
}

int LibraryManager::listAuthors()
{
    if (!checkAccess(Operation::ViewRecords)) {
        return 1;
    }

    for (const QString &author : store.uniqueAuthors(context.schoolId)) {
        out << author << '\n';
    }
    return 0;
}

// 借还书
int LibraryManager::borrowBook(const QStringList &args, const CommandOptions &options)
{
    if (!checkAccess(Operation::BorrowBook)
        || !requireArgs(args, 2, "borrow <admission_no> <barcode> [--days N]")) {
        return 1;
    }

    const Student student = store.findStudent(context.schoolId, args.at(0).trimmed());
    if (!student.isValid()) {
        return report(false, "Student not found");
    }

    const Book book = store.findBook(context.schoolId, args.at(1).trimmed());
    if (!book.isValid()) {
        return report(false, "Book not found");
    }

    // 参考书不外借
    if (book.nonCirculating) {
        return report(false, "Book not for borrowing");
    }

    const LedgerResult result = ledger.borrow(context.schoolId, book.id, student.id, options.days);
    if (!result.ok()) {
        return report(false, result.message);
    }
    return report(true, QString("Borrowed by %1. %2").arg(student.name, result.message));
}

int LibraryManager::returnBook(const QStringList &args)
{
    if (!checkAccess(Operation::ReturnBook) || !requireArgs(args, 1, "return <barcode>")) {
        return 1;
    }

    const Book book = store.findBook(context.schoolId, args.at(0).trimmed());
    if (!book.isValid()) {
        return report(false, "Book not found");
    }

    const LedgerResult result = ledger.returnBook(context.schoolId, book.id);
    return report(result.ok(), result.message);
}

int LibraryManager::showLoans(const QList<LoanRecord> &loans)
{
    const QList<int> widths = QList<int>() << 12 << 28 << 20 << 16 << 10 << 8;
    printRow(out, QStringList() << "Barcode" << "Title" << "Student" << "Borrowed" << "Due" << "Condition", widths);
    for (const LoanRecord &loan : loans) {
        printRow(out, QStringList() << loan.barcode << loan.bookTitle
                                    << QString("%1 (%2)").arg(loan.studentName, loan.admissionNo)
                                    << formatTime(loan.borrowedAt) << formatDate(loan.dueDate)
                                    << loan.condition, widths);
    }
    return 0;
}

int LibraryManager::studentLoans(const QStringList &args, bool historyOnly)
{
    if (!checkAccess(Operation::ViewRecords)
        || !requireArgs(args, 1, historyOnly ? "student-history <admission_no>" : "student-loans <admission_no>")) {
        return 1;
    }

    const Student student = store.findStudent(context.schoolId, args.at(0).trimmed());
    if (!student.isValid()) {
        return report(false, "Student not found");
    }

    out << student.name << " (" << student.admissionNo << ")";
    if (!student.klass.isEmpty()) {
        out << " - " << student.klass;
    }
    out << '\n';

    const QList<int> widths = QList<int>() << 12 << 28 << 16 << 10 << 16;
    if (!historyOnly) {
        printRow(out, QStringList() << "Barcode" << "Title" << "Borrowed" << "Due", widths);
        for (const LoanRecord &loan : ledger.studentActiveLoans(context.schoolId, student.id)) {
            printRow(out, QStringList() << loan.barcode << loan.bookTitle
                                        << formatTime(loan.borrowedAt) << formatDate(loan.dueDate), widths);
        }
        return 0;
    }

    printRow(out, QStringList() << "Barcode" << "Title" << "Borrowed" << "Due" << "Returned", widths);
    for (const LoanRecord &loan : ledger.studentLoanHistory(context.schoolId, student.id)) {
        printRow(out, QStringList() << loan.barcode << loan.bookTitle << formatTime(loan.borrowedAt)
                                    << formatDate(loan.dueDate)
                                    << (loan.isActive() ? QString("Not returned") : formatTime(loan.returnedAt)),
                 widths);
    }
    return 0;
}

int LibraryManager::showHistory()
{
    if (!checkAccess(Operation::ViewRecords)) {
        return 1;
    }

    const QList<int> widths = QList<int>() << 12 << 28 << 20 << 16 << 10 << 16;
    printRow(out, QStringList() << "Barcode" << "Title" << "Student" << "Borrowed" << "Due" << "Returned", widths);
    for (const LoanRecord &loan : ledger.loanHistory(context.schoolId)) {
        printRow(out, QStringList() << loan.barcode << loan.bookTitle
                                    << QString("%1 (%2)").arg(loan.studentName, loan.admissionNo)
                                    << formatTime(loan.borrowedAt) << formatDate(loan.dueDate)
                                    << (loan.isActive() ? QString("Not returned") : formatTime(loan.returnedAt)),
                 widths);
    }
    return 0;
}

// 撤销
int LibraryManager::listDeletions(const CommandOptions &options)
{
    if (!checkAccess(Operation::ViewRecords)) {
        return 1;
    }

    const int limit = options.limit > 0 ? options.limit : config.recentDeletionsLimit;
    const QList<int> widths = QList<int>() << 6 << 10 << 36 << 19;
    printRow(out, QStringList() << "Id" << "Type" << "Details" << "Deleted At", widths);
    for (const UndoEntry &entry : undoLog.listRecent(context.schoolId, limit)) {
        QString type = entry.tableName;
        if (!type.isEmpty()) {
            type[0] = type.at(0).toUpper();
        }
        printRow(out, QStringList() << QString::number(entry.id) << type << UndoLog::describe(entry)
                                    << entry.deletedAt.toLocalTime().toString("yyyy-MM-dd hh:mm:ss"), widths);
    }
    return 0;
}

int LibraryManager::undoDeletion(const QStringList &args)
{
    if (!checkAccess(Operation::UndoDeletion) || !requireArgs(args, 1, "undo <entry_id>")) {
        return 1;
    }

    int entryId = 0;
    if (!parseNumber(args.at(0), &entryId)) {
        return report(false, "Entry id must be a number");
    }

    const LedgerResult result = undoLog.undo(context.schoolId, entryId);
    return report(result.ok(), result.message);
}

// 系统
int LibraryManager::backupDatabase(const QStringList &args)
{
    if (!checkAccess(Operation::BackupDatabase) || !requireArgs(args, 1, "backup <file>")) {
        return 1;
    }

    QString error;
    if (!DatabaseBackup::exportDatabase(store, args.at(0), &error)) {
        return report(false, QString("Export failed: %1").arg(error));
    }
    return report(true, "Database exported");
}

int LibraryManager::restoreDatabase(const QStringList &args)
{
    if (!checkAccess(Operation::RestoreDatabase) || !requireArgs(args, 1, "restore <file>")) {
        return 1;
    }

    QString error;
    if (!DatabaseBackup::restoreDatabase(store, args.at(0), &error)) {
        return report(false, QString("Restore failed: %1").arg(error));
    }

    // 恢复后旧的登录信息不再可信
    context = TenantContext();
    return report(true, "Database restored");
}

int LibraryManager::checkLicense(const QStringList &args)
{
    const QString path = args.isEmpty() ? config.licensePath : args.at(0);
    const LicenseCheck check = LicenseValidator::validateLicenseFile(path, context.schoolName, config.licenseSecret);
    return report(check.valid, check.message);
}

int LibraryManager::issueLicense(const QStringList &args)
{
    if (!requireArgs(args, 1, "issue-license <school> [file]")) {
        return 1;
    }

    const QString path = args.size() > 1 ? args.at(1) : config.licensePath;
    QString error;
    if (!LicenseValidator::writeLicenseFile(path, args.at(0), config.licenseSecret, &error)) {
        return report(false, QString("Cannot write license: %1").arg(error));
    }
    return report(true, QString("License for %1 written to %2").arg(args.at(0), path));
}

int LibraryManager::saveDraft(const QStringList &args)
{
    if (!requireArgs(args, 2, "draft-save <category> <field=value>...")) {
        return 1;
    }

    QVariantMap fields;
    for (int i = 1; i < args.size(); ++i) {
        const int eq = args.at(i).indexOf('=');
        if (eq <= 0) {
            return report(false, QString("Expected field=value, got '%1'").arg(args.at(i)));
        }
        fields.insert(args.at(i).left(eq), args.at(i).mid(eq + 1));
    }

    DraftStore drafts(config.draftsPath);
    if (!drafts.save(args.at(0), fields)) {
        return report(false, QString("Failed to save draft '%1' to %2").arg(args.at(0), drafts.filePath()));
    }
    return report(true, QString("Draft '%1' saved").arg(args.at(0)));
}

int LibraryManager::showDraft(const QStringList &args)
{
    if (!requireArgs(args, 1, "draft-show <category>")) {
        return 1;
    }

    const QVariantMap fields = DraftStore(config.draftsPath).load(args.at(0));
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        out << it.key() << '=' << it.value().toString() << '\n';
    }
    return 0;
}

int LibraryManager::clearDraft(const QStringList &args)
{
    if (!requireArgs(args, 1, "draft-clear <category>")) {
        return 1;
    }

    DraftStore drafts(config.draftsPath);
    if (!drafts.clear(args.at(0))) {
        return report(false, QString("Failed to clear draft '%1' in %2").arg(args.at(0), drafts.filePath()));
    }
    return report(true, QString("Draft '%1' cleared").arg(args.at(0)));
}
