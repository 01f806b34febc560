// accesspolicy.cpp
#include "accesspolicy.h"

namespace
{
    // 各操作所需的最低角色
    Role minimumRole(Operation operation)
    {
        switch (operation) {
        case Operation::ViewRecords:
        case Operation::AddStudent:
        case Operation::BorrowBook:
        case Operation::ReturnBook:
        case Operation::UndoDeletion:
            return Role::Assistant;
        case Operation::DeleteStudent:
        case Operation::AddBook:
        case Operation::BackupDatabase:
            return Role::Librarian;
        case Operation::DeleteBook:
        case Operation::UpdateSettings:
        case Operation::ManageUsers:
        case Operation::RestoreDatabase:
            return Role::Admin;
        }
        return Role::Admin;
    }

    int rank(Role role)
    {
        switch (role) {
        case Role::Admin:
            return 3;
        case Role::Librarian:
            return 2;
        case Role::Assistant:
            return 1;
        }
        return 0;
    }
}

namespace AccessPolicy
{
    bool isAllowed(Operation operation, Role role)
    {
        return rank(role) >= rank(minimumRole(operation));
    }

    QString denialMessage(Operation operation)
    {
        switch (operation) {
        case Operation::DeleteStudent:
            return "Only Admin or Librarian can delete students";
        case Operation::AddBook:
            return "Assistants cannot add books";
        case Operation::DeleteBook:
            return "Only Admin can delete books";
        case Operation::UpdateSettings:
            return "Only Admin can change settings";
        case Operation::ManageUsers:
            return "Only Admin can manage users";
        case Operation::BackupDatabase:
            return "Only Admin or Librarian can export the database";
        case Operation::RestoreDatabase:
            return "Only Admin can restore the database";
        default:
            break;
        }
        return "Permission denied";
    }
}
