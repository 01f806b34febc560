// accesspolicy.h
#ifndef ACCESSPOLICY_H
#define ACCESSPOLICY_H

#include "models.h"

#include <QString>

// 需要角色权限的操作。借还书规则本身不区分角色，
// 调用方在修改数据前统一通过 AccessPolicy 检查。
enum class Operation
{
    ViewRecords,
    AddStudent,
    DeleteStudent,
    AddBook,
    DeleteBook,
    BorrowBook,
    ReturnBook,
    UndoDeletion,
    UpdateSettings,
    ManageUsers,
    BackupDatabase,
    RestoreDatabase
};

namespace AccessPolicy
{
    bool isAllowed(Operation operation, Role role);
    QString denialMessage(Operation operation);
}

#endif // ACCESSPOLICY_H
