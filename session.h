// session.h
#ifndef SESSION_H
#define SESSION_H

#include "models.h"

#include <QString>

class LibraryStore;

// 当前登录的学校与用户，作为参数显式传递，不使用全局状态
struct TenantContext
{
    int schoolId = 0;
    QString schoolName;
    int userId = 0;
    QString username;
    Role role = Role::Assistant;

    bool isValid() const { return schoolId > 0 && userId > 0; }
};

struct LoginResult
{
    bool ok = false;
    QString message;
    TenantContext context;
};

namespace Session
{
    // 先校验学校账号，再校验该学校下的用户账号
    LoginResult login(const LibraryStore &store,
                      const QString &schoolName, const QString &schoolPassword,
                      const QString &username, const QString &userPassword);
}

#endif // SESSION_H
