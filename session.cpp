// session.cpp
#include "session.h"
#include "librarystore.h"
#include "logging.h"

namespace Session
{
    LoginResult login(const LibraryStore &store,
                      const QString &schoolName, const QString &schoolPassword,
                      const QString &username, const QString &userPassword)
    {
        LoginResult result;

        if (schoolName.trimmed().isEmpty() || schoolPassword.isEmpty()) {
            result.message = "Enter school name and password";
            return result;
        }
        if (username.trimmed().isEmpty() || userPassword.isEmpty()) {
            result.message = "Login information incomplete";
            return result;
        }

        const School school = store.validateSchoolCredentials(schoolName.trimmed(), schoolPassword);
        if (!school.isValid()) {
            qCWarning(lcApp) << "School login failed for" << schoolName;
            result.message = "Wrong school credentials";
            return result;
        }

        const User user = store.validateUser(school.id, username.trimmed(), userPassword);
        if (!user.isValid()) {
            qCWarning(lcApp) << "User login failed for" << username << "at" << school.name;
            result.message = "Wrong user credentials";
            return result;
        }

        result.ok = true;
        result.message = QString("Logged in as %1 (%2) at %3")
                             .arg(user.username, roleToString(user.role), school.name);
        result.context.schoolId = school.id;
        result.context.schoolName = school.name;
        result.context.userId = user.id;
        result.context.username = user.username;
        result.context.role = user.role;

        qCInfo(lcApp) << "User" << user.username << "logged in to school" << school.name;
        return result;
    }
}
