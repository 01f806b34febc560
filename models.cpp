// models.cpp
#include "models.h"

QString roleToString(Role role)
{
    switch (role) {
    case Role::Admin:
        return "Admin";
    case Role::Librarian:
        return "Librarian";
    case Role::Assistant:
        return "Assistant";
    }
    return QString();
}

bool roleFromString(const QString &text, Role *role)
{
    const QString value = text.trimmed();
    if (value.compare("Admin", Qt::CaseInsensitive) == 0) {
        *role = Role::Admin;
    } else if (value.compare("Librarian", Qt::CaseInsensitive) == 0) {
        *role = Role::Librarian;
    } else if (value.compare("Assistant", Qt::CaseInsensitive) == 0) {
        *role = Role::Assistant;
    } else {
        return false;
    }
    return true;
}

QString conditionToString(BookCondition condition)
{
    switch (condition) {
    case BookCondition::New:
        return "New";
    case BookCondition::Good:
        return "Good";
    case BookCondition::Fair:
        return "Fair";
    case BookCondition::Poor:
        return "Poor";
    case BookCondition::Damaged:
        return "Damaged";
    }
    return QString();
}

bool conditionFromString(const QString &text, BookCondition *condition)
{
    static const BookCondition all[] = {
        BookCondition::New, BookCondition::Good, BookCondition::Fair,
        BookCondition::Poor, BookCondition::Damaged
    };

    for (BookCondition c : all) {
        if (text.trimmed().compare(conditionToString(c), Qt::CaseInsensitive) == 0) {
            *condition = c;
            return true;
        }
    }
    return false;
}
