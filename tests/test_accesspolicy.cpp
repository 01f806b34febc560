// test_accesspolicy.cpp
#include "accesspolicy.h"
#include "testutil.h"

#include <gtest/gtest.h>

TEST(AccessPolicyTest, EveryRoleHandlesDayToDayWork)
{
    const QList<Role> roles = QList<Role>() << Role::Admin << Role::Librarian << Role::Assistant;
    for (Role role : roles) {
        EXPECT_TRUE(AccessPolicy::isAllowed(Operation::ViewRecords, role));
        EXPECT_TRUE(AccessPolicy::isAllowed(Operation::AddStudent, role));
        EXPECT_TRUE(AccessPolicy::isAllowed(Operation::BorrowBook, role));
        EXPECT_TRUE(AccessPolicy::isAllowed(Operation::ReturnBook, role));
        EXPECT_TRUE(AccessPolicy::isAllowed(Operation::UndoDeletion, role));
    }
}

TEST(AccessPolicyTest, AssistantRestrictions)
{
    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::AddBook, Role::Assistant));
    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::DeleteStudent, Role::Assistant));
    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::DeleteBook, Role::Assistant));
    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::BackupDatabase, Role::Assistant));
    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::UpdateSettings, Role::Assistant));
}

TEST(AccessPolicyTest, LibrarianRestrictions)
{
    EXPECT_TRUE(AccessPolicy::isAllowed(Operation::AddBook, Role::Librarian));
    EXPECT_TRUE(AccessPolicy::isAllowed(Operation::DeleteStudent, Role::Librarian));
    EXPECT_TRUE(AccessPolicy::isAllowed(Operation::BackupDatabase, Role::Librarian));

    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::DeleteBook, Role::Librarian));
    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::UpdateSettings, Role::Librarian));
    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::ManageUsers, Role::Librarian));
    EXPECT_FALSE(AccessPolicy::isAllowed(Operation::RestoreDatabase, Role::Librarian));
}

TEST(AccessPolicyTest, AdminMayDoEverything)
{
    EXPECT_TRUE(AccessPolicy::isAllowed(Operation::DeleteBook, Role::Admin));
    EXPECT_TRUE(AccessPolicy::isAllowed(Operation::UpdateSettings, Role::Admin));
    EXPECT_TRUE(AccessPolicy::isAllowed(Operation::ManageUsers, Role::Admin));
    EXPECT_TRUE(AccessPolicy::isAllowed(Operation::RestoreDatabase, Role::Admin));
}

TEST(AccessPolicyTest, DenialMessages)
{
    EXPECT_EQ(AccessPolicy::denialMessage(Operation::DeleteBook), QString("Only Admin can delete books"));
    EXPECT_EQ(AccessPolicy::denialMessage(Operation::UpdateSettings), QString("Only Admin can change settings"));
    EXPECT_EQ(AccessPolicy::denialMessage(Operation::AddBook), QString("Assistants cannot add books"));
    EXPECT_EQ(AccessPolicy::denialMessage(Operation::BorrowBook), QString("Permission denied"));
}

TEST(RoleTest, ParsesCaseInsensitively)
{
    Role role = Role::Assistant;
    EXPECT_TRUE(roleFromString("librarian", &role));
    EXPECT_EQ(role, Role::Librarian);
    EXPECT_TRUE(roleFromString("ADMIN", &role));
    EXPECT_EQ(role, Role::Admin);
    EXPECT_FALSE(roleFromString("janitor", &role));
    EXPECT_EQ(roleToString(Role::Assistant), QString("Assistant"));
}

TEST(BookConditionTest, Parses)
{
    BookCondition condition = BookCondition::Good;
    EXPECT_TRUE(conditionFromString("Damaged", &condition));
    EXPECT_EQ(condition, BookCondition::Damaged);
    EXPECT_FALSE(conditionFromString("Shiny", &condition));
    EXPECT_EQ(conditionToString(BookCondition::New), QString("New"));
}
