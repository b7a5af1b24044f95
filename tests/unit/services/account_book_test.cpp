#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ledger_core/services/account_book.h"

namespace ledger_core {

namespace {

CreateAccountRequest BuildRequest(const std::string& code, AccountType type) {
    CreateAccountRequest request;
    request.account_id = "acct-" + code;
    request.account_code = code;
    request.name = "Account " + code;
    request.account_type = type;
    request.performed_by = "alice";
    return request;
}

}  // namespace

TEST(AccountBookTest, CreateAccountIndexesByIdAndCode) {
    AccountBook book("org-1");
    LedgerError error;
    ASSERT_TRUE(book.CreateAccount(BuildRequest("1000", AccountType::kAsset), &error));
    ASSERT_TRUE(book.CreateAccount(BuildRequest("4000", AccountType::kRevenue), &error));

    EXPECT_EQ(book.AccountCount(), 2U);
    EXPECT_TRUE(book.HasAccount("1000"));
    EXPECT_FALSE(book.HasAccount("9999"));
    ASSERT_NE(book.FindById("acct-4000"), nullptr);
    EXPECT_EQ(book.FindById("acct-4000")->account_code(), "4000");
    EXPECT_EQ(book.FindByCode("1000")->organization_id(), "org-1");
    EXPECT_EQ(book.AccountCodes(), (std::vector<std::string>{"1000", "4000"}));
}

TEST(AccountBookTest, RejectsDuplicateCodesAndForeignOrganizations) {
    AccountBook book("org-1");
    LedgerError error;
    ASSERT_TRUE(book.CreateAccount(BuildRequest("1000", AccountType::kAsset), &error));

    auto same_code = BuildRequest("1000", AccountType::kAsset);
    same_code.account_id = "acct-other";
    EXPECT_FALSE(book.CreateAccount(same_code, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kAlreadyExists);
    EXPECT_EQ(error.message, "Account code 1000 is already in use");

    EXPECT_FALSE(book.CreateAccount(BuildRequest("1000", AccountType::kAsset), &error));
    EXPECT_EQ(error.message, "Account already exists");

    auto foreign = BuildRequest("2000", AccountType::kLiability);
    foreign.organization_id = "org-2";
    EXPECT_FALSE(book.CreateAccount(foreign, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidArgument);
    EXPECT_EQ(book.AccountCount(), 1U);
}

TEST(AccountBookTest, PostsAndQueriesByAccountCode) {
    AccountBook book("org-1");
    LedgerError error;
    ASSERT_TRUE(book.CreateAccount(BuildRequest("1000", AccountType::kAsset), &error));

    PostingRequest request;
    request.amount = Amount::FromInteger(250);
    request.reference_id = "JE-1";
    request.reference_type = "JournalEntry";
    ASSERT_TRUE(book.Post("1000", BalanceSide::kDebit, request, nullptr, &error));

    Amount balance;
    ASSERT_TRUE(book.GetBalance("1000", &balance, &error));
    EXPECT_EQ(balance, Amount::FromInteger(250));
    EXPECT_EQ(book.FindEntriesByReference("1000", "JE-1").size(), 1U);
    EXPECT_TRUE(book.FindEntriesByReference("9999", "JE-1").empty());

    EXPECT_FALSE(book.Post("9999", BalanceSide::kDebit, request, nullptr, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kNotFound);
    EXPECT_FALSE(book.GetBalance("9999", &balance, &error));
    EXPECT_EQ(error.message, "Account 9999 does not exist");
}

TEST(AccountBookTest, ApplyEventValidatesOrganizationAndAccount) {
    AccountBook book("org-1");
    LedgerError error;

    AccountEvent entry;
    entry.kind = AccountEventKind::kEntryAppended;
    entry.organization_id = "org-1";
    entry.account_id = "acct-missing";
    EXPECT_FALSE(book.ApplyEvent(entry, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kNotFound);

    AccountEvent created;
    created.kind = AccountEventKind::kCreated;
    created.organization_id = "org-2";
    created.account_id = "acct-1000";
    created.account_code = "1000";
    EXPECT_FALSE(book.ApplyEvent(created, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kInvalidArgument);

    created.organization_id = "org-1";
    ASSERT_TRUE(book.ApplyEvent(created, &error)) << error.message;
    EXPECT_TRUE(book.HasAccount("1000"));
    EXPECT_FALSE(book.ApplyEvent(created, &error));
    EXPECT_EQ(error.code, LedgerErrorCode::kAlreadyExists);
}

}  // namespace ledger_core
