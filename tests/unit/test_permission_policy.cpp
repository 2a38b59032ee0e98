#include <catch2/catch_test_macros.hpp>
#include "veil/agents/permission_policy.hpp"
using namespace veil::transfer;
using namespace veil::transfer::agents;
namespace {
// 2024-01-01 10:30 UTC
const Timestamp kMorning = FromUnixMillis(1'704'105'000'000);
AgentOperation FundCard(uint64_t amount, std::string mcc = "5411") {
    return AgentOperation{
        .type = "fund_card",
        .amount = amount,
        .target = std::nullopt,
        .mcc_code = std::move(mcc),
        .payload = {}
    };
}
AgentPermissions Scoped() {
    AgentPermissions permissions;
    permissions.allowed = {std::string(permission::kFundCard), std::string(permission::kTransferFunds)};
    permissions.wallet_scoping = WalletScoping{
        .allowed_addresses = {"merchant-1"},
        .max_transaction_amount = 10'000,
        .daily_limit = 1,
        .monthly_limit = 1
    };
    permissions.activity_restrictions = ActivityRestrictions{.allowed_mcc_codes = {"5411"}};
    return permissions;
}
}
TEST_CASE("PermissionPolicy - Operation tokens", "[agents][policy]") {
    AgentPermissions permissions;
    permissions.allowed = {"read_balance"};
    REQUIRE_FALSE(PermissionPolicy::Evaluate(permissions, AgentOperation{.type = "read_balance"}, kMorning).has_value());
    const auto denial = PermissionPolicy::Evaluate(permissions, AgentOperation{.type = "transfer_funds"}, kMorning);
    REQUIRE(denial.has_value());
    REQUIRE(denial->find("transfer_funds") != std::string::npos);
}
TEST_CASE("PermissionPolicy - Wallet scoping", "[agents][policy]") {
    const auto permissions = Scoped();
    SECTION("Amount at the cap is allowed") {
        REQUIRE_FALSE(PermissionPolicy::Evaluate(permissions, FundCard(10'000), kMorning).has_value());
    }
    SECTION("Amount over the cap is denied") {
        const auto denial = PermissionPolicy::Evaluate(permissions, FundCard(10'001), kMorning);
        REQUIRE(denial.has_value());
        REQUIRE(denial->find("per-transaction limit") != std::string::npos);
    }
    SECTION("Daily and monthly limits are not checked locally") {
        REQUIRE_FALSE(PermissionPolicy::Evaluate(permissions, FundCard(5'000), kMorning).has_value());
    }
    SECTION("Target outside the scope is denied") {
        AgentOperation transfer{.type = "transfer_funds", .amount = 100, .target = "stranger"};
        REQUIRE(PermissionPolicy::Evaluate(permissions, transfer, kMorning).has_value());
        transfer.target = "merchant-1";
        REQUIRE_FALSE(PermissionPolicy::Evaluate(permissions, transfer, kMorning).has_value());
    }
    SECTION("Merchant category outside the list is denied") {
        REQUIRE(PermissionPolicy::Evaluate(permissions, FundCard(100, "7995"), kMorning).has_value());
    }
}
TEST_CASE("PermissionPolicy - Time restrictions", "[agents][policy]") {
    AgentPermissions permissions;
    permissions.allowed = {"fund_card"};
    const int64_t now_ms = ToUnixMillis(kMorning);
    SECTION("Validity window") {
        permissions.time_restrictions = TimeRestrictions{.valid_from_ms = now_ms - 1, .valid_until_ms = now_ms + 1};
        REQUIRE_FALSE(PermissionPolicy::Evaluate(permissions, FundCard(1), kMorning).has_value());
        permissions.time_restrictions->valid_from_ms = now_ms + 1;
        REQUIRE(PermissionPolicy::Evaluate(permissions, FundCard(1), kMorning).has_value());
        permissions.time_restrictions->valid_from_ms = std::nullopt;
        permissions.time_restrictions->valid_until_ms = now_ms;
        REQUIRE(PermissionPolicy::Evaluate(permissions, FundCard(1), kMorning).has_value());
    }
    SECTION("Allowed hours are UTC") {
        permissions.time_restrictions = TimeRestrictions{.allowed_hours = {9, 10, 11}};
        REQUIRE_FALSE(PermissionPolicy::Evaluate(permissions, FundCard(1), kMorning).has_value());
        permissions.time_restrictions->allowed_hours = {22, 23};
        const auto denial = PermissionPolicy::Evaluate(permissions, FundCard(1), kMorning);
        REQUIRE(denial.has_value());
        REQUIRE(denial->find("allowed hours") != std::string::npos);
    }
}
TEST_CASE("PermissionPolicy - Validation", "[agents][policy]") {
    AgentPermissions permissions;
    SECTION("Empty set") {
        REQUIRE(PermissionPolicy::ValidatePermissions(permissions).has_value());
    }
    SECTION("Known tokens") {
        permissions.allowed = {"sign_transaction", "read_holdings", "approve_intent"};
        REQUIRE_FALSE(PermissionPolicy::ValidatePermissions(permissions).has_value());
    }
    SECTION("Unknown token") {
        permissions.allowed = {"read_balance", "launch_missiles"};
        const auto problem = PermissionPolicy::ValidatePermissions(permissions);
        REQUIRE(problem.has_value());
        REQUIRE(problem->find("launch_missiles") != std::string::npos);
    }
    SECTION("Hour out of range") {
        permissions.allowed = {"read_balance"};
        permissions.time_restrictions = TimeRestrictions{.allowed_hours = {24}};
        REQUIRE(PermissionPolicy::ValidatePermissions(permissions).has_value());
    }
    SECTION("Inverted window") {
        permissions.allowed = {"read_balance"};
        permissions.time_restrictions = TimeRestrictions{.valid_from_ms = 10, .valid_until_ms = 10};
        REQUIRE(PermissionPolicy::ValidatePermissions(permissions).has_value());
    }
}
