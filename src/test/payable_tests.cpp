// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Payable Registry Tests
 *
 * Tests:
 *   1. Creation records, counters and lazy host user
 *   2. Description and allowed-set validation (in order)
 *   3. Close / reopen lifecycle and host-only transitions
 *   4. Allowed-set updates leave balances alone
 *   5. Notifications after commit
 *
 * Rejection codes tested:
 * - empty-description
 * - max-payable-description-reached
 * - max-payable-tokens-capacity-reached
 * - zero-amount-specified
 * - invalid-token
 * - duplicate-token-and-amount
 * - invalid-payable-id
 * - not-your-payable
 * - payable-is-closed / payable-is-not-closed
 */

#include "chainparams.h"
#include "ledger/ledgerdb.h"
#include "ledger/notifications.h"
#include "ledger/payables.h"
#include "ledger/payments.h"
#include "ledger/queries.h"
#include "ledger/setup.h"
#include "test/test_chainbills.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(payable_tests, LedgerTestingSetup)

// =============================================================================
// Helpers
// =============================================================================

static bool TryCreate(const uint256& host, const std::string& description,
                      const std::vector<TokenAndAmount>& vAllowed, CValidationState& state)
{
    uint256 payableId;
    return CreatePayable(*g_ledgerdb, host, description, vAllowed, state, payableId);
}

class PayableEventCounter : public CLedgerNotificationInterface
{
public:
    int nCreated{0};
    int nClosed{0};
    int nReopened{0};
    int nUpdated{0};
    uint64_t nLastChainCount{0};

protected:
    void PayableCreated(const PayableRecord& payable) override
    {
        nCreated++;
        nLastChainCount = payable.nChainCount;
    }
    void PayableClosed(const PayableRecord& payable) override { nClosed++; }
    void PayableReopened(const PayableRecord& payable) override { nReopened++; }
    void PayableUpdated(const PayableRecord& payable) override { nUpdated++; }
};

// =============================================================================
// Test 1: Creation
// =============================================================================

BOOST_AUTO_TEST_CASE(create_payable_records_host_and_counters)
{
    CValidationState state;
    uint256 payableId;
    BOOST_REQUIRE(CreatePayable(*g_ledgerdb, host, "  Consulting, March  ", {TokenAndAmount(tokenA, 100)},
                                state, payableId));
    BOOST_CHECK(payableId == ComputeEntityId(EntityKind::PAYABLE, nChainId, 1));

    PayableRecord payable;
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(payableId, payable));
    BOOST_CHECK(payable.host == host);
    BOOST_CHECK_EQUAL(payable.nHostChainId, nChainId);
    BOOST_CHECK_EQUAL(payable.nChainCount, 1U);
    BOOST_CHECK_EQUAL(payable.nHostCount, 1U);
    BOOST_CHECK_EQUAL(payable.description, "Consulting, March");
    BOOST_CHECK_EQUAL(payable.nCreatedAt, TEST_MOCK_TIME);
    BOOST_CHECK_EQUAL(payable.nPaymentsCount, 0U);
    BOOST_CHECK_EQUAL(payable.nWithdrawalsCount, 0U);
    BOOST_CHECK(!payable.fClosed);
    BOOST_CHECK(payable.vBalances.empty());
    BOOST_REQUIRE_EQUAL(payable.vAllowedTokensAndAmounts.size(), 1U);

    UserRecord user;
    BOOST_REQUIRE(g_ledgerdb->ReadUser(host, nChainId, user));
    BOOST_CHECK_EQUAL(user.nChainCount, 1U);
    BOOST_CHECK_EQUAL(user.nPayablesCount, 1U);

    // Second payable of the same host: no new user
    uint256 secondId;
    BOOST_REQUIRE(CreatePayable(*g_ledgerdb, host, "Consulting, April", {}, state, secondId));
    BOOST_CHECK(secondId != payableId);
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(secondId, payable));
    BOOST_CHECK_EQUAL(payable.nChainCount, 2U);
    BOOST_CHECK_EQUAL(payable.nHostCount, 2U);

    ChainStats stats = GetChainStats(*g_ledgerdb);
    BOOST_CHECK_EQUAL(stats.nChainId, nChainId);
    BOOST_CHECK_EQUAL(stats.nUsersCount, 1U);
    BOOST_CHECK_EQUAL(stats.nPayablesCount, 2U);
    BOOST_CHECK_EQUAL(stats.nPaymentsCount, 0U);
}

// =============================================================================
// Test 2: Validation
// =============================================================================

BOOST_AUTO_TEST_CASE(create_payable_checks_description)
{
    const unsigned int nMax = Params().GetConsensus().nMaxPayableDescriptionLength;
    {
        CValidationState state;
        BOOST_CHECK(!TryCreate(host, " \t\n ", {}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "empty-description");
        BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_INVALID);
    }
    {
        CValidationState state;
        BOOST_CHECK(!TryCreate(host, "", {}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "empty-description");
    }
    {
        CValidationState state;
        BOOST_CHECK(!TryCreate(host, std::string(nMax + 1, 'x'), {}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "max-payable-description-reached");
    }
    {
        CValidationState state;
        BOOST_CHECK(TryCreate(host, std::string(nMax, 'x'), {}, state));
    }
}

BOOST_AUTO_TEST_CASE(create_payable_checks_tokens_in_order)
{
    const unsigned int nMaxTokens = Params().GetConsensus().nMaxPayableTokens;

    // Capacity is checked before anything else in the list
    {
        std::vector<TokenAndAmount> vTooMany;
        for (unsigned int i = 0; i <= nMaxTokens; i++) {
            vTooMany.emplace_back(tokenUnsupported, 0);
        }
        CValidationState state;
        BOOST_CHECK(!TryCreate(host, "Too many", vTooMany, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "max-payable-tokens-capacity-reached");
    }
    // Zero amount before unsupported token
    {
        CValidationState state;
        BOOST_CHECK(!TryCreate(host, "Zero", {TokenAndAmount(tokenUnsupported, 5), TokenAndAmount(tokenA, 0)}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "zero-amount-specified");
    }
    {
        CValidationState state;
        BOOST_CHECK(!TryCreate(host, "Unsupported", {TokenAndAmount(tokenA, 5), TokenAndAmount(tokenUnsupported, 5)}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "invalid-token");
    }
    {
        CValidationState state;
        BOOST_CHECK(!TryCreate(host, "Duplicate", {TokenAndAmount(tokenA, 5), TokenAndAmount(tokenA, 5)}, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "duplicate-token-and-amount");
    }

    // Same token at two amounts is fine, and a full list is fine
    {
        CValidationState state;
        BOOST_CHECK(TryCreate(host, "Tiers", {TokenAndAmount(tokenA, 5), TokenAndAmount(tokenA, 10)}, state));

        std::vector<TokenAndAmount> vFull;
        for (unsigned int i = 1; i <= nMaxTokens; i++) {
            vFull.emplace_back(tokenB, i);
        }
        BOOST_CHECK(TryCreate(host, "Full", vFull, state));
    }
}

BOOST_AUTO_TEST_CASE(failed_create_leaves_ledger_unchanged)
{
    CValidationState state;
    BOOST_CHECK(!TryCreate(host, "Bad", {TokenAndAmount(tokenUnsupported, 1)}, state));

    ChainStats stats = GetChainStats(*g_ledgerdb);
    BOOST_CHECK_EQUAL(stats.nUsersCount, 0U);
    BOOST_CHECK_EQUAL(stats.nPayablesCount, 0U);
    BOOST_CHECK(!g_ledgerdb->ExistsUser(host, nChainId));
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCounter(UserCounter(CounterScope::USER_PAYABLES, host, nChainId)), 0U);
}

BOOST_AUTO_TEST_CASE(token_registration)
{
    CValidationState nullState;
    BOOST_CHECK(!RegisterToken(*g_ledgerdb, uint256(), 6, true, nullState));
    BOOST_CHECK_EQUAL(nullState.GetRejectReason(), "invalid-token");

    // Enabling a token makes it usable in allowed sets
    CValidationState state;
    BOOST_CHECK(!TryCreate(host, "Later", {TokenAndAmount(tokenUnsupported, 1)}, state));
    BOOST_REQUIRE(RegisterToken(*g_ledgerdb, tokenUnsupported, 2, true, state));
    BOOST_CHECK(g_ledgerdb->IsTokenSupported(tokenUnsupported));
    BOOST_CHECK(TryCreate(host, "Later", {TokenAndAmount(tokenUnsupported, 1)}, state));

    TokenDetails details;
    BOOST_REQUIRE(g_ledgerdb->ReadTokenDetails(tokenUnsupported, details));
    BOOST_CHECK_EQUAL(details.nDecimals, 2);

    // Disabling does not touch existing payables
    BOOST_REQUIRE(RegisterToken(*g_ledgerdb, tokenA, 6, false, state));
    BOOST_CHECK(!g_ledgerdb->IsTokenSupported(tokenA));
    BOOST_CHECK(!g_ledgerdb->IsTokenSupported(stranger));
}

// =============================================================================
// Test 3: Lifecycle
// =============================================================================

BOOST_AUTO_TEST_CASE(close_and_reopen_lifecycle)
{
    const uint256 payableId = CreateTestPayable();

    {
        CValidationState state;
        BOOST_CHECK(!ClosePayable(*g_ledgerdb, payableId, stranger, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "not-your-payable");
        BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_UNAUTHORIZED);
    }
    {
        CValidationState state;
        BOOST_CHECK(!ClosePayable(*g_ledgerdb, uint256S("0x42"), host, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "invalid-payable-id");
    }
    {
        CValidationState state;
        BOOST_CHECK(!ReopenPayable(*g_ledgerdb, payableId, host, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "payable-is-not-closed");
    }

    CValidationState state;
    BOOST_REQUIRE(ClosePayable(*g_ledgerdb, payableId, host, state));
    PayableRecord payable;
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(payableId, payable));
    BOOST_CHECK(payable.fClosed);

    BOOST_CHECK(!ClosePayable(*g_ledgerdb, payableId, host, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "payable-is-closed");

    CValidationState reopenState;
    BOOST_REQUIRE(ReopenPayable(*g_ledgerdb, payableId, host, reopenState));
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(payableId, payable));
    BOOST_CHECK(!payable.fClosed);
}

// =============================================================================
// Test 4: Updates
// =============================================================================

BOOST_AUTO_TEST_CASE(update_tokens_and_amounts_keeps_balances)
{
    const uint256 payableId = CreateTestPayable({TokenAndAmount(tokenA, 100)});

    CValidationState state;
    uint256 paymentId;
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 100), state, paymentId));

    BOOST_CHECK(!UpdatePayableTokensAndAmounts(*g_ledgerdb, payableId, stranger, {}, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "not-your-payable");

    CValidationState dupState;
    BOOST_CHECK(!UpdatePayableTokensAndAmounts(*g_ledgerdb, payableId, host,
                                               {TokenAndAmount(tokenB, 1), TokenAndAmount(tokenB, 1)}, dupState));
    BOOST_CHECK_EQUAL(dupState.GetRejectReason(), "duplicate-token-and-amount");

    CValidationState okState;
    BOOST_REQUIRE(UpdatePayableTokensAndAmounts(*g_ledgerdb, payableId, host, {TokenAndAmount(tokenB, 7)}, okState));

    PayableRecord payable;
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(payableId, payable));
    BOOST_REQUIRE_EQUAL(payable.vAllowedTokensAndAmounts.size(), 1U);
    BOOST_CHECK(payable.vAllowedTokensAndAmounts[0] == TokenAndAmount(tokenB, 7));
    BOOST_REQUIRE(payable.FindBalance(tokenA) != nullptr);
    BOOST_CHECK_EQUAL(payable.FindBalance(tokenA)->amount, 100U);

    // The old pair is no longer accepted, the new one is
    CValidationState payState;
    BOOST_CHECK(!RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 100), payState, paymentId));
    BOOST_CHECK_EQUAL(payState.GetRejectReason(), "matching-token-and-amount-not-found");
    CValidationState payState2;
    BOOST_CHECK(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenB, 7), payState2, paymentId));

    // Clearing the set accepts anything supported
    CValidationState clearState;
    BOOST_REQUIRE(UpdatePayableTokensAndAmounts(*g_ledgerdb, payableId, host, {}, clearState));
    CValidationState payState3;
    BOOST_CHECK(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 3), payState3, paymentId));
}

// =============================================================================
// Test 5: Notifications
// =============================================================================

BOOST_AUTO_TEST_CASE(payable_notifications_follow_commits)
{
    PayableEventCounter events;
    RegisterLedgerInterface(&events);

    const uint256 payableId = CreateTestPayable();
    CValidationState state;
    BOOST_REQUIRE(ClosePayable(*g_ledgerdb, payableId, host, state));
    BOOST_REQUIRE(ReopenPayable(*g_ledgerdb, payableId, host, state));
    BOOST_REQUIRE(UpdatePayableTokensAndAmounts(*g_ledgerdb, payableId, host, {TokenAndAmount(tokenA, 1)}, state));

    // Rejected operations notify nobody
    CValidationState badState;
    BOOST_CHECK(!ReopenPayable(*g_ledgerdb, payableId, host, badState));
    BOOST_CHECK(!TryCreate(host, "", {}, badState));

    BOOST_CHECK_EQUAL(events.nCreated, 1);
    BOOST_CHECK_EQUAL(events.nLastChainCount, 1U);
    BOOST_CHECK_EQUAL(events.nClosed, 1);
    BOOST_CHECK_EQUAL(events.nReopened, 1);
    BOOST_CHECK_EQUAL(events.nUpdated, 1);

    UnregisterLedgerInterface(&events);
    CreateTestPayable();
    BOOST_CHECK_EQUAL(events.nCreated, 1);
}

BOOST_AUTO_TEST_SUITE_END()
