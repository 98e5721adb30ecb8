// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Payment Recorder Tests (local payments)
 *
 * Tests:
 *   1. Both payment views, counters, indexes and the payer user
 *   2. Validation order
 *   3. Balances per token
 *   4. Failures leave the ledger unchanged (transfer, overflow)
 *   5. Funds move before the batch is committed
 *
 * Rejection codes tested:
 * - invalid-payable-id
 * - payable-is-closed
 * - zero-amount-specified
 * - invalid-token
 * - matching-token-and-amount-not-found
 * - transfer-failed, balance-overflow (error mode)
 */

#include "ledger/ledgerdb.h"
#include "ledger/notifications.h"
#include "ledger/payables.h"
#include "ledger/payments.h"
#include "ledger/queries.h"
#include "test/test_chainbills.h"

#include <limits>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(payment_tests, LedgerTestingSetup)

class PaymentEventCounter : public CLedgerNotificationInterface
{
public:
    int nPayments{0};
    bool fHadUserView{false};
    uint64_t nLastPayableCount{0};

protected:
    void PaymentRecorded(const PayablePaymentRecord& payablePayment, const UserPaymentRecord* userPayment) override
    {
        nPayments++;
        fHadUserView = userPayment != nullptr;
        nLastPayableCount = payablePayment.nPayableCount;
    }
};

// =============================================================================
// Test 1: Records
// =============================================================================

BOOST_AUTO_TEST_CASE(record_payment_writes_both_views)
{
    const uint256 payableId = CreateTestPayable({TokenAndAmount(tokenA, 250)});
    PaymentEventCounter events;
    RegisterLedgerInterface(&events);

    CValidationState state;
    uint256 paymentId;
    BOOST_REQUIRE_MESSAGE(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 250),
                                        state, paymentId), FormatStateMessage(state));
    BOOST_CHECK(paymentId == ComputeEntityId(EntityKind::PAYMENT, nChainId, 1));

    UserPaymentRecord userPayment;
    BOOST_REQUIRE(g_ledgerdb->ReadUserPayment(paymentId, userPayment));
    BOOST_CHECK(userPayment.payableId == payableId);
    BOOST_CHECK(userPayment.payer == payer);
    BOOST_CHECK_EQUAL(userPayment.nPayableChainId, nChainId);
    BOOST_CHECK_EQUAL(userPayment.nChainCount, 1U);
    BOOST_CHECK_EQUAL(userPayment.nPayerCount, 1U);
    BOOST_CHECK_EQUAL(userPayment.nPayableCount, 1U);
    BOOST_CHECK_EQUAL(userPayment.nTimestamp, TEST_MOCK_TIME);
    BOOST_CHECK(userPayment.details == TokenAndAmount(tokenA, 250));

    PayablePaymentRecord payablePayment;
    BOOST_REQUIRE(g_ledgerdb->ReadPayablePayment(paymentId, payablePayment));
    BOOST_CHECK(payablePayment.payer == payer);
    BOOST_CHECK_EQUAL(payablePayment.nPayerChainId, nChainId);
    BOOST_CHECK_EQUAL(payablePayment.nLocalChainCount, 1U);
    BOOST_CHECK_EQUAL(payablePayment.nPayableCount, 1U);
    BOOST_CHECK_EQUAL(payablePayment.nPayerCount, 1U);

    UserRecord user;
    BOOST_REQUIRE(g_ledgerdb->ReadUser(payer, nChainId, user));
    BOOST_CHECK_EQUAL(user.nPaymentsCount, 1U);
    BOOST_CHECK_EQUAL(user.nChainCount, 2U); // host was user #1

    PayableRecord payable;
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(payableId, payable));
    BOOST_CHECK_EQUAL(payable.nPaymentsCount, 1U);

    uint256 indexed;
    BOOST_REQUIRE(GetUserPaymentId(*g_ledgerdb, payer, nChainId, 1, indexed, state));
    BOOST_CHECK(indexed == paymentId);
    BOOST_REQUIRE(GetPayablePaymentId(*g_ledgerdb, payableId, 1, indexed, state));
    BOOST_CHECK(indexed == paymentId);
    BOOST_CHECK_EQUAL(GetPayableChainPaymentsCount(*g_ledgerdb, payableId, nChainId), 1U);

    BOOST_REQUIRE_EQUAL(transfer.vCollected.size(), 1U);
    BOOST_CHECK(transfer.vCollected[0].first == payer);
    BOOST_CHECK(transfer.vCollected[0].second == TokenAndAmount(tokenA, 250));

    BOOST_CHECK_EQUAL(events.nPayments, 1);
    BOOST_CHECK(events.fHadUserView);
    BOOST_CHECK_EQUAL(events.nLastPayableCount, 1U);

    ChainStats stats = GetChainStats(*g_ledgerdb);
    BOOST_CHECK_EQUAL(stats.nPaymentsCount, 1U);
    BOOST_CHECK_EQUAL(stats.nUsersCount, 2U);
}

BOOST_AUTO_TEST_CASE(payment_counters_advance_per_scope)
{
    const uint256 first = CreateTestPayable();
    const uint256 second = CreateTestPayable();

    CValidationState state;
    uint256 id1, id2, id3;
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, first, payer, TokenAndAmount(tokenA, 1), state, id1));
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, second, payer, TokenAndAmount(tokenA, 2), state, id2));
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, first, stranger, TokenAndAmount(tokenB, 3), state, id3));

    UserPaymentRecord p3;
    BOOST_REQUIRE(g_ledgerdb->ReadUserPayment(id3, p3));
    BOOST_CHECK_EQUAL(p3.nChainCount, 3U);
    BOOST_CHECK_EQUAL(p3.nPayerCount, 1U);
    BOOST_CHECK_EQUAL(p3.nPayableCount, 2U);

    UserPaymentRecord p2;
    BOOST_REQUIRE(g_ledgerdb->ReadUserPayment(id2, p2));
    BOOST_CHECK_EQUAL(p2.nPayerCount, 2U);
    BOOST_CHECK_EQUAL(p2.nPayableCount, 1U);

    std::vector<PayablePaymentRecord> vPayments;
    BOOST_REQUIRE(ListPayablePayments(*g_ledgerdb, first, vPayments, state));
    BOOST_REQUIRE_EQUAL(vPayments.size(), 2U);
    BOOST_CHECK(vPayments[0].id == id1);
    BOOST_CHECK(vPayments[1].id == id3);
}

// =============================================================================
// Test 2: Validation order
// =============================================================================

BOOST_AUTO_TEST_CASE(payment_validation_order)
{
    const uint256 payableId = CreateTestPayable({TokenAndAmount(tokenA, 100)});
    uint256 paymentId;

    {
        CValidationState state;
        BOOST_CHECK(!RecordPayment(*g_ledgerdb, transfer, uint256S("0x99"), payer, TokenAndAmount(tokenA, 100),
                                   state, paymentId));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "invalid-payable-id");
    }

    // Closed wins over every amount/token problem
    {
        CValidationState state;
        BOOST_REQUIRE(ClosePayable(*g_ledgerdb, payableId, host, state));
        BOOST_CHECK(!RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenUnsupported, 0),
                                   state, paymentId));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "payable-is-closed");
        CValidationState reopenState;
        BOOST_REQUIRE(ReopenPayable(*g_ledgerdb, payableId, host, reopenState));
    }
    {
        CValidationState state;
        BOOST_CHECK(!RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenUnsupported, 0),
                                   state, paymentId));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "zero-amount-specified");
    }
    {
        CValidationState state;
        BOOST_CHECK(!RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenUnsupported, 100),
                                   state, paymentId));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "invalid-token");
    }
    {
        CValidationState state;
        BOOST_CHECK(!RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 101),
                                   state, paymentId));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "matching-token-and-amount-not-found");
        BOOST_CHECK(state.IsInvalid());
    }

    BOOST_CHECK(transfer.vCollected.empty());
    BOOST_CHECK_EQUAL(GetChainStats(*g_ledgerdb).nPaymentsCount, 0U);
    BOOST_CHECK(!g_ledgerdb->ExistsUser(payer, nChainId));
}

// =============================================================================
// Test 3: Balances
// =============================================================================

BOOST_AUTO_TEST_CASE(open_payable_accumulates_balances_per_token)
{
    const uint256 payableId = CreateTestPayable();
    CValidationState state;
    uint256 paymentId;

    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 40), state, paymentId));
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenB, 7), state, paymentId));
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, payableId, stranger, TokenAndAmount(tokenA, 2), state, paymentId));

    PayableRecord payable;
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(payableId, payable));
    BOOST_REQUIRE_EQUAL(payable.vBalances.size(), 2U);
    BOOST_CHECK_EQUAL(payable.FindBalance(tokenA)->amount, 42U);
    BOOST_CHECK_EQUAL(payable.FindBalance(tokenB)->amount, 7U);
    BOOST_CHECK(payable.FindBalance(tokenUnsupported) == nullptr);
    BOOST_CHECK_EQUAL(payable.nPaymentsCount, 3U);
}

// =============================================================================
// Test 4: Failures
// =============================================================================

BOOST_AUTO_TEST_CASE(failed_transfer_writes_nothing)
{
    const uint256 payableId = CreateTestPayable();
    transfer.fFail = true;

    CValidationState state;
    uint256 paymentId;
    BOOST_CHECK(!RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 10), state, paymentId));
    BOOST_CHECK(state.IsError());
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "transfer-failed");

    PayableRecord payable;
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(payableId, payable));
    BOOST_CHECK(payable.vBalances.empty());
    BOOST_CHECK_EQUAL(payable.nPaymentsCount, 0U);
    BOOST_CHECK_EQUAL(GetChainStats(*g_ledgerdb).nPaymentsCount, 0U);
    BOOST_CHECK_EQUAL(GetChainStats(*g_ledgerdb).nUsersCount, 1U);
    BOOST_CHECK(!g_ledgerdb->ExistsUser(payer, nChainId));
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCounter(PayableCounter(CounterScope::PAYABLE_PAYMENTS, payableId)), 0U);

    // Once the executor recovers the same payment takes the first numbers
    transfer.fFail = false;
    CValidationState okState;
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 10), okState, paymentId));
    BOOST_CHECK(paymentId == ComputeEntityId(EntityKind::PAYMENT, nChainId, 1));
}

BOOST_AUTO_TEST_CASE(payment_is_collected_before_it_is_committed)
{
    const uint256 payableId = CreateTestPayable();
    CValidationState state;
    uint256 paymentId;
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 10), state, paymentId));

    // The executor runs while the payment is still only staged
    BOOST_REQUIRE_EQUAL(transfer.vStatsAtTransfer.size(), 1U);
    BOOST_CHECK_EQUAL(transfer.vStatsAtTransfer[0].nPaymentsCount, 0U);
    BOOST_CHECK_EQUAL(transfer.vStatsAtTransfer[0].nActivitiesCount, 1U);

    const ChainStats stats = GetChainStats(*g_ledgerdb);
    BOOST_CHECK_EQUAL(stats.nPaymentsCount, 1U);
    BOOST_CHECK_EQUAL(stats.nActivitiesCount, 2U);
}

BOOST_AUTO_TEST_CASE(balance_overflow_is_an_error)
{
    const uint256 payableId = CreateTestPayable();
    const uint64_t nMax = std::numeric_limits<uint64_t>::max();

    CValidationState state;
    uint256 paymentId;
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, nMax), state, paymentId));

    CValidationState overflowState;
    BOOST_CHECK(!RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 1), overflowState, paymentId));
    BOOST_CHECK(overflowState.IsError());
    BOOST_CHECK_EQUAL(overflowState.GetRejectReason(), "balance-overflow");

    PayableRecord payable;
    BOOST_REQUIRE(g_ledgerdb->ReadPayable(payableId, payable));
    BOOST_CHECK_EQUAL(payable.FindBalance(tokenA)->amount, nMax);
    BOOST_CHECK_EQUAL(payable.nPaymentsCount, 1U);
    BOOST_CHECK_EQUAL(transfer.vCollected.size(), 1U);
}

BOOST_AUTO_TEST_CASE(payment_list_queries_are_bounded)
{
    const uint256 payableId = CreateTestPayable();
    CValidationState state;
    uint256 paymentId;
    BOOST_REQUIRE(RecordPayment(*g_ledgerdb, transfer, payableId, payer, TokenAndAmount(tokenA, 1), state, paymentId));

    uint256 out;
    CValidationState zeroState;
    BOOST_CHECK(!GetPayablePaymentId(*g_ledgerdb, payableId, 0, out, zeroState));
    BOOST_CHECK_EQUAL(zeroState.GetRejectReason(), "invalid-payable-payment-count");

    CValidationState pastState;
    BOOST_CHECK(!GetUserPaymentId(*g_ledgerdb, payer, nChainId, 2, out, pastState));
    BOOST_CHECK_EQUAL(pastState.GetRejectReason(), "invalid-user-payment-count");

    CValidationState missingState;
    PayablePaymentRecord record;
    BOOST_CHECK(!GetPayablePayment(*g_ledgerdb, uint256S("0x1234"), record, missingState));
    BOOST_CHECK_EQUAL(missingState.GetRejectReason(), "invalid-payment-id");
}

BOOST_AUTO_TEST_SUITE_END()
