// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "ledger/ledgerdb.h"
#include "test/test_chainbills.h"

#include <limits>
#include <vector>

#include <boost/test/unit_test.hpp>

static ReceivedMessageRecord MakeReceived(uint16_t nChainId, uint64_t n)
{
    ReceivedMessageRecord record;
    record.nEmitterChainId = nChainId;
    record.hash = ComputeEntityId(EntityKind::PAYMENT, nChainId, n);
    record.nActionId = static_cast<uint8_t>(ActionId::PAY);
    record.nAppliedAt = TEST_MOCK_TIME;
    return record;
}

BOOST_FIXTURE_TEST_SUITE(ledgerdb_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(chain_marker_persists)
{
    uint16_t nStored = 0;
    BOOST_REQUIRE(g_ledgerdb->ReadChainId(nStored));
    BOOST_CHECK_EQUAL(nStored, Params().ChainId());

    const uint256 payableId = CreateTestPayable();

    // Reopen without wiping keeps the ledger
    BOOST_REQUIRE(InitLedgerDB(1 << 20, false));
    BOOST_CHECK(g_ledgerdb->ExistsPayable(payableId));
    BOOST_CHECK_EQUAL(GetChainStats(*g_ledgerdb).nPayablesCount, 1U);

    // A database written for another chain is refused
    BOOST_REQUIRE(g_ledgerdb->WriteChainId(7));
    BOOST_CHECK(!InitLedgerDB(1 << 20, false));
    BOOST_CHECK(!g_ledgerdb);

    // Wiping starts over with the configured chain
    BOOST_REQUIRE(InitLedgerDB(1 << 20, true));
    BOOST_CHECK(!g_ledgerdb->ExistsPayable(payableId));
    BOOST_REQUIRE(g_ledgerdb->ReadChainId(nStored));
    BOOST_CHECK_EQUAL(nStored, Params().ChainId());
}

BOOST_AUTO_TEST_CASE(payable_payment_ids_iterate_in_order)
{
    const uint256 first = uint256S("0x01");
    const uint256 second = uint256S("0x02");

    // Past 255 so the ordering depends on big-endian sequence keys
    const uint64_t nPayments = 300;
    CLedgerDB::Batch batch = g_ledgerdb->CreateBatch();
    for (uint64_t i = 1; i <= nPayments; i++) {
        batch.WritePayablePaymentId(first, i, ComputeEntityId(EntityKind::PAYMENT, 50, i));
    }
    batch.WritePayablePaymentId(second, 1, ComputeEntityId(EntityKind::PAYMENT, 50, 1000));
    BOOST_REQUIRE(batch.Commit());

    std::vector<uint64_t> vSeq;
    bool fIdsMatch = true;
    g_ledgerdb->ForEachPayablePaymentId(first, [&](uint64_t nSeq, const uint256& paymentId) {
        vSeq.push_back(nSeq);
        fIdsMatch &= paymentId == ComputeEntityId(EntityKind::PAYMENT, 50, nSeq);
        return true;
    });
    BOOST_REQUIRE_EQUAL(vSeq.size(), nPayments);
    BOOST_CHECK(fIdsMatch);
    for (uint64_t i = 0; i < nPayments; i++) {
        BOOST_CHECK_EQUAL(vSeq[i], i + 1);
    }

    // Stops when the callback says so
    uint64_t nVisited = 0;
    g_ledgerdb->ForEachPayablePaymentId(first, [&](uint64_t, const uint256&) {
        return ++nVisited < 10;
    });
    BOOST_CHECK_EQUAL(nVisited, 10U);

    std::vector<uint256> vSecond;
    g_ledgerdb->ForEachPayablePaymentId(second, [&](uint64_t, const uint256& paymentId) {
        vSecond.push_back(paymentId);
        return true;
    });
    BOOST_REQUIRE_EQUAL(vSecond.size(), 1U);
    BOOST_CHECK(vSecond[0] == ComputeEntityId(EntityKind::PAYMENT, 50, 1000));

    uint256 paymentId;
    BOOST_CHECK(g_ledgerdb->ReadPayablePaymentId(first, 256, paymentId));
    BOOST_CHECK(paymentId == ComputeEntityId(EntityKind::PAYMENT, 50, 256));
    BOOST_CHECK(!g_ledgerdb->ReadPayablePaymentId(first, nPayments + 1, paymentId));
}

BOOST_AUTO_TEST_CASE(batch_counters_read_through)
{
    const CounterKey key = ChainCounter(CounterScope::CHAIN_PAYABLES);
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCounter(key), 0U);

    CLedgerDB::Batch batch = g_ledgerdb->CreateBatch();
    uint64_t nFirst = 0, nSecond = 0;
    BOOST_REQUIRE(batch.NextCounter(key, nFirst));
    BOOST_REQUIRE(batch.NextCounter(key, nSecond));
    BOOST_CHECK_EQUAL(nFirst, 1U);
    BOOST_CHECK_EQUAL(nSecond, 2U);

    // Nothing is visible before the commit
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCounter(key), 0U);
    BOOST_REQUIRE(batch.Commit());
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCounter(key), 2U);

    // A dropped batch leaves no trace
    {
        CLedgerDB::Batch dropped = g_ledgerdb->CreateBatch();
        uint64_t nValue = 0;
        BOOST_REQUIRE(dropped.NextCounter(key, nValue));
        BOOST_CHECK_EQUAL(nValue, 3U);
        BOOST_REQUIRE(dropped.AddCollectedFees(tokenA, 5));
    }
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCounter(key), 2U);
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCollectedFees(tokenA), 0U);
}

BOOST_AUTO_TEST_CASE(collected_fees_accumulate)
{
    CLedgerDB::Batch batch = g_ledgerdb->CreateBatch();
    BOOST_REQUIRE(batch.AddCollectedFees(tokenA, 7));
    BOOST_REQUIRE(batch.AddCollectedFees(tokenA, 3));
    BOOST_REQUIRE(batch.Commit());
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCollectedFees(tokenA), 10U);

    CLedgerDB::Batch overflow = g_ledgerdb->CreateBatch();
    BOOST_CHECK(!overflow.AddCollectedFees(tokenA, std::numeric_limits<uint64_t>::max() - 9));
    BOOST_CHECK_EQUAL(g_ledgerdb->ReadCollectedFees(tokenA), 10U);
}

BOOST_AUTO_TEST_CASE(received_messages_counted_per_chain)
{
    CLedgerDB::Batch batch = g_ledgerdb->CreateBatch();
    for (uint64_t i = 1; i <= 3; i++) {
        batch.WriteReceivedMessage(MakeReceived(2, i));
    }
    batch.WriteReceivedMessage(MakeReceived(3, 1));
    batch.WriteReceivedMessage(MakeReceived(0x0200, 1));
    BOOST_REQUIRE(batch.Commit());

    BOOST_CHECK_EQUAL(g_ledgerdb->CountReceivedMessages(1), 0U);
    BOOST_CHECK_EQUAL(g_ledgerdb->CountReceivedMessages(2), 3U);
    BOOST_CHECK_EQUAL(g_ledgerdb->CountReceivedMessages(3), 1U);
    BOOST_CHECK_EQUAL(g_ledgerdb->CountReceivedMessages(0x0200), 1U);

    // Replay guard entries are scoped by chain
    const ReceivedMessageRecord record = MakeReceived(2, 1);
    BOOST_CHECK(g_ledgerdb->IsMessageReceived(2, record.hash));
    BOOST_CHECK(!g_ledgerdb->IsMessageReceived(1, record.hash));

    ReceivedMessageRecord stored;
    BOOST_REQUIRE(g_ledgerdb->ReadReceivedMessage(2, record.hash, stored));
    BOOST_CHECK_EQUAL(stored.nAppliedAt, TEST_MOCK_TIME);
}

BOOST_AUTO_TEST_SUITE_END()
