// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/queries.h"

#include "util/format.h"

bool GetPayable(const CLedgerDB& ledgerdb, const uint256& payableId, PayableRecord& payable, CValidationState& state)
{
    if (!ledgerdb.ReadPayable(payableId, payable)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payable-id", payableId.ToString());
    }
    return true;
}

bool GetUser(const CLedgerDB& ledgerdb, const uint256& wallet, uint16_t nChainId, UserRecord& user, CValidationState& state)
{
    if (!ledgerdb.ReadUser(wallet, nChainId, user)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-user",
                             strprintf("%s on chain %u", wallet.ToString(), nChainId));
    }
    return true;
}

bool GetUserPayment(const CLedgerDB& ledgerdb, const uint256& paymentId, UserPaymentRecord& payment, CValidationState& state)
{
    if (!ledgerdb.ReadUserPayment(paymentId, payment)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payment-id", paymentId.ToString());
    }
    return true;
}

bool GetPayablePayment(const CLedgerDB& ledgerdb, const uint256& paymentId, PayablePaymentRecord& payment, CValidationState& state)
{
    if (!ledgerdb.ReadPayablePayment(paymentId, payment)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payment-id", paymentId.ToString());
    }
    return true;
}

bool GetWithdrawal(const CLedgerDB& ledgerdb, const uint256& withdrawalId, WithdrawalRecord& withdrawal, CValidationState& state)
{
    if (!ledgerdb.ReadWithdrawal(withdrawalId, withdrawal)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-withdrawal-id", withdrawalId.ToString());
    }
    return true;
}

static bool CheckListPosition(uint64_t nCount, const CounterKey& key, const CLedgerDB& ledgerdb,
                              const char* strReason, CValidationState& state)
{
    const uint64_t nTotal = ledgerdb.ReadCounter(key);
    if (nCount == 0 || nCount > nTotal) {
        return state.Invalid(false, REJECT_INVALID, strReason, strprintf("%u not in [1, %u]", nCount, nTotal));
    }
    return true;
}

bool GetUserPaymentId(const CLedgerDB& ledgerdb, const uint256& wallet, uint16_t nChainId, uint64_t nCount,
                      uint256& paymentId, CValidationState& state)
{
    if (!CheckListPosition(nCount, UserCounter(CounterScope::USER_PAYMENTS, wallet, nChainId), ledgerdb,
                           "invalid-user-payment-count", state)) {
        return false;
    }
    if (!ledgerdb.ReadUserPaymentId(wallet, nChainId, nCount, paymentId)) {
        return state.Error("missing-user-payment-index");
    }
    return true;
}

bool GetUserWithdrawalId(const CLedgerDB& ledgerdb, const uint256& wallet, uint16_t nChainId, uint64_t nCount,
                         uint256& withdrawalId, CValidationState& state)
{
    if (!CheckListPosition(nCount, UserCounter(CounterScope::USER_WITHDRAWALS, wallet, nChainId), ledgerdb,
                           "invalid-user-withdrawal-count", state)) {
        return false;
    }
    if (!ledgerdb.ReadUserWithdrawalId(wallet, nChainId, nCount, withdrawalId)) {
        return state.Error("missing-user-withdrawal-index");
    }
    return true;
}

bool GetPayablePaymentId(const CLedgerDB& ledgerdb, const uint256& payableId, uint64_t nCount,
                         uint256& paymentId, CValidationState& state)
{
    if (!CheckListPosition(nCount, PayableCounter(CounterScope::PAYABLE_PAYMENTS, payableId), ledgerdb,
                           "invalid-payable-payment-count", state)) {
        return false;
    }
    if (!ledgerdb.ReadPayablePaymentId(payableId, nCount, paymentId)) {
        return state.Error("missing-payable-payment-index");
    }
    return true;
}

bool GetPayableWithdrawalId(const CLedgerDB& ledgerdb, const uint256& payableId, uint64_t nCount,
                            uint256& withdrawalId, CValidationState& state)
{
    if (!CheckListPosition(nCount, PayableCounter(CounterScope::PAYABLE_WITHDRAWALS, payableId), ledgerdb,
                           "invalid-payable-withdrawal-count", state)) {
        return false;
    }
    if (!ledgerdb.ReadPayableWithdrawalId(payableId, nCount, withdrawalId)) {
        return state.Error("missing-payable-withdrawal-index");
    }
    return true;
}

bool GetActivity(const CLedgerDB& ledgerdb, uint64_t nChainCount, ActivityRecord& activity, CValidationState& state)
{
    if (!CheckListPosition(nChainCount, ChainCounter(CounterScope::CHAIN_ACTIVITIES), ledgerdb,
                           "invalid-activity-count", state)) {
        return false;
    }
    if (!ledgerdb.ReadActivity(nChainCount, activity)) {
        return state.Error("missing-activity");
    }
    return true;
}

bool GetUserActivity(const CLedgerDB& ledgerdb, const uint256& wallet, uint16_t nChainId, uint64_t nCount,
                     ActivityRecord& activity, CValidationState& state)
{
    if (!CheckListPosition(nCount, UserCounter(CounterScope::USER_ACTIVITIES, wallet, nChainId), ledgerdb,
                           "invalid-user-activity-count", state)) {
        return false;
    }
    uint64_t nChainCount;
    if (!ledgerdb.ReadUserActivityChainCount(wallet, nChainId, nCount, nChainCount)) {
        return state.Error("missing-user-activity-index");
    }
    if (!ledgerdb.ReadActivity(nChainCount, activity)) {
        return state.Error("missing-activity");
    }
    return true;
}

bool GetPayableActivity(const CLedgerDB& ledgerdb, const uint256& payableId, uint64_t nCount,
                        ActivityRecord& activity, CValidationState& state)
{
    if (!CheckListPosition(nCount, PayableCounter(CounterScope::PAYABLE_ACTIVITIES, payableId), ledgerdb,
                           "invalid-payable-activity-count", state)) {
        return false;
    }
    uint64_t nChainCount;
    if (!ledgerdb.ReadPayableActivityChainCount(payableId, nCount, nChainCount)) {
        return state.Error("missing-payable-activity-index");
    }
    if (!ledgerdb.ReadActivity(nChainCount, activity)) {
        return state.Error("missing-activity");
    }
    return true;
}

bool ListPayablePayments(const CLedgerDB& ledgerdb, const uint256& payableId,
                         std::vector<PayablePaymentRecord>& vPayments, CValidationState& state)
{
    if (!ledgerdb.ExistsPayable(payableId)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payable-id", payableId.ToString());
    }

    vPayments.clear();
    bool fMissing = false;
    ledgerdb.ForEachPayablePaymentId(payableId, [&](uint64_t nSeq, const uint256& paymentId) {
        PayablePaymentRecord payment;
        if (!ledgerdb.ReadPayablePayment(paymentId, payment)) {
            fMissing = true;
            return false;
        }
        vPayments.push_back(payment);
        return true;
    });
    if (fMissing) {
        return state.Error("missing-payable-payment");
    }
    return true;
}

uint64_t GetPayableChainPaymentsCount(const CLedgerDB& ledgerdb, const uint256& payableId, uint16_t nPayerChainId)
{
    return ledgerdb.ReadCounter(PayableChainCounter(payableId, nPayerChainId));
}

uint64_t GetCollectedFees(const CLedgerDB& ledgerdb, const uint256& token)
{
    return ledgerdb.ReadCollectedFees(token);
}
