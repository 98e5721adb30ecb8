// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/payments.h"

#include "chainparams.h"
#include "ledger/activities.h"
#include "ledger/notifications.h"
#include "ledger/users.h"
#include "logging.h"
#include "utiltime.h"

#include <limits>

bool CheckPaymentAgainstPayable(const CLedgerDB& ledgerdb, const PayableRecord& payable,
                                const TokenAndAmount& details, CValidationState& state)
{
    if (payable.fClosed) {
        return state.Invalid(false, REJECT_INVALID, "payable-is-closed", payable.id.ToString());
    }
    if (details.amount == 0) {
        return state.Invalid(false, REJECT_INVALID, "zero-amount-specified");
    }
    if (!ledgerdb.IsTokenSupported(details.token)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-token", details.token.ToString());
    }
    if (!payable.AcceptsTokenAndAmount(details.token, details.amount)) {
        return state.Invalid(false, REJECT_INVALID, "matching-token-and-amount-not-found", details.ToString());
    }
    return true;
}

/** Add a payment to the payable's balance in its token */
static bool CreditBalance(PayableRecord& payable, const TokenAndAmount& details, CValidationState& state)
{
    TokenAndAmount* balance = payable.FindBalance(details.token);
    if (!balance) {
        payable.vBalances.emplace_back(details.token, details.amount);
        return true;
    }
    if (balance->amount > std::numeric_limits<uint64_t>::max() - details.amount) {
        return state.Error("balance-overflow");
    }
    balance->amount += details.amount;
    return true;
}

bool RecordPayment(CLedgerDB& ledgerdb,
                   CTransferExecutor& transfer,
                   const uint256& payableId,
                   const uint256& payer,
                   const TokenAndAmount& details,
                   CValidationState& state,
                   uint256& paymentIdOut)
{
    const uint16_t nChainId = Params().ChainId();

    PayableRecord payable;
    if (!ledgerdb.ReadPayable(payableId, payable)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payable-id", payableId.ToString());
    }
    if (!CheckPaymentAgainstPayable(ledgerdb, payable, details, state)) {
        return false;
    }

    CLedgerDB::Batch batch = ledgerdb.CreateBatch();

    UserRecord user;
    if (!LoadOrCreateUser(ledgerdb, batch, payer, nChainId, user, state)) {
        return false;
    }

    uint64_t nChainCount, nPayerCount, nPayableCount, nLocalChainCount;
    if (!batch.NextCounter(ChainCounter(CounterScope::CHAIN_PAYMENTS), nChainCount) ||
        !batch.NextCounter(UserCounter(CounterScope::USER_PAYMENTS, payer, nChainId), nPayerCount) ||
        !batch.NextCounter(PayableCounter(CounterScope::PAYABLE_PAYMENTS, payableId), nPayableCount) ||
        !batch.NextCounter(PayableChainCounter(payableId, nChainId), nLocalChainCount)) {
        return state.Error("counter-overflow");
    }

    if (!CreditBalance(payable, details, state)) {
        return false;
    }

    const uint256 paymentId = ComputeEntityId(EntityKind::PAYMENT, nChainId, nChainCount);
    const int64_t nNow = GetTime();

    UserPaymentRecord userPayment;
    userPayment.id = paymentId;
    userPayment.payableId = payableId;
    userPayment.payer = payer;
    userPayment.nPayableChainId = nChainId;
    userPayment.nChainCount = nChainCount;
    userPayment.nPayerCount = nPayerCount;
    userPayment.nPayableCount = nPayableCount;
    userPayment.nTimestamp = nNow;
    userPayment.details = details;

    PayablePaymentRecord payablePayment;
    payablePayment.id = paymentId;
    payablePayment.payableId = payableId;
    payablePayment.payer = payer;
    payablePayment.nPayerChainId = nChainId;
    payablePayment.nLocalChainCount = nLocalChainCount;
    payablePayment.nPayableCount = nPayableCount;
    payablePayment.nPayerCount = nPayerCount;
    payablePayment.nTimestamp = nNow;
    payablePayment.details = details;

    user.nPaymentsCount = nPayerCount;
    payable.nPaymentsCount = nPayableCount;

    ActivityRecord activity;
    if (!StageActivity(batch, ActivityType::PAID, paymentId, payable, &user, activity, state)) {
        return false;
    }

    batch.WriteUser(user);
    batch.WritePayable(payable);
    batch.WriteUserPayment(userPayment);
    batch.WritePayablePayment(payablePayment);
    batch.WriteUserPaymentId(payer, nChainId, nPayerCount, paymentId);
    batch.WritePayablePaymentId(payableId, nPayableCount, paymentId);

    std::string strError;
    if (!transfer.CollectPayment(payer, details, strError)) {
        LogPrintf("ERROR: RecordPayment - collecting %s from %s failed: %s\n",
                  details.ToString(), payer.ToString(), strError);
        return state.Error("transfer-failed");
    }
    try {
        if (!batch.Commit()) {
            return state.Error("ledger-write-failed");
        }
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: RecordPayment - collected %s from %s for payment %s but the ledger write failed: %s\n",
                  details.ToString(), payer.ToString(), paymentId.ToString(), e.what());
        throw;
    }

    LogPrint(BCLog::PAYMENTS, "RecordPayment: %s payable=%s payer=%s %s chain#%u payer#%u payable#%u\n",
             paymentId.ToString(), payableId.ToString(), payer.ToString(), details.ToString(),
             nChainCount, nPayerCount, nPayableCount);

    paymentIdOut = paymentId;
    GetLedgerSignals().PaymentRecorded(payablePayment, &userPayment);
    return true;
}

bool RecordPaymentReceived(CLedgerDB& ledgerdb,
                           const AttestedMessage& msg,
                           const uint256& payableId,
                           CValidationState& state,
                           uint256& paymentIdOut)
{
    VerifiedMessage verified;
    if (!VerifyAttestedMessage(ledgerdb, msg, {ActionId::PAY}, nullptr, &payableId, verified, state)) {
        return false;
    }
    const CrossChainPayload& payload = verified.payload;

    PayableRecord payable;
    if (!ledgerdb.ReadPayable(payableId, payable)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payable-id", payableId.ToString());
    }
    if (!CheckPaymentAgainstPayable(ledgerdb, payable, payload.details, state)) {
        return false;
    }

    const uint256 paymentId = ComputeEntityId(EntityKind::PAYMENT, msg.nEmitterChainId, payload.nOriginChainCount);
    if (ledgerdb.ExistsPayablePayment(paymentId)) {
        return state.Invalid(false, REJECT_DUPLICATE, "duplicate-payment-id", paymentId.ToString());
    }

    CLedgerDB::Batch batch = ledgerdb.CreateBatch();

    uint64_t nPayableCount, nLocalChainCount;
    if (!batch.NextCounter(PayableCounter(CounterScope::PAYABLE_PAYMENTS, payableId), nPayableCount) ||
        !batch.NextCounter(PayableChainCounter(payableId, msg.nEmitterChainId), nLocalChainCount)) {
        return state.Error("counter-overflow");
    }

    if (!CreditBalance(payable, payload.details, state)) {
        return false;
    }
    payable.nPaymentsCount = nPayableCount;

    PayablePaymentRecord payablePayment;
    payablePayment.id = paymentId;
    payablePayment.payableId = payableId;
    payablePayment.payer = payload.caller;
    payablePayment.nPayerChainId = msg.nEmitterChainId;
    payablePayment.nLocalChainCount = nLocalChainCount;
    payablePayment.nPayableCount = nPayableCount;
    payablePayment.nPayerCount = payload.nPayerCount;
    payablePayment.nTimestamp = GetTime();
    payablePayment.details = payload.details;

    ActivityRecord activity;
    if (!StageActivity(batch, ActivityType::PAID, paymentId, payable, nullptr, activity, state)) {
        return false;
    }

    batch.WritePayable(payable);
    batch.WritePayablePayment(payablePayment);
    batch.WritePayablePaymentId(payableId, nPayableCount, paymentId);
    StageMessageApplied(batch, verified);
    if (!batch.Commit()) {
        return state.Error("ledger-write-failed");
    }

    LogPrint(BCLog::XCHAIN, "RecordPaymentReceived: %s payable=%s payer=%s chain=%u %s message=%s\n",
             paymentId.ToString(), payableId.ToString(), payload.caller.ToString(), msg.nEmitterChainId,
             payload.details.ToString(), msg.hash.ToString());

    paymentIdOut = paymentId;
    GetLedgerSignals().PaymentRecorded(payablePayment, nullptr);
    return true;
}
