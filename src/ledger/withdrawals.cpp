// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/withdrawals.h"

#include "chainparams.h"
#include "ledger/activities.h"
#include "ledger/notifications.h"
#include "ledger/users.h"
#include "logging.h"
#include "utiltime.h"

// floor(a * num / den) without the intermediate product; num <= den < 2^32
static uint64_t MulDivFloor(uint64_t a, uint64_t num, uint64_t den)
{
    return (a / den) * num + (a % den) * num / den;
}

bool IsValidFeePolicy(const Consensus::WithdrawalFeePolicy& policy)
{
    return policy.nFeeDenominator > 0 &&
           policy.nFeeDenominator <= UINT32_MAX &&
           policy.nFeeNumerator <= policy.nFeeDenominator;
}

bool ComputeWithdrawalAmounts(const Consensus::WithdrawalFeePolicy& policy,
                              uint64_t nAmount,
                              uint8_t nTokenDecimals,
                              uint8_t nBridgeDecimals,
                              WithdrawalAmounts& amounts)
{
    if (!IsValidFeePolicy(policy)) {
        return false;
    }

    uint64_t nNormalized = nAmount;
    if (policy.fNormalizeBridgedAmounts && nTokenDecimals > nBridgeDecimals) {
        // 10^20 no longer fits: nothing survives the truncation
        const unsigned int nShift = nTokenDecimals - nBridgeDecimals;
        if (nShift >= 20) {
            nNormalized = 0;
        } else {
            uint64_t nScale = 1;
            for (unsigned int i = 0; i < nShift; i++) nScale *= 10;
            nNormalized = (nAmount / nScale) * nScale;
        }
    }

    amounts.nGross = nAmount;
    amounts.nDust = nAmount - nNormalized;
    switch (policy.rounding) {
    case Consensus::FeeRounding::NET_FLOOR:
        amounts.nNet = MulDivFloor(nNormalized, policy.nFeeDenominator - policy.nFeeNumerator, policy.nFeeDenominator);
        amounts.nFee = nNormalized - amounts.nNet;
        break;
    case Consensus::FeeRounding::FEE_FLOOR:
    default:
        amounts.nFee = MulDivFloor(nNormalized, policy.nFeeNumerator, policy.nFeeDenominator);
        amounts.nNet = nNormalized - amounts.nFee;
        break;
    }
    return true;
}

/**
 * Checks 3 and 4, then stage the balance deduction, counters, indexes,
 * collected fees, the withdrawal record and its activity.
 */
static bool StageWithdrawal(const CLedgerDB& ledgerdb,
                            CLedgerDB::Batch& batch,
                            PayableRecord& payable,
                            const TokenAndAmount& details,
                            const Consensus::WithdrawalFeePolicy& policy,
                            WithdrawalRecord& withdrawal,
                            WithdrawalAmounts& amounts,
                            CValidationState& state)
{
    if (details.amount == 0) {
        return state.Invalid(false, REJECT_INVALID, "zero-amount-specified");
    }
    TokenAndAmount* balance = payable.FindBalance(details.token);
    if (!balance) {
        return state.Invalid(false, REJECT_INVALID, "no-balance-for-withdrawal-token", details.token.ToString());
    }
    if (balance->amount < details.amount) {
        return state.Invalid(false, REJECT_INVALID, "insufficient-withdraw-amount",
                             strprintf("balance %u < %u", balance->amount, details.amount));
    }

    TokenDetails token;
    const uint8_t nTokenDecimals = ledgerdb.ReadTokenDetails(details.token, token) ? token.nDecimals : 0;
    if (!ComputeWithdrawalAmounts(policy, details.amount, nTokenDecimals,
                                  Params().GetConsensus().nBridgeDecimals, amounts)) {
        return state.Error("invalid-fee-policy");
    }

    UserRecord host;
    if (!LoadOrCreateUser(ledgerdb, batch, payable.host, payable.nHostChainId, host, state)) {
        return false;
    }

    uint64_t nChainCount, nPayableCount, nHostCount;
    if (!batch.NextCounter(ChainCounter(CounterScope::CHAIN_WITHDRAWALS), nChainCount) ||
        !batch.NextCounter(PayableCounter(CounterScope::PAYABLE_WITHDRAWALS, payable.id), nPayableCount) ||
        !batch.NextCounter(UserCounter(CounterScope::USER_WITHDRAWALS, payable.host, payable.nHostChainId), nHostCount)) {
        return state.Error("counter-overflow");
    }

    const uint64_t nRetained = amounts.nFee + amounts.nDust;
    if (!batch.AddCollectedFees(details.token, nRetained)) {
        return state.Error("collected-fees-overflow");
    }

    balance->amount -= details.amount;
    payable.nWithdrawalsCount = nPayableCount;
    host.nWithdrawalsCount = nHostCount;

    withdrawal = WithdrawalRecord();
    withdrawal.id = ComputeEntityId(EntityKind::WITHDRAWAL, Params().ChainId(), nChainCount);
    withdrawal.payableId = payable.id;
    withdrawal.host = payable.host;
    withdrawal.nHostChainId = payable.nHostChainId;
    withdrawal.nChainCount = nChainCount;
    withdrawal.nPayableCount = nPayableCount;
    withdrawal.nHostCount = nHostCount;
    withdrawal.nTimestamp = GetTime();
    withdrawal.details = details;
    withdrawal.nFee = nRetained;
    withdrawal.nNet = amounts.nNet;

    ActivityRecord activity;
    if (!StageActivity(batch, ActivityType::WITHDREW, withdrawal.id, payable, &host, activity, state)) {
        return false;
    }

    batch.WriteUser(host);
    batch.WritePayable(payable);
    batch.WriteWithdrawal(withdrawal);
    batch.WritePayableWithdrawalId(payable.id, nPayableCount, withdrawal.id);
    batch.WriteUserWithdrawalId(payable.host, payable.nHostChainId, nHostCount, withdrawal.id);
    return true;
}

/** Release the funds, then commit the staged withdrawal */
static bool ReleaseAndCommit(CTransferExecutor& transfer, CLedgerDB::Batch& batch, const WithdrawalRecord& withdrawal,
                             const WithdrawalAmounts& amounts, CValidationState& state)
{
    std::string strError;
    if (!transfer.ReleaseWithdrawal(withdrawal.host, withdrawal.nHostChainId, withdrawal.details.token,
                                    amounts, strError)) {
        LogPrintf("ERROR: ReleaseWithdrawal %s to %s failed: %s\n",
                  withdrawal.id.ToString(), withdrawal.host.ToString(), strError);
        return state.Error("transfer-failed");
    }
    try {
        if (!batch.Commit()) {
            return state.Error("ledger-write-failed");
        }
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: ReleaseWithdrawal %s released net=%u fee=%u to %s on chain %u but the ledger write failed: %s\n",
                  withdrawal.id.ToString(), amounts.nNet, amounts.nFee + amounts.nDust, withdrawal.host.ToString(),
                  withdrawal.nHostChainId, e.what());
        throw;
    }
    return true;
}

bool Withdraw(CLedgerDB& ledgerdb,
              CTransferExecutor& transfer,
              const uint256& payableId,
              const uint256& caller,
              const TokenAndAmount& details,
              CValidationState& state,
              uint256& withdrawalIdOut)
{
    PayableRecord payable;
    if (!ledgerdb.ReadPayable(payableId, payable)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payable-id", payableId.ToString());
    }
    if (!payable.IsHostedBy(caller, Params().ChainId())) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-your-payable");
    }

    CLedgerDB::Batch batch = ledgerdb.CreateBatch();
    WithdrawalRecord withdrawal;
    WithdrawalAmounts amounts;
    if (!StageWithdrawal(ledgerdb, batch, payable, details, Params().GetConsensus().localWithdrawalFee,
                         withdrawal, amounts, state)) {
        return false;
    }
    if (!ReleaseAndCommit(transfer, batch, withdrawal, amounts, state)) {
        return false;
    }

    LogPrint(BCLog::WITHDRAWALS, "Withdraw: %s payable=%s %s fee=%u net=%u chain#%u payable#%u host#%u\n",
             withdrawal.id.ToString(), payableId.ToString(), details.ToString(), withdrawal.nFee,
             withdrawal.nNet, withdrawal.nChainCount, withdrawal.nPayableCount, withdrawal.nHostCount);

    withdrawalIdOut = withdrawal.id;
    GetLedgerSignals().WithdrawalRecorded(withdrawal);
    return true;
}

bool WithdrawReceived(CLedgerDB& ledgerdb,
                      CTransferExecutor& transfer,
                      const AttestedMessage& msg,
                      const uint256& payableId,
                      const uint256& caller,
                      uint64_t nHostCount,
                      const TokenAndAmount& details,
                      CValidationState& state,
                      uint256& withdrawalIdOut)
{
    VerifiedMessage verified;
    if (!VerifyAttestedMessage(ledgerdb, msg, {ActionId::WITHDRAW}, &caller, &payableId, verified, state)) {
        return false;
    }
    const CrossChainPayload& payload = verified.payload;

    PayableRecord payable;
    if (!ledgerdb.ReadPayable(payableId, payable)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payable-id", payableId.ToString());
    }
    if (!payable.IsHostedBy(caller, msg.nEmitterChainId)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "unauthorized-caller-address");
    }

    const uint64_t nExpectedHostCount =
        ledgerdb.ReadCounter(UserCounter(CounterScope::USER_WITHDRAWALS, caller, msg.nEmitterChainId)) + 1;
    if (nHostCount != nExpectedHostCount) {
        return state.Invalid(false, REJECT_CONFLICT, "wrong-withdrawals-host-count",
                             strprintf("got %u, expected %u", nHostCount, nExpectedHostCount));
    }
    if (payload.details.token != details.token) {
        return state.Invalid(false, REJECT_CONFLICT, "not-matching-transaction-token");
    }
    if (payload.details.amount != details.amount) {
        return state.Invalid(false, REJECT_CONFLICT, "not-matching-transaction-amount");
    }

    CLedgerDB::Batch batch = ledgerdb.CreateBatch();
    WithdrawalRecord withdrawal;
    WithdrawalAmounts amounts;
    if (!StageWithdrawal(ledgerdb, batch, payable, details, Params().GetConsensus().bridgedWithdrawalFee,
                         withdrawal, amounts, state)) {
        return false;
    }
    StageMessageApplied(batch, verified);
    if (!ReleaseAndCommit(transfer, batch, withdrawal, amounts, state)) {
        return false;
    }

    LogPrint(BCLog::XCHAIN, "WithdrawReceived: %s payable=%s host=%s chain=%u %s fee=%u net=%u message=%s\n",
             withdrawal.id.ToString(), payableId.ToString(), caller.ToString(), msg.nEmitterChainId,
             details.ToString(), withdrawal.nFee, withdrawal.nNet, msg.hash.ToString());

    withdrawalIdOut = withdrawal.id;
    GetLedgerSignals().WithdrawalRecorded(withdrawal);
    return true;
}
