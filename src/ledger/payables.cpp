// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/payables.h"

#include "chainparams.h"
#include "ledger/activities.h"
#include "ledger/notifications.h"
#include "ledger/users.h"
#include "logging.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <set>
#include <utility>

bool CheckPayableDescription(const std::string& description, CValidationState& state)
{
    if (TrimString(description).empty()) {
        return state.Invalid(false, REJECT_INVALID, "empty-description");
    }

    const Consensus::Params& consensus = Params().GetConsensus();
    if (description.size() > consensus.nMaxPayableDescriptionLength) {
        return state.Invalid(false, REJECT_INVALID, "max-payable-description-reached",
                             strprintf("%u > %u", description.size(), consensus.nMaxPayableDescriptionLength));
    }
    return true;
}

bool CheckTokensAndAmounts(const CLedgerDB& ledgerdb, const std::vector<TokenAndAmount>& vTokensAndAmounts,
                           CValidationState& state)
{
    const Consensus::Params& consensus = Params().GetConsensus();
    if (vTokensAndAmounts.size() > consensus.nMaxPayableTokens) {
        return state.Invalid(false, REJECT_INVALID, "max-payable-tokens-capacity-reached",
                             strprintf("%u > %u", vTokensAndAmounts.size(), consensus.nMaxPayableTokens));
    }

    for (const TokenAndAmount& taa : vTokensAndAmounts) {
        if (taa.amount == 0) {
            return state.Invalid(false, REJECT_INVALID, "zero-amount-specified", taa.token.ToString());
        }
    }

    for (const TokenAndAmount& taa : vTokensAndAmounts) {
        if (!ledgerdb.IsTokenSupported(taa.token)) {
            return state.Invalid(false, REJECT_INVALID, "invalid-token", taa.token.ToString());
        }
    }

    std::set<std::pair<uint256, uint64_t>> setSeen;
    for (const TokenAndAmount& taa : vTokensAndAmounts) {
        if (!setSeen.emplace(taa.token, taa.amount).second) {
            return state.Invalid(false, REJECT_INVALID, "duplicate-token-and-amount", taa.ToString());
        }
    }
    return true;
}

/**
 * Stage a new payable and its host. The payable takes this chain's id and
 * CHAIN_PAYABLES counter whatever chain the host is on.
 */
static bool StageNewPayable(const CLedgerDB& ledgerdb,
                            CLedgerDB::Batch& batch,
                            const uint256& host,
                            uint16_t nHostChainId,
                            const std::string& description,
                            const std::vector<TokenAndAmount>& vAllowedTokensAndAmounts,
                            PayableRecord& payable,
                            CValidationState& state)
{
    UserRecord user;
    if (!LoadOrCreateUser(ledgerdb, batch, host, nHostChainId, user, state)) {
        return false;
    }

    uint64_t nChainCount, nHostCount;
    if (!batch.NextCounter(ChainCounter(CounterScope::CHAIN_PAYABLES), nChainCount) ||
        !batch.NextCounter(UserCounter(CounterScope::USER_PAYABLES, host, nHostChainId), nHostCount)) {
        return state.Error("counter-overflow");
    }
    user.nPayablesCount = nHostCount;

    payable = PayableRecord();
    payable.id = ComputeEntityId(EntityKind::PAYABLE, Params().ChainId(), nChainCount);
    payable.host = host;
    payable.nHostChainId = nHostChainId;
    payable.nChainCount = nChainCount;
    payable.nHostCount = nHostCount;
    payable.description = TrimString(description);
    payable.nCreatedAt = GetTime();
    payable.vAllowedTokensAndAmounts = vAllowedTokensAndAmounts;

    ActivityRecord activity;
    if (!StageActivity(batch, ActivityType::CREATED_PAYABLE, payable.id, payable, &user, activity, state)) {
        return false;
    }

    batch.WriteUser(user);
    batch.WritePayable(payable);
    return true;
}

bool CreatePayable(CLedgerDB& ledgerdb,
                   const uint256& host,
                   const std::string& description,
                   const std::vector<TokenAndAmount>& vAllowedTokensAndAmounts,
                   CValidationState& state,
                   uint256& payableIdOut)
{
    if (!CheckPayableDescription(description, state) ||
        !CheckTokensAndAmounts(ledgerdb, vAllowedTokensAndAmounts, state)) {
        return false;
    }

    CLedgerDB::Batch batch = ledgerdb.CreateBatch();
    PayableRecord payable;
    if (!StageNewPayable(ledgerdb, batch, host, Params().ChainId(), description, vAllowedTokensAndAmounts,
                         payable, state)) {
        return false;
    }
    if (!batch.Commit()) {
        return state.Error("ledger-write-failed");
    }

    LogPrint(BCLog::PAYABLES, "CreatePayable: %s host=%s chain#%u host#%u tokens=%u\n",
             payable.id.ToString(), host.ToString(), payable.nChainCount, payable.nHostCount,
             payable.vAllowedTokensAndAmounts.size());

    payableIdOut = payable.id;
    GetLedgerSignals().PayableCreated(payable);
    return true;
}

/** Load a payable for a host-only change */
static bool LoadHostedPayable(const CLedgerDB& ledgerdb, const uint256& payableId,
                              const uint256& caller, uint16_t nCallerChainId,
                              const char* strUnauthorizedReason,
                              PayableRecord& payable, CValidationState& state)
{
    if (!ledgerdb.ReadPayable(payableId, payable)) {
        return state.Invalid(false, REJECT_INVALID, "invalid-payable-id", payableId.ToString());
    }
    if (!payable.IsHostedBy(caller, nCallerChainId)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, strUnauthorizedReason,
                             strprintf("host is %s on chain %u", payable.host.ToString(), payable.nHostChainId));
    }
    return true;
}

static bool ApplyClose(PayableRecord& payable, CValidationState& state)
{
    if (payable.fClosed) {
        return state.Invalid(false, REJECT_INVALID, "payable-is-closed");
    }
    payable.fClosed = true;
    return true;
}

static bool ApplyReopen(PayableRecord& payable, CValidationState& state)
{
    if (!payable.fClosed) {
        return state.Invalid(false, REJECT_INVALID, "payable-is-not-closed");
    }
    payable.fClosed = false;
    return true;
}

static void NotifyPayableChange(ActionId action, const PayableRecord& payable)
{
    switch (action) {
    case ActionId::CLOSE_PAYABLE:
        GetLedgerSignals().PayableClosed(payable);
        break;
    case ActionId::REOPEN_PAYABLE:
        GetLedgerSignals().PayableReopened(payable);
        break;
    case ActionId::UPDATE_PAYABLE_TOKENS_AND_AMOUNTS:
        GetLedgerSignals().PayableUpdated(payable);
        break;
    default:
        break;
    }
}

static ActivityType PayableChangeActivity(ActionId action)
{
    switch (action) {
    case ActionId::CLOSE_PAYABLE: return ActivityType::CLOSED_PAYABLE;
    case ActionId::REOPEN_PAYABLE: return ActivityType::REOPENED_PAYABLE;
    default: return ActivityType::UPDATED_PAYABLE_TOKENS_AND_AMOUNTS;
    }
}

/** Stage a changed payable with its activity, listed under the host */
static bool StagePayableChange(const CLedgerDB& ledgerdb, CLedgerDB::Batch& batch, ActionId action,
                               PayableRecord& payable, CValidationState& state)
{
    UserRecord host;
    if (!LoadOrCreateUser(ledgerdb, batch, payable.host, payable.nHostChainId, host, state)) {
        return false;
    }

    ActivityRecord activity;
    if (!StageActivity(batch, PayableChangeActivity(action), payable.id, payable, &host, activity, state)) {
        return false;
    }

    batch.WriteUser(host);
    batch.WritePayable(payable);
    return true;
}

static bool CommitPayableChange(CLedgerDB& ledgerdb, ActionId action, PayableRecord& payable,
                                CValidationState& state)
{
    CLedgerDB::Batch batch = ledgerdb.CreateBatch();
    if (!StagePayableChange(ledgerdb, batch, action, payable, state)) {
        return false;
    }
    if (!batch.Commit()) {
        return state.Error("ledger-write-failed");
    }

    LogPrint(BCLog::PAYABLES, "%s: %s\n", ActionIdName(action), payable.id.ToString());
    NotifyPayableChange(action, payable);
    return true;
}

bool ClosePayable(CLedgerDB& ledgerdb, const uint256& payableId, const uint256& caller, CValidationState& state)
{
    PayableRecord payable;
    if (!LoadHostedPayable(ledgerdb, payableId, caller, Params().ChainId(), "not-your-payable", payable, state) ||
        !ApplyClose(payable, state)) {
        return false;
    }
    return CommitPayableChange(ledgerdb, ActionId::CLOSE_PAYABLE, payable, state);
}

bool ReopenPayable(CLedgerDB& ledgerdb, const uint256& payableId, const uint256& caller, CValidationState& state)
{
    PayableRecord payable;
    if (!LoadHostedPayable(ledgerdb, payableId, caller, Params().ChainId(), "not-your-payable", payable, state) ||
        !ApplyReopen(payable, state)) {
        return false;
    }
    return CommitPayableChange(ledgerdb, ActionId::REOPEN_PAYABLE, payable, state);
}

bool UpdatePayableTokensAndAmounts(CLedgerDB& ledgerdb,
                                   const uint256& payableId,
                                   const uint256& caller,
                                   const std::vector<TokenAndAmount>& vAllowedTokensAndAmounts,
                                   CValidationState& state)
{
    PayableRecord payable;
    if (!LoadHostedPayable(ledgerdb, payableId, caller, Params().ChainId(), "not-your-payable", payable, state) ||
        !CheckTokensAndAmounts(ledgerdb, vAllowedTokensAndAmounts, state)) {
        return false;
    }
    payable.vAllowedTokensAndAmounts = vAllowedTokensAndAmounts;
    return CommitPayableChange(ledgerdb, ActionId::UPDATE_PAYABLE_TOKENS_AND_AMOUNTS, payable, state);
}

bool CreatePayableReceived(CLedgerDB& ledgerdb, const AttestedMessage& msg,
                           CValidationState& state, uint256& payableIdOut)
{
    VerifiedMessage verified;
    if (!VerifyAttestedMessage(ledgerdb, msg, {ActionId::CREATE_PAYABLE}, nullptr, nullptr, verified, state)) {
        return false;
    }
    const CrossChainPayload& payload = verified.payload;

    if (!CheckPayableDescription(payload.description, state) ||
        !CheckTokensAndAmounts(ledgerdb, payload.vAllowedTokensAndAmounts, state)) {
        return false;
    }

    CLedgerDB::Batch batch = ledgerdb.CreateBatch();
    PayableRecord payable;
    if (!StageNewPayable(ledgerdb, batch, payload.caller, msg.nEmitterChainId, payload.description,
                         payload.vAllowedTokensAndAmounts, payable, state)) {
        return false;
    }
    StageMessageApplied(batch, verified);
    if (!batch.Commit()) {
        return state.Error("ledger-write-failed");
    }

    LogPrint(BCLog::XCHAIN, "CreatePayableReceived: %s host=%s chain=%u message=%s\n",
             payable.id.ToString(), payload.caller.ToString(), msg.nEmitterChainId, msg.hash.ToString());

    payableIdOut = payable.id;
    GetLedgerSignals().PayableCreated(payable);
    return true;
}

bool UpdatePayableReceived(CLedgerDB& ledgerdb, const AttestedMessage& msg, const uint256& payableId,
                           CValidationState& state)
{
    static const std::vector<ActionId> vActions = {
        ActionId::CLOSE_PAYABLE,
        ActionId::REOPEN_PAYABLE,
        ActionId::UPDATE_PAYABLE_TOKENS_AND_AMOUNTS,
    };

    VerifiedMessage verified;
    if (!VerifyAttestedMessage(ledgerdb, msg, vActions, nullptr, &payableId, verified, state)) {
        return false;
    }
    const CrossChainPayload& payload = verified.payload;

    PayableRecord payable;
    if (!LoadHostedPayable(ledgerdb, payableId, payload.caller, msg.nEmitterChainId,
                           "unauthorized-caller-address", payable, state)) {
        return false;
    }

    switch (payload.action) {
    case ActionId::CLOSE_PAYABLE:
        if (!ApplyClose(payable, state)) return false;
        break;
    case ActionId::REOPEN_PAYABLE:
        if (!ApplyReopen(payable, state)) return false;
        break;
    case ActionId::UPDATE_PAYABLE_TOKENS_AND_AMOUNTS:
        if (!CheckTokensAndAmounts(ledgerdb, payload.vAllowedTokensAndAmounts, state)) return false;
        payable.vAllowedTokensAndAmounts = payload.vAllowedTokensAndAmounts;
        break;
    default:
        return state.Invalid(false, REJECT_INVALID, "invalid-action-id");
    }

    CLedgerDB::Batch batch = ledgerdb.CreateBatch();
    if (!StagePayableChange(ledgerdb, batch, payload.action, payable, state)) {
        return false;
    }
    StageMessageApplied(batch, verified);
    if (!batch.Commit()) {
        return state.Error("ledger-write-failed");
    }

    LogPrint(BCLog::XCHAIN, "UpdatePayableReceived: %s %s message=%s\n",
             ActionIdName(payload.action), payable.id.ToString(), msg.hash.ToString());

    NotifyPayableChange(payload.action, payable);
    return true;
}
