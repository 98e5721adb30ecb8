// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/xchain.h"

#include "logging.h"
#include "util/format.h"
#include "utiltime.h"

#include <algorithm>

MessageState GetMessageState(const CLedgerDB& ledgerdb, uint16_t nEmitterChainId, const uint256& hash)
{
    return ledgerdb.IsMessageReceived(nEmitterChainId, hash) ? MessageState::APPLIED : MessageState::UNSEEN;
}

bool VerifyAttestedMessage(const CLedgerDB& ledgerdb,
                           const AttestedMessage& msg,
                           const std::vector<ActionId>& vExpectedActions,
                           const uint256* pExpectedCaller,
                           const uint256* pExpectedPayableId,
                           VerifiedMessage& verified,
                           CValidationState& state)
{
    verified.state = MessageState::UNSEEN;

    // 1. Replay guard
    if (ledgerdb.IsMessageReceived(msg.nEmitterChainId, msg.hash)) {
        LogPrint(BCLog::XCHAIN, "VerifyAttestedMessage: REJECT replay of %s from chain %u\n",
                 msg.hash.ToString(), msg.nEmitterChainId);
        return state.Invalid(false, REJECT_DUPLICATE, "duplicate-message",
                             strprintf("message %s from chain %u already applied", msg.hash.ToString(), msg.nEmitterChainId));
    }

    // 2. Emitter must be the registered contract of its chain
    ForeignContract contract;
    if (!ledgerdb.ReadForeignContract(msg.nEmitterChainId, contract) || contract.emitter != msg.emitterAddress) {
        LogPrint(BCLog::XCHAIN, "VerifyAttestedMessage: REJECT emitter %s on chain %u not registered\n",
                 msg.emitterAddress.ToString(), msg.nEmitterChainId);
        return state.Invalid(false, REJECT_UNAUTHORIZED, "unregistered-emitter");
    }

    // 3. Payload
    CrossChainPayload payload;
    std::string strError;
    if (!DecodePayload(msg.vPayload, payload, strError) || !payload.IsTriviallyValid(strError)) {
        LogPrint(BCLog::XCHAIN, "VerifyAttestedMessage: REJECT malformed payload in %s: %s\n",
                 msg.hash.ToString(), strError);
        return state.Invalid(false, REJECT_MALFORMED, "malformed-payload", strError);
    }

    // 4. Action
    if (std::find(vExpectedActions.begin(), vExpectedActions.end(), payload.action) == vExpectedActions.end()) {
        return state.Invalid(false, REJECT_INVALID, "invalid-action-id",
                             strprintf("unexpected action %s", ActionIdName(payload.action)));
    }

    // 5. Caller
    if (payload.caller.IsNull() || (pExpectedCaller && payload.caller != *pExpectedCaller)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "invalid-caller-address");
    }

    // 6. Payable
    if (pExpectedPayableId && payload.payableId != *pExpectedPayableId) {
        return state.Invalid(false, REJECT_CONFLICT, "not-matching-payable-id",
                             strprintf("message targets %s", payload.payableId.ToString()));
    }

    verified.msg = msg;
    verified.payload = payload;
    verified.state = MessageState::VERIFIED;
    return true;
}

void StageMessageApplied(CLedgerDB::Batch& batch, const VerifiedMessage& verified)
{
    ReceivedMessageRecord record;
    record.nEmitterChainId = verified.msg.nEmitterChainId;
    record.hash = verified.msg.hash;
    record.nActionId = static_cast<uint8_t>(verified.payload.action);
    record.nAppliedAt = GetTime();
    batch.WriteReceivedMessage(record);
}
