// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_XCHAIN_H
#define CHAINBILLS_XCHAIN_H

/**
 * Cross-Chain Message Validator
 *
 * Remote-origin requests arrive as attested messages whose signatures have
 * already been verified by the messaging layer. Before such a message may
 * touch the ledger it must pass, in order:
 *
 *   1. replay guard      hash not yet applied for the emitter chain     duplicate-message
 *   2. emitter           registered foreign contract for that chain     unregistered-emitter
 *   3. payload           decodes completely and is trivially valid      malformed-payload
 *   4. action            one of the actions the operation accepts       invalid-action-id
 *   5. caller            non-zero and equal to the expected caller      invalid-caller-address
 *   6. payable           decoded payable id equals the target           not-matching-payable-id
 *
 * Lifecycle: UNSEEN -> VERIFIED (all checks passed) -> APPLIED (replay guard
 * entry committed in the same batch as the message's effect).
 */

#include "consensus/validation.h"
#include "ledger/ledgerdb.h"
#include "ledger/payload.h"
#include "uint256.h"

#include <stdint.h>
#include <vector>

struct AttestedMessage
{
    uint16_t nEmitterChainId{0};
    uint256 emitterAddress;
    uint256 hash;
    std::vector<unsigned char> vPayload;
};

enum class MessageState : uint8_t {
    UNSEEN = 0,
    VERIFIED = 1,
    APPLIED = 2,
};

struct VerifiedMessage
{
    AttestedMessage msg;
    CrossChainPayload payload;
    MessageState state{MessageState::UNSEEN};
};

/** UNSEEN or APPLIED; VERIFIED only exists inside an operation */
MessageState GetMessageState(const CLedgerDB& ledgerdb, uint16_t nEmitterChainId, const uint256& hash);

/**
 * Run the message checks.
 *
 * @param vExpectedActions   actions the calling operation handles
 * @param pExpectedCaller    if set, the decoded caller must equal it
 * @param pExpectedPayableId if set, the decoded payable id must equal it
 * @param[out] verified      message and decoded payload, state VERIFIED
 */
bool VerifyAttestedMessage(const CLedgerDB& ledgerdb,
                           const AttestedMessage& msg,
                           const std::vector<ActionId>& vExpectedActions,
                           const uint256* pExpectedCaller,
                           const uint256* pExpectedPayableId,
                           VerifiedMessage& verified,
                           CValidationState& state);

/** Stage the replay guard entry of a verified message */
void StageMessageApplied(CLedgerDB::Batch& batch, const VerifiedMessage& verified);

#endif // CHAINBILLS_XCHAIN_H
