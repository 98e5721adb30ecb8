// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_PAYLOAD_H
#define CHAINBILLS_PAYLOAD_H

/**
 * Cross-chain payload codec
 *
 * Layout (Bitcoin-style serialization, little-endian integers,
 * CompactSize-prefixed strings and vectors):
 *
 *   version (1) || action id (1) || caller (32) || action fields
 *
 *   CREATE_PAYABLE                      description, allowed tokens and amounts
 *   CLOSE_PAYABLE / REOPEN_PAYABLE      payable id
 *   UPDATE_PAYABLE_TOKENS_AND_AMOUNTS   payable id, allowed tokens and amounts
 *   PAY                                 payable id, details, origin chain count, payer count
 *   WITHDRAW                            payable id, details
 *
 * A payload must decode completely; short reads and trailing bytes are
 * malformed.
 */

#include "ledger/ledger.h"
#include "serialize.h"
#include "uint256.h"

#include <ios>
#include <stdint.h>
#include <string>
#include <vector>

/** Version byte carried at the head of every cross-chain payload */
static const unsigned char PAYLOAD_VERSION = 1;

enum class ActionId : uint8_t {
    CREATE_PAYABLE = 1,
    CLOSE_PAYABLE = 2,
    REOPEN_PAYABLE = 3,
    UPDATE_PAYABLE_TOKENS_AND_AMOUNTS = 4,
    WITHDRAW = 5,
    PAY = 6,
};

const char* ActionIdName(ActionId action);
bool IsKnownActionId(uint8_t nActionId);

struct CrossChainPayload
{
    uint8_t nVersion;
    ActionId action;
    uint256 caller;

    uint256 payableId;                                      // all but CREATE_PAYABLE
    std::string description;                                // CREATE_PAYABLE
    std::vector<TokenAndAmount> vAllowedTokensAndAmounts;   // CREATE_PAYABLE, UPDATE_...
    TokenAndAmount details;                                 // PAY, WITHDRAW
    uint64_t nOriginChainCount{0};                          // PAY
    uint64_t nPayerCount{0};                                // PAY

    CrossChainPayload();

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, nVersion);
        ::Serialize(s, static_cast<uint8_t>(action));
        ::Serialize(s, caller);
        switch (action) {
        case ActionId::CREATE_PAYABLE:
            ::Serialize(s, description);
            ::Serialize(s, vAllowedTokensAndAmounts);
            break;
        case ActionId::CLOSE_PAYABLE:
        case ActionId::REOPEN_PAYABLE:
            ::Serialize(s, payableId);
            break;
        case ActionId::UPDATE_PAYABLE_TOKENS_AND_AMOUNTS:
            ::Serialize(s, payableId);
            ::Serialize(s, vAllowedTokensAndAmounts);
            break;
        case ActionId::PAY:
            ::Serialize(s, payableId);
            ::Serialize(s, details);
            ::Serialize(s, nOriginChainCount);
            ::Serialize(s, nPayerCount);
            break;
        case ActionId::WITHDRAW:
            ::Serialize(s, payableId);
            ::Serialize(s, details);
            break;
        }
    }

    template <typename Stream>
    void Unserialize(Stream& s)
    {
        uint8_t nActionId;
        ::Unserialize(s, nVersion);
        ::Unserialize(s, nActionId);
        if (!IsKnownActionId(nActionId)) {
            throw std::ios_base::failure("unknown payload action id");
        }
        action = static_cast<ActionId>(nActionId);
        ::Unserialize(s, caller);
        switch (action) {
        case ActionId::CREATE_PAYABLE:
            ::Unserialize(s, description);
            ::Unserialize(s, vAllowedTokensAndAmounts);
            break;
        case ActionId::CLOSE_PAYABLE:
        case ActionId::REOPEN_PAYABLE:
            ::Unserialize(s, payableId);
            break;
        case ActionId::UPDATE_PAYABLE_TOKENS_AND_AMOUNTS:
            ::Unserialize(s, payableId);
            ::Unserialize(s, vAllowedTokensAndAmounts);
            break;
        case ActionId::PAY:
            ::Unserialize(s, payableId);
            ::Unserialize(s, details);
            ::Unserialize(s, nOriginChainCount);
            ::Unserialize(s, nPayerCount);
            break;
        case ActionId::WITHDRAW:
            ::Unserialize(s, payableId);
            ::Unserialize(s, details);
            break;
        }
    }

    bool IsTriviallyValid(std::string& strError) const;
};

std::vector<unsigned char> EncodePayload(const CrossChainPayload& payload);

/**
 * Decode a payload. Fails on short reads, trailing bytes and unknown
 * actions.
 */
bool DecodePayload(const std::vector<unsigned char>& vch, CrossChainPayload& payload, std::string& strError);

#endif // CHAINBILLS_PAYLOAD_H
