// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_LEDGER_H
#define CHAINBILLS_LEDGER_H

/**
 * Chainbills Ledger - records
 *
 * Hosts register payables (invoice-like receivers), payers pay a payable in a
 * given token and amount, and hosts withdraw the accumulated balances minus a
 * withdrawal fee. Activity may start on this chain or arrive as an attested
 * message from a remote chain; both paths write the same records.
 *
 * Identities are chain-portable: a wallet or token is a 32-byte value (the
 * native address left-padded with zeros) plus the Wormhole chain id it lives
 * on.
 *
 * Entity ids:
 *   id = SHA256d("chainbills" || kind (1) || origin_chain_id (2 LE) || origin_count (8 LE))
 *
 * so every chain observing the same payment derives the same id.
 */

#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

/**
 * EntityKind - domain separator mixed into entity ids
 */
enum class EntityKind : uint8_t {
    PAYABLE = 1,
    PAYMENT = 2,
    WITHDRAWAL = 3,
};

uint256 ComputeEntityId(EntityKind kind, uint16_t nOriginChainId, uint64_t nOriginCount);

/**
 * TokenAndAmount - a token and an exact amount in its smallest unit
 */
struct TokenAndAmount
{
    uint256 token;
    uint64_t amount{0};

    TokenAndAmount() {}
    TokenAndAmount(const uint256& tokenIn, uint64_t amountIn) : token(tokenIn), amount(amountIn) {}

    SERIALIZE_METHODS(TokenAndAmount, obj)
    {
        READWRITE(obj.token, obj.amount);
    }

    friend bool operator==(const TokenAndAmount& a, const TokenAndAmount& b)
    {
        return a.token == b.token && a.amount == b.amount;
    }
    friend bool operator!=(const TokenAndAmount& a, const TokenAndAmount& b) { return !(a == b); }

    std::string ToString() const;
};

/**
 * ChainStats - totals of entities ever created on this chain
 *
 * Derived from the chain-scope counters; never decremented.
 */
struct ChainStats
{
    uint16_t nChainId{0};
    uint64_t nUsersCount{0};
    uint64_t nPayablesCount{0};
    uint64_t nPaymentsCount{0};
    uint64_t nWithdrawalsCount{0};
    uint64_t nActivitiesCount{0};
};

/**
 * UserRecord - a wallet on a given chain that has hosted, paid or withdrawn
 *
 * Key: 'u' + (wallet, chain id). The count fields mirror the user-scope
 * counters and are written in the same batch.
 */
struct UserRecord
{
    uint256 wallet;
    uint16_t nChainId{0};
    uint64_t nChainCount{0};        // Ordinal among users of this chain
    uint64_t nPayablesCount{0};
    uint64_t nPaymentsCount{0};
    uint64_t nWithdrawalsCount{0};
    uint64_t nActivitiesCount{0};

    SERIALIZE_METHODS(UserRecord, obj)
    {
        READWRITE(obj.wallet, obj.nChainId, obj.nChainCount);
        READWRITE(obj.nPayablesCount, obj.nPaymentsCount, obj.nWithdrawalsCount, obj.nActivitiesCount);
    }
};

/**
 * PayableRecord - an invoice-like receiver owned by a host
 *
 * Key: 'p' + id.
 *
 * vAllowedTokensAndAmounts empty means any supported token at any positive
 * amount. vBalances holds one entry per token that was ever paid in; an
 * entry survives at zero after a full withdrawal.
 */
struct PayableRecord
{
    uint256 id;
    uint256 host;
    uint16_t nHostChainId{0};
    uint64_t nChainCount{0};
    uint64_t nHostCount{0};
    std::string description;
    int64_t nCreatedAt{0};
    uint64_t nPaymentsCount{0};
    uint64_t nWithdrawalsCount{0};
    uint64_t nActivitiesCount{0};
    bool fClosed{false};
    std::vector<TokenAndAmount> vAllowedTokensAndAmounts;
    std::vector<TokenAndAmount> vBalances;

    SERIALIZE_METHODS(PayableRecord, obj)
    {
        READWRITE(obj.id, obj.host, obj.nHostChainId, obj.nChainCount, obj.nHostCount);
        READWRITE(obj.description, obj.nCreatedAt);
        READWRITE(obj.nPaymentsCount, obj.nWithdrawalsCount, obj.nActivitiesCount, obj.fClosed);
        READWRITE(obj.vAllowedTokensAndAmounts, obj.vBalances);
    }

    bool IsHostedBy(const uint256& wallet, uint16_t nChainId) const
    {
        return host == wallet && nHostChainId == nChainId;
    }

    /** Return the balance entry for a token, or nullptr if none was ever paid in */
    const TokenAndAmount* FindBalance(const uint256& token) const;
    TokenAndAmount* FindBalance(const uint256& token);

    /** True if the allowed set is empty or contains exactly (token, amount) */
    bool AcceptsTokenAndAmount(const uint256& token, uint64_t amount) const;
};

/**
 * UserPaymentRecord - a payment seen from the payer's side
 *
 * Key: 'y' + payment id. Only written on the payer's chain.
 */
struct UserPaymentRecord
{
    uint256 id;
    uint256 payableId;
    uint256 payer;
    uint16_t nPayableChainId{0};
    uint64_t nChainCount{0};
    uint64_t nPayerCount{0};
    uint64_t nPayableCount{0};
    int64_t nTimestamp{0};
    TokenAndAmount details;

    SERIALIZE_METHODS(UserPaymentRecord, obj)
    {
        READWRITE(obj.id, obj.payableId, obj.payer, obj.nPayableChainId);
        READWRITE(obj.nChainCount, obj.nPayerCount, obj.nPayableCount);
        READWRITE(obj.nTimestamp, obj.details);
    }
};

/**
 * PayablePaymentRecord - a payment seen from the payable's side
 *
 * Key: 'q' + payment id. nLocalChainCount is the ordinal among payments the
 * payable received from nPayerChainId.
 */
struct PayablePaymentRecord
{
    uint256 id;
    uint256 payableId;
    uint256 payer;
    uint16_t nPayerChainId{0};
    uint64_t nLocalChainCount{0};
    uint64_t nPayableCount{0};
    uint64_t nPayerCount{0};
    int64_t nTimestamp{0};
    TokenAndAmount details;

    SERIALIZE_METHODS(PayablePaymentRecord, obj)
    {
        READWRITE(obj.id, obj.payableId, obj.payer, obj.nPayerChainId);
        READWRITE(obj.nLocalChainCount, obj.nPayableCount, obj.nPayerCount);
        READWRITE(obj.nTimestamp, obj.details);
    }
};

/**
 * WithdrawalRecord - a withdrawal of a payable balance to its host
 *
 * Key: 'w' + id. details.amount is the gross amount deducted from the
 * balance; nFee + nNet == details.amount.
 */
struct WithdrawalRecord
{
    uint256 id;
    uint256 payableId;
    uint256 host;
    uint16_t nHostChainId{0};
    uint64_t nChainCount{0};
    uint64_t nPayableCount{0};
    uint64_t nHostCount{0};
    int64_t nTimestamp{0};
    TokenAndAmount details;
    uint64_t nFee{0};
    uint64_t nNet{0};

    SERIALIZE_METHODS(WithdrawalRecord, obj)
    {
        READWRITE(obj.id, obj.payableId, obj.host, obj.nHostChainId);
        READWRITE(obj.nChainCount, obj.nPayableCount, obj.nHostCount);
        READWRITE(obj.nTimestamp, obj.details, obj.nFee, obj.nNet);
    }
};

/**
 * ActivityType - what an activity record logs
 */
enum class ActivityType : uint8_t {
    CREATED_PAYABLE = 1,
    CLOSED_PAYABLE = 2,
    REOPENED_PAYABLE = 3,
    UPDATED_PAYABLE_TOKENS_AND_AMOUNTS = 4,
    PAID = 5,
    WITHDREW = 6,
};

/**
 * ActivityRecord - one entry of the chain-wide activity log
 *
 * Key: 'a' + chain count (BE). reference is the payable id for payable
 * changes, the payment id for PAID and the withdrawal id for WITHDREW.
 * nUserCount is 0 when no local user took part (a payment from a remote
 * payer).
 */
struct ActivityRecord
{
    uint64_t nChainCount{0};
    uint64_t nUserCount{0};
    uint64_t nPayableCount{0};
    int64_t nTimestamp{0};
    uint256 reference;
    ActivityType type{ActivityType::CREATED_PAYABLE};

    SERIALIZE_METHODS(ActivityRecord, obj)
    {
        READWRITE(obj.nChainCount, obj.nUserCount, obj.nPayableCount, obj.nTimestamp, obj.reference);
        uint8_t typeByte = static_cast<uint8_t>(obj.type);
        READWRITE(typeByte);
        SER_READ(obj, obj.type = static_cast<ActivityType>(typeByte));
    }
};

/**
 * TokenDetails - a token this ledger accepts
 *
 * Key: 't' + token. A token is supported iff its record exists with
 * fSupported set.
 */
struct TokenDetails
{
    uint256 token;
    bool fSupported{false};
    uint8_t nDecimals{0};

    SERIALIZE_METHODS(TokenDetails, obj)
    {
        READWRITE(obj.token, obj.fSupported, obj.nDecimals);
    }
};

/**
 * ForeignContract - the emitter whose messages are accepted from a chain
 *
 * Key: 'f' + chain id.
 */
struct ForeignContract
{
    uint16_t nChainId{0};
    uint256 emitter;

    SERIALIZE_METHODS(ForeignContract, obj)
    {
        READWRITE(obj.nChainId, obj.emitter);
    }
};

/**
 * ReceivedMessageRecord - replay guard entry for an applied message
 *
 * Key: 'r' + (emitter chain id BE, message hash).
 */
struct ReceivedMessageRecord
{
    uint16_t nEmitterChainId{0};
    uint256 hash;
    uint8_t nActionId{0};
    int64_t nAppliedAt{0};

    SERIALIZE_METHODS(ReceivedMessageRecord, obj)
    {
        READWRITE(obj.nEmitterChainId, obj.hash, obj.nActionId, obj.nAppliedAt);
    }
};

#endif // CHAINBILLS_LEDGER_H
