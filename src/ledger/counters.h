// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_COUNTERS_H
#define CHAINBILLS_COUNTERS_H

/**
 * Counter Registry
 *
 * Every sequence number in the ledger comes from a named counter. A counter
 * starts at 0 (nothing allocated), hands out 1, 2, 3, ... with no gaps and is
 * never reset. Allocation happens inside a CLedgerDB::Batch so the new value
 * lands atomically with the records that capture it; two allocations on the
 * same counter in one batch return consecutive values.
 *
 * DB Keys:
 *   'n' + CounterKey -> uint64_t (last allocated value)
 */

#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>

enum class CounterScope : uint8_t {
    CHAIN_USERS = 1,
    CHAIN_PAYABLES = 2,
    CHAIN_PAYMENTS = 3,
    CHAIN_WITHDRAWALS = 4,
    USER_PAYABLES = 5,
    USER_PAYMENTS = 6,
    USER_WITHDRAWALS = 7,
    PAYABLE_PAYMENTS = 8,
    PAYABLE_WITHDRAWALS = 9,
    PAYABLE_CHAIN_PAYMENTS = 10,
    CHAIN_ACTIVITIES = 11,
    USER_ACTIVITIES = 12,
    PAYABLE_ACTIVITIES = 13,
};

struct CounterKey
{
    CounterScope scope{CounterScope::CHAIN_USERS};
    uint256 id;             // wallet or payable id, null for chain scopes
    uint16_t nChainId{0};   // wallet chain, or payer chain for PAYABLE_CHAIN_PAYMENTS

    SERIALIZE_METHODS(CounterKey, obj)
    {
        uint8_t scopeByte = static_cast<uint8_t>(obj.scope);
        READWRITE(scopeByte);
        SER_READ(obj, obj.scope = static_cast<CounterScope>(scopeByte));
        READWRITE(obj.id, obj.nChainId);
    }

    friend bool operator<(const CounterKey& a, const CounterKey& b)
    {
        if (a.scope != b.scope) return a.scope < b.scope;
        if (a.id != b.id) return a.id < b.id;
        return a.nChainId < b.nChainId;
    }
    friend bool operator==(const CounterKey& a, const CounterKey& b)
    {
        return a.scope == b.scope && a.id == b.id && a.nChainId == b.nChainId;
    }

    std::string ToString() const;
};

CounterKey ChainCounter(CounterScope scope);
CounterKey UserCounter(CounterScope scope, const uint256& wallet, uint16_t nChainId);
CounterKey PayableCounter(CounterScope scope, const uint256& payableId);
CounterKey PayableChainCounter(const uint256& payableId, uint16_t nPayerChainId);

/** Return n + 1, or false if n is already the largest representable value */
bool IncrementCounterValue(uint64_t n, uint64_t& nNext);

#endif // CHAINBILLS_COUNTERS_H
