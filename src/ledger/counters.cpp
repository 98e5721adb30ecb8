// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/counters.h"

#include "util/format.h"

#include <limits>

static const char* ScopeName(CounterScope scope)
{
    switch (scope) {
    case CounterScope::CHAIN_USERS: return "chain-users";
    case CounterScope::CHAIN_PAYABLES: return "chain-payables";
    case CounterScope::CHAIN_PAYMENTS: return "chain-payments";
    case CounterScope::CHAIN_WITHDRAWALS: return "chain-withdrawals";
    case CounterScope::USER_PAYABLES: return "user-payables";
    case CounterScope::USER_PAYMENTS: return "user-payments";
    case CounterScope::USER_WITHDRAWALS: return "user-withdrawals";
    case CounterScope::PAYABLE_PAYMENTS: return "payable-payments";
    case CounterScope::PAYABLE_WITHDRAWALS: return "payable-withdrawals";
    case CounterScope::PAYABLE_CHAIN_PAYMENTS: return "payable-chain-payments";
    case CounterScope::CHAIN_ACTIVITIES: return "chain-activities";
    case CounterScope::USER_ACTIVITIES: return "user-activities";
    case CounterScope::PAYABLE_ACTIVITIES: return "payable-activities";
    }
    return "unknown";
}

std::string CounterKey::ToString() const
{
    return strprintf("CounterKey(%s, id=%s, chain=%u)", ScopeName(scope), id.ToString(), nChainId);
}

CounterKey ChainCounter(CounterScope scope)
{
    CounterKey key;
    key.scope = scope;
    return key;
}

CounterKey UserCounter(CounterScope scope, const uint256& wallet, uint16_t nChainId)
{
    CounterKey key;
    key.scope = scope;
    key.id = wallet;
    key.nChainId = nChainId;
    return key;
}

CounterKey PayableCounter(CounterScope scope, const uint256& payableId)
{
    CounterKey key;
    key.scope = scope;
    key.id = payableId;
    return key;
}

CounterKey PayableChainCounter(const uint256& payableId, uint16_t nPayerChainId)
{
    CounterKey key;
    key.scope = CounterScope::PAYABLE_CHAIN_PAYMENTS;
    key.id = payableId;
    key.nChainId = nPayerChainId;
    return key;
}

bool IncrementCounterValue(uint64_t n, uint64_t& nNext)
{
    if (n == std::numeric_limits<uint64_t>::max()) {
        return false;
    }
    nNext = n + 1;
    return true;
}
