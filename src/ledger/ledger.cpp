// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger.h"

#include "hash.h"
#include "util/format.h"

static const char ENTITY_ID_TAG[] = "chainbills";

uint256 ComputeEntityId(EntityKind kind, uint16_t nOriginChainId, uint64_t nOriginCount)
{
    CHashWriter hw(SER_GETHASH, 0);
    hw.write(ENTITY_ID_TAG, sizeof(ENTITY_ID_TAG) - 1);
    hw << static_cast<uint8_t>(kind);
    hw << nOriginChainId;
    hw << nOriginCount;
    return hw.GetHash();
}

std::string TokenAndAmount::ToString() const
{
    return strprintf("TokenAndAmount(token=%s, amount=%u)", token.ToString(), amount);
}

const TokenAndAmount* PayableRecord::FindBalance(const uint256& token) const
{
    for (const auto& balance : vBalances) {
        if (balance.token == token) return &balance;
    }
    return nullptr;
}

TokenAndAmount* PayableRecord::FindBalance(const uint256& token)
{
    for (auto& balance : vBalances) {
        if (balance.token == token) return &balance;
    }
    return nullptr;
}

bool PayableRecord::AcceptsTokenAndAmount(const uint256& token, uint64_t amount) const
{
    if (vAllowedTokensAndAmounts.empty()) return true;
    for (const auto& taa : vAllowedTokensAndAmounts) {
        if (taa.token == token && taa.amount == amount) return true;
    }
    return false;
}
