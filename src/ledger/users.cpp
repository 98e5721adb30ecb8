// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/users.h"

#include "logging.h"

bool LoadOrCreateUser(const CLedgerDB& ledgerdb, CLedgerDB::Batch& batch,
                      const uint256& wallet, uint16_t nChainId,
                      UserRecord& user, CValidationState& state)
{
    if (ledgerdb.ReadUser(wallet, nChainId, user)) {
        return true;
    }

    uint64_t nChainCount;
    if (!batch.NextCounter(ChainCounter(CounterScope::CHAIN_USERS), nChainCount)) {
        return state.Error("counter-overflow");
    }

    user = UserRecord();
    user.wallet = wallet;
    user.nChainId = nChainId;
    user.nChainCount = nChainCount;

    LogPrint(BCLog::LEDGER, "New user %s on chain %u (#%u)\n", wallet.ToString(), nChainId, nChainCount);
    return true;
}
