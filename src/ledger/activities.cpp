// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/activities.h"

#include "logging.h"
#include "utiltime.h"

const char* ActivityTypeName(ActivityType type)
{
    switch (type) {
    case ActivityType::CREATED_PAYABLE: return "CreatedPayable";
    case ActivityType::CLOSED_PAYABLE: return "ClosedPayable";
    case ActivityType::REOPENED_PAYABLE: return "ReopenedPayable";
    case ActivityType::UPDATED_PAYABLE_TOKENS_AND_AMOUNTS: return "UpdatedPayableTokensAndAmounts";
    case ActivityType::PAID: return "Paid";
    case ActivityType::WITHDREW: return "Withdrew";
    }
    return "Unknown";
}

bool StageActivity(CLedgerDB::Batch& batch,
                   ActivityType type,
                   const uint256& reference,
                   PayableRecord& payable,
                   UserRecord* pUser,
                   ActivityRecord& activity,
                   CValidationState& state)
{
    uint64_t nChainCount, nPayableCount, nUserCount = 0;
    if (!batch.NextCounter(ChainCounter(CounterScope::CHAIN_ACTIVITIES), nChainCount) ||
        !batch.NextCounter(PayableCounter(CounterScope::PAYABLE_ACTIVITIES, payable.id), nPayableCount)) {
        return state.Error("counter-overflow");
    }
    if (pUser && !batch.NextCounter(UserCounter(CounterScope::USER_ACTIVITIES, pUser->wallet, pUser->nChainId),
                                    nUserCount)) {
        return state.Error("counter-overflow");
    }

    activity = ActivityRecord();
    activity.nChainCount = nChainCount;
    activity.nUserCount = nUserCount;
    activity.nPayableCount = nPayableCount;
    activity.nTimestamp = GetTime();
    activity.reference = reference;
    activity.type = type;

    payable.nActivitiesCount = nPayableCount;
    batch.WriteActivity(activity);
    batch.WritePayableActivity(payable.id, nPayableCount, nChainCount);
    if (pUser) {
        pUser->nActivitiesCount = nUserCount;
        batch.WriteUserActivity(pUser->wallet, pUser->nChainId, nUserCount, nChainCount);
    }

    LogPrint(BCLog::LEDGER, "Activity #%u %s %s payable#%u user#%u\n", nChainCount, ActivityTypeName(type),
             reference.ToString(), nPayableCount, nUserCount);
    return true;
}
