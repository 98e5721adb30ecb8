// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_ACTIVITIES_H
#define CHAINBILLS_ACTIVITIES_H

/**
 * Activity Log
 *
 * Every payable, payment and withdrawal operation appends one ActivityRecord
 * in the batch that applies it. The record is listed under the payable it
 * touched and, when a user on any chain took part, under that user.
 */

#include "consensus/validation.h"
#include "ledger/ledger.h"
#include "ledger/ledgerdb.h"
#include "uint256.h"

const char* ActivityTypeName(ActivityType type);

/**
 * Allocate the activity counters and stage the record and its list entries.
 *
 * Bumps payable.nActivitiesCount and, if pUser is set, pUser->nActivitiesCount.
 * The caller writes the payable and the user afterwards.
 */
bool StageActivity(CLedgerDB::Batch& batch,
                   ActivityType type,
                   const uint256& reference,
                   PayableRecord& payable,
                   UserRecord* pUser,
                   ActivityRecord& activity,
                   CValidationState& state);

#endif // CHAINBILLS_ACTIVITIES_H
