// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_USERS_H
#define CHAINBILLS_USERS_H

#include "consensus/validation.h"
#include "ledger/ledgerdb.h"
#include "uint256.h"

#include <stdint.h>

/**
 * Load a user, or prepare a new one if the wallet was never seen on this
 * ledger. A new user takes the next CHAIN_USERS value from the batch.
 * Nothing is written; the caller stages the record once its counts are
 * updated.
 */
bool LoadOrCreateUser(const CLedgerDB& ledgerdb, CLedgerDB::Batch& batch,
                      const uint256& wallet, uint16_t nChainId,
                      UserRecord& user, CValidationState& state);

#endif // CHAINBILLS_USERS_H
