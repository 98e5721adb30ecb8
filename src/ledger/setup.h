// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_SETUP_H
#define CHAINBILLS_SETUP_H

/**
 * Setup primitives
 *
 * Plain storage writes for the tokens this ledger accepts and the emitter
 * contracts it trusts on remote chains. Authorizing who may call them is
 * left to the host environment.
 */

#include "consensus/validation.h"
#include "ledger/ledgerdb.h"
#include "uint256.h"

#include <stdint.h>

/** Add or update a token. fSupported = false disables new payments in it. */
bool RegisterToken(CLedgerDB& ledgerdb, const uint256& token, uint8_t nDecimals, bool fSupported,
                   CValidationState& state);

/** Set the emitter whose messages are accepted from nChainId */
bool RegisterForeignContract(CLedgerDB& ledgerdb, uint16_t nChainId, const uint256& emitter,
                             CValidationState& state);

#endif // CHAINBILLS_SETUP_H
