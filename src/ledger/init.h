// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_INIT_H
#define CHAINBILLS_INIT_H

#include <stdint.h>
#include <string>

static const int64_t DEFAULT_LEDGERDB_CACHE_MIN = 1;  // MiB
static const int64_t DEFAULT_LEDGERDB_CACHE_MAX = 1024;
static const bool DEFAULT_REINDEXLEDGER = false;
static const bool DEFAULT_PRINTTOFILE = true;

/** Help text for the ledger options */
std::string GetLedgerHelpString();

/**
 * Bring the ledger up from gArgs: select the chain, set up logging, open
 * the ledger database.
 *
 * Options: -chain/-testnet/-regtest, -datadir, -debug=<category>,
 * -printtoconsole, -debuglogfile, -logtimestamps, -ledgerdbcache=<MiB>,
 * -reindexledger.
 *
 * @param[out] strError reason on failure
 */
bool AppInitLedger(std::string& strError);

/** Flush and close the ledger database and the debug log */
void ShutdownLedger();

#endif // CHAINBILLS_INIT_H
