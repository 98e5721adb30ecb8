// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/init.h"

#include "chainparams.h"
#include "ledger/ledgerdb.h"
#include "ledger/notifications.h"
#include "logging.h"
#include "util/system.h"

#include <algorithm>
#include <stdexcept>

std::string GetLedgerHelpString()
{
    std::string strUsage = "Ledger options:\n";
    strUsage += "  -chain=<chain>          Use the chain <chain> (main, test, regtest)\n";
    strUsage += "  -datadir=<dir>          Specify data directory\n";
    strUsage += strprintf("  -ledgerdbcache=<n>      Ledger database cache size in MiB (%d to %d, default: network dependent)\n",
                          DEFAULT_LEDGERDB_CACHE_MIN, DEFAULT_LEDGERDB_CACHE_MAX);
    strUsage += "  -reindexledger          Wipe the ledger database on startup\n";
    strUsage += "\nDebugging/Testing options:\n";
    strUsage += "  -debug=<category>       Output debugging information. <category> can be: " + ListLogCategories() + "\n";
    strUsage += "  -printtoconsole         Send trace/debug info to console\n";
    strUsage += strprintf("  -debuglogfile           Write debug.log in the data directory (default: %u)\n", DEFAULT_PRINTTOFILE);
    strUsage += strprintf("  -logtimestamps          Prepend debug output with timestamp (default: %u)\n", DEFAULT_LOGTIMESTAMPS);
    return strUsage;
}

static bool InitLogging(std::string& strError)
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    logger.m_print_to_file = gArgs.GetBoolArg("-debuglogfile", DEFAULT_PRINTTOFILE);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (cat == "0" || cat == "none") {
            logger.DisableCategory(BCLog::ALL);
        } else if (cat == "1" || cat == "all") {
            logger.EnableCategory(BCLog::ALL);
        } else if (!logger.EnableCategory(cat)) {
            LogPrintf("Unsupported logging category -debug=%s\n", cat);
        }
    }

    if (logger.m_print_to_file) {
        logger.m_file_path = GetDataDir() / DEFAULT_DEBUGLOGFILE;
        if (logger.DefaultShrinkDebugFile()) {
            logger.ShrinkDebugFile();
        }
        if (!logger.OpenDebugLog()) {
            strError = strprintf("Could not open debug log file %s", logger.m_file_path.string());
            return false;
        }
    }
    return true;
}

bool AppInitLedger(std::string& strError)
{
    try {
        SelectParams(gArgs.GetChainName());
    } catch (const std::exception& e) {
        strError = strprintf("Error: %s", e.what());
        return false;
    }

    try {
        TryCreateDirectories(GetDataDir());
    } catch (const fs::filesystem_error& e) {
        strError = strprintf("Cannot create data directory: %s", e.what());
        return false;
    }

    if (!InitLogging(strError)) {
        return false;
    }

    LogPrintf("Chainbills ledger starting, network %s, chain id %u\n",
              Params().NetworkIDString(), Params().ChainId());
    LogPrintf("Using data directory %s\n", GetDataDir().string());
    std::string strActive;
    for (const CLogCategoryActive& cat : ListActiveLogCategories()) {
        if (!cat.active) continue;
        strActive += (strActive.empty() ? "" : ", ") + cat.category;
    }
    LogPrintf("Active log categories: %s\n", strActive.empty() ? "none" : strActive);

    int64_t nCacheMiB = gArgs.GetArg("-ledgerdbcache", Params().DefaultLedgerCache());
    nCacheMiB = std::max(DEFAULT_LEDGERDB_CACHE_MIN, std::min(nCacheMiB, DEFAULT_LEDGERDB_CACHE_MAX));
    const bool fReindex = gArgs.GetBoolArg("-reindexledger", DEFAULT_REINDEXLEDGER);
    if (fReindex) {
        LogPrintf("Wiping ledger database (-reindexledger)\n");
    }

    if (!InitLedgerDB(static_cast<size_t>(nCacheMiB) << 20, fReindex)) {
        strError = "Error initializing ledger database, see debug.log";
        return false;
    }
    return true;
}

void ShutdownLedger()
{
    LogPrintf("Ledger shutdown\n");
    UnregisterAllLedgerInterfaces();
    if (g_ledgerdb) {
        if (!g_ledgerdb->Sync()) {
            LogPrintf("ERROR: ShutdownLedger: failed to sync ledger database\n");
        }
        g_ledgerdb.reset();
    }
    LogInstance().Close();
}
