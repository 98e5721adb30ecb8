// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "ledger/init.h"
#include "ledger/ledgerdb.h"
#include "logging.h"
#include "test/test_chainbills.h"
#include "util/system.h"

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

struct InitTestingSetup : public BasicTestingSetup
{
    /** Parse a command line that keeps the fixture's data directory */
    bool ParseArgs(std::vector<std::string> vArgs, std::string& strError)
    {
        vArgs.insert(vArgs.begin(), "-datadir=" + path_root.string());
        vArgs.insert(vArgs.begin(), "chainbills");
        std::vector<const char*> argv;
        for (const std::string& arg : vArgs) {
            argv.push_back(arg.c_str());
        }
        gArgs.ClearArgs();
        const bool fParsed = gArgs.ParseParameters(static_cast<int>(argv.size()), argv.data(), strError);
        ClearDatadirCache();
        return fParsed;
    }

    ~InitTestingSetup()
    {
        BCLog::Logger& logger = LogInstance();
        logger.DisableCategory(BCLog::ALL);
        logger.Close();
        logger.m_print_to_console = DEFAULT_PRINTTOCONSOLE;
        logger.m_log_timestamps = DEFAULT_LOGTIMESTAMPS;
    }
};

BOOST_FIXTURE_TEST_SUITE(init_tests, InitTestingSetup)

BOOST_AUTO_TEST_CASE(app_init_opens_ledger)
{
    std::string strError;
    BOOST_REQUIRE(ParseArgs({"-regtest", "-debug=payments", "-printtoconsole=0", "-ledgerdbcache=100000"}, strError));

    BOOST_REQUIRE_MESSAGE(AppInitLedger(strError), strError);
    BOOST_CHECK(strError.empty());
    BOOST_REQUIRE(g_ledgerdb);
    BOOST_CHECK_EQUAL(Params().NetworkIDString(), "regtest");

    BOOST_CHECK(LogAcceptCategory(BCLog::PAYMENTS));
    BOOST_CHECK(!LogAcceptCategory(BCLog::WITHDRAWALS));

    uint16_t nStored = 0;
    BOOST_REQUIRE(g_ledgerdb->ReadChainId(nStored));
    BOOST_CHECK_EQUAL(nStored, Params().ChainId());

    ShutdownLedger();
    BOOST_CHECK(!g_ledgerdb);
    BOOST_CHECK(fs::exists(path_root / "regtest" / "debug.log"));
    BOOST_CHECK(fs::exists(path_root / "regtest" / "ledger"));
}

BOOST_AUTO_TEST_CASE(app_init_debug_none_clears_categories)
{
    std::string strError;
    BOOST_REQUIRE(ParseArgs({"-chain=test", "-debug=all", "-debug=none", "-debuglogfile=0"}, strError));

    BOOST_REQUIRE_MESSAGE(AppInitLedger(strError), strError);
    BOOST_CHECK_EQUAL(Params().NetworkIDString(), "test");
    BOOST_CHECK_EQUAL(LogInstance().GetCategoryMask(), 0U);

    ShutdownLedger();
    BOOST_CHECK(!fs::exists(path_root / "testnet" / "debug.log"));
}

BOOST_AUTO_TEST_CASE(app_init_rejects_bad_chain)
{
    std::string strError;
    BOOST_REQUIRE(ParseArgs({"-chain=bogus"}, strError));
    BOOST_CHECK(!AppInitLedger(strError));
    BOOST_CHECK(!strError.empty());
    BOOST_CHECK(!g_ledgerdb);

    strError.clear();
    BOOST_REQUIRE(ParseArgs({"-regtest", "-testnet"}, strError));
    BOOST_CHECK(!AppInitLedger(strError));
    BOOST_CHECK(!strError.empty());

    // Parameters must be options
    BOOST_CHECK(!ParseArgs({"regtest"}, strError));
}

BOOST_AUTO_TEST_CASE(help_lists_ledger_options)
{
    const std::string strHelp = GetLedgerHelpString();
    BOOST_CHECK(strHelp.find("-ledgerdbcache") != std::string::npos);
    BOOST_CHECK(strHelp.find("-reindexledger") != std::string::npos);
    BOOST_CHECK(strHelp.find("withdrawals") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(chain_params_values)
{
    SelectParams(CBaseChainParams::MAIN);
    const Consensus::Params& main = Params().GetConsensus();
    BOOST_CHECK_EQUAL(Params().ChainId(), 50);
    BOOST_CHECK_EQUAL(main.nMaxPayableTokens, 20U);
    BOOST_CHECK_EQUAL(main.nMaxPayableDescriptionLength, 3000U);
    BOOST_CHECK_EQUAL(main.nBridgeDecimals, 8);
    BOOST_CHECK(main.localWithdrawalFee.rounding == Consensus::FeeRounding::FEE_FLOOR);
    BOOST_CHECK(main.bridgedWithdrawalFee.rounding == Consensus::FeeRounding::NET_FLOOR);
    BOOST_CHECK(main.bridgedWithdrawalFee.fNormalizeBridgedAmounts);
    BOOST_CHECK(!Params().AllowFeePolicyOverride());
    BOOST_CHECK_THROW(UpdateWithdrawalFeePolicy(false, {1, 100, Consensus::FeeRounding::FEE_FLOOR, false}),
                      std::runtime_error);

    SelectParams(CBaseChainParams::REGTEST);
    const Consensus::Params& regtest = Params().GetConsensus();
    BOOST_CHECK(Params().AllowFeePolicyOverride());
    BOOST_CHECK_EQUAL(regtest.localWithdrawalFee.nFeeNumerator, 2U);
    BOOST_CHECK_EQUAL(regtest.localWithdrawalFee.nFeeDenominator, 100U);
    BOOST_CHECK(!regtest.bridgedWithdrawalFee.fNormalizeBridgedAmounts);

    BOOST_CHECK_THROW(SelectParams("bogus"), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
